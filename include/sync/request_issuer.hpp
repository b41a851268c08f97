#pragma once

/*
 * RequestIssuer - header fetch request stage
 *
 * Turns Empty slices into outbound GETBLOCKHEADERS requests:
 * - Each Execute() first blocks until at least one slice is Empty, using the
 *   store's Empty-count watch (no polling).
 * - It then walks the store once. For every Empty slice it sends one request
 *   (one slice plus one extra header, so the next stage can check linkage to
 *   the following slice) to a single random peer and moves the slice to
 *   Waiting with the request time set.
 * - A full send queue ends the walk early; Execute() then waits until the
 *   gateway reports free capacity and returns. The walk is not retried within
 *   the same call.
 * - A stopped gateway, a failed send, a closed watch or a failed capacity wait
 *   are thrown as SyncError.
 *
 * Re-requesting slices that time out in Waiting belongs to another stage.
 */

#include "network/gateway.hpp"
#include "sync/header_slices.hpp"
#include "util/watch.hpp"
#include <atomic>
#include <cstdint>
#include <memory>

namespace headerpipe {
namespace sync {

class RequestIssuer {
public:
  RequestIssuer(std::shared_ptr<HeaderSlices> header_slices,
                std::shared_ptr<network::SharedGateway> gateway);

  // Non-copyable, non-movable (owns the watch cursor and id counter)
  RequestIssuer(const RequestIssuer &) = delete;
  RequestIssuer &operator=(const RequestIssuer &) = delete;
  RequestIssuer(RequestIssuer &&) = delete;
  RequestIssuer &operator=(RequestIssuer &&) = delete;

  /**
   * Run one pass of the stage. Blocks the calling thread while there is no
   * work or while waiting for send queue capacity.
   *
   * @throws SyncError on any unrecoverable condition
   */
  void Execute();

  // Number of request ids drawn so far (also the next id to be issued)
  uint64_t IssuedRequestCount() const {
    return last_request_id_.load(std::memory_order_relaxed);
  }

private:
  enum class ScanOutcome {
    Completed,   // every slice was visited
    QueueFull,   // stopped early, gateway queue is full
  };

  size_t PendingCount() const;
  void WaitForPending();
  ScanOutcome RequestPending();
  network::SendResult Request(uint64_t request_id, BlockNum block_num,
                              uint64_t limit);
  void WaitForCapacity();

  std::shared_ptr<HeaderSlices> header_slices_;
  std::shared_ptr<network::SharedGateway> gateway_;
  std::atomic<uint64_t> last_request_id_{0};
  util::WatchReceiver<size_t> pending_watch_;
};

} // namespace sync
} // namespace headerpipe
