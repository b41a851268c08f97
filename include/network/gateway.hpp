#pragma once

#include "network/message.hpp"
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <string>

namespace headerpipe {
namespace network {

// Outcome of a non-blocking send attempt
enum class SendResult {
  OK,
  QUEUE_FULL, // transient: the outbound queue has no room right now
  STOPPED,    // permanent: the gateway no longer accepts messages
  FAILED,     // any other failure (e.g. message could not be encoded)
};

std::string SendResultToString(SendResult result);

/**
 * Thrown from a capacity future when the gateway stops before room became
 * available.
 */
class GatewayStoppedError : public std::runtime_error {
public:
  GatewayStoppedError() : std::runtime_error("gateway stopped") {}
};

/**
 * PeerFilter - which peer(s) should receive an outbound message
 */
struct PeerFilter {
  enum class Kind {
    ALL,     // broadcast
    RANDOM,  // `count` peers sampled at random
    PEER_ID, // exactly `peer_id`
  };

  Kind kind{Kind::ALL};
  size_t count{0};
  uint64_t peer_id{0};

  static PeerFilter All() { return PeerFilter{Kind::ALL, 0, 0}; }
  static PeerFilter Random(size_t n) { return PeerFilter{Kind::RANDOM, n, 0}; }
  static PeerFilter Peer(uint64_t id) { return PeerFilter{Kind::PEER_ID, 1, id}; }

  bool operator==(const PeerFilter &other) const {
    return kind == other.kind && count == other.count && peer_id == other.peer_id;
  }

  std::string ToString() const;
};

/**
 * Gateway - abstract bounded outbound channel to peers
 *
 * Allows dependency injection of different implementations:
 * - SendQueueGateway: bounded queue drained on a boost::asio strand
 * - MockGateway: scripted results for unit tests (in test/)
 *
 * Queue occupancy is internal; callers only observe it through
 * TrySendMessage() results and the capacity future.
 */
class Gateway {
public:
  virtual ~Gateway() = default;

  // Non-blocking; never waits for queue space
  virtual SendResult TrySendMessage(const message::Message &msg,
                                    const PeerFilter &filter) = 0;

  /**
   * Future that becomes ready once the outbound queue has room.
   *
   * Obtained synchronously; waiting on it must happen after any lock used to
   * reach the gateway has been released. get() throws GatewayStoppedError if
   * the gateway stops first.
   */
  virtual std::future<void> ReserveCapacityInSendQueue() = 0;
};

/**
 * SharedGateway - reader/writer guarded handle to a Gateway shared by several
 * pipeline stages
 *
 * Stages take short read handles to send; the owner takes a write handle to
 * swap or tear down the gateway. Handles must never be held across a blocking
 * wait.
 */
class SharedGateway {
public:
  template <typename Lock>
  class Handle {
  public:
    // The pointer is read only after the lock is held (member order matters)
    Handle(std::shared_mutex &mutex, const std::shared_ptr<Gateway> &gateway)
        : lock_(mutex), gateway_(gateway.get()) {}

    Gateway *operator->() const { return gateway_; }
    Gateway &operator*() const { return *gateway_; }

  private:
    Lock lock_;
    Gateway *gateway_;
  };

  using ReadHandle = Handle<std::shared_lock<std::shared_mutex>>;
  using WriteHandle = Handle<std::unique_lock<std::shared_mutex>>;

  explicit SharedGateway(std::shared_ptr<Gateway> gateway);

  SharedGateway(const SharedGateway &) = delete;
  SharedGateway &operator=(const SharedGateway &) = delete;

  ReadHandle Read() const { return ReadHandle(mutex_, gateway_); }
  WriteHandle Write() { return WriteHandle(mutex_, gateway_); }

  // Replace the underlying gateway (takes the write lock)
  void Reset(std::shared_ptr<Gateway> gateway);

private:
  mutable std::shared_mutex mutex_;
  std::shared_ptr<Gateway> gateway_;
};

} // namespace network
} // namespace headerpipe
