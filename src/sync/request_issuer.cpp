#include "sync/request_issuer.hpp"
#include "network/message.hpp"
#include "sync/sync_error.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"
#include <future>
#include <optional>
#include <stdexcept>

namespace headerpipe {
namespace sync {

namespace {

// One header past the slice end, so the next slice's first header can be
// checked against this slice's last one
constexpr uint64_t kRequestLimit = kHeaderSliceSize + 1;

const std::shared_ptr<HeaderSlices> &
RequireSlices(const std::shared_ptr<HeaderSlices> &header_slices) {
  if (!header_slices) {
    throw std::invalid_argument("RequestIssuer requires header slices");
  }
  return header_slices;
}

} // namespace

RequestIssuer::RequestIssuer(std::shared_ptr<HeaderSlices> header_slices,
                             std::shared_ptr<network::SharedGateway> gateway)
    : header_slices_(RequireSlices(header_slices)),
      gateway_(std::move(gateway)),
      pending_watch_(header_slices_->WatchStatusChanges(HeaderSliceStatus::Empty)) {
  if (!gateway_) {
    throw std::invalid_argument("RequestIssuer requires a gateway");
  }
}

size_t RequestIssuer::PendingCount() const {
  return header_slices_->CountSlicesInStatus(HeaderSliceStatus::Empty);
}

void RequestIssuer::Execute() {
  LOG_SYNC_DEBUG("RequestIssuer: start");
  if (PendingCount() == 0) {
    LOG_SYNC_DEBUG("RequestIssuer: waiting pending");
    WaitForPending();
    LOG_SYNC_DEBUG("RequestIssuer: waiting pending done");
  }

  LOG_SYNC_INFO("RequestIssuer: requesting {} slices", PendingCount());
  if (RequestPending() == ScanOutcome::QueueFull) {
    WaitForCapacity();
  }

  LOG_SYNC_DEBUG("RequestIssuer: done");
}

void RequestIssuer::WaitForPending() {
  try {
    // Re-check after every wake: the count may already be back to zero
    while (pending_watch_.BorrowAndUpdate() == 0) {
      pending_watch_.Changed();
    }
  } catch (const util::WatchClosedError &e) {
    throw SyncError(SyncErrorKind::PendingWatchClosed, e.what());
  }
}

RequestIssuer::ScanOutcome RequestIssuer::RequestPending() {
  std::optional<BlockNum> failed_block;

  std::optional<network::SendResult> stop =
      header_slices_->ForEach([&](HeaderSliceLock &slice_lock) -> std::optional<network::SendResult> {
        auto slice = slice_lock.UpgradableRead();
        if (slice->status != HeaderSliceStatus::Empty) {
          return std::nullopt;
        }

        uint64_t request_id = last_request_id_.fetch_add(1, std::memory_order_seq_cst);
        BlockNum block_num = slice->start_block_num;

        network::SendResult result = Request(request_id, block_num, kRequestLimit);
        if (result != network::SendResult::OK) {
          failed_block = block_num;
          return result;
        }

        auto written = std::move(slice).Upgrade();
        written->request_time = util::GetSteadyTime();
        ++written->request_attempt;
        if (!header_slices_->SetSliceStatus(written, HeaderSliceStatus::Waiting)) {
          LOG_SYNC_WARN("RequestIssuer: slice {} was removed while request {} was sent",
                        block_num, request_id);
          return std::nullopt;
        }
        LOG_SYNC_TRACE("RequestIssuer: request {} sent for slice {}", request_id, block_num);
        return std::nullopt;
      });

  if (!stop) {
    return ScanOutcome::Completed;
  }

  switch (*stop) {
  case network::SendResult::QUEUE_FULL:
    LOG_SYNC_DEBUG("RequestIssuer: request send queue is full");
    return ScanOutcome::QueueFull;
  case network::SendResult::STOPPED:
    throw SyncError(SyncErrorKind::GatewayStopped,
                    "request for slice " + std::to_string(*failed_block));
  default:
    throw SyncError(SyncErrorKind::SendFailed,
                    network::SendResultToString(*stop) + " for slice " +
                        std::to_string(*failed_block));
  }
}

network::SendResult RequestIssuer::Request(uint64_t request_id, BlockNum block_num,
                                           uint64_t limit) {
  message::GetBlockHeadersMessage msg(request_id, message::BlockId::FromNumber(block_num),
                                      limit, /*skip=*/0, /*reverse=*/false);
  return gateway_->Read()->TrySendMessage(msg, network::PeerFilter::Random(1));
}

void RequestIssuer::WaitForCapacity() {
  // The gateway read handle must be released before waiting on the future
  std::future<void> capacity = [this] {
    auto gateway = gateway_->Read();
    return gateway->ReserveCapacityInSendQueue();
  }();

  try {
    capacity.get();
  } catch (const network::GatewayStoppedError &e) {
    throw SyncError(SyncErrorKind::GatewayStopped, e.what());
  } catch (const std::future_error &e) {
    throw SyncError(SyncErrorKind::CapacityWaitFailed, e.what());
  }
}

} // namespace sync
} // namespace headerpipe
