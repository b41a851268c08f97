#include "network/send_queue_gateway.hpp"
#include "util/logging.hpp"
#include <stdexcept>

namespace headerpipe {
namespace network {

std::shared_ptr<SendQueueGateway>
SendQueueGateway::Create(boost::asio::io_context &io_context, size_t capacity,
                         MessageSink sink) {
  if (capacity == 0) {
    throw std::invalid_argument("send queue capacity must be positive");
  }
  if (!sink) {
    throw std::invalid_argument("send queue needs a message sink");
  }
  // Private constructor: cannot use make_shared
  return std::shared_ptr<SendQueueGateway>(
      new SendQueueGateway(io_context, capacity, std::move(sink)));
}

SendQueueGateway::SendQueueGateway(boost::asio::io_context &io_context,
                                   size_t capacity, MessageSink sink)
    : strand_(boost::asio::make_strand(io_context)),
      capacity_(capacity),
      sink_(std::move(sink)) {}

SendQueueGateway::~SendQueueGateway() { Stop(); }

SendResult SendQueueGateway::TrySendMessage(const message::Message &msg,
                                            const PeerFilter &filter) {
  std::vector<uint8_t> payload = msg.serialize();
  if (payload.empty()) {
    LOG_NET_ERROR("Refusing to queue empty '{}' payload", msg.command());
    return SendResult::FAILED;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    return SendResult::STOPPED;
  }
  if (queue_.size() >= capacity_) {
    return SendResult::QUEUE_FULL;
  }

  queue_.push_back(OutboundMessage{msg.command(), std::move(payload), filter});
  LOG_NET_TRACE("Queued '{}' for {} ({} / {} queued)", msg.command(),
                filter.ToString(), queue_.size(), capacity_);
  ScheduleDrainLocked();
  return SendResult::OK;
}

std::future<void> SendQueueGateway::ReserveCapacityInSendQueue() {
  std::promise<void> promise;
  std::future<void> future = promise.get_future();

  std::lock_guard<std::mutex> lock(mutex_);
  if (stopped_) {
    promise.set_exception(std::make_exception_ptr(GatewayStoppedError()));
  } else if (queue_.size() < capacity_) {
    promise.set_value();
  } else {
    capacity_waiters_.push_back(std::move(promise));
  }
  return future;
}

void SendQueueGateway::Stop() {
  std::vector<std::promise<void>> waiters;
  size_t discarded = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
    discarded = queue_.size();
    dropped_ += discarded;
    queue_.clear();
    waiters.swap(capacity_waiters_);
  }

  // Fulfil promises outside the lock: continuations may call back into us
  for (auto &waiter : waiters) {
    waiter.set_exception(std::make_exception_ptr(GatewayStoppedError()));
  }
  LOG_NET_DEBUG("Send queue stopped ({} queued messages discarded, {} waiters failed)",
                discarded, waiters.size());
}

bool SendQueueGateway::IsStopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stopped_;
}

size_t SendQueueGateway::QueuedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t SendQueueGateway::DeliveredCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return delivered_;
}

uint64_t SendQueueGateway::DroppedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

void SendQueueGateway::ScheduleDrainLocked() {
  if (drain_scheduled_) {
    return;
  }
  drain_scheduled_ = true;
  boost::asio::post(strand_, [self = shared_from_this()]() { self->DrainOne(); });
}

void SendQueueGateway::DrainOne() {
  OutboundMessage next;
  std::vector<std::promise<void>> waiters;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_ || queue_.empty()) {
      drain_scheduled_ = false;
      return;
    }
    next = std::move(queue_.front());
    queue_.pop_front();
    waiters.swap(capacity_waiters_);
  }

  for (auto &waiter : waiters) {
    waiter.set_value();
  }

  bool accepted = false;
  try {
    accepted = sink_(next.command, next.payload, next.filter);
  } catch (const std::exception &e) {
    LOG_NET_WARN("Transport failed on '{}' for {}: {}", next.command,
                 next.filter.ToString(), e.what());
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (accepted) {
    ++delivered_;
  } else {
    ++dropped_;
    LOG_NET_WARN("Transport dropped '{}' for {}", next.command, next.filter.ToString());
  }

  // Keep draining one message per handler until the queue is empty
  if (!stopped_ && !queue_.empty()) {
    boost::asio::post(strand_, [self = shared_from_this()]() { self->DrainOne(); });
  } else {
    drain_scheduled_ = false;
  }
}

} // namespace network
} // namespace headerpipe
