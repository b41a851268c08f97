#pragma once

#include "network/gateway.hpp"
#include <utility>  // before asio: Boost 1.74 awaitable.hpp uses std::exchange without it
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace headerpipe {
namespace network {

// Transport hand-off: returns false if the transport dropped the message.
// An exception from the sink counts as a drop.
using MessageSink = std::function<bool(const std::string &command,
                                       const std::vector<uint8_t> &payload,
                                       const PeerFilter &filter)>;

/**
 * SendQueueGateway - Gateway backed by a bounded in-memory queue
 *
 * Messages are serialized on TrySendMessage() and queued; the queue is
 * drained on a boost::asio strand into the MessageSink, one message per
 * handler so other work on the io_context interleaves.
 *
 * Capacity is counted in messages. Capacity waiters are woken whenever the
 * drain frees a slot; every waiter gets the same wake-up and is expected to
 * race for the slot with TrySendMessage() again.
 */
class SendQueueGateway : public Gateway,
                         public std::enable_shared_from_this<SendQueueGateway> {
public:
  static std::shared_ptr<SendQueueGateway>
  Create(boost::asio::io_context &io_context, size_t capacity, MessageSink sink);

  ~SendQueueGateway() override;

  SendQueueGateway(const SendQueueGateway &) = delete;
  SendQueueGateway &operator=(const SendQueueGateway &) = delete;
  SendQueueGateway(SendQueueGateway &&) = delete;
  SendQueueGateway &operator=(SendQueueGateway &&) = delete;

  // Gateway interface
  SendResult TrySendMessage(const message::Message &msg,
                            const PeerFilter &filter) override;
  std::future<void> ReserveCapacityInSendQueue() override;

  /**
   * Stop accepting messages. Queued messages are discarded and every pending
   * capacity future fails with GatewayStoppedError. Safe to call repeatedly.
   */
  void Stop();

  bool IsStopped() const;
  size_t QueuedCount() const;
  size_t Capacity() const { return capacity_; }

  // Statistics
  uint64_t DeliveredCount() const;
  uint64_t DroppedCount() const;

private:
  SendQueueGateway(boost::asio::io_context &io_context, size_t capacity,
                   MessageSink sink);

  struct OutboundMessage {
    std::string command;
    std::vector<uint8_t> payload;
    PeerFilter filter;
  };

  // Must be called with mutex_ held
  void ScheduleDrainLocked();
  void DrainOne();

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  const size_t capacity_;
  MessageSink sink_;

  mutable std::mutex mutex_;
  std::deque<OutboundMessage> queue_;
  std::vector<std::promise<void>> capacity_waiters_;
  bool stopped_{false};
  bool drain_scheduled_{false};
  uint64_t delivered_{0};
  uint64_t dropped_{0};
};

} // namespace network
} // namespace headerpipe
