#pragma once

#include "network/gateway.hpp"
#include "network/message.hpp"
#include <condition_variable>
#include <chrono>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <vector>

namespace headerpipe {
namespace network {

// Gateway mock for unit tests: records requests, scripted send results,
// capacity futures resolved by the test
class MockGateway : public Gateway {
public:
    struct SentRequest {
        uint64_t request_id;
        message::BlockId start_block;
        uint64_t limit;
        uint64_t skip;
        bool reverse;
        PeerFilter filter;
    };

    SendResult TrySendMessage(const message::Message& msg, const PeerFilter& filter) override {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t attempt = attempts_++;

        auto scripted = scripted_.find(attempt);
        SendResult result = scripted != scripted_.end() ? scripted->second : default_result_;
        if (result != SendResult::OK) {
            return result;
        }

        // Decode from the wire so the tests also cover serialization
        message::GetBlockHeadersMessage decoded;
        auto payload = msg.serialize();
        if (msg.command() != protocol::commands::GET_BLOCK_HEADERS ||
            !decoded.deserialize(payload.data(), payload.size())) {
            return SendResult::FAILED;
        }
        sent_.push_back(SentRequest{decoded.request_id, decoded.start_block, decoded.limit,
                                    decoded.skip, decoded.reverse, filter});
        return SendResult::OK;
    }

    std::future<void> ReserveCapacityInSendQueue() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++capacity_requests_;
        std::promise<void> promise;
        auto future = promise.get_future();
        if (capacity_available_) {
            promise.set_value();
        } else {
            capacity_waiters_.push_back(std::move(promise));
        }
        capacity_cv_.notify_all();
        return future;
    }

    // Result returned by the Nth send attempt (0-based), counted over the mock's lifetime
    void ScriptResult(size_t attempt, SendResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripted_[attempt] = result;
    }

    // Result for attempts without a scripted entry
    void SetDefaultResult(SendResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        default_result_ = result;
    }

    // When false, capacity futures stay pending until ResolveCapacity()/FailCapacity()
    void SetCapacityAvailable(bool available) {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_available_ = available;
    }

    void ResolveCapacity() {
        std::vector<std::promise<void>> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            waiters.swap(capacity_waiters_);
        }
        for (auto& waiter : waiters) {
            waiter.set_value();
        }
    }

    void FailCapacity() {
        std::vector<std::promise<void>> waiters;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            waiters.swap(capacity_waiters_);
        }
        for (auto& waiter : waiters) {
            waiter.set_exception(std::make_exception_ptr(GatewayStoppedError()));
        }
    }

    // Drop pending capacity promises unfulfilled (futures see broken_promise)
    void AbandonCapacity() {
        std::lock_guard<std::mutex> lock(mutex_);
        capacity_waiters_.clear();
    }

    // Block until `count` capacity futures have been handed out
    bool WaitForCapacityRequests(size_t count,
                                 std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
        std::unique_lock<std::mutex> lock(mutex_);
        return capacity_cv_.wait_for(lock, timeout,
                                     [&] { return capacity_requests_ >= count; });
    }

    std::vector<SentRequest> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    size_t attempts() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_;
    }

    size_t capacity_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capacity_requests_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable capacity_cv_;
    std::map<size_t, SendResult> scripted_;
    SendResult default_result_{SendResult::OK};
    std::vector<SentRequest> sent_;
    size_t attempts_{0};
    bool capacity_available_{true};
    size_t capacity_requests_{0};
    std::vector<std::promise<void>> capacity_waiters_;
};

} // namespace network
} // namespace headerpipe
