// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace headerpipe {
namespace util {

/**
 * Thrown by WatchReceiver::Changed() once the sending side is gone and no
 * unseen value is left.
 */
class WatchClosedError : public std::runtime_error {
public:
  WatchClosedError() : std::runtime_error("watch channel closed") {}
};

template <typename T>
class WatchReceiver;

namespace detail {

template <typename T>
struct WatchState {
  explicit WatchState(T initial) : value(std::move(initial)) {}

  std::mutex mutex;
  std::condition_variable changed;
  T value;
  uint64_t version{0};
  bool closed{false};
};

} // namespace detail

/**
 * WatchSender - producing side of a last-value-wins channel
 *
 * Only the latest value is retained. Every Send() bumps a version number and
 * wakes all blocked receivers; a receiver that was not waiting simply sees the
 * newest value on its next Borrow().
 *
 * Usage:
 *   WatchSender<size_t> pending(0);
 *   auto rx = pending.Subscribe();
 *
 *   // consumer thread
 *   while (rx.BorrowAndUpdate() == 0) {
 *     rx.Changed();  // blocks, throws WatchClosedError when sender closes
 *   }
 *
 *   // producer thread
 *   pending.Send(5);
 *
 * Destroying the sender closes the channel.
 */
template <typename T>
class WatchSender {
public:
  explicit WatchSender(T initial = T{})
      : state_(std::make_shared<detail::WatchState<T>>(std::move(initial))) {}

  ~WatchSender() { Close(); }

  WatchSender(const WatchSender&) = delete;
  WatchSender& operator=(const WatchSender&) = delete;
  WatchSender(WatchSender&&) = delete;
  WatchSender& operator=(WatchSender&&) = delete;

  // Publish a new value (ignored once closed)
  void Send(T value) {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->closed) {
        return;
      }
      state_->value = std::move(value);
      ++state_->version;
    }
    state_->changed.notify_all();
  }

  // Mark the producer as gone; blocked receivers wake up and throw
  void Close() {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->closed) {
        return;
      }
      state_->closed = true;
    }
    state_->changed.notify_all();
  }

  bool IsClosed() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->closed;
  }

  // New receiver; it treats the current value as already seen
  WatchReceiver<T> Subscribe() const { return WatchReceiver<T>(state_); }

private:
  std::shared_ptr<detail::WatchState<T>> state_;
};

/**
 * WatchReceiver - consuming side of a WatchSender
 *
 * Copyable; each copy tracks its own "last seen" version. Not safe to share a
 * single receiver between threads without external locking.
 */
template <typename T>
class WatchReceiver {
public:
  // Copy of the latest value, without marking it seen
  T Borrow() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->value;
  }

  // Copy of the latest value, marking it seen
  T BorrowAndUpdate() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    seen_version_ = state_->version;
    return state_->value;
  }

  // True if a value newer than the last seen one was sent
  bool HasChanged() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->version != seen_version_;
  }

  /**
   * Block until a value newer than the last seen one is available, then mark
   * it seen. Callers re-check their predicate afterwards.
   *
   * @throws WatchClosedError if the sender closed with nothing unseen pending
   */
  void Changed() {
    std::unique_lock<std::mutex> lock(state_->mutex);
    state_->changed.wait(lock, [this] {
      return state_->version != seen_version_ || state_->closed;
    });
    if (state_->version == seen_version_) {
      throw WatchClosedError();
    }
    seen_version_ = state_->version;
  }

private:
  friend class WatchSender<T>;

  explicit WatchReceiver(std::shared_ptr<detail::WatchState<T>> state)
      : state_(std::move(state)) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    seen_version_ = state_->version;
  }

  std::shared_ptr<detail::WatchState<T>> state_;
  uint64_t seen_version_{0};
};

} // namespace util
} // namespace headerpipe
