#pragma once

/*
 * HeaderSlices - shared work list of the header download pipeline
 *
 * The headers range being synced is cut into fixed-size slices of
 * kHeaderSliceSize blocks. Each pipeline stage walks the list and moves the
 * slices it is responsible for to the next status:
 *
 *   Empty -> Waiting -> Downloaded -> Verified -> Saved
 *                 \          \-> Invalid -> Refetch -> Empty
 *                  \-> (timeout) Empty
 *
 * Locking:
 * - every slice has its own boost::upgrade_mutex, so stages working on
 *   different slices never contend
 * - the slice list itself is guarded by a shared_mutex that is held shared
 *   while iterating and exclusively only when slices are added or removed
 * - per-status counts are updated only through SetSliceStatus(), which
 *   demands a write guard, and are published on one watch channel per status
 */

#include "util/watch.hpp"
#include <array>
#include <atomic>
#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>

namespace headerpipe {
namespace sync {

using BlockNum = uint64_t;

// Number of blocks covered by one slice
constexpr size_t kHeaderSliceSize = 192;

enum class HeaderSliceStatus : uint8_t {
  Empty = 0,  // nothing requested yet
  Waiting,    // request sent, waiting for a response
  Downloaded, // headers received, not yet verified
  Verified,   // headers link correctly
  Invalid,    // verification failed
  Refetch,    // scheduled for another download attempt
  Saved,      // persisted, slice can be dropped
};

constexpr size_t kHeaderSliceStatusCount = 7;

std::string HeaderSliceStatusToString(HeaderSliceStatus status);

struct HeaderSlice {
  BlockNum start_block_num{0};
  HeaderSliceStatus status{HeaderSliceStatus::Empty};
  std::optional<std::chrono::steady_clock::time_point> request_time;
  uint32_t request_attempt{0};
};

class HeaderSliceLock;

// Shared (read-only) access to a slice
class HeaderSliceReadGuard {
public:
  const HeaderSlice &operator*() const { return *slice_; }
  const HeaderSlice *operator->() const { return slice_; }

private:
  friend class HeaderSliceLock;
  HeaderSliceReadGuard(boost::upgrade_mutex &mutex, const HeaderSlice &slice)
      : lock_(mutex), slice_(&slice) {}

  boost::shared_lock<boost::upgrade_mutex> lock_;
  const HeaderSlice *slice_;
};

// Exclusive access to a slice; required by HeaderSlices::SetSliceStatus()
class HeaderSliceWriteGuard {
public:
  HeaderSlice &operator*() const { return *slice_; }
  HeaderSlice *operator->() const { return slice_; }

  // True once the store has removed this slice; its status is then frozen
  bool IsDetached() const { return *detached_; }

private:
  friend class HeaderSliceLock;
  friend class HeaderSliceUpgradableGuard;
  friend class HeaderSlices;
  HeaderSliceWriteGuard(boost::upgrade_mutex &mutex, HeaderSlice &slice, bool &detached)
      : lock_(mutex), slice_(&slice), detached_(&detached) {}
  HeaderSliceWriteGuard(boost::upgrade_lock<boost::upgrade_mutex> &&upgradable,
                        HeaderSlice &slice, bool &detached)
      : lock_(std::move(upgradable)), slice_(&slice), detached_(&detached) {}

  void Detach() { *detached_ = true; }

  boost::unique_lock<boost::upgrade_mutex> lock_;
  HeaderSlice *slice_;
  bool *detached_;
};

/**
 * Read access that can later be turned into exclusive access without
 * releasing the lock in between.
 *
 * Only one upgradable holder exists per slice at a time (plain readers may
 * coexist), so two stages can never both observe a status and both act on it.
 */
class HeaderSliceUpgradableGuard {
public:
  const HeaderSlice &operator*() const { return *slice_; }
  const HeaderSlice *operator->() const { return slice_; }

  // Atomically upgrade to exclusive access; this guard becomes unusable
  HeaderSliceWriteGuard Upgrade() &&;

private:
  friend class HeaderSliceLock;
  HeaderSliceUpgradableGuard(boost::upgrade_mutex &mutex, HeaderSlice &slice, bool &detached)
      : lock_(mutex), slice_(&slice), detached_(&detached) {}

  boost::upgrade_lock<boost::upgrade_mutex> lock_;
  HeaderSlice *slice_;
  bool *detached_;
};

/**
 * HeaderSliceLock - one slice plus its lock
 */
class HeaderSliceLock {
public:
  explicit HeaderSliceLock(HeaderSlice slice) : slice_(std::move(slice)) {}

  HeaderSliceLock(const HeaderSliceLock &) = delete;
  HeaderSliceLock &operator=(const HeaderSliceLock &) = delete;

  HeaderSliceReadGuard Read() const { return HeaderSliceReadGuard(mutex_, slice_); }
  HeaderSliceUpgradableGuard UpgradableRead() {
    return HeaderSliceUpgradableGuard(mutex_, slice_, detached_);
  }
  HeaderSliceWriteGuard Write() { return HeaderSliceWriteGuard(mutex_, slice_, detached_); }

private:
  mutable boost::upgrade_mutex mutex_;
  HeaderSlice slice_;
  bool detached_{false};
};

using HeaderSliceLockPtr = std::shared_ptr<HeaderSliceLock>;

/**
 * HeaderSlices - the shared slice collection
 */
class HeaderSlices {
public:
  /**
   * @param max_slices upper bound on slices held at once
   * @param start_block_num first block to sync; rounded down to a slice boundary
   * @param final_block_num last block to sync (inclusive), unbounded if unset
   */
  HeaderSlices(size_t max_slices, BlockNum start_block_num,
               std::optional<BlockNum> final_block_num = std::nullopt);
  ~HeaderSlices();

  HeaderSlices(const HeaderSlices &) = delete;
  HeaderSlices &operator=(const HeaderSlices &) = delete;

  /**
   * Visit every slice in block order while the slice list is held shared.
   *
   * The visitor returns std::optional<R>; the first engaged result stops the
   * iteration and is returned. std::nullopt means the whole list was visited.
   */
  template <typename Visitor>
  auto ForEach(Visitor &&visitor) const
      -> std::invoke_result_t<Visitor &, HeaderSliceLock &>;

  size_t CountSlicesInStatus(HeaderSliceStatus status) const;

  // Receiver that sees the slice count of `status` on every change
  util::WatchReceiver<size_t> WatchStatusChanges(HeaderSliceStatus status) const;

  /**
   * Change a slice's status and keep the aggregate counts in step.
   *
   * Returns false, leaving the slice untouched, if the slice was removed from
   * the store after the caller found it. Throws std::logic_error if the counts
   * disagree with the slice; nothing is modified in that case.
   */
  [[nodiscard]] bool SetSliceStatus(HeaderSliceWriteGuard &slice, HeaderSliceStatus status);

  HeaderSliceLockPtr FindByStartBlockNum(BlockNum start_block_num) const;

  // Append Empty slices until max_slices or the final block is reached.
  // Returns the number of slices added.
  size_t Refill();

  // Drop all slices currently in `status`; returns the number removed.
  // Removed slices are detached: later SetSliceStatus() calls on them fail.
  size_t RemoveInStatus(HeaderSliceStatus status);

  size_t Size() const;

  // First block of the lowest slice, or the next block to be sliced if empty
  BlockNum MinBlockNum() const;
  // One past the last block covered by the highest slice. Saturates at
  // UINT64_MAX once the slice at the top of the block range has been added.
  BlockNum MaxBlockNum() const;

  /**
   * Close every status watch. Stages blocked on WatchStatusChanges() wake up
   * with util::WatchClosedError; used when the pipeline shuts down.
   */
  void Close();

private:
  // Must be called with slices_mutex_ held exclusively
  size_t RefillLocked();
  void AdjustCounts(HeaderSliceStatus from, HeaderSliceStatus to);

  static size_t Index(HeaderSliceStatus status) {
    return static_cast<size_t>(status);
  }

  const size_t max_slices_;
  const std::optional<BlockNum> final_block_num_;

  // Lock order: slices_mutex_, then a slice lock, then counts_mutex_
  mutable std::shared_mutex slices_mutex_;
  std::deque<HeaderSliceLockPtr> slices_;
  BlockNum next_start_block_num_;
  // Set once no further slice start fits below UINT64_MAX
  bool exhausted_{false};

  // counts_ and the watch senders are updated together under counts_mutex_ so
  // a watcher can never observe an older count after a newer one
  mutable std::mutex counts_mutex_;
  std::array<size_t, kHeaderSliceStatusCount> counts_{};
  std::array<std::unique_ptr<util::WatchSender<size_t>>, kHeaderSliceStatusCount> watches_;
};

template <typename Visitor>
auto HeaderSlices::ForEach(Visitor &&visitor) const
    -> std::invoke_result_t<Visitor &, HeaderSliceLock &> {
  std::shared_lock<std::shared_mutex> lock(slices_mutex_);
  for (const auto &slice : slices_) {
    auto result = visitor(*slice);
    if (result) {
      return result;
    }
  }
  return std::nullopt;
}

} // namespace sync
} // namespace headerpipe
