#include "sync/header_slices.hpp"
#include "util/logging.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace headerpipe {
namespace sync {

std::string HeaderSliceStatusToString(HeaderSliceStatus status) {
  switch (status) {
  case HeaderSliceStatus::Empty:
    return "empty";
  case HeaderSliceStatus::Waiting:
    return "waiting";
  case HeaderSliceStatus::Downloaded:
    return "downloaded";
  case HeaderSliceStatus::Verified:
    return "verified";
  case HeaderSliceStatus::Invalid:
    return "invalid";
  case HeaderSliceStatus::Refetch:
    return "refetch";
  case HeaderSliceStatus::Saved:
    return "saved";
  }
  return "unknown";
}

HeaderSliceWriteGuard HeaderSliceUpgradableGuard::Upgrade() && {
  return HeaderSliceWriteGuard(std::move(lock_), *slice_, *detached_);
}

HeaderSlices::HeaderSlices(size_t max_slices, BlockNum start_block_num,
                           std::optional<BlockNum> final_block_num)
    : max_slices_(max_slices),
      final_block_num_(final_block_num),
      next_start_block_num_(start_block_num - start_block_num % kHeaderSliceSize) {
  if (max_slices_ == 0) {
    throw std::invalid_argument("HeaderSlices needs room for at least one slice");
  }
  if (final_block_num_ && *final_block_num_ < start_block_num) {
    throw std::invalid_argument("final block is below the start block");
  }

  for (auto &watch : watches_) {
    watch = std::make_unique<util::WatchSender<size_t>>(0);
  }

  BlockNum first_block = next_start_block_num_;
  std::unique_lock<std::shared_mutex> lock(slices_mutex_);
  size_t added = RefillLocked();
  LOG_SYNC_DEBUG("HeaderSlices: created {} slices starting at block {}", added,
                 first_block);
}

HeaderSlices::~HeaderSlices() { Close(); }

size_t HeaderSlices::CountSlicesInStatus(HeaderSliceStatus status) const {
  std::lock_guard<std::mutex> lock(counts_mutex_);
  return counts_[Index(status)];
}

util::WatchReceiver<size_t>
HeaderSlices::WatchStatusChanges(HeaderSliceStatus status) const {
  return watches_[Index(status)]->Subscribe();
}

bool HeaderSlices::SetSliceStatus(HeaderSliceWriteGuard &slice,
                                  HeaderSliceStatus status) {
  if (slice.IsDetached()) {
    LOG_SYNC_DEBUG("HeaderSlices: slice at block {} was removed, status stays {}",
                   slice->start_block_num, HeaderSliceStatusToString(slice->status));
    return false;
  }
  HeaderSliceStatus previous = slice->status;
  if (previous == status) {
    return true;
  }
  AdjustCounts(previous, status);
  slice->status = status;
  return true;
}

void HeaderSlices::AdjustCounts(HeaderSliceStatus from, HeaderSliceStatus to) {
  std::lock_guard<std::mutex> lock(counts_mutex_);
  size_t &from_count = counts_[Index(from)];
  if (from_count == 0) {
    // Would mean a status was changed behind our back
    throw std::logic_error("slice status count underflow for " +
                           HeaderSliceStatusToString(from));
  }
  --from_count;
  ++counts_[Index(to)];
  watches_[Index(from)]->Send(from_count);
  watches_[Index(to)]->Send(counts_[Index(to)]);
}

HeaderSliceLockPtr HeaderSlices::FindByStartBlockNum(BlockNum start_block_num) const {
  std::shared_lock<std::shared_mutex> lock(slices_mutex_);
  // Removal may leave gaps, so no index arithmetic here
  for (const auto &slice : slices_) {
    if (slice->Read()->start_block_num == start_block_num) {
      return slice;
    }
  }
  return nullptr;
}

size_t HeaderSlices::Refill() {
  std::unique_lock<std::shared_mutex> lock(slices_mutex_);
  return RefillLocked();
}

size_t HeaderSlices::RefillLocked() {
  size_t added = 0;
  while (!exhausted_ && slices_.size() < max_slices_) {
    if (final_block_num_ && next_start_block_num_ > *final_block_num_) {
      break;
    }
    HeaderSlice slice;
    slice.start_block_num = next_start_block_num_;
    slices_.push_back(std::make_shared<HeaderSliceLock>(std::move(slice)));
    ++added;
    if (next_start_block_num_ > std::numeric_limits<BlockNum>::max() - kHeaderSliceSize) {
      exhausted_ = true;
      LOG_SYNC_DEBUG("HeaderSlices: reached the end of the block range at {}",
                     next_start_block_num_);
    } else {
      next_start_block_num_ += kHeaderSliceSize;
    }
  }

  if (added > 0) {
    std::lock_guard<std::mutex> lock(counts_mutex_);
    size_t &empty = counts_[Index(HeaderSliceStatus::Empty)];
    empty += added;
    watches_[Index(HeaderSliceStatus::Empty)]->Send(empty);
  }
  return added;
}

size_t HeaderSlices::RemoveInStatus(HeaderSliceStatus status) {
  std::unique_lock<std::shared_mutex> lock(slices_mutex_);

  // Matching slices stay write-locked until they are detached so their
  // status cannot change between the match and the count update
  std::vector<HeaderSliceWriteGuard> removed_guards;
  std::deque<HeaderSliceLockPtr> kept;
  for (const auto &slice : slices_) {
    auto guard = slice->Write();
    if (guard->status == status) {
      removed_guards.push_back(std::move(guard));
    } else {
      kept.push_back(slice);
    }
  }
  size_t removed = removed_guards.size();
  if (removed == 0) {
    return 0;
  }

  std::lock_guard<std::mutex> counts_lock(counts_mutex_);
  size_t &count = counts_[Index(status)];
  if (count < removed) {
    throw std::logic_error("slice status count mismatch for " +
                           HeaderSliceStatusToString(status) + ": counted " +
                           std::to_string(count) + ", found " + std::to_string(removed));
  }
  for (auto &guard : removed_guards) {
    guard.Detach();
  }
  slices_.swap(kept);
  count -= removed;
  watches_[Index(status)]->Send(count);
  LOG_SYNC_DEBUG("HeaderSlices: removed {} {} slices", removed,
                 HeaderSliceStatusToString(status));
  return removed;
}

size_t HeaderSlices::Size() const {
  std::shared_lock<std::shared_mutex> lock(slices_mutex_);
  return slices_.size();
}

BlockNum HeaderSlices::MinBlockNum() const {
  std::shared_lock<std::shared_mutex> lock(slices_mutex_);
  if (slices_.empty()) {
    return next_start_block_num_;
  }
  return slices_.front()->Read()->start_block_num;
}

BlockNum HeaderSlices::MaxBlockNum() const {
  std::shared_lock<std::shared_mutex> lock(slices_mutex_);
  if (exhausted_) {
    return std::numeric_limits<BlockNum>::max();
  }
  return next_start_block_num_;
}

void HeaderSlices::Close() {
  for (auto &watch : watches_) {
    if (watch) {
      watch->Close();
    }
  }
}

} // namespace sync
} // namespace headerpipe
