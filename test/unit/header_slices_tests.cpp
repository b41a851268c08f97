// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for sync/header_slices.cpp

#include <catch2/catch_test_macros.hpp>
#include "sync/header_slices.hpp"
#include <atomic>
#include <chrono>
#include <limits>
#include <optional>
#include <thread>

using namespace headerpipe::sync;
using headerpipe::util::WatchClosedError;

namespace {

void SetStatus(HeaderSlices& slices, BlockNum start_block, HeaderSliceStatus status) {
    auto slice = slices.FindByStartBlockNum(start_block);
    REQUIRE(slice);
    auto guard = slice->Write();
    REQUIRE(slices.SetSliceStatus(guard, status));
}

} // namespace

TEST_CASE("HeaderSlices - construction", "[sync][slices]") {
    SECTION("start is rounded down to a slice boundary") {
        HeaderSlices slices(4, kHeaderSliceSize + 5);
        REQUIRE(slices.Size() == 4);
        REQUIRE(slices.MinBlockNum() == kHeaderSliceSize);
        REQUIRE(slices.MaxBlockNum() == 5 * kHeaderSliceSize);
        REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 4);
    }

    SECTION("final block limits the slice count") {
        // Blocks 0..400 need slices at 0, 192 and 384
        HeaderSlices slices(10, 0, 400);
        REQUIRE(slices.Size() == 3);
        REQUIRE(slices.FindByStartBlockNum(384));
        REQUIRE_FALSE(slices.FindByStartBlockNum(576));
    }

    SECTION("new slices carry no request state") {
        HeaderSlices slices(1, 0);
        auto slice = slices.FindByStartBlockNum(0);
        REQUIRE(slice);
        auto read = slice->Read();
        REQUIRE(read->status == HeaderSliceStatus::Empty);
        REQUIRE_FALSE(read->request_time.has_value());
        REQUIRE(read->request_attempt == 0);
    }

    SECTION("invalid arguments") {
        REQUIRE_THROWS_AS(HeaderSlices(0, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(HeaderSlices(4, 1000, 10), std::invalid_argument);
    }
}

TEST_CASE("HeaderSlices - status counts follow SetSliceStatus", "[sync][slices]") {
    HeaderSlices slices(3, 0);

    SetStatus(slices, 0, HeaderSliceStatus::Waiting);
    SetStatus(slices, kHeaderSliceSize, HeaderSliceStatus::Waiting);
    SetStatus(slices, kHeaderSliceSize, HeaderSliceStatus::Downloaded);

    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 1);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Waiting) == 1);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Downloaded) == 1);

    // Same-status transition is a no-op
    SetStatus(slices, 0, HeaderSliceStatus::Waiting);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Waiting) == 1);

    size_t total = 0;
    for (size_t i = 0; i < kHeaderSliceStatusCount; ++i) {
        total += slices.CountSlicesInStatus(static_cast<HeaderSliceStatus>(i));
    }
    REQUIRE(total == slices.Size());
}

TEST_CASE("HeaderSlices - status watches", "[sync][slices][watch]") {
    HeaderSlices slices(2, 0);
    auto empty = slices.WatchStatusChanges(HeaderSliceStatus::Empty);
    auto waiting = slices.WatchStatusChanges(HeaderSliceStatus::Waiting);
    REQUIRE(empty.Borrow() == 2);
    REQUIRE(waiting.Borrow() == 0);

    SetStatus(slices, 0, HeaderSliceStatus::Waiting);
    REQUIRE(empty.HasChanged());
    REQUIRE(empty.BorrowAndUpdate() == 1);
    REQUIRE(waiting.BorrowAndUpdate() == 1);

    SECTION("a blocked watcher wakes on the next change") {
        std::atomic<bool> woke{false};
        std::thread watcher([&] {
            while (empty.BorrowAndUpdate() != 2) {
                empty.Changed();
            }
            woke = true;
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE_FALSE(woke);

        SetStatus(slices, 0, HeaderSliceStatus::Empty);
        watcher.join();
        REQUIRE(woke);
    }

    SECTION("Close() ends every watch") {
        slices.Close();
        REQUIRE_THROWS_AS(waiting.Changed(), WatchClosedError);
        REQUIRE_THROWS_AS(empty.Changed(), WatchClosedError);
    }
}

TEST_CASE("HeaderSlices - ForEach", "[sync][slices]") {
    HeaderSlices slices(5, 0);

    SECTION("visits in block order") {
        std::vector<BlockNum> seen;
        auto result = slices.ForEach([&](HeaderSliceLock& slice) -> std::optional<int> {
            seen.push_back(slice.Read()->start_block_num);
            return std::nullopt;
        });
        REQUIRE_FALSE(result.has_value());
        REQUIRE(seen == std::vector<BlockNum>{0, 192, 384, 576, 768});
    }

    SECTION("first engaged result stops the walk") {
        size_t visited = 0;
        auto result = slices.ForEach([&](HeaderSliceLock& slice) -> std::optional<BlockNum> {
            ++visited;
            BlockNum start = slice.Read()->start_block_num;
            if (start == 384) return start;
            return std::nullopt;
        });
        REQUIRE(result == BlockNum{384});
        REQUIRE(visited == 3);
    }
}

TEST_CASE("HeaderSlices - upgradable guard", "[sync][slices][lock]") {
    HeaderSlices slices(1, 0);
    auto slice = slices.FindByStartBlockNum(0);

    auto upgradable = slice->UpgradableRead();
    REQUIRE(upgradable->status == HeaderSliceStatus::Empty);

    // Plain readers may coexist with the upgradable holder
    std::optional<HeaderSliceStatus> reader_saw;
    std::thread reader([&] { reader_saw = slice->Read()->status; });
    reader.join();
    REQUIRE(reader_saw == HeaderSliceStatus::Empty);

    // A second upgradable holder has to wait for the first to finish
    std::atomic<bool> second_entered{false};
    std::optional<HeaderSliceStatus> second_saw;
    std::thread second([&] {
        auto other = slice->UpgradableRead();
        second_entered = true;
        second_saw = other->status;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE_FALSE(second_entered);

    {
        auto write = std::move(upgradable).Upgrade();
        write->request_attempt = 1;
        REQUIRE(slices.SetSliceStatus(write, HeaderSliceStatus::Waiting));
    }

    second.join();
    REQUIRE(second_entered);
    REQUIRE(second_saw == HeaderSliceStatus::Waiting);
}

TEST_CASE("HeaderSlices - removal and refill", "[sync][slices]") {
    HeaderSlices slices(4, 0);
    SetStatus(slices, 0, HeaderSliceStatus::Saved);
    SetStatus(slices, 2 * kHeaderSliceSize, HeaderSliceStatus::Saved);

    auto saved = slices.WatchStatusChanges(HeaderSliceStatus::Saved);
    REQUIRE(slices.RemoveInStatus(HeaderSliceStatus::Saved) == 2);
    REQUIRE(slices.Size() == 2);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Saved) == 0);
    REQUIRE(saved.BorrowAndUpdate() == 0);
    REQUIRE(slices.MinBlockNum() == kHeaderSliceSize);

    // Lookup still works with a gap in the list
    REQUIRE(slices.FindByStartBlockNum(3 * kHeaderSliceSize));
    REQUIRE_FALSE(slices.FindByStartBlockNum(0));

    REQUIRE(slices.Refill() == 2);
    REQUIRE(slices.Size() == 4);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 4);
    REQUIRE(slices.FindByStartBlockNum(4 * kHeaderSliceSize));
    REQUIRE(slices.FindByStartBlockNum(5 * kHeaderSliceSize));
    REQUIRE(slices.MaxBlockNum() == 6 * kHeaderSliceSize);

    REQUIRE(slices.RemoveInStatus(HeaderSliceStatus::Invalid) == 0);
    REQUIRE(slices.Refill() == 0);
}

TEST_CASE("HeaderSlices - removed slice keeps its status", "[sync][slices]") {
    HeaderSlices slices(2, 0);
    auto stale = slices.FindByStartBlockNum(0);
    REQUIRE(stale);

    SetStatus(slices, 0, HeaderSliceStatus::Saved);
    REQUIRE(slices.RemoveInStatus(HeaderSliceStatus::Saved) == 1);

    // A stage that looked the slice up before the removal still holds it
    auto empty = slices.WatchStatusChanges(HeaderSliceStatus::Empty);
    empty.BorrowAndUpdate();
    {
        auto guard = stale->Write();
        REQUIRE(guard.IsDetached());
        REQUIRE_FALSE(slices.SetSliceStatus(guard, HeaderSliceStatus::Empty));
        REQUIRE(guard->status == HeaderSliceStatus::Saved);
    }

    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 1);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Saved) == 0);
    REQUIRE_FALSE(empty.HasChanged());

    // The remaining slice is unaffected
    SetStatus(slices, kHeaderSliceSize, HeaderSliceStatus::Waiting);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 0);
    REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Waiting) == 1);
    REQUIRE_FALSE(slices.FindByStartBlockNum(kHeaderSliceSize)->Write().IsDetached());
}

TEST_CASE("HeaderSlices - end of the block range", "[sync][slices]") {
    constexpr BlockNum kMax = std::numeric_limits<BlockNum>::max();
    // Last slice boundary below UINT64_MAX
    constexpr BlockNum kLastStart = kMax - kMax % kHeaderSliceSize;

    SECTION("unbounded") {
        HeaderSlices slices(4, kMax - 10);
        REQUIRE(slices.Size() == 1);
        REQUIRE(slices.MinBlockNum() == kLastStart);
        REQUIRE(slices.MaxBlockNum() == kMax);
        REQUIRE(slices.FindByStartBlockNum(kLastStart));
        REQUIRE_FALSE(slices.FindByStartBlockNum(0));

        SetStatus(slices, kLastStart, HeaderSliceStatus::Saved);
        REQUIRE(slices.RemoveInStatus(HeaderSliceStatus::Saved) == 1);
        REQUIRE(slices.Refill() == 0);
        REQUIRE(slices.Size() == 0);
        REQUIRE(slices.MaxBlockNum() == kMax);
    }

    SECTION("final block at UINT64_MAX") {
        HeaderSlices slices(4, kMax - 10, kMax);
        REQUIRE(slices.Size() == 1);
        REQUIRE(slices.MaxBlockNum() == kMax);
        REQUIRE(slices.Refill() == 0);
    }

    SECTION("several slices before the end") {
        HeaderSlices slices(10, kLastStart - 2 * kHeaderSliceSize);
        REQUIRE(slices.Size() == 3);
        REQUIRE(slices.CountSlicesInStatus(HeaderSliceStatus::Empty) == 3);
        REQUIRE(slices.FindByStartBlockNum(kLastStart));
        REQUIRE(slices.MaxBlockNum() == kMax);
    }
}

TEST_CASE("HeaderSlices - status names", "[sync][slices]") {
    REQUIRE(HeaderSliceStatusToString(HeaderSliceStatus::Empty) == "empty");
    REQUIRE(HeaderSliceStatusToString(HeaderSliceStatus::Waiting) == "waiting");
    REQUIRE(HeaderSliceStatusToString(HeaderSliceStatus::Saved) == "saved");
}
