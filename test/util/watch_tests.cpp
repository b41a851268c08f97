// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for util/watch.hpp

#include <catch2/catch_test_macros.hpp>
#include "util/watch.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace headerpipe::util;

TEST_CASE("Watch - latest value wins", "[util][watch]") {
    WatchSender<int> tx(0);
    auto rx = tx.Subscribe();

    REQUIRE(rx.Borrow() == 0);
    REQUIRE_FALSE(rx.HasChanged());

    tx.Send(1);
    tx.Send(2);
    tx.Send(3);

    REQUIRE(rx.HasChanged());
    REQUIRE(rx.Borrow() == 3);
    // Borrow() does not mark the value seen
    REQUIRE(rx.HasChanged());

    REQUIRE(rx.BorrowAndUpdate() == 3);
    REQUIRE_FALSE(rx.HasChanged());
}

TEST_CASE("Watch - receivers track their own cursor", "[util][watch]") {
    WatchSender<int> tx(0);
    auto a = tx.Subscribe();
    tx.Send(5);
    auto b = tx.Subscribe();

    REQUIRE(a.HasChanged());
    REQUIRE_FALSE(b.HasChanged());
    REQUIRE(b.Borrow() == 5);

    auto c = a;
    a.BorrowAndUpdate();
    REQUIRE_FALSE(a.HasChanged());
    REQUIRE(c.HasChanged());
}

TEST_CASE("Watch - Changed() returns immediately for an unseen value", "[util][watch]") {
    WatchSender<int> tx(0);
    auto rx = tx.Subscribe();
    tx.Send(9);

    rx.Changed();
    REQUIRE_FALSE(rx.HasChanged());
    REQUIRE(rx.Borrow() == 9);
}

TEST_CASE("Watch - Changed() blocks until Send()", "[util][watch]") {
    WatchSender<int> tx(0);
    auto rx = tx.Subscribe();
    std::atomic<bool> woke{false};

    std::thread waiter([&] {
        rx.Changed();
        woke = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE_FALSE(woke);

    tx.Send(1);
    waiter.join();
    REQUIRE(woke);
}

TEST_CASE("Watch - closing", "[util][watch]") {
    SECTION("Close wakes a blocked receiver with WatchClosedError") {
        WatchSender<int> tx(0);
        auto rx = tx.Subscribe();
        std::atomic<bool> threw{false};

        std::thread waiter([&] {
            try {
                rx.Changed();
            } catch (const WatchClosedError&) {
                threw = true;
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        tx.Close();
        waiter.join();
        REQUIRE(threw);
        REQUIRE(tx.IsClosed());
    }

    SECTION("Unseen value is still delivered after close") {
        WatchSender<int> tx(0);
        auto rx = tx.Subscribe();
        tx.Send(4);
        tx.Close();

        REQUIRE_NOTHROW(rx.Changed());
        REQUIRE(rx.Borrow() == 4);
        REQUIRE_THROWS_AS(rx.Changed(), WatchClosedError);
    }

    SECTION("Send after close is ignored") {
        WatchSender<int> tx(1);
        auto rx = tx.Subscribe();
        tx.Close();
        tx.Send(2);
        REQUIRE(rx.Borrow() == 1);
        REQUIRE_FALSE(rx.HasChanged());
    }

    SECTION("Destroying the sender closes the channel") {
        auto tx = std::make_unique<WatchSender<int>>(0);
        auto rx = tx->Subscribe();
        tx.reset();
        REQUIRE_THROWS_AS(rx.Changed(), WatchClosedError);
        REQUIRE(rx.Borrow() == 0);
    }
}
