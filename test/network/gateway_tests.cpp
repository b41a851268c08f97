// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// SharedGateway handles and PeerFilter

#include <catch2/catch_test_macros.hpp>
#include "network/infra/mock_gateway.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace headerpipe::network;

TEST_CASE("PeerFilter - factories and names", "[network][gateway]") {
    REQUIRE(PeerFilter::All().ToString() == "all");
    REQUIRE(PeerFilter::Random(1).ToString() == "random(1)");
    REQUIRE(PeerFilter::Peer(42).ToString() == "peer(42)");
    REQUIRE(PeerFilter::Random(1) == PeerFilter::Random(1));
    REQUIRE_FALSE(PeerFilter::Random(1) == PeerFilter::Random(2));
    REQUIRE(SendResultToString(SendResult::QUEUE_FULL) == "send queue full");
}

TEST_CASE("SharedGateway - handles", "[network][gateway]") {
    auto first = std::make_shared<MockGateway>();
    SharedGateway shared(first);

    REQUIRE_THROWS_AS(SharedGateway(nullptr), std::invalid_argument);

    SECTION("readers share, a writer waits for them") {
        auto reader_a = shared.Read();
        auto reader_b = shared.Read();
        REQUIRE(&*reader_a == first.get());

        std::atomic<bool> writer_in{false};
        std::thread writer([&] {
            auto exclusive = shared.Write();
            writer_in = true;
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        REQUIRE_FALSE(writer_in);

        { auto drop_a = std::move(reader_a); }
        { auto drop_b = std::move(reader_b); }
        writer.join();
        REQUIRE(writer_in);
    }

    SECTION("Reset swaps the target for later handles") {
        auto second = std::make_shared<MockGateway>();
        shared.Reset(second);
        REQUIRE(&*shared.Read() == second.get());
        REQUIRE_THROWS_AS(shared.Reset(nullptr), std::invalid_argument);
    }
}
