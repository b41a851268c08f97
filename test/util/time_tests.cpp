// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for util/time.cpp

#include <catch2/catch_test_macros.hpp>
#include "util/time.hpp"

using namespace headerpipe::util;

TEST_CASE("Mock time - pinned and advanced", "[util][time]") {
    REQUIRE(GetMockTimeMillis() == 0);

    {
        MockTimeScope scope(1'700'000'000'000);
        auto start = GetSteadyTime();
        REQUIRE(GetSteadyTime() == start);

        AdvanceMockTime(std::chrono::milliseconds(250));
        REQUIRE(GetSteadyTime() - start == std::chrono::milliseconds(250));
        REQUIRE(GetMockTimeMillis() == 1'700'000'000'250);
    }

    REQUIRE(GetMockTimeMillis() == 0);
}

TEST_CASE("Mock time - advancing is a no-op while disabled", "[util][time]") {
    AdvanceMockTime(std::chrono::milliseconds(1000));
    REQUIRE(GetMockTimeMillis() == 0);

    auto before = GetSteadyTime();
    REQUIRE(GetSteadyTime() >= before);
}
