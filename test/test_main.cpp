// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: console logging at a level taken from HEADERPIPE_TEST_LOGLEVEL

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    const char* env_level = std::getenv("HEADERPIPE_TEST_LOGLEVEL");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
