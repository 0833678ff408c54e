// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Test runner: initializes logging before any test case runs

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // Quiet by default; DEADLOCK_TEST_LOGLEVEL=debug to see session traces
    const char* env_level = std::getenv("DEADLOCK_TEST_LOGLEVEL");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
