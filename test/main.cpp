// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <cstdlib>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    // PBAPCLIENT_TEST_LOG=trace to see what the state machine is doing
    const char* env_level = std::getenv("PBAPCLIENT_TEST_LOG");
    InitializeTestLogging(env_level ? env_level : "off");

    int result = Catch::Session().run(argc, argv);

    ShutdownTestLogging();
    return result;
}
