// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_session.hpp>
#include <string>

void InitializeTestLogging(const std::string& level);
void ShutdownTestLogging();

int main(int argc, char* argv[]) {
    Catch::Session session;

    // Logging is off unless asked for: --log-level=debug
    std::string log_level = "off";

    using namespace Catch::Clara;
    auto cli = session.cli()
        | Opt(log_level, "level")
            ["--log-level"]
            ("log level for the stack under test (trace, debug, info, warn, error, off)");
    session.cli(cli);

    int rc = session.applyCommandLine(argc, argv);
    if (rc != 0) {
        return rc;
    }

    InitializeTestLogging(log_level);
    int result = session.run();
    ShutdownTestLogging();
    return result;
}
