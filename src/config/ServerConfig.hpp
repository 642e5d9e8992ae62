#pragma once

#include <string>

#include "../types/QueueMode.hpp"

// Command-line settings for turnstile-server.
struct ServerConfig {
    int port = 6379;
    QueueMode mode = QueueMode::SINGLE;
    std::string state_file;   // empty → in-memory only

    /**
     * Parses --port <n>, --mode single|multi, --state-file <path>.
     * @param err  Set to a one-line message when false is returned.
     */
    static bool parse(int argc, char** argv, ServerConfig& out, std::string& err);

    static std::string usage(const char* prog);
};
