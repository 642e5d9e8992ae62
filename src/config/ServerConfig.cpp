#include "ServerConfig.hpp"

#include <charconv>
#include <system_error>

bool ServerConfig::parse(int argc, char** argv, ServerConfig& out, std::string& err) {
    ServerConfig cfg;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (i + 1 >= argc) {
            err = "missing value for " + flag;
            return false;
        }
        std::string value = argv[++i];

        if (flag == "--port") {
            int port = 0;
            auto res = std::from_chars(value.data(), value.data() + value.size(), port);
            if (res.ec != std::errc() || res.ptr != value.data() + value.size() ||
                port <= 0 || port > 65535) {
                err = "invalid port '" + value + "'";
                return false;
            }
            cfg.port = port;
        } else if (flag == "--mode") {
            if (!parseQueueMode(value, cfg.mode)) {
                err = "invalid mode '" + value + "' (expected single or multi)";
                return false;
            }
        } else if (flag == "--state-file") {
            if (value.empty()) {
                err = "empty --state-file";
                return false;
            }
            cfg.state_file = value;
        } else {
            err = "unknown option " + flag;
            return false;
        }
    }

    out = cfg;
    return true;
}

std::string ServerConfig::usage(const char* prog) {
    return std::string("usage: ") + prog +
           " [--port <n>] [--mode single|multi] [--state-file <path>]\n";
}
