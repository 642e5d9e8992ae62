#pragma once
#include <string>
#include <utility>

struct ExecResult {
    std::string reply;   // empty while the client is parked
    bool blocked;        // ACQUIRE queued behind a holder
    int target_fd;

    ExecResult(std::string r, bool b, int fd)
        : reply(std::move(r)), blocked(b), target_fd(fd) {}
};
