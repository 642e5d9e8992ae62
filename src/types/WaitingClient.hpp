#pragma once
#include <cstdint>
#include <string>

// A client parked on ACQUIRE until its ticket is admitted.
struct WaitingClient {
    int fd;
    std::string key;
    uint64_t since_ms;   // steady clock, for logging wait times
};
