#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// One waiting (or admitted) lock request.
struct QueueEntry {
    uint64_t id;             // ticket, unique per QueueStore
    std::string key;
    std::string payload;     // opaque, handed back verbatim on admission
    long long enqueued_at;   // unix ms, informational only
};

// Input batch A: a request for the lock named by key.
struct ArrivalRequest {
    std::string key;
    std::string payload;
};

// Input batch B: "the holder of key is done". A missing or empty
// key makes the signal a no-op.
struct ReleaseSignal {
    std::optional<std::string> key;
};

// A granted lock, copied out of the entry that now holds it.
struct Admission {
    uint64_t id;
    std::string key;
    std::string payload;
};

struct InvocationResult {
    std::vector<uint64_t> tickets;      // ids given to the arrivals, same order
    std::vector<Admission> admitted;
    size_t released = 0;
    size_t ignored = 0;
};
