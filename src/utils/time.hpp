#pragma once
#include <chrono>
#include <cstdint>


/*
------------------------------------------------------------------------------
  CLOCKS USED BY THE QUEUE
------------------------------------------------------------------------------

  steady_clock → intervals (benchmarks, uptime). Monotonic, no relation to
                 the Unix epoch, so it is never written into queue state.

  system_clock → real time. Used for QueueEntry::enqueued_at, which survives
                 restarts through the snapshot file and must still mean
                 something after the process is gone.

------------------------------------------------------------------------------
*/

/**
 * @brief Returns the current monotonic time in milliseconds.
 *
 * Only differences between two calls are meaningful.
 */
inline uint64_t current_time_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()
    ).count();
}


/**
 * @brief Returns the current Unix timestamp in milliseconds.
 *
 * Stamped onto every queue entry at arrival. Informational only:
 * queue order is insertion order, never this value.
 */
inline long long getUnixTimeMs() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        system_clock::now().time_since_epoch()
    ).count();
}
