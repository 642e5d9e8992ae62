#pragma once

#include <string>
#include <vector>

#include "ModePolicy.hpp"
#include "../db/QueueStore.hpp"
#include "../types/QueueEntry.hpp"
#include "../types/QueueMode.hpp"

/**
 * QueueController
 * ---------------
 * The keyed mutex/turnstile state machine. One invoke() call is one
 * activation:
 *
 *   1. shape the store for the mode (never dropping queued entries)
 *   2. append every arrival to its queue
 *   3. promote: each unlocked, non-empty queue locks and admits its head
 *   4. apply release signals in order, admitting each queue's next head
 *
 * The state is an explicit parameter and the controller keeps nothing
 * between calls. Callers must serialize invocations on one store.
 */
class QueueController {
public:
    /**
     * Runs one activation against "state".
     * @param state     Persisted queue state, mutated in place.
     * @param mode      SINGLE (one global lock) or MULTI (lock per key).
     * @param arrivals  Lock requests, in arrival order.
     * @param signals   Release signals, in arrival order.
     * @return          Admissions in decision order, plus release counters.
     */
    static InvocationResult invoke(QueueStore& state,
                                   QueueMode mode,
                                   const std::vector<ArrivalRequest>& arrivals,
                                   const std::vector<ReleaseSignal>& signals);

    // --------------------------------------------------------------------
    // Read-only inspection
    // --------------------------------------------------------------------

    /** Number of waiters (holder included). Single mode ignores "key". */
    static int queueLength(const QueueStore& state, QueueMode mode,
                           const std::string& key);

    /** Entry currently holding the lock, or nullptr. Single mode ignores "key". */
    static const QueueEntry* holder(const QueueStore& state, QueueMode mode,
                                    const std::string& key);

    /**
     * Keys that currently have waiters.
     * MULTI: active queue keys. SINGLE: distinct entry keys in queue order.
     */
    static std::vector<std::string> activeKeys(const QueueStore& state,
                                               QueueMode mode);

private:
    static void ensureShape(QueueStore& state, const ModePolicy& policy);

    static void enqueue(QueueStore& state, const ModePolicy& policy,
                        const ArrivalRequest& request, InvocationResult& result);

    static void promoteAll(QueueStore& state, InvocationResult& result);

    static void release(QueueStore& state, const ModePolicy& policy,
                        const ReleaseSignal& signal, InvocationResult& result);

    // Locks "queue" and copies its head into the output batch.
    static void admitHead(KeyQueueState& queue, InvocationResult& result);
};
