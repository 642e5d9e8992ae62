#pragma once

#include <string>

#include "../types/QueueEntry.hpp"
#include "../types/QueueMode.hpp"

/**
 * ModePolicy
 * ----------
 * Key-resolution strategy that lets one algorithm serve both modes.
 *
 *   SINGLE: every request lands in one implicit queue (kSingleQueueKey).
 *           Entries keep their own key, and a release only advances the
 *           queue when it names the head entry's key.
 *
 *   MULTI:  the request key selects the queue. A release selects its queue
 *           by key and needs no further check. Queues emptied by a release
 *           are removed from the store.
 */
class ModePolicy {
public:
    explicit ModePolicy(QueueMode mode);

    // Name under which the single-mode queue lives in QueueStore.
    static const std::string kSingleQueueKey;

    QueueMode mode() const;

    // Queue an arrival or release carrying "key" refers to.
    const std::string& queueKeyFor(const std::string& key) const;

    // Whether a release for signal_key may remove "head".
    bool releaseMatches(const QueueEntry& head, const std::string& signal_key) const;

    // Whether a queue left empty after a release is deleted.
    bool collectsEmptyQueues() const;

private:
    QueueMode queue_mode;
};
