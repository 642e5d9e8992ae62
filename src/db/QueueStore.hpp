#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

#include "KeyQueue.hpp"
#include "../types/QueueMode.hpp"

// Persisted state of the queue controller: every key's queue plus the
// ticket counter. Owned by the host and passed explicitly to
// QueueController::invoke; nothing else mutates queue contents.
class QueueStore {
public:
    // Key → lock state. Ordered, so promotion in multi mode walks keys
    // in a stable order.
    std::map<std::string, KeyQueueState> queues;

    // Next ticket handed out by issueTicket(). Never reused, survives snapshots.
    uint64_t next_id = 1;

    // Mode of the most recent invocation, unset for a fresh store.
    std::optional<QueueMode> last_mode;

    // Returns the queue at "key", creating an empty unlocked one if needed.
    KeyQueueState& getOrCreateQueue(const std::string& key);

    // nullptr if the key has no state.
    KeyQueueState* getQueue(const std::string& key);
    const KeyQueueState* getQueue(const std::string& key) const;

    // Returns true if the key existed.
    bool eraseQueue(const std::string& key);

    uint64_t issueTicket();

    // Sum of all queue lengths.
    size_t totalEntries() const;

    void clear();
};
