#include "QueueStore.hpp"

// ----------------------------------------------------
// Queue lookup / creation
// ----------------------------------------------------
KeyQueueState& QueueStore::getOrCreateQueue(const std::string& key) {
    return queues[key];
}

KeyQueueState* QueueStore::getQueue(const std::string& key) {
    auto it = queues.find(key);
    if (it == queues.end())
        return nullptr;
    return &it->second;
}

const KeyQueueState* QueueStore::getQueue(const std::string& key) const {
    auto it = queues.find(key);
    if (it == queues.end())
        return nullptr;
    return &it->second;
}

bool QueueStore::eraseQueue(const std::string& key) {
    return queues.erase(key) > 0;
}

// ----------------------------------------------------
// Tickets
// ----------------------------------------------------
uint64_t QueueStore::issueTicket() {
    return next_id++;
}

size_t QueueStore::totalEntries() const {
    size_t total = 0;
    for (const auto& pair : queues) {
        total += pair.second.Len();
    }
    return total;
}

void QueueStore::clear() {
    queues.clear();
    next_id = 1;
    last_mode.reset();
}
