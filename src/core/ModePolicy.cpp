#include "ModePolicy.hpp"

const std::string ModePolicy::kSingleQueueKey = "";

ModePolicy::ModePolicy(QueueMode mode)
    : queue_mode(mode)
{
}

QueueMode ModePolicy::mode() const {
    return queue_mode;
}

const std::string& ModePolicy::queueKeyFor(const std::string& key) const {
    if (queue_mode == QueueMode::SINGLE)
        return kSingleQueueKey;
    return key;
}

bool ModePolicy::releaseMatches(const QueueEntry& head,
                                const std::string& signal_key) const {
    // Multi mode already picked the queue by this key.
    if (queue_mode == QueueMode::MULTI)
        return true;

    return head.key == signal_key;
}

bool ModePolicy::collectsEmptyQueues() const {
    return queue_mode == QueueMode::MULTI;
}
