#include "KeyQueue.hpp"

#include <utility>

bool KeyQueueState::Empty() const {
    return queue.empty();
}

int KeyQueueState::Len() const {
    return queue.size();
}

int KeyQueueState::PushBack(QueueEntry entry) {
    queue.push_back(std::move(entry));
    return queue.size();
}

const QueueEntry* KeyQueueState::Front() const {
    if (queue.empty())
        return nullptr;
    return &queue.front();
}

bool KeyQueueState::POPFront(QueueEntry& out) {
    if (queue.empty())
        return false;

    out = std::move(queue.front());
    queue.pop_front();
    return true;
}

bool KeyQueueState::IsLocked() const {
    return locked;
}

void KeyQueueState::Lock() {
    locked = true;
}

void KeyQueueState::Unlock() {
    locked = false;
}

const std::deque<QueueEntry>& KeyQueueState::Entries() const {
    return queue;
}
