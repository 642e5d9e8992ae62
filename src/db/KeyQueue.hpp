#pragma once

#include <deque>

#include "../types/QueueEntry.hpp"

// Lock state for one key: FIFO of waiters plus the "head holds the lock" flag.
// Invariant kept by QueueController: locked implies !Empty().
class KeyQueueState {
private:
    std::deque<QueueEntry> queue;
    bool locked = false;
public:
    bool Empty() const;
    int Len() const;
    int PushBack(QueueEntry entry);

    // nullptr when the queue is empty.
    const QueueEntry* Front() const;

    // Removes the head into out. Returns false on an empty queue.
    bool POPFront(QueueEntry& out);

    bool IsLocked() const;
    void Lock();
    void Unlock();

    const std::deque<QueueEntry>& Entries() const;
};
