#include "QueueController.hpp"

#include <algorithm>
#include <utility>

#include "../utils/time.hpp"

InvocationResult QueueController::invoke(QueueStore& state,
                                         QueueMode mode,
                                         const std::vector<ArrivalRequest>& arrivals,
                                         const std::vector<ReleaseSignal>& signals)
{
    ModePolicy policy(mode);
    InvocationResult result;

    ensureShape(state, policy);

    for (const auto& request : arrivals) {
        enqueue(state, policy, request, result);
    }

    // Promotion runs once, after the whole arrival batch.
    promoteAll(state, result);

    for (const auto& signal : signals) {
        release(state, policy, signal, result);
    }

    return result;
}

// ----------------------------------------------------
// State initialization
// ----------------------------------------------------
void QueueController::ensureShape(QueueStore& state, const ModePolicy& policy) {
    // Single mode always has its one queue, even when idle.
    if (policy.mode() == QueueMode::SINGLE)
        state.getOrCreateQueue(ModePolicy::kSingleQueueKey);

    state.last_mode = policy.mode();
}

// ----------------------------------------------------
// Enqueue: never rejects, never blocks
// ----------------------------------------------------
void QueueController::enqueue(QueueStore& state, const ModePolicy& policy,
                              const ArrivalRequest& request, InvocationResult& result)
{
    QueueEntry entry;
    entry.id = state.issueTicket();
    entry.key = request.key;
    entry.payload = request.payload;
    entry.enqueued_at = getUnixTimeMs();

    result.tickets.push_back(entry.id);

    KeyQueueState& queue = state.getOrCreateQueue(policy.queueKeyFor(request.key));
    queue.PushBack(std::move(entry));
}

// ----------------------------------------------------
// Promotion: UNLOCKED-NONEMPTY → LOCKED
// ----------------------------------------------------
void QueueController::promoteAll(QueueStore& state, InvocationResult& result) {
    for (auto& pair : state.queues) {
        KeyQueueState& queue = pair.second;
        if (!queue.IsLocked() && !queue.Empty())
            admitHead(queue, result);
    }
}

void QueueController::admitHead(KeyQueueState& queue, InvocationResult& result) {
    const QueueEntry* head = queue.Front();
    if (!head)
        return;

    queue.Lock();
    result.admitted.push_back({ head->id, head->key, head->payload });
}

// ----------------------------------------------------
// Release: LOCKED → EMPTY | LOCKED (next head)
// ----------------------------------------------------
void QueueController::release(QueueStore& state, const ModePolicy& policy,
                              const ReleaseSignal& signal, InvocationResult& result)
{
    if (!signal.key || signal.key->empty()) {
        result.ignored++;
        return;
    }

    const std::string& signal_key = *signal.key;
    const std::string& queue_key = policy.queueKeyFor(signal_key);

    KeyQueueState* queue = state.getQueue(queue_key);
    if (!queue || queue->Empty()) {
        result.ignored++;
        return;
    }

    // Stale or mismatched signals must not free the current holder.
    if (!policy.releaseMatches(*queue->Front(), signal_key)) {
        result.ignored++;
        return;
    }

    QueueEntry finished;
    if (!queue->POPFront(finished)) {
        result.ignored++;
        return;
    }
    queue->Unlock();
    result.released++;

    if (!queue->Empty()) {
        admitHead(*queue, result);
        return;
    }

    if (policy.collectsEmptyQueues())
        state.eraseQueue(queue_key);
}

// ----------------------------------------------------
// Inspection
// ----------------------------------------------------
int QueueController::queueLength(const QueueStore& state, QueueMode mode,
                                 const std::string& key)
{
    ModePolicy policy(mode);
    const KeyQueueState* queue = state.getQueue(policy.queueKeyFor(key));
    if (!queue)
        return 0;
    return queue->Len();
}

const QueueEntry* QueueController::holder(const QueueStore& state, QueueMode mode,
                                          const std::string& key)
{
    ModePolicy policy(mode);
    const KeyQueueState* queue = state.getQueue(policy.queueKeyFor(key));
    if (!queue || !queue->IsLocked())
        return nullptr;
    return queue->Front();
}

std::vector<std::string> QueueController::activeKeys(const QueueStore& state,
                                                     QueueMode mode)
{
    std::vector<std::string> keys;

    if (mode == QueueMode::MULTI) {
        for (const auto& pair : state.queues) {
            if (!pair.second.Empty())
                keys.push_back(pair.first);
        }
        return keys;
    }

    const KeyQueueState* queue = state.getQueue(ModePolicy::kSingleQueueKey);
    if (!queue)
        return keys;

    for (const auto& entry : queue->Entries()) {
        if (std::find(keys.begin(), keys.end(), entry.key) == keys.end())
            keys.push_back(entry.key);
    }
    return keys;
}
