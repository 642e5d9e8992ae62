#include "CommandHandler.hpp"

#include <iostream>
#include <unistd.h>

#include "../core/QueueController.hpp"
#include "../protocol/RESPWriter.hpp"
#include "../utils/time.hpp"

/**
 * ----------------------------------------------------
 * handleACQUIRE
 * ----------------------------------------------------
 * RESP command: ACQUIRE <key> <payload>
 *
 * Behavior:
 *   Runs one invocation with a single arrival.
 *   - Queue was free  → the entry is admitted in the same
 *                       invocation and the caller gets
 *                       [key, payload] right away.
 *   - Queue is locked → the caller is parked under its
 *                       ticket and gets no reply until a
 *                       RELEASE admits it.
 *
 * There is no timeout: a parked client waits as long as
 * the holder keeps the lock.
*/
ExecResult CommandHandler::handleACQUIRE(const std::vector<std::string_view>& args) {
    if (args.size() != 3)
        return arityError("ACQUIRE", client_fd);

    std::string key = std::string(args[1]);
    std::string payload = std::string(args[2]);

    InvocationResult result = QueueController::invoke(
        store, mode, { ArrivalRequest{ key, payload } }, {});

    uint64_t ticket = result.tickets.front();
    bool admitted_now = deliverAdmissions(result, ticket);

    persist();

    if (admitted_now)
        return ExecResult(admissionReply(key, payload), false, client_fd);

    waitingClients[ticket] = { client_fd, key, current_time_ms() };

    // No reply now; EventLoop writes nothing for a blocked result.
    return ExecResult("", true, client_fd);
}

/**
 * ----------------------------------------------------
 * handleRELEASE
 * ----------------------------------------------------
 * RESP command: RELEASE <key> [key ...]
 *
 * Behavior:
 *   Runs one invocation whose signal batch is the given
 *   keys, in order. Unmatched signals are silently ignored.
 *   Newly admitted tickets are pushed to their parked
 *   clients.
 *
 * Return:
 *   RESP Integer → number of signals that advanced a queue.
*/
ExecResult CommandHandler::handleRELEASE(const std::vector<std::string_view>& args) {
    if (args.size() < 2)
        return arityError("RELEASE", client_fd);

    std::vector<ReleaseSignal> signals;
    signals.reserve(args.size() - 1);
    for (size_t i = 1; i < args.size(); ++i) {
        signals.push_back({ std::string(args[i]) });
    }

    InvocationResult result = QueueController::invoke(store, mode, {}, signals);
    deliverAdmissions(result, 0);

    if (result.released > 0)
        persist();

    return ExecResult(RESPWriter::integer(result.released), false, client_fd);
}

/**
 * QLEN <key> → waiters on the key, holder included.
 * Single mode reports the global queue whatever the key.
 */
ExecResult CommandHandler::handleQLEN(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return arityError("QLEN", client_fd);

    int len = QueueController::queueLength(store, mode, std::string(args[1]));
    return ExecResult(RESPWriter::integer(len), false, client_fd);
}

/**
 * HOLDER <key> → [key, payload] of the entry holding the lock,
 * or a null bulk string when nobody holds it.
 */
ExecResult CommandHandler::handleHOLDER(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return arityError("HOLDER", client_fd);

    const QueueEntry* holder = QueueController::holder(store, mode, std::string(args[1]));
    if (!holder)
        return ExecResult(RESPWriter::nullBulk(), false, client_fd);

    return ExecResult(admissionReply(holder->key, holder->payload), false, client_fd);
}

ExecResult CommandHandler::handleQKEYS(const std::vector<std::string_view>& args) {
    if (args.size() != 1)
        return arityError("QKEYS", client_fd);

    return ExecResult(RESPWriter::array(QueueController::activeKeys(store, mode)),
                      false, client_fd);
}

/**
 * ----------------------------------------------------
 * deliverAdmissions
 * ----------------------------------------------------
 * Admissions are walked in decision order. Each one either
 * belongs to the current caller (own_ticket) or to a parked
 * client, whose socket gets the [key, payload] reply.
 *
 * A ticket with no parked client (disconnected, or queued
 * before a restart) still holds the lock; it is only logged.
*/
bool CommandHandler::deliverAdmissions(const InvocationResult& result, uint64_t own_ticket) {
    bool own_admitted = false;

    for (const auto& admission : result.admitted) {
        if (own_ticket != 0 && admission.id == own_ticket) {
            own_admitted = true;
            continue;
        }

        auto it = waitingClients.find(admission.id);
        if (it == waitingClients.end()) {
            std::cerr << "ticket " << admission.id << " on '" << admission.key
                      << "' admitted with no waiting client\n";
            continue;
        }

        const WaitingClient& waiter = it->second;
        std::string reply = admissionReply(admission.key, admission.payload);

        ssize_t written = ::write(waiter.fd, reply.c_str(), reply.size());
        if (written != static_cast<ssize_t>(reply.size())) {
            std::cerr << "failed to deliver ticket " << admission.id
                      << " to fd = " << waiter.fd << "\n";
        } else {
            std::cout << "ticket " << admission.id << " admitted on '" << admission.key
                      << "' after " << (current_time_ms() - waiter.since_ms) << " ms\n";
        }

        wokenClients.push_back(waiter.fd);
        waitingClients.erase(it);
    }

    return own_admitted;
}

void CommandHandler::dropClient(int fd) {
    for (auto it = waitingClients.begin(); it != waitingClients.end(); ) {
        if (it->second.fd == fd) {
            it = waitingClients.erase(it);
        } else {
            ++it;
        }
    }
}

size_t CommandHandler::waitingCount() const {
    return waitingClients.size();
}

std::vector<int> CommandHandler::takeWokenClients() {
    std::vector<int> woken;
    woken.swap(wokenClients);
    return woken;
}

std::string CommandHandler::admissionReply(const std::string& key, const std::string& payload) {
    return RESPWriter::array({ key, payload });
}
