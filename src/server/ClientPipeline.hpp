#pragma once

#include <cstddef>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "../commands/CommandHandler.hpp"

/**
 * ClientPipeline
 * --------------
 * Per-connection framing between raw socket bytes and CommandHandler:
 *   • buffers partial commands until they are complete
 *   • runs pipelined commands in order, writing each reply to the fd
 *   • stops reading a client while its ACQUIRE is parked, and resumes
 *     it once the admission has been written, so replies never
 *     overtake the pending ACQUIRE reply
 *   • rejects malformed or oversized input
 *
 * Holds no sockets itself; EventLoop closes whatever takeClosing() returns.
 */
class ClientPipeline {
public:
    // A client that buffers this much without completing a command is cut off.
    static constexpr size_t kMaxPendingBytes = 1 << 20;

    explicit ClientPipeline(CommandHandler& handler);

    // Appends bytes read from fd and runs every command that can run now.
    void feed(int fd, const char* data, size_t len);

    // Clients to disconnect after protocol errors, cleared by the call.
    std::vector<int> takeClosing();

    // Forgets everything about fd, including parked ACQUIREs.
    void drop(int fd);

    bool isBlocked(int fd) const;
    size_t pendingBytes(int fd) const;

private:
    CommandHandler& handler;

    std::unordered_map<int, std::string> pending;
    std::unordered_set<int> blocked;

    // Woken clients waiting for their buffered commands to run.
    std::deque<int> ready;
    std::vector<int> closing;

    void drain(int fd);
    void reject(int fd);
    void reply(int fd, const std::string& data);
};
