#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>

#include "../db/QueueStore.hpp"
#include "../types/ExecResult.hpp"
#include "../types/QueueEntry.hpp"
#include "../types/QueueMode.hpp"
#include "../types/WaitingClient.hpp"

/**
 * CommandHandler
 * ---------------
 * Turns RESP commands into QueueController invocations:
 *   • ACQUIRE  → one arrival
 *   • RELEASE  → a batch of release signals
 *   • QLEN / HOLDER / QKEYS → read-only inspection
 *   • SAVE     → explicit snapshot
 *
 * Admissions for the calling client come back in its ExecResult.
 * Admissions for parked clients are written straight to their sockets.
 * Every mutating command is followed by a snapshot when a state file
 * is configured.
 */
class CommandHandler
{
public:
    /**
     * @param str         Queue state, owned by the caller.
     * @param mode        Mode used for every invocation.
     * @param state_file  Snapshot path; empty keeps state in memory only.
     */
    CommandHandler(QueueStore& str, QueueMode mode, std::string state_file = "");

    /**
     * Executes a parsed RESP command.
     * @param args      Parsed RESP tokens (command + arguments).
     * @param client_fd Calling client's file descriptor.
     * @return          Response payload + metadata.
    */
    ExecResult execute(const std::vector<std::string_view>& args, int client_fd);

    /**
     * Forgets every ACQUIRE parked by this client. Its entries stay queued;
     * a later admission of one of them is logged as undeliverable.
     */
    void dropClient(int fd);

    size_t waitingCount() const;

    /**
     * Clients whose parked ACQUIRE was admitted since the last call.
     * Their connection may resume processing pipelined commands.
     */
    std::vector<int> takeWokenClients();

private:
    // File descriptor of the currently executing client.
    int client_fd{};

    QueueStore& store;
    QueueMode mode;
    std::string state_file;

    using CmdFn = ExecResult (CommandHandler::*)(const std::vector<std::string_view>&);

    /**
     * Command dispatch table.
     * Maps uppercase RESP command names to their handler functions.
    */
    std::unordered_map<std::string, CmdFn> commandMap;

    /**
     * Parked ACQUIRE callers, by ticket. FIFO order lives in the queues
     * themselves; this only maps an admitted ticket back to a socket.
    */
    std::unordered_map<uint64_t, WaitingClient> waitingClients;

    // Filled by deliverAdmissions, emptied by takeWokenClients.
    std::vector<int> wokenClients;

    // --------------------------------------------------------------------
    // Core Handlers
    // --------------------------------------------------------------------
    ExecResult handlePING(const std::vector<std::string_view>& args);
    ExecResult handleECHO(const std::vector<std::string_view>& args);
    ExecResult handleSAVE(const std::vector<std::string_view>& args);

    // --------------------------------------------------------------------
    // Queue Handlers
    // --------------------------------------------------------------------

    /**
     * ACQUIRE key payload
     *   • admitted now    → [key, payload]
     *   • queued behind a holder → no reply until a RELEASE admits it
     */
    ExecResult handleACQUIRE(const std::vector<std::string_view>& args);

    /** RELEASE key [key ...] → number of signals that advanced a queue. */
    ExecResult handleRELEASE(const std::vector<std::string_view>& args);

    ExecResult handleQLEN  (const std::vector<std::string_view>& args);
    ExecResult handleHOLDER(const std::vector<std::string_view>& args);
    ExecResult handleQKEYS (const std::vector<std::string_view>& args);

    /**
     * Sends every admission to its parked client.
     * @param own_ticket Ticket of the calling client's ACQUIRE, or 0.
     * @return           true if own_ticket was among the admissions.
     */
    bool deliverAdmissions(const InvocationResult& result, uint64_t own_ticket);

    // Snapshot after a mutation; failures are logged, not replied.
    void persist();

    static std::string admissionReply(const std::string& key, const std::string& payload);

    static ExecResult arityError(const char* cmd, int fd);
};
