#include "CommandHandler.hpp"

#include <cctype>
#include <iostream>
#include <utility>

#include "../db/Snapshot.hpp"
#include "../protocol/RESPWriter.hpp"

/**
 * ----------------------------------------------------
 * Constructor
 * ----------------------------------------------------
 * Builds the dispatch table. Command names are matched
 * after uppercasing, so "acquire" and "ACQUIRE" are the
 * same command.
*/
CommandHandler::CommandHandler(QueueStore& str, QueueMode m, std::string file)
    : client_fd(-1),
      store(str),
      mode(m),
      state_file(std::move(file))
{
    commandMap = {
        {"PING",    &CommandHandler::handlePING},
        {"ECHO",    &CommandHandler::handleECHO},
        {"SAVE",    &CommandHandler::handleSAVE},
        {"ACQUIRE", &CommandHandler::handleACQUIRE},
        {"RELEASE", &CommandHandler::handleRELEASE},
        {"QLEN",    &CommandHandler::handleQLEN},
        {"HOLDER",  &CommandHandler::handleHOLDER},
        {"QKEYS",   &CommandHandler::handleQKEYS}
    };
}

/**
 * ----------------------------------------------------
 * execute()
 * ----------------------------------------------------
 * Routes a parsed RESP command to its handler.
 *
 * Replies for the caller are returned, never written here.
 * The only direct socket writes happen when an invocation
 * admits a ticket parked by some other client.
 */
ExecResult CommandHandler::execute(const std::vector<std::string_view>& args,
                                   int client_fd)
{
    this->client_fd = client_fd;

    if (args.empty())
        return ExecResult(RESPWriter::error("empty command"), false, client_fd);

    std::string cmd(args[0]);
    for (char& c : cmd) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    auto it = commandMap.find(cmd);
    if (it == commandMap.end())
        return ExecResult(RESPWriter::error("unknown command"), false, client_fd);

    return (this->*(it->second))(args);
}

ExecResult CommandHandler::arityError(const char* cmd, int fd) {
    return ExecResult(RESPWriter::error(std::string("wrong number of arguments for '") + cmd + "'"),
                      false, fd);
}

/**
 * PING → +PONG
 * Extra arguments are ignored.
 */
ExecResult CommandHandler::handlePING(const std::vector<std::string_view>&) {
    return ExecResult(RESPWriter::simpleString("PONG"), false, client_fd);
}

/**
 * ECHO <message> → bulk string
 */
ExecResult CommandHandler::handleECHO(const std::vector<std::string_view>& args) {
    if (args.size() != 2)
        return arityError("ECHO", client_fd);

    return ExecResult(RESPWriter::bulk(std::string(args[1])), false, client_fd);
}

/**
 * ----------------------------------------------------
 * handleSAVE
 * ----------------------------------------------------
 * RESP command: SAVE
 *
 * Writes the snapshot immediately. Unlike the automatic
 * write-through in persist(), failures reach the client.
 */
ExecResult CommandHandler::handleSAVE(const std::vector<std::string_view>& args) {
    if (args.size() != 1)
        return arityError("SAVE", client_fd);

    if (state_file.empty())
        return ExecResult(RESPWriter::error("no state file configured"), false, client_fd);

    std::string err;
    if (!Snapshot::save(store, state_file, err))
        return ExecResult(RESPWriter::error(err), false, client_fd);

    return ExecResult(RESPWriter::simpleString("OK"), false, client_fd);
}

void CommandHandler::persist() {
    if (state_file.empty())
        return;

    std::string err;
    if (!Snapshot::save(store, state_file, err))
        std::cerr << "snapshot failed: " << err << "\n";
}
