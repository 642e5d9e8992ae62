#include "ClientPipeline.hpp"
#include "../protocol/RESPParser.hpp"
#include "../protocol/RESPWriter.hpp"

#include <unistd.h>
#include <iostream>
#include <string_view>

ClientPipeline::ClientPipeline(CommandHandler& h)
    : handler(h)
{
}

void ClientPipeline::feed(int fd, const char* data, size_t len) {
    pending[fd].append(data, len);

    drain(fd);

    // A RELEASE above may have admitted parked clients; run what they queued.
    while (!ready.empty()) {
        int woken = ready.front();
        ready.pop_front();
        drain(woken);
    }
}

void ClientPipeline::drain(int fd) {
    auto it = pending.find(fd);
    if (it == pending.end())
        return;

    std::string& request = it->second;
    size_t offset = 0;
    std::vector<std::string_view> args;
    size_t consumed = 0;

    while (!blocked.count(fd)) {
        RESPParser::Status status = RESPParser::parseArray(request, offset, args, consumed);

        if (status == RESPParser::Status::INCOMPLETE)
            break;

        if (status == RESPParser::Status::MALFORMED) {
            reject(fd);
            return;
        }

        offset += consumed;

        if (args.empty())
            continue;

        ExecResult result = handler.execute(args, fd);

        // Parked ACQUIRE → nothing to write yet.
        if (!result.reply.empty())
            reply(fd, result.reply);

        if (result.blocked)
            blocked.insert(fd);

        for (int woken : handler.takeWokenClients()) {
            blocked.erase(woken);
            ready.push_back(woken);
        }
    }

    request.erase(0, offset);

    if (request.size() > kMaxPendingBytes)
        reject(fd);
}

void ClientPipeline::reject(int fd) {
    reply(fd, RESPWriter::error("protocol error"));
    pending.erase(fd);
    closing.push_back(fd);
}

void ClientPipeline::reply(int fd, const std::string& data) {
    ssize_t written = ::write(fd, data.c_str(), data.size());
    if (written != static_cast<ssize_t>(data.size()))
        std::cerr << "short write to fd = " << fd << "\n";
}

std::vector<int> ClientPipeline::takeClosing() {
    std::vector<int> out;
    out.swap(closing);
    return out;
}

void ClientPipeline::drop(int fd) {
    handler.dropClient(fd);
    pending.erase(fd);
    blocked.erase(fd);
}

bool ClientPipeline::isBlocked(int fd) const {
    return blocked.count(fd) > 0;
}

size_t ClientPipeline::pendingBytes(int fd) const {
    auto it = pending.find(fd);
    if (it == pending.end())
        return 0;
    return it->second.size();
}
