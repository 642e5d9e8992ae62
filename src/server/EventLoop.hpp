#pragma once
#include <sys/select.h>

#include "ClientPipeline.hpp"
#include "../commands/CommandHandler.hpp"
#include "../config/ServerConfig.hpp"
#include "../db/QueueStore.hpp"

// Single-threaded select() loop. Every command is handled to completion
// before the next one is read, which is what serializes invocations on
// the shared QueueStore.
class EventLoop {
    int server_fd;
    int max_fd;
    fd_set current_fds;

    CommandHandler handler;
    ClientPipeline pipeline;

    void acceptClient();
    void disconnect(int fd);
    void serveClient(int fd);
public:
    EventLoop(int serverFd, QueueStore& store, const ServerConfig& cfg);
    void run();
};
