#pragma once

#include "../config/ServerConfig.hpp"
#include "../db/QueueStore.hpp"

// Owns the listening socket and the queue state for one server process.
class QueueServer {
    ServerConfig config;
    QueueStore store;

    int openListener();
public:
    explicit QueueServer(const ServerConfig& cfg);

    // Blocks serving clients. Returns a process exit code on failure.
    int start();
};
