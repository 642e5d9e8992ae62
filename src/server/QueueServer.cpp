#include "QueueServer.hpp"
#include "EventLoop.hpp"
#include "../db/Snapshot.hpp"

#include <sys/socket.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <iostream>
#include <string>

QueueServer::QueueServer(const ServerConfig& cfg) : config(cfg) {}

int QueueServer::openListener() {
    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        std::cerr << "Failed to create server socket\n";
        return -1;
    }

    // Restarts should not trip over 'Address already in use'.
    int reuse = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
        std::cerr << "setsockopt failed\n";
        close(server_fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = INADDR_ANY;
    addr.sin_port = htons(config.port);

    if (bind(server_fd, (sockaddr*)&addr, sizeof(addr)) != 0) {
        std::cerr << "Failed to bind to port " << config.port << "\n";
        close(server_fd);
        return -1;
    }

    int connection_backlog = 16;
    if (listen(server_fd, connection_backlog) != 0) {
        std::cerr << "listen failed\n";
        close(server_fd);
        return -1;
    }

    return server_fd;
}

int QueueServer::start() {
    if (!config.state_file.empty()) {
        std::string err;
        if (!Snapshot::load(config.state_file, store, err)) {
            std::cerr << "Failed to load " << config.state_file << ": " << err << "\n";
            return 1;
        }

        std::cout << "Loaded " << store.totalEntries() << " queued entries across "
                  << store.queues.size() << " queues from " << config.state_file << "\n";

        // Mixed-mode use of one state is undefined; say so instead of guessing.
        if (store.last_mode && *store.last_mode != config.mode) {
            std::cerr << "warning: state was written in " << queueModeName(*store.last_mode)
                      << " mode, serving it in " << queueModeName(config.mode) << " mode\n";
        }
    }

    int server_fd = openListener();
    if (server_fd < 0)
        return 1;

    std::cout << "turnstile listening on port " << config.port
              << " (" << queueModeName(config.mode) << " mode)\n";

    EventLoop loop(server_fd, store, config);
    loop.run();

    close(server_fd);
    return 1;
}
