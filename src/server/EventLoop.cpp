#include "EventLoop.hpp"

#include <unistd.h>
#include <sys/socket.h>
#include <arpa/inet.h>
#include <iostream>
#include <string>

EventLoop::EventLoop(int serverFd, QueueStore& store, const ServerConfig& cfg)
    : server_fd(serverFd),
      max_fd(serverFd),
      handler(store, cfg.mode, cfg.state_file),
      pipeline(handler)
{
    FD_ZERO(&current_fds);
    FD_SET(server_fd, &current_fds);
}

void EventLoop::run() {
    while (true) {
        fd_set ready_fds = current_fds;

        // No timers: locks never expire, so select may block indefinitely.
        int activity = select(max_fd + 1, &ready_fds, nullptr, nullptr, nullptr);
        if (activity < 0) {
            std::cerr << "select error\n";
            break;
        }

        if (FD_ISSET(server_fd, &ready_fds))
            acceptClient();

        for (int fd = 0; fd <= max_fd; ++fd) {
            if (fd == server_fd) continue;
            if (!FD_ISSET(fd, &ready_fds)) continue;
            // Closed earlier in this pass after a protocol error.
            if (!FD_ISSET(fd, &current_fds)) continue;

            serveClient(fd);
        }
    }
}

void EventLoop::acceptClient() {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    int fd = accept(server_fd, (sockaddr*)&client_addr, &len);
    if (fd < 0) {
        std::cerr << "accept error\n";
        return;
    }

    if (fd >= FD_SETSIZE) {
        std::cerr << "too many clients, rejecting fd = " << fd << "\n";
        close(fd);
        return;
    }

    std::cout << "New client connected: fd = " << fd << "\n";
    FD_SET(fd, &current_fds);
    if (fd > max_fd) max_fd = fd;
}

void EventLoop::disconnect(int fd) {
    if (!FD_ISSET(fd, &current_fds))
        return;

    std::cout << "Client disconnected: fd = " << fd << "\n";

    // Parked ACQUIREs of this client stay queued; only the socket goes away.
    pipeline.drop(fd);
    close(fd);
    FD_CLR(fd, &current_fds);
}

void EventLoop::serveClient(int fd) {
    char buffer[4096];

    ssize_t bytes = read(fd, buffer, sizeof(buffer));
    if (bytes <= 0) {
        disconnect(fd);
        return;
    }

    pipeline.feed(fd, buffer, bytes);

    for (int bad : pipeline.takeClosing()) {
        disconnect(bad);
    }
}
