#include <iostream>
#include <string>

#include "config/ServerConfig.hpp"
#include "server/QueueServer.hpp"

int main(int argc, char **argv) {
  // Flush after every std::cout / std::cerr
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  ServerConfig config;
  std::string err;
  if (!ServerConfig::parse(argc, argv, config, err)) {
    std::cerr << err << "\n" << ServerConfig::usage(argv[0]);
    return 2;
  }

  QueueServer server(config);
  return server.start();
}
