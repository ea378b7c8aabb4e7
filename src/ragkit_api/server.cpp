#include "ragkit_api/server.hpp"

#include <iostream>
#include <stdexcept>

namespace ragkit_api {

Server::Server(const std::string &address) {
  const auto colon = address.rfind(':');
  if (colon == std::string::npos || colon == 0 || colon + 1 == address.size()) {
    throw std::invalid_argument("Server address must be host:port, got '" + address + "'");
  }
  host_ = address.substr(0, colon);

  const std::string port_text = address.substr(colon + 1);
  int port = 0;
  try {
    size_t consumed = 0;
    port = std::stoi(port_text, &consumed);
    if (consumed != port_text.size()) {
      throw std::invalid_argument(port_text);
    }
  } catch (const std::logic_error &) {
    throw std::invalid_argument("Server port is not a number: '" + port_text + "'");
  }
  if (port <= 0 || port > 65535) {
    throw std::invalid_argument("Server port out of range: " + port_text);
  }
  port_ = static_cast<uint16_t>(port);

  // Request lines from Crow would duplicate the trace output
  app_.loglevel(crow::LogLevel::Warning);
}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  run_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).multithreaded().run();
  });
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();
  if (run_future_.valid()) {
    run_future_.get();
  }
  running_ = false;
}

}  // namespace ragkit_api
