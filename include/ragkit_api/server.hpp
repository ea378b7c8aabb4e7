#pragma once
#include <crow.h>

#include <cstdint>
#include <future>
#include <string>

namespace ragkit_api {

// Runs the Crow app on a background thread so main can wait for a shutdown signal.
class Server {
 public:
  // `address` is "host:port"; throws std::invalid_argument otherwise
  explicit Server(const std::string &address);
  ~Server() = default;

  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  crow::SimpleApp &get_app() {
    return app_;
  }

  void start();
  void stop();

  bool is_running() const {
    return running_;
  }
  const std::string &host() const {
    return host_;
  }
  uint16_t port() const {
    return port_;
  }

 private:
  crow::SimpleApp app_;
  std::string host_;
  uint16_t port_ = 0;
  std::future<void> run_future_;
  bool running_ = false;
};

}  // namespace ragkit_api
