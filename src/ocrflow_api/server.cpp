#include "ocrflow_api/server.hpp"

namespace ocrflow_api {
Server::Server(const std::string &host, int port, int threads)
    : host_(host), port_(port), threads_(threads), running_(false) {}

void Server::start() {
  if (running_) {
    return;
  }
  running_ = true;
  // Progress streams hold a handler thread for the life of a job, so run several.
  server_thread_future_ = std::async(std::launch::async, [this] {
    app_.port(port_).bindaddr(host_).concurrency(static_cast<std::uint16_t>(threads_)).run();
  });
}

void Server::stop() {
  if (!running_) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    server_thread_future_.get();
  }
  running_ = false;
}
}  // namespace ocrflow_api
