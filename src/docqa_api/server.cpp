#include "docqa_api/server.hpp"

#include <iostream>

namespace docqa_api {
Server::Server(const std::string &host, int port) : host_(host), port_(port), running_(false) {}

Server::~Server() {
  stop();
}

void Server::start(unsigned int concurrency) {
  if (running_) {
    return;
  }
  running_ = true;
  server_thread_future_ = std::async(std::launch::async, [this, concurrency] {
    app_.port(port_).bindaddr(host_).concurrency(concurrency).run();
  });
  std::cout << "Listening on " << host_ << ":" << port_ << std::endl;
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
}  // namespace docqa_api
