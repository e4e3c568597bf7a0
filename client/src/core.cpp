#include "client/core.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <vector>

#include "common/codec.hpp"

namespace livequiz::client {

ClientCore::~ClientCore() {
  disconnect();
}

bool ClientCore::connect(const std::string& host, uint16_t port, std::string& error) {
  disconnect();
  fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd_ < 0) {
    error = std::string("socket: ") + std::strerror(errno);
    return false;
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (::inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    error = "invalid host: " + host;
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  if (::connect(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    error = std::string("connect: ") + std::strerror(errno);
    ::close(fd_);
    fd_ = -1;
    return false;
  }
  connected_.store(true);
  reader_ = std::thread(&ClientCore::reader_loop, this);
  return true;
}

void ClientCore::disconnect() {
  if (connected_.exchange(false) && fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
  if (reader_.joinable()) reader_.join();
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  queue_cv_.notify_all();
}

bool ClientCore::send_message(const Message& msg, std::string& error) {
  if (!connected_.load()) {
    error = "not connected";
    return false;
  }
  auto frame = encode_frame(msg, error);
  if (frame.empty()) return false;
  std::lock_guard<std::mutex> lock(send_mtx_);
  return write_frame(fd_, frame, error);
}

std::optional<Message> ClientCore::pop_event() {
  std::lock_guard<std::mutex> lock(queue_mtx_);
  if (queue_.empty()) return std::nullopt;
  Message ev = std::move(queue_.front());
  queue_.pop();
  return ev;
}

std::optional<Message> ClientCore::wait_event(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(queue_mtx_);
  queue_cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || !connected_.load(); });
  if (queue_.empty()) return std::nullopt;
  Message ev = std::move(queue_.front());
  queue_.pop();
  return ev;
}

void ClientCore::reader_loop() {
  while (connected_.load()) {
    std::vector<std::uint8_t> frame;
    std::string error;
    if (!read_frame(fd_, frame, error)) {
      if (connected_.load() && error != "EOF") {
        std::cerr << "[client] read error: " << error << "\n";
      }
      break;
    }
    Message msg;
    if (!decode_frame(frame, msg, error)) {
      std::cerr << "[client] decode error: " << error << "\n";
      continue;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mtx_);
      queue_.push(std::move(msg));
    }
    queue_cv_.notify_one();
  }
  connected_.store(false);
  queue_cv_.notify_all();
}

}  // namespace livequiz::client
