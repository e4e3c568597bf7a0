#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#include "common/message.hpp"

namespace livequiz::client {

// Blocking TCP client: requests are written synchronously, everything the
// server pushes is queued by a reader thread.
class ClientCore {
 public:
  ClientCore() = default;
  ~ClientCore();

  ClientCore(const ClientCore&) = delete;
  ClientCore& operator=(const ClientCore&) = delete;

  bool connect(const std::string& host, uint16_t port, std::string& error);
  void disconnect();

  bool send_message(const Message& msg, std::string& error);

  std::optional<Message> pop_event();
  // Waits up to `timeout` for the next event.
  std::optional<Message> wait_event(std::chrono::milliseconds timeout);

  bool is_connected() const { return connected_.load(); }

 private:
  void reader_loop();

  int fd_{-1};
  std::atomic<bool> connected_{false};
  std::thread reader_;
  std::mutex send_mtx_;

  std::mutex queue_mtx_;
  std::condition_variable queue_cv_;
  std::queue<Message> queue_;
};

}  // namespace livequiz::client
