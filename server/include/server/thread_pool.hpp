#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace livequiz::server {

// Fixed worker set executing queued request handlers.
class ThreadPool {
 public:
  explicit ThreadPool(std::size_t workers);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once shutdown has begun; the task is dropped.
  bool enqueue(std::function<void()> task);
  // Runs what is already queued, then joins the workers.
  void shutdown();
  std::size_t size() const { return threads_.size(); }

 private:
  void worker_loop();

  std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<std::function<void()>> tasks_;
  bool stopping_{false};
  std::vector<std::thread> threads_;
};

}  // namespace livequiz::server
