#include "server/scheduler.hpp"

#include <spdlog/spdlog.h>

namespace livequiz::server {

void TimerHandle::cancel() {
  if (done_) done_->store(true);
}

bool TimerHandle::done() const {
  return !done_ || done_->load();
}

ThreadScheduler::ThreadScheduler() : thread_(&ThreadScheduler::run, this) {}

ThreadScheduler::~ThreadScheduler() {
  shutdown();
}

TimerHandle ThreadScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) {
      done->store(true);
      return TimerHandle(done);
    }
    auto key = std::make_pair(Clock::now() + delay, next_seq_++);
    queue_.emplace(key, Entry{std::move(task), done});
  }
  cv_.notify_one();
  return TimerHandle(done);
}

void ThreadScheduler::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (stopping_) return;
    stopping_ = true;
    for (auto& kv : queue_) kv.second.done->store(true);
    queue_.clear();
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

std::size_t ThreadScheduler::pending() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

void ThreadScheduler::run() {
  std::unique_lock<std::mutex> lock(mtx_);
  while (!stopping_) {
    if (queue_.empty()) {
      cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
      continue;
    }
    auto due = queue_.begin()->first.first;
    if (Clock::now() < due) {
      // Woken early by a new (possibly sooner) entry or by shutdown.
      cv_.wait_until(lock, due);
      continue;
    }
    Entry entry = std::move(queue_.begin()->second);
    queue_.erase(queue_.begin());
    // Claim the entry; a concurrent cancel() that lost the race is a no-op.
    if (entry.done->exchange(true)) continue;

    lock.unlock();
    try {
      entry.task();
    } catch (const std::exception& ex) {
      spdlog::error("scheduled task threw: {}", ex.what());
    }
    lock.lock();
  }
}

}  // namespace livequiz::server
