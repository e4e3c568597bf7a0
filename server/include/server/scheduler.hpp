#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

namespace livequiz::server {

using Clock = std::chrono::steady_clock;
using Task = std::function<void()>;

// Handle to one scheduled task. Copies share the same cancellation flag.
// cancel() is idempotent and safe after the task has fired or after the
// scheduler itself is gone.
class TimerHandle {
 public:
  TimerHandle() = default;
  explicit TimerHandle(std::shared_ptr<std::atomic<bool>> done) : done_(std::move(done)) {}

  void cancel();
  bool valid() const { return done_ != nullptr; }
  // True once the task either ran or was canceled.
  bool done() const;

 private:
  std::shared_ptr<std::atomic<bool>> done_;
};

// Single-shot delayed execution.
class Scheduler {
 public:
  virtual ~Scheduler() = default;
  virtual TimerHandle schedule_after(std::chrono::milliseconds delay, Task task) = 0;
};

// One background thread draining a deadline-ordered queue.
class ThreadScheduler : public Scheduler {
 public:
  ThreadScheduler();
  ~ThreadScheduler() override;

  ThreadScheduler(const ThreadScheduler&) = delete;
  ThreadScheduler& operator=(const ThreadScheduler&) = delete;

  TimerHandle schedule_after(std::chrono::milliseconds delay, Task task) override;
  void shutdown();
  std::size_t pending() const;

 private:
  struct Entry {
    Task task;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void run();

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  // Keyed by (deadline, insertion sequence) so equal deadlines fire in order.
  std::map<std::pair<Clock::time_point, std::uint64_t>, Entry> queue_;
  std::uint64_t next_seq_{0};
  bool stopping_{false};
  std::thread thread_;
};

}  // namespace livequiz::server
