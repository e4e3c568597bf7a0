#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "server/scheduler.hpp"

namespace livequiz::server {

// At most one outstanding question deadline. Arming replaces (and cancels)
// the previous deadline. Each arm gets a fresh generation; a fired callback
// must call consume(generation) under the owner's lock and only proceed on
// true, which turns a late or superseded fire into a no-op.
//
// Not thread-safe on its own: the owning Session serializes access.
class QuestionTimer {
 public:
  using FireFn = std::function<void(std::uint64_t generation)>;

  explicit QuestionTimer(Scheduler& scheduler) : scheduler_(scheduler) {}
  ~QuestionTimer() { cancel(); }

  QuestionTimer(const QuestionTimer&) = delete;
  QuestionTimer& operator=(const QuestionTimer&) = delete;

  std::uint64_t arm(std::chrono::milliseconds duration, FireFn on_fire);
  void cancel();
  bool consume(std::uint64_t generation);

  bool armed() const { return armed_; }
  std::uint64_t generation() const { return generation_; }

 private:
  Scheduler& scheduler_;
  TimerHandle handle_;
  std::uint64_t generation_{0};
  bool armed_{false};
};

}  // namespace livequiz::server
