#include "server/question_timer.hpp"

namespace livequiz::server {

std::uint64_t QuestionTimer::arm(std::chrono::milliseconds duration, FireFn on_fire) {
  handle_.cancel();
  const std::uint64_t gen = ++generation_;
  armed_ = true;
  handle_ = scheduler_.schedule_after(duration, [on_fire = std::move(on_fire), gen] {
    on_fire(gen);
  });
  return gen;
}

void QuestionTimer::cancel() {
  handle_.cancel();
  handle_ = TimerHandle();
  if (armed_) {
    armed_ = false;
    ++generation_;
  }
}

bool QuestionTimer::consume(std::uint64_t generation) {
  if (!armed_ || generation != generation_) return false;
  armed_ = false;
  handle_ = TimerHandle();
  return true;
}

}  // namespace livequiz::server
