#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "server/question_timer.hpp"
#include "server/scheduler.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using livequiz::server::QuestionTimer;
using livequiz::server::ThreadScheduler;
using livequiz::server::TimerHandle;
using livequiz::testing::ManualScheduler;
using livequiz::testing::TestRunner;

int main() {
  TestRunner tr("timer");

  // Fires exactly once at the deadline.
  {
    ManualScheduler sched;
    QuestionTimer timer(sched);
    int fired = 0;
    auto gen = timer.arm(10s, [&](std::uint64_t g) {
      if (timer.consume(g)) ++fired;
    });
    tr.expect(timer.armed(), "armed after arm");
    sched.advance(9999ms);
    tr.expect(fired == 0, "not before the deadline");
    sched.advance(1ms);
    tr.expect(fired == 1, "fires at the deadline");
    tr.expect(!timer.armed(), "spent after fire");
    tr.expect(!timer.consume(gen), "a spent generation cannot be consumed again");
    sched.advance(60s);
    tr.expect(fired == 1, "never fires twice");
  }

  // Re-arming replaces the previous deadline.
  {
    ManualScheduler sched;
    QuestionTimer timer(sched);
    int first = 0;
    int second = 0;
    const auto gen1 = timer.arm(5s, [&](std::uint64_t g) {
      if (timer.consume(g)) ++first;
    });
    sched.advance(2s);
    const auto gen2 = timer.arm(5s, [&](std::uint64_t g) {
      if (timer.consume(g)) ++second;
    });
    tr.expect(gen2 > gen1 && timer.generation() == gen2, "re-arm moves to a fresh generation");
    tr.expect(sched.pending() == 1, "old deadline canceled on re-arm");
    sched.advance(10s);
    tr.expect(first == 0, "replaced timer never fires");
    tr.expect(second == 1, "replacement fires");
  }

  // Cancel is idempotent and safe after firing.
  {
    ManualScheduler sched;
    QuestionTimer timer(sched);
    int fired = 0;
    timer.arm(1s, [&](std::uint64_t g) {
      if (timer.consume(g)) ++fired;
    });
    const auto before = timer.generation();
    timer.cancel();
    tr.expect(timer.generation() == before + 1, "cancel retires the armed generation");
    timer.cancel();
    tr.expect(timer.generation() == before + 1, "second cancel leaves the generation alone");
    tr.expect(!timer.armed(), "canceled timer is disarmed");
    sched.advance(5s);
    tr.expect(fired == 0, "canceled timer does not fire");

    timer.arm(1s, [&](std::uint64_t g) {
      if (timer.consume(g)) ++fired;
    });
    sched.advance(1s);
    timer.cancel();
    tr.expect(fired == 1, "cancel after fire is harmless");
  }

  // A fire that was already claimed when cancel ran is rejected by consume().
  {
    ManualScheduler sched;
    QuestionTimer timer(sched);
    std::uint64_t late = 0;
    timer.arm(1s, [&](std::uint64_t g) { late = g; });
    sched.advance(1s);
    timer.cancel();
    tr.expect(late != 0, "callback observed");
    tr.expect(!timer.consume(late), "generation invalidated by cancel");
  }

  // Handles outliving everything.
  {
    TimerHandle empty;
    tr.expect(!empty.valid(), "default handle refers to nothing");
    empty.cancel();
    tr.expect(empty.done(), "default handle counts as done");
    TimerHandle kept;
    {
      ManualScheduler sched;
      kept = sched.schedule_after(1s, [] {});
    }
    tr.expect(kept.valid() && !kept.done(), "scheduled handle is live");
    kept.cancel();
    tr.expect(kept.done(), "cancel after scheduler destruction");
  }

  // Real thread scheduler: ordering, cancellation, shutdown.
  {
    ThreadScheduler sched;
    std::mutex mtx;
    std::condition_variable cv;
    std::vector<int> order;

    auto push = [&](int v) {
      std::lock_guard<std::mutex> lock(mtx);
      order.push_back(v);
      cv.notify_all();
    };
    sched.schedule_after(60ms, [&] { push(2); });
    sched.schedule_after(20ms, [&] { push(1); });
    auto canceled = sched.schedule_after(40ms, [&] { push(99); });
    canceled.cancel();

    std::unique_lock<std::mutex> lock(mtx);
    bool done = cv.wait_for(lock, 2s, [&] { return order.size() >= 2; });
    lock.unlock();
    std::this_thread::sleep_for(50ms);
    lock.lock();
    tr.expect(done, "thread scheduler runs due tasks");
    tr.expect(order.size() == 2 && order[0] == 1 && order[1] == 2, "deadline order kept, canceled skipped");
    lock.unlock();

    std::atomic<bool> ran{false};
    auto pending = sched.schedule_after(10s, [&] { ran.store(true); });
    tr.expect(sched.pending() == 1, "long task pending");
    sched.shutdown();
    tr.expect(pending.done(), "shutdown drops pending tasks");
    tr.expect(!ran.load(), "dropped task never runs");
    auto after = sched.schedule_after(1ms, [&] { ran.store(true); });
    tr.expect(after.done(), "schedule after shutdown is refused");
  }

  return tr.exit_code();
}
