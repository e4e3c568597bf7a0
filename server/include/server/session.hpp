#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/quiz.hpp"
#include "server/broadcast_gateway.hpp"
#include "server/question_timer.hpp"
#include "server/scheduler.hpp"

namespace livequiz::server {

enum class SessionPhase { Lobby, InQuestion, Finished };

enum class StartResult { Started, AlreadyStarted, NotHost, Closed };
enum class AdvanceResult { NextQuestion, Finished, AlreadyFinished, Stale, NotHost, Closed };
enum class JoinResult { Joined, AlreadyJoined, Closed };
enum class SubmitResult { Accepted, Duplicate, NotInQuestion, UnknownParticipant, Closed };

std::string to_string(SessionPhase phase);

struct SessionOptions {
  std::chrono::milliseconds grace_delay{2500};
  int points_per_correct{10};
};

// One live room. Every public operation takes the session mutex, so all
// transitions for a room are serialized while unrelated rooms never contend.
// Outbound events are pushed through the gateway while the lock is held,
// which keeps per-room delivery order identical to transition order.
class Session : public std::enable_shared_from_this<Session> {
 public:
  Session(std::string room_code,
          std::string quiz_id,
          std::shared_ptr<const Quiz> quiz,
          std::string host_id,
          BroadcastGateway& gateway,
          Scheduler& scheduler,
          SessionOptions options = {});
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  const std::string& room_code() const { return room_code_; }
  const std::string& quiz_id() const { return quiz_id_; }
  const std::string& title() const { return title_; }
  const std::string& host_id() const { return host_id_; }

  // Lobby -> first question. Anything but the lobby is rejected.
  StartResult start(const std::string& requester);

  // Manual advance by the host. From the lobby this behaves like start;
  // once finished it is a no-op.
  AdvanceResult next_question(const std::string& requester);

  JoinResult join(const std::string& participant_id, const std::string& name);
  SubmitResult submit_answer(const std::string& participant_id, const nlohmann::json& answer);

  // Removes a non-host participant and re-broadcasts the roster.
  bool remove_participant(const std::string& participant_id);

  // Host teardown: cancels timers, notifies the room, rejects all later calls.
  void close();

  bool closed() const;
  bool has_participant(const std::string& participant_id) const;
  int current_question_index() const;
  int question_count() const;
  SessionPhase phase() const;
  bool timer_armed() const;
  std::vector<Participant> roster() const;
  // Sorted by score descending; ties keep join order.
  std::vector<Participant> ranked_leaderboard() const;

 private:
  SessionPhase phase_locked() const;
  AdvanceResult advance_locked(int expected_index);
  void arm_question_timer_locked();
  void on_question_timeout(std::uint64_t generation, int question_index);
  void on_grace_elapsed(int question_index);
  std::vector<Participant> ranked_locked() const;
  Participant* find_locked(const std::string& participant_id);
  void broadcast_roster_locked();

  const std::string room_code_;
  const std::string quiz_id_;
  const std::shared_ptr<const Quiz> quiz_;
  const std::string title_;
  const std::string host_id_;
  BroadcastGateway& gateway_;
  Scheduler& scheduler_;
  const SessionOptions options_;

  mutable std::mutex mtx_;
  int current_index_{-1};
  // Join order; doubles as the leaderboard (one entry per roster member).
  std::vector<Participant> participants_;
  QuestionTimer timer_;
  TimerHandle grace_handle_;
  bool closed_{false};
};

}  // namespace livequiz::server
