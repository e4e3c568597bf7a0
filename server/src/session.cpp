#include "server/session.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

#include "common/events.hpp"

namespace livequiz::server {

std::string to_string(SessionPhase phase) {
  switch (phase) {
    case SessionPhase::Lobby:
      return "LOBBY";
    case SessionPhase::InQuestion:
      return "IN_QUESTION";
    case SessionPhase::Finished:
      return "FINISHED";
  }
  return "LOBBY";
}

Session::Session(std::string room_code,
                 std::string quiz_id,
                 std::shared_ptr<const Quiz> quiz,
                 std::string host_id,
                 BroadcastGateway& gateway,
                 Scheduler& scheduler,
                 SessionOptions options)
    : room_code_(std::move(room_code)),
      quiz_id_(std::move(quiz_id)),
      quiz_(std::move(quiz)),
      title_(quiz_ ? quiz_->title : std::string()),
      host_id_(std::move(host_id)),
      gateway_(gateway),
      scheduler_(scheduler),
      options_(options),
      timer_(scheduler) {}

Session::~Session() {
  grace_handle_.cancel();
}

StartResult Session::start(const std::string& requester) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return StartResult::Closed;
  if (requester != host_id_) return StartResult::NotHost;
  if (current_index_ != -1) {
    spdlog::info("room {}: start ignored, already {}", room_code_, to_string(phase_locked()));
    return StartResult::AlreadyStarted;
  }
  advance_locked(-1);
  spdlog::info("room {}: quiz started", room_code_);
  return StartResult::Started;
}

AdvanceResult Session::next_question(const std::string& requester) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return AdvanceResult::Closed;
  if (requester != host_id_) return AdvanceResult::NotHost;
  return advance_locked(current_index_);
}

AdvanceResult Session::advance_locked(int expected_index) {
  if (closed_) return AdvanceResult::Closed;
  // A grace-delay advance that lost the race to a manual one.
  if (current_index_ != expected_index) return AdvanceResult::Stale;

  const int total = static_cast<int>(quiz_->questions.size());
  if (current_index_ >= total) return AdvanceResult::AlreadyFinished;

  timer_.cancel();
  ++current_index_;

  if (current_index_ < total) {
    NewQuestion ev{current_index_, total, quiz_->questions[static_cast<std::size_t>(current_index_)]};
    gateway_.broadcast(room_code_, ev.to_message());
    arm_question_timer_locked();
    spdlog::info("room {}: question {}/{}", room_code_, current_index_ + 1, total);
    return AdvanceResult::NextQuestion;
  }

  QuizFinished ev{ranked_locked()};
  gateway_.broadcast(room_code_, ev.to_message());
  spdlog::info("room {}: quiz finished", room_code_);
  return AdvanceResult::Finished;
}

void Session::arm_question_timer_locked() {
  const auto& q = quiz_->questions[static_cast<std::size_t>(current_index_)];
  const double seconds = std::min(std::max(q.time_limit_seconds, 0.0), kMaxTimeLimitSeconds);
  const auto limit = std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
  std::weak_ptr<Session> weak = weak_from_this();
  const int index = current_index_;
  timer_.arm(limit, [weak, index](std::uint64_t generation) {
    if (auto self = weak.lock()) self->on_question_timeout(generation, index);
  });
}

void Session::on_question_timeout(std::uint64_t generation, int question_index) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_ || !timer_.consume(generation) || question_index != current_index_) {
    spdlog::debug("room {}: stale timer fire for question {}", room_code_, question_index);
    return;
  }

  const auto& q = quiz_->questions[static_cast<std::size_t>(question_index)];
  QuestionTimeout ev{q.correct_answer, participants_};
  gateway_.broadcast(room_code_, ev.to_message());
  spdlog::info("room {}: question {} timed out", room_code_, question_index + 1);

  std::weak_ptr<Session> weak = weak_from_this();
  grace_handle_ = scheduler_.schedule_after(options_.grace_delay, [weak, question_index] {
    if (auto self = weak.lock()) self->on_grace_elapsed(question_index);
  });
}

void Session::on_grace_elapsed(int question_index) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (advance_locked(question_index) == AdvanceResult::Stale) {
    spdlog::debug("room {}: auto-advance from question {} superseded", room_code_,
                  question_index + 1);
  }
}

JoinResult Session::join(const std::string& participant_id, const std::string& name) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return JoinResult::Closed;
  if (find_locked(participant_id) != nullptr) return JoinResult::AlreadyJoined;

  Participant p;
  p.id = participant_id;
  p.name = name;
  participants_.push_back(std::move(p));

  gateway_.subscribe(room_code_, participant_id);
  JoinedRoom reply{room_code_, title_, participants_};
  gateway_.send_to(participant_id, reply.to_message());
  broadcast_roster_locked();
  spdlog::info("{} ({}) joined room {}", name, participant_id, room_code_);
  return JoinResult::Joined;
}

SubmitResult Session::submit_answer(const std::string& participant_id,
                                    const nlohmann::json& answer) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return SubmitResult::Closed;
  if (phase_locked() != SessionPhase::InQuestion) return SubmitResult::NotInQuestion;

  Participant* p = find_locked(participant_id);
  if (p == nullptr) return SubmitResult::UnknownParticipant;
  if (p->has_answered(current_index_)) {
    spdlog::debug("room {}: {} answered question {} again", room_code_, participant_id,
                  current_index_ + 1);
    return SubmitResult::Duplicate;
  }

  const auto& q = quiz_->questions[static_cast<std::size_t>(current_index_)];
  const bool correct = (answer == q.correct_answer);
  p->answers.push_back(AnswerRecord{current_index_, answer, correct});
  if (correct) p->score += options_.points_per_correct;
  const int score = p->score;
  spdlog::info("room {}: answer by {}: {} correct={}", room_code_, p->name, answer.dump(), correct);

  UpdateLeaderboard board{ranked_locked()};
  gateway_.send_to(host_id_, board.to_message());
  gateway_.send_to(participant_id, ScoreUpdate{score}.to_message());
  return SubmitResult::Accepted;
}

bool Session::remove_participant(const std::string& participant_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return false;
  auto it = std::find_if(participants_.begin(), participants_.end(),
                         [&](const Participant& p) { return p.id == participant_id; });
  if (it == participants_.end()) return false;
  const std::string name = it->name;
  participants_.erase(it);
  gateway_.unsubscribe(room_code_, participant_id);
  broadcast_roster_locked();
  spdlog::info("{} ({}) left room {}", name, participant_id, room_code_);
  return true;
}

void Session::close() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (closed_) return;
  closed_ = true;
  timer_.cancel();
  grace_handle_.cancel();
  gateway_.broadcast(room_code_, HostDisconnected{}.to_message());
}

bool Session::closed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return closed_;
}

bool Session::has_participant(const std::string& participant_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  return std::any_of(participants_.begin(), participants_.end(),
                     [&](const Participant& p) { return p.id == participant_id; });
}

int Session::current_question_index() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return current_index_;
}

int Session::question_count() const {
  return static_cast<int>(quiz_->questions.size());
}

SessionPhase Session::phase() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return phase_locked();
}

bool Session::timer_armed() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return timer_.armed();
}

std::vector<Participant> Session::roster() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return participants_;
}

std::vector<Participant> Session::ranked_leaderboard() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return ranked_locked();
}

SessionPhase Session::phase_locked() const {
  if (current_index_ < 0) return SessionPhase::Lobby;
  if (current_index_ < static_cast<int>(quiz_->questions.size())) return SessionPhase::InQuestion;
  return SessionPhase::Finished;
}

std::vector<Participant> Session::ranked_locked() const {
  std::vector<Participant> ranked = participants_;
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const Participant& a, const Participant& b) { return a.score > b.score; });
  return ranked;
}

Participant* Session::find_locked(const std::string& participant_id) {
  for (auto& p : participants_) {
    if (p.id == participant_id) return &p;
  }
  return nullptr;
}

void Session::broadcast_roster_locked() {
  gateway_.broadcast(room_code_, PlayerJoined{participants_, title_}.to_message());
}

}  // namespace livequiz::server
