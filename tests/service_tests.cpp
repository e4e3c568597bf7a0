#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "common/events.hpp"
#include "server/quiz_catalog.hpp"
#include "server/quiz_service.hpp"
#include "server/session_registry.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using livequiz::Message;
using livequiz::MessageType;
using livequiz::Status;
using livequiz::server::QuizCatalog;
using livequiz::server::QuizService;
using livequiz::server::SessionRegistry;
using livequiz::testing::ManualScheduler;
using livequiz::testing::RecordingGateway;
using livequiz::testing::TestRunner;
namespace actions = livequiz::actions;

namespace {

Message request(const std::string& action, nlohmann::json data) {
  Message m;
  m.type = MessageType::Request;
  m.action = action;
  m.data = std::move(data);
  return m;
}

nlohmann::json two_question_quiz() {
  nlohmann::json q1 = {{"prompt", "Largest planet?"},
                       {"choices", nlohmann::json::array({"Jupiter", "Mars"})},
                       {"correctAnswer", "Jupiter"},
                       {"timeLimit", 10}};
  nlohmann::json q2 = {{"prompt", "Smallest planet?"},
                       {"choices", nlohmann::json::array({"Mercury", "Venus"})},
                       {"correctAnswer", "Mercury"},
                       {"timeLimit", 10}};
  return {{"title", "Planets"}, {"questions", nlohmann::json::array({q1, q2})}};
}

struct Fixture {
  QuizCatalog catalog;
  RecordingGateway gw;
  ManualScheduler sched;
  SessionRegistry registry;
  QuizService service;

  Fixture()
      : registry(catalog, gw, sched, {}, [](std::size_t) { return std::string("ab12"); }),
        service(registry, gw) {}

  std::string create(const std::string& host = "host") {
    service.create_quiz(host, request(actions::kCreateQuiz, two_question_quiz()));
    auto created = gw.sent_to(host, actions::kQuizCreated);
    return created.empty() ? std::string() : created.back().data.value("roomCode", "");
  }

  Message last_error(const std::string& client) const {
    Message out;
    for (const auto& d : gw.deliveries()) {
      if (!d.to_room && d.target == client && d.msg.status == Status::Error) out = d.msg;
    }
    return out;
  }
};

}  // namespace

int main() {
  TestRunner tr("service");

  // Full host/player scenario through the event handlers.
  {
    Fixture f;
    const std::string room = f.create();
    tr.expect(room == "AB12", "quizCreated carries the room code");
    auto created = f.gw.sent_to("host", actions::kQuizCreated);
    tr.expect(!created.empty() && created[0].data.value("quizId", "").rfind("quiz-", 0) == 0,
              "quizCreated carries the quiz id");
    tr.expect(f.gw.is_member(room, "host"), "host subscribed to the room");

    f.service.join_quiz("A", request(actions::kJoinQuiz, {{"roomCode", "ab12"}, {"name", "Ana"}}));
    auto joined = f.gw.sent_to("A", actions::kJoinedRoom);
    tr.expect(joined.size() == 1 && joined[0].data["roomCode"] == "AB12", "lowercase code joins, reply normalized");
    tr.expect(joined.size() == 1 && joined[0].data["quizTitle"] == "Planets", "joinedRoom title");
    tr.expect(f.gw.broadcasts(actions::kPlayerJoined).size() == 1, "room told about the new player");

    f.service.start_quiz("host", request(actions::kStartQuiz, room));
    tr.expect(f.gw.broadcasts(actions::kNewQuestion).size() == 1, "newQuestion[0]");

    f.service.submit_answer("A", request(actions::kSubmitAnswer, {{"roomCode", room}, {"answer", "Jupiter"}}));
    auto score = f.gw.sent_to("A", actions::kScoreUpdate);
    tr.expect(score.size() == 1 && score[0].data == 10, "scoreUpdate 10 to A");
    auto board = f.gw.sent_to("host", actions::kUpdateLeaderboard);
    tr.expect(board.size() == 1 && board[0].data[0]["score"] == 10, "leaderboard to host");

    f.service.submit_answer("A", request(actions::kSubmitAnswer, {{"roomCode", room}, {"answer", "Jupiter"}}));
    tr.expect(f.gw.sent_to("A", actions::kScoreUpdate).size() == 1, "duplicate answer is silent");

    f.sched.advance(10s);
    tr.expect(f.gw.broadcasts(actions::kQuestionTimeout).size() == 1, "questionTimeout");
    f.sched.advance(2500ms);
    tr.expect(f.gw.broadcasts(actions::kNewQuestion).size() == 2, "newQuestion[1] after the grace delay");

    f.service.next_question("host", request(actions::kNextQuestion, {{"roomCode", room}}));
    auto finished = f.gw.broadcasts(actions::kQuizFinished);
    tr.expect(finished.size() == 1 && finished[0].data.size() == 1 && finished[0].data[0]["name"] == "Ana" &&
                  finished[0].data[0]["score"] == 10,
              "quizFinished [{A,10}]");
    f.service.next_question("host", request(actions::kNextQuestion, room));
    tr.expect(f.gw.broadcasts(actions::kQuizFinished).size() == 1, "extra next is a no-op");
    tr.expect(f.last_error("host").error_code.empty(), "no error for a no-op next");
  }

  // Join errors.
  {
    Fixture f;
    f.create();
    f.service.join_quiz("A", request(actions::kJoinQuiz, {{"roomCode", "ZZZZ"}, {"name", "Ana"}}));
    auto errors = f.gw.sent_to("A", actions::kJoinError);
    tr.expect(errors.size() == 1 && errors[0].data == "Room not found. Please check the code.",
              "unknown room yields joinError");
    tr.expect(f.gw.sent_to("A", actions::kJoinedRoom).empty(), "no joinedRoom on failure");

    f.service.join_quiz("B", request(actions::kJoinQuiz, {{"roomCode", "AB12"}}));
    tr.expect(f.last_error("B").error_code == "INVALID_REQUEST", "malformed join rejected");
  }

  // Host command errors are reported to the caller only.
  {
    Fixture f;
    const std::string room = f.create();
    f.service.join_quiz("A", request(actions::kJoinQuiz, {{"roomCode", room}, {"name", "Ana"}}));

    f.service.start_quiz("A", request(actions::kStartQuiz, room));
    tr.expect(f.last_error("A").error_code == "NOT_HOST", "player cannot start");
    f.service.start_quiz("host", request(actions::kStartQuiz, "NOPE"));
    tr.expect(f.last_error("host").error_code == "ROOM_NOT_FOUND", "start on unknown room");

    f.service.start_quiz("host", request(actions::kStartQuiz, room));
    f.service.start_quiz("host", request(actions::kStartQuiz, room));
    auto err = f.last_error("host");
    tr.expect(err.error_code == "ALREADY_STARTED" && err.action == actions::kStartQuiz,
              "second start reported as already started");
    tr.expect(f.gw.broadcasts(actions::kNewQuestion).size() == 1, "second start changed nothing");

    f.service.next_question("A", request(actions::kNextQuestion, room));
    tr.expect(f.last_error("A").error_code == "NOT_HOST", "player cannot advance");

    f.service.create_quiz("host2", request(actions::kCreateQuiz, {{"title", "no questions key"}}));
    tr.expect(f.last_error("host2").error_code == "INVALID_REQUEST", "malformed quiz rejected");
  }

  // Player disconnect removes exactly that player.
  {
    Fixture f;
    const std::string room = f.create();
    f.service.join_quiz("A", request(actions::kJoinQuiz, {{"roomCode", room}, {"name", "Ana"}}));
    f.service.join_quiz("B", request(actions::kJoinQuiz, {{"roomCode", room}, {"name", "Ben"}}));
    f.service.start_quiz("host", request(actions::kStartQuiz, room));
    f.service.submit_answer("A", request(actions::kSubmitAnswer, {{"roomCode", room}, {"answer", "Jupiter"}}));

    f.service.disconnect("B");
    auto session = f.registry.lookup(room);
    tr.expect(session != nullptr, "room survives a player leaving");
    auto roster = session->roster();
    tr.expect(roster.size() == 1 && roster[0].id == "A" && roster[0].score == 10, "only B removed");
    tr.expect(session->current_question_index() == 0, "question index untouched");
    auto sync = f.gw.broadcasts(actions::kPlayerJoined);
    tr.expect(!sync.empty() && sync.back().data["players"].size() == 1, "room gets the updated roster");
    tr.expect(f.gw.broadcasts(actions::kHostDisconnected).empty(), "no host event for a player");

    f.service.disconnect("stranger");
    tr.expect(f.registry.size() == 1, "unknown identity has no effect");
  }

  // Host disconnect tears the room down once.
  {
    Fixture f;
    const std::string room = f.create();
    f.service.join_quiz("A", request(actions::kJoinQuiz, {{"roomCode", room}, {"name", "Ana"}}));
    f.service.start_quiz("host", request(actions::kStartQuiz, room));

    f.service.disconnect("host");
    f.service.disconnect("host");
    tr.expect(f.gw.broadcasts(actions::kHostDisconnected).size() == 1, "exactly one hostDisconnected");
    tr.expect(f.registry.size() == 0, "room removed");
    tr.expect(f.catalog.size() == 0, "quiz removed");
    tr.expect(!f.gw.is_member(room, "A"), "room memberships dropped");

    f.sched.advance(30s);
    tr.expect(f.gw.broadcasts(actions::kQuestionTimeout).empty(), "timer canceled with the room");

    f.service.join_quiz("C", request(actions::kJoinQuiz, {{"roomCode", room}, {"name", "Cid"}}));
    tr.expect(f.gw.sent_to("C", actions::kJoinError).size() == 1, "joining a torn-down room fails");
    f.service.submit_answer("A", request(actions::kSubmitAnswer, {{"roomCode", room}, {"answer", "Jupiter"}}));
    tr.expect(f.gw.sent_to("A", actions::kScoreUpdate).empty(), "submit to a torn-down room is absorbed");
    f.service.disconnect("A");
  }

  // Concurrent players across the service.
  {
    Fixture f;
    const std::string room = f.create();
    const std::vector<std::string> players = {"p0", "p1", "p2", "p3", "p4", "p5"};
    {
      std::vector<std::thread> joiners;
      for (const auto& p : players) {
        joiners.emplace_back([&f, &room, p] {
          f.service.join_quiz(p, request(actions::kJoinQuiz, {{"roomCode", room}, {"name", p}}));
        });
      }
      for (auto& t : joiners) t.join();
    }
    tr.expect(f.registry.lookup(room)->roster().size() == players.size(), "all joins recorded");

    f.service.start_quiz("host", request(actions::kStartQuiz, room));
    {
      std::vector<std::thread> submitters;
      for (const auto& p : players) {
        for (int i = 0; i < 3; ++i) {
          submitters.emplace_back([&f, &room, p] {
            f.service.submit_answer(p, request(actions::kSubmitAnswer, {{"roomCode", room}, {"answer", "Jupiter"}}));
          });
        }
      }
      for (auto& t : submitters) t.join();
    }
    for (const auto& p : f.registry.lookup(room)->roster()) {
      tr.expect(p.score == 10 && p.answers.size() == 1, "scored once: " + p.id);
    }
    tr.expect(f.gw.unicast_count(actions::kScoreUpdate) == players.size(), "one scoreUpdate per player");
  }

  return tr.exit_code();
}
