#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "client/core.hpp"
#include "common/events.hpp"
#include "server/quiz_catalog.hpp"
#include "server/quiz_service.hpp"
#include "server/scheduler.hpp"
#include "server/server.hpp"
#include "server/session_registry.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using livequiz::Message;
using livequiz::MessageType;
using livequiz::Status;
using livequiz::client::ClientCore;
using livequiz::server::QuizCatalog;
using livequiz::server::QuizService;
using livequiz::server::Server;
using livequiz::server::SessionRegistry;
using livequiz::server::ThreadScheduler;
using livequiz::testing::TestRunner;
namespace actions = livequiz::actions;

namespace {

const std::string kLoopback = "127.0.0.1";

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(10ms);
  }
  return pred();
}

// Pops events until one with `action` arrives; others are discarded.
std::optional<Message> wait_for(ClientCore& client, const std::string& action,
                                std::chrono::milliseconds timeout = 5s) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline) return std::nullopt;
    auto ev = client.wait_event(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
    if (ev && ev->action == action) return ev;
  }
}

Message raw_request(const std::string& action) {
  Message m;
  m.type = MessageType::Request;
  m.action = action;
  return m;
}

livequiz::Quiz one_question_quiz() {
  livequiz::Quiz quiz;
  quiz.title = "Rivers";
  livequiz::Question q;
  q.prompt = "Longest river?";
  q.choices = nlohmann::json::array({"Nile", "Rhine"});
  q.correct_answer = "Nile";
  q.time_limit_seconds = 30;
  quiz.questions.push_back(q);
  return quiz;
}

// Server wired to the quiz handlers the way the server binary wires them.
struct QuizServer {
  ThreadScheduler scheduler;
  QuizCatalog catalog;
  Server server{kLoopback, 0, 4};
  SessionRegistry registry{catalog, server, scheduler};
  QuizService service{registry, server};
  std::atomic<int> creates{0};

  QuizServer() {
    server.register_handler(actions::kCreateQuiz, [this](const std::string& id, const Message& m) {
      service.create_quiz(id, m);
      ++creates;
    });
    server.register_handler(actions::kJoinQuiz, [this](const std::string& id, const Message& m) {
      service.join_quiz(id, m);
    });
    server.set_disconnect_handler([this](const std::string& id) { service.disconnect(id); });
  }

  ~QuizServer() {
    scheduler.shutdown();
    server.stop();
  }
};

}  // namespace

int main() {
  TestRunner tr("transport");

  // A client's requests finish before its disconnect hook runs.
  {
    Server server(kLoopback, 0, 4);
    std::mutex mtx;
    std::vector<std::string> seen;
    server.register_handler("slow", [&](const std::string&, const Message& m) {
      std::this_thread::sleep_for(30ms);
      std::lock_guard<std::mutex> lock(mtx);
      seen.push_back("slow:" + m.data.value("n", std::string()));
    });
    server.set_disconnect_handler([&](const std::string&) {
      std::lock_guard<std::mutex> lock(mtx);
      seen.push_back("disconnect");
    });
    tr.expect(server.start(), "server listens");
    tr.expect(server.port() != 0, "ephemeral port resolved");

    ClientCore client;
    std::string err;
    tr.expect(client.connect(kLoopback, server.port(), err), "client connects: " + err);
    for (const char* n : {"1", "2", "3"}) {
      Message m = raw_request("slow");
      m.data = {{"n", n}};
      tr.expect(client.send_message(m, err), "request sent");
    }
    client.disconnect();

    bool done = eventually([&] {
      std::lock_guard<std::mutex> lock(mtx);
      return !seen.empty() && seen.back() == "disconnect";
    });
    tr.expect(done, "disconnect hook ran");
    {
      std::lock_guard<std::mutex> lock(mtx);
      const std::vector<std::string> expected = {"slow:1", "slow:2", "slow:3", "disconnect"};
      tr.expect(seen == expected, "requests in order, then disconnect");
    }
    tr.expect(eventually([&] { return server.connection_count() == 0; }), "connection released");
    server.stop();
  }

  // Unknown actions get an error response.
  {
    Server server(kLoopback, 0, 2);
    tr.expect(server.start(), "server listens");
    ClientCore client;
    std::string err;
    tr.expect(client.connect(kLoopback, server.port(), err), "client connects: " + err);
    tr.expect(eventually([&] { return server.connection_count() == 1; }), "connection registered");
    client.send_message(raw_request("dance"), err);
    auto reply = wait_for(client, "dance");
    tr.expect(reply && reply->type == MessageType::Response && reply->status == Status::Error &&
                  reply->error_code == "UNKNOWN_ACTION",
              "unknown action rejected");
    client.disconnect();
    server.stop();
  }

  // Hosts that create and hang up at once never leave a room behind.
  {
    QuizServer qs;
    tr.expect(qs.server.start(), "quiz server listens");
    const int hosts = 40;
    std::vector<std::unique_ptr<ClientCore>> clients;
    for (int i = 0; i < hosts; ++i) {
      auto client = std::make_unique<ClientCore>();
      std::string err;
      if (!client->connect(kLoopback, qs.server.port(), err)) {
        tr.expect(false, "host connects: " + err);
        continue;
      }
      client->send_message(livequiz::CreateQuizRequest{one_question_quiz()}.to_message(), err);
      clients.push_back(std::move(client));
    }
    for (auto& c : clients) c->disconnect();

    bool settled = eventually([&] {
      return qs.creates.load() == hosts && qs.server.connection_count() == 0 && qs.registry.size() == 0;
    });
    tr.expect(settled, "every create handled and every room torn down");
    tr.expect(qs.registry.size() == 0, "no rooms left");
    tr.expect(qs.catalog.size() == 0, "no quizzes left");
  }

  // Host create, player join, host close: the player is told and the room is gone.
  {
    QuizServer qs;
    tr.expect(qs.server.start(), "quiz server listens");
    std::string err;

    ClientCore host;
    tr.expect(host.connect(kLoopback, qs.server.port(), err), "host connects: " + err);
    host.send_message(livequiz::CreateQuizRequest{one_question_quiz()}.to_message(), err);
    auto created = wait_for(host, actions::kQuizCreated);
    tr.expect(created.has_value(), "quizCreated received");
    const std::string room = created ? created->data.value("roomCode", "") : "";

    ClientCore player;
    tr.expect(player.connect(kLoopback, qs.server.port(), err), "player connects: " + err);
    player.send_message(livequiz::JoinQuizRequest{room, "Ana"}.to_message(), err);
    auto joined = wait_for(player, actions::kJoinedRoom);
    tr.expect(joined && joined->data["quizTitle"] == "Rivers", "joinedRoom received");
    auto roster = wait_for(host, actions::kPlayerJoined);
    tr.expect(roster && roster->data["players"].size() == 1, "host sees the player");

    host.disconnect();
    auto gone = wait_for(player, actions::kHostDisconnected);
    tr.expect(gone.has_value(), "player told the host left");
    tr.expect(eventually([&] { return qs.registry.size() == 0 && qs.catalog.size() == 0; }),
              "room and quiz removed");

    player.send_message(livequiz::JoinQuizRequest{room, "Ana"}.to_message(), err);
    auto refused = wait_for(player, actions::kJoinError);
    tr.expect(refused.has_value(), "rejoining a closed room fails");
    player.disconnect();
  }

  return tr.exit_code();
}
