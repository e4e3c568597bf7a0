#pragma once

#include <string>

#include "common/message.hpp"
#include "server/broadcast_gateway.hpp"
#include "server/session_registry.hpp"

namespace livequiz::server {

// Maps inbound client events onto the registry and session state machine.
// Every method is safe to call concurrently from transport workers.
class QuizService {
 public:
  QuizService(SessionRegistry& registry, BroadcastGateway& gateway);

  void create_quiz(const std::string& client_id, const Message& req);
  void start_quiz(const std::string& client_id, const Message& req);
  void next_question(const std::string& client_id, const Message& req);
  void join_quiz(const std::string& client_id, const Message& req);
  void submit_answer(const std::string& client_id, const Message& req);

  // Transport-level disconnect of client_id.
  void disconnect(const std::string& client_id);

 private:
  void reject(const std::string& client_id, const std::string& action,
              const std::string& code, const std::string& message);

  SessionRegistry& registry_;
  BroadcastGateway& gateway_;
};

}  // namespace livequiz::server
