#include "server/quiz_service.hpp"

#include <spdlog/spdlog.h>

#include "common/events.hpp"

namespace livequiz::server {

namespace {
constexpr const char* kRoomNotFoundText = "Room not found. Please check the code.";
}  // namespace

QuizService::QuizService(SessionRegistry& registry, BroadcastGateway& gateway)
    : registry_(registry), gateway_(gateway) {}

void QuizService::reject(const std::string& client_id, const std::string& action,
                         const std::string& code, const std::string& message) {
  gateway_.send_to(client_id, make_error_response(action, code, message));
}

void QuizService::create_quiz(const std::string& client_id, const Message& req) {
  std::string error;
  auto parsed = CreateQuizRequest::from_message(req, error);
  if (!parsed) {
    reject(client_id, req.action, "INVALID_REQUEST", error);
    return;
  }

  auto created = registry_.create_session(std::move(parsed->quiz), client_id);
  gateway_.subscribe(created.room_code, client_id);
  gateway_.send_to(client_id, QuizCreated{created.room_code, created.quiz_id}.to_message());
  spdlog::info("quiz created: room {} quiz {} host {}", created.room_code, created.quiz_id,
               client_id);
}

void QuizService::start_quiz(const std::string& client_id, const Message& req) {
  std::string error;
  auto cmd = RoomCommand::from_message(req, error);
  if (!cmd) {
    reject(client_id, req.action, "INVALID_REQUEST", error);
    return;
  }
  auto session = registry_.lookup(cmd->room_code);
  if (!session) {
    spdlog::info("start: room {} not found", cmd->room_code);
    reject(client_id, req.action, "ROOM_NOT_FOUND", kRoomNotFoundText);
    return;
  }

  switch (session->start(client_id)) {
    case StartResult::Started:
      break;
    case StartResult::AlreadyStarted:
      reject(client_id, req.action, "ALREADY_STARTED", "Quiz already started");
      break;
    case StartResult::NotHost:
      reject(client_id, req.action, "NOT_HOST", "Only the host can start the quiz");
      break;
    case StartResult::Closed:
      reject(client_id, req.action, "ROOM_NOT_FOUND", kRoomNotFoundText);
      break;
  }
}

void QuizService::next_question(const std::string& client_id, const Message& req) {
  std::string error;
  auto cmd = RoomCommand::from_message(req, error);
  if (!cmd) {
    reject(client_id, req.action, "INVALID_REQUEST", error);
    return;
  }
  spdlog::info("next question requested for room {}", cmd->room_code);
  auto session = registry_.lookup(cmd->room_code);
  if (!session) {
    reject(client_id, req.action, "ROOM_NOT_FOUND", kRoomNotFoundText);
    return;
  }

  switch (session->next_question(client_id)) {
    case AdvanceResult::NotHost:
      reject(client_id, req.action, "NOT_HOST", "Only the host can advance the quiz");
      break;
    case AdvanceResult::Closed:
      reject(client_id, req.action, "ROOM_NOT_FOUND", kRoomNotFoundText);
      break;
    default:
      // Advancing a finished quiz is a no-op.
      break;
  }
}

void QuizService::join_quiz(const std::string& client_id, const Message& req) {
  std::string error;
  auto parsed = JoinQuizRequest::from_message(req, error);
  if (!parsed) {
    reject(client_id, req.action, "INVALID_REQUEST", error);
    return;
  }

  auto session = registry_.lookup(parsed->room_code);
  JoinResult result = session ? session->join(client_id, parsed->name) : JoinResult::Closed;
  switch (result) {
    case JoinResult::Joined:
      break;
    case JoinResult::AlreadyJoined: {
      // Re-send the room state without touching the roster.
      JoinedRoom reply{session->room_code(), session->title(), session->roster()};
      gateway_.send_to(client_id, reply.to_message());
      break;
    }
    case JoinResult::Closed:
      spdlog::info("join: room {} not found for {}", parsed->room_code, client_id);
      gateway_.send_to(client_id, JoinError{kRoomNotFoundText}.to_message());
      break;
  }
}

void QuizService::submit_answer(const std::string& client_id, const Message& req) {
  std::string error;
  auto parsed = SubmitAnswerRequest::from_message(req, error);
  if (!parsed) {
    reject(client_id, req.action, "INVALID_REQUEST", error);
    return;
  }
  auto session = registry_.lookup(parsed->room_code);
  if (!session) {
    spdlog::debug("submit: room {} not found", parsed->room_code);
    return;
  }
  // Duplicates and out-of-phase answers are absorbed without a reply.
  session->submit_answer(client_id, parsed->answer);
}

void QuizService::disconnect(const std::string& client_id) {
  for (const auto& session : registry_.snapshot()) {
    if (session->host_id() == client_id) {
      spdlog::info("host {} disconnected from room {}", client_id, session->room_code());
      // Another disconnect path may have torn it down already.
      if (!registry_.remove(session->room_code())) return;
      session->close();
      gateway_.close_room(session->room_code());
      return;
    }
    if (session->remove_participant(client_id)) return;
  }
  spdlog::debug("client {} disconnected without a room", client_id);
}

}  // namespace livequiz::server
