#include "common/events.hpp"

namespace livequiz {
namespace {

Message make_request(const std::string& action, nlohmann::json data) {
  Message msg;
  msg.type = MessageType::Request;
  msg.action = action;
  msg.timestamp = now_seconds();
  msg.data = std::move(data);
  return msg;
}

bool read_room_code(const nlohmann::json& data, std::string& out, std::string& error) {
  if (!data.is_object() || !data.contains("roomCode") || !data["roomCode"].is_string()) {
    error = "roomCode missing or not string";
    return false;
  }
  out = data["roomCode"].get<std::string>();
  if (out.empty()) {
    error = "roomCode empty";
    return false;
  }
  return true;
}

}  // namespace

Message CreateQuizRequest::to_message() const {
  return make_request(actions::kCreateQuiz, quiz_to_json(quiz));
}

std::optional<CreateQuizRequest> CreateQuizRequest::from_message(const Message& msg,
                                                                 std::string& error) {
  CreateQuizRequest req;
  if (!quiz_from_json(msg.data, req.quiz, error)) return std::nullopt;
  return req;
}

Message RoomCommand::to_message() const {
  return make_request(action, {{"roomCode", room_code}});
}

std::optional<RoomCommand> RoomCommand::from_message(const Message& msg, std::string& error) {
  RoomCommand cmd;
  cmd.action = msg.action;
  // The host page sends the bare room code as the payload.
  if (msg.data.is_string()) {
    cmd.room_code = msg.data.get<std::string>();
    if (cmd.room_code.empty()) {
      error = "roomCode empty";
      return std::nullopt;
    }
    return cmd;
  }
  if (!read_room_code(msg.data, cmd.room_code, error)) return std::nullopt;
  return cmd;
}

Message JoinQuizRequest::to_message() const {
  return make_request(actions::kJoinQuiz, {{"roomCode", room_code}, {"name", name}});
}

std::optional<JoinQuizRequest> JoinQuizRequest::from_message(const Message& msg,
                                                             std::string& error) {
  JoinQuizRequest req;
  if (!read_room_code(msg.data, req.room_code, error)) return std::nullopt;
  if (!msg.data.contains("name") || !msg.data["name"].is_string()) {
    error = "name missing or not string";
    return std::nullopt;
  }
  req.name = msg.data["name"].get<std::string>();
  return req;
}

Message SubmitAnswerRequest::to_message() const {
  return make_request(actions::kSubmitAnswer, {{"roomCode", room_code}, {"answer", answer}});
}

std::optional<SubmitAnswerRequest> SubmitAnswerRequest::from_message(const Message& msg,
                                                                     std::string& error) {
  SubmitAnswerRequest req;
  if (!read_room_code(msg.data, req.room_code, error)) return std::nullopt;
  if (!msg.data.contains("answer")) {
    error = "answer missing";
    return std::nullopt;
  }
  req.answer = msg.data["answer"];
  return req;
}

Message QuizCreated::to_message() const {
  return make_notification(actions::kQuizCreated, {{"roomCode", room_code}, {"quizId", quiz_id}});
}

Message JoinedRoom::to_message() const {
  return make_notification(actions::kJoinedRoom, {{"roomCode", room_code},
                                                  {"quizTitle", quiz_title},
                                                  {"players", roster_to_json(players)}});
}

Message JoinError::to_message() const {
  return make_notification(actions::kJoinError, message);
}

Message ScoreUpdate::to_message() const {
  return make_notification(actions::kScoreUpdate, score);
}

Message UpdateLeaderboard::to_message() const {
  return make_notification(actions::kUpdateLeaderboard, leaderboard_to_json(ranked));
}

Message NewQuestion::to_message() const {
  return make_notification(actions::kNewQuestion, {{"index", index},
                                                   {"total", total},
                                                   {"prompt", question.prompt},
                                                   {"choices", question.choices},
                                                   {"timeLimit", question.time_limit_seconds}});
}

Message QuestionTimeout::to_message() const {
  nlohmann::json by_id = nlohmann::json::object();
  for (const auto& p : results) by_id[p.id] = leaderboard_entry_to_json(p);
  return make_notification(actions::kQuestionTimeout,
                           {{"correctAnswer", correct_answer}, {"results", by_id}});
}

Message QuizFinished::to_message() const {
  return make_notification(actions::kQuizFinished, leaderboard_to_json(ranked));
}

Message PlayerJoined::to_message() const {
  return make_notification(actions::kPlayerJoined,
                           {{"players", roster_to_json(players)}, {"quizTitle", quiz_title}});
}

Message HostDisconnected::to_message() const {
  return make_notification(actions::kHostDisconnected, nlohmann::json::object());
}

}  // namespace livequiz
