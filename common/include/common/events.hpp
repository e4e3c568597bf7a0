#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/message.hpp"
#include "common/quiz.hpp"

namespace livequiz {

namespace actions {
// Host -> server
inline constexpr const char* kCreateQuiz = "createQuiz";
inline constexpr const char* kStartQuiz = "startQuiz";
inline constexpr const char* kNextQuestion = "nextQuestion";
// Player -> server
inline constexpr const char* kJoinQuiz = "joinQuiz";
inline constexpr const char* kSubmitAnswer = "submitAnswer";
// Server -> client
inline constexpr const char* kQuizCreated = "quizCreated";
inline constexpr const char* kJoinedRoom = "joinedRoom";
inline constexpr const char* kJoinError = "joinError";
inline constexpr const char* kScoreUpdate = "scoreUpdate";
inline constexpr const char* kUpdateLeaderboard = "updateLeaderboard";
inline constexpr const char* kNewQuestion = "newQuestion";
inline constexpr const char* kQuestionTimeout = "questionTimeout";
inline constexpr const char* kQuizFinished = "quizFinished";
inline constexpr const char* kPlayerJoined = "playerJoined";
inline constexpr const char* kHostDisconnected = "hostDisconnected";
}  // namespace actions

// ----- Inbound requests -----

struct CreateQuizRequest {
  Quiz quiz;

  Message to_message() const;
  static std::optional<CreateQuizRequest> from_message(const Message& msg, std::string& error);
};

// startQuiz / nextQuestion carry only the room code.
struct RoomCommand {
  std::string action;
  std::string room_code;

  Message to_message() const;
  static std::optional<RoomCommand> from_message(const Message& msg, std::string& error);
};

struct JoinQuizRequest {
  std::string room_code;
  std::string name;

  Message to_message() const;
  static std::optional<JoinQuizRequest> from_message(const Message& msg, std::string& error);
};

struct SubmitAnswerRequest {
  std::string room_code;
  nlohmann::json answer;

  Message to_message() const;
  static std::optional<SubmitAnswerRequest> from_message(const Message& msg, std::string& error);
};

// ----- Outbound events -----

struct QuizCreated {
  std::string room_code;
  std::string quiz_id;
  Message to_message() const;
};

struct JoinedRoom {
  std::string room_code;
  std::string quiz_title;
  std::vector<Participant> players;
  Message to_message() const;
};

struct JoinError {
  std::string message;
  Message to_message() const;
};

struct ScoreUpdate {
  int score{0};
  Message to_message() const;
};

// Host-only live ranking; entries are already sorted.
struct UpdateLeaderboard {
  std::vector<Participant> ranked;
  Message to_message() const;
};

struct NewQuestion {
  int index{0};
  int total{0};
  Question question;
  Message to_message() const;
};

struct QuestionTimeout {
  nlohmann::json correct_answer;
  std::vector<Participant> results;
  Message to_message() const;
};

struct QuizFinished {
  std::vector<Participant> ranked;
  Message to_message() const;
};

struct PlayerJoined {
  std::vector<Participant> players;
  std::string quiz_title;
  Message to_message() const;
};

struct HostDisconnected {
  Message to_message() const;
};

}  // namespace livequiz
