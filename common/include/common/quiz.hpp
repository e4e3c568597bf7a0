#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace livequiz {

// Longest accepted question time limit (one day).
inline constexpr double kMaxTimeLimitSeconds = 24.0 * 60.0 * 60.0;

// Question content is opaque to the session apart from the correct answer
// and the time limit.
struct Question {
  std::string prompt;
  nlohmann::json choices{nlohmann::json::array()};
  nlohmann::json correct_answer;
  double time_limit_seconds{0.0};
};

struct Quiz {
  std::string title;
  std::vector<Question> questions;
};

struct AnswerRecord {
  int question_index{-1};
  nlohmann::json answer;
  bool correct{false};
};

// One player in a room: roster row and leaderboard row share this record.
struct Participant {
  std::string id;
  std::string name;
  int score{0};
  std::vector<AnswerRecord> answers;

  bool has_answered(int question_index) const;
};

// Parse the externally supplied quiz definition. Returns false and fills
// error when a required field is missing or has the wrong type.
bool quiz_from_json(const nlohmann::json& j, Quiz& out, std::string& error);
nlohmann::json quiz_to_json(const Quiz& quiz);

nlohmann::json roster_to_json(const std::vector<Participant>& players);
nlohmann::json leaderboard_entry_to_json(const Participant& p);
nlohmann::json leaderboard_to_json(const std::vector<Participant>& ranked);

}  // namespace livequiz
