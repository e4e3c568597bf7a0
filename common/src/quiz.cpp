#include "common/quiz.hpp"

#include <algorithm>
#include <cmath>

namespace livequiz {

bool Participant::has_answered(int question_index) const {
  return std::any_of(answers.begin(), answers.end(), [question_index](const AnswerRecord& a) {
    return a.question_index == question_index;
  });
}

namespace {

bool question_from_json(const nlohmann::json& j, std::size_t index, Question& out,
                        std::string& error) {
  const std::string where = "questions[" + std::to_string(index) + "]";
  if (!j.is_object()) {
    error = where + " must be an object";
    return false;
  }
  if (!j.contains("prompt") || !j["prompt"].is_string()) {
    error = where + ".prompt missing or not string";
    return false;
  }
  out.prompt = j["prompt"].get<std::string>();

  if (j.contains("choices")) out.choices = j["choices"];

  if (!j.contains("correctAnswer") || j["correctAnswer"].is_null()) {
    error = where + ".correctAnswer missing";
    return false;
  }
  out.correct_answer = j["correctAnswer"];

  // The browser front end sends "timeLimit"; "timeLimitSeconds" is accepted too.
  const char* limit_key = j.contains("timeLimit") ? "timeLimit" : "timeLimitSeconds";
  if (!j.contains(limit_key) || !j[limit_key].is_number()) {
    error = where + ".timeLimit missing or not number";
    return false;
  }
  out.time_limit_seconds = j[limit_key].get<double>();
  if (!std::isfinite(out.time_limit_seconds) || out.time_limit_seconds <= 0.0) {
    error = where + ".timeLimit must be positive";
    return false;
  }
  if (out.time_limit_seconds > kMaxTimeLimitSeconds) {
    error = where + ".timeLimit exceeds 86400 seconds";
    return false;
  }
  return true;
}

}  // namespace

bool quiz_from_json(const nlohmann::json& j, Quiz& out, std::string& error) {
  if (!j.is_object()) {
    error = "quiz must be a JSON object";
    return false;
  }
  if (!j.contains("title") || !j["title"].is_string()) {
    error = "title missing or not string";
    return false;
  }
  if (!j.contains("questions") || !j["questions"].is_array()) {
    error = "questions missing or not array";
    return false;
  }

  Quiz quiz;
  quiz.title = j["title"].get<std::string>();
  const auto& questions = j["questions"];
  quiz.questions.reserve(questions.size());
  for (std::size_t i = 0; i < questions.size(); ++i) {
    Question q;
    if (!question_from_json(questions[i], i, q, error)) return false;
    quiz.questions.push_back(std::move(q));
  }
  out = std::move(quiz);
  return true;
}

nlohmann::json quiz_to_json(const Quiz& quiz) {
  nlohmann::json questions = nlohmann::json::array();
  for (const auto& q : quiz.questions) {
    questions.push_back({{"prompt", q.prompt},
                         {"choices", q.choices},
                         {"correctAnswer", q.correct_answer},
                         {"timeLimit", q.time_limit_seconds}});
  }
  return {{"title", quiz.title}, {"questions", questions}};
}

nlohmann::json roster_to_json(const std::vector<Participant>& players) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& p : players) {
    arr.push_back({{"id", p.id}, {"name", p.name}, {"score", p.score}});
  }
  return arr;
}

nlohmann::json leaderboard_entry_to_json(const Participant& p) {
  nlohmann::json answers = nlohmann::json::array();
  for (const auto& a : p.answers) {
    answers.push_back({{"question", a.question_index}, {"answer", a.answer}, {"correct", a.correct}});
  }
  return {{"id", p.id}, {"name", p.name}, {"score", p.score}, {"answers", answers}};
}

nlohmann::json leaderboard_to_json(const std::vector<Participant>& ranked) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& p : ranked) arr.push_back(leaderboard_entry_to_json(p));
  return arr;
}

}  // namespace livequiz
