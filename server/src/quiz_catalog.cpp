#include "server/quiz_catalog.hpp"

#include <chrono>

namespace livequiz::server {

std::string QuizCatalog::next_id_locked() {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
  return "quiz-" + std::to_string(ms) + "-" + std::to_string(++seq_);
}

std::string QuizCatalog::add(Quiz quiz) {
  std::lock_guard<std::mutex> lock(mtx_);
  std::string id = next_id_locked();
  quizzes_.emplace(id, std::make_shared<const Quiz>(std::move(quiz)));
  return id;
}

std::shared_ptr<const Quiz> QuizCatalog::find(const std::string& quiz_id) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = quizzes_.find(quiz_id);
  if (it == quizzes_.end()) return nullptr;
  return it->second;
}

bool QuizCatalog::remove(const std::string& quiz_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  return quizzes_.erase(quiz_id) > 0;
}

std::size_t QuizCatalog::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return quizzes_.size();
}

}  // namespace livequiz::server
