#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "common/quiz.hpp"

namespace livequiz::server {

// Authored question sets keyed by quiz id. Entries are immutable once added;
// readers hold a shared_ptr so removal never invalidates content in use.
class QuizCatalog {
 public:
  QuizCatalog() = default;

  QuizCatalog(const QuizCatalog&) = delete;
  QuizCatalog& operator=(const QuizCatalog&) = delete;

  // Stores the quiz under a fresh id and returns that id.
  std::string add(Quiz quiz);
  std::shared_ptr<const Quiz> find(const std::string& quiz_id) const;
  bool remove(const std::string& quiz_id);
  std::size_t size() const;

 private:
  std::string next_id_locked();

  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<const Quiz>> quizzes_;
  std::uint64_t seq_{0};
};

}  // namespace livequiz::server
