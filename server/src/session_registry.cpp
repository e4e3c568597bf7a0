#include "server/session_registry.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace livequiz::server {

namespace {
constexpr char kCodeAlphabet[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
}  // namespace

RoomCodeGenerator SessionRegistry::random_generator(std::uint32_t seed) {
  auto rng = std::make_shared<std::mt19937>(seed);
  return [rng](std::size_t length) {
    std::uniform_int_distribution<std::size_t> dist(0, sizeof(kCodeAlphabet) - 2);
    std::string code;
    code.reserve(length);
    for (std::size_t i = 0; i < length; ++i) code.push_back(kCodeAlphabet[dist(*rng)]);
    return code;
  };
}

SessionRegistry::SessionRegistry(QuizCatalog& catalog,
                                 BroadcastGateway& gateway,
                                 Scheduler& scheduler,
                                 SessionOptions options,
                                 RoomCodeGenerator generator)
    : catalog_(catalog),
      gateway_(gateway),
      scheduler_(scheduler),
      options_(options),
      generator_(generator ? std::move(generator) : random_generator(std::random_device{}())) {}

std::string SessionRegistry::normalize_code(const std::string& room_code) {
  std::string out = room_code;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

std::string SessionRegistry::unique_code_locked() {
  std::size_t length = kRoomCodeLength;
  int attempts = 0;
  while (true) {
    std::string code = normalize_code(generator_(length));
    if (!code.empty() && sessions_.find(code) == sessions_.end()) return code;
    spdlog::debug("room code {} collided, retrying", code);
    if (++attempts >= kRoomCodeAttemptsPerLength) {
      attempts = 0;
      ++length;
    }
  }
}

CreatedSession SessionRegistry::create_session(Quiz quiz, const std::string& host_id) {
  std::lock_guard<std::mutex> lock(mtx_);
  CreatedSession created;
  created.room_code = unique_code_locked();
  created.quiz_id = catalog_.add(std::move(quiz));
  created.session = std::make_shared<Session>(created.room_code, created.quiz_id,
                                              catalog_.find(created.quiz_id), host_id,
                                              gateway_, scheduler_, options_);
  sessions_.emplace(created.room_code, created.session);
  return created;
}

std::shared_ptr<Session> SessionRegistry::lookup(const std::string& room_code) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = sessions_.find(normalize_code(room_code));
  if (it == sessions_.end()) return nullptr;
  return it->second;
}

std::shared_ptr<Session> SessionRegistry::remove(const std::string& room_code) {
  std::shared_ptr<Session> session;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = sessions_.find(normalize_code(room_code));
    if (it == sessions_.end()) return nullptr;
    session = std::move(it->second);
    sessions_.erase(it);
  }
  catalog_.remove(session->quiz_id());
  return session;
}

std::vector<std::shared_ptr<Session>> SessionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<std::shared_ptr<Session>> out;
  out.reserve(sessions_.size());
  for (const auto& kv : sessions_) out.push_back(kv.second);
  return out;
}

std::size_t SessionRegistry::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return sessions_.size();
}

}  // namespace livequiz::server
