#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/quiz.hpp"
#include "server/broadcast_gateway.hpp"
#include "server/quiz_catalog.hpp"
#include "server/scheduler.hpp"
#include "server/session.hpp"

namespace livequiz::server {

constexpr std::size_t kRoomCodeLength = 4;
// Consecutive collisions tolerated before codes grow by one character.
constexpr int kRoomCodeAttemptsPerLength = 32;

// Produces a candidate room code of the requested length.
using RoomCodeGenerator = std::function<std::string(std::size_t length)>;

struct CreatedSession {
  std::string room_code;
  std::string quiz_id;
  std::shared_ptr<Session> session;
};

// Owns every live Session (one per room code) together with its quiz in
// the catalog. The registry lock only guards the map; session state has its
// own lock.
class SessionRegistry {
 public:
  SessionRegistry(QuizCatalog& catalog,
                  BroadcastGateway& gateway,
                  Scheduler& scheduler,
                  SessionOptions options = {},
                  RoomCodeGenerator generator = {});

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  CreatedSession create_session(Quiz quiz, const std::string& host_id);

  // Room codes are case-insensitive.
  std::shared_ptr<Session> lookup(const std::string& room_code) const;

  // Detaches the session and deletes its quiz. Returns the detached session
  // so the caller can finish teardown outside the registry lock.
  std::shared_ptr<Session> remove(const std::string& room_code);

  std::vector<std::shared_ptr<Session>> snapshot() const;
  std::size_t size() const;

  static std::string normalize_code(const std::string& room_code);
  static RoomCodeGenerator random_generator(std::uint32_t seed);

 private:
  std::string unique_code_locked();

  QuizCatalog& catalog_;
  BroadcastGateway& gateway_;
  Scheduler& scheduler_;
  const SessionOptions options_;
  RoomCodeGenerator generator_;

  mutable std::mutex mtx_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
};

}  // namespace livequiz::server
