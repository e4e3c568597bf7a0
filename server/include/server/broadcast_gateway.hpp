#pragma once

#include <string>

#include "common/message.hpp"

namespace livequiz::server {

// Delivery primitives the session layer needs from the transport.
// Implementations must tolerate unknown rooms and identities (no-op).
class BroadcastGateway {
 public:
  virtual ~BroadcastGateway() = default;

  virtual void subscribe(const std::string& room, const std::string& client_id) = 0;
  virtual void unsubscribe(const std::string& room, const std::string& client_id) = 0;
  // Drops every membership of the room.
  virtual void close_room(const std::string& room) = 0;

  virtual void broadcast(const std::string& room, const Message& msg) = 0;
  virtual void send_to(const std::string& client_id, const Message& msg) = 0;
};

}  // namespace livequiz::server
