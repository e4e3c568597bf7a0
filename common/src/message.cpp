#include "common/message.hpp"

#include <chrono>

namespace livequiz {

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::Request:
      return "REQUEST";
    case MessageType::Response:
      return "RESPONSE";
    case MessageType::Notification:
      return "NOTIFICATION";
  }
  return "REQUEST";
}

std::string to_string(Status status) {
  switch (status) {
    case Status::None:
      return "";
    case Status::Success:
      return "SUCCESS";
    case Status::Error:
      return "ERROR";
  }
  return "";
}

std::optional<MessageType> message_type_from_string(const std::string& value) {
  if (value == "REQUEST") return MessageType::Request;
  if (value == "RESPONSE") return MessageType::Response;
  if (value == "NOTIFICATION") return MessageType::Notification;
  return std::nullopt;
}

std::optional<Status> status_from_string(const std::string& value) {
  if (value.empty()) return Status::None;
  if (value == "SUCCESS") return Status::Success;
  if (value == "ERROR") return Status::Error;
  return std::nullopt;
}

namespace {

// Reads an optional string field; returns false if present with the wrong type.
bool read_optional_string(const nlohmann::json& j, const char* key,
                          std::string& out, std::string& error) {
  auto it = j.find(key);
  if (it == j.end()) return true;
  if (!it->is_string()) {
    error = std::string(key) + " must be string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

}  // namespace

std::optional<Message> message_from_json(const nlohmann::json& j, std::string& error) {
  if (!j.is_object()) {
    error = "Message must be a JSON object";
    return std::nullopt;
  }

  Message msg;

  auto mt_it = j.find("message_type");
  if (mt_it == j.end() || !mt_it->is_string()) {
    error = "message_type missing or not string";
    return std::nullopt;
  }
  auto mt = message_type_from_string(mt_it->get<std::string>());
  if (!mt) {
    error = "invalid message_type";
    return std::nullopt;
  }
  msg.type = *mt;

  auto action_it = j.find("action");
  if (action_it == j.end() || !action_it->is_string() ||
      action_it->get<std::string>().empty()) {
    error = "action missing or empty";
    return std::nullopt;
  }
  msg.action = action_it->get<std::string>();

  // Browser-side clients may omit the timestamp; the server stamps its own.
  auto ts_it = j.find("timestamp");
  if (ts_it != j.end()) {
    if (!ts_it->is_number_unsigned()) {
      error = "timestamp must be unsigned number";
      return std::nullopt;
    }
    msg.timestamp = ts_it->get<std::uint64_t>();
  }

  auto data_it = j.find("data");
  if (data_it != j.end() && !data_it->is_null()) {
    msg.data = *data_it;
  }

  std::string status_text;
  if (!read_optional_string(j, "status", status_text, error)) return std::nullopt;
  auto st = status_from_string(status_text);
  if (!st) {
    error = "invalid status";
    return std::nullopt;
  }
  msg.status = *st;

  if (!read_optional_string(j, "error_code", msg.error_code, error)) return std::nullopt;
  if (!read_optional_string(j, "error_message", msg.error_message, error)) return std::nullopt;

  if (msg.type == MessageType::Response && msg.status == Status::None) {
    error = "response requires status";
    return std::nullopt;
  }

  return msg;
}

nlohmann::json message_to_json(const Message& msg) {
  nlohmann::json j;
  j["message_type"] = to_string(msg.type);
  j["action"] = msg.action;
  j["timestamp"] = msg.timestamp;
  j["data"] = msg.data;
  if (msg.status != Status::None) j["status"] = to_string(msg.status);
  if (!msg.error_code.empty()) j["error_code"] = msg.error_code;
  if (!msg.error_message.empty()) j["error_message"] = msg.error_message;
  return j;
}

std::uint64_t now_seconds() {
  using namespace std::chrono;
  return static_cast<std::uint64_t>(
      duration_cast<seconds>(system_clock::now().time_since_epoch()).count());
}

Message make_notification(const std::string& action, nlohmann::json data) {
  Message msg;
  msg.type = MessageType::Notification;
  msg.action = action;
  msg.timestamp = now_seconds();
  msg.data = std::move(data);
  return msg;
}

Message make_error_response(const std::string& action,
                            const std::string& code,
                            const std::string& message) {
  Message resp;
  resp.type = MessageType::Response;
  resp.action = action;
  resp.timestamp = now_seconds();
  resp.status = Status::Error;
  resp.error_code = code;
  resp.error_message = message;
  return resp;
}

}  // namespace livequiz
