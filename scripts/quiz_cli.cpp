// Terminal driver for a livequiz server, acting as host or as player.
//
//   quiz_cli <host> <port> host <quiz.json>
//   quiz_cli <host> <port> play <ROOM> <name>

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "client/core.hpp"
#include "common/events.hpp"

using livequiz::Message;
using livequiz::Status;
using livequiz::client::ClientCore;
namespace actions = livequiz::actions;

namespace {

std::mutex g_room_mtx;
std::string g_room_code;

void print_event(const Message& m) {
  if (m.status == Status::Error) {
    std::cout << "! " << m.action << " failed: " << m.error_code << " " << m.error_message << "\n";
    return;
  }
  if (m.action == actions::kQuizCreated) {
    std::lock_guard<std::mutex> lock(g_room_mtx);
    g_room_code = m.data.value("roomCode", "");
    std::cout << "room code: " << g_room_code << "  (type 'start', 'next' or 'quit')\n";
    return;
  }
  if (m.action == actions::kNewQuestion) {
    std::cout << "\nQ" << m.data.value("index", 0) + 1 << "/" << m.data.value("total", 0) << ": "
              << m.data.value("prompt", "") << "\n";
    if (m.data.contains("choices")) {
      for (const auto& c : m.data["choices"]) std::cout << "  - " << c.dump() << "\n";
    }
    return;
  }
  std::cout << "< " << m.action << " " << m.data.dump() << "\n";
}

bool send(ClientCore& core, const Message& msg) {
  std::string err;
  if (!core.send_message(msg, err)) {
    std::cerr << "send failed: " << err << "\n";
    return false;
  }
  return true;
}

int run_host(ClientCore& core, const std::string& quiz_path) {
  std::ifstream in(quiz_path);
  if (!in) {
    std::cerr << "cannot open " << quiz_path << "\n";
    return 1;
  }
  nlohmann::json raw = nlohmann::json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (raw.is_discarded()) {
    std::cerr << quiz_path << ": not valid JSON\n";
    return 1;
  }
  livequiz::CreateQuizRequest req;
  std::string err;
  if (!livequiz::quiz_from_json(raw, req.quiz, err)) {
    std::cerr << quiz_path << ": " << err << "\n";
    return 1;
  }
  if (!send(core, req.to_message())) return 1;

  std::string line;
  while (core.is_connected() && std::getline(std::cin, line)) {
    if (line == "quit") break;
    std::string room;
    {
      std::lock_guard<std::mutex> lock(g_room_mtx);
      room = g_room_code;
    }
    if (room.empty()) {
      std::cout << "waiting for room code...\n";
      continue;
    }
    if (line == "start") {
      send(core, livequiz::RoomCommand{actions::kStartQuiz, room}.to_message());
    } else if (line == "next") {
      send(core, livequiz::RoomCommand{actions::kNextQuestion, room}.to_message());
    } else if (!line.empty()) {
      std::cout << "commands: start, next, quit\n";
    }
  }
  return 0;
}

int run_player(ClientCore& core, const std::string& room, const std::string& name) {
  if (!send(core, livequiz::JoinQuizRequest{room, name}.to_message())) return 1;

  std::string line;
  while (core.is_connected() && std::getline(std::cin, line)) {
    if (line == "quit") break;
    if (line.empty()) continue;
    // Numbers and quoted strings go out as typed; anything else as plain text.
    nlohmann::json answer = nlohmann::json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (answer.is_discarded()) answer = line;
    send(core, livequiz::SubmitAnswerRequest{room, answer}.to_message());
  }
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 5) {
    std::cerr << "Usage: " << argv[0] << " <host> <port> host <quiz.json>\n"
              << "       " << argv[0] << " <host> <port> play <ROOM> <name>\n";
    return 1;
  }
  const std::string host = argv[1];
  int port = 0;
  try {
    port = std::stoi(argv[2]);
  } catch (const std::exception&) {
    port = 0;
  }
  if (port <= 0 || port > 65535) {
    std::cerr << "invalid port: " << argv[2] << "\n";
    return 1;
  }
  const std::string mode = argv[3];

  ClientCore core;
  std::string err;
  if (!core.connect(host, static_cast<uint16_t>(port), err)) {
    std::cerr << err << "\n";
    return 1;
  }

  std::atomic<bool> done{false};
  std::thread printer([&core, &done] {
    while (!done.load()) {
      if (auto ev = core.wait_event(std::chrono::milliseconds(200))) {
        print_event(*ev);
        if (ev->action == actions::kHostDisconnected) std::cout << "host left, type 'quit'\n";
      } else if (!core.is_connected()) {
        break;
      }
    }
  });

  int rc = 1;
  if (mode == "host") {
    rc = run_host(core, argv[4]);
  } else if (mode == "play" && argc >= 6) {
    rc = run_player(core, argv[4], argv[5]);
  } else {
    std::cerr << "unknown mode " << mode << "\n";
  }

  done.store(true);
  core.disconnect();
  if (printer.joinable()) printer.join();
  return rc;
}
