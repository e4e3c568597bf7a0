#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "common/events.hpp"
#include "server/config.hpp"
#include "server/quiz_catalog.hpp"
#include "server/quiz_service.hpp"
#include "server/scheduler.hpp"
#include "server/server.hpp"
#include "server/session_registry.hpp"

using livequiz::Message;
using livequiz::server::QuizCatalog;
using livequiz::server::QuizService;
using livequiz::server::Server;
using livequiz::server::ServerConfig;
using livequiz::server::SessionOptions;
using livequiz::server::SessionRegistry;
using livequiz::server::ThreadScheduler;
namespace actions = livequiz::actions;

namespace {
std::atomic<bool> g_stop{false};

void signal_handler(int) {
  g_stop.store(true);
}

bool setup_logging(const ServerConfig& cfg) {
  try {
    auto parent = std::filesystem::path(cfg.log_file).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        cfg.log_file, 1024 * 1024 * 5, 3));
    auto logger = std::make_shared<spdlog::logger>("livequiz", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
  } catch (const std::exception& ex) {
    std::cerr << "[server] logging setup failed: " << ex.what() << "\n";
    return false;
  }
  spdlog::set_level(spdlog::level::from_str(cfg.log_level));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
  spdlog::flush_on(spdlog::level::warn);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  std::string error;
  auto cfg = livequiz::server::load_config(argc, argv, &error);
  if (!cfg) {
    std::cerr << "[server] " << error << "\n";
    return 1;
  }
  if (!setup_logging(*cfg)) return 1;

  ThreadScheduler scheduler;
  QuizCatalog catalog;
  Server server(cfg->host, cfg->port, cfg->workers);
  SessionOptions options;
  options.grace_delay = cfg->grace_delay;
  SessionRegistry registry(catalog, server, scheduler, options);
  QuizService service(registry, server);

  server.register_handler(actions::kCreateQuiz, [&service](const std::string& id, const Message& m) {
    service.create_quiz(id, m);
  });
  server.register_handler(actions::kStartQuiz, [&service](const std::string& id, const Message& m) {
    service.start_quiz(id, m);
  });
  server.register_handler(actions::kNextQuestion, [&service](const std::string& id, const Message& m) {
    service.next_question(id, m);
  });
  server.register_handler(actions::kJoinQuiz, [&service](const std::string& id, const Message& m) {
    service.join_quiz(id, m);
  });
  server.register_handler(actions::kSubmitAnswer, [&service](const std::string& id, const Message& m) {
    service.submit_answer(id, m);
  });
  server.set_disconnect_handler([&service](const std::string& id) { service.disconnect(id); });

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  if (!server.start()) {
    spdlog::critical("failed to listen on {}:{}", cfg->host, cfg->port);
    return 1;
  }
  spdlog::info("livequiz server listening on {}:{}. Press Ctrl+C to stop.", cfg->host, cfg->port);

  while (!g_stop.load()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  // Stop timers before the transport so no fire races a closing socket.
  scheduler.shutdown();
  server.stop();
  spdlog::info("server stopped with {} live room(s) discarded", registry.size());
  spdlog::shutdown();
  return 0;
}
