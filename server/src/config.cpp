#include "server/config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace livequiz::server {

namespace {

const char* const kEnvKeys[] = {"PORT", "LIVEQUIZ_LOG_LEVEL"};

bool parse_port(const std::string& text, uint16_t& out, std::string* error) {
  std::size_t used = 0;
  long value = 0;
  try {
    value = std::stol(text, &used);
  } catch (const std::exception&) {
    used = 0;
  }
  if (used != text.size() || text.empty() || value <= 0 || value > 65535) {
    if (error) *error = "invalid port: " + text;
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool valid_level(const std::string& level) {
  static const char* const kLevels[] = {"trace", "debug", "info", "warn",
                                        "warning", "error", "err", "critical", "off"};
  for (const char* l : kLevels) {
    if (level == l) return true;
  }
  return false;
}

}  // namespace

std::optional<ServerConfig> parse_config(const std::vector<std::string>& args,
                                         const std::map<std::string, std::string>& env,
                                         std::string* error) {
  ServerConfig cfg;

  auto port_env = env.find("PORT");
  if (port_env != env.end() && !parse_port(port_env->second, cfg.port, error)) {
    return std::nullopt;
  }
  auto level_env = env.find("LIVEQUIZ_LOG_LEVEL");
  if (level_env != env.end()) {
    if (!valid_level(level_env->second)) {
      if (error) *error = "invalid log level: " + level_env->second;
      return std::nullopt;
    }
    cfg.log_level = level_env->second;
  }

  if (args.size() > 2) {
    if (error) *error = "usage: livequiz_server [port] [log_file]";
    return std::nullopt;
  }
  if (!args.empty() && !parse_port(args[0], cfg.port, error)) return std::nullopt;
  if (args.size() > 1) {
    if (args[1].empty()) {
      if (error) *error = "log file path is empty";
      return std::nullopt;
    }
    cfg.log_file = args[1];
  }
  return cfg;
}

std::optional<ServerConfig> load_config(int argc, char** argv, std::string* error) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  std::map<std::string, std::string> env;
  for (const char* key : kEnvKeys) {
    if (const char* value = std::getenv(key)) env.emplace(key, value);
  }
  return parse_config(args, env, error);
}

}  // namespace livequiz::server
