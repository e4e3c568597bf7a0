#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace livequiz::server {

struct ServerConfig {
  std::string host{"0.0.0.0"};
  uint16_t port{3000};
  std::size_t workers{4};
  std::string log_file{"logs/livequiz.log"};
  std::string log_level{"info"};
  std::chrono::milliseconds grace_delay{2500};
};

// Builds the config from defaults, then `env` (PORT, LIVEQUIZ_LOG_LEVEL),
// then positional `args` ([port] [log_file], program name excluded).
std::optional<ServerConfig> parse_config(const std::vector<std::string>& args,
                                         const std::map<std::string, std::string>& env,
                                         std::string* error = nullptr);

// parse_config over the real process arguments and environment.
std::optional<ServerConfig> load_config(int argc, char** argv, std::string* error = nullptr);

}  // namespace livequiz::server
