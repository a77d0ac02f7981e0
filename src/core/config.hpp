#pragma once

#include <string>
#include <vector>

#include "core/logging.hpp"

namespace sda {

inline constexpr char kDefaultBaseUrl[] = "https://api.sudandigitalarchive.com/sda-api";
inline constexpr int kDefaultTimeoutSeconds = 30;

// Process-wide settings. Built once at startup and never mutated.
struct BridgeConfig {
  std::string api_key;
  std::string base_url = kDefaultBaseUrl;
  int timeout_seconds = kDefaultTimeoutSeconds;
  logging::LogLevel log_level = logging::LogLevel::kInfo;
  bool show_help = false;
  bool show_version = false;
};

// Reads API_KEY / SDA_MCP_* from the environment, then applies command-line
// flags on top. Throws std::invalid_argument on a malformed or missing value.
BridgeConfig LoadBridgeConfig(const std::vector<std::string>& args);
BridgeConfig LoadBridgeConfig(int argc, char** argv);

std::string UsageText(const std::string& program);

}  // namespace sda
