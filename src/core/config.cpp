#include "core/config.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>

namespace sda {
namespace {

std::optional<std::string> GetEnv(const char* key) {
  if (const char* value = std::getenv(key)) {
    return std::string{value};
  }
  return std::nullopt;
}

int ParseTimeout(const std::string& value) {
  int parsed = 0;
  try {
    std::size_t consumed = 0;
    parsed = std::stoi(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument("trailing characters");
    }
  } catch (const std::exception&) {
    throw std::invalid_argument("Timeout must be an integer number of seconds: " + value);
  }
  if (parsed <= 0 || parsed > 3600) {
    throw std::invalid_argument("Timeout must be between 1 and 3600 seconds: " + value);
  }
  return parsed;
}

logging::LogLevel ParseLevelOrThrow(const std::string& value) {
  const auto level = logging::ParseLogLevel(value);
  if (!level) {
    throw std::invalid_argument("Unknown log level: " + value);
  }
  return *level;
}

}  // namespace

BridgeConfig LoadBridgeConfig(const std::vector<std::string>& args) {
  BridgeConfig config;
  if (auto key = GetEnv("API_KEY")) {
    config.api_key = *key;
  }
  if (auto base_url = GetEnv("SDA_MCP_BASE_URL")) {
    config.base_url = *base_url;
  }
  if (auto timeout = GetEnv("SDA_MCP_TIMEOUT")) {
    config.timeout_seconds = ParseTimeout(*timeout);
  }
  if (auto level = GetEnv("SDA_MCP_LOG_LEVEL")) {
    config.log_level = ParseLevelOrThrow(*level);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string flag = args[i];
    std::optional<std::string> inline_value;
    if (const auto eq = flag.find('='); flag.rfind("--", 0) == 0 && eq != std::string::npos) {
      inline_value = flag.substr(eq + 1);
      flag = flag.substr(0, eq);
    }

    if (flag == "--help" || flag == "-h") {
      config.show_help = true;
      continue;
    }
    if (flag == "--version" || flag == "-V") {
      config.show_version = true;
      continue;
    }

    auto take_value = [&]() -> std::string {
      if (inline_value) {
        return *inline_value;
      }
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("Missing value for " + flag);
      }
      return args[++i];
    };

    if (flag == "--api-key") {
      config.api_key = take_value();
    } else if (flag == "--base-url") {
      config.base_url = take_value();
    } else if (flag == "--timeout") {
      config.timeout_seconds = ParseTimeout(take_value());
    } else if (flag == "--log-level") {
      config.log_level = ParseLevelOrThrow(take_value());
    } else {
      throw std::invalid_argument("Unknown argument: " + args[i]);
    }
  }

  if (config.show_help || config.show_version) {
    return config;
  }
  if (config.api_key.empty()) {
    throw std::invalid_argument("An API key is required (--api-key or API_KEY)");
  }
  while (!config.base_url.empty() && config.base_url.back() == '/') {
    config.base_url.pop_back();
  }
  if (config.base_url.empty()) {
    throw std::invalid_argument("Base URL must not be empty");
  }
  return config;
}

BridgeConfig LoadBridgeConfig(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return LoadBridgeConfig(args);
}

std::string UsageText(const std::string& program) {
  return "Usage: " + program +
         " [options]\n"
         "\n"
         "MCP server exposing the Sudan Digital Archive API over stdio.\n"
         "\n"
         "Options:\n"
         "  --api-key <key>      API key for the archive (env: API_KEY, required)\n"
         "  --base-url <url>     Archive API base URL (env: SDA_MCP_BASE_URL)\n"
         "                       default: " +
         std::string{kDefaultBaseUrl} +
         "\n"
         "  --timeout <seconds>  Per-request timeout (env: SDA_MCP_TIMEOUT, default 30)\n"
         "  --log-level <level>  error|warn|info|debug (env: SDA_MCP_LOG_LEVEL)\n"
         "  -h, --help           Show this help\n"
         "  -V, --version        Show version\n";
}

}  // namespace sda
