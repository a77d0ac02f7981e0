#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sda::logging {

enum class LogLevel { kError = 0, kWarn, kInfo, kDebug };

std::optional<LogLevel> ParseLogLevel(std::string value);
std::string_view LogLevelToString(LogLevel level);

void SetLogLevel(LogLevel level);

// Every line goes to stderr. stdout belongs to the MCP channel.
void Log(LogLevel level, const std::string& message);
void LogInfo(const std::string& message);
void LogWarn(const std::string& message);
void LogError(const std::string& message);
void LogDebug(const std::string& message);

}  // namespace sda::logging
