#pragma once

#include <optional>
#include <string>

#include "core/tool_dispatcher.hpp"
#include "nlohmann/json.hpp"

namespace sda {

inline constexpr char kServerName[] = "sda-mcp-server";
inline constexpr char kDefaultProtocolVersion[] = "2024-11-05";

namespace rpc {
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;
}  // namespace rpc

nlohmann::json MakeResultPayload(const nlohmann::json& id, const nlohmann::json& result);
nlohmann::json MakeErrorPayload(const nlohmann::json& id, int code, const std::string& message);

// JSON-RPC 2.0 front end for the tool dispatcher. Stateless apart from the
// exit flag, so HandleMessage may run on several threads at once.
class McpServer {
 public:
  McpServer(const ToolDispatcher& dispatcher, std::string version);

  // Returns the reply, or std::nullopt for notifications.
  std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message) const;

  static bool IsToolCall(const nlohmann::json& message);
  static bool IsExit(const nlohmann::json& message);

 private:
  nlohmann::json Initialize(const nlohmann::json& params) const;
  nlohmann::json CallTool(const nlohmann::json& id, const nlohmann::json& params) const;

  const ToolDispatcher& dispatcher_;
  std::string version_;
};

}  // namespace sda
