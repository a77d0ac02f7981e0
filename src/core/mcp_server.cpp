#include "core/mcp_server.hpp"

#include <stdexcept>
#include <utility>

#include "core/logging.hpp"

namespace sda {
namespace {

using logging::LogDebug;
using logging::LogInfo;
using nlohmann::json;

std::string MethodOf(const json& message) {
  if (!message.is_object()) {
    return {};
  }
  const auto it = message.find("method");
  if (it == message.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

json MakeResultPayload(const json& id, const json& result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json MakeErrorPayload(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

McpServer::McpServer(const ToolDispatcher& dispatcher, std::string version)
    : dispatcher_(dispatcher), version_(std::move(version)) {}

bool McpServer::IsToolCall(const json& message) { return MethodOf(message) == "tools/call"; }

bool McpServer::IsExit(const json& message) { return MethodOf(message) == "exit"; }

std::optional<json> McpServer::HandleMessage(const json& message) const {
  if (!message.is_object() || !message.contains("method")) {
    const json id = message.is_object() && message.contains("id") ? message.at("id") : json();
    return MakeErrorPayload(id, rpc::kInvalidRequest, "Invalid JSON-RPC request");
  }

  const auto method = MethodOf(message);
  const auto id_it = message.find("id");
  const bool is_notification = id_it == message.end();
  const json id = is_notification ? json() : *id_it;
  const json params = message.contains("params") ? message.at("params") : json::object();

  if (method.empty()) {
    return MakeErrorPayload(id, rpc::kInvalidRequest, "Field 'method' must be a string");
  }
  LogDebug("rpc.request method=" + method);

  if (is_notification) {
    // notifications/initialized, notifications/cancelled, exit, ...
    return std::nullopt;
  }

  if (method == "initialize") {
    return MakeResultPayload(id, Initialize(params));
  }
  if (method == "ping" || method == "shutdown") {
    return MakeResultPayload(id, json::object());
  }
  if (method == "tools/list") {
    return MakeResultPayload(id, {{"tools", dispatcher_.ToolSchemasJson()}});
  }
  if (method == "tools/call") {
    return CallTool(id, params);
  }
  if (method == "exit") {
    return std::nullopt;
  }
  return MakeErrorPayload(id, rpc::kMethodNotFound, "Unsupported method: " + method);
}

json McpServer::Initialize(const json& params) const {
  std::string protocol_version = kDefaultProtocolVersion;
  if (params.is_object()) {
    if (const auto it = params.find("protocolVersion"); it != params.end() && it->is_string()) {
      protocol_version = it->get<std::string>();
    }
  }
  LogInfo("rpc.initialize protocol_version=" + protocol_version);
  return {
      {"protocolVersion", protocol_version},
      {"serverInfo", {{"name", kServerName}, {"version", version_}}},
      {"capabilities", {{"tools", {{"listChanged", false}}}}},
      {"instructions",
       "This server provides tools to interact with the Sudan Digital Archive API."},
  };
}

json McpServer::CallTool(const json& id, const json& params) const {
  if (!params.is_object()) {
    return MakeErrorPayload(id, rpc::kInvalidParams, "tools/call params must be an object");
  }
  const auto name_it = params.find("name");
  if (name_it == params.end() || !name_it->is_string()) {
    return MakeErrorPayload(id, rpc::kInvalidParams, "tools/call requires a string 'name'");
  }
  const auto name = name_it->get<std::string>();
  if (!dispatcher_.HasTool(name)) {
    return MakeErrorPayload(id, rpc::kInvalidParams, "Unknown tool: " + name);
  }
  const json arguments =
      params.contains("arguments") ? params.at("arguments") : json::object();
  return MakeResultPayload(id, dispatcher_.CallTool(name, arguments));
}

}  // namespace sda
