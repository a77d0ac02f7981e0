#include <cstddef>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#include "core/archive_client.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "core/mcp_server.hpp"
#include "core/tool_dispatcher.hpp"
#include "nlohmann/json.hpp"
#include "platform/stdio_channel.hpp"
#include "platform/task_group.hpp"

#ifndef SDA_MCP_VERSION
#define SDA_MCP_VERSION "0.0.0"
#endif

namespace {

using sda::logging::LogDebug;
using sda::logging::LogError;
using sda::logging::LogInfo;

// Reading pauses while this many tools/call requests are outstanding.
constexpr std::size_t kMaxConcurrentToolCalls = 16;

std::string Serialize(const nlohmann::json& payload) {
  return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

int Serve(const sda::BridgeConfig& config) {
  sda::ToolDispatcher dispatcher{sda::ArchiveClient(config)};
  sda::McpServer server(dispatcher, SDA_MCP_VERSION);
  platform::StdioChannel channel(std::cin, std::cout);

  LogInfo("server.start base_url=" + config.base_url +
          " timeout_s=" + std::to_string(config.timeout_seconds) +
          " tools=" + std::to_string(dispatcher.Definitions().size()));

  platform::TaskGroup tool_calls(kMaxConcurrentToolCalls);
  while (true) {
    std::optional<platform::InboundFrame> frame;
    try {
      frame = channel.Read();
    } catch (const std::exception& ex) {
      LogError(std::string{"rpc.read_error error=\""} + ex.what() + "\"");
      channel.Write(Serialize(sda::MakeErrorPayload(nullptr, sda::rpc::kParseError, ex.what())));
      continue;
    }
    if (!frame) {
      break;
    }

    auto message = nlohmann::json::parse(frame->payload, nullptr, false);
    if (message.is_discarded()) {
      channel.Write(
          Serialize(sda::MakeErrorPayload(nullptr, sda::rpc::kParseError, "Parse error")));
      continue;
    }
    if (sda::McpServer::IsExit(message)) {
      break;
    }

    if (sda::McpServer::IsToolCall(message)) {
      tool_calls.Submit([&server, &channel, message = std::move(message)] {
        try {
          if (auto reply = server.HandleMessage(message)) {
            channel.Write(Serialize(*reply));
          }
        } catch (const std::exception& ex) {
          LogError(std::string{"rpc.tool_task_error error=\""} + ex.what() + "\"");
          const nlohmann::json id = message.contains("id") ? message.at("id") : nlohmann::json();
          channel.Write(Serialize(sda::MakeErrorPayload(id, sda::rpc::kInternalError, ex.what())));
        }
      });
    } else if (auto reply = server.HandleMessage(message)) {
      channel.Write(Serialize(*reply));
    }
  }

  LogDebug("server.drain in_flight=" + std::to_string(tool_calls.InFlight()));
  tool_calls.Wait();
  LogInfo("server.stop");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  sda::BridgeConfig config;
  try {
    config = sda::LoadBridgeConfig(argc, argv);
  } catch (const std::exception& ex) {
    LogError(std::string{"config.invalid error=\""} + ex.what() + "\"");
    std::cerr << sda::UsageText(argc > 0 ? argv[0] : "sda-mcp-server");
    return 1;
  }
  if (config.show_help) {
    std::cerr << sda::UsageText(argc > 0 ? argv[0] : "sda-mcp-server");
    return 0;
  }
  if (config.show_version) {
    std::cerr << sda::kServerName << ' ' << SDA_MCP_VERSION << '\n';
    return 0;
  }
  sda::logging::SetLogLevel(config.log_level);

  try {
    return Serve(config);
  } catch (const std::exception& ex) {
    LogError(std::string{"server.fatal error=\""} + ex.what() + "\"");
    return 1;
  }
}
