#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "core/logging.hpp"
#include "core/mcp_server.hpp"
#include "core/tool_dispatcher.hpp"
#include "nlohmann/json.hpp"
#include "platform/stdio_channel.hpp"
#include "support/stub_archive_server.hpp"
#include "support/test_util.hpp"

namespace {

using nlohmann::json;
using sda::testing::Assert;
using sda::testing::HttpMethod;
using sda::testing::StubArchiveServer;
using sda::testing::StubRequest;
using sda::testing::StubResponse;

json Request(int id, const std::string& method, const json& params = json::object()) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

void TestLifecycleMethods(const sda::McpServer& server) {
  const auto init = server.HandleMessage(
      Request(1, "initialize", {{"protocolVersion", "2025-03-26"}, {"capabilities", json::object()}}));
  Assert(init.has_value(), "initialize must be answered");
  Assert(init->at("id") == 1, "initialize id mismatch");
  const auto& result = init->at("result");
  Assert(result.at("protocolVersion") == "2025-03-26", "requested protocol version must be echoed");
  Assert(result.at("serverInfo").at("name") == "sda-mcp-server", "server name mismatch");
  Assert(result.at("capabilities").contains("tools"), "tools capability missing");

  const auto notification = server.HandleMessage(
      json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
  Assert(!notification.has_value(), "notifications must not be answered");

  const auto ping = server.HandleMessage(Request(2, "ping"));
  Assert(ping && ping->at("result").empty(), "ping must return an empty result");

  const auto unknown = server.HandleMessage(Request(3, "resources/list"));
  Assert(unknown && unknown->at("error").at("code") == sda::rpc::kMethodNotFound,
         "unknown methods must return -32601");

  const auto invalid = server.HandleMessage(json::array({1, 2}));
  Assert(invalid && invalid->at("error").at("code") == sda::rpc::kInvalidRequest,
         "non-object requests must return -32600");

  Assert(sda::McpServer::IsExit(json{{"jsonrpc", "2.0"}, {"method", "exit"}}),
         "exit must be recognised");
}

void TestToolMethods(const sda::McpServer& server, const StubArchiveServer& stub) {
  const auto listed = server.HandleMessage(Request(10, "tools/list"));
  Assert(listed && listed->at("result").at("tools").size() == 8, "tools/list must list 8 tools");

  const auto unknown_tool =
      server.HandleMessage(Request(11, "tools/call", {{"name", "drop_database"}}));
  Assert(unknown_tool && unknown_tool->at("error").at("code") == sda::rpc::kInvalidParams,
         "unknown tools must return -32602");

  const auto missing_name = server.HandleMessage(Request(12, "tools/call", json::object()));
  Assert(missing_name && missing_name->at("error").at("code") == sda::rpc::kInvalidParams,
         "tools/call without a name must return -32602");

  const auto invalid_args = server.HandleMessage(
      Request(13, "tools/call", {{"name", "get_accession"}, {"arguments", {{"id", ""}}}}));
  Assert(invalid_args && invalid_args->contains("result"),
         "tool validation failures are results, not protocol errors");
  Assert(invalid_args->at("result").at("isError").get<bool>(), "isError must be set");

  const auto listed_subjects = server.HandleMessage(
      Request(14, "tools/call",
              {{"name", "list_subjects"}, {"arguments", {{"page", -1}, {"per_page", 5}}}}));
  Assert(listed_subjects && !listed_subjects->at("result").at("isError").get<bool>(),
         "list_subjects must succeed");
  Assert(listed_subjects->at("result").at("structuredContent").at("items").size() == 1,
         "list_subjects must return the stub items");

  const auto requests = stub.Requests();
  Assert(requests.size() == 1, "only the valid tool call may reach the archive");
  Assert(requests[0].QueryValues("per_page") == std::vector<std::string>{"5"},
         "per_page must be forwarded");
  Assert(requests[0].QueryValues("page").empty(), "page -1 must be omitted");
}

void TestNewlineFraming() {
  std::istringstream input(
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n\n"
      "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\r\n");
  std::ostringstream output;
  platform::StdioChannel channel(input, output);

  const auto first = channel.Read();
  Assert(first && first->framing == platform::Framing::kNewlineDelimited, "first frame missing");
  Assert(json::parse(first->payload).at("id") == 1, "first frame id mismatch");
  const auto second = channel.Read();
  Assert(second && json::parse(second->payload).at("id") == 2, "blank lines must be skipped");
  Assert(!channel.Read().has_value(), "end of input must return nullopt");

  channel.Write("{\"ok\":true}");
  Assert(output.str() == "{\"ok\":true}\n", "newline framing must be used for replies");
}

void TestContentLengthFraming() {
  const std::string body = "{\"jsonrpc\":\"2.0\",\"id\":7,\"method\":\"tools/list\"}";
  std::istringstream input("Content-Length: " + std::to_string(body.size()) +
                           "\r\nContent-Type: application/json\r\n\r\n" + body);
  std::ostringstream output;
  platform::StdioChannel channel(input, output);

  const auto frame = channel.Read();
  Assert(frame && frame->framing == platform::Framing::kContentLength,
         "Content-Length frame expected");
  Assert(frame->payload == body, "Content-Length payload mismatch");

  channel.Write("{}");
  Assert(output.str() == "Content-Length: 2\r\n\r\n{}",
         "replies must reuse Content-Length framing");
}

void TestZeroLengthFrameKeepsReading() {
  std::istringstream input(
      "Content-Length: 0\r\n\r\n"
      "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n");
  std::ostringstream output;
  platform::StdioChannel channel(input, output);

  const auto empty = channel.Read();
  Assert(empty.has_value(), "a zero-length frame is not end of input");
  Assert(empty->payload.empty() && empty->framing == platform::Framing::kContentLength,
         "a zero-length frame must carry an empty payload");
  Assert(json::parse(empty->payload, nullptr, false).is_discarded(),
         "an empty payload must fail to parse");

  const auto next = channel.Read();
  Assert(next && json::parse(next->payload).at("method") == "ping",
         "the frame after a zero-length frame must be read");
  Assert(!channel.Read().has_value(), "end of input must return nullopt");
}

void TestTruncatedHeadersEndInput() {
  std::istringstream input("Content-Length: 10\r\nContent-Type: application/json\r\n");
  std::ostringstream output;
  platform::StdioChannel channel(input, output);
  Assert(!channel.Read().has_value(), "headers cut off by end of input must return nullopt");
}

}  // namespace

int main() {
  sda::logging::SetLogLevel(sda::logging::LogLevel::kError);
  try {
    StubArchiveServer stub;
    stub.AddHandler(HttpMethod::kGet, "/api/v1/metadata-subjects", [](const StubRequest&) {
      const json page = {{"items", json::array({{{"id", 1}, {"subject", "Health"}}})},
                         {"num_pages", 1},
                         {"page", 0},
                         {"per_page", 5}};
      return StubResponse{200, "application/json", page.dump()};
    });
    stub.Start();

    const sda::ToolDispatcher dispatcher{
        sda::ArchiveClient(sda::testing::MakeTestConfig(stub.BaseUrl()))};
    const sda::McpServer server(dispatcher, "test");

    TestLifecycleMethods(server);
    TestToolMethods(server, stub);
    TestNewlineFraming();
    TestContentLengthFraming();
    TestZeroLengthFrameKeepsReading();
    TestTruncatedHeadersEndInput();
    stub.Stop();
  } catch (const std::exception& ex) {
    std::cerr << "mcp_server_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
