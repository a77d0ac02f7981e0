#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sda::testing {

enum class HttpMethod { kGet = 0, kPost, kPut, kDelete };

struct StubRequest {
  std::string method;
  std::string path;
  std::string body;
  std::vector<std::string> path_params;
  std::multimap<std::string, std::string> query_params;
  std::map<std::string, std::string> headers;

  std::string Header(const std::string& key) const;
  std::vector<std::string> QueryValues(const std::string& key) const;
};

struct StubResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
};

using StubHandler = std::function<StubResponse(const StubRequest&)>;

// Local stand-in for the archive API. Records every request it receives.
class StubArchiveServer {
 public:
  StubArchiveServer();
  ~StubArchiveServer();

  StubArchiveServer(const StubArchiveServer&) = delete;
  StubArchiveServer& operator=(const StubArchiveServer&) = delete;

  void AddHandler(HttpMethod method, const std::string& pattern, StubHandler handler);

  // Binds an ephemeral port on 127.0.0.1, serves on a background thread and
  // returns the port.
  int Start();
  void Stop();

  std::string BaseUrl(const std::string& path_prefix = "") const;
  std::size_t RequestCount() const;
  std::vector<StubRequest> Requests() const;

 private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sda::testing
