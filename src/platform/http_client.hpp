#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace httplib {
class Response;
}

namespace platform {

// Ordered, repeatable query parameters (e.g. "subject=1&subject=2").
using QueryParams = std::vector<std::pair<std::string, std::string>>;
using HeaderMap = std::map<std::string, std::string>;

struct HttpClientResponse {
  int status = 0;
  std::string content_type;
  std::string body;
};

// The request never produced an HTTP response (connect, DNS, TLS, timeout).
class HttpTransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class HttpClient {
 public:
  HttpClient(const std::string& base_url, HeaderMap default_headers, int timeout_seconds);

  HttpClientResponse Get(const std::string& path, const QueryParams& query = {}) const;
  HttpClientResponse Post(const std::string& path, const std::string& body,
                          const std::string& content_type = "application/json") const;
  HttpClientResponse Put(const std::string& path, const std::string& body,
                         const std::string& content_type = "application/json") const;
  HttpClientResponse Delete(const std::string& path, const std::string& body = {},
                            const std::string& content_type = "application/json") const;

  std::string BuildTarget(const std::string& path, const QueryParams& query) const;

 private:
  HttpClientResponse ConvertResponse(const httplib::Response& response) const;

  std::string origin_;
  std::string path_prefix_;
  HeaderMap default_headers_;
  int timeout_seconds_;
};

std::string UrlEncode(const std::string& value);

// Reason phrase for an HTTP status code, e.g. "Not Found" for 404.
std::string StatusMessage(int status);

}  // namespace platform
