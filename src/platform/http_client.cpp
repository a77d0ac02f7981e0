#include "platform/http_client.hpp"

#include <stdexcept>
#include <string>

#include "httplib.h"

namespace {

struct ParsedUrl {
  std::string scheme;
  std::string host;
  int port = 80;
  std::string path_prefix;
};

ParsedUrl ParseUrl(const std::string& base_url) {
  ParsedUrl parsed;
  const auto scheme_end = base_url.find("://");
  if (scheme_end == std::string::npos) {
    throw std::invalid_argument(
        "Base URL must include a scheme (e.g., https://api.example.org/sda-api)");
  }

  parsed.scheme = base_url.substr(0, scheme_end);
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw std::invalid_argument("Base URL scheme must be http or https: " + base_url);
  }

  auto remainder = base_url.substr(scheme_end + 3);
  const auto slash_pos = remainder.find('/');
  if (slash_pos != std::string::npos) {
    parsed.path_prefix = remainder.substr(slash_pos);
    remainder = remainder.substr(0, slash_pos);
  }
  while (!parsed.path_prefix.empty() && parsed.path_prefix.back() == '/') {
    parsed.path_prefix.pop_back();
  }

  const auto colon_pos = remainder.find(':');
  if (colon_pos == std::string::npos) {
    parsed.host = remainder;
    parsed.port = (parsed.scheme == "https") ? 443 : 80;
  } else {
    parsed.host = remainder.substr(0, colon_pos);
    const auto port_str = remainder.substr(colon_pos + 1);
    std::size_t consumed = 0;
    try {
      parsed.port = std::stoi(port_str, &consumed);
    } catch (const std::logic_error&) {
      consumed = 0;
    }
    if (consumed == 0 || consumed != port_str.size()) {
      throw std::invalid_argument("Base URL has an invalid port: " + base_url);
    }
    if (parsed.port <= 0 || parsed.port > 65535) {
      throw std::invalid_argument("Base URL port is out of range: " + base_url);
    }
  }
  if (parsed.host.empty()) {
    throw std::invalid_argument("Base URL has no host: " + base_url);
  }
  return parsed;
}

httplib::Headers ToHeaders(const platform::HeaderMap& headers) {
  httplib::Headers converted;
  for (const auto& [key, value] : headers) {
    converted.emplace(key, value);
  }
  return converted;
}

void ConfigureClient(httplib::Client& client, int timeout_seconds,
                     const platform::HeaderMap& headers) {
  client.set_connection_timeout(timeout_seconds);
  client.set_read_timeout(timeout_seconds);
  client.set_write_timeout(timeout_seconds);
  client.set_default_headers(ToHeaders(headers));
}

}  // namespace

namespace platform {

std::string UrlEncode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string encoded;
  for (unsigned char ch : value) {
    if ((ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
        ch == '-' || ch == '_' || ch == '.' || ch == '~') {
      encoded.push_back(static_cast<char>(ch));
    } else {
      encoded.push_back('%');
      encoded.push_back(kHex[(ch >> 4) & 0x0F]);
      encoded.push_back(kHex[ch & 0x0F]);
    }
  }
  return encoded;
}

std::string StatusMessage(int status) { return httplib::status_message(status); }

HttpClient::HttpClient(const std::string& base_url, HeaderMap default_headers,
                       int timeout_seconds)
    : default_headers_(std::move(default_headers)), timeout_seconds_(timeout_seconds) {
  auto parsed = ParseUrl(base_url);
  origin_ = parsed.scheme + "://" + parsed.host + ":" + std::to_string(parsed.port);
  path_prefix_ = std::move(parsed.path_prefix);
  if (timeout_seconds_ <= 0) {
    throw std::invalid_argument("HTTP timeout must be positive");
  }
}

HttpClientResponse HttpClient::Get(const std::string& path, const QueryParams& query) const {
  httplib::Client client(origin_);
  ConfigureClient(client, timeout_seconds_, default_headers_);
  const auto target = BuildTarget(path, query);
  auto result = client.Get(target);
  if (!result) {
    throw HttpTransportError("GET " + target + " failed: " + httplib::to_string(result.error()));
  }
  return ConvertResponse(*result);
}

HttpClientResponse HttpClient::Post(const std::string& path, const std::string& body,
                                    const std::string& content_type) const {
  httplib::Client client(origin_);
  ConfigureClient(client, timeout_seconds_, default_headers_);
  const auto target = BuildTarget(path, {});
  auto result = client.Post(target, body, content_type);
  if (!result) {
    throw HttpTransportError("POST " + target + " failed: " + httplib::to_string(result.error()));
  }
  return ConvertResponse(*result);
}

HttpClientResponse HttpClient::Put(const std::string& path, const std::string& body,
                                   const std::string& content_type) const {
  httplib::Client client(origin_);
  ConfigureClient(client, timeout_seconds_, default_headers_);
  const auto target = BuildTarget(path, {});
  auto result = client.Put(target, body, content_type);
  if (!result) {
    throw HttpTransportError("PUT " + target + " failed: " + httplib::to_string(result.error()));
  }
  return ConvertResponse(*result);
}

HttpClientResponse HttpClient::Delete(const std::string& path, const std::string& body,
                                      const std::string& content_type) const {
  httplib::Client client(origin_);
  ConfigureClient(client, timeout_seconds_, default_headers_);
  const auto target = BuildTarget(path, {});
  auto result = body.empty() ? client.Delete(target)
                             : client.Delete(target, body, content_type);
  if (!result) {
    throw HttpTransportError("DELETE " + target +
                             " failed: " + httplib::to_string(result.error()));
  }
  return ConvertResponse(*result);
}

std::string HttpClient::BuildTarget(const std::string& path, const QueryParams& query) const {
  std::string target = path_prefix_ + path;
  if (query.empty()) {
    return target;
  }

  target.push_back('?');
  bool first = true;
  for (const auto& [key, value] : query) {
    if (!first) {
      target.push_back('&');
    }
    target += UrlEncode(key);
    target.push_back('=');
    target += UrlEncode(value);
    first = false;
  }
  return target;
}

HttpClientResponse HttpClient::ConvertResponse(const httplib::Response& result) const {
  HttpClientResponse response;
  response.status = result.status;
  response.content_type = result.get_header_value("Content-Type");
  response.body = result.body;
  return response;
}

}  // namespace platform
