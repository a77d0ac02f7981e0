#include "platform/stdio_channel.hpp"

#include <algorithm>
#include <cctype>
#include <istream>
#include <ostream>
#include <stdexcept>
#include <string>

namespace {

std::string Lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
  return value;
}

bool IsBlank(const std::string& line) {
  return std::all_of(line.begin(), line.end(),
                     [](unsigned char ch) { return std::isspace(ch) != 0; });
}

bool StartsWithHeader(const std::string& line) {
  return Lowercase(line.substr(0, 15)) == "content-length:";
}

std::size_t ParseContentLength(const std::string& header) {
  const auto colon = header.find(':');
  std::string value = header.substr(colon + 1);
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [](unsigned char ch) { return std::isspace(ch) == 0; }));
  try {
    return static_cast<std::size_t>(std::stoul(value));
  } catch (const std::exception&) {
    throw std::runtime_error("Invalid Content-Length header: " + header);
  }
}

}  // namespace

namespace platform {

StdioChannel::StdioChannel(std::istream& input, std::ostream& output)
    : input_(input), output_(output) {}

std::optional<InboundFrame> StdioChannel::Read() {
  std::string line;
  while (std::getline(input_, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (IsBlank(line)) {
      continue;
    }
    if (StartsWithHeader(line)) {
      return ReadContentLengthFrame(line);
    }
    framing_ = Framing::kNewlineDelimited;
    return InboundFrame{line, Framing::kNewlineDelimited};
  }
  return std::nullopt;
}

std::optional<InboundFrame> StdioChannel::ReadContentLengthFrame(std::string first_header) {
  std::size_t content_length = ParseContentLength(first_header);
  std::string line;
  bool headers_complete = false;
  // Remaining headers up to the blank separator line.
  while (std::getline(input_, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      headers_complete = true;
      break;
    }
    if (StartsWithHeader(line)) {
      content_length = ParseContentLength(line);
    }
  }
  if (!headers_complete) {
    return std::nullopt;
  }

  framing_ = Framing::kContentLength;
  if (content_length == 0) {
    return InboundFrame{std::string{}, Framing::kContentLength};
  }

  std::string body(content_length, '\0');
  input_.read(body.data(), static_cast<std::streamsize>(content_length));
  if (input_.gcount() != static_cast<std::streamsize>(content_length)) {
    return std::nullopt;
  }
  return InboundFrame{std::move(body), Framing::kContentLength};
}

void StdioChannel::Write(const std::string& payload) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (framing_.load() == Framing::kContentLength) {
    output_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  } else {
    output_ << payload << '\n';
  }
  output_.flush();
}

}  // namespace platform
