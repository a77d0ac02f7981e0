#pragma once

#include <atomic>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>

namespace platform {

enum class Framing { kNewlineDelimited = 0, kContentLength };

struct InboundFrame {
  std::string payload;
  Framing framing = Framing::kNewlineDelimited;
};

// Reads and writes framed JSON-RPC messages on a pair of streams. Accepts
// newline-delimited JSON as well as LSP-style Content-Length framing, and
// replies in whichever framing the peer used last.
class StdioChannel {
 public:
  StdioChannel(std::istream& input, std::ostream& output);

  StdioChannel(const StdioChannel&) = delete;
  StdioChannel& operator=(const StdioChannel&) = delete;

  // Returns std::nullopt once the input is exhausted or a frame is cut short.
  // A zero-length frame yields an empty payload. Only one thread reads.
  std::optional<InboundFrame> Read();

  // Safe to call from several threads.
  void Write(const std::string& payload);

 private:
  std::optional<InboundFrame> ReadContentLengthFrame(std::string first_header);

  std::istream& input_;
  std::ostream& output_;
  std::mutex write_mutex_;
  std::atomic<Framing> framing_{Framing::kNewlineDelimited};
};

}  // namespace platform
