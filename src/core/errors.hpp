#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace sda {

// Caller-supplied tool arguments failed normalization. Raised before any
// request leaves the process.
class ValidationError : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

enum class ApiErrorOrigin { kTransport = 0, kHttpStatus, kDecode };

std::string_view ApiErrorOriginToString(ApiErrorOrigin origin);

// A failed call against the remote archive.
class ApiError : public std::runtime_error {
 public:
  ApiError(ApiErrorOrigin origin, const std::string& message,
           std::optional<int> status_code = std::nullopt);

  ApiErrorOrigin origin() const { return origin_; }
  const std::optional<int>& status_code() const { return status_code_; }

 private:
  ApiErrorOrigin origin_;
  std::optional<int> status_code_;
};

}  // namespace sda
