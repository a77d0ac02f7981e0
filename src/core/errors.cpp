#include "core/errors.hpp"

namespace sda {

std::string_view ApiErrorOriginToString(ApiErrorOrigin origin) {
  switch (origin) {
    case ApiErrorOrigin::kTransport:
      return "transport";
    case ApiErrorOrigin::kHttpStatus:
      return "remote_status";
    case ApiErrorOrigin::kDecode:
      return "decode";
  }
  return "transport";
}

ApiError::ApiError(ApiErrorOrigin origin, const std::string& message,
                   std::optional<int> status_code)
    : std::runtime_error(message), origin_(origin), status_code_(status_code) {}

}  // namespace sda
