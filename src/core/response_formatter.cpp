#include "core/response_formatter.hpp"

namespace sda {
namespace {

using nlohmann::json;

json TextContent(const std::string& text) {
  return json::array({{{"type", "text"}, {"text", text}}});
}

json MakeErrorResult(const std::string& kind, const std::string& message,
                     const json& status = nullptr) {
  json error = {{"kind", kind}, {"message", message}};
  if (!status.is_null()) {
    error["status"] = status;
  }
  return {{"content", TextContent(message)},
          {"structuredContent", {{"error", error}}},
          {"isError", true}};
}

}  // namespace

json MakeSuccessResult(const json& value) {
  // Replace invalid UTF-8 from the remote rather than throwing in dump().
  const auto text = value.dump(2, ' ', false, json::error_handler_t::replace);
  json result = {{"content", TextContent(text)}, {"isError", false}};
  if (value.is_object()) {
    result["structuredContent"] = value;
  }
  return result;
}

json MakeValidationErrorResult(const ValidationError& error) {
  return MakeErrorResult("validation", error.what());
}

json MakeApiErrorResult(const ApiError& error) {
  json status = nullptr;
  if (error.status_code()) {
    status = *error.status_code();
  }
  return MakeErrorResult(std::string{ApiErrorOriginToString(error.origin())}, error.what(),
                         status);
}

json MakeInternalErrorResult(const std::string& message) {
  return MakeErrorResult("internal", message);
}

}  // namespace sda
