#pragma once

#include <string>

#include "core/errors.hpp"
#include "nlohmann/json.hpp"

namespace sda {

// Builders for MCP `tools/call` results. A failed tool call is still a
// well-formed result with "isError": true; none of these functions throw.
nlohmann::json MakeSuccessResult(const nlohmann::json& value);
nlohmann::json MakeValidationErrorResult(const ValidationError& error);
nlohmann::json MakeApiErrorResult(const ApiError& error);
nlohmann::json MakeInternalErrorResult(const std::string& message);

}  // namespace sda
