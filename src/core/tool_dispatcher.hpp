#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "core/archive_client.hpp"
#include "nlohmann/json.hpp"

namespace sda {

// Normalizes `arguments`, issues the client call and returns the domain
// value as JSON. May throw ValidationError or ApiError.
using ToolHandler =
    std::function<nlohmann::json(const ArchiveClient& client, const nlohmann::json& arguments)>;

struct ToolDefinition {
  std::string name;
  std::string description;
  nlohmann::json input_schema;
  ToolHandler handler;
};

class ToolDispatcher {
 public:
  // Throws std::logic_error if the catalogue registers a name twice.
  explicit ToolDispatcher(ArchiveClient client);
  ToolDispatcher(ArchiveClient client, std::vector<ToolDefinition> definitions);

  nlohmann::json ToolSchemasJson() const;
  const std::vector<ToolDefinition>& Definitions() const { return definitions_; }
  bool HasTool(const std::string& name) const;

  // Runs normalize -> call -> format. Tool failures come back as an error
  // result, never as an exception. Throws std::out_of_range for a name that
  // is not registered.
  nlohmann::json CallTool(const std::string& name, const nlohmann::json& arguments) const;

 private:
  ArchiveClient client_;
  std::vector<ToolDefinition> definitions_;
  std::unordered_map<std::string, std::size_t> index_;
};

std::vector<ToolDefinition> ArchiveToolCatalog();

}  // namespace sda
