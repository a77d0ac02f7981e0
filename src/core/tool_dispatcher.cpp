#include "core/tool_dispatcher.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "core/argument_normalizer.hpp"
#include "core/errors.hpp"
#include "core/logging.hpp"
#include "core/response_formatter.hpp"

namespace sda {
namespace {

using logging::LogError;
using logging::LogInfo;
using logging::LogWarn;
using nlohmann::json;

json IntegerProperty(const std::string& description) {
  return {{"type", "integer"}, {"minimum", -1}, {"description", description}};
}

json StringProperty(const std::string& description) {
  return {{"type", "string"}, {"description", description}};
}

json EnumProperty(const std::string& description, const std::vector<std::string>& values) {
  return {{"type", "string"}, {"enum", values}, {"description", description}};
}

json BooleanProperty(const std::string& description) {
  return {{"type", "boolean"}, {"description", description}};
}

json IdListProperty(const std::string& description) {
  return {{"type", "array"},
          {"items", {{"type", "integer"}, {"minimum", 0}}},
          {"description", description}};
}

// Every property is listed as required; "unspecified" travels as a sentinel.
json ObjectSchema(const json& properties) {
  json required = json::array();
  for (const auto& item : properties.items()) {
    required.push_back(item.key());
  }
  return {{"type", "object"},
          {"properties", properties},
          {"required", required},
          {"additionalProperties", false}};
}

json ListAccessionsSchema() {
  return ObjectSchema({
      {"page", IntegerProperty("Page number, or -1 for the server default.")},
      {"per_page", IntegerProperty("Items per page, or -1 for the server default.")},
      {"lang", EnumProperty("Metadata language filter, or empty for any.",
                            {"", "english", "arabic"})},
      {"metadata_subjects", IdListProperty("Subject ids to filter by, or [] for none.")},
      {"metadata_subjects_inclusive_filter",
       BooleanProperty("Match any of the subjects instead of all of them.")},
      {"query_term", StringProperty("Full-text search term, or empty.")},
      {"url_filter", StringProperty("Seed URL filter, or empty.")},
      {"date_from", StringProperty("Earliest metadata date (ISO 8601), or empty.")},
      {"date_to", StringProperty("Latest metadata date (ISO 8601), or empty.")},
      {"is_private", BooleanProperty("Restrict results to private accessions.")},
  });
}

json IdSchema(const std::string& description) {
  return ObjectSchema({{"id", StringProperty(description)}});
}

std::vector<ToolDefinition> BuildCatalog() {
  return {
      {"list_accessions",
       "List archived accessions with optional paging, language, subject, text and date "
       "filters.",
       ListAccessionsSchema(),
       [](const ArchiveClient& client, const json& arguments) {
         const auto query = NormalizeListAccessions(ParseListAccessionsArgs(arguments));
         return AccessionPageToJson(client.ListAccessions(query));
       }},
      {"list_private_accessions",
       "List private accessions. Takes the same filters as list_accessions.",
       ListAccessionsSchema(),
       [](const ArchiveClient& client, const json& arguments) {
         const auto query = NormalizeListAccessions(ParseListAccessionsArgs(arguments));
         return AccessionPageToJson(client.ListPrivateAccessions(query));
       }},
      {"get_accession",
       "Fetch one accession and the download URL of its WACZ archive.",
       IdSchema("Accession id."),
       [](const ArchiveClient& client, const json& arguments) {
         const auto id = NormalizeIdentifier(ParseIdArgs(arguments).id);
         return AccessionDetailToJson(client.GetAccession(id));
       }},
      {"get_private_accession",
       "Fetch one private accession and the download URL of its WACZ archive.",
       IdSchema("Private accession id."),
       [](const ArchiveClient& client, const json& arguments) {
         const auto id = NormalizeIdentifier(ParseIdArgs(arguments).id);
         return AccessionDetailToJson(client.GetPrivateAccession(id));
       }},
      {"update_accession",
       "Update the metadata of an accession. Empty strings and [] leave a field unchanged.",
       ObjectSchema({
           {"id", StringProperty("Accession id.")},
           {"is_private", BooleanProperty("Whether the accession is private.")},
           {"metadata_title", StringProperty("New title, or empty.")},
           {"metadata_description", StringProperty("New description, or empty.")},
           {"metadata_time", StringProperty("New metadata date (ISO 8601), or empty.")},
           {"metadata_language", EnumProperty("Language of the metadata, or empty.",
                                              {"", "english", "arabic"})},
           {"metadata_subjects", IdListProperty("Subject ids to attach, or [].")},
       }),
       [](const ArchiveClient& client, const json& arguments) {
         const auto update = NormalizeUpdateAccession(ParseUpdateAccessionArgs(arguments));
         return AccessionDetailToJson(client.UpdateAccession(update.id, update.patch));
       }},
      {"list_subjects",
       "List metadata subjects with optional paging.",
       ObjectSchema({
           {"page", IntegerProperty("Page number, or -1 for the server default.")},
           {"per_page", IntegerProperty("Items per page, or -1 for the server default.")},
       }),
       [](const ArchiveClient& client, const json& arguments) {
         const auto paging = NormalizeListSubjects(ParseListSubjectsArgs(arguments));
         return SubjectPageToJson(client.ListSubjects(paging));
       }},
      {"create_subject",
       "Create a metadata subject.",
       ObjectSchema({
           {"label", StringProperty("Subject label. Must not be empty.")},
           {"visibility", EnumProperty("Subject visibility, or empty for the server default.",
                                       {"", "public", "private"})},
           {"lang", EnumProperty("Language of the label, or empty.", {"", "english", "arabic"})},
       }),
       [](const ArchiveClient& client, const json& arguments) {
         const auto subject = NormalizeCreateSubject(ParseCreateSubjectArgs(arguments));
         return CreatedSubjectToJson(client.CreateSubject(subject));
       }},
      {"delete_subject",
       "Delete a metadata subject. Deleting a subject that does not exist is an error.",
       ObjectSchema({
           {"id", StringProperty("Subject id.")},
           {"lang", EnumProperty("Language of the subject, or empty.", {"", "english", "arabic"})},
       }),
       [](const ArchiveClient& client, const json& arguments) {
         const auto deletion = NormalizeDeleteSubject(ParseDeleteSubjectArgs(arguments));
         client.DeleteSubject(deletion);
         return json{{"deleted", true}, {"id", deletion.id}};
       }},
  };
}

json MakeToolSchemaJson(const ToolDefinition& tool) {
  return {{"name", tool.name}, {"description", tool.description}, {"inputSchema", tool.input_schema}};
}

}  // namespace

std::vector<ToolDefinition> ArchiveToolCatalog() { return BuildCatalog(); }

ToolDispatcher::ToolDispatcher(ArchiveClient client)
    : ToolDispatcher(std::move(client), BuildCatalog()) {}

ToolDispatcher::ToolDispatcher(ArchiveClient client, std::vector<ToolDefinition> definitions)
    : client_(std::move(client)), definitions_(std::move(definitions)) {
  for (std::size_t i = 0; i < definitions_.size(); ++i) {
    const auto& tool = definitions_[i];
    if (!tool.handler) {
      throw std::logic_error("Tool '" + tool.name + "' has no handler");
    }
    if (!index_.emplace(tool.name, i).second) {
      throw std::logic_error("Tool '" + tool.name + "' is registered more than once");
    }
  }
}

json ToolDispatcher::ToolSchemasJson() const {
  json tools = json::array();
  for (const auto& tool : definitions_) {
    tools.push_back(MakeToolSchemaJson(tool));
  }
  return tools;
}

bool ToolDispatcher::HasTool(const std::string& name) const {
  return index_.find(name) != index_.end();
}

json ToolDispatcher::CallTool(const std::string& name, const json& arguments) const {
  const auto it = index_.find(name);
  if (it == index_.end()) {
    throw std::out_of_range("Unknown tool: " + name);
  }
  const auto& tool = definitions_[it->second];
  const auto started = std::chrono::steady_clock::now();
  const auto elapsed_ms = [&started] {
    return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count());
  };

  try {
    auto value = tool.handler(client_, arguments);
    LogInfo("tool.call tool=" + name + " outcome=ok elapsed_ms=" + elapsed_ms());
    return MakeSuccessResult(value);
  } catch (const ValidationError& ex) {
    LogWarn("tool.call tool=" + name + " outcome=validation_error error=\"" + ex.what() + "\"");
    return MakeValidationErrorResult(ex);
  } catch (const ApiError& ex) {
    LogWarn("tool.call tool=" + name + " outcome=" +
            std::string{ApiErrorOriginToString(ex.origin())} + " elapsed_ms=" + elapsed_ms() +
            " error=\"" + ex.what() + "\"");
    return MakeApiErrorResult(ex);
  } catch (const std::exception& ex) {
    LogError("tool.call tool=" + name + " outcome=internal_error error=\"" + ex.what() + "\"");
    return MakeInternalErrorResult(ex.what());
  }
}

}  // namespace sda
