#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/archive_model.hpp"
#include "nlohmann/json.hpp"

namespace sda {

// Tool arguments as they arrive over MCP. Every field is always present so
// that generated client schemas stay simple; "not specified" is carried in
// band by a sentinel.
inline constexpr std::int64_t kUnspecifiedInt = -1;

struct ListAccessionsArgs {
  std::int64_t page = kUnspecifiedInt;
  std::int64_t per_page = kUnspecifiedInt;
  std::string lang;
  std::vector<std::int64_t> metadata_subjects;
  bool metadata_subjects_inclusive_filter = false;
  std::string query_term;
  std::string url_filter;
  std::string date_from;
  std::string date_to;
  bool is_private = false;
};

struct ListSubjectsArgs {
  std::int64_t page = kUnspecifiedInt;
  std::int64_t per_page = kUnspecifiedInt;
};

struct IdArgs {
  std::string id;
};

struct UpdateAccessionArgs {
  std::string id;
  bool is_private = false;
  std::string metadata_title;
  std::string metadata_description;
  std::string metadata_time;
  std::string metadata_language;
  std::vector<std::int64_t> metadata_subjects;
};

struct CreateSubjectArgs {
  std::string label;
  std::string visibility;
  std::string lang;
};

struct DeleteSubjectArgs {
  std::string id;
  std::string lang;
};

// Parsing: loose JSON object -> sentinel-bearing struct. Missing or null
// fields take their sentinel; a field of the wrong type throws
// ValidationError.
ListAccessionsArgs ParseListAccessionsArgs(const nlohmann::json& arguments);
ListSubjectsArgs ParseListSubjectsArgs(const nlohmann::json& arguments);
IdArgs ParseIdArgs(const nlohmann::json& arguments);
UpdateAccessionArgs ParseUpdateAccessionArgs(const nlohmann::json& arguments);
CreateSubjectArgs ParseCreateSubjectArgs(const nlohmann::json& arguments);
DeleteSubjectArgs ParseDeleteSubjectArgs(const nlohmann::json& arguments);

// Normalizing: sentinel-bearing struct -> request value with no sentinels.
PageRequest NormalizePagination(std::int64_t page, std::int64_t per_page);
AccessionQuery NormalizeListAccessions(const ListAccessionsArgs& args);
PageRequest NormalizeListSubjects(const ListSubjectsArgs& args);
std::string NormalizeIdentifier(const std::string& id);
AccessionUpdate NormalizeUpdateAccession(const UpdateAccessionArgs& args);
NewSubject NormalizeCreateSubject(const CreateSubjectArgs& args);
SubjectDeletion NormalizeDeleteSubject(const DeleteSubjectArgs& args);

}  // namespace sda
