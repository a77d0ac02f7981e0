#include "core/argument_normalizer.hpp"

#include <cctype>
#include <cstdint>
#include <limits>
#include <optional>

#include "core/errors.hpp"

namespace sda {
namespace {

using nlohmann::json;

const json& EmptyObject() {
  static const json kEmpty = json::object();
  return kEmpty;
}

const json& RequireObject(const json& arguments) {
  if (arguments.is_null()) {
    return EmptyObject();
  }
  if (!arguments.is_object()) {
    throw ValidationError("Tool arguments must be a JSON object.");
  }
  return arguments;
}

// Looks up `key`, then each alias. Returns nullptr for missing or null.
const json* FindArg(const json& arguments, const char* key, const char* alias = nullptr) {
  auto it = arguments.find(key);
  if ((it == arguments.end() || it->is_null()) && alias != nullptr) {
    it = arguments.find(alias);
  }
  if (it == arguments.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

// Unsigned values above INT64_MAX would wrap, possibly into the -1 sentinel.
std::int64_t ToInt64(const json& value, const char* key) {
  if (value.is_number_unsigned() &&
      value.get<std::uint64_t>() >
          static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw ValidationError(std::string{"Argument '"} + key + "' is out of range.");
  }
  return value.get<std::int64_t>();
}

std::int64_t IntArg(const json& arguments, const char* key, const char* alias = nullptr) {
  const json* value = FindArg(arguments, key, alias);
  if (value == nullptr) {
    return kUnspecifiedInt;
  }
  if (!value->is_number_integer()) {
    throw ValidationError(std::string{"Argument '"} + key + "' must be an integer.");
  }
  return ToInt64(*value, key);
}

std::string StringArg(const json& arguments, const char* key) {
  const json* value = FindArg(arguments, key);
  if (value == nullptr) {
    return {};
  }
  if (!value->is_string()) {
    throw ValidationError(std::string{"Argument '"} + key + "' must be a string.");
  }
  return value->get<std::string>();
}

bool BoolArg(const json& arguments, const char* key) {
  const json* value = FindArg(arguments, key);
  if (value == nullptr) {
    return false;
  }
  if (!value->is_boolean()) {
    throw ValidationError(std::string{"Argument '"} + key + "' must be a boolean.");
  }
  return value->get<bool>();
}

std::vector<std::int64_t> IntListArg(const json& arguments, const char* key) {
  const json* value = FindArg(arguments, key);
  if (value == nullptr) {
    return {};
  }
  if (!value->is_array()) {
    throw ValidationError(std::string{"Argument '"} + key + "' must be an array of integers.");
  }
  std::vector<std::int64_t> values;
  for (const auto& item : *value) {
    if (!item.is_number_integer()) {
      throw ValidationError(std::string{"Argument '"} + key +
                            "' must only contain integers.");
    }
    values.push_back(ToInt64(item, key));
  }
  return values;
}

// Identifiers are accepted as strings or non-negative integers.
std::string IdArg(const json& arguments, const char* key) {
  const json* value = FindArg(arguments, key);
  if (value == nullptr) {
    return {};
  }
  if (value->is_string()) {
    return value->get<std::string>();
  }
  if (value->is_number_unsigned()) {
    return std::to_string(value->get<std::uint64_t>());
  }
  if (value->is_number_integer()) {
    const auto id = value->get<std::int64_t>();
    if (id < 0) {
      throw ValidationError(std::string{"Argument '"} + key + "' must not be negative.");
    }
    return std::to_string(id);
  }
  throw ValidationError(std::string{"Argument '"} + key + "' must be a string or integer.");
}

std::string Trim(const std::string& value) {
  std::size_t first = 0;
  std::size_t last = value.size();
  while (first < value.size() && std::isspace(static_cast<unsigned char>(value[first]))) {
    ++first;
  }
  while (last > first && std::isspace(static_cast<unsigned char>(value[last - 1]))) {
    --last;
  }
  return value.substr(first, last - first);
}

std::optional<std::int64_t> NormalizeCount(std::int64_t value, const char* name) {
  if (value == kUnspecifiedInt) {
    return std::nullopt;
  }
  if (value < 0) {
    throw ValidationError(std::string{"Argument '"} + name +
                          "' must be a non-negative integer, or -1 to leave it unspecified.");
  }
  return value;
}

std::optional<std::string> NormalizeText(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::optional<MetadataLanguage> NormalizeLanguage(const std::string& value, const char* name) {
  if (value.empty() || value == "none") {
    return std::nullopt;
  }
  const auto language = ParseLanguage(value);
  if (!language) {
    throw ValidationError(std::string{"Argument '"} + name +
                          "' must be 'english', 'arabic' or empty.");
  }
  return language;
}

std::vector<std::int64_t> NormalizeSubjectIds(const std::vector<std::int64_t>& ids,
                                              const char* name) {
  for (const auto id : ids) {
    if (id < 0) {
      throw ValidationError(std::string{"Argument '"} + name +
                            "' must only contain non-negative subject ids.");
    }
  }
  return ids;
}

}  // namespace

ListAccessionsArgs ParseListAccessionsArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  ListAccessionsArgs parsed;
  parsed.page = IntArg(args, "page");
  parsed.per_page = IntArg(args, "per_page", "perPage");
  parsed.lang = StringArg(args, "lang");
  parsed.metadata_subjects = IntListArg(args, "metadata_subjects");
  parsed.metadata_subjects_inclusive_filter = BoolArg(args, "metadata_subjects_inclusive_filter");
  parsed.query_term = StringArg(args, "query_term");
  parsed.url_filter = StringArg(args, "url_filter");
  parsed.date_from = StringArg(args, "date_from");
  parsed.date_to = StringArg(args, "date_to");
  parsed.is_private = BoolArg(args, "is_private");
  return parsed;
}

ListSubjectsArgs ParseListSubjectsArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  ListSubjectsArgs parsed;
  parsed.page = IntArg(args, "page");
  parsed.per_page = IntArg(args, "per_page", "perPage");
  return parsed;
}

IdArgs ParseIdArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  return IdArgs{IdArg(args, "id")};
}

UpdateAccessionArgs ParseUpdateAccessionArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  UpdateAccessionArgs parsed;
  parsed.id = IdArg(args, "id");
  parsed.is_private = BoolArg(args, "is_private");
  parsed.metadata_title = StringArg(args, "metadata_title");
  parsed.metadata_description = StringArg(args, "metadata_description");
  parsed.metadata_time = StringArg(args, "metadata_time");
  parsed.metadata_language = StringArg(args, "metadata_language");
  parsed.metadata_subjects = IntListArg(args, "metadata_subjects");
  return parsed;
}

CreateSubjectArgs ParseCreateSubjectArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  CreateSubjectArgs parsed;
  parsed.label = StringArg(args, "label");
  parsed.visibility = StringArg(args, "visibility");
  parsed.lang = StringArg(args, "lang");
  return parsed;
}

DeleteSubjectArgs ParseDeleteSubjectArgs(const json& arguments) {
  const auto& args = RequireObject(arguments);
  DeleteSubjectArgs parsed;
  parsed.id = IdArg(args, "id");
  parsed.lang = StringArg(args, "lang");
  return parsed;
}

PageRequest NormalizePagination(std::int64_t page, std::int64_t per_page) {
  PageRequest request;
  request.page = NormalizeCount(page, "page");
  request.per_page = NormalizeCount(per_page, "per_page");
  return request;
}

AccessionQuery NormalizeListAccessions(const ListAccessionsArgs& args) {
  AccessionQuery query;
  query.paging = NormalizePagination(args.page, args.per_page);
  query.lang = NormalizeLanguage(args.lang, "lang");
  query.metadata_subjects = NormalizeSubjectIds(args.metadata_subjects, "metadata_subjects");
  query.metadata_subjects_inclusive_filter = args.metadata_subjects_inclusive_filter;
  query.query_term = NormalizeText(args.query_term);
  query.url_filter = NormalizeText(args.url_filter);
  query.date_from = NormalizeText(args.date_from);
  query.date_to = NormalizeText(args.date_to);
  query.is_private = args.is_private;
  return query;
}

PageRequest NormalizeListSubjects(const ListSubjectsArgs& args) {
  return NormalizePagination(args.page, args.per_page);
}

std::string NormalizeIdentifier(const std::string& id) {
  auto trimmed = Trim(id);
  if (trimmed.empty()) {
    throw ValidationError("Argument 'id' is required and must not be empty.");
  }
  return trimmed;
}

AccessionUpdate NormalizeUpdateAccession(const UpdateAccessionArgs& args) {
  AccessionUpdate update;
  update.id = NormalizeIdentifier(args.id);
  update.patch.is_private = args.is_private;
  update.patch.metadata_title = NormalizeText(args.metadata_title);
  update.patch.metadata_description = NormalizeText(args.metadata_description);
  update.patch.metadata_time = NormalizeText(args.metadata_time);
  update.patch.metadata_language = NormalizeLanguage(args.metadata_language, "metadata_language");
  if (!args.metadata_subjects.empty()) {
    update.patch.metadata_subjects =
        NormalizeSubjectIds(args.metadata_subjects, "metadata_subjects");
  }
  return update;
}

NewSubject NormalizeCreateSubject(const CreateSubjectArgs& args) {
  NewSubject subject;
  subject.label = Trim(args.label);
  if (subject.label.empty()) {
    throw ValidationError("Argument 'label' is required and must not be empty.");
  }
  if (!args.visibility.empty()) {
    subject.visibility = ParseVisibility(args.visibility);
    if (!subject.visibility) {
      throw ValidationError("Argument 'visibility' must be 'public', 'private' or empty.");
    }
  }
  subject.lang = NormalizeLanguage(args.lang, "lang");
  return subject;
}

SubjectDeletion NormalizeDeleteSubject(const DeleteSubjectArgs& args) {
  SubjectDeletion deletion;
  deletion.id = NormalizeIdentifier(args.id);
  deletion.lang = NormalizeLanguage(args.lang, "lang");
  return deletion;
}

}  // namespace sda
