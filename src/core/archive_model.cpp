#include "core/archive_model.hpp"

#include <stdexcept>
#include <utility>

namespace sda {
namespace {

using nlohmann::json;

const json& RequireField(const json& object, const std::string& context, const char* key) {
  const auto it = object.find(key);
  if (it == object.end()) {
    throw std::invalid_argument(context + "." + key + " is missing");
  }
  return *it;
}

void RequireObject(const json& value, const std::string& context) {
  if (!value.is_object()) {
    throw std::invalid_argument(context + " must be a JSON object");
  }
}

std::string ReadString(const json& object, const std::string& context, const char* key) {
  const auto& field = RequireField(object, context, key);
  if (!field.is_string()) {
    throw std::invalid_argument(context + "." + key + " must be a string");
  }
  return field.get<std::string>();
}

bool ReadBool(const json& object, const std::string& context, const char* key) {
  const auto& field = RequireField(object, context, key);
  if (!field.is_boolean()) {
    throw std::invalid_argument(context + "." + key + " must be a boolean");
  }
  return field.get<bool>();
}

std::int64_t ReadInt(const json& object, const std::string& context, const char* key) {
  const auto& field = RequireField(object, context, key);
  if (!field.is_number_integer()) {
    throw std::invalid_argument(context + "." + key + " must be an integer");
  }
  return field.get<std::int64_t>();
}

std::optional<std::string> ReadOptionalString(const json& object, const std::string& context,
                                              const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_string()) {
    throw std::invalid_argument(context + "." + key + " must be a string or null");
  }
  return it->get<std::string>();
}

std::optional<std::vector<std::string>> ReadOptionalStrings(const json& object,
                                                            const std::string& context,
                                                            const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_array()) {
    throw std::invalid_argument(context + "." + key + " must be an array or null");
  }
  std::vector<std::string> values;
  for (const auto& item : *it) {
    if (!item.is_string()) {
      throw std::invalid_argument(context + "." + key + " must only contain strings");
    }
    values.push_back(item.get<std::string>());
  }
  return values;
}

std::optional<std::vector<std::int64_t>> ReadOptionalInts(const json& object,
                                                          const std::string& context,
                                                          const char* key) {
  const auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return std::nullopt;
  }
  if (!it->is_array()) {
    throw std::invalid_argument(context + "." + key + " must be an array or null");
  }
  std::vector<std::int64_t> values;
  for (const auto& item : *it) {
    if (!item.is_number_integer()) {
      throw std::invalid_argument(context + "." + key + " must only contain integers");
    }
    values.push_back(item.get<std::int64_t>());
  }
  return values;
}

template <typename T>
json OptionalToJson(const std::optional<T>& value) {
  if (!value) {
    return nullptr;
  }
  return json(*value);
}

std::optional<Visibility> ReadOptionalVisibility(const json& object, const std::string& context) {
  const auto raw = ReadOptionalString(object, context, "visibility");
  if (!raw) {
    return std::nullopt;
  }
  const auto visibility = ParseVisibility(*raw);
  if (!visibility) {
    throw std::invalid_argument(context + ".visibility has unknown value '" + *raw + "'");
  }
  return visibility;
}

// The archive names the label "subject"; accept both spellings.
std::optional<std::string> ReadOptionalLabel(const json& object, const std::string& context) {
  if (object.contains("label")) {
    return ReadOptionalString(object, context, "label");
  }
  return ReadOptionalString(object, context, "subject");
}

}  // namespace

std::string_view LanguageToString(MetadataLanguage language) {
  switch (language) {
    case MetadataLanguage::kEnglish:
      return "english";
    case MetadataLanguage::kArabic:
      return "arabic";
  }
  return "english";
}

std::optional<MetadataLanguage> ParseLanguage(std::string_view value) {
  if (value == "english") {
    return MetadataLanguage::kEnglish;
  }
  if (value == "arabic") {
    return MetadataLanguage::kArabic;
  }
  return std::nullopt;
}

std::string_view VisibilityToString(Visibility visibility) {
  return visibility == Visibility::kPrivate ? "private" : "public";
}

std::optional<Visibility> ParseVisibility(std::string_view value) {
  if (value == "public") {
    return Visibility::kPublic;
  }
  if (value == "private") {
    return Visibility::kPrivate;
  }
  return std::nullopt;
}

std::string_view CrawlStatusToString(CrawlStatus status) {
  switch (status) {
    case CrawlStatus::kBadCrawl:
      return "BadCrawl";
    case CrawlStatus::kComplete:
      return "Complete";
    case CrawlStatus::kError:
      return "Error";
    case CrawlStatus::kPending:
      return "Pending";
  }
  return "Pending";
}

std::optional<CrawlStatus> ParseCrawlStatus(std::string_view value) {
  if (value == "BadCrawl") {
    return CrawlStatus::kBadCrawl;
  }
  if (value == "Complete") {
    return CrawlStatus::kComplete;
  }
  if (value == "Error") {
    return CrawlStatus::kError;
  }
  if (value == "Pending") {
    return CrawlStatus::kPending;
  }
  return std::nullopt;
}

Accession AccessionFromJson(const json& value) {
  const std::string context = "accession";
  RequireObject(value, context);

  Accession accession;
  accession.id = ReadInt(value, context, "id");
  accession.is_private = ReadBool(value, context, "is_private");
  const auto status = ReadString(value, context, "crawl_status");
  const auto parsed_status = ParseCrawlStatus(status);
  if (!parsed_status) {
    throw std::invalid_argument("accession.crawl_status has unknown value '" + status + "'");
  }
  accession.crawl_status = *parsed_status;
  accession.crawl_timestamp = ReadString(value, context, "crawl_timestamp");
  accession.seed_url = ReadString(value, context, "seed_url");
  accession.dublin_metadata_date = ReadString(value, context, "dublin_metadata_date");
  accession.dublin_metadata_format = ReadString(value, context, "dublin_metadata_format");
  accession.has_english_metadata = ReadBool(value, context, "has_english_metadata");
  accession.has_arabic_metadata = ReadBool(value, context, "has_arabic_metadata");
  accession.title_en = ReadOptionalString(value, context, "title_en");
  accession.title_ar = ReadOptionalString(value, context, "title_ar");
  accession.description_en = ReadOptionalString(value, context, "description_en");
  accession.description_ar = ReadOptionalString(value, context, "description_ar");
  accession.subjects_en = ReadOptionalStrings(value, context, "subjects_en");
  accession.subjects_ar = ReadOptionalStrings(value, context, "subjects_ar");
  accession.subjects_en_ids = ReadOptionalInts(value, context, "subjects_en_ids");
  accession.subjects_ar_ids = ReadOptionalInts(value, context, "subjects_ar_ids");
  return accession;
}

AccessionPage AccessionPageFromJson(const json& value) {
  const std::string context = "accession page";
  RequireObject(value, context);

  AccessionPage page;
  const auto& items = RequireField(value, context, "items");
  if (!items.is_array()) {
    throw std::invalid_argument("accession page.items must be an array");
  }
  for (const auto& item : items) {
    page.items.push_back(AccessionFromJson(item));
  }
  page.num_pages = ReadInt(value, context, "num_pages");
  page.page = ReadInt(value, context, "page");
  page.per_page = ReadInt(value, context, "per_page");
  return page;
}

AccessionDetail AccessionDetailFromJson(const json& value) {
  const std::string context = "accession detail";
  RequireObject(value, context);

  AccessionDetail detail;
  detail.accession = AccessionFromJson(RequireField(value, context, "accession"));
  detail.wacz_url = ReadString(value, context, "wacz_url");
  return detail;
}

Subject SubjectFromJson(const json& value) {
  const std::string context = "subject";
  RequireObject(value, context);

  Subject subject;
  subject.id = ReadInt(value, context, "id");
  auto label = ReadOptionalLabel(value, context);
  if (!label) {
    throw std::invalid_argument("subject.label (or subject.subject) is missing");
  }
  subject.label = std::move(*label);
  subject.visibility = ReadOptionalVisibility(value, context);
  return subject;
}

CreatedSubject CreatedSubjectFromJson(const json& value) {
  const std::string context = "created subject";
  RequireObject(value, context);

  CreatedSubject subject;
  const auto& id = RequireField(value, context, "id");
  if (!id.is_number_integer() && !id.is_string()) {
    throw std::invalid_argument("created subject.id must be an integer or a string");
  }
  subject.id = id;
  subject.label = ReadOptionalLabel(value, context);
  subject.visibility = ReadOptionalVisibility(value, context);
  return subject;
}

SubjectPage SubjectPageFromJson(const json& value) {
  const std::string context = "subject page";
  RequireObject(value, context);

  SubjectPage page;
  const auto& items = RequireField(value, context, "items");
  if (!items.is_array()) {
    throw std::invalid_argument("subject page.items must be an array");
  }
  for (const auto& item : items) {
    page.items.push_back(SubjectFromJson(item));
  }
  page.num_pages = ReadInt(value, context, "num_pages");
  page.page = ReadInt(value, context, "page");
  page.per_page = ReadInt(value, context, "per_page");
  return page;
}

json AccessionToJson(const Accession& accession) {
  return {{"id", accession.id},
          {"is_private", accession.is_private},
          {"crawl_status", CrawlStatusToString(accession.crawl_status)},
          {"crawl_timestamp", accession.crawl_timestamp},
          {"seed_url", accession.seed_url},
          {"dublin_metadata_date", accession.dublin_metadata_date},
          {"dublin_metadata_format", accession.dublin_metadata_format},
          {"has_english_metadata", accession.has_english_metadata},
          {"has_arabic_metadata", accession.has_arabic_metadata},
          {"title_en", OptionalToJson(accession.title_en)},
          {"title_ar", OptionalToJson(accession.title_ar)},
          {"description_en", OptionalToJson(accession.description_en)},
          {"description_ar", OptionalToJson(accession.description_ar)},
          {"subjects_en", OptionalToJson(accession.subjects_en)},
          {"subjects_ar", OptionalToJson(accession.subjects_ar)},
          {"subjects_en_ids", OptionalToJson(accession.subjects_en_ids)},
          {"subjects_ar_ids", OptionalToJson(accession.subjects_ar_ids)}};
}

json AccessionPageToJson(const AccessionPage& page) {
  json items = json::array();
  for (const auto& accession : page.items) {
    items.push_back(AccessionToJson(accession));
  }
  return {{"items", items},
          {"num_pages", page.num_pages},
          {"page", page.page},
          {"per_page", page.per_page}};
}

json AccessionDetailToJson(const AccessionDetail& detail) {
  return {{"accession", AccessionToJson(detail.accession)}, {"wacz_url", detail.wacz_url}};
}

json SubjectToJson(const Subject& subject) {
  json payload = {{"id", subject.id}, {"label", subject.label}};
  if (subject.visibility) {
    payload["visibility"] = VisibilityToString(*subject.visibility);
  }
  return payload;
}

json CreatedSubjectToJson(const CreatedSubject& subject) {
  json payload = {{"id", subject.id}};
  if (subject.label) {
    payload["label"] = *subject.label;
  }
  if (subject.visibility) {
    payload["visibility"] = VisibilityToString(*subject.visibility);
  }
  return payload;
}

json SubjectPageToJson(const SubjectPage& page) {
  json items = json::array();
  for (const auto& subject : page.items) {
    items.push_back(SubjectToJson(subject));
  }
  return {{"items", items},
          {"num_pages", page.num_pages},
          {"page", page.page},
          {"per_page", page.per_page}};
}

}  // namespace sda
