#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace sda {

enum class MetadataLanguage { kEnglish = 0, kArabic };
enum class Visibility { kPublic = 0, kPrivate };
enum class CrawlStatus { kBadCrawl = 0, kComplete, kError, kPending };

std::string_view LanguageToString(MetadataLanguage language);
std::optional<MetadataLanguage> ParseLanguage(std::string_view value);
std::string_view VisibilityToString(Visibility visibility);
std::optional<Visibility> ParseVisibility(std::string_view value);
std::string_view CrawlStatusToString(CrawlStatus status);
std::optional<CrawlStatus> ParseCrawlStatus(std::string_view value);

// Normalized request values. None of these can carry a sentinel: an absent
// std::optional means the parameter is left out of the request entirely.

struct PageRequest {
  std::optional<std::int64_t> page;
  std::optional<std::int64_t> per_page;
};

struct AccessionQuery {
  PageRequest paging;
  std::optional<MetadataLanguage> lang;
  std::vector<std::int64_t> metadata_subjects;
  bool metadata_subjects_inclusive_filter = false;
  std::optional<std::string> query_term;
  std::optional<std::string> url_filter;
  std::optional<std::string> date_from;
  std::optional<std::string> date_to;
  bool is_private = false;
};

struct AccessionPatch {
  bool is_private = false;
  std::optional<std::string> metadata_title;
  std::optional<std::string> metadata_description;
  std::optional<std::string> metadata_time;
  std::optional<MetadataLanguage> metadata_language;
  std::optional<std::vector<std::int64_t>> metadata_subjects;
};

struct AccessionUpdate {
  std::string id;
  AccessionPatch patch;
};

struct NewSubject {
  std::string label;
  std::optional<Visibility> visibility;
  std::optional<MetadataLanguage> lang;
};

struct SubjectDeletion {
  std::string id;
  std::optional<MetadataLanguage> lang;
};

// Remote records. Request-scoped copies only; the archive owns the data.

struct Accession {
  std::int64_t id = 0;
  bool is_private = false;
  CrawlStatus crawl_status = CrawlStatus::kPending;
  std::string crawl_timestamp;
  std::string seed_url;
  std::string dublin_metadata_date;
  std::string dublin_metadata_format;
  bool has_english_metadata = false;
  bool has_arabic_metadata = false;
  std::optional<std::string> title_en;
  std::optional<std::string> title_ar;
  std::optional<std::string> description_en;
  std::optional<std::string> description_ar;
  std::optional<std::vector<std::string>> subjects_en;
  std::optional<std::vector<std::string>> subjects_ar;
  std::optional<std::vector<std::int64_t>> subjects_en_ids;
  std::optional<std::vector<std::int64_t>> subjects_ar_ids;
};

struct AccessionPage {
  std::vector<Accession> items;
  std::int64_t num_pages = 0;
  std::int64_t page = 0;
  std::int64_t per_page = 0;
};

struct AccessionDetail {
  Accession accession;
  std::string wacz_url;
};

struct Subject {
  std::int64_t id = 0;
  std::string label;
  std::optional<Visibility> visibility;
};

// Reply to a create request. The archive may answer with only the new id,
// which is an integer or a string.
struct CreatedSubject {
  nlohmann::json id;
  std::optional<std::string> label;
  std::optional<Visibility> visibility;
};

struct SubjectPage {
  std::vector<Subject> items;
  std::int64_t num_pages = 0;
  std::int64_t page = 0;
  std::int64_t per_page = 0;
};

// Decoders throw std::invalid_argument naming the offending field when the
// payload does not have the expected shape.
Accession AccessionFromJson(const nlohmann::json& value);
AccessionPage AccessionPageFromJson(const nlohmann::json& value);
AccessionDetail AccessionDetailFromJson(const nlohmann::json& value);
Subject SubjectFromJson(const nlohmann::json& value);
CreatedSubject CreatedSubjectFromJson(const nlohmann::json& value);
SubjectPage SubjectPageFromJson(const nlohmann::json& value);

nlohmann::json AccessionToJson(const Accession& accession);
nlohmann::json AccessionPageToJson(const AccessionPage& page);
nlohmann::json AccessionDetailToJson(const AccessionDetail& detail);
nlohmann::json SubjectToJson(const Subject& subject);
nlohmann::json CreatedSubjectToJson(const CreatedSubject& subject);
nlohmann::json SubjectPageToJson(const SubjectPage& page);

}  // namespace sda
