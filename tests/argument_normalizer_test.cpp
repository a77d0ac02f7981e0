#include <exception>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>

#include "core/argument_normalizer.hpp"
#include "core/errors.hpp"
#include "nlohmann/json.hpp"
#include "support/test_util.hpp"

namespace {

using nlohmann::json;
using sda::testing::Assert;

void ExpectValidationError(const std::function<void()>& action, const std::string& message) {
  try {
    action();
  } catch (const sda::ValidationError&) {
    return;
  }
  throw std::runtime_error("Expected ValidationError: " + message);
}

void TestSentinelPaginationIsOmitted() {
  const auto paging = sda::NormalizePagination(-1, -1);
  Assert(!paging.page.has_value(), "page -1 must normalize to unspecified");
  Assert(!paging.per_page.has_value(), "per_page -1 must normalize to unspecified");

  const auto explicit_paging = sda::NormalizePagination(0, 25);
  Assert(explicit_paging.page == 0, "page 0 is a real value");
  Assert(explicit_paging.per_page == 25, "per_page 25 must be kept");
}

void TestNegativePaginationIsRejected() {
  for (const std::int64_t value : {-2, -5, -100, -1000000}) {
    ExpectValidationError([value] { sda::NormalizePagination(value, -1); },
                          "page " + std::to_string(value));
    ExpectValidationError([value] { sda::NormalizePagination(-1, value); },
                          "per_page " + std::to_string(value));
  }
}

void TestMissingFieldsTakeSentinels() {
  const auto args = sda::ParseListAccessionsArgs(json::object());
  Assert(args.page == sda::kUnspecifiedInt, "missing page must parse as -1");
  Assert(args.per_page == sda::kUnspecifiedInt, "missing per_page must parse as -1");
  Assert(args.query_term.empty(), "missing query_term must parse as empty");
  Assert(args.metadata_subjects.empty(), "missing subjects must parse as []");

  const auto null_args = sda::ParseListSubjectsArgs(json{{"page", nullptr}});
  Assert(null_args.page == sda::kUnspecifiedInt, "null page must parse as -1");

  const auto query = sda::NormalizeListAccessions(args);
  Assert(!query.paging.page && !query.paging.per_page, "no paging expected");
  Assert(!query.lang && !query.query_term && !query.url_filter && !query.date_from &&
             !query.date_to,
         "no filters expected");
  Assert(!query.is_private, "is_private defaults to false");
}

void TestListAccessionsNormalization() {
  const json raw = {{"page", 2},
                    {"perPage", 10},
                    {"lang", "arabic"},
                    {"metadata_subjects", {3, 4}},
                    {"metadata_subjects_inclusive_filter", true},
                    {"query_term", "flood"},
                    {"url_filter", ""},
                    {"date_from", "2023-01-01"},
                    {"date_to", ""},
                    {"is_private", true}};
  const auto query = sda::NormalizeListAccessions(sda::ParseListAccessionsArgs(raw));
  Assert(query.paging.page == 2, "page mismatch");
  Assert(query.paging.per_page == 10, "perPage alias must populate per_page");
  Assert(query.lang == sda::MetadataLanguage::kArabic, "lang mismatch");
  Assert(query.metadata_subjects.size() == 2, "subjects mismatch");
  Assert(query.metadata_subjects_inclusive_filter, "inclusive filter mismatch");
  Assert(query.query_term == std::string{"flood"}, "query_term mismatch");
  Assert(!query.url_filter, "empty url_filter must be unspecified");
  Assert(query.date_from == std::string{"2023-01-01"}, "date_from mismatch");
  Assert(!query.date_to, "empty date_to must be unspecified");
  Assert(query.is_private, "is_private mismatch");
}

void TestWrongTypesAreRejected() {
  ExpectValidationError([] { sda::ParseListAccessionsArgs(json{{"page", "2"}}); },
                        "string page");
  ExpectValidationError([] { sda::ParseListAccessionsArgs(json{{"query_term", 5}}); },
                        "numeric query_term");
  ExpectValidationError(
      [] { sda::ParseListAccessionsArgs(json{{"metadata_subjects", {"a"}}}); },
      "string subject id");
  ExpectValidationError([] { sda::ParseListSubjectsArgs(json::array({1, 2})); },
                        "array arguments");
  ExpectValidationError(
      [] { sda::NormalizeListAccessions(sda::ParseListAccessionsArgs(json{{"lang", "french"}})); },
      "unknown language");
  ExpectValidationError(
      [] {
        sda::NormalizeListAccessions(
            sda::ParseListAccessionsArgs(json{{"metadata_subjects", {1, -3}}}));
      },
      "negative subject id");
}

void TestIdentifiers() {
  ExpectValidationError([] { sda::NormalizeIdentifier(""); }, "empty id");
  ExpectValidationError([] { sda::NormalizeIdentifier("   "); }, "blank id");
  ExpectValidationError([] { sda::NormalizeIdentifier(sda::ParseIdArgs(json::object()).id); },
                        "missing id");
  ExpectValidationError([] { sda::ParseIdArgs(json{{"id", -4}}); }, "negative numeric id");
  ExpectValidationError([] { sda::ParseIdArgs(json{{"id", true}}); }, "boolean id");

  Assert(sda::NormalizeIdentifier(" abc ") == "abc", "id must be trimmed");
  Assert(sda::ParseIdArgs(json{{"id", 42}}).id == "42", "numeric id must be stringified");
}

void TestOversizedIntegersAreRejected() {
  // Values above INT64_MAX arrive as unsigned JSON integers.
  ExpectValidationError(
      [] { sda::ParseListSubjectsArgs(json::parse(R"({"page":18446744073709551615})")); },
      "page 2^64-1 must not wrap to -1");
  ExpectValidationError(
      [] { sda::ParseListSubjectsArgs(json::parse(R"({"per_page":9223372036854775808})")); },
      "per_page 2^63");
  ExpectValidationError(
      [] {
        sda::ParseListAccessionsArgs(json::parse(R"({"metadata_subjects":[9223372036854775808]})"));
      },
      "subject id 2^63");

  const auto largest =
      sda::ParseListSubjectsArgs(json::parse(R"({"page":9223372036854775807})"));
  Assert(largest.page == 9223372036854775807LL, "INT64_MAX page must be accepted");
  Assert(sda::NormalizeListSubjects(largest).page.has_value(), "INT64_MAX page is specified");

  Assert(sda::ParseIdArgs(json::parse(R"({"id":18446744073709551615})")).id ==
             "18446744073709551615",
         "large numeric ids must be stringified exactly");
  Assert(sda::ParseIdArgs(json::parse(R"({"id":9223372036854775808})")).id ==
             "9223372036854775808",
         "2^63 id must be stringified exactly");
}

void TestUpdateAccessionPatch() {
  const json raw = {{"id", "17"},
                    {"is_private", true},
                    {"metadata_title", "New title"},
                    {"metadata_description", ""},
                    {"metadata_time", ""},
                    {"metadata_language", "english"},
                    {"metadata_subjects", json::array()}};
  const auto update = sda::NormalizeUpdateAccession(sda::ParseUpdateAccessionArgs(raw));
  Assert(update.id == "17", "update id mismatch");
  Assert(update.patch.is_private, "is_private mismatch");
  Assert(update.patch.metadata_title == std::string{"New title"}, "title mismatch");
  Assert(!update.patch.metadata_description, "empty description must be unspecified");
  Assert(!update.patch.metadata_time, "empty time must be unspecified");
  Assert(update.patch.metadata_language == sda::MetadataLanguage::kEnglish, "language mismatch");
  Assert(!update.patch.metadata_subjects, "[] subjects must be unspecified");

  ExpectValidationError(
      [] { sda::NormalizeUpdateAccession(sda::ParseUpdateAccessionArgs(json{{"id", ""}})); },
      "update without id");
}

void TestCreateSubject() {
  const auto subject = sda::NormalizeCreateSubject(
      sda::ParseCreateSubjectArgs(json{{"label", "Health"}, {"visibility", "public"}}));
  Assert(subject.label == "Health", "label mismatch");
  Assert(subject.visibility == sda::Visibility::kPublic, "visibility mismatch");
  Assert(!subject.lang, "lang must be unspecified");

  const auto unspecified = sda::NormalizeCreateSubject(
      sda::ParseCreateSubjectArgs(json{{"label", "Education"}, {"visibility", ""}}));
  Assert(!unspecified.visibility, "empty visibility must be unspecified");

  ExpectValidationError(
      [] { sda::NormalizeCreateSubject(sda::ParseCreateSubjectArgs(json{{"label", ""}})); },
      "empty label");
  ExpectValidationError(
      [] { sda::NormalizeCreateSubject(sda::ParseCreateSubjectArgs(json{{"label", "  "}})); },
      "blank label");
  ExpectValidationError(
      [] {
        sda::NormalizeCreateSubject(
            sda::ParseCreateSubjectArgs(json{{"label", "Health"}, {"visibility", "secret"}}));
      },
      "unknown visibility");
}

void TestDeleteSubject() {
  const auto deletion = sda::NormalizeDeleteSubject(
      sda::ParseDeleteSubjectArgs(json{{"id", 9}, {"lang", "none"}}));
  Assert(deletion.id == "9", "delete id mismatch");
  Assert(!deletion.lang, "'none' language must be unspecified");
  ExpectValidationError(
      [] { sda::NormalizeDeleteSubject(sda::ParseDeleteSubjectArgs(json{{"id", ""}})); },
      "delete without id");
}

}  // namespace

int main() {
  try {
    TestSentinelPaginationIsOmitted();
    TestNegativePaginationIsRejected();
    TestMissingFieldsTakeSentinels();
    TestListAccessionsNormalization();
    TestWrongTypesAreRejected();
    TestIdentifiers();
    TestOversizedIntegersAreRejected();
    TestUpdateAccessionPatch();
    TestCreateSubject();
    TestDeleteSubject();
  } catch (const std::exception& ex) {
    std::cerr << "argument_normalizer_test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
