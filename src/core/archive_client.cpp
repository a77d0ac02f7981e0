#include "core/archive_client.hpp"

#include <chrono>
#include <utility>

#include "core/errors.hpp"
#include "core/logging.hpp"

namespace sda {
namespace {

using logging::LogDebug;
using logging::LogWarn;
using nlohmann::json;

constexpr char kAccessionsPath[] = "/api/v1/accessions";
constexpr char kPrivateAccessionsPath[] = "/api/v1/accessions/private";
constexpr char kSubjectsPath[] = "/api/v1/metadata-subjects";
constexpr std::size_t kMaxErrorMessageLength = 512;

bool IsSuccess(int status) { return status >= 200 && status < 300; }

std::string Truncate(std::string value) {
  if (value.size() > kMaxErrorMessageLength) {
    value.resize(kMaxErrorMessageLength);
    value += "...";
  }
  return value;
}

// Parses a 2xx body and runs `decode` over it; any mismatch is a decode error.
template <typename Decoder>
auto DecodeBody(const platform::HttpClientResponse& response, const std::string& context,
                Decoder decode) -> decltype(decode(json{})) {
  const auto parsed = json::parse(response.body, nullptr, false);
  if (parsed.is_discarded()) {
    std::string message = context + ": response body is not valid JSON";
    if (!response.content_type.empty()) {
      message += " (Content-Type: " + response.content_type + ")";
    }
    throw ApiError(ApiErrorOrigin::kDecode, message, response.status);
  }
  try {
    return decode(parsed);
  } catch (const std::invalid_argument& ex) {
    throw ApiError(ApiErrorOrigin::kDecode, context + ": " + ex.what(), response.status);
  } catch (const json::exception& ex) {
    throw ApiError(ApiErrorOrigin::kDecode, context + ": " + ex.what(), response.status);
  }
}

}  // namespace

platform::QueryParams BuildPageQuery(const PageRequest& paging) {
  platform::QueryParams query;
  if (paging.page) {
    query.emplace_back("page", std::to_string(*paging.page));
  }
  if (paging.per_page) {
    query.emplace_back("per_page", std::to_string(*paging.per_page));
  }
  return query;
}

platform::QueryParams BuildAccessionQuery(const AccessionQuery& query) {
  auto params = BuildPageQuery(query.paging);
  if (query.lang) {
    params.emplace_back("lang", std::string{LanguageToString(*query.lang)});
  }
  for (const auto subject : query.metadata_subjects) {
    params.emplace_back("metadata_subjects", std::to_string(subject));
  }
  if (query.metadata_subjects_inclusive_filter) {
    params.emplace_back("metadata_subjects_inclusive_filter", "true");
  }
  if (query.query_term) {
    params.emplace_back("query_term", *query.query_term);
  }
  if (query.url_filter) {
    params.emplace_back("url_filter", *query.url_filter);
  }
  if (query.date_from) {
    params.emplace_back("date_from", *query.date_from);
  }
  if (query.date_to) {
    params.emplace_back("date_to", *query.date_to);
  }
  if (query.is_private) {
    params.emplace_back("is_private", "true");
  }
  return params;
}

json BuildAccessionPatchBody(const AccessionPatch& patch) {
  json body = json::object();
  body["is_private"] = patch.is_private;
  if (patch.metadata_title) {
    body["metadata_title"] = *patch.metadata_title;
  }
  if (patch.metadata_description) {
    body["metadata_description"] = *patch.metadata_description;
  }
  if (patch.metadata_time) {
    body["metadata_time"] = *patch.metadata_time;
  }
  if (patch.metadata_language) {
    body["metadata_language"] = LanguageToString(*patch.metadata_language);
  }
  if (patch.metadata_subjects) {
    body["metadata_subjects"] = *patch.metadata_subjects;
  }
  return body;
}

json BuildNewSubjectBody(const NewSubject& subject) {
  json body = {{"label", subject.label}};
  if (subject.visibility) {
    body["visibility"] = VisibilityToString(*subject.visibility);
  }
  if (subject.lang) {
    body["lang"] = LanguageToString(*subject.lang);
  }
  return body;
}

std::string DescribeErrorResponse(const platform::HttpClientResponse& response) {
  const auto parsed = json::parse(response.body, nullptr, false);
  if (!parsed.is_discarded()) {
    if (parsed.is_object()) {
      for (const char* key : {"message", "error", "detail"}) {
        if (const auto it = parsed.find(key); it != parsed.end() && it->is_string() &&
                                              !it->get<std::string>().empty()) {
          return Truncate(it->get<std::string>());
        }
      }
    } else if (parsed.is_string() && !parsed.get<std::string>().empty()) {
      return Truncate(parsed.get<std::string>());
    }
  } else {
    const auto first = response.body.find_first_not_of(" \t\r\n");
    if (first != std::string::npos) {
      const auto last = response.body.find_last_not_of(" \t\r\n");
      return Truncate(response.body.substr(first, last - first + 1));
    }
  }
  return "HTTP " + std::to_string(response.status) + " " +
         platform::StatusMessage(response.status);
}

ArchiveClient::ArchiveClient(const BridgeConfig& config)
    : http_(config.base_url,
            {{"x-api-key", config.api_key}, {"Accept", "application/json"}},
            config.timeout_seconds) {}

platform::HttpClientResponse ArchiveClient::Send(const std::string& method,
                                                 const std::string& path,
                                                 const platform::QueryParams& query,
                                                 const std::string& body) const {
  const auto target = http_.BuildTarget(path, query);
  const auto started = std::chrono::steady_clock::now();
  platform::HttpClientResponse response;
  try {
    if (method == "GET") {
      response = http_.Get(path, query);
    } else if (method == "POST") {
      response = http_.Post(path, body);
    } else if (method == "PUT") {
      response = http_.Put(path, body);
    } else {
      response = http_.Delete(path, body);
    }
  } catch (const platform::HttpTransportError& ex) {
    LogWarn("archive.request.transport_error method=" + method + " target=" + target +
            " error=\"" + ex.what() + "\"");
    throw ApiError(ApiErrorOrigin::kTransport, ex.what());
  }

  const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - started)
                              .count();
  LogDebug("archive.request method=" + method + " target=" + target +
           " status=" + std::to_string(response.status) +
           " elapsed_ms=" + std::to_string(elapsed_ms));

  if (!IsSuccess(response.status)) {
    throw ApiError(ApiErrorOrigin::kHttpStatus,
                   method + " " + target + " returned HTTP " + std::to_string(response.status) +
                       ": " + DescribeErrorResponse(response),
                   response.status);
  }
  return response;
}

AccessionPage ArchiveClient::ListAccessions(const AccessionQuery& query) const {
  const auto response = Send("GET", kAccessionsPath, BuildAccessionQuery(query), {});
  return DecodeBody(response, "list accessions", AccessionPageFromJson);
}

AccessionPage ArchiveClient::ListPrivateAccessions(const AccessionQuery& query) const {
  const auto response = Send("GET", kPrivateAccessionsPath, BuildAccessionQuery(query), {});
  return DecodeBody(response, "list private accessions", AccessionPageFromJson);
}

AccessionDetail ArchiveClient::GetAccession(const std::string& id) const {
  const auto response =
      Send("GET", std::string{kAccessionsPath} + "/" + platform::UrlEncode(id), {}, {});
  return DecodeBody(response, "get accession", AccessionDetailFromJson);
}

AccessionDetail ArchiveClient::GetPrivateAccession(const std::string& id) const {
  const auto response =
      Send("GET", std::string{kPrivateAccessionsPath} + "/" + platform::UrlEncode(id), {}, {});
  return DecodeBody(response, "get private accession", AccessionDetailFromJson);
}

AccessionDetail ArchiveClient::UpdateAccession(const std::string& id,
                                               const AccessionPatch& patch) const {
  const auto response = Send("PUT", std::string{kAccessionsPath} + "/" + platform::UrlEncode(id),
                             {}, BuildAccessionPatchBody(patch).dump());
  return DecodeBody(response, "update accession", AccessionDetailFromJson);
}

SubjectPage ArchiveClient::ListSubjects(const PageRequest& paging) const {
  const auto response = Send("GET", kSubjectsPath, BuildPageQuery(paging), {});
  return DecodeBody(response, "list subjects", SubjectPageFromJson);
}

CreatedSubject ArchiveClient::CreateSubject(const NewSubject& subject) const {
  const auto response = Send("POST", kSubjectsPath, {}, BuildNewSubjectBody(subject).dump());
  return DecodeBody(response, "create subject", CreatedSubjectFromJson);
}

void ArchiveClient::DeleteSubject(const SubjectDeletion& deletion) const {
  std::string body;
  if (deletion.lang) {
    body = json{{"lang", LanguageToString(*deletion.lang)}}.dump();
  }
  Send("DELETE", std::string{kSubjectsPath} + "/" + platform::UrlEncode(deletion.id), {}, body);
}

}  // namespace sda
