#pragma once

#include <string>

#include "core/archive_model.hpp"
#include "core/config.hpp"
#include "nlohmann/json.hpp"
#include "platform/http_client.hpp"

namespace sda {

// One authenticated HTTP request per call against the archive API. Failures
// surface as ApiError; nothing is retried or cached. Holds no mutable state,
// so a single instance may be shared by concurrent tool calls.
class ArchiveClient {
 public:
  explicit ArchiveClient(const BridgeConfig& config);

  AccessionPage ListAccessions(const AccessionQuery& query) const;
  AccessionPage ListPrivateAccessions(const AccessionQuery& query) const;
  AccessionDetail GetAccession(const std::string& id) const;
  AccessionDetail GetPrivateAccession(const std::string& id) const;
  AccessionDetail UpdateAccession(const std::string& id, const AccessionPatch& patch) const;

  SubjectPage ListSubjects(const PageRequest& paging) const;
  CreatedSubject CreateSubject(const NewSubject& subject) const;
  void DeleteSubject(const SubjectDeletion& deletion) const;

 private:
  platform::HttpClientResponse Send(const std::string& method, const std::string& path,
                                    const platform::QueryParams& query,
                                    const std::string& body) const;

  platform::HttpClient http_;
};

// Request builders, exposed for tests.
platform::QueryParams BuildPageQuery(const PageRequest& paging);
platform::QueryParams BuildAccessionQuery(const AccessionQuery& query);
nlohmann::json BuildAccessionPatchBody(const AccessionPatch& patch);
nlohmann::json BuildNewSubjectBody(const NewSubject& subject);

// Picks the most useful human-readable message out of an error response.
std::string DescribeErrorResponse(const platform::HttpClientResponse& response);

}  // namespace sda
