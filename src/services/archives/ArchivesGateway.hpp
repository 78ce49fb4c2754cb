#pragma once
#include "core/sweep/DeletionGateway.hpp"

#include <string>

namespace ssd {

struct ArchivesAppConfig {
  std::string url;       // "archives.example.edu" or "http(s)://host[:port]"
  std::string user;
  std::string password;
  int         timeoutSeconds = 30;
};

// Enqueues deletions through the Archives App server_change API.
class ArchivesGateway : public DeletionGateway {
public:
  explicit ArchivesGateway(ArchivesAppConfig cfg);

  DeletionResult requestDeletion(int64_t file_id, const std::string& instance_path) override;

  const std::string& baseUrl() const { return baseUrl_; }

private:
  ArchivesAppConfig cfg_;
  std::string baseUrl_;     // scheme://host[:port]
  std::string pathPrefix_;  // any path component of the configured URL
};

// Pulls a reference for the enqueued task out of a response body; falls back to
// "HTTP <status>" when the body is not JSON or carries no id.
std::string gatewayRefFromResponse(int status, const std::string& body);

} // namespace ssd
