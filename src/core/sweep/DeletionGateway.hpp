#pragma once
#include <cstdint>
#include <string>

struct DeletionResult {
  bool        success = false;
  std::string error_message;  // set when !success
  std::string gateway_ref;    // set when success
};

// Accepts one deletion intent per physical instance. A failure is reported in the
// result; an implementation may instead throw GatewayFailure, which callers treat
// as a failure of the same call.
class DeletionGateway {
public:
  virtual ~DeletionGateway() = default;
  virtual DeletionResult requestDeletion(int64_t file_id, const std::string& instance_path) = 0;
};
