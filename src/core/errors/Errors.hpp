#pragma once
#include <stdexcept>
#include <string>

// Neither the local nor the shared copy of the tracking store exists.
struct StoreUnavailable : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// initDatabase() found a file already sitting at the target path.
struct AlreadyExists : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Any SQLite-level failure on the local store.
struct StoreError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Publishing to the shared location failed. The local store is still valid.
struct SyncFailed : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// The archive database was unreachable or answered with something unusable.
struct QueryFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct GatewayFailure : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct MalformedPath : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct ConfigError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

// A processed_files row would be written without the records that justify it.
// Programming error, never recovered from.
struct ConsistencyViolation : std::logic_error {
  using std::logic_error::logic_error;
};
