#pragma once
#include <functional>
#include <string>
#include <vector>

// Schema version written to PRAGMA user_version and checked on open.
constexpr int kTrackingSchemaVersion = 1;

// Creates an empty tracking store at dbPath. Throws AlreadyExists if any file is
// already there, StoreError on SQLite failure.
void initDatabase(const std::string& dbPath);

// Replaces the store pair with a fresh one: a new local file, published to sharedPath.
// Existing files (either copy, which may hold decisions found nowhere else) are
// passed to confirmOverwrite and removed only if it returns true; returns false
// when it declines, with nothing touched. Throws SyncFailed before removing
// anything if the shared directory is not reachable.
bool createTrackingStore(const std::string& localPath,
                         const std::string& sharedPath,
                         const std::function<bool(const std::vector<std::string>&)>& confirmOverwrite);
