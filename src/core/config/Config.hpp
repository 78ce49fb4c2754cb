#pragma once
#include <chrono>
#include <string>
#include <vector>

// What the invoked command needs; Store-only commands skip the archive settings.
// Upper bound for SWEEP_SYNC_INTERVAL_SECONDS (one day).
constexpr long kMaxSyncIntervalSeconds = 86400;

enum class ConfigScope { Store, Sweep };

struct AppConfig {
  // Archive database (Duplicate Index)
  std::string archivesDbHost;
  std::string archivesDbName;
  std::string archivesDbUser;
  std::string archivesDbPassword;

  // Archives App (Deletion Gateway)
  std::string archivesAppUrl;
  std::string archivesAppUser;
  std::string archivesAppPassword;

  std::string sweepDbLocation;   // shared directory
  std::string stagingDir = ".";  // local working copy directory
  std::string fileServerMount;

  std::chrono::seconds syncInterval{600};
  std::vector<std::string> filters;
  std::string viewer = "xdg-open";

  std::string localStorePath() const;
  std::string sharedStorePath() const;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads KEY=VALUE lines into the process environment without overriding variables
// that are already set. Blank lines and '#' comments are ignored; values may be
// single- or double-quoted. Returns false when the file does not exist.
bool loadDotEnv(const std::string& path);

// Throws ConfigError naming every missing variable at once.
AppConfig loadConfig(ConfigScope scope);
