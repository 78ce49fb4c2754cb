#include "Config.hpp"
#include "core/errors/Errors.hpp"
#include "core/tracking/TrackingStore.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ---------- helpers ----------

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static std::string trim(const std::string& s) {
  const auto b = s.find_first_not_of(" \t\r\n");
  if (b == std::string::npos) return "";
  const auto e = s.find_last_not_of(" \t\r\n");
  return s.substr(b, e - b + 1);
}

static std::vector<std::string> splitList(const std::string& s) {
  std::vector<std::string> out;
  std::stringstream ss(s);
  for (std::string item; std::getline(ss, item, ',');) {
    item = trim(item);
    if (!item.empty()) out.push_back(item);
  }
  return out;
}

bool loadDotEnv(const std::string& path) {
  std::ifstream in(path);
  if (!in) return false;

  for (std::string line; std::getline(in, line);) {
    line = trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (line.rfind("export ", 0) == 0) line = trim(line.substr(7));

    const auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    const std::string key = trim(line.substr(0, eq));
    std::string value = trim(line.substr(eq + 1));
    if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
        value.back() == value.front()) {
      value = value.substr(1, value.size() - 2);
    }
    if (!key.empty()) setenv(key.c_str(), value.c_str(), /*overwrite=*/0);
  }
  return true;
}

// ---------- AppConfig ----------

std::string AppConfig::localStorePath() const {
  return (fs::path(stagingDir) / TrackingStore::kFileName).string();
}

std::string AppConfig::sharedStorePath() const {
  return (fs::path(sweepDbLocation) / TrackingStore::kFileName).string();
}

AppConfig loadConfig(ConfigScope scope) {
  AppConfig cfg;
  std::vector<std::string> missing;

  auto required = [&](const char* key, std::string& into) {
    const char* v = std::getenv(key);
    if (!v || !*v) missing.emplace_back(key);
    else into = v;
  };

  required("SWEEP_DB_LOCATION", cfg.sweepDbLocation);
  if (scope == ConfigScope::Sweep) {
    required("ARCHIVES_DB_HOST", cfg.archivesDbHost);
    required("ARCHIVES_DB_NAME", cfg.archivesDbName);
    required("ARCHIVES_DB_USER", cfg.archivesDbUser);
    required("ARCHIVES_DB_PASSWORD", cfg.archivesDbPassword);
    required("ARCHIVES_APP_URL", cfg.archivesAppUrl);
    required("ARCHIVES_APP_USER", cfg.archivesAppUser);
    required("ARCHIVES_APP_PASSWORD", cfg.archivesAppPassword);
    required("FILE_SERVER_MOUNT", cfg.fileServerMount);
  }

  if (!missing.empty()) {
    std::string msg = "missing required environment variables:";
    for (const auto& m : missing) msg += " " + m;
    throw ConfigError(msg);
  }

  cfg.stagingDir = get_env_or("SWEEP_STAGING_DIR", ".");
  cfg.viewer = get_env_or("SWEEP_VIEWER", "xdg-open");
  cfg.filters = splitList(get_env_or("SWEEP_FILTERS", ""));

  const std::string interval = get_env_or("SWEEP_SYNC_INTERVAL_SECONDS", "600");
  try {
    size_t used = 0;
    const long secs = std::stol(interval, &used);
    if (used != interval.size() || secs < 0 || secs > kMaxSyncIntervalSeconds) {
      throw std::invalid_argument(interval);
    }
    cfg.syncInterval = std::chrono::seconds(secs);
  } catch (const std::exception&) {
    throw ConfigError("SWEEP_SYNC_INTERVAL_SECONDS must be an integer from 0 to " +
                      std::to_string(kMaxSyncIntervalSeconds) + ", got '" + interval + "'");
  }
  return cfg;
}
