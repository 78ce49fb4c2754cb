#include "ArchivesIndex.hpp"
#include "core/errors/Errors.hpp"

#include <pqxx/pqxx>
#include <spdlog/spdlog.h>

namespace ssd {

static std::string quoteConnValue(const std::string& v) {
  std::string out = "'";
  for (char c : v) {
    if (c == '\'' || c == '\\') out += '\\';
    out += c;
  }
  return out + "'";
}

static std::vector<FileInstance> toInstances(const pqxx::result& res) {
  std::vector<FileInstance> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back({row["file_id"].as<int64_t>(),
                   row["file_server_directories"].as<std::string>(),
                   row["filename"].as<std::string>(),
                   row["size"].is_null() ? 0 : row["size"].as<int64_t>()});
  }
  return out;
}

ArchivesIndex::ArchivesIndex(const ArchivesDbConfig& cfg) {
  const std::string connStr = "host=" + quoteConnValue(cfg.host) +
                              " dbname=" + quoteConnValue(cfg.dbname) +
                              " user=" + quoteConnValue(cfg.user) +
                              " password=" + quoteConnValue(cfg.password);
  try {
    conn_ = std::make_unique<pqxx::connection>(connStr);
    initPrepared();
  } catch (const std::exception& e) {
    throw QueryFailure("cannot connect to archives database at " + cfg.host + ": " + e.what());
  }
  spdlog::info("Connected to archives database {} on {}", cfg.dbname, cfg.host);
}

ArchivesIndex::~ArchivesIndex() = default;

void ArchivesIndex::initPrepared() const {
  // Non-recursive: only instances whose directory is exactly the target.
  conn_->prepare("find_duplicates_in_location", R"SQL(
    WITH locs AS (
      SELECT fl.file_id,
             fl.file_server_directories,
             fl.filename,
             f.size,
             (SELECT COUNT(*) FROM file_locations all_fl WHERE all_fl.file_id = fl.file_id) AS loc_count
      FROM file_locations fl
      JOIN files f ON f.id = fl.file_id
      WHERE fl.file_server_directories = $1
    )
    SELECT file_id, file_server_directories, filename, size
    FROM locs
    WHERE loc_count > 1
    ORDER BY file_id, filename
  )SQL");

  conn_->prepare("get_all_locations_for_file", R"SQL(
    SELECT fl.file_id, fl.file_server_directories, fl.filename, f.size
    FROM file_locations fl
    JOIN files f ON f.id = fl.file_id
    WHERE fl.file_id = $1
    ORDER BY fl.file_server_directories, fl.filename
  )SQL");
}

std::vector<FileInstance> ArchivesIndex::findDuplicatesUnder(const std::string& directory) {
  try {
    pqxx::read_transaction txn(*conn_);
    const auto res = txn.exec_prepared("find_duplicates_in_location", directory);
    spdlog::debug("find_duplicates_in_location('{}') -> {} rows", directory, res.size());
    return toInstances(res);
  } catch (const std::exception& e) {
    throw QueryFailure("duplicate query for '" + directory + "' failed: " + e.what());
  }
}

std::vector<FileInstance> ArchivesIndex::findAllLocations(int64_t file_id) {
  try {
    pqxx::read_transaction txn(*conn_);
    const auto res = txn.exec_prepared("get_all_locations_for_file", file_id);
    return toInstances(res);
  } catch (const std::exception& e) {
    throw QueryFailure("location query for file " + std::to_string(file_id) + " failed: " + e.what());
  }
}

} // namespace ssd
