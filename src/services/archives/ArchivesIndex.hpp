#pragma once
#include "core/sweep/DuplicateIndex.hpp"

#include <memory>
#include <string>
#include <pqxx/connection>

namespace ssd {

struct ArchivesDbConfig {
  std::string host;
  std::string dbname;
  std::string user;
  std::string password;
};

// DuplicateIndex over the Archives App PostgreSQL database
// (file_locations joined to files). Every libpqxx error surfaces as QueryFailure.
class ArchivesIndex : public DuplicateIndex {
public:
  explicit ArchivesIndex(const ArchivesDbConfig& cfg);
  ~ArchivesIndex() override;

  std::vector<FileInstance> findDuplicatesUnder(const std::string& directory) override;
  std::vector<FileInstance> findAllLocations(int64_t file_id) override;

private:
  void initPrepared() const;

  std::unique_ptr<pqxx::connection> conn_;
};

} // namespace ssd
