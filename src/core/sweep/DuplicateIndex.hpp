#pragma once
#include <cstdint>
#include <string>
#include <vector>

// One physical copy of an archived file.
struct FileInstance {
  int64_t     file_id;
  std::string directory;  // archive form, e.g. "42xx Housing/4203/Bids"
  std::string filename;
  int64_t     size;
};

// Read side of the archive database. Implementations throw QueryFailure.
class DuplicateIndex {
public:
  virtual ~DuplicateIndex() = default;

  // Instances directly in `directory` whose file_id has more than one location
  // anywhere in the archive.
  virtual std::vector<FileInstance> findDuplicatesUnder(const std::string& directory) = 0;

  virtual std::vector<FileInstance> findAllLocations(int64_t file_id) = 0;
};
