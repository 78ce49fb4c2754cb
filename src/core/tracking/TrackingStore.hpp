#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct ProcessedFileRecord {
  int64_t     id;
  int64_t     file_id;
  std::string decision;       // "kept" | "deleted"
  std::string location_path;  // sweep location the decision was made in
  std::string note;
  int64_t     processed_at;
};

struct DeletedFileRecord {
  int64_t     id;
  int64_t     processed_file_id;
  int64_t     file_id;
  std::string path;
  int64_t     file_size;
  std::string gateway_ref;
  int64_t     deleted_at;
};

struct ErrorRecord {
  int64_t                id;
  std::string            operation;
  std::optional<int64_t> file_id;
  std::string            message;
  std::optional<std::string> context;
  int64_t                occurred_at;
};

struct ProcessedLocationRecord {
  int64_t     id;
  std::string location_path;
  std::string archive_path;
  int64_t     duplicates_count;
  int64_t     processed_at;
};

// One successful gateway call, as handed to recordDeleted().
struct Deletion {
  std::string path;
  int64_t     size;
  std::string gateway_ref;
};

struct StoreCounts {
  int64_t processed_locations = 0;
  int64_t processed_files = 0;
  int64_t deleted_files = 0;
  int64_t errors = 0;
};

// Local SQLite copy of the sweep history, mirrored to a shared location.
//
// The local file is authoritative. The constructor refreshes it from the shared
// copy when that one is newer; sync() publishes it back with a temp-file-and-rename
// so the shared file is never seen half written. Mutations and the local snapshot
// taken by sync() share one mutex; the write to the shared location happens after
// that mutex is released, so sync() may run from a background thread without
// holding up the operator.
class TrackingStore {
public:
  static constexpr const char* kFileName = "sweep_db.sqlite";

  // Throws StoreUnavailable when neither copy exists.
  TrackingStore(const std::string& localPath, const std::string& sharedPath);
  ~TrackingStore();

  TrackingStore(const TrackingStore&) = delete;
  TrackingStore& operator=(const TrackingStore&) = delete;

  bool isProcessed(int64_t file_id);

  void recordKept(int64_t file_id, const std::string& location_path, const std::string& note);

  // Throws ConsistencyViolation if deletions is empty.
  void recordDeleted(int64_t file_id,
                     const std::string& location_path,
                     const std::string& note,
                     const std::vector<Deletion>& deletions);

  void recordError(const std::string& operation,
                   std::optional<int64_t> file_id,
                   const std::string& message,
                   const std::optional<std::string>& context = std::nullopt);

  void recordLocationComplete(const std::string& location_path,
                              const std::string& archive_path,
                              int64_t duplicates_count);

  // Throws SyncFailed; the local store stays usable either way.
  void sync();

  std::optional<ProcessedFileRecord> processedFile(int64_t file_id);
  std::vector<DeletedFileRecord> deletedFiles(int64_t file_id);
  std::vector<ErrorRecord> errors();
  std::vector<ProcessedLocationRecord> processedLocations();
  StoreCounts counts();

  const std::string& localPath() const { return localPath_; }
  const std::string& sharedPath() const { return sharedPath_; }

private:
  void copyDownIfStale();
  void open();

  std::string localPath_;
  std::string sharedPath_;
  std::mutex mu_;      // database handle
  std::mutex syncMu_;  // one publish at a time
  void* db_; // sqlite3*
};
