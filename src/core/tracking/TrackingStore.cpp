#include "TrackingStore.hpp"
#include "InitDb.hpp"
#include "core/errors/Errors.hpp"

#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// ---------- helpers ----------

static int64_t now() { return static_cast<int64_t>(std::time(nullptr)); }

static void execAll(sqlite3* db, const char* sql) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StoreError(std::string("SQLite exec failed (") + sql + "): " + msg);
  }
}

namespace {

// Finalizes on scope exit so a throw between prepare and step cannot leak.
struct Stmt {
  sqlite3* db;
  sqlite3_stmt* st = nullptr;

  Stmt(sqlite3* d, const char* sql) : db(d) {
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
      std::string err = sqlite3_errmsg(db);
      sqlite3_finalize(st);
      throw StoreError("prepare failed: " + err);
    }
  }
  ~Stmt() { sqlite3_finalize(st); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  void done(const char* what) {
    if (sqlite3_step(st) != SQLITE_DONE) {
      throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
    }
  }
  bool row(const char* what) {
    int rc = sqlite3_step(st);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError(std::string(what) + " failed: " + sqlite3_errmsg(db));
  }
  std::string text(int col) const {
    auto* p = sqlite3_column_text(st, col);
    return p ? reinterpret_cast<const char*>(p) : std::string();
  }
  int64_t i64(int col) const { return sqlite3_column_int64(st, col); }
  bool isNull(int col) const { return sqlite3_column_type(st, col) == SQLITE_NULL; }
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was reached.
struct Txn {
  sqlite3* db;
  bool committed = false;
  explicit Txn(sqlite3* d) : db(d) { execAll(db, "BEGIN IMMEDIATE;"); }
  ~Txn() {
    if (!committed) sqlite3_exec(db, "ROLLBACK;", nullptr, nullptr, nullptr);
  }
  void commit() {
    execAll(db, "COMMIT;");
    committed = true;
  }
};

} // namespace

// ---------- open ----------

TrackingStore::TrackingStore(const std::string& localPath, const std::string& sharedPath)
  : localPath_(localPath), sharedPath_(sharedPath), db_(nullptr) {
  copyDownIfStale();
  open();
}

TrackingStore::~TrackingStore() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

void TrackingStore::copyDownIfStale() {
  std::error_code ec;
  const bool localExists = fs::exists(localPath_, ec);
  const bool sharedExists = fs::exists(sharedPath_, ec);
  if (ec) spdlog::warn("Shared tracking store not reachable at {}: {}", sharedPath_, ec.message());

  if (!localExists && !sharedExists) {
    throw StoreUnavailable("no tracking store at " + localPath_ + " or " + sharedPath_ +
                           " (run init-db first)");
  }
  if (!sharedExists) {
    spdlog::warn("Shared tracking store missing, using local copy {}", localPath_);
    return;
  }

  if (localExists) {
    const auto localTime = fs::last_write_time(localPath_, ec);
    const auto sharedTime = fs::last_write_time(sharedPath_, ec);
    if (ec || sharedTime <= localTime) return;
    spdlog::warn("Local tracking store {} is older than the shared copy, replacing it", localPath_);
  }

  const fs::path parent = fs::path(localPath_).parent_path();
  if (!parent.empty()) fs::create_directories(parent);
  // A hot journal left by a crashed session belongs to the file being replaced.
  fs::remove(localPath_ + "-journal", ec);
  fs::copy_file(sharedPath_, localPath_, fs::copy_options::overwrite_existing);
  spdlog::info("Copied tracking store down from {}", sharedPath_);
}

void TrackingStore::open() {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(localPath_.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("failed to open tracking store " + localPath_ + ": " + msg);
  }

  try {
    execAll(db, "PRAGMA journal_mode=DELETE;");
    execAll(db, "PRAGMA synchronous=FULL;");
    execAll(db, "PRAGMA foreign_keys=ON;");
    execAll(db, "PRAGMA busy_timeout=5000;");

    Stmt q(db, "PRAGMA user_version;");
    const int64_t version = q.row("user_version") ? q.i64(0) : 0;
    if (version != kTrackingSchemaVersion) {
      throw StoreError("tracking store " + localPath_ + " has schema version " +
                       std::to_string(version) + ", expected " +
                       std::to_string(kTrackingSchemaVersion));
    }
  } catch (...) {
    sqlite3_close(db);
    throw;
  }
  db_ = db;
  spdlog::debug("Opened tracking store {}", localPath_);
}

// ---------- mutations ----------

bool TrackingStore::isProcessed(int64_t file_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), "SELECT 1 FROM processed_files WHERE file_id = ?");
  sqlite3_bind_int64(q.st, 1, file_id);
  return q.row("isProcessed");
}

void TrackingStore::recordKept(int64_t file_id, const std::string& location_path,
                               const std::string& note) {
  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  Stmt st(db, R"SQL(
    INSERT INTO processed_files (file_id, decision, location_path, note, processed_at)
    VALUES (?, 'kept', ?, ?, ?)
  )SQL");
  sqlite3_bind_int64(st.st, 1, file_id);
  sqlite3_bind_text(st.st, 2, location_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.st, 3, note.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.st, 4, now());
  st.done("recordKept");
}

void TrackingStore::recordDeleted(int64_t file_id,
                                  const std::string& location_path,
                                  const std::string& note,
                                  const std::vector<Deletion>& deletions) {
  if (deletions.empty()) {
    throw ConsistencyViolation("recordDeleted for file " + std::to_string(file_id) +
                               " without any successful deletion");
  }

  std::lock_guard<std::mutex> lock(mu_);
  auto* db = static_cast<sqlite3*>(db_);
  const int64_t at = now();

  Txn txn(db);
  {
    Stmt st(db, R"SQL(
      INSERT INTO processed_files (file_id, decision, location_path, note, processed_at)
      VALUES (?, 'deleted', ?, ?, ?)
    )SQL");
    sqlite3_bind_int64(st.st, 1, file_id);
    sqlite3_bind_text(st.st, 2, location_path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(st.st, 3, note.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.st, 4, at);
    st.done("recordDeleted(processed_files)");
  }
  const int64_t processedId = sqlite3_last_insert_rowid(db);

  for (const auto& d : deletions) {
    Stmt st(db, R"SQL(
      INSERT INTO deleted_files
        (processed_file_id, file_id, path, file_size, gateway_ref, deleted_at)
      VALUES (?,?,?,?,?,?)
    )SQL");
    int i = 1;
    sqlite3_bind_int64(st.st, i++, processedId);
    sqlite3_bind_int64(st.st, i++, file_id);
    sqlite3_bind_text(st.st, i++, d.path.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.st, i++, d.size);
    sqlite3_bind_text(st.st, i++, d.gateway_ref.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(st.st, i++, at);
    st.done("recordDeleted(deleted_files)");
  }
  txn.commit();
}

void TrackingStore::recordError(const std::string& operation,
                                std::optional<int64_t> file_id,
                                const std::string& message,
                                const std::optional<std::string>& context) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO errors (operation, file_id, message, context, occurred_at)
    VALUES (?,?,?,?,?)
  )SQL");
  sqlite3_bind_text(st.st, 1, operation.c_str(), -1, SQLITE_TRANSIENT);
  if (file_id) sqlite3_bind_int64(st.st, 2, *file_id);
  else sqlite3_bind_null(st.st, 2);
  sqlite3_bind_text(st.st, 3, message.c_str(), -1, SQLITE_TRANSIENT);
  if (context) sqlite3_bind_text(st.st, 4, context->c_str(), -1, SQLITE_TRANSIENT);
  else sqlite3_bind_null(st.st, 4);
  sqlite3_bind_int64(st.st, 5, now());
  st.done("recordError");
}

void TrackingStore::recordLocationComplete(const std::string& location_path,
                                           const std::string& archive_path,
                                           int64_t duplicates_count) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt st(static_cast<sqlite3*>(db_), R"SQL(
    INSERT INTO processed_locations (location_path, archive_path, duplicates_count, processed_at)
    VALUES (?,?,?,?)
  )SQL");
  sqlite3_bind_text(st.st, 1, location_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(st.st, 2, archive_path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.st, 3, duplicates_count);
  sqlite3_bind_int64(st.st, 4, now());
  st.done("recordLocationComplete");
}

// ---------- sync ----------

// Copies src to dst through raw descriptors and fsyncs dst before returning.
static void copyAndFlush(const fs::path& src, const fs::path& dst) {
  const int in = ::open(src.c_str(), O_RDONLY);
  if (in < 0) throw SyncFailed("cannot read " + src.string() + ": " + std::strerror(errno));
  const int out = ::open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (out < 0) {
    const int err = errno;
    ::close(in);
    throw SyncFailed("cannot create " + dst.string() + ": " + std::strerror(err));
  }

  std::string failure;
  char buf[64 * 1024];
  for (;;) {
    const ssize_t n = ::read(in, buf, sizeof buf);
    if (n < 0) {
      failure = "read from " + src.string() + " failed: " + std::strerror(errno);
      break;
    }
    if (n == 0) break;
    for (ssize_t off = 0; off < n && failure.empty();) {
      const ssize_t w = ::write(out, buf + off, static_cast<size_t>(n - off));
      if (w < 0) failure = "write to " + dst.string() + " failed: " + std::strerror(errno);
      else off += w;
    }
    if (!failure.empty()) break;
  }
  if (failure.empty() && ::fsync(out) != 0) {
    failure = "fsync failed for " + dst.string() + ": " + std::strerror(errno);
  }
  ::close(in);
  if (::close(out) != 0 && failure.empty()) failure = "close failed for " + dst.string();
  if (!failure.empty()) throw SyncFailed(failure);
}

void TrackingStore::sync() {
  std::lock_guard<std::mutex> publishing(syncMu_);

  const fs::path shared(sharedPath_);
  const fs::path snapshot(localPath_ + ".snapshot");
  fs::path tmp = shared;
  tmp += ".tmp";

  auto cleanup = [&] {
    std::error_code ec;
    fs::remove(tmp, ec);
    fs::remove(snapshot, ec);
  };

  try {
    const fs::path dir = shared.parent_path();
    if (!dir.empty() && !fs::is_directory(dir)) {
      throw SyncFailed("shared location " + dir.string() + " is not reachable");
    }

    {
      // Mutations wait for the local snapshot only, never for the shared write.
      std::lock_guard<std::mutex> lock(mu_);
      fs::copy_file(localPath_, snapshot, fs::copy_options::overwrite_existing);
    }
    copyAndFlush(snapshot, tmp);

    // The only step that touches the published file.
    fs::rename(tmp, shared);
  } catch (const SyncFailed&) {
    cleanup();
    throw;
  } catch (const std::exception& e) {
    cleanup();
    throw SyncFailed(std::string("sync to ") + sharedPath_ + " failed: " + e.what());
  }

  std::error_code ec;
  fs::remove(snapshot, ec);
  spdlog::info("Tracking store published to {}", sharedPath_);
}

// ---------- reads ----------

std::optional<ProcessedFileRecord> TrackingStore::processedFile(int64_t file_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, file_id, decision, location_path, note, processed_at
    FROM processed_files WHERE file_id = ?
  )SQL");
  sqlite3_bind_int64(q.st, 1, file_id);
  if (!q.row("processedFile")) return std::nullopt;
  return ProcessedFileRecord{q.i64(0), q.i64(1), q.text(2), q.text(3), q.text(4), q.i64(5)};
}

std::vector<DeletedFileRecord> TrackingStore::deletedFiles(int64_t file_id) {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, processed_file_id, file_id, path, file_size, gateway_ref, deleted_at
    FROM deleted_files WHERE file_id = ? ORDER BY id
  )SQL");
  sqlite3_bind_int64(q.st, 1, file_id);
  std::vector<DeletedFileRecord> out;
  while (q.row("deletedFiles")) {
    out.push_back({q.i64(0), q.i64(1), q.i64(2), q.text(3), q.i64(4), q.text(5), q.i64(6)});
  }
  return out;
}

std::vector<ErrorRecord> TrackingStore::errors() {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, operation, file_id, message, context, occurred_at
    FROM errors ORDER BY id
  )SQL");
  std::vector<ErrorRecord> out;
  while (q.row("errors")) {
    ErrorRecord r{q.i64(0), q.text(1), std::nullopt, q.text(3), std::nullopt, q.i64(5)};
    if (!q.isNull(2)) r.file_id = q.i64(2);
    if (!q.isNull(4)) r.context = q.text(4);
    out.push_back(std::move(r));
  }
  return out;
}

std::vector<ProcessedLocationRecord> TrackingStore::processedLocations() {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), R"SQL(
    SELECT id, location_path, archive_path, duplicates_count, processed_at
    FROM processed_locations ORDER BY id
  )SQL");
  std::vector<ProcessedLocationRecord> out;
  while (q.row("processedLocations")) {
    out.push_back({q.i64(0), q.text(1), q.text(2), q.i64(3), q.i64(4)});
  }
  return out;
}

StoreCounts TrackingStore::counts() {
  std::lock_guard<std::mutex> lock(mu_);
  Stmt q(static_cast<sqlite3*>(db_), R"SQL(
    SELECT (SELECT COUNT(*) FROM processed_locations),
           (SELECT COUNT(*) FROM processed_files),
           (SELECT COUNT(*) FROM deleted_files),
           (SELECT COUNT(*) FROM errors)
  )SQL");
  StoreCounts c;
  if (q.row("counts")) {
    c.processed_locations = q.i64(0);
    c.processed_files = q.i64(1);
    c.deleted_files = q.i64(2);
    c.errors = q.i64(3);
  }
  return c;
}
