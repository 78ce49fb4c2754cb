// src/core/tracking/InitDb.cpp
#include "InitDb.hpp"
#include "core/errors/Errors.hpp"
#include "TrackingStore.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

static const char* kSchemaSql = R"SQL(
CREATE TABLE processed_locations (
  id               INTEGER PRIMARY KEY AUTOINCREMENT,
  location_path    TEXT    NOT NULL,
  archive_path     TEXT    NOT NULL,
  duplicates_count INTEGER NOT NULL,
  processed_at     INTEGER NOT NULL
);

CREATE TABLE processed_files (
  id            INTEGER PRIMARY KEY AUTOINCREMENT,
  file_id       INTEGER NOT NULL UNIQUE,
  decision      TEXT    NOT NULL CHECK (decision IN ('kept', 'deleted')),
  location_path TEXT    NOT NULL,
  note          TEXT    NOT NULL DEFAULT '',
  processed_at  INTEGER NOT NULL
);

CREATE TABLE deleted_files (
  id                INTEGER PRIMARY KEY AUTOINCREMENT,
  processed_file_id INTEGER NOT NULL REFERENCES processed_files(id),
  file_id           INTEGER NOT NULL,
  path              TEXT    NOT NULL,
  file_size         INTEGER NOT NULL,
  gateway_ref       TEXT    NOT NULL DEFAULT '',
  deleted_at        INTEGER NOT NULL
);
CREATE INDEX idx_deleted_files_file_id ON deleted_files(file_id);

CREATE TABLE errors (
  id          INTEGER PRIMARY KEY AUTOINCREMENT,
  operation   TEXT    NOT NULL,
  file_id     INTEGER,
  message     TEXT    NOT NULL,
  context     TEXT,
  occurred_at INTEGER NOT NULL
);
)SQL";

static void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("SQLite exec failed: " + msg);
    }
}

void initDatabase(const std::string& dbPath) {
    if (fs::exists(dbPath)) throw AlreadyExists("tracking store already exists: " + dbPath);

    const fs::path parent = fs::path(dbPath).parent_path();
    if (!parent.empty()) fs::create_directories(parent);

    sqlite3* db = nullptr;
    int rc = sqlite3_open_v2(
        dbPath.c_str(),
        &db,
        SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
        nullptr
    );
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        throw StoreError("Failed to open DB: " + msg);
    }

    try {
        // Rollback journal, not WAL: the main file has to be complete after every
        // commit because sync() copies it byte for byte.
        execAll(db, "PRAGMA journal_mode=DELETE;");
        execAll(db, "PRAGMA synchronous=FULL;");
        execAll(db, "PRAGMA foreign_keys=ON;");

        execAll(db, "BEGIN;");
        execAll(db, kSchemaSql);
        execAll(db, "PRAGMA user_version=" + std::to_string(kTrackingSchemaVersion) + ";");
        execAll(db, "COMMIT;");

        sqlite3_close(db);
    } catch (...) {
        sqlite3_close(db);
        std::error_code ec;
        fs::remove(dbPath, ec);
        throw;
    }
    spdlog::info("Initialized tracking store at {}", dbPath);
}

bool createTrackingStore(const std::string& localPath,
                         const std::string& sharedPath,
                         const std::function<bool(const std::vector<std::string>&)>& confirmOverwrite) {
    const fs::path sharedDir = fs::path(sharedPath).parent_path();
    if (!sharedDir.empty() && !fs::is_directory(sharedDir)) {
        throw SyncFailed("shared location " + sharedDir.string() + " is not reachable");
    }

    std::vector<std::string> existing;
    if (fs::exists(sharedPath)) existing.push_back(sharedPath);
    if (fs::exists(localPath)) existing.push_back(localPath);

    if (!existing.empty()) {
        if (!confirmOverwrite(existing)) return false;
        for (const auto& f : existing) {
            fs::remove(f);
            spdlog::warn("Removed tracking store {}", f);
        }
        std::error_code ec;
        fs::remove(localPath + "-journal", ec);
    }

    initDatabase(localPath);
    TrackingStore store(localPath, sharedPath);
    store.sync();
    return true;
}
