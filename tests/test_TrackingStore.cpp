#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "core/errors/Errors.hpp"
#include "core/tracking/InitDb.hpp"
#include "core/tracking/TrackingStore.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>
#include <sys/stat.h>

namespace fs = std::filesystem;

class TrackingStoreTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::string local;
    std::string shared;

    void SetUp() override {
        fs::create_directories(tmp.path() / "local");
        fs::create_directories(tmp.path() / "shared");
        local = tmp.file("local/sweep_db.sqlite");
        shared = tmp.file("shared/sweep_db.sqlite");
    }

    void initAndPublish() {
        initDatabase(local);
        TrackingStore store(local, shared);
        store.sync();
    }
};

TEST_F(TrackingStoreTest, OpenWithoutAnyCopyIsUnavailable) {
    EXPECT_THROW({ TrackingStore store(local, shared); }, StoreUnavailable);
}

TEST_F(TrackingStoreTest, InitializeRefusesExistingFile) {
    initDatabase(local);
    EXPECT_THROW(initDatabase(local), AlreadyExists);
}

TEST_F(TrackingStoreTest, InitializeCreatesParentDirectory) {
    const std::string nested = tmp.file("deep/er/sweep_db.sqlite");
    initDatabase(nested);
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(TrackingStoreTest, OpensLocalWhenSharedIsMissing) {
    initDatabase(local);
    TrackingStore store(local, shared);
    EXPECT_FALSE(store.isProcessed(1));
    EXPECT_FALSE(fs::exists(shared));
}

TEST_F(TrackingStoreTest, CopiesSharedDownWhenLocalIsMissing) {
    initAndPublish();
    {
        TrackingStore store(local, shared);
        store.recordKept(7, "/mnt/records/A", "kept all 2 instances");
        store.sync();
    }
    fs::remove(local);

    TrackingStore reopened(local, shared);
    EXPECT_TRUE(fs::exists(local));
    EXPECT_TRUE(reopened.isProcessed(7));
}

TEST_F(TrackingStoreTest, StaleLocalIsReplacedByNewerShared) {
    initAndPublish();

    // Another machine publishes a decision; our local copy is older.
    const std::string otherLocal = tmp.file("other/sweep_db.sqlite");
    {
        TrackingStore other(otherLocal, shared);
        other.recordKept(42, "/mnt/records/B", "kept all 3 instances");
        other.sync();
    }
    fs::last_write_time(local, fs::last_write_time(shared) - std::chrono::hours(1));

    TrackingStore store(local, shared);
    EXPECT_TRUE(store.isProcessed(42));
}

TEST_F(TrackingStoreTest, NewerLocalIsKept) {
    initAndPublish();
    {
        TrackingStore store(local, shared);
        store.recordKept(5, "/mnt/records/A", "");
        // not synced: the shared copy does not know about file 5
    }
    fs::last_write_time(local, fs::last_write_time(shared) + std::chrono::hours(1));

    TrackingStore store(local, shared);
    EXPECT_TRUE(store.isProcessed(5));
}

TEST_F(TrackingStoreTest, RecordKept) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordKept(10, "/mnt/records/A", "kept all 2 instances");

    EXPECT_TRUE(store.isProcessed(10));
    const auto rec = store.processedFile(10);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->decision, "kept");
    EXPECT_EQ(rec->location_path, "/mnt/records/A");
    EXPECT_EQ(rec->note, "kept all 2 instances");
    EXPECT_GT(rec->processed_at, 0);
    EXPECT_TRUE(store.deletedFiles(10).empty());
}

TEST_F(TrackingStoreTest, FileIdIsUnique) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordKept(10, "/mnt/records/A", "");
    EXPECT_THROW(store.recordKept(10, "/mnt/records/B", ""), StoreError);
    EXPECT_THROW(store.recordDeleted(10, "/mnt/records/B", "", {{"/x", 1, "r"}}), StoreError);
    EXPECT_EQ(store.counts().processed_files, 1);
    EXPECT_EQ(store.counts().deleted_files, 0);
}

TEST_F(TrackingStoreTest, RecordDeletedWritesBothKindsTogether) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordDeleted(3, "/mnt/records/A", "deleted 2 of 3 instances",
                        {{"/mnt/records/B/f.pdf", 100, "task-1"},
                         {"/mnt/records/C/f.pdf", 100, "task-2"}});

    const auto rec = store.processedFile(3);
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->decision, "deleted");

    const auto rows = store.deletedFiles(3);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].path, "/mnt/records/B/f.pdf");
    EXPECT_EQ(rows[0].gateway_ref, "task-1");
    EXPECT_EQ(rows[0].processed_file_id, rec->id);
    EXPECT_EQ(rows[1].path, "/mnt/records/C/f.pdf");
    EXPECT_EQ(rows[1].file_size, 100);
}

TEST_F(TrackingStoreTest, RecordDeletedWithoutDeletionsIsAConsistencyViolation) {
    initDatabase(local);
    TrackingStore store(local, shared);
    EXPECT_THROW(store.recordDeleted(3, "/mnt/records/A", "", {}), ConsistencyViolation);
    EXPECT_FALSE(store.isProcessed(3));
}

TEST_F(TrackingStoreTest, RecordErrorWithAndWithoutFileId) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordError("delete", 9, "HTTP 500", std::string("/mnt/records/B/f.pdf"));
    store.recordError("sync", std::nullopt, "share offline");

    const auto errs = store.errors();
    ASSERT_EQ(errs.size(), 2u);
    EXPECT_EQ(errs[0].operation, "delete");
    ASSERT_TRUE(errs[0].file_id.has_value());
    EXPECT_EQ(*errs[0].file_id, 9);
    EXPECT_EQ(errs[0].context.value_or(""), "/mnt/records/B/f.pdf");
    EXPECT_FALSE(errs[1].file_id.has_value());
    EXPECT_FALSE(errs[1].context.has_value());
    EXPECT_FALSE(store.isProcessed(9));
}

TEST_F(TrackingStoreTest, RecordLocationComplete) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordLocationComplete("/mnt/records/A", "A", 4);

    const auto locs = store.processedLocations();
    ASSERT_EQ(locs.size(), 1u);
    EXPECT_EQ(locs[0].location_path, "/mnt/records/A");
    EXPECT_EQ(locs[0].archive_path, "A");
    EXPECT_EQ(locs[0].duplicates_count, 4);
}

TEST_F(TrackingStoreTest, SyncPublishesByteIdenticalCopy) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordKept(1, "/mnt/records/A", "");
    store.recordDeleted(2, "/mnt/records/A", "", {{"/mnt/records/B/x", 5, "r"}});
    store.sync();

    EXPECT_EQ(readAll(shared), readAll(local));
    EXPECT_FALSE(fs::exists(shared + ".tmp"));
    EXPECT_FALSE(fs::exists(local + ".snapshot"));
}

TEST_F(TrackingStoreTest, MutationsProceedWhileSharedWriteIsStalled) {
    initDatabase(local);
    TrackingStore store(local, shared);

    // A FIFO in place of the temp file blocks the shared write until someone reads it.
    const std::string stalled = shared + ".tmp";
    ASSERT_EQ(::mkfifo(stalled.c_str(), 0600), 0);

    std::thread publisher([&] {
        try {
            store.sync();
        } catch (const SyncFailed&) {
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    std::atomic<bool> recorded{false};
    std::thread decision([&] {
        store.recordKept(1, "/mnt/records/A", "kept all 2 instances");
        recorded = true;
    });
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (!recorded && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_TRUE(recorded.load());

    // Drain the FIFO so the stalled publish can finish.
    {
        std::ifstream drain(stalled, std::ios::binary);
        std::string sink((std::istreambuf_iterator<char>(drain)), std::istreambuf_iterator<char>());
    }
    publisher.join();
    decision.join();

    EXPECT_TRUE(store.isProcessed(1));
    std::error_code ec;
    fs::remove(stalled, ec);
    store.sync();
    EXPECT_EQ(readAll(shared), readAll(local));
}

TEST_F(TrackingStoreTest, FailedSyncLeavesSharedUntouched) {
    initAndPublish();
    const std::string before = readAll(shared);

    // Shared directory disappears: the sync must fail without touching anything.
    const std::string goneShared = tmp.file("unmounted/sweep_db.sqlite");
    {
        fs::copy_file(local, tmp.file("local/copy.sqlite"));
        TrackingStore store(tmp.file("local/copy.sqlite"), goneShared);
        store.recordKept(11, "/mnt/records/A", "");
        EXPECT_THROW(store.sync(), SyncFailed);
        EXPECT_TRUE(store.isProcessed(11));
    }
    EXPECT_FALSE(fs::exists(goneShared));
    EXPECT_EQ(readAll(shared), before);
}

TEST_F(TrackingStoreTest, InterruptedTempFileDoesNotAffectPublishedCopy) {
    initAndPublish();
    const std::string before = readAll(shared);

    // Leftover of a sync interrupted before rename.
    {
        std::ofstream partial(shared + ".tmp", std::ios::binary);
        partial << "SQLite format 3 truncated";
    }
    TrackingStore store(tmp.file("local2/sweep_db.sqlite"), shared);
    EXPECT_FALSE(store.isProcessed(1));
    EXPECT_EQ(readAll(shared), before);

    store.recordKept(1, "/mnt/records/A", "");
    store.sync();
    EXPECT_FALSE(fs::exists(shared + ".tmp"));
    EXPECT_EQ(readAll(shared), readAll(store.localPath()));
}

TEST_F(TrackingStoreTest, RejectsUnknownSchemaVersion) {
    // An empty file opens as an empty SQLite database with user_version 0.
    const std::string bogus = tmp.file("local/bogus.sqlite");
    {
        std::ofstream out(bogus, std::ios::binary);
    }
    EXPECT_THROW({ TrackingStore store(bogus, tmp.file("shared/bogus.sqlite")); }, StoreError);
}

TEST_F(TrackingStoreTest, CountsAllFourKinds) {
    initDatabase(local);
    TrackingStore store(local, shared);
    store.recordKept(1, "/L", "");
    store.recordDeleted(2, "/L", "", {{"/p1", 1, ""}, {"/p2", 1, ""}});
    store.recordError("delete", 2, "boom");
    store.recordLocationComplete("/L", "L", 2);

    const StoreCounts c = store.counts();
    EXPECT_EQ(c.processed_locations, 1);
    EXPECT_EQ(c.processed_files, 2);
    EXPECT_EQ(c.deleted_files, 2);
    EXPECT_EQ(c.errors, 1);
}

TEST_F(TrackingStoreTest, CreateStoreWithoutExistingFilesNeedsNoConfirmation) {
    bool asked = false;
    EXPECT_TRUE(createTrackingStore(local, shared, [&](const std::vector<std::string>&) {
        asked = true;
        return false;
    }));
    EXPECT_FALSE(asked);
    EXPECT_TRUE(fs::exists(local));
    EXPECT_EQ(readAll(shared), readAll(local));
}

TEST_F(TrackingStoreTest, CreateStoreDeclinedKeepsBothCopies) {
    initAndPublish();
    {
        TrackingStore store(local, shared);
        store.recordKept(3, "/mnt/records/A", "");  // local only, not synced
    }

    std::vector<std::string> offered;
    EXPECT_FALSE(createTrackingStore(local, shared, [&](const std::vector<std::string>& files) {
        offered = files;
        return false;
    }));
    EXPECT_EQ(offered, (std::vector<std::string>{shared, local}));

    TrackingStore store(local, shared);
    EXPECT_TRUE(store.isProcessed(3));
}

TEST_F(TrackingStoreTest, CreateStoreNamesUnsyncedLocalCopy) {
    initDatabase(local);
    {
        TrackingStore store(local, shared);
        store.recordKept(4, "/mnt/records/A", "");
    }
    ASSERT_FALSE(fs::exists(shared));

    std::vector<std::string> offered;
    EXPECT_FALSE(createTrackingStore(local, shared, [&](const std::vector<std::string>& files) {
        offered = files;
        return false;
    }));
    EXPECT_EQ(offered, (std::vector<std::string>{local}));
    EXPECT_TRUE(TrackingStore(local, shared).isProcessed(4));
}

TEST_F(TrackingStoreTest, CreateStoreRefusesUnreachableShareBeforeTouchingLocal) {
    initDatabase(local);
    {
        TrackingStore store(local, shared);
        store.recordKept(5, "/mnt/records/A", "");
    }
    const std::string offline = tmp.file("unmounted/sweep_db.sqlite");

    bool asked = false;
    EXPECT_THROW(createTrackingStore(local, offline, [&](const std::vector<std::string>&) {
        asked = true;
        return true;
    }), SyncFailed);
    EXPECT_FALSE(asked);
    EXPECT_TRUE(TrackingStore(local, shared).isProcessed(5));
}

TEST_F(TrackingStoreTest, CreateStoreConfirmedReplacesBothCopies) {
    initAndPublish();
    {
        TrackingStore store(local, shared);
        store.recordKept(6, "/mnt/records/A", "");
        store.sync();
    }

    EXPECT_TRUE(createTrackingStore(local, shared, [](const std::vector<std::string>&) { return true; }));

    TrackingStore store(local, shared);
    EXPECT_FALSE(store.isProcessed(6));
    EXPECT_EQ(store.counts().processed_files, 0);
    EXPECT_EQ(readAll(shared), readAll(local));
}
