#include <gtest/gtest.h>
#include "TempDir.hpp"
#include "core/tracking/InitDb.hpp"
#include "core/tracking/PeriodicSync.hpp"
#include "core/tracking/TrackingStore.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class PeriodicSyncTest : public ::testing::Test {
protected:
    TempDir tmp;
    std::string local, shared;

    void SetUp() override {
        fs::create_directories(tmp.path() / "shared");
        local = tmp.file("sweep_db.sqlite");
        shared = tmp.file("shared/sweep_db.sqlite");
        initDatabase(local);
    }

    template <typename Pred>
    static bool waitFor(Pred pred, std::chrono::milliseconds limit = 5000ms) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (std::chrono::steady_clock::now() < deadline) {
            if (pred()) return true;
            std::this_thread::sleep_for(5ms);
        }
        return pred();
    }
};

TEST_F(PeriodicSyncTest, PublishesOnEachTick) {
    TrackingStore store(local, shared);
    PeriodicSync timer(store, 20ms);
    timer.start();

    ASSERT_TRUE(waitFor([&] { return timer.syncCount() >= 2; }));
    timer.stop();

    EXPECT_TRUE(fs::exists(shared));
    EXPECT_EQ(readAll(shared), readAll(local));
}

TEST_F(PeriodicSyncTest, StopWakesALongWait) {
    TrackingStore store(local, shared);
    PeriodicSync timer(store, std::chrono::hours(1));
    timer.start();

    const auto begin = std::chrono::steady_clock::now();
    timer.stop();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 2s);
    EXPECT_EQ(timer.syncCount(), 0);
    EXPECT_FALSE(fs::exists(shared));
}

TEST_F(PeriodicSyncTest, FailedSyncIsRetriedNextTick) {
    const std::string unreachable = tmp.file("offline/sweep_db.sqlite");
    TrackingStore store(local, unreachable);
    PeriodicSync timer(store, 10ms);
    timer.start();
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(timer.syncCount(), 0);

    fs::create_directories(tmp.path() / "offline");
    ASSERT_TRUE(waitFor([&] { return timer.syncCount() >= 1; }));
    timer.stop();
    EXPECT_TRUE(fs::exists(unreachable));
}

TEST_F(PeriodicSyncTest, MutationsDuringSyncNeverPublishHalfState) {
    TrackingStore store(local, shared);
    PeriodicSync timer(store, 1ms);
    timer.start();

    for (int i = 0; i < 200; ++i) {
        store.recordDeleted(i, "/L", "", {{"/p/" + std::to_string(i), 1, ""}});
    }
    timer.stop();
    store.sync();

    // The published copy must open cleanly and agree with the local one.
    TrackingStore check(tmp.file("check/sweep_db.sqlite"), shared);
    const auto c = check.counts();
    EXPECT_EQ(c.processed_files, 200);
    EXPECT_EQ(c.deleted_files, 200);
}

TEST_F(PeriodicSyncTest, StopWithoutStartIsHarmless) {
    TrackingStore store(local, shared);
    PeriodicSync timer(store, 10ms);
    timer.stop();
    EXPECT_EQ(timer.syncCount(), 0);
}
