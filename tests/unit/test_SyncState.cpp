#include <gtest/gtest.h>
#include "monitor/SyncState.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace sw::monitor;
using Status = model::SyncSnapshot::Status;

TEST(SyncStateTest, StartsEmpty) {
    SyncState state;
    EXPECT_EQ(state.syncedCount(), 0u);
    EXPECT_EQ(state.snapshot().status, Status::Unknown);
}

TEST(SyncStateTest, RecordSyncedCountsAndMarksSnapshot) {
    SyncState state;
    state.recordSynced();
    state.recordSynced();
    EXPECT_EQ(state.syncedCount(), 2u);
    EXPECT_EQ(state.snapshot().status, Status::Synced);
}

TEST(SyncStateTest, RecordSyncingOverwritesSnapshotOnly) {
    SyncState state;
    state.recordSynced();
    state.recordSyncing({1, 100, 200});

    EXPECT_EQ(state.syncedCount(), 1u);
    const auto snap = state.snapshot();
    EXPECT_EQ(snap.status, Status::Syncing);
    EXPECT_EQ(snap.progress.current_block, 100u);
    EXPECT_EQ(snap.progress.highest_block, 200u);
}

TEST(SyncStateTest, TakeResetsCounterButKeepsSnapshot) {
    SyncState state;
    state.recordSyncing({0, 7, 9});
    state.recordSynced();

    EXPECT_EQ(state.takeSyncedCount(), 1u);
    EXPECT_EQ(state.syncedCount(), 0u);
    EXPECT_EQ(state.takeSyncedCount(), 0u);
    EXPECT_EQ(state.snapshot().status, Status::Synced);
}

TEST(SyncStateTest, ConcurrentTakesNeverLoseIncrements) {
    SyncState state;
    constexpr int writers = 4;
    constexpr int perWriter = 20000;

    std::atomic<bool> done{false};
    std::atomic<uint64_t> taken{0};

    std::thread reader([&] {
        while (!done.load()) taken += state.takeSyncedCount();
    });

    std::vector<std::thread> threads;
    for (int w = 0; w < writers; ++w)
        threads.emplace_back([&] { for (int i = 0; i < perWriter; ++i) state.recordSynced(); });

    for (auto& t : threads) t.join();
    done = true;
    reader.join();

    taken += state.takeSyncedCount();
    EXPECT_EQ(taken.load(), static_cast<uint64_t>(writers) * perWriter);
}
