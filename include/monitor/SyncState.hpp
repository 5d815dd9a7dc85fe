#pragma once

#include "monitor/model/SyncSnapshot.hpp"
#include "rpc/SyncProgress.hpp"

#include <cstdint>
#include <mutex>

namespace sw::monitor {

// Shared between the sampler and the reporter. Every accessor takes the lock for its own duration only.
class SyncState {
public:
    // One fully-synced observation: count it and mark the snapshot synced.
    void recordSynced();

    // A mid-sync observation: overwrite the snapshot, leave the count alone.
    void recordSyncing(const rpc::SyncProgress& progress);

    [[nodiscard]] uint64_t syncedCount() const;

    // Reads and zeroes the counter in one critical section.
    uint64_t takeSyncedCount();

    [[nodiscard]] model::SyncSnapshot snapshot() const;

private:
    mutable std::mutex mutex_;
    uint64_t syncedCount_{0};
    model::SyncSnapshot snapshot_;
};

}
