#include "monitor/SyncState.hpp"

using namespace sw::monitor;

void SyncState::recordSynced() {
    std::lock_guard lock(mutex_);
    ++syncedCount_;
    snapshot_ = model::SyncSnapshot::synced();
}

void SyncState::recordSyncing(const rpc::SyncProgress& progress) {
    std::lock_guard lock(mutex_);
    snapshot_ = model::SyncSnapshot::syncing(progress);
}

uint64_t SyncState::syncedCount() const {
    std::lock_guard lock(mutex_);
    return syncedCount_;
}

uint64_t SyncState::takeSyncedCount() {
    std::lock_guard lock(mutex_);
    const auto n = syncedCount_;
    syncedCount_ = 0;
    return n;
}

model::SyncSnapshot SyncState::snapshot() const {
    std::lock_guard lock(mutex_);
    return snapshot_;
}
