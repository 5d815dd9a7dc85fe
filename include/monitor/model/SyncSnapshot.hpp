#pragma once

#include "rpc/SyncProgress.hpp"

#include <string>

namespace sw::monitor::model {

// Last status a successful sample observed. Failed samples leave it untouched.
struct SyncSnapshot {
    enum class Status {
        Unknown,   // nothing observed yet
        Synced,    // node returned no progress object
        Syncing    // progress holds the latest block figures
    };

    Status status{Status::Unknown};
    rpc::SyncProgress progress{};

    static SyncSnapshot synced() { return {Status::Synced, {}}; }
    static SyncSnapshot syncing(const rpc::SyncProgress& p) { return {Status::Syncing, p}; }

    [[nodiscard]] bool hasBlockFigures() const { return status == Status::Syncing; }

    [[nodiscard]] std::string currentBlockStr() const;
    [[nodiscard]] std::string highestBlockStr() const;
};

}
