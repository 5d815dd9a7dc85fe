#pragma once

#include <cstdint>

namespace sw::rpc {

// Catch-up progress reported by a node that is still syncing.
struct SyncProgress {
    uint64_t starting_block{};
    uint64_t current_block{};
    uint64_t highest_block{};

    bool operator==(const SyncProgress&) const = default;
};

}
