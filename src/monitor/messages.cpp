#include "monitor/messages.hpp"

#include <fmt/format.h>

namespace sw::monitor {

std::string backInSyncMessage() { return BACK_IN_SYNC_MSG; }

std::string outOfSyncMessage(const util::Duration reportInterval, const model::SyncSnapshot& snapshot) {
    std::string s;
    s += fmt::format("🔴 your node is out of sync since {}\n", util::durationToString(reportInterval));
    s += fmt::format("Current block: {}\n", snapshot.currentBlockStr());
    s += fmt::format("Highest block: {}\n", snapshot.highestBlockStr());
    return s;
}

}
