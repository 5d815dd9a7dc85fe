#pragma once

#include "monitor/model/SyncSnapshot.hpp"
#include "util/duration.hpp"

#include <string>

namespace sw::monitor {

inline constexpr auto BACK_IN_SYNC_MSG = "🟢 your node is back in sync";

std::string backInSyncMessage();

// "since" carries the configured report interval, not the time the outage began.
std::string outOfSyncMessage(util::Duration reportInterval, const model::SyncSnapshot& snapshot);

}
