#include "monitor/model/SyncSnapshot.hpp"

using namespace sw::monitor::model;

static constexpr auto UNKNOWN_FIGURE = "unknown";

std::string SyncSnapshot::currentBlockStr() const {
    return hasBlockFigures() ? std::to_string(progress.current_block) : UNKNOWN_FIGURE;
}

std::string SyncSnapshot::highestBlockStr() const {
    return hasBlockFigures() ? std::to_string(progress.highest_block) : UNKNOWN_FIGURE;
}
