// ARENA - Epoch Stages Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/core/stage.h"

#include <sstream>

namespace arena {

const char* StageToString(Stage stage) {
    switch (stage) {
        case Stage::Stake: return "Stake";
        case Stage::DaiVote: return "DaiVote";
        case Stage::Pair: return "Pair";
        case Stage::ZooVote: return "ZooVote";
        case Stage::Winner: return "Winner";
        default: return "Unknown";
    }
}

int64_t StageDurations::Get(Stage stage) const {
    switch (stage) {
        case Stage::Stake: return stake;
        case Stage::DaiVote: return daiVote;
        case Stage::Pair: return pair;
        case Stage::ZooVote: return zooVote;
        case Stage::Winner: return winner;
    }
    return 0;
}

int64_t StageDurations::Total() const {
    return stake + daiVote + pair + zooVote + winner;
}

bool StageDurations::IsValid() const {
    return stake > 0 && daiVote > 0 && pair > 0 && zooVote > 0 && winner > 0;
}

std::string StageDurations::ToString() const {
    std::ostringstream oss;
    oss << "StageDurations(stake=" << stake
        << ", daiVote=" << daiVote
        << ", pair=" << pair
        << ", zooVote=" << zooVote
        << ", winner=" << winner << ")";
    return oss.str();
}

} // namespace arena
