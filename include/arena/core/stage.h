// ARENA - Epoch Stages
// Copyright (c) 2024 ARENA Developers
// MIT License

#ifndef ARENA_CORE_STAGE_H
#define ARENA_CORE_STAGE_H

#include "arena/core/types.h"

#include <cstdint>
#include <string>

namespace arena {

/// The five stages of every epoch, in order
enum class Stage {
    Stake = 0,     // stake, unstake, withdraw, liquidate
    DaiVote = 1,   // dai votes
    Pair = 2,      // pairing
    ZooVote = 3,   // zoo votes
    Winner = 4,    // randomness, winners, epoch advance
};

constexpr size_t STAGE_COUNT = 5;

const char* StageToString(Stage stage);

/// Stage lengths in seconds. Winner has no upper bound while the
/// epoch has not been advanced; its duration only counts toward Total().
struct StageDurations {
    int64_t stake{0};
    int64_t daiVote{0};
    int64_t pair{0};
    int64_t zooVote{0};
    int64_t winner{0};

    /// Length of the given stage
    int64_t Get(Stage stage) const;

    /// Sum of all five stages
    int64_t Total() const;

    /// Every stage positive
    bool IsValid() const;

    std::string ToString() const;

    bool operator==(const StageDurations& other) const {
        return stake == other.stake && daiVote == other.daiVote &&
               pair == other.pair && zooVote == other.zooVote &&
               winner == other.winner;
    }

    bool operator!=(const StageDurations& other) const {
        return !(*this == other);
    }
};

} // namespace arena

#endif // ARENA_CORE_STAGE_H
