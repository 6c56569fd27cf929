// ARENA - Arena Parameters
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Tunable values of the arena, the reference policy and the simulator,
// with defaults and loading from a ConfigManager.

#ifndef ARENA_ARENA_PARAMS_H
#define ARENA_ARENA_PARAMS_H

#include "arena/core/stage.h"
#include "arena/core/types.h"
#include "arena/util/config.h"

#include <cstdint>
#include <string>
#include <vector>

namespace arena {

/// Reference policy (ZooFunctions) settings
struct PolicyParams {
    StageDurations durations;

    /// Votes per deposited unit, basis points
    int64_t daiVoteMultiplierBps{10000};
    int64_t zooVoteMultiplierBps{10000};

    /// Minimum votes of each league, ascending, first entry 0
    std::vector<Amount> leagueThresholds;

    /// Zoo granted for beating the arena, one per league
    std::vector<Amount> leagueZooRewards;

    /// Fulfil randomness from OS entropy as soon as it is requested
    bool autoFulfill{false};

    bool IsValid(std::string* error = nullptr) const;
};

/// Incentive token distribution
struct IncentiveParams {
    Amount baseStakerReward{0};
    Amount baseVoterReward{0};

    /// First epoch without incentive rewards
    Epoch endEpoch{0};

    bool IsValid(std::string* error = nullptr) const;
};

/// Simulator run
struct SimParams {
    uint64_t epochs{5};
    uint64_t stakers{8};
    uint64_t voters{3};
    int64_t yieldBps{100};      // exchange-rate growth per epoch
    Amount deposit{0};          // dai per voter
    uint64_t seed{0};           // 0 for OS entropy
};

struct ArenaParams {
    PolicyParams policy;
    IncentiveParams incentives;
    SimParams sim;

    static ArenaParams Default();

    std::string ToString() const;
};

/// Parse a comma list of whole-token amounts into smallest units
bool ParseAmountList(const std::vector<std::string>& values, std::vector<Amount>& out,
                     std::string* error = nullptr);

/**
 * Overlay configuration values on params (missing keys keep their value)
 * and validate the result.
 */
util::ConfigParseResult LoadArenaParams(const util::ConfigManager& config, ArenaParams& params);

} // namespace arena

#endif // ARENA_ARENA_PARAMS_H
