// ARENA - Randomness and Policy Interface
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// The pluggable policy module: epoch randomness, the win comparator,
// vote pricing, leagues and stage lengths.

#ifndef ARENA_INTERFACES_RANDOMNESS_H
#define ARENA_INTERFACES_RANDOMNESS_H

#include "arena/core/stage.h"
#include "arena/core/types.h"

#include <cstdint>

namespace arena {

class IRandomnessPolicy {
public:
    virtual ~IRandomnessPolicy() = default;

    // ========================================================================
    // Randomness
    // ========================================================================

    /// Ask for this epoch's random value.
    /// Throws ArenaException(RANDOM_ALREADY_REQUESTED) on a second request.
    virtual void RequestRandomNumber() = 0;

    /// The fulfilled random value.
    /// Throws ArenaException(RANDOM_NOT_READY) before fulfilment.
    virtual uint64_t GetRandomResult() const = 0;

    /// Forget the current value at the end of an epoch
    virtual void ResetRandom() = 0;

    /// Cheap value for opponent selection; not manipulation resistant
    virtual uint64_t ComputePseudoRandom() = 0;

    // ========================================================================
    // Policy
    // ========================================================================

    /// True when the side with votesA wins against votesB
    virtual bool DecideWins(Amount votesA, Amount votesB, uint64_t random) const = 0;

    /// Votes bought by a dai deposit (monotonic in amount)
    virtual Amount ComputeVotesByDai(Amount amount) const = 0;

    /// Votes bought by a zoo deposit (monotonic in amount)
    virtual Amount ComputeVotesByZoo(Amount amount) const = 0;

    virtual League GetNftLeague(Amount votes) const = 0;

    /// Zoo granted to a position that beats the arena in this league
    virtual Amount GetLeagueZooRewards(League league) const = 0;

    virtual StageDurations GetStageDurations() const = 0;
};

} // namespace arena

#endif // ARENA_INTERFACES_RANDOMNESS_H
