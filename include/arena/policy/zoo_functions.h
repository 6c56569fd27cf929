// ARENA - Zoo Functions
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Reference randomness and policy module. Vote pricing, leagues, league
// rewards and stage lengths come from PolicyParams. The epoch random value
// is requested once per epoch and delivered by an external oracle through
// FulfillRandomWords(), or drawn from OS entropy when auto-fulfil is on.

#ifndef ARENA_POLICY_ZOO_FUNCTIONS_H
#define ARENA_POLICY_ZOO_FUNCTIONS_H

#include "arena/arena/params.h"
#include "arena/core/types.h"
#include "arena/interfaces/randomness.h"

#include <array>
#include <cstdint>
#include <mutex>

namespace arena {
namespace policy {

/// Basis point denominator of the vote multipliers
constexpr int64_t BPS_DENOMINATOR = 10000;

class ZooFunctions : public IRandomnessPolicy {
public:
    explicit ZooFunctions(const PolicyParams& params);

    // IRandomnessPolicy
    void RequestRandomNumber() override;
    uint64_t GetRandomResult() const override;
    void ResetRandom() override;
    uint64_t ComputePseudoRandom() override;
    bool DecideWins(Amount votesA, Amount votesB, uint64_t random) const override;
    Amount ComputeVotesByDai(Amount amount) const override;
    Amount ComputeVotesByZoo(Amount amount) const override;
    League GetNftLeague(Amount votes) const override;
    Amount GetLeagueZooRewards(League league) const override;
    StageDurations GetStageDurations() const override;

    /**
     * Deliver the random word for the outstanding request.
     * @throws ArenaException RANDOM_NOT_READY if nothing was requested,
     *         RANDOM_ALREADY_REQUESTED if the request was already fulfilled
     */
    void FulfillRandomWords(uint64_t word);

    bool IsRequested() const;
    bool IsFulfilled() const;

    void SetAutoFulfill(bool enabled);

    /// New stage lengths, picked up at the next epoch advance.
    /// Throws std::invalid_argument for a non-positive stage.
    void SetStageDurations(const StageDurations& durations);

    /// Fix the pseudo-random key and restart its counter
    void SetPseudoRandomSeed(uint64_t seed);

    const PolicyParams& GetParams() const { return params_; }

private:
    mutable std::mutex mutex_;
    PolicyParams params_;

    bool requested_{false};
    bool fulfilled_{false};
    uint64_t randomResult_{0};

    std::array<Byte, 32> pseudoKey_{};
    uint64_t pseudoNonce_{0};
};

} // namespace policy
} // namespace arena

#endif // ARENA_POLICY_ZOO_FUNCTIONS_H
