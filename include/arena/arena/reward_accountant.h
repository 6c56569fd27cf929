// ARENA - Reward Accountant
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Lazy epoch catch-up of staking position records and the pending reward
// computations for stakers and voters.

#ifndef ARENA_ARENA_REWARD_ACCOUNTANT_H
#define ARENA_ARENA_REWARD_ACCOUNTANT_H

#include "arena/arena/ledger.h"
#include "arena/core/types.h"
#include "arena/interfaces/randomness.h"

#include <string>

namespace arena {

/// Share of positive saldo kept by the staker: saldo / STAKER_SALDO_DIVISOR
constexpr Amount STAKER_SALDO_DIVISOR = 96;

/// Rewards a voter has earned but not yet received
struct VoterReward {
    Amount yTokens{0};      // vault shares
    Amount zoo{0};
    Epoch lastEpoch{0};     // rewards are computed up to, not including, this epoch

    std::string ToString() const;
};

class RewardAccountant {
public:
    RewardAccountant(PositionLedger& ledger, const IRandomnessPolicy& policy);

    /**
     * Carry votes and yTokens of a staking position forward from its last
     * updated epoch to currentEpoch, applying pending votes at the epoch
     * boundary after they were cast and recomputing the league for every
     * epoch. Afterwards the position sits in the partition its votes call
     * for. No-op for inactive or already current positions.
     */
    void UpdateInfo(PositionId stakingId, Epoch currentEpoch);

    /// Move an unpaired position between Eligible and Idle to match its
    /// current vote count
    void SyncPartition(PositionId stakingId, Epoch currentEpoch);

    /// Exclusive upper bound of the epochs a staker can be paid for
    Epoch GetStakerLastEpoch(PositionId stakingId, Epoch currentEpoch) const;

    /// Exclusive upper bound of the epochs a voter can be paid for
    Epoch GetVoterLastEpoch(PositionId votingId, Epoch currentEpoch) const;

    /// Sum of saldo / 96 over positive-saldo epochs not yet rewarded
    Amount ComputePendingStakerReward(PositionId stakingId, Epoch currentEpoch) const;

    /// Voter's share of positive saldo and arena zoo grants not yet rewarded,
    /// excluding debts already settled into the position
    VoterReward ComputePendingVoterReward(PositionId votingId, Epoch currentEpoch) const;

    /**
     * The voter's own shares after deducting, for every battle epoch since
     * the last deduction, the income those shares contributed to the
     * battle. Rounds every deduction up so voters never hold more than the
     * position record.
     */
    Amount CalculateVotersYTokensExcludingRewards(PositionId votingId, Epoch currentEpoch) const;

    /**
     * Move pending rewards into the voter's debts and apply the share
     * deduction, so that the vote count can change afterwards. Returns the
     * reward that was settled.
     */
    VoterReward SettleVoter(PositionId votingId, Epoch currentEpoch);

private:
    PositionLedger& ledger_;
    const IRandomnessPolicy& policy_;
};

} // namespace arena

#endif // ARENA_ARENA_REWARD_ACCOUNTANT_H
