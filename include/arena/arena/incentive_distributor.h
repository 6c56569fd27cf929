// ARENA - Incentive Distributor
// Copyright (c) 2024 ARENA Developers
// MIT License

#ifndef ARENA_ARENA_INCENTIVE_DISTRIBUTOR_H
#define ARENA_ARENA_INCENTIVE_DISTRIBUTOR_H

#include "arena/arena/ledger.h"
#include "arena/arena/params.h"
#include "arena/core/types.h"
#include "arena/interfaces/registry.h"

namespace arena {

/**
 * Incentive token rewards, split each epoch by the weight locked behind
 * each collection in the registry.
 *
 * Staker share per epoch:
 *   baseStakerReward * weight(col) / totalWeight / stakedCount(col)
 *
 * Voter share per epoch, only when the backed position battled:
 *   baseVoterReward * weight(col) / totalWeight * votes / playedVotes(col)
 *
 * Nothing accrues from IncentiveParams::endEpoch on.
 */
class IncentiveDistributor {
public:
    IncentiveDistributor(PositionLedger& ledger, ICollectionRegistry& registry,
                         const IncentiveParams& params);

    /// Bring registry weight and staked count of the position's collection
    /// up to currentEpoch
    void CatchUp(const Address& collection, Epoch currentEpoch);

    Amount ComputeStakerIncentive(PositionId stakingId, Epoch currentEpoch) const;

    /// Unclaimed voter incentive: the settled debt plus what accrued since
    Amount ComputeVoterIncentive(PositionId votingId, Epoch currentEpoch) const;

    /// Move the voter's accrued incentive into its debt at the votes it
    /// held. Runs before every change to the position's votes.
    void SettleVoter(PositionId votingId, Epoch currentEpoch);

    /// Compute and mark as paid; the caller transfers the amount
    Amount ClaimStakerIncentive(PositionId stakingId, Epoch currentEpoch);
    Amount ClaimVoterIncentive(PositionId votingId, Epoch currentEpoch);

    const IncentiveParams& GetParams() const { return params_; }

private:
    Epoch StakerEnd(const StakerPosition& position, Epoch currentEpoch) const;
    Epoch VoterEnd(const VotingPosition& voter, Epoch currentEpoch) const;

    /// Incentive accrued since lastEpochOfIncentiveReward
    Amount AccruedVoterIncentive(const VotingPosition& voter, Epoch currentEpoch) const;

    /// baseReward * weight(col, e) / totalWeight(e), 0 without weight
    Amount WeightedShare(Amount baseReward, const Address& collection, Epoch epoch) const;

    PositionLedger& ledger_;
    ICollectionRegistry& registry_;
    IncentiveParams params_;
};

} // namespace arena

#endif // ARENA_ARENA_INCENTIVE_DISTRIBUTOR_H
