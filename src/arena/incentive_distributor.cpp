// ARENA - Incentive Distributor Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/incentive_distributor.h"
#include "arena/util/logging.h"

#include <algorithm>

namespace arena {

IncentiveDistributor::IncentiveDistributor(PositionLedger& ledger, ICollectionRegistry& registry,
                                           const IncentiveParams& params)
    : ledger_(ledger), registry_(registry), params_(params) {}

void IncentiveDistributor::CatchUp(const Address& collection, Epoch currentEpoch) {
    registry_.UpdateCurrentEpochAndReturnPoolWeight(collection);
    ledger_.UpdateStakedCount(collection, currentEpoch);
}

Epoch IncentiveDistributor::StakerEnd(const StakerPosition& position, Epoch currentEpoch) const {
    Epoch end = std::min(currentEpoch, params_.endEpoch);
    if (position.endEpoch != 0) {
        end = std::min(end, position.endEpoch);
    }
    return end;
}

Amount IncentiveDistributor::WeightedShare(Amount baseReward, const Address& collection,
                                           Epoch epoch) const {
    const Amount total = registry_.GetTotalPoolWeight(epoch);
    if (total <= 0) {
        return 0;
    }
    return MulDiv(baseReward, registry_.GetPoolWeight(collection, epoch), total);
}

// ============================================================================
// Stakers
// ============================================================================

Amount IncentiveDistributor::ComputeStakerIncentive(PositionId stakingId,
                                                    Epoch currentEpoch) const {
    const StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    const Epoch end = StakerEnd(position, currentEpoch);

    Amount reward = 0;
    for (Epoch e = position.lastEpochOfIncentiveReward; e < end; ++e) {
        const uint64_t staked = ledger_.GetStakedCount(position.collection, e);
        if (staked == 0) {
            continue;
        }
        Amount share = WeightedShare(params_.baseStakerReward, position.collection, e);
        reward = CheckedAdd(reward, share / static_cast<Amount>(staked));
    }
    return reward;
}

Amount IncentiveDistributor::ClaimStakerIncentive(PositionId stakingId, Epoch currentEpoch) {
    StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    CatchUp(position.collection, currentEpoch);

    const Amount reward = ComputeStakerIncentive(stakingId, currentEpoch);
    position.lastEpochOfIncentiveReward =
        std::max(position.lastEpochOfIncentiveReward, StakerEnd(position, currentEpoch));

    LogDebugF(util::LogCategory::INCENTIVE, "Staking position %llu incentive %lld",
              static_cast<unsigned long long>(stakingId), static_cast<long long>(reward));
    return reward;
}

// ============================================================================
// Voters
// ============================================================================

Epoch IncentiveDistributor::VoterEnd(const VotingPosition& voter, Epoch currentEpoch) const {
    Epoch end = StakerEnd(ledger_.GetStakerPosition(voter.stakingPositionId), currentEpoch);
    if (voter.endEpoch != 0) {
        end = std::min(end, voter.endEpoch);
    }
    return end;
}

Amount IncentiveDistributor::AccruedVoterIncentive(const VotingPosition& voter,
                                                   Epoch currentEpoch) const {
    const Address& collection = ledger_.GetStakerPosition(voter.stakingPositionId).collection;
    const Epoch end = VoterEnd(voter, currentEpoch);

    Amount reward = 0;
    for (Epoch e = voter.lastEpochOfIncentiveReward; e < end; ++e) {
        if (!ledger_.GetRecord(voter.stakingPositionId, e).battlePlayed) {
            continue;
        }
        const Amount played = ledger_.GetPlayedVotes(e, collection);
        if (played <= 0) {
            continue;
        }
        Amount share = WeightedShare(params_.baseVoterReward, collection, e);
        reward = CheckedAdd(reward, MulDiv(share, voter.votes, played));
    }
    return reward;
}

Amount IncentiveDistributor::ComputeVoterIncentive(PositionId votingId,
                                                   Epoch currentEpoch) const {
    const VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    return CheckedAdd(voter.incentiveRewardDebt, AccruedVoterIncentive(voter, currentEpoch));
}

void IncentiveDistributor::SettleVoter(PositionId votingId, Epoch currentEpoch) {
    VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    CatchUp(ledger_.GetStakerPosition(voter.stakingPositionId).collection, currentEpoch);

    const Amount accrued = AccruedVoterIncentive(voter, currentEpoch);
    voter.incentiveRewardDebt = CheckedAdd(voter.incentiveRewardDebt, accrued);
    voter.lastEpochOfIncentiveReward =
        std::max(voter.lastEpochOfIncentiveReward, VoterEnd(voter, currentEpoch));
}

Amount IncentiveDistributor::ClaimVoterIncentive(PositionId votingId, Epoch currentEpoch) {
    SettleVoter(votingId, currentEpoch);

    VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    const Amount reward = voter.incentiveRewardDebt;
    voter.incentiveRewardDebt = 0;

    LogDebugF(util::LogCategory::INCENTIVE, "Voting position %llu incentive %lld",
              static_cast<unsigned long long>(votingId), static_cast<long long>(reward));
    return reward;
}

} // namespace arena
