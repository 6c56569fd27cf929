// ARENA - Reward Accountant Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/reward_accountant.h"
#include "arena/interfaces/vault.h"
#include "arena/util/logging.h"

#include <algorithm>
#include <sstream>

namespace arena {

std::string VoterReward::ToString() const {
    std::ostringstream oss;
    oss << "VoterReward(yTokens=" << yTokens << ", zoo=" << zoo
        << ", lastEpoch=" << lastEpoch << ")";
    return oss.str();
}

RewardAccountant::RewardAccountant(PositionLedger& ledger, const IRandomnessPolicy& policy)
    : ledger_(ledger), policy_(policy) {}

// ============================================================================
// Catch-up
// ============================================================================

void RewardAccountant::UpdateInfo(PositionId stakingId, Epoch currentEpoch) {
    StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    if (!position.IsActive() || position.lastUpdateEpoch >= currentEpoch) {
        return;
    }

    auto pending = ledger_.GetPendingVotes(stakingId);

    for (Epoch e = position.lastUpdateEpoch; e < currentEpoch; ++e) {
        const BattleRewardForEpoch prev = ledger_.GetRecord(stakingId, e);
        BattleRewardForEpoch& next = ledger_.Record(stakingId, e + 1);

        next.votes = prev.votes;
        next.yTokens = prev.yTokens;
        if (pending && pending->epoch == e) {
            next.votes = CheckedAdd(next.votes, pending->votes);
            next.yTokens = CheckedAdd(next.yTokens, pending->yTokens);
            ledger_.ClearPendingVotes(stakingId);
            pending.reset();
        }
        next.league = policy_.GetNftLeague(next.votes);
    }
    position.lastUpdateEpoch = currentEpoch;

    SyncPartition(stakingId, currentEpoch);

    LOG_TRACE(util::LogCategory::REWARD) << "Caught up staking position " << stakingId
                                         << " to epoch " << currentEpoch;
}

void RewardAccountant::SyncPartition(PositionId stakingId, Epoch currentEpoch) {
    const Amount votes = ledger_.GetRecord(stakingId, currentEpoch).votes;
    ActivePositionIndex& index = ledger_.Index();
    auto partition = index.GetPartition(stakingId);
    if (partition == Partition::Idle && votes > 0) {
        index.Move(stakingId, Partition::Eligible);
    } else if (partition == Partition::Eligible && votes <= 0) {
        index.Move(stakingId, Partition::Idle);
    }
}

// ============================================================================
// Reward Ranges
// ============================================================================

Epoch RewardAccountant::GetStakerLastEpoch(PositionId stakingId, Epoch currentEpoch) const {
    const StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    Epoch last = currentEpoch;
    if (position.endEpoch != 0) {
        last = std::min(last, position.endEpoch);
    }
    return last;
}

Epoch RewardAccountant::GetVoterLastEpoch(PositionId votingId, Epoch currentEpoch) const {
    const VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    Epoch last = GetStakerLastEpoch(voter.stakingPositionId, currentEpoch);
    if (voter.endEpoch != 0) {
        last = std::min(last, voter.endEpoch);
    }
    return last;
}

// ============================================================================
// Pending Rewards
// ============================================================================

Amount RewardAccountant::ComputePendingStakerReward(PositionId stakingId,
                                                    Epoch currentEpoch) const {
    const StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    const Epoch lastEpoch = GetStakerLastEpoch(stakingId, currentEpoch);

    Amount reward = 0;
    for (Epoch e = position.lastRewardedEpoch; e < lastEpoch; ++e) {
        const Amount saldo = ledger_.GetRecord(stakingId, e).yTokensSaldo;
        if (saldo > 0) {
            reward = CheckedAdd(reward, saldo / STAKER_SALDO_DIVISOR);
        }
    }
    return reward;
}

VoterReward RewardAccountant::ComputePendingVoterReward(PositionId votingId,
                                                        Epoch currentEpoch) const {
    const VotingPosition& voter = ledger_.GetVotingPosition(votingId);

    VoterReward reward;
    reward.lastEpoch = GetVoterLastEpoch(votingId, currentEpoch);

    for (Epoch e = voter.lastRewardedEpoch; e < reward.lastEpoch; ++e) {
        const BattleRewardForEpoch record = ledger_.GetRecord(voter.stakingPositionId, e);
        if (record.votes == 0) {
            continue;
        }
        if (record.yTokensSaldo > 0) {
            Amount votersPart = record.yTokensSaldo - record.yTokensSaldo / STAKER_SALDO_DIVISOR;
            reward.yTokens = CheckedAdd(reward.yTokens,
                                        MulDiv(votersPart, voter.votes, record.votes));
        }
        if (record.zooRewards > 0) {
            reward.zoo = CheckedAdd(reward.zoo,
                                    MulDiv(record.zooRewards, voter.votes, record.votes));
        }
    }
    return reward;
}

Amount RewardAccountant::CalculateVotersYTokensExcludingRewards(PositionId votingId,
                                                                Epoch currentEpoch) const {
    const VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    const Epoch lastEpoch = GetVoterLastEpoch(votingId, currentEpoch);

    Amount shares = voter.yTokensNumber;
    for (Epoch e = voter.lastEpochYTokensWereDeductedForRewards; e < lastEpoch; ++e) {
        const BattleRewardForEpoch record = ledger_.GetRecord(voter.stakingPositionId, e);
        if (record.pricePerShareCoef == 0) {
            continue;
        }
        Amount tokens = SharesToAssets(shares, record.pricePerShareAtBattleStart);
        Amount income = MulDivRoundUp(tokens, RATE_SCALE, record.pricePerShareCoef);
        shares = std::max<Amount>(0, shares - income);
    }
    return shares;
}

VoterReward RewardAccountant::SettleVoter(PositionId votingId, Epoch currentEpoch) {
    const Amount remainingShares = CalculateVotersYTokensExcludingRewards(votingId, currentEpoch);
    const VoterReward reward = ComputePendingVoterReward(votingId, currentEpoch);

    VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    voter.yTokensNumber = remainingShares;
    voter.lastEpochYTokensWereDeductedForRewards =
        std::max(voter.lastEpochYTokensWereDeductedForRewards, reward.lastEpoch);

    if (reward.lastEpoch > voter.lastRewardedEpoch) {
        voter.yTokensRewardDebt = CheckedAdd(voter.yTokensRewardDebt, reward.yTokens);
        voter.zooRewardDebt = CheckedAdd(voter.zooRewardDebt, reward.zoo);
        voter.lastRewardedEpoch = reward.lastEpoch;
    }

    if (reward.yTokens != 0 || reward.zoo != 0) {
        LOG_DEBUG(util::LogCategory::REWARD) << "Settled voting position " << votingId
                                             << ": " << reward.ToString();
    }
    return reward;
}

} // namespace arena
