// ARENA - Battle Engine Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/battle_engine.h"
#include "arena/core/error.h"
#include "arena/interfaces/vault.h"
#include "arena/util/logging.h"

#include <sstream>
#include <vector>

namespace arena {

std::string BattleOutcome::ToString() const {
    std::ostringstream oss;
    oss << "BattleOutcome(pair=" << pairIndex
        << ", " << token1 << " vs " << (arenaPair ? std::string("arena") : std::to_string(token2))
        << ", winner=" << (token1Won ? "token1" : "token2")
        << ", income=" << income1 << "/" << income2
        << ", treasury=" << treasuryShares
        << ", zoo=" << zooReward << ")";
    return oss.str();
}

BattleEngine::BattleEngine(PositionLedger& ledger, RewardAccountant& accountant,
                           IRandomnessPolicy& policy)
    : ledger_(ledger), accountant_(accountant), policy_(policy) {}

// ============================================================================
// Pairing
// ============================================================================

PositionId BattleEngine::PairNft(PositionId stakingId, Epoch currentEpoch, ExchangeRate rate) {
    Require(ledger_.GetStakerPosition(stakingId).IsActive(), ArenaError::POSITION_NOT_ACTIVE);

    accountant_.UpdateInfo(stakingId, currentEpoch);

    ActivePositionIndex& index = ledger_.Index();
    Require(index.GetPartition(stakingId) != Partition::InGame, ArenaError::ALREADY_PAIRED);

    const BattleRewardForEpoch own = ledger_.GetRecord(stakingId, currentEpoch);
    Require(own.votes > 0, ArenaError::NO_VOTES);

    // Catch-up can move candidates between partitions, so scan a copy
    std::vector<PositionId> candidates;
    for (PositionId id : index.GetMembers(Partition::Eligible)) {
        if (id == stakingId) {
            continue;
        }
        accountant_.UpdateInfo(id, currentEpoch);
        if (index.GetPartition(id) == Partition::Eligible &&
            ledger_.GetRecord(id, currentEpoch).league == own.league) {
            candidates.push_back(id);
        }
    }

    PositionId opponent = ARENA_POSITION_ID;
    if (!candidates.empty()) {
        opponent = candidates[policy_.ComputePseudoRandom() % candidates.size()];
    }

    StartBattle(stakingId, currentEpoch, rate);
    if (opponent != ARENA_POSITION_ID) {
        StartBattle(opponent, currentEpoch, rate);
    }

    NftPair pair;
    pair.token1 = stakingId;
    pair.token2 = opponent;
    ledger_.Pairs(currentEpoch).push_back(pair);

    LOG_INFO(util::LogCategory::BATTLE) << "Epoch " << currentEpoch << ": paired " << stakingId
                                        << " with "
                                        << (opponent == ARENA_POSITION_ID
                                                ? std::string("the arena")
                                                : std::to_string(opponent))
                                        << " in league " << own.league;
    return opponent;
}

void BattleEngine::StartBattle(PositionId stakingId, Epoch currentEpoch, ExchangeRate rate) {
    ledger_.Index().Move(stakingId, Partition::InGame);

    BattleRewardForEpoch& record = ledger_.Record(stakingId, currentEpoch);
    record.pricePerShareAtBattleStart = rate;
    record.tokensAtBattleStart = SharesToAssets(record.yTokens, rate);
}

// ============================================================================
// Winner Decision
// ============================================================================

BattleOutcome BattleEngine::ChooseWinnerInPair(size_t pairIndex, Epoch currentEpoch,
                                               ExchangeRate rate) {
    const std::vector<NftPair> pairs = ledger_.GetPairs(currentEpoch);
    Require(pairIndex < pairs.size(), ArenaError::PAIR_NOT_FOUND,
            "pair " + std::to_string(pairIndex) + " of " + std::to_string(pairs.size()));
    Require(!pairs[pairIndex].playedInEpoch, ArenaError::WINNER_ALREADY_CHOSEN);

    const uint64_t random = policy_.GetRandomResult();
    const NftPair& pair = pairs[pairIndex];

    BattleOutcome outcome;
    outcome.pairIndex = pairIndex;
    outcome.token1 = pair.token1;
    outcome.token2 = pair.token2;
    outcome.arenaPair = pair.IsArenaPair();

    BattleRewardForEpoch& record1 = ledger_.Record(pair.token1, currentEpoch);

    if (outcome.arenaPair) {
        // Even odds against the arena
        outcome.token1Won = policy_.DecideWins(record1.votes, record1.votes, random);
        if (outcome.token1Won) {
            outcome.zooReward = policy_.GetLeagueZooRewards(record1.league);
            record1.zooRewards = CheckedAdd(record1.zooRewards, outcome.zooReward);
        } else {
            outcome.income1 = TakeIncome(record1, rate);
            outcome.treasuryShares = outcome.income1;
            record1.yTokens -= outcome.income1;
        }
        outcome.pricePerShareCoef = record1.pricePerShareCoef;
    } else {
        BattleRewardForEpoch& record2 = ledger_.Record(pair.token2, currentEpoch);
        outcome.token1Won = policy_.DecideWins(record1.votes, record2.votes, random);

        outcome.income1 = TakeIncome(record1, rate);
        outcome.income2 = TakeIncome(record2, rate);
        outcome.pricePerShareCoef = record1.pricePerShareCoef;

        const Amount pot = CheckedAdd(outcome.income1, outcome.income2);
        outcome.treasuryShares = pot * TREASURY_FEE_PERCENT / 100;
        outcome.winnerSaldoDelta = pot - outcome.treasuryShares;
        outcome.loserSaldoDelta = -(outcome.token1Won ? outcome.income2 : outcome.income1);

        BattleRewardForEpoch& winner = outcome.token1Won ? record1 : record2;
        BattleRewardForEpoch& loser = outcome.token1Won ? record2 : record1;
        winner.yTokensSaldo = CheckedAdd(winner.yTokensSaldo, outcome.winnerSaldoDelta);
        loser.yTokensSaldo = CheckedAdd(loser.yTokensSaldo, outcome.loserSaldoDelta);

        record1.yTokens -= outcome.income1;
        record2.yTokens -= outcome.income2;
    }

    NftPair& stored = ledger_.Pairs(currentEpoch)[pairIndex];
    stored.playedInEpoch = true;
    stored.win = outcome.token1Won;

    MarkPlayed(pair.token1, currentEpoch);
    if (!outcome.arenaPair) {
        MarkPlayed(pair.token2, currentEpoch);
    }

    LOG_INFO(util::LogCategory::BATTLE) << "Epoch " << currentEpoch << ": " << outcome.ToString();
    return outcome;
}

Amount BattleEngine::TakeIncome(BattleRewardForEpoch& record, ExchangeRate rate) {
    const ExchangeRate start = record.pricePerShareAtBattleStart;
    if (start == 0 || rate <= start) {
        return 0;
    }
    record.pricePerShareCoef = MulDiv(start, rate, rate - start);
    if (record.pricePerShareCoef == 0) {
        return 0;
    }
    return MulDiv(record.tokensAtBattleStart, RATE_SCALE, record.pricePerShareCoef);
}

void BattleEngine::MarkPlayed(PositionId stakingId, Epoch currentEpoch) {
    BattleRewardForEpoch& record = ledger_.Record(stakingId, currentEpoch);
    record.battlePlayed = true;
    ledger_.AddPlayedVotes(currentEpoch, ledger_.GetStakerPosition(stakingId).collection,
                           record.votes);
}

} // namespace arena
