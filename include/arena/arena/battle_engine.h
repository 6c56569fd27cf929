// ARENA - Battle Engine
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Pairing of eligible staking positions by league and the per-pair winner
// decision with its yield split. The engine only moves ledger state; the
// caller redeems the treasury shares and pays out zoo.

#ifndef ARENA_ARENA_BATTLE_ENGINE_H
#define ARENA_ARENA_BATTLE_ENGINE_H

#include "arena/arena/ledger.h"
#include "arena/arena/reward_accountant.h"
#include "arena/core/types.h"
#include "arena/interfaces/randomness.h"

#include <string>

namespace arena {

/// Treasury share of the battle pot, percent
constexpr Amount TREASURY_FEE_PERCENT = 4;

/// Result of one decided pair
struct BattleOutcome {
    size_t pairIndex{0};
    PositionId token1{0};
    PositionId token2{0};
    bool arenaPair{false};
    bool token1Won{false};

    /// Yield of each side since pairing, in vault shares
    Amount income1{0};
    Amount income2{0};

    /// Shares to redeem for the treasury
    Amount treasuryShares{0};

    Amount winnerSaldoDelta{0};
    Amount loserSaldoDelta{0};

    /// Zoo granted for beating the arena
    Amount zooReward{0};

    ExchangeRate pricePerShareCoef{0};

    PositionId Winner() const { return token1Won ? token1 : token2; }
    PositionId Loser() const { return token1Won ? token2 : token1; }

    std::string ToString() const;
};

class BattleEngine {
public:
    BattleEngine(PositionLedger& ledger, RewardAccountant& accountant,
                 IRandomnessPolicy& policy);

    /**
     * Pair an eligible position with a random unpaired position of the same
     * league, or with the arena when there is none. Both sides move to the
     * in-game partition with their battle-start value snapshotted at rate.
     *
     * @return the opponent, ARENA_POSITION_ID for the arena
     * @throws ArenaException POSITION_NOT_ACTIVE, ALREADY_PAIRED, NO_VOTES
     */
    PositionId PairNft(PositionId stakingId, Epoch currentEpoch, ExchangeRate rate);

    /**
     * Decide pair pairIndex of the current epoch with the epoch's random
     * value and split the yield accrued since pairing.
     *
     * @throws ArenaException PAIR_NOT_FOUND, WINNER_ALREADY_CHOSEN,
     *         RANDOM_NOT_READY
     */
    BattleOutcome ChooseWinnerInPair(size_t pairIndex, Epoch currentEpoch, ExchangeRate rate);

private:
    /// Snapshot the battle-start value of a position
    void StartBattle(PositionId stakingId, Epoch currentEpoch, ExchangeRate rate);

    /// Yield of a record in shares; sets the record's coefficient.
    /// Zero when the rate did not grow.
    Amount TakeIncome(BattleRewardForEpoch& record, ExchangeRate rate);

    void MarkPlayed(PositionId stakingId, Epoch currentEpoch);

    PositionLedger& ledger_;
    RewardAccountant& accountant_;
    IRandomnessPolicy& policy_;
};

} // namespace arena

#endif // ARENA_ARENA_BATTLE_ENGINE_H
