// ARENA - NFT Battle Arena
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// The arena facade: stage guards, caller checks, transactional boundaries
// and the calls into the vault, the tokens and the registry. Position
// bookkeeping lives in PositionLedger; catch-up and rewards in
// RewardAccountant; pairing and battles in BattleEngine.
//
// Every entry point either completes or throws ArenaException with all
// ledger state and collaborator effects rolled back.

#ifndef ARENA_ARENA_BATTLE_ARENA_H
#define ARENA_ARENA_BATTLE_ARENA_H

#include "arena/arena/battle_engine.h"
#include "arena/arena/incentive_distributor.h"
#include "arena/arena/ledger.h"
#include "arena/arena/params.h"
#include "arena/arena/reward_accountant.h"
#include "arena/arena/stage_clock.h"
#include "arena/core/types.h"
#include "arena/interfaces/randomness.h"
#include "arena/interfaces/registry.h"
#include "arena/interfaces/token.h"
#include "arena/interfaces/vault.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace arena {

class Transaction;

// ============================================================================
// Wiring
// ============================================================================

/// External modules the arena talks to
struct ArenaCollaborators {
    std::shared_ptr<IFungibleToken> dai;
    std::shared_ptr<IFungibleToken> zoo;
    std::shared_ptr<IYieldVault> vault;
    std::shared_ptr<IRandomnessPolicy> policy;
    std::shared_ptr<ICollectionRegistry> registry;
    std::shared_ptr<EpochStageClock> clock;

    bool IsComplete() const {
        return dai && zoo && vault && policy && registry && clock;
    }
};

struct ArenaAddresses {
    Address self;               // holds vault shares, dai in transit and zoo
    Address treasury;
    Address stakingFrontEnd;
    Address votingFrontEnd;
};

/// What a voter received from a claim
struct VoterClaim {
    Amount assets{0};           // dai from redeemed reward shares
    Amount zoo{0};
};

// ============================================================================
// Arena
// ============================================================================

class NftBattleArena {
public:
    /// Throws std::invalid_argument if a collaborator is missing
    NftBattleArena(ArenaCollaborators collaborators, const ArenaAddresses& addresses,
                   const IncentiveParams& incentives);
    ~NftBattleArena();

    NftBattleArena(const NftBattleArena&) = delete;
    NftBattleArena& operator=(const NftBattleArena&) = delete;

    // ========================================================================
    // Staking front end
    // ========================================================================

    /// Stage Stake. Opens a staking position for an NFT in the front end's custody.
    PositionId CreateStakerPosition(const Address& caller, const Address& collection,
                                    TokenId tokenId);

    /// Stage Stake. Ends the position and drops it from the active index.
    void RemoveStakerPosition(const Address& caller, PositionId stakingId);

    /// Redeem the staker's saldo cut and pay it out. Returns assets paid.
    Amount ClaimRewardFromStaking(const Address& caller, PositionId stakingId,
                                  const Address& beneficiary);

    /// Pay out incentive zoo. Returns zoo paid.
    Amount ClaimIncentiveStakerReward(const Address& caller, PositionId stakingId,
                                      const Address& beneficiary);

    // ========================================================================
    // Voting front end
    // ========================================================================

    /**
     * Pull amount of dai from voter (allowance to the arena), deposit it in
     * the vault and vote with it. After the dai vote window the votes count
     * from the next epoch.
     */
    PositionId CreateVotingPosition(const Address& caller, PositionId stakingId,
                                    const Address& voter, Amount amount);

    /// Stages Stake to DaiVote
    void AddDaiToVoting(const Address& caller, PositionId votingId, const Address& voter,
                        Amount amount);

    /// Stage ZooVote. Zoo invested may not exceed dai invested.
    void AddZooToVoting(const Address& caller, PositionId votingId, const Address& voter,
                        Amount amount);

    /**
     * Stage Stake. Redeem the proportional part of the voter's shares left
     * after battle deductions, return zoo above the new dai amount, and end
     * the position when everything is withdrawn. Returns dai paid.
     */
    Amount WithdrawDaiFromVoting(const Address& caller, PositionId votingId,
                                 const Address& beneficiary, Amount amount);

    /// Stage Stake. Returns zoo paid.
    Amount WithdrawZooFromVoting(const Address& caller, PositionId votingId,
                                 const Address& beneficiary, Amount amount);

    VoterClaim ClaimRewardFromVoting(const Address& caller, PositionId votingId,
                                     const Address& beneficiary);

    Amount ClaimIncentiveVoterReward(const Address& caller, PositionId votingId,
                                     const Address& beneficiary);

    // ========================================================================
    // Permissionless steps
    // ========================================================================

    /// Stage Pair. Returns the opponent, ARENA_POSITION_ID for the arena.
    PositionId PairNft(PositionId stakingId);

    /// Stage Winner
    void RequestRandom();

    /// Stage Winner. Decides one pair of the current epoch.
    BattleOutcome ChooseWinnerInPair(size_t pairIndex);

    /// Stage Winner, once the epoch has run its course or every pair is decided
    void UpdateEpoch();

    void UpdateInfo(PositionId stakingId);

    /// Stages Stake to DaiVote. Re-price dai votes with the current policy.
    void RecomputeDaiVotes(PositionId votingId);

    /// Stage ZooVote. Re-price zoo votes with the current policy.
    void RecomputeZooVotes(PositionId votingId);

    // ========================================================================
    // Views
    // ========================================================================

    Stage GetCurrentStage() const;
    Epoch GetCurrentEpoch() const;

    std::optional<StakerPosition> GetStakerPosition(PositionId stakingId) const;
    std::optional<VotingPosition> GetVotingPosition(PositionId votingId) const;
    BattleRewardForEpoch GetRecord(PositionId stakingId, Epoch epoch) const;
    std::vector<NftPair> GetPairs(Epoch epoch) const;

    Amount GetPendingStakerReward(PositionId stakingId) const;

    /// Settled debts plus rewards not yet settled
    VoterReward GetPendingVoterReward(PositionId votingId) const;

    /// Voter's shares after battle deductions
    Amount GetVoterShares(PositionId votingId) const;

    Amount GetPendingStakerIncentive(PositionId stakingId) const;
    Amount GetPendingVoterIncentive(PositionId votingId) const;

    size_t GetActivePositionCount() const;
    size_t GetInGameCount() const;
    size_t GetNonZeroVoteCount() const;

    /// Read access for inspection; not synchronized
    const PositionLedger& GetLedger() const { return ledger_; }

    const ArenaAddresses& GetAddresses() const { return addresses_; }

private:
    void RequireCaller(const Address& caller, const Address& expected) const;

    /// Active voting position backing an active staking position
    VotingPosition& RequireActiveVoter(PositionId votingId);

    /// Add votes and shares to the current record of a staking position,
    /// or queue them for the next epoch
    void ApplyVotes(PositionId stakingId, Epoch epoch, Amount votes, Amount shares,
                    bool pending);

    /// Take votes and shares off the current record
    void RemoveVotes(PositionId stakingId, Epoch epoch, Amount votes, Amount shares);

    /// Pull dai from voter and deposit it; returns shares minted
    Amount DepositDai(Transaction& tx, const Address& voter, Amount amount);

    /// Redeem shares and send the assets to beneficiary; returns assets paid
    Amount RedeemTo(Transaction& tx, Amount shares, const Address& beneficiary);

    /// Release zoo from a voting position and send it to beneficiary
    void ReleaseZoo(Transaction& tx, PositionId votingId, Amount amount,
                    const Address& beneficiary, Epoch epoch);

    void PayZoo(Transaction& tx, const Address& beneficiary, Amount amount);

    mutable std::mutex mutex_;

    ArenaCollaborators collab_;
    ArenaAddresses addresses_;

    PositionLedger ledger_;
    RewardAccountant accountant_;
    BattleEngine engine_;
    IncentiveDistributor incentives_;
};

} // namespace arena

#endif // ARENA_ARENA_BATTLE_ARENA_H
