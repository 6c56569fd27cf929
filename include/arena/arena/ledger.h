// ARENA - Position Ledger
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Storage for staking positions, voting positions, per-epoch battle
// records, pairing lists and the bookkeeping the incentive split reads.
// While a journal is open, the prior value of every entry handed out for
// writing is kept so that RollbackJournal() can put it back.

#ifndef ARENA_ARENA_LEDGER_H
#define ARENA_ARENA_LEDGER_H

#include "arena/arena/position_index.h"
#include "arena/core/types.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace arena {

// ============================================================================
// Records
// ============================================================================

/// One staked NFT
struct StakerPosition {
    Address collection;
    uint64_t tokenId{0};
    Epoch startEpoch{0};
    Epoch endEpoch{0};                  // 0 while active
    Epoch lastRewardedEpoch{0};
    Epoch lastUpdateEpoch{0};
    Epoch lastEpochOfIncentiveReward{0};

    bool IsActive() const { return endEpoch == 0; }

    std::string ToString() const;
};

/// A bundle of votes backing one staking position
struct VotingPosition {
    PositionId stakingPositionId{0};
    Amount daiInvested{0};
    Amount yTokensNumber{0};            // vault shares owned
    Amount zooInvested{0};
    Amount daiVotes{0};
    Amount zooVotes{0};
    Amount votes{0};                    // daiVotes + zooVotes
    Epoch startEpoch{0};
    Epoch endEpoch{0};                  // 0 while active
    Epoch lastRewardedEpoch{0};
    Epoch lastEpochYTokensWereDeductedForRewards{0};
    Amount yTokensRewardDebt{0};        // settled, unclaimed reward shares
    Amount zooRewardDebt{0};            // settled, unclaimed zoo
    Epoch lastEpochOfIncentiveReward{0};
    Amount incentiveRewardDebt{0};      // settled, unclaimed incentive

    bool IsActive() const { return endEpoch == 0; }

    std::string ToString() const;
};

/// Aggregate of one staking position in one epoch
struct BattleRewardForEpoch {
    Amount yTokensSaldo{0};             // signed net yield from battles
    Amount votes{0};
    Amount yTokens{0};
    Amount tokensAtBattleStart{0};
    ExchangeRate pricePerShareAtBattleStart{0};
    ExchangeRate pricePerShareCoef{0};
    Amount zooRewards{0};
    League league{0};
    bool battlePlayed{false};

    bool WasPaired() const { return pricePerShareAtBattleStart != 0; }

    std::string ToString() const;
};

/// One pairing of an epoch; token2 == ARENA_POSITION_ID is the arena
struct NftPair {
    PositionId token1{0};
    PositionId token2{0};
    bool playedInEpoch{false};
    bool win{false};                    // token1 won

    bool IsArenaPair() const { return token2 == ARENA_POSITION_ID; }
};

/// Votes and shares added after the vote window, due next epoch
struct PendingVotes {
    Epoch epoch{0};                     // epoch in which they were cast
    Amount votes{0};
    Amount yTokens{0};
};

// ============================================================================
// Position Ledger
// ============================================================================

class PositionLedger {
public:
    // Staking positions

    PositionId AddStakerPosition(const Address& collection, uint64_t tokenId, Epoch epoch);

    /// Throws ArenaException(POSITION_NOT_FOUND)
    StakerPosition& GetStakerPosition(PositionId id);
    const StakerPosition& GetStakerPosition(PositionId id) const;

    std::optional<StakerPosition> FindStakerPosition(PositionId id) const;

    size_t StakerPositionCount() const { return stakers_.size(); }

    // Voting positions

    PositionId AddVotingPosition(const VotingPosition& position);

    /// Throws ArenaException(POSITION_NOT_FOUND)
    VotingPosition& GetVotingPosition(PositionId id);
    const VotingPosition& GetVotingPosition(PositionId id) const;

    std::optional<VotingPosition> FindVotingPosition(PositionId id) const;

    size_t VotingPositionCount() const { return voters_.size(); }

    /// Voting positions (active or not) backing a staking position
    const std::set<PositionId>& GetVotersOf(PositionId stakingId) const;

    // Per-epoch records

    /// Mutable record, created on first access
    BattleRewardForEpoch& Record(PositionId stakingId, Epoch epoch);

    /// Copy of the record, default when never written
    BattleRewardForEpoch GetRecord(PositionId stakingId, Epoch epoch) const;

    // Pending votes

    void AddPendingVotes(PositionId stakingId, Epoch epoch, Amount votes, Amount yTokens);

    std::optional<PendingVotes> GetPendingVotes(PositionId stakingId) const;

    void ClearPendingVotes(PositionId stakingId);

    /// Staking positions with pending votes
    std::vector<PositionId> GetPendingPositions() const;

    // Staked count per collection and epoch, carried forward lazily

    void UpdateStakedCount(const Address& collection, Epoch currentEpoch);
    void IncrementStakedCount(const Address& collection, Epoch currentEpoch);
    void DecrementStakedCount(const Address& collection, Epoch currentEpoch);
    uint64_t GetStakedCount(const Address& collection, Epoch epoch) const;

    // Votes of positions whose battle was decided, per epoch and collection

    void AddPlayedVotes(Epoch epoch, const Address& collection, Amount votes);
    Amount GetPlayedVotes(Epoch epoch, const Address& collection) const;

    // Pairs

    std::vector<NftPair>& Pairs(Epoch epoch);
    std::vector<NftPair> GetPairs(Epoch epoch) const;
    size_t GetPlayedPairCount(Epoch epoch) const;
    bool AllPairsPlayed(Epoch epoch) const;

    // Active index

    ActivePositionIndex& Index();
    const ActivePositionIndex& Index() const { return index_; }

    // Undo journal

    /// Start recording prior values. Throws std::logic_error if one is open.
    void BeginJournal();

    /// Drop the recorded values and keep the changes
    void CommitJournal() noexcept;

    /// Restore every entry touched since BeginJournal() and close the journal
    void RollbackJournal();

    bool IsJournaling() const { return journal_.has_value(); }

    /// Entries recorded so far
    size_t JournalSize() const;

private:
    /// Prior values; nullopt marks an entry that did not exist
    struct Journal {
        std::map<PositionId, std::optional<StakerPosition>> stakers;
        std::map<PositionId, std::optional<VotingPosition>> voters;
        std::map<PositionId, std::optional<std::set<PositionId>>> votersByStaker;
        std::map<std::pair<PositionId, Epoch>, std::optional<BattleRewardForEpoch>> records;
        std::map<PositionId, std::optional<PendingVotes>> pending;
        std::map<std::pair<Address, Epoch>, std::optional<uint64_t>> stakedCount;
        std::map<Address, std::optional<Epoch>> stakedCountUpdatedEpoch;
        std::map<std::pair<Epoch, Address>, std::optional<Amount>> playedVotes;
        std::map<Epoch, std::optional<std::vector<NftPair>>> pairs;
        std::optional<ActivePositionIndex> index;
        PositionId nextStakingId{0};
        PositionId nextVotingId{0};
    };

    void RememberStakedCount(const Address& collection, Epoch epoch);

    std::map<PositionId, StakerPosition> stakers_;
    std::map<PositionId, VotingPosition> voters_;
    std::map<PositionId, std::set<PositionId>> votersByStaker_;
    std::map<std::pair<PositionId, Epoch>, BattleRewardForEpoch> records_;
    std::map<PositionId, PendingVotes> pending_;
    std::map<Address, std::map<Epoch, uint64_t>> stakedCount_;
    std::map<Address, Epoch> stakedCountUpdatedEpoch_;
    std::map<std::pair<Epoch, Address>, Amount> playedVotes_;
    std::map<Epoch, std::vector<NftPair>> pairs_;
    ActivePositionIndex index_;

    PositionId nextStakingId_{1};
    PositionId nextVotingId_{1};

    std::optional<Journal> journal_;
};

} // namespace arena

#endif // ARENA_ARENA_LEDGER_H
