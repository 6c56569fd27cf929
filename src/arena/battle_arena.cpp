// ARENA - NFT Battle Arena Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/battle_arena.h"
#include "arena/arena/transaction.h"
#include "arena/core/error.h"
#include "arena/util/logging.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace arena {

namespace {

ArenaCollaborators Validated(ArenaCollaborators collaborators) {
    if (!collaborators.IsComplete()) {
        throw std::invalid_argument("NftBattleArena: missing collaborator");
    }
    return collaborators;
}

} // namespace

NftBattleArena::NftBattleArena(ArenaCollaborators collaborators,
                               const ArenaAddresses& addresses,
                               const IncentiveParams& incentives)
    : collab_(Validated(std::move(collaborators))),
      addresses_(addresses),
      accountant_(ledger_, *collab_.policy),
      engine_(ledger_, accountant_, *collab_.policy),
      incentives_(ledger_, *collab_.registry, incentives) {
    LOG_INFO(util::LogCategory::STAGE) << "Arena started: " << collab_.clock->ToString();
}

NftBattleArena::~NftBattleArena() = default;

// ============================================================================
// Helpers
// ============================================================================

void NftBattleArena::RequireCaller(const Address& caller, const Address& expected) const {
    Require(caller == expected, ArenaError::UNAUTHORIZED_CALLER);
}

VotingPosition& NftBattleArena::RequireActiveVoter(PositionId votingId) {
    VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    Require(voter.IsActive(), ArenaError::POSITION_NOT_ACTIVE, "voting " + std::to_string(votingId));
    Require(ledger_.GetStakerPosition(voter.stakingPositionId).IsActive(),
            ArenaError::POSITION_NOT_ACTIVE,
            "staking " + std::to_string(voter.stakingPositionId));
    return voter;
}

void NftBattleArena::ApplyVotes(PositionId stakingId, Epoch epoch, Amount votes, Amount shares,
                                bool pending) {
    if (pending) {
        ledger_.AddPendingVotes(stakingId, epoch, votes, shares);
        return;
    }
    BattleRewardForEpoch& record = ledger_.Record(stakingId, epoch);
    record.votes = CheckedAdd(record.votes, votes);
    record.yTokens = CheckedAdd(record.yTokens, shares);
    record.league = collab_.policy->GetNftLeague(record.votes);
    accountant_.SyncPartition(stakingId, epoch);
}

void NftBattleArena::RemoveVotes(PositionId stakingId, Epoch epoch, Amount votes, Amount shares) {
    if (!ledger_.GetStakerPosition(stakingId).IsActive()) {
        return;
    }
    BattleRewardForEpoch& record = ledger_.Record(stakingId, epoch);
    record.votes = std::max<Amount>(0, record.votes - votes);
    record.yTokens = std::max<Amount>(0, record.yTokens - shares);
    record.league = collab_.policy->GetNftLeague(record.votes);
    accountant_.SyncPartition(stakingId, epoch);
}

Amount NftBattleArena::DepositDai(Transaction& tx, const Address& voter, Amount amount) {
    const Address& self = addresses_.self;
    auto dai = collab_.dai;
    auto vault = collab_.vault;

    Require(dai->TransferFrom(self, voter, self, amount), ArenaError::TOKEN_TRANSFER_FAILED,
            "dai deposit");
    tx.OnRollback([dai, self, voter, amount]() { return dai->Transfer(self, voter, amount); },
                  "return deposited dai");

    auto shares = vault->Mint(self, amount);
    if (!shares) {
        LOG_WARN(util::LogCategory::VAULT) << "Vault mint of " << amount << " failed";
        throw ArenaException(ArenaError::VAULT_MINT_FAILED);
    }
    const Amount minted = *shares;
    tx.OnRollback([vault, self, minted]() { return vault->Redeem(self, minted).has_value(); },
                  "redeem minted shares");
    return minted;
}

Amount NftBattleArena::RedeemTo(Transaction& tx, Amount shares, const Address& beneficiary) {
    if (shares <= 0) {
        return 0;
    }
    const Address& self = addresses_.self;
    auto dai = collab_.dai;
    auto vault = collab_.vault;

    auto assets = vault->Redeem(self, shares);
    if (!assets) {
        LOG_WARN(util::LogCategory::VAULT) << "Vault redeem of " << shares << " shares failed";
        throw ArenaException(ArenaError::VAULT_REDEEM_FAILED);
    }
    const Amount paid = *assets;
    tx.OnRollback([vault, self, paid]() { return vault->Mint(self, paid).has_value(); },
                  "re-mint redeemed assets");

    Require(dai->Transfer(self, beneficiary, paid), ArenaError::TOKEN_TRANSFER_FAILED,
            "dai payout");
    tx.OnRollback([dai, self, beneficiary, paid]() { return dai->Transfer(beneficiary, self, paid); },
                  "take back dai payout");
    return paid;
}

void NftBattleArena::PayZoo(Transaction& tx, const Address& beneficiary, Amount amount) {
    if (amount <= 0) {
        return;
    }
    const Address& self = addresses_.self;
    auto zoo = collab_.zoo;
    Require(zoo->Transfer(self, beneficiary, amount), ArenaError::TOKEN_TRANSFER_FAILED,
            "zoo payout");
    tx.OnRollback([zoo, self, beneficiary, amount]() { return zoo->Transfer(beneficiary, self, amount); },
                  "take back zoo payout");
}

void NftBattleArena::ReleaseZoo(Transaction& tx, PositionId votingId, Amount amount,
                                const Address& beneficiary, Epoch epoch) {
    VotingPosition& voter = ledger_.GetVotingPosition(votingId);
    const Amount votesOut = amount == voter.zooInvested
                                ? voter.zooVotes
                                : MulDiv(voter.zooVotes, amount, voter.zooInvested);

    voter.zooInvested -= amount;
    voter.zooVotes -= votesOut;
    voter.votes -= votesOut;
    RemoveVotes(voter.stakingPositionId, epoch, votesOut, 0);

    const Address& self = addresses_.self;
    const Address collection = ledger_.GetStakerPosition(voter.stakingPositionId).collection;
    auto registry = collab_.registry;
    registry->RemoveVotesFromVeZoo(self, collection, amount);
    tx.OnRollback([registry, self, collection, amount]() {
                      registry->AddVotesToVeZoo(self, collection, amount);
                      return true;
                  },
                  "restore collection weight");

    PayZoo(tx, beneficiary, amount);
}

// ============================================================================
// Staking front end
// ============================================================================

PositionId NftBattleArena::CreateStakerPosition(const Address& caller, const Address& collection,
                                                TokenId tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.stakingFrontEnd);
    collab_.clock->RequireStage(Stage::Stake);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("CreateStakerPosition");
    tx.Journal(ledger_);

    PositionId id = ledger_.AddStakerPosition(collection, tokenId, epoch);
    ledger_.IncrementStakedCount(collection, epoch);
    ledger_.Record(id, epoch).league = collab_.policy->GetNftLeague(0);

    tx.Commit();
    LOG_INFO(util::LogCategory::LEDGER) << "Staking position " << id << " opened for token "
                                        << tokenId << " in epoch " << epoch;
    return id;
}

void NftBattleArena::RemoveStakerPosition(const Address& caller, PositionId stakingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.stakingFrontEnd);
    collab_.clock->RequireStage(Stage::Stake);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("RemoveStakerPosition");
    tx.Journal(ledger_);

    StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    Require(position.IsActive(), ArenaError::POSITION_NOT_ACTIVE);

    accountant_.UpdateInfo(stakingId, epoch);
    ledger_.Index().Erase(stakingId);
    position.endEpoch = epoch;
    ledger_.DecrementStakedCount(position.collection, epoch);

    tx.Commit();
    LOG_INFO(util::LogCategory::LEDGER) << "Staking position " << stakingId
                                        << " closed in epoch " << epoch;
}

Amount NftBattleArena::ClaimRewardFromStaking(const Address& caller, PositionId stakingId,
                                              const Address& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.stakingFrontEnd);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("ClaimRewardFromStaking");
    tx.Journal(ledger_);

    accountant_.UpdateInfo(stakingId, epoch);
    const Amount shares = accountant_.ComputePendingStakerReward(stakingId, epoch);
    StakerPosition& position = ledger_.GetStakerPosition(stakingId);
    position.lastRewardedEpoch =
        std::max(position.lastRewardedEpoch, accountant_.GetStakerLastEpoch(stakingId, epoch));

    const Amount paid = RedeemTo(tx, shares, beneficiary);

    tx.Commit();
    LOG_INFO(util::LogCategory::REWARD) << "Staking position " << stakingId << " claimed "
                                        << shares << " shares (" << paid << " dai)";
    return paid;
}

Amount NftBattleArena::ClaimIncentiveStakerReward(const Address& caller, PositionId stakingId,
                                                  const Address& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.stakingFrontEnd);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("ClaimIncentiveStakerReward");
    tx.Journal(ledger_);

    const Amount reward = incentives_.ClaimStakerIncentive(stakingId, epoch);
    PayZoo(tx, beneficiary, reward);

    tx.Commit();
    return reward;
}

// ============================================================================
// Voting front end
// ============================================================================

PositionId NftBattleArena::CreateVotingPosition(const Address& caller, PositionId stakingId,
                                                const Address& voter, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);
    Require(ledger_.GetStakerPosition(stakingId).IsActive(), ArenaError::POSITION_NOT_ACTIVE);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    const bool pending = collab_.clock->GetCurrentStage() > Stage::DaiVote;

    Transaction tx("CreateVotingPosition");
    tx.Journal(ledger_);

    accountant_.UpdateInfo(stakingId, epoch);

    const Amount shares = DepositDai(tx, voter, amount);
    const Amount votes = collab_.policy->ComputeVotesByDai(amount);

    VotingPosition position;
    position.stakingPositionId = stakingId;
    position.daiInvested = amount;
    position.yTokensNumber = shares;
    position.daiVotes = votes;
    position.votes = votes;

    const Epoch start = pending ? epoch + 1 : epoch;
    position.startEpoch = start;
    position.lastRewardedEpoch = start;
    position.lastEpochYTokensWereDeductedForRewards = start;
    position.lastEpochOfIncentiveReward = start;

    ApplyVotes(stakingId, epoch, votes, shares, pending);
    PositionId id = ledger_.AddVotingPosition(position);

    tx.Commit();
    LOG_INFO(util::LogCategory::LEDGER) << "Voting position " << id << " for staking position "
                                        << stakingId << ": " << votes << " votes"
                                        << (pending ? " from next epoch" : "");
    return id;
}

void NftBattleArena::AddDaiToVoting(const Address& caller, PositionId votingId,
                                    const Address& voter, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);
    collab_.clock->RequireStageIn(Stage::Stake, Stage::DaiVote);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("AddDaiToVoting");
    tx.Journal(ledger_);

    const PositionId stakingId = RequireActiveVoter(votingId).stakingPositionId;
    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    const Amount shares = DepositDai(tx, voter, amount);
    const Amount votes = collab_.policy->ComputeVotesByDai(amount);

    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    position.daiInvested = CheckedAdd(position.daiInvested, amount);
    position.yTokensNumber = CheckedAdd(position.yTokensNumber, shares);
    position.daiVotes = CheckedAdd(position.daiVotes, votes);
    position.votes = CheckedAdd(position.votes, votes);
    ApplyVotes(stakingId, epoch, votes, shares, position.startEpoch > epoch);

    tx.Commit();
}

void NftBattleArena::AddZooToVoting(const Address& caller, PositionId votingId,
                                    const Address& voter, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);
    collab_.clock->RequireStage(Stage::ZooVote);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("AddZooToVoting");
    tx.Journal(ledger_);

    VotingPosition& checked = RequireActiveVoter(votingId);
    Require(CheckedAdd(checked.zooInvested, amount) <= checked.daiInvested,
            ArenaError::ZOO_EXCEEDS_DAI);
    const PositionId stakingId = checked.stakingPositionId;

    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    const Address& self = addresses_.self;
    auto zoo = collab_.zoo;
    Require(zoo->TransferFrom(self, voter, self, amount), ArenaError::TOKEN_TRANSFER_FAILED,
            "zoo deposit");
    tx.OnRollback([zoo, self, voter, amount]() { return zoo->Transfer(self, voter, amount); },
                  "return deposited zoo");

    const Address collection = ledger_.GetStakerPosition(stakingId).collection;
    auto registry = collab_.registry;
    registry->AddVotesToVeZoo(self, collection, amount);
    tx.OnRollback([registry, self, collection, amount]() {
                      registry->RemoveVotesFromVeZoo(self, collection, amount);
                      return true;
                  },
                  "release collection weight");

    const Amount votes = collab_.policy->ComputeVotesByZoo(amount);
    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    position.zooInvested += amount;
    position.zooVotes = CheckedAdd(position.zooVotes, votes);
    position.votes = CheckedAdd(position.votes, votes);
    ApplyVotes(stakingId, epoch, votes, 0, position.startEpoch > epoch);

    tx.Commit();
}

Amount NftBattleArena::WithdrawDaiFromVoting(const Address& caller, PositionId votingId,
                                             const Address& beneficiary, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);
    collab_.clock->RequireStage(Stage::Stake);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("WithdrawDaiFromVoting");
    tx.Journal(ledger_);

    VotingPosition& checked = ledger_.GetVotingPosition(votingId);
    Require(checked.IsActive(), ArenaError::POSITION_NOT_ACTIVE);
    Require(amount <= checked.daiInvested, ArenaError::WITHDRAW_EXCEEDS_INVESTED);
    const PositionId stakingId = checked.stakingPositionId;

    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    const bool full = amount == position.daiInvested;
    const Amount sharesOut = full ? position.yTokensNumber
                                  : MulDiv(position.yTokensNumber, amount, position.daiInvested);
    const Amount votesOut = full ? position.daiVotes
                                 : MulDiv(position.daiVotes, amount, position.daiInvested);

    position.daiInvested -= amount;
    position.yTokensNumber -= sharesOut;
    position.daiVotes -= votesOut;
    position.votes -= votesOut;
    RemoveVotes(stakingId, epoch, votesOut, sharesOut);

    // Zoo may not stay above dai
    if (position.zooInvested > position.daiInvested) {
        ReleaseZoo(tx, votingId, position.zooInvested - position.daiInvested, beneficiary, epoch);
    }

    if (full) {
        ledger_.GetVotingPosition(votingId).endEpoch = epoch;
    }

    const Amount paid = RedeemTo(tx, sharesOut, beneficiary);

    tx.Commit();
    LOG_INFO(util::LogCategory::LEDGER) << "Voting position " << votingId << " withdrew "
                                        << amount << " dai for " << sharesOut << " shares ("
                                        << paid << " paid)" << (full ? ", liquidated" : "");
    return paid;
}

Amount NftBattleArena::WithdrawZooFromVoting(const Address& caller, PositionId votingId,
                                             const Address& beneficiary, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);
    collab_.clock->RequireStage(Stage::Stake);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("WithdrawZooFromVoting");
    tx.Journal(ledger_);

    VotingPosition& checked = ledger_.GetVotingPosition(votingId);
    Require(checked.IsActive(), ArenaError::POSITION_NOT_ACTIVE);
    Require(amount <= checked.zooInvested, ArenaError::WITHDRAW_EXCEEDS_INVESTED);
    const PositionId stakingId = checked.stakingPositionId;

    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    ReleaseZoo(tx, votingId, amount, beneficiary, epoch);

    tx.Commit();
    return amount;
}

VoterClaim NftBattleArena::ClaimRewardFromVoting(const Address& caller, PositionId votingId,
                                                 const Address& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("ClaimRewardFromVoting");
    tx.Journal(ledger_);

    accountant_.UpdateInfo(ledger_.GetVotingPosition(votingId).stakingPositionId, epoch);
    accountant_.SettleVoter(votingId, epoch);

    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    const Amount shares = position.yTokensRewardDebt;
    VoterClaim claim;
    claim.zoo = position.zooRewardDebt;
    position.yTokensRewardDebt = 0;
    position.zooRewardDebt = 0;

    claim.assets = RedeemTo(tx, shares, beneficiary);
    PayZoo(tx, beneficiary, claim.zoo);

    tx.Commit();
    LOG_INFO(util::LogCategory::REWARD) << "Voting position " << votingId << " claimed "
                                        << claim.assets << " dai and " << claim.zoo << " zoo";
    return claim;
}

Amount NftBattleArena::ClaimIncentiveVoterReward(const Address& caller, PositionId votingId,
                                                 const Address& beneficiary) {
    std::lock_guard<std::mutex> lock(mutex_);
    RequireCaller(caller, addresses_.votingFrontEnd);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("ClaimIncentiveVoterReward");
    tx.Journal(ledger_);

    const Amount reward = incentives_.ClaimVoterIncentive(votingId, epoch);
    PayZoo(tx, beneficiary, reward);

    tx.Commit();
    return reward;
}

// ============================================================================
// Permissionless steps
// ============================================================================

PositionId NftBattleArena::PairNft(PositionId stakingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    collab_.clock->RequireStage(Stage::Pair);

    Transaction tx("PairNft");
    tx.Journal(ledger_);
    PositionId opponent = engine_.PairNft(stakingId, collab_.clock->GetCurrentEpoch(),
                                          collab_.vault->ExchangeRateCurrent());
    tx.Commit();
    return opponent;
}

void NftBattleArena::RequestRandom() {
    std::lock_guard<std::mutex> lock(mutex_);
    collab_.clock->RequireStage(Stage::Winner);
    collab_.policy->RequestRandomNumber();
}

BattleOutcome NftBattleArena::ChooseWinnerInPair(size_t pairIndex) {
    std::lock_guard<std::mutex> lock(mutex_);
    collab_.clock->RequireStage(Stage::Winner);

    Transaction tx("ChooseWinnerInPair");
    tx.Journal(ledger_);

    BattleOutcome outcome = engine_.ChooseWinnerInPair(
        pairIndex, collab_.clock->GetCurrentEpoch(), collab_.vault->ExchangeRateCurrent());
    RedeemTo(tx, outcome.treasuryShares, addresses_.treasury);

    tx.Commit();
    return outcome;
}

void NftBattleArena::UpdateEpoch() {
    std::lock_guard<std::mutex> lock(mutex_);
    EpochStageClock& clock = *collab_.clock;
    clock.RequireStage(Stage::Winner);

    const Epoch epoch = clock.GetCurrentEpoch();
    Require(clock.IsEpochDurationElapsed() || ledger_.AllPairsPlayed(epoch),
            ArenaError::EPOCH_NOT_FINISHED,
            std::to_string(ledger_.GetPlayedPairCount(epoch)) + " of " +
                std::to_string(ledger_.GetPairs(epoch).size()) + " pairs decided");

    Transaction tx("UpdateEpoch");
    tx.Journal(ledger_);
    tx.Track(clock);

    clock.Advance(collab_.policy->GetStageDurations());
    ledger_.Index().ResetGames();

    const Epoch next = clock.GetCurrentEpoch();
    for (PositionId id : ledger_.GetPendingPositions()) {
        accountant_.UpdateInfo(id, next);
    }

    collab_.policy->ResetRandom();
    tx.Commit();
}

void NftBattleArena::UpdateInfo(PositionId stakingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx("UpdateInfo");
    tx.Journal(ledger_);
    accountant_.UpdateInfo(stakingId, collab_.clock->GetCurrentEpoch());
    tx.Commit();
}

void NftBattleArena::RecomputeDaiVotes(PositionId votingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    collab_.clock->RequireStageIn(Stage::Stake, Stage::DaiVote);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("RecomputeDaiVotes");
    tx.Journal(ledger_);

    const PositionId stakingId = RequireActiveVoter(votingId).stakingPositionId;
    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    const Amount votes = collab_.policy->ComputeVotesByDai(position.daiInvested);
    Require(votes >= position.daiVotes, ArenaError::VOTES_DECREASED);

    const Amount delta = votes - position.daiVotes;
    position.daiVotes = votes;
    position.votes = CheckedAdd(position.votes, delta);
    ApplyVotes(stakingId, epoch, delta, 0, position.startEpoch > epoch);

    tx.Commit();
}

void NftBattleArena::RecomputeZooVotes(PositionId votingId) {
    std::lock_guard<std::mutex> lock(mutex_);
    collab_.clock->RequireStage(Stage::ZooVote);

    const Epoch epoch = collab_.clock->GetCurrentEpoch();
    Transaction tx("RecomputeZooVotes");
    tx.Journal(ledger_);

    const PositionId stakingId = RequireActiveVoter(votingId).stakingPositionId;
    accountant_.UpdateInfo(stakingId, epoch);
    accountant_.SettleVoter(votingId, epoch);
    incentives_.SettleVoter(votingId, epoch);

    VotingPosition& position = ledger_.GetVotingPosition(votingId);
    const Amount votes = collab_.policy->ComputeVotesByZoo(position.zooInvested);
    Require(votes >= position.zooVotes, ArenaError::VOTES_DECREASED);

    const Amount delta = votes - position.zooVotes;
    position.zooVotes = votes;
    position.votes = CheckedAdd(position.votes, delta);
    ApplyVotes(stakingId, epoch, delta, 0, position.startEpoch > epoch);

    tx.Commit();
}

// ============================================================================
// Views
// ============================================================================

Stage NftBattleArena::GetCurrentStage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collab_.clock->GetCurrentStage();
}

Epoch NftBattleArena::GetCurrentEpoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return collab_.clock->GetCurrentEpoch();
}

std::optional<StakerPosition> NftBattleArena::GetStakerPosition(PositionId stakingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.FindStakerPosition(stakingId);
}

std::optional<VotingPosition> NftBattleArena::GetVotingPosition(PositionId votingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.FindVotingPosition(votingId);
}

BattleRewardForEpoch NftBattleArena::GetRecord(PositionId stakingId, Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetRecord(stakingId, epoch);
}

std::vector<NftPair> NftBattleArena::GetPairs(Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.GetPairs(epoch);
}

Amount NftBattleArena::GetPendingStakerReward(PositionId stakingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accountant_.ComputePendingStakerReward(stakingId, collab_.clock->GetCurrentEpoch());
}

VoterReward NftBattleArena::GetPendingVoterReward(PositionId votingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    VoterReward reward =
        accountant_.ComputePendingVoterReward(votingId, collab_.clock->GetCurrentEpoch());
    const VotingPosition& position = ledger_.GetVotingPosition(votingId);
    reward.yTokens = CheckedAdd(reward.yTokens, position.yTokensRewardDebt);
    reward.zoo = CheckedAdd(reward.zoo, position.zooRewardDebt);
    return reward;
}

Amount NftBattleArena::GetVoterShares(PositionId votingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accountant_.CalculateVotersYTokensExcludingRewards(votingId,
                                                              collab_.clock->GetCurrentEpoch());
}

Amount NftBattleArena::GetPendingStakerIncentive(PositionId stakingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incentives_.ComputeStakerIncentive(stakingId, collab_.clock->GetCurrentEpoch());
}

Amount NftBattleArena::GetPendingVoterIncentive(PositionId votingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return incentives_.ComputeVoterIncentive(votingId, collab_.clock->GetCurrentEpoch());
}

size_t NftBattleArena::GetActivePositionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.Index().Size();
}

size_t NftBattleArena::GetInGameCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.Index().InGameCount();
}

size_t NftBattleArena::GetNonZeroVoteCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.Index().NonZeroVoteCount();
}

} // namespace arena
