// ARENA - Position Ledger Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/ledger.h"
#include "arena/core/error.h"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace arena {

namespace {

/// Save the current value of key unless it was saved before
template<typename Key, typename Value, typename Live>
void Remember(std::map<Key, std::optional<Value>>& saved, const Live& live, const Key& key) {
    if (saved.count(key) != 0) {
        return;
    }
    auto it = live.find(key);
    if (it == live.end()) {
        saved.emplace(key, std::nullopt);
    } else {
        saved.emplace(key, it->second);
    }
}

template<typename Key, typename Value, typename Live>
void Restore(const std::map<Key, std::optional<Value>>& saved, Live& live) {
    for (const auto& [key, value] : saved) {
        if (value) {
            live[key] = *value;
        } else {
            live.erase(key);
        }
    }
}

} // anonymous namespace

// ============================================================================
// Record ToString
// ============================================================================

std::string StakerPosition::ToString() const {
    std::ostringstream oss;
    oss << "StakerPosition(collection=" << collection.ToHex()
        << ", token=" << tokenId
        << ", start=" << startEpoch
        << ", end=" << endEpoch
        << ", lastRewarded=" << lastRewardedEpoch
        << ", lastUpdate=" << lastUpdateEpoch << ")";
    return oss.str();
}

std::string VotingPosition::ToString() const {
    std::ostringstream oss;
    oss << "VotingPosition(staking=" << stakingPositionId
        << ", dai=" << daiInvested
        << ", zoo=" << zooInvested
        << ", shares=" << yTokensNumber
        << ", votes=" << votes
        << ", start=" << startEpoch
        << ", end=" << endEpoch << ")";
    return oss.str();
}

std::string BattleRewardForEpoch::ToString() const {
    std::ostringstream oss;
    oss << "BattleRewardForEpoch(saldo=" << yTokensSaldo
        << ", votes=" << votes
        << ", yTokens=" << yTokens
        << ", pps=" << pricePerShareAtBattleStart
        << ", coef=" << pricePerShareCoef
        << ", zoo=" << zooRewards
        << ", league=" << league << ")";
    return oss.str();
}

// ============================================================================
// Staking Positions
// ============================================================================

PositionId PositionLedger::AddStakerPosition(const Address& collection, uint64_t tokenId,
                                             Epoch epoch) {
    PositionId id = nextStakingId_++;

    StakerPosition position;
    position.collection = collection;
    position.tokenId = tokenId;
    position.startEpoch = epoch;
    position.lastRewardedEpoch = epoch;
    position.lastUpdateEpoch = epoch;
    position.lastEpochOfIncentiveReward = epoch;
    if (journal_) {
        Remember(journal_->stakers, stakers_, id);
    }
    stakers_[id] = position;

    Index().Insert(id);
    return id;
}

StakerPosition& PositionLedger::GetStakerPosition(PositionId id) {
    auto it = stakers_.find(id);
    if (it == stakers_.end()) {
        throw ArenaException(ArenaError::POSITION_NOT_FOUND, "staking " + std::to_string(id));
    }
    if (journal_) {
        Remember(journal_->stakers, stakers_, id);
    }
    return it->second;
}

const StakerPosition& PositionLedger::GetStakerPosition(PositionId id) const {
    auto it = stakers_.find(id);
    if (it == stakers_.end()) {
        throw ArenaException(ArenaError::POSITION_NOT_FOUND, "staking " + std::to_string(id));
    }
    return it->second;
}

std::optional<StakerPosition> PositionLedger::FindStakerPosition(PositionId id) const {
    auto it = stakers_.find(id);
    if (it == stakers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Voting Positions
// ============================================================================

PositionId PositionLedger::AddVotingPosition(const VotingPosition& position) {
    PositionId id = nextVotingId_++;
    if (journal_) {
        Remember(journal_->voters, voters_, id);
        Remember(journal_->votersByStaker, votersByStaker_, position.stakingPositionId);
    }
    voters_[id] = position;
    votersByStaker_[position.stakingPositionId].insert(id);
    return id;
}

VotingPosition& PositionLedger::GetVotingPosition(PositionId id) {
    auto it = voters_.find(id);
    if (it == voters_.end()) {
        throw ArenaException(ArenaError::POSITION_NOT_FOUND, "voting " + std::to_string(id));
    }
    if (journal_) {
        Remember(journal_->voters, voters_, id);
    }
    return it->second;
}

const VotingPosition& PositionLedger::GetVotingPosition(PositionId id) const {
    auto it = voters_.find(id);
    if (it == voters_.end()) {
        throw ArenaException(ArenaError::POSITION_NOT_FOUND, "voting " + std::to_string(id));
    }
    return it->second;
}

std::optional<VotingPosition> PositionLedger::FindVotingPosition(PositionId id) const {
    auto it = voters_.find(id);
    if (it == voters_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const std::set<PositionId>& PositionLedger::GetVotersOf(PositionId stakingId) const {
    static const std::set<PositionId> empty;
    auto it = votersByStaker_.find(stakingId);
    return it == votersByStaker_.end() ? empty : it->second;
}

// ============================================================================
// Records
// ============================================================================

BattleRewardForEpoch& PositionLedger::Record(PositionId stakingId, Epoch epoch) {
    const std::pair<PositionId, Epoch> key{stakingId, epoch};
    if (journal_) {
        Remember(journal_->records, records_, key);
    }
    return records_[key];
}

BattleRewardForEpoch PositionLedger::GetRecord(PositionId stakingId, Epoch epoch) const {
    auto it = records_.find({stakingId, epoch});
    if (it == records_.end()) {
        return BattleRewardForEpoch{};
    }
    return it->second;
}

// ============================================================================
// Pending Votes
// ============================================================================

void PositionLedger::AddPendingVotes(PositionId stakingId, Epoch epoch, Amount votes,
                                     Amount yTokens) {
    if (journal_) {
        Remember(journal_->pending, pending_, stakingId);
    }
    PendingVotes& pending = pending_[stakingId];
    if (pending.epoch != epoch) {
        // Older pending votes are applied by catch-up before new ones arrive
        pending = PendingVotes{};
        pending.epoch = epoch;
    }
    pending.votes = CheckedAdd(pending.votes, votes);
    pending.yTokens = CheckedAdd(pending.yTokens, yTokens);
}

std::optional<PendingVotes> PositionLedger::GetPendingVotes(PositionId stakingId) const {
    auto it = pending_.find(stakingId);
    if (it == pending_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PositionLedger::ClearPendingVotes(PositionId stakingId) {
    if (journal_) {
        Remember(journal_->pending, pending_, stakingId);
    }
    pending_.erase(stakingId);
}

std::vector<PositionId> PositionLedger::GetPendingPositions() const {
    std::vector<PositionId> ids;
    ids.reserve(pending_.size());
    for (const auto& [id, pending] : pending_) {
        ids.push_back(id);
    }
    return ids;
}

// ============================================================================
// Staked Count
// ============================================================================

void PositionLedger::RememberStakedCount(const Address& collection, Epoch epoch) {
    if (!journal_) {
        return;
    }
    const std::pair<Address, Epoch> key{collection, epoch};
    if (journal_->stakedCount.count(key) != 0) {
        return;
    }
    std::optional<uint64_t> value;
    auto outer = stakedCount_.find(collection);
    if (outer != stakedCount_.end()) {
        auto inner = outer->second.find(epoch);
        if (inner != outer->second.end()) {
            value = inner->second;
        }
    }
    journal_->stakedCount.emplace(key, value);
}

void PositionLedger::UpdateStakedCount(const Address& collection, Epoch currentEpoch) {
    if (journal_) {
        Remember(journal_->stakedCountUpdatedEpoch, stakedCountUpdatedEpoch_, collection);
    }
    auto it = stakedCountUpdatedEpoch_.find(collection);
    if (it == stakedCountUpdatedEpoch_.end()) {
        RememberStakedCount(collection, currentEpoch);
        stakedCountUpdatedEpoch_[collection] = currentEpoch;
        stakedCount_[collection][currentEpoch] = 0;
        return;
    }

    auto& counts = stakedCount_[collection];
    for (Epoch e = it->second + 1; e <= currentEpoch; ++e) {
        RememberStakedCount(collection, e);
        counts[e] = counts[e - 1];
    }
    it->second = std::max(it->second, currentEpoch);
}

void PositionLedger::IncrementStakedCount(const Address& collection, Epoch currentEpoch) {
    UpdateStakedCount(collection, currentEpoch);
    RememberStakedCount(collection, currentEpoch);
    ++stakedCount_[collection][currentEpoch];
}

void PositionLedger::DecrementStakedCount(const Address& collection, Epoch currentEpoch) {
    UpdateStakedCount(collection, currentEpoch);
    RememberStakedCount(collection, currentEpoch);
    uint64_t& count = stakedCount_[collection][currentEpoch];
    if (count > 0) {
        --count;
    }
}

uint64_t PositionLedger::GetStakedCount(const Address& collection, Epoch epoch) const {
    auto it = stakedCount_.find(collection);
    if (it == stakedCount_.end()) {
        return 0;
    }
    // Latest materialized epoch at or before `epoch`
    auto entry = it->second.upper_bound(epoch);
    if (entry == it->second.begin()) {
        return 0;
    }
    return std::prev(entry)->second;
}

// ============================================================================
// Played Votes
// ============================================================================

void PositionLedger::AddPlayedVotes(Epoch epoch, const Address& collection, Amount votes) {
    const std::pair<Epoch, Address> key{epoch, collection};
    if (journal_) {
        Remember(journal_->playedVotes, playedVotes_, key);
    }
    Amount& total = playedVotes_[key];
    total = CheckedAdd(total, votes);
}

Amount PositionLedger::GetPlayedVotes(Epoch epoch, const Address& collection) const {
    auto it = playedVotes_.find({epoch, collection});
    return it == playedVotes_.end() ? 0 : it->second;
}

// ============================================================================
// Pairs
// ============================================================================

std::vector<NftPair>& PositionLedger::Pairs(Epoch epoch) {
    if (journal_) {
        Remember(journal_->pairs, pairs_, epoch);
    }
    return pairs_[epoch];
}

std::vector<NftPair> PositionLedger::GetPairs(Epoch epoch) const {
    auto it = pairs_.find(epoch);
    if (it == pairs_.end()) {
        return {};
    }
    return it->second;
}

size_t PositionLedger::GetPlayedPairCount(Epoch epoch) const {
    auto it = pairs_.find(epoch);
    if (it == pairs_.end()) {
        return 0;
    }
    return static_cast<size_t>(std::count_if(it->second.begin(), it->second.end(),
                                             [](const NftPair& p) { return p.playedInEpoch; }));
}

bool PositionLedger::AllPairsPlayed(Epoch epoch) const {
    auto it = pairs_.find(epoch);
    if (it == pairs_.end()) {
        return true;
    }
    return GetPlayedPairCount(epoch) == it->second.size();
}

// ============================================================================
// Active Index
// ============================================================================

ActivePositionIndex& PositionLedger::Index() {
    if (journal_ && !journal_->index) {
        journal_->index = index_;
    }
    return index_;
}

// ============================================================================
// Undo Journal
// ============================================================================

void PositionLedger::BeginJournal() {
    if (journal_) {
        throw std::logic_error("ledger journal already open");
    }
    journal_.emplace();
    journal_->nextStakingId = nextStakingId_;
    journal_->nextVotingId = nextVotingId_;
}

void PositionLedger::CommitJournal() noexcept {
    journal_.reset();
}

void PositionLedger::RollbackJournal() {
    if (!journal_) {
        return;
    }
    Journal saved = std::move(*journal_);
    journal_.reset();

    Restore(saved.stakers, stakers_);
    Restore(saved.voters, voters_);
    Restore(saved.votersByStaker, votersByStaker_);
    Restore(saved.records, records_);
    Restore(saved.pending, pending_);
    Restore(saved.stakedCountUpdatedEpoch, stakedCountUpdatedEpoch_);
    Restore(saved.playedVotes, playedVotes_);
    Restore(saved.pairs, pairs_);

    for (const auto& [key, value] : saved.stakedCount) {
        if (value) {
            stakedCount_[key.first][key.second] = *value;
            continue;
        }
        auto outer = stakedCount_.find(key.first);
        if (outer != stakedCount_.end()) {
            outer->second.erase(key.second);
            if (outer->second.empty()) {
                stakedCount_.erase(outer);
            }
        }
    }

    if (saved.index) {
        index_ = std::move(*saved.index);
    }
    nextStakingId_ = saved.nextStakingId;
    nextVotingId_ = saved.nextVotingId;
}

size_t PositionLedger::JournalSize() const {
    if (!journal_) {
        return 0;
    }
    return journal_->stakers.size() + journal_->voters.size() +
           journal_->votersByStaker.size() + journal_->records.size() +
           journal_->pending.size() + journal_->stakedCount.size() +
           journal_->stakedCountUpdatedEpoch.size() + journal_->playedVotes.size() +
           journal_->pairs.size() + (journal_->index ? 1 : 0);
}

} // namespace arena
