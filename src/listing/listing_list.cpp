// ARENA - Listing List Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/listing/listing_list.h"
#include "arena/core/error.h"
#include "arena/util/logging.h"

#include <iterator>
#include <stdexcept>
#include <utility>

namespace arena {
namespace listing {

namespace {
const Address GLOBAL_KEY{};
}

ListingList::ListingList(const Address& owner, EpochSource epochSource)
    : owner_(owner), epochSource_(std::move(epochSource)) {
    if (!epochSource_) {
        throw std::invalid_argument("ListingList needs an epoch source");
    }
}

// ============================================================================
// Administration
// ============================================================================

void ListingList::SetArena(const Address& caller, const Address& arena) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(caller == owner_, ArenaError::NOT_OWNER);
    arena_ = arena;
}

void ListingList::AllowNewContractForStaking(const Address& caller, const Address& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(caller == owner_, ArenaError::NOT_OWNER);
    eligible_.insert(collection);
    LOG_INFO(util::LogCategory::REGISTRY) << "Collection " << collection.ToHex()
                                          << " allowed for staking";
}

void ListingList::DisallowContractFromStaking(const Address& caller, const Address& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(caller == owner_, ArenaError::NOT_OWNER);
    eligible_.erase(collection);
    LOG_INFO(util::LogCategory::REGISTRY) << "Collection " << collection.ToHex()
                                          << " disallowed from staking";
}

std::vector<Address> ListingList::GetEligibleCollections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<Address>(eligible_.begin(), eligible_.end());
}

bool ListingList::IsEligible(const Address& collection) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return eligible_.count(collection) != 0;
}

// ============================================================================
// Weight
// ============================================================================

void ListingList::AddVotesToVeZoo(const Address& caller, const Address& collection,
                                  Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(caller == arena_, ArenaError::UNAUTHORIZED_CALLER);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);
    Require(eligible_.count(collection) != 0, ArenaError::COLLECTION_NOT_ELIGIBLE);

    const Epoch epoch = epochSource_();
    Amount collectionWeight = CheckedAdd(CarryForward(collection, epoch), amount);
    Amount totalWeight = CheckedAdd(CarryForward(GLOBAL_KEY, epoch), amount);
    weights_[collection][epoch] = collectionWeight;
    weights_[GLOBAL_KEY][epoch] = totalWeight;

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Epoch " << epoch << ": +" << amount
                                           << " weight, collection now " << collectionWeight;
}

void ListingList::RemoveVotesFromVeZoo(const Address& caller, const Address& collection,
                                       Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(caller == arena_, ArenaError::UNAUTHORIZED_CALLER);
    Require(amount > 0, ArenaError::ZERO_AMOUNT);

    const Epoch epoch = epochSource_();
    Amount collectionWeight = CarryForward(collection, epoch);
    Amount totalWeight = CarryForward(GLOBAL_KEY, epoch);
    Require(collectionWeight >= amount && totalWeight >= amount,
            ArenaError::INSUFFICIENT_WEIGHT);

    weights_[collection][epoch] = collectionWeight - amount;
    weights_[GLOBAL_KEY][epoch] = totalWeight - amount;

    LOG_DEBUG(util::LogCategory::REGISTRY) << "Epoch " << epoch << ": -" << amount
                                           << " weight, collection now "
                                           << collectionWeight - amount;
}

Amount ListingList::UpdateCurrentEpochAndReturnPoolWeight(const Address& collection) {
    std::lock_guard<std::mutex> lock(mutex_);
    const Epoch epoch = epochSource_();
    CarryForward(GLOBAL_KEY, epoch);
    return CarryForward(collection, epoch);
}

Amount ListingList::GetPoolWeight(const Address& collection, Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return WeightAt(collection, epoch);
}

Amount ListingList::GetTotalPoolWeight(Epoch epoch) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return WeightAt(GLOBAL_KEY, epoch);
}

Amount ListingList::CarryForward(const Address& key, Epoch epoch) {
    auto it = weights_.find(key);
    if (it == weights_.end() || it->second.empty()) {
        return 0;
    }
    auto& byEpoch = it->second;
    Epoch last = byEpoch.rbegin()->first;
    for (Epoch e = last + 1; e <= epoch; ++e) {
        byEpoch[e] = byEpoch[e - 1];
    }
    return WeightAt(key, epoch);
}

Amount ListingList::WeightAt(const Address& key, Epoch epoch) const {
    auto it = weights_.find(key);
    if (it == weights_.end()) {
        return 0;
    }
    auto entry = it->second.upper_bound(epoch);
    if (entry == it->second.begin()) {
        return 0;
    }
    return std::prev(entry)->second;
}

} // namespace listing
} // namespace arena
