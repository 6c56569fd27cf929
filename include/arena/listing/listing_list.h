// ARENA - Listing List
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Reference collection registry (veZoo). The owner decides which NFT
// collections may be staked; the arena locks and releases governance
// weight per collection. Weight is a running total per collection and
// globally, carried forward lazily from the epoch of its last change.

#ifndef ARENA_LISTING_LISTING_LIST_H
#define ARENA_LISTING_LISTING_LIST_H

#include "arena/core/types.h"
#include "arena/interfaces/registry.h"

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace arena {
namespace listing {

/// Supplies the current arena epoch
using EpochSource = std::function<Epoch()>;

class ListingList : public ICollectionRegistry {
public:
    ListingList(const Address& owner, EpochSource epochSource);

    // ========================================================================
    // Administration (owner only, NOT_OWNER otherwise)
    // ========================================================================

    /// The only caller allowed to change weight
    void SetArena(const Address& caller, const Address& arena);

    void AllowNewContractForStaking(const Address& caller, const Address& collection);

    void DisallowContractFromStaking(const Address& caller, const Address& collection);

    std::vector<Address> GetEligibleCollections() const;

    const Address& GetOwner() const { return owner_; }

    // ========================================================================
    // ICollectionRegistry
    // ========================================================================

    bool IsEligible(const Address& collection) const override;

    /// Throws UNAUTHORIZED_CALLER, ZERO_AMOUNT, COLLECTION_NOT_ELIGIBLE
    void AddVotesToVeZoo(const Address& caller, const Address& collection,
                         Amount amount) override;

    /// Throws UNAUTHORIZED_CALLER, ZERO_AMOUNT, INSUFFICIENT_WEIGHT
    void RemoveVotesFromVeZoo(const Address& caller, const Address& collection,
                              Amount amount) override;

    Amount UpdateCurrentEpochAndReturnPoolWeight(const Address& collection) override;

    Amount GetPoolWeight(const Address& collection, Epoch epoch) const override;

    Amount GetTotalPoolWeight(Epoch epoch) const override;

private:
    /// Materialize weight of key up to epoch; caller holds the lock
    Amount CarryForward(const Address& key, Epoch epoch);

    Amount WeightAt(const Address& key, Epoch epoch) const;

    mutable std::mutex mutex_;
    Address owner_;
    Address arena_;
    EpochSource epochSource_;

    std::set<Address> eligible_;

    /// Weight per collection and epoch; the null address holds the total
    std::map<Address, std::map<Epoch, Amount>> weights_;
};

} // namespace listing
} // namespace arena

#endif // ARENA_LISTING_LISTING_LIST_H
