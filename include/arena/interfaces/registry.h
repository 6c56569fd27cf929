// ARENA - Collection Registry Interface
// Copyright (c) 2024 ARENA Developers
// MIT License

#ifndef ARENA_INTERFACES_REGISTRY_H
#define ARENA_INTERFACES_REGISTRY_H

#include "arena/core/types.h"

namespace arena {

/**
 * Eligibility of NFT collections and the per-epoch governance weight
 * (veZoo) locked behind each of them. The weight only feeds the
 * incentive split. The null address keys the global total.
 */
class ICollectionRegistry {
public:
    virtual ~ICollectionRegistry() = default;

    virtual bool IsEligible(const Address& collection) const = 0;

    /// Lock weight for collection in the current epoch (caller must be the arena)
    virtual void AddVotesToVeZoo(const Address& caller, const Address& collection,
                                 Amount amount) = 0;

    /// Release weight (caller must be the arena)
    virtual void RemoveVotesFromVeZoo(const Address& caller, const Address& collection,
                                      Amount amount) = 0;

    /// Materialize carry-forward up to the current epoch and return
    /// the collection's current weight
    virtual Amount UpdateCurrentEpochAndReturnPoolWeight(const Address& collection) = 0;

    /// Collection weight at an epoch (carried forward from the last change)
    virtual Amount GetPoolWeight(const Address& collection, Epoch epoch) const = 0;

    /// Sum over all collections at an epoch
    virtual Amount GetTotalPoolWeight(Epoch epoch) const = 0;
};

} // namespace arena

#endif // ARENA_INTERFACES_REGISTRY_H
