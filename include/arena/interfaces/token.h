// ARENA - Token Interfaces
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Fungible and non-fungible asset ledgers the arena consumes. Failures are
// reported through return values; the arena turns them into
// ExternalCollaboratorFailure errors and rolls back.

#ifndef ARENA_INTERFACES_TOKEN_H
#define ARENA_INTERFACES_TOKEN_H

#include "arena/core/types.h"

#include <cstdint>
#include <optional>

namespace arena {

/// Fungible asset (the stable deposit asset, the zoo token)
class IFungibleToken {
public:
    virtual ~IFungibleToken() = default;

    /// Move amount from `from` to `to`; false on insufficient balance
    virtual bool Transfer(const Address& from, const Address& to, Amount amount) = 0;

    /// Move amount using spender's allowance on `from`
    virtual bool TransferFrom(const Address& spender, const Address& from,
                              const Address& to, Amount amount) = 0;

    virtual Amount BalanceOf(const Address& holder) const = 0;

    virtual bool Approve(const Address& owner, const Address& spender, Amount amount) = 0;

    virtual Amount Allowance(const Address& owner, const Address& spender) const = 0;
};

using TokenId = uint64_t;

/// Non-fungible ownership ledger (collections, position tokens)
class INonFungibleToken {
public:
    virtual ~INonFungibleToken() = default;

    /// Create tokenId owned by `to`; false if it already exists
    virtual bool Mint(const Address& to, TokenId tokenId) = 0;

    /// Destroy tokenId; false if it does not exist
    virtual bool Burn(TokenId tokenId) = 0;

    virtual std::optional<Address> OwnerOf(TokenId tokenId) const = 0;

    /// Move tokenId from its current owner `from` to `to`
    virtual bool TransferFrom(const Address& from, const Address& to, TokenId tokenId) = 0;
};

} // namespace arena

#endif // ARENA_INTERFACES_TOKEN_H
