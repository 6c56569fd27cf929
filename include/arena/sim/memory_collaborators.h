// ARENA - In-Memory Collaborators
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Self-contained token, NFT and vault ledgers for the simulator and the
// tests. Each one can be told to fail so that rollback paths can be
// exercised.

#ifndef ARENA_SIM_MEMORY_COLLABORATORS_H
#define ARENA_SIM_MEMORY_COLLABORATORS_H

#include "arena/core/types.h"
#include "arena/interfaces/token.h"
#include "arena/interfaces/vault.h"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace arena {
namespace sim {

// ============================================================================
// Fungible Token
// ============================================================================

class InMemoryToken : public IFungibleToken {
public:
    explicit InMemoryToken(std::string symbol);

    bool Transfer(const Address& from, const Address& to, Amount amount) override;
    bool TransferFrom(const Address& spender, const Address& from,
                      const Address& to, Amount amount) override;
    Amount BalanceOf(const Address& holder) const override;
    bool Approve(const Address& owner, const Address& spender, Amount amount) override;
    Amount Allowance(const Address& owner, const Address& spender) const override;

    /// Create new tokens
    void Mint(const Address& to, Amount amount);

    Amount TotalSupply() const;

    /// Every transfer fails while set
    void SetFailTransfers(bool fail);

    const std::string& GetSymbol() const { return symbol_; }

private:
    bool MoveLocked(const Address& from, const Address& to, Amount amount);

    mutable std::mutex mutex_;
    std::string symbol_;
    std::map<Address, Amount> balances_;
    std::map<std::pair<Address, Address>, Amount> allowances_;
    Amount totalSupply_{0};
    bool failTransfers_{false};
};

// ============================================================================
// Non-Fungible Token
// ============================================================================

class InMemoryNft : public INonFungibleToken {
public:
    explicit InMemoryNft(std::string name);

    bool Mint(const Address& to, TokenId tokenId) override;
    bool Burn(TokenId tokenId) override;
    std::optional<Address> OwnerOf(TokenId tokenId) const override;
    bool TransferFrom(const Address& from, const Address& to, TokenId tokenId) override;

    size_t BalanceOf(const Address& holder) const;

    void SetFailTransfers(bool fail);

    const std::string& GetName() const { return name_; }

private:
    mutable std::mutex mutex_;
    std::string name_;
    std::map<TokenId, Address> owners_;
    bool failTransfers_{false};
};

// ============================================================================
// Yield Vault
// ============================================================================

/**
 * Vault over an InMemoryToken. Raising the exchange rate mints underlying
 * into the vault so that every outstanding share stays fully backed.
 */
class InMemoryVault : public IYieldVault {
public:
    InMemoryVault(std::shared_ptr<InMemoryToken> underlying, const Address& vaultAddress,
                  ExchangeRate initialRate = RATE_SCALE);

    std::optional<Amount> Mint(const Address& depositor, Amount assets) override;
    std::optional<Amount> Redeem(const Address& holder, Amount shares) override;
    ExchangeRate ExchangeRateCurrent() const override;
    Amount BalanceOf(const Address& holder) const override;

    /// Throws std::invalid_argument if the rate would go down
    void SetExchangeRate(ExchangeRate rate);

    /// Raise the rate by bps basis points
    void AccrueYield(int64_t bps);

    Amount TotalShares() const;

    void SetFailMints(bool fail);
    void SetFailRedeems(bool fail);

    const Address& GetAddress() const { return address_; }

private:
    mutable std::mutex mutex_;
    std::shared_ptr<InMemoryToken> underlying_;
    Address address_;
    ExchangeRate rate_;
    std::map<Address, Amount> shares_;
    Amount totalShares_{0};
    bool failMints_{false};
    bool failRedeems_{false};
};

} // namespace sim
} // namespace arena

#endif // ARENA_SIM_MEMORY_COLLABORATORS_H
