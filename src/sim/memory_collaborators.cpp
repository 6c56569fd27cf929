// ARENA - In-Memory Collaborators Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/sim/memory_collaborators.h"
#include "arena/util/logging.h"

#include <stdexcept>

namespace arena {
namespace sim {

// ============================================================================
// InMemoryToken
// ============================================================================

InMemoryToken::InMemoryToken(std::string symbol) : symbol_(std::move(symbol)) {}

bool InMemoryToken::MoveLocked(const Address& from, const Address& to, Amount amount) {
    if (failTransfers_ || amount < 0) {
        return false;
    }
    Amount& source = balances_[from];
    if (source < amount) {
        return false;
    }
    source -= amount;
    balances_[to] += amount;
    return true;
}

bool InMemoryToken::Transfer(const Address& from, const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    return MoveLocked(from, to, amount);
}

bool InMemoryToken::TransferFrom(const Address& spender, const Address& from,
                                 const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount& allowance = allowances_[{from, spender}];
    if (allowance < amount) {
        return false;
    }
    if (!MoveLocked(from, to, amount)) {
        return false;
    }
    allowance -= amount;
    return true;
}

Amount InMemoryToken::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = balances_.find(holder);
    return it == balances_.end() ? 0 : it->second;
}

bool InMemoryToken::Approve(const Address& owner, const Address& spender, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (amount < 0) {
        return false;
    }
    allowances_[{owner, spender}] = amount;
    return true;
}

Amount InMemoryToken::Allowance(const Address& owner, const Address& spender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it == allowances_.end() ? 0 : it->second;
}

void InMemoryToken::Mint(const Address& to, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    balances_[to] = CheckedAdd(balances_[to], amount);
    totalSupply_ = CheckedAdd(totalSupply_, amount);
}

Amount InMemoryToken::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

void InMemoryToken::SetFailTransfers(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failTransfers_ = fail;
}

// ============================================================================
// InMemoryNft
// ============================================================================

InMemoryNft::InMemoryNft(std::string name) : name_(std::move(name)) {}

bool InMemoryNft::Mint(const Address& to, TokenId tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.emplace(tokenId, to).second;
}

bool InMemoryNft::Burn(TokenId tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.erase(tokenId) != 0;
}

std::optional<Address> InMemoryNft::OwnerOf(TokenId tokenId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = owners_.find(tokenId);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryNft::TransferFrom(const Address& from, const Address& to, TokenId tokenId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failTransfers_) {
        return false;
    }
    auto it = owners_.find(tokenId);
    if (it == owners_.end() || it->second != from) {
        return false;
    }
    it->second = to;
    return true;
}

size_t InMemoryNft::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& [id, owner] : owners_) {
        if (owner == holder) {
            ++count;
        }
    }
    return count;
}

void InMemoryNft::SetFailTransfers(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failTransfers_ = fail;
}

// ============================================================================
// InMemoryVault
// ============================================================================

InMemoryVault::InMemoryVault(std::shared_ptr<InMemoryToken> underlying,
                             const Address& vaultAddress, ExchangeRate initialRate)
    : underlying_(std::move(underlying)), address_(vaultAddress), rate_(initialRate) {
    if (!underlying_) {
        throw std::invalid_argument("InMemoryVault needs an underlying token");
    }
    if (rate_ <= 0) {
        throw std::invalid_argument("InMemoryVault rate must be positive");
    }
}

std::optional<Amount> InMemoryVault::Mint(const Address& depositor, Amount assets) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failMints_ || assets <= 0) {
        return std::nullopt;
    }
    const Amount minted = AssetsToShares(assets, rate_);
    if (minted <= 0 || !underlying_->Transfer(depositor, address_, assets)) {
        return std::nullopt;
    }
    shares_[depositor] = CheckedAdd(shares_[depositor], minted);
    totalShares_ = CheckedAdd(totalShares_, minted);
    return minted;
}

std::optional<Amount> InMemoryVault::Redeem(const Address& holder, Amount shares) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failRedeems_ || shares <= 0) {
        return std::nullopt;
    }
    Amount& held = shares_[holder];
    if (held < shares) {
        return std::nullopt;
    }
    const Amount assets = SharesToAssets(shares, rate_);
    if (!underlying_->Transfer(address_, holder, assets)) {
        LOG_WARN(util::LogCategory::VAULT) << "Vault cannot pay " << assets << " assets";
        return std::nullopt;
    }
    held -= shares;
    totalShares_ -= shares;
    return assets;
}

ExchangeRate InMemoryVault::ExchangeRateCurrent() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rate_;
}

Amount InMemoryVault::BalanceOf(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = shares_.find(holder);
    return it == shares_.end() ? 0 : it->second;
}

void InMemoryVault::SetExchangeRate(ExchangeRate rate) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (rate < rate_) {
        throw std::invalid_argument("Vault exchange rate cannot decrease");
    }
    rate_ = rate;

    // Back every share at the new rate, rounding up
    const Amount needed = MulDivRoundUp(totalShares_, rate_, RATE_SCALE) -
                          underlying_->BalanceOf(address_);
    if (needed > 0) {
        underlying_->Mint(address_, needed);
    }
    LOG_DEBUG(util::LogCategory::VAULT) << "Exchange rate now " << rate_;
}

void InMemoryVault::AccrueYield(int64_t bps) {
    ExchangeRate current = ExchangeRateCurrent();
    SetExchangeRate(current + MulDiv(current, bps, 10000));
}

Amount InMemoryVault::TotalShares() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalShares_;
}

void InMemoryVault::SetFailMints(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failMints_ = fail;
}

void InMemoryVault::SetFailRedeems(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    failRedeems_ = fail;
}

} // namespace sim
} // namespace arena
