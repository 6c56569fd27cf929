// ARENA - Yield Vault Interface
// Copyright (c) 2024 ARENA Developers
// MIT License

#ifndef ARENA_INTERFACES_VAULT_H
#define ARENA_INTERFACES_VAULT_H

#include "arena/core/types.h"

#include <optional>

namespace arena {

/**
 * Interest-bearing vault over the deposit asset.
 *
 * Shares are minted at the current exchange rate and redeemed at the rate
 * of the moment, so a share is worth a non-decreasing amount of the
 * underlying asset over time.
 */
class IYieldVault {
public:
    virtual ~IYieldVault() = default;

    /// Pull `assets` of the underlying from depositor and mint shares to it.
    /// Returns the shares minted, nullopt on failure.
    virtual std::optional<Amount> Mint(const Address& depositor, Amount assets) = 0;

    /// Burn `shares` held by holder and send the underlying to it.
    /// Returns the assets paid out, nullopt on failure.
    virtual std::optional<Amount> Redeem(const Address& holder, Amount shares) = 0;

    /// Underlying per share, scaled by RATE_SCALE; never decreases
    virtual ExchangeRate ExchangeRateCurrent() const = 0;

    /// Shares held
    virtual Amount BalanceOf(const Address& holder) const = 0;
};

/// Underlying value of shares at rate (rounded down)
inline Amount SharesToAssets(Amount shares, ExchangeRate rate) {
    return MulDiv(shares, rate, RATE_SCALE);
}

/// Shares worth assets at rate (rounded down)
inline Amount AssetsToShares(Amount assets, ExchangeRate rate) {
    return MulDiv(assets, RATE_SCALE, rate);
}

} // namespace arena

#endif // ARENA_INTERFACES_VAULT_H
