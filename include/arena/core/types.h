// ARENA - Core Types Header
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// This file defines fundamental types used throughout ARENA.

#ifndef ARENA_CORE_TYPES_H
#define ARENA_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>

namespace arena {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units of a token
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Epoch number, the first epoch is 1
using Epoch = uint64_t;

/// Identifier of a staking or voting position
using PositionId = uint64_t;

/// Fixed-point vault exchange rate (underlying per share, scaled by RATE_SCALE)
using ExchangeRate = int64_t;

/// League bucket derived from a vote total
using League = uint32_t;

/// Constants
constexpr Amount COIN = 100000000LL;
constexpr Amount MAX_MONEY = 10000000000LL * COIN;

/// Scale of ExchangeRate and price-per-share coefficients
constexpr int64_t RATE_SCALE = 100000000LL;

/// First epoch of a freshly deployed arena
constexpr Epoch FIRST_EPOCH = 1;

/// Position id of the synthetic arena opponent
constexpr PositionId ARENA_POSITION_ID = 0;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a * b / denominator rounded down, 128-bit intermediate.
/// Throws ArenaException(ARITHMETIC_OVERFLOW) if the result does not fit
/// or the denominator is zero.
Amount MulDiv(Amount a, Amount b, Amount denominator);

/// a * b / denominator rounded up
Amount MulDivRoundUp(Amount a, Amount b, Amount denominator);

/// Overflow-checked addition
Amount CheckedAdd(Amount a, Amount b);

/// Overflow-checked subtraction
Amount CheckedSub(Amount a, Amount b);

// ============================================================================
// Hash Templates
// ============================================================================

/// Generic fixed-size byte string
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    /// Check if hash is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set hash to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        // Most significant byte is stored last
        for (int i = SIZE - 1; i >= 0; --i) {
            if (data_[i] < other.data_[i]) return true;
            if (data_[i] > other.data_[i]) return false;
        }
        return false;
    }

    /// Convert to hex string (displayed in reverse byte order)
    std::string ToHex() const;

    /// Create from hex string
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;

    /// First 8 bytes as a little-endian integer
    uint64_t GetUint64() const noexcept;
};

/// 160-bit account or contract address (20 bytes).
/// The null address stands for "nobody" and keys the global weight ledger.
class Address : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Address() = default;

    static Address FromHex(const std::string& hex) {
        auto base = BaseHash<160>::FromHex(hex);
        return Address(base.data(), SIZE);
    }

    /// Address whose low 8 bytes hold value (little-endian)
    static Address FromUint64(uint64_t value);
};

} // namespace arena

#endif // ARENA_CORE_TYPES_H
