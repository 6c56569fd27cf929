// ARENA - Core Types Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/core/types.h"
#include "arena/core/error.h"

#include <limits>
#include <stdexcept>

namespace arena {

// ============================================================================
// Checked Arithmetic
// ============================================================================

namespace {

// GCC and Clang provide __int128 in strict ISO mode as well
__extension__ typedef __int128 int128;

constexpr int128 AMOUNT_MAX = std::numeric_limits<Amount>::max();
constexpr int128 AMOUNT_MIN = std::numeric_limits<Amount>::min();

Amount NarrowOrThrow(int128 value) {
    if (value > AMOUNT_MAX || value < AMOUNT_MIN) {
        throw ArenaException(ArenaError::ARITHMETIC_OVERFLOW);
    }
    return static_cast<Amount>(value);
}

} // anonymous namespace

Amount MulDiv(Amount a, Amount b, Amount denominator) {
    if (denominator == 0) {
        throw ArenaException(ArenaError::ARITHMETIC_OVERFLOW, "division by zero");
    }
    int128 product = static_cast<int128>(a) * static_cast<int128>(b);
    return NarrowOrThrow(product / denominator);
}

Amount MulDivRoundUp(Amount a, Amount b, Amount denominator) {
    if (denominator == 0) {
        throw ArenaException(ArenaError::ARITHMETIC_OVERFLOW, "division by zero");
    }
    int128 product = static_cast<int128>(a) * static_cast<int128>(b);
    int128 quotient = product / denominator;
    // Truncation went toward zero; step away when positive with a remainder
    if (product % denominator != 0 && (product > 0) == (denominator > 0)) {
        ++quotient;
    }
    return NarrowOrThrow(quotient);
}

Amount CheckedAdd(Amount a, Amount b) {
    return NarrowOrThrow(static_cast<int128>(a) + b);
}

Amount CheckedSub(Amount a, Amount b) {
    return NarrowOrThrow(static_cast<int128>(a) - b);
}

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    std::string result;
    result.reserve(SIZE * 2);

    static const char hexChars[] = "0123456789abcdef";

    for (int i = SIZE - 1; i >= 0; --i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }

    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    std::string digits = hex;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    BaseHash result;

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    // Hex string is big-endian display
    for (size_t i = 0; i < SIZE; ++i) {
        size_t hexIdx = (SIZE - 1 - i) * 2;
        Byte high = hexCharToNibble(digits[hexIdx]);
        Byte low = hexCharToNibble(digits[hexIdx + 1]);
        result.data_[i] = (high << 4) | low;
    }

    return result;
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;

uint64_t Hash256::GetUint64() const noexcept {
    uint64_t value = 0;
    for (int i = 7; i >= 0; --i) {
        value = (value << 8) | data_[i];
    }
    return value;
}

Address Address::FromUint64(uint64_t value) {
    Address addr;
    for (size_t i = 0; i < 8; ++i) {
        addr.data_[i] = static_cast<Byte>(value >> (8 * i));
    }
    return addr;
}

} // namespace arena
