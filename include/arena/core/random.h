// ARENA - Secure Random Number Generation Header
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// OS entropy for fulfilling randomness requests when no external
// coordinator supplies the epoch random word.

#ifndef ARENA_CORE_RANDOM_H
#define ARENA_CORE_RANDOM_H

#include "arena/core/types.h"

#include <cstddef>
#include <cstdint>

namespace arena {

/// Fill buffer with random bytes from the OS entropy source.
/// Throws std::runtime_error if the source fails.
void GetRandBytes(uint8_t* buf, size_t len);

/// Generate random 64-bit unsigned integer
uint64_t GetRandUint64();

/// Generate random integer in range [0, max) without modulo bias
uint64_t GetRandInt(uint64_t max);

/// Generate random 256-bit value
Hash256 GetRandHash256();

namespace detail {

/// Platform-specific entropy; returns false on failure
bool GetOSEntropy(uint8_t* buf, size_t len);

} // namespace detail

} // namespace arena

#endif // ARENA_CORE_RANDOM_H
