// ARENA - Time Utilities
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Wall-clock access for the stage clock, with mock time for tests and
// the simulator.

#ifndef ARENA_UTIL_TIME_H
#define ARENA_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace arena {
namespace util {

using Seconds = std::chrono::seconds;
using Milliseconds = std::chrono::milliseconds;

// ============================================================================
// Unix Timestamps
// ============================================================================

/// Current Unix timestamp in seconds (mock time when enabled)
int64_t GetTime();

/// Current Unix timestamp in milliseconds (ignores mock time)
int64_t GetTimeMillis();

// ============================================================================
// Mock Time
// ============================================================================

/// Enable mock time; starts at the real time unless already set
void EnableMockTime();

void DisableMockTime();

bool IsMockTimeEnabled();

void SetMockTime(int64_t timestamp);

void AdvanceMockTime(Seconds duration);

int64_t GetMockTime();

// ============================================================================
// Formatting
// ============================================================================

/// "2d 3h 4m 5s" style rendering
std::string FormatDuration(Seconds duration);

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_WEEK = 604800;

} // namespace util
} // namespace arena

#endif // ARENA_UTIL_TIME_H
