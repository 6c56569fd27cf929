// ARENA - Time Utilities Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/util/time.h"

#include <atomic>
#include <sstream>

namespace arena {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

int64_t GetTimeMillis() {
    return std::chrono::duration_cast<Milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// ============================================================================
// Mock Time
// ============================================================================

void EnableMockTime() {
    if (g_mockTime.load() == 0) {
        g_mockTime.store(GetTime());
    }
    g_mockTimeEnabled.store(true);
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

int64_t GetMockTime() {
    return g_mockTime.load();
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatDuration(Seconds duration) {
    int64_t total = duration.count();
    if (total < 0) {
        return "-" + FormatDuration(Seconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    const int64_t parts[] = {
        total / SECONDS_PER_DAY,
        (total % SECONDS_PER_DAY) / SECONDS_PER_HOUR,
        (total % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE,
        total % SECONDS_PER_MINUTE,
    };
    const char* units[] = {"d", "h", "m", "s"};

    std::ostringstream oss;
    bool first = true;
    for (size_t i = 0; i < 4; ++i) {
        if (parts[i] == 0) continue;
        if (!first) oss << ' ';
        oss << parts[i] << units[i];
        first = false;
    }
    return oss.str();
}

} // namespace util
} // namespace arena
