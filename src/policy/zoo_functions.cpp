// ARENA - Zoo Functions Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/policy/zoo_functions.h"
#include "arena/core/error.h"
#include "arena/core/random.h"
#include "arena/util/logging.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <stdexcept>
#include <string>

namespace arena {
namespace policy {

ZooFunctions::ZooFunctions(const PolicyParams& params) : params_(params) {
    std::string error;
    if (!params_.IsValid(&error)) {
        throw std::invalid_argument("Invalid policy parameters: " + error);
    }
    GetRandBytes(pseudoKey_.data(), pseudoKey_.size());
}

// ============================================================================
// Randomness
// ============================================================================

void ZooFunctions::RequestRandomNumber() {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(!requested_, ArenaError::RANDOM_ALREADY_REQUESTED);
    requested_ = true;

    if (params_.autoFulfill) {
        randomResult_ = GetRandUint64();
        fulfilled_ = true;
        LOG_DEBUG(util::LogCategory::BATTLE) << "Random number fulfilled from OS entropy";
    } else {
        LOG_DEBUG(util::LogCategory::BATTLE) << "Random number requested";
    }
}

void ZooFunctions::FulfillRandomWords(uint64_t word) {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(requested_, ArenaError::RANDOM_NOT_READY, "no request outstanding");
    Require(!fulfilled_, ArenaError::RANDOM_ALREADY_REQUESTED, "already fulfilled");
    randomResult_ = word;
    fulfilled_ = true;
}

uint64_t ZooFunctions::GetRandomResult() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Require(fulfilled_, ArenaError::RANDOM_NOT_READY);
    return randomResult_;
}

void ZooFunctions::ResetRandom() {
    std::lock_guard<std::mutex> lock(mutex_);
    requested_ = false;
    fulfilled_ = false;
    randomResult_ = 0;
}

bool ZooFunctions::IsRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
}

bool ZooFunctions::IsFulfilled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fulfilled_;
}

void ZooFunctions::SetAutoFulfill(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    params_.autoFulfill = enabled;
}

uint64_t ZooFunctions::ComputePseudoRandom() {
    std::lock_guard<std::mutex> lock(mutex_);

    // HMAC-SHA256(key, nonce || epoch random)
    Byte message[16];
    uint64_t nonce = pseudoNonce_++;
    for (int i = 0; i < 8; ++i) {
        message[i] = static_cast<Byte>(nonce >> (8 * i));
        message[8 + i] = static_cast<Byte>(randomResult_ >> (8 * i));
    }

    Byte digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (HMAC(EVP_sha256(), pseudoKey_.data(), static_cast<int>(pseudoKey_.size()),
             message, sizeof(message), digest, &digestLen) == nullptr || digestLen < 8) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }

    uint64_t value = 0;
    for (int i = 0; i < 8; ++i) {
        value |= static_cast<uint64_t>(digest[i]) << (8 * i);
    }
    return value;
}

void ZooFunctions::SetPseudoRandomSeed(uint64_t seed) {
    std::lock_guard<std::mutex> lock(mutex_);
    pseudoKey_.fill(0);
    for (int i = 0; i < 8; ++i) {
        pseudoKey_[i] = static_cast<Byte>(seed >> (8 * i));
    }
    pseudoNonce_ = 0;
}

// ============================================================================
// Policy
// ============================================================================

bool ZooFunctions::DecideWins(Amount votesA, Amount votesB, uint64_t random) const {
    const uint64_t a = votesA > 0 ? static_cast<uint64_t>(votesA) : 0;
    const uint64_t b = votesB > 0 ? static_cast<uint64_t>(votesB) : 0;
    if (a + b == 0) {
        return (random & 1) == 0;
    }
    return random % (a + b) < a;
}

Amount ZooFunctions::ComputeVotesByDai(Amount amount) const {
    return MulDiv(amount, params_.daiVoteMultiplierBps, BPS_DENOMINATOR);
}

Amount ZooFunctions::ComputeVotesByZoo(Amount amount) const {
    return MulDiv(amount, params_.zooVoteMultiplierBps, BPS_DENOMINATOR);
}

League ZooFunctions::GetNftLeague(Amount votes) const {
    League league = 0;
    for (size_t i = 1; i < params_.leagueThresholds.size(); ++i) {
        if (votes < params_.leagueThresholds[i]) {
            break;
        }
        league = static_cast<League>(i);
    }
    return league;
}

Amount ZooFunctions::GetLeagueZooRewards(League league) const {
    if (params_.leagueZooRewards.empty()) {
        return 0;
    }
    size_t index = std::min<size_t>(league, params_.leagueZooRewards.size() - 1);
    return params_.leagueZooRewards[index];
}

StageDurations ZooFunctions::GetStageDurations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return params_.durations;
}

void ZooFunctions::SetStageDurations(const StageDurations& durations) {
    if (!durations.IsValid()) {
        throw std::invalid_argument("Invalid stage durations: " + durations.ToString());
    }
    std::lock_guard<std::mutex> lock(mutex_);
    params_.durations = durations;
    LOG_INFO(util::LogCategory::STAGE) << "Stage durations set to " << durations.ToString();
}

} // namespace policy
} // namespace arena
