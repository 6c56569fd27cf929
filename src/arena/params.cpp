// ARENA - Arena Parameters Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/params.h"
#include "arena/util/logging.h"
#include "arena/util/time.h"

#include <sstream>
#include <stdexcept>

namespace arena {

// ============================================================================
// Validation
// ============================================================================

namespace {

bool Fail(std::string* error, const std::string& message) {
    if (error) {
        *error = message;
    }
    return false;
}

/// Whole tokens to smallest units; false on overflow or negative input
bool WholeToUnits(int64_t whole, Amount& out) {
    if (whole < 0 || whole > MAX_MONEY / COIN) {
        return false;
    }
    out = whole * COIN;
    return true;
}

/// Read an integer key if present; false if present but malformed
bool ReadInt(const util::ConfigManager& config, const char* key, const char* section,
             int64_t& out, std::string& error) {
    if (!config.HasKey(key, section)) {
        return true;
    }
    auto value = config.TryGetInt(key, section);
    if (!value) {
        error = std::string("[") + section + "] " + key + " is not an integer";
        return false;
    }
    out = *value;
    return true;
}

} // namespace

bool PolicyParams::IsValid(std::string* error) const {
    if (!durations.IsValid()) {
        return Fail(error, "stage durations must be positive: " + durations.ToString());
    }
    if (daiVoteMultiplierBps <= 0 || zooVoteMultiplierBps <= 0) {
        return Fail(error, "vote multipliers must be positive");
    }
    if (leagueThresholds.empty() || leagueThresholds.front() != 0) {
        return Fail(error, "league thresholds must start at 0");
    }
    for (size_t i = 1; i < leagueThresholds.size(); ++i) {
        if (leagueThresholds[i] <= leagueThresholds[i - 1]) {
            return Fail(error, "league thresholds must be ascending");
        }
    }
    if (leagueZooRewards.size() != leagueThresholds.size()) {
        return Fail(error, "need one league zoo reward per league threshold");
    }
    for (Amount reward : leagueZooRewards) {
        if (!MoneyRange(reward)) {
            return Fail(error, "league zoo reward out of range");
        }
    }
    return true;
}

bool IncentiveParams::IsValid(std::string* error) const {
    if (!MoneyRange(baseStakerReward) || !MoneyRange(baseVoterReward)) {
        return Fail(error, "base incentive rewards out of range");
    }
    if (endEpoch < FIRST_EPOCH) {
        return Fail(error, "incentive end epoch must be at least 1");
    }
    return true;
}

// ============================================================================
// Defaults
// ============================================================================

ArenaParams ArenaParams::Default() {
    ArenaParams params;

    params.policy.durations.stake = 3 * util::SECONDS_PER_DAY;
    params.policy.durations.daiVote = 7 * util::SECONDS_PER_DAY;
    params.policy.durations.pair = 2 * util::SECONDS_PER_DAY;
    params.policy.durations.zooVote = 5 * util::SECONDS_PER_DAY;
    params.policy.durations.winner = 2 * util::SECONDS_PER_DAY;

    params.policy.leagueThresholds = {0, 10 * COIN, 100 * COIN, 1000 * COIN,
                                      10000 * COIN, 100000 * COIN};
    params.policy.leagueZooRewards = {10 * COIN, 20 * COIN, 50 * COIN,
                                      100 * COIN, 200 * COIN, 500 * COIN};

    params.incentives.baseStakerReward = 83333 * COIN;
    params.incentives.baseVoterReward = 2000000 * COIN;
    params.incentives.endEpoch = 13;

    params.sim.deposit = 1000 * COIN;
    return params;
}

std::string ArenaParams::ToString() const {
    std::ostringstream oss;
    oss << "ArenaParams(stages=" << policy.durations.ToString()
        << ", leagues=" << policy.leagueThresholds.size()
        << ", autoFulfill=" << (policy.autoFulfill ? "yes" : "no")
        << ", baseStaker=" << incentives.baseStakerReward
        << ", baseVoter=" << incentives.baseVoterReward
        << ", endEpoch=" << incentives.endEpoch << ")";
    return oss.str();
}

// ============================================================================
// Loading
// ============================================================================

bool ParseAmountList(const std::vector<std::string>& values, std::vector<Amount>& out,
                     std::string* error) {
    std::vector<Amount> parsed;
    parsed.reserve(values.size());
    for (const auto& value : values) {
        int64_t whole = 0;
        try {
            size_t pos = 0;
            whole = std::stoll(value, &pos);
            if (pos != value.size()) {
                return Fail(error, "not a whole number: " + value);
            }
        } catch (const std::exception&) {
            return Fail(error, "not a whole number: " + value);
        }
        Amount units = 0;
        if (!WholeToUnits(whole, units)) {
            return Fail(error, "amount out of range: " + value);
        }
        parsed.push_back(units);
    }
    out = std::move(parsed);
    return true;
}

util::ConfigParseResult LoadArenaParams(const util::ConfigManager& config, ArenaParams& params) {
    using namespace util::ConfigKeys;
    namespace sections = util::ConfigSections;

    ArenaParams loaded = params;
    std::string error;

    // [stages]
    StageDurations& d = loaded.policy.durations;
    if (!ReadInt(config, STAGE_STAKE, sections::STAGES, d.stake, error) ||
        !ReadInt(config, STAGE_DAIVOTE, sections::STAGES, d.daiVote, error) ||
        !ReadInt(config, STAGE_PAIR, sections::STAGES, d.pair, error) ||
        !ReadInt(config, STAGE_ZOOVOTE, sections::STAGES, d.zooVote, error) ||
        !ReadInt(config, STAGE_WINNER, sections::STAGES, d.winner, error)) {
        return util::ConfigParseResult::Error(error);
    }

    // [incentives]
    int64_t baseStaker = -1;
    int64_t baseVoter = -1;
    int64_t endEpoch = static_cast<int64_t>(loaded.incentives.endEpoch);
    if (!ReadInt(config, BASE_STAKER_REWARD, sections::INCENTIVES, baseStaker, error) ||
        !ReadInt(config, BASE_VOTER_REWARD, sections::INCENTIVES, baseVoter, error) ||
        !ReadInt(config, END_EPOCH, sections::INCENTIVES, endEpoch, error)) {
        return util::ConfigParseResult::Error(error);
    }
    if (baseStaker >= 0 && !WholeToUnits(baseStaker, loaded.incentives.baseStakerReward)) {
        return util::ConfigParseResult::Error("basestakerreward out of range");
    }
    if (baseVoter >= 0 && !WholeToUnits(baseVoter, loaded.incentives.baseVoterReward)) {
        return util::ConfigParseResult::Error("basevoterreward out of range");
    }
    if (endEpoch < 0) {
        return util::ConfigParseResult::Error("endepoch must not be negative");
    }
    loaded.incentives.endEpoch = static_cast<Epoch>(endEpoch);

    // [policy]
    if (!ReadInt(config, DAI_VOTE_MULTIPLIER, sections::POLICY,
                 loaded.policy.daiVoteMultiplierBps, error) ||
        !ReadInt(config, ZOO_VOTE_MULTIPLIER, sections::POLICY,
                 loaded.policy.zooVoteMultiplierBps, error)) {
        return util::ConfigParseResult::Error(error);
    }
    if (config.HasKey(LEAGUE_THRESHOLDS, sections::POLICY) &&
        !ParseAmountList(config.GetList(LEAGUE_THRESHOLDS, sections::POLICY),
                         loaded.policy.leagueThresholds, &error)) {
        return util::ConfigParseResult::Error("leaguethresholds: " + error);
    }
    if (config.HasKey(LEAGUE_ZOO_REWARDS, sections::POLICY) &&
        !ParseAmountList(config.GetList(LEAGUE_ZOO_REWARDS, sections::POLICY),
                         loaded.policy.leagueZooRewards, &error)) {
        return util::ConfigParseResult::Error("leaguezoorewards: " + error);
    }
    if (config.HasKey(AUTO_FULFILL, sections::POLICY)) {
        auto autoFulfill = config.TryGetBool(AUTO_FULFILL, sections::POLICY);
        if (!autoFulfill) {
            return util::ConfigParseResult::Error("autofulfill is not a boolean");
        }
        loaded.policy.autoFulfill = *autoFulfill;
    }

    // [sim]
    SimParams& sim = loaded.sim;
    sim.epochs = config.GetUInt(SIM_EPOCHS, sim.epochs, sections::SIM);
    sim.stakers = config.GetUInt(SIM_STAKERS, sim.stakers, sections::SIM);
    sim.voters = config.GetUInt(SIM_VOTERS, sim.voters, sections::SIM);
    sim.seed = config.GetUInt(SIM_SEED, sim.seed, sections::SIM);
    if (!ReadInt(config, SIM_YIELD_BPS, sections::SIM, sim.yieldBps, error)) {
        return util::ConfigParseResult::Error(error);
    }
    if (sim.yieldBps < 0) {
        return util::ConfigParseResult::Error("yieldbps must not be negative");
    }
    int64_t deposit = -1;
    if (!ReadInt(config, SIM_DEPOSIT, sections::SIM, deposit, error)) {
        return util::ConfigParseResult::Error(error);
    }
    if (deposit >= 0 && !WholeToUnits(deposit, sim.deposit)) {
        return util::ConfigParseResult::Error("deposit out of range");
    }

    if (!loaded.policy.IsValid(&error) || !loaded.incentives.IsValid(&error)) {
        return util::ConfigParseResult::Error(error);
    }

    params = std::move(loaded);
    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded " << params.ToString();
    return util::ConfigParseResult::Success();
}

} // namespace arena
