// ARENA - Arena Parameter Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/arena/params.h"
#include "arena/util/config.h"

#include <string>
#include <vector>

using namespace arena;

// ============================================================================
// Defaults and Validation
// ============================================================================

TEST(ArenaParamsTest, DefaultsAreValid) {
    ArenaParams params = ArenaParams::Default();
    std::string error;
    EXPECT_TRUE(params.policy.IsValid(&error)) << error;
    EXPECT_TRUE(params.incentives.IsValid(&error)) << error;

    EXPECT_EQ(params.policy.durations.stake, 3 * 86400);
    EXPECT_EQ(params.policy.durations.daiVote, 7 * 86400);
    EXPECT_EQ(params.policy.leagueThresholds.size(), params.policy.leagueZooRewards.size());
    EXPECT_EQ(params.policy.leagueThresholds.front(), 0);
    EXPECT_EQ(params.incentives.baseStakerReward, 83333 * COIN);
    EXPECT_EQ(params.incentives.baseVoterReward, 2000000 * COIN);
    EXPECT_EQ(params.incentives.endEpoch, 13u);
    EXPECT_EQ(params.sim.deposit, 1000 * COIN);
    EXPECT_FALSE(params.policy.autoFulfill);
}

TEST(ArenaParamsTest, PolicyValidation) {
    PolicyParams policy = ArenaParams::Default().policy;
    std::string error;

    PolicyParams bad = policy;
    bad.durations.winner = 0;
    EXPECT_FALSE(bad.IsValid(&error));

    bad = policy;
    bad.leagueThresholds[0] = 5;
    EXPECT_FALSE(bad.IsValid(&error));
    EXPECT_NE(error.find("start at 0"), std::string::npos);

    bad = policy;
    bad.leagueThresholds[2] = bad.leagueThresholds[1];
    EXPECT_FALSE(bad.IsValid(&error));

    bad = policy;
    bad.leagueZooRewards.pop_back();
    EXPECT_FALSE(bad.IsValid(&error));

    bad = policy;
    bad.zooVoteMultiplierBps = 0;
    EXPECT_FALSE(bad.IsValid(nullptr));
}

TEST(ArenaParamsTest, IncentiveValidation) {
    IncentiveParams incentives = ArenaParams::Default().incentives;
    incentives.endEpoch = 0;
    EXPECT_FALSE(incentives.IsValid());

    incentives = ArenaParams::Default().incentives;
    incentives.baseVoterReward = -1;
    EXPECT_FALSE(incentives.IsValid());
}

// ============================================================================
// Amount Lists
// ============================================================================

TEST(ArenaParamsTest, ParseAmountList) {
    std::vector<Amount> out;
    ASSERT_TRUE(ParseAmountList({"0", "10", "250"}, out));
    EXPECT_EQ(out, (std::vector<Amount>{0, 10 * COIN, 250 * COIN}));

    std::string error;
    EXPECT_FALSE(ParseAmountList({"1", "x"}, out, &error));
    EXPECT_NE(error.find("x"), std::string::npos);
    EXPECT_EQ(out.size(), 3u);

    EXPECT_FALSE(ParseAmountList({"12abc"}, out));
    EXPECT_FALSE(ParseAmountList({"-4"}, out));
}

// ============================================================================
// Loading
// ============================================================================

TEST(ArenaParamsTest, LoadOverlaysConfiguredKeys) {
    util::ConfigManager config;
    ASSERT_TRUE(config.ParseString(
        "[stages]\n"
        "stake=60\n"
        "winner=30\n"
        "[policy]\n"
        "leaguethresholds=0,50\n"
        "leaguezoorewards=5,15\n"
        "autofulfill=1\n"
        "[incentives]\n"
        "basevoterreward=1000\n"
        "endepoch=4\n"
        "[sim]\n"
        "epochs=9\n"
        "deposit=25\n").success);

    ArenaParams params = ArenaParams::Default();
    util::ConfigParseResult result = LoadArenaParams(config, params);
    ASSERT_TRUE(result.success) << result.errorMessage;

    EXPECT_EQ(params.policy.durations.stake, 60);
    EXPECT_EQ(params.policy.durations.winner, 30);
    EXPECT_EQ(params.policy.durations.daiVote, 7 * 86400);
    EXPECT_EQ(params.policy.leagueThresholds, (std::vector<Amount>{0, 50 * COIN}));
    EXPECT_EQ(params.policy.leagueZooRewards, (std::vector<Amount>{5 * COIN, 15 * COIN}));
    EXPECT_TRUE(params.policy.autoFulfill);
    EXPECT_EQ(params.incentives.baseVoterReward, 1000 * COIN);
    EXPECT_EQ(params.incentives.baseStakerReward, 83333 * COIN);
    EXPECT_EQ(params.incentives.endEpoch, 4u);
    EXPECT_EQ(params.sim.epochs, 9u);
    EXPECT_EQ(params.sim.deposit, 25 * COIN);
}

TEST(ArenaParamsTest, LoadRejectsMalformedValues) {
    util::ConfigManager config;
    config.ParseString("[stages]\nstake=soon\n");

    ArenaParams params = ArenaParams::Default();
    util::ConfigParseResult result = LoadArenaParams(config, params);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("stake"), std::string::npos);
    EXPECT_EQ(params.policy.durations.stake, 3 * 86400);
}

TEST(ArenaParamsTest, LoadLeavesParamsUntouchedWhenInvalid) {
    util::ConfigManager config;
    config.ParseString("[policy]\nleaguethresholds=0,10,20\n");

    ArenaParams params = ArenaParams::Default();
    EXPECT_FALSE(LoadArenaParams(config, params).success);
    EXPECT_EQ(params.policy.leagueThresholds.size(), 6u);
}

TEST(ArenaParamsTest, LoadRejectsZeroStage) {
    util::ConfigManager config;
    config.ParseString("[stages]\npair=0\n");

    ArenaParams params = ArenaParams::Default();
    EXPECT_FALSE(LoadArenaParams(config, params).success);
}

TEST(ArenaParamsTest, ToStringMentionsIncentives) {
    std::string text = ArenaParams::Default().ToString();
    EXPECT_NE(text.find("endEpoch=13"), std::string::npos);
}
