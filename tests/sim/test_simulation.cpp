// ARENA - Simulation Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/sim/simulation.h"
#include "arena/util/time.h"

#include <stdexcept>

using namespace arena;
using namespace arena::sim;

class SimulationTest : public ::testing::Test {
protected:
    void SetUp() override {
        params_ = ArenaParams::Default();
        params_.sim.epochs = 3;
        params_.sim.stakers = 4;
        params_.sim.voters = 2;
        params_.sim.deposit = 100 * COIN;
        params_.sim.seed = 42;
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    ArenaParams params_;
};

TEST_F(SimulationTest, SeededRunCompletes) {
    Simulation sim(params_);
    SimulationReport report = sim.Run();

    EXPECT_EQ(report.epochsRun, 3u);
    EXPECT_GT(report.battles, 0u);

    // Stakers 0..2 get two voters each with 1x, 2x and 3x the deposit
    EXPECT_EQ(report.daiDeposited, 2 * (100 + 200 + 300) * COIN);
    EXPECT_GT(report.daiWithdrawn, 0);

    // Principal survives battles up to rounding
    EXPECT_GE(report.daiWithdrawn, report.daiDeposited - COIN);

    const Amount paidOut =
        report.daiWithdrawn + report.stakerDai + report.voterDai + report.treasuryDai;
    EXPECT_LE(paidOut, sim.GetDai().TotalSupply());
    EXPECT_GE(report.sharesLeft, 0);

    EXPECT_EQ(sim.GetArena().GetActivePositionCount(), 0u);
    for (PositionId id : sim.GetVotingIds()) {
        EXPECT_FALSE(sim.GetArena().GetVotingPosition(id)->IsActive());
    }
}

TEST_F(SimulationTest, SameSeedSameReport) {
    std::string first;
    {
        Simulation sim(params_);
        first = sim.Run().ToString();
    }
    Simulation again(params_);
    EXPECT_EQ(again.Run().ToString(), first);
}

TEST_F(SimulationTest, StakersWithoutVotersNeverBattle) {
    params_.sim.stakers = 1;
    params_.sim.voters = 0;

    Simulation sim(params_);
    SimulationReport report = sim.Run();
    EXPECT_EQ(report.epochsRun, 3u);
    EXPECT_EQ(report.battles, 0u);
    EXPECT_EQ(report.daiDeposited, 0);
}

TEST_F(SimulationTest, RejectsEmptySetup) {
    params_.sim.stakers = 0;
    EXPECT_THROW(Simulation bad(params_), std::invalid_argument);

    params_ = ArenaParams::Default();
    params_.sim.deposit = 0;
    EXPECT_THROW(Simulation bad(params_), std::invalid_argument);
}
