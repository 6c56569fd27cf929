// ARENA - Arena Test Fixture
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// A complete arena on in-memory collaborators under mock time. Tests call
// the arena directly with the front-end addresses as callers.

#ifndef ARENA_TESTS_ARENA_FIXTURE_H
#define ARENA_TESTS_ARENA_FIXTURE_H

#include <gtest/gtest.h>

#include "arena/arena/battle_arena.h"
#include "arena/arena/params.h"
#include "arena/arena/stage_clock.h"
#include "arena/core/error.h"
#include "arena/interfaces/vault.h"
#include "arena/listing/listing_list.h"
#include "arena/policy/zoo_functions.h"
#include "arena/sim/memory_collaborators.h"
#include "arena/util/time.h"

#include <algorithm>
#include <functional>
#include <memory>
#include <vector>

namespace arena {
namespace test {

constexpr Timestamp TEST_START_TIME = 1000000;
constexpr int64_t TEST_STAGE_LENGTH = 100;

/// Exchange rate 10% above the initial one
constexpr ExchangeRate RATE_PLUS_10 = RATE_SCALE + RATE_SCALE / 10;

inline Address Actor(uint64_t n) {
    return Address::FromUint64(0x5000 + n);
}

class ArenaFixture : public ::testing::Test {
protected:
    void SetUp() override {
        util::EnableMockTime();
        util::SetMockTime(TEST_START_TIME);

        policyParams_ = ArenaParams::Default().policy;
        policyParams_.durations = StageDurations{TEST_STAGE_LENGTH, TEST_STAGE_LENGTH,
                                                 TEST_STAGE_LENGTH, TEST_STAGE_LENGTH,
                                                 TEST_STAGE_LENGTH};
        incentiveParams_ = ArenaParams::Default().incentives;
        Configure(policyParams_, incentiveParams_);

        self_ = Address::FromUint64(0xA000);
        treasury_ = Address::FromUint64(0xA001);
        stakingFrontEnd_ = Address::FromUint64(0xA002);
        votingFrontEnd_ = Address::FromUint64(0xA003);
        owner_ = Address::FromUint64(0xA005);
        collection_ = Address::FromUint64(0xC000);

        dai_ = std::make_shared<sim::InMemoryToken>("DAI");
        zoo_ = std::make_shared<sim::InMemoryToken>("ZOO");
        vault_ = std::make_shared<sim::InMemoryVault>(dai_, Address::FromUint64(0xA004));
        policy_ = std::make_shared<policy::ZooFunctions>(policyParams_);
        policy_->SetPseudoRandomSeed(7);

        clock_ = std::make_shared<EpochStageClock>(policyParams_.durations, TEST_START_TIME);
        auto clock = clock_;
        registry_ = std::make_shared<listing::ListingList>(
            owner_, [clock]() { return clock->GetCurrentEpoch(); });
        registry_->AllowNewContractForStaking(owner_, collection_);
        registry_->SetArena(owner_, self_);

        ArenaCollaborators collaborators;
        collaborators.dai = dai_;
        collaborators.zoo = zoo_;
        collaborators.vault = vault_;
        collaborators.policy = policy_;
        collaborators.registry = registry_;
        collaborators.clock = clock_;

        ArenaAddresses addresses;
        addresses.self = self_;
        addresses.treasury = treasury_;
        addresses.stakingFrontEnd = stakingFrontEnd_;
        addresses.votingFrontEnd = votingFrontEnd_;

        arena_ = std::make_shared<NftBattleArena>(collaborators, addresses, incentiveParams_);
        zoo_->Mint(self_, ARENA_ZOO_FUND);
    }

    void TearDown() override {
        util::DisableMockTime();
    }

    /// Adjust parameters before the arena is built
    virtual void Configure(PolicyParams& policy, IncentiveParams& incentives) {
        (void)policy;
        (void)incentives;
    }

    // ========================================================================
    // Helpers
    // ========================================================================

    void MoveTo(Stage stage) {
        util::SetMockTime(std::max(util::GetTime(), clock_->GetStageStart(stage)));
    }

    PositionId Stake(TokenId tokenId) {
        return arena_->CreateStakerPosition(stakingFrontEnd_, collection_, tokenId);
    }

    /// Fund voter with amount dai and open a voting position
    PositionId Vote(const Address& voter, PositionId stakingId, Amount amount) {
        dai_->Mint(voter, amount);
        dai_->Approve(voter, self_, dai_->Allowance(voter, self_) + amount);
        return arena_->CreateVotingPosition(votingFrontEnd_, stakingId, voter, amount);
    }

    void AddZoo(const Address& voter, PositionId votingId, Amount amount) {
        zoo_->Mint(voter, amount);
        zoo_->Approve(voter, self_, zoo_->Allowance(voter, self_) + amount);
        arena_->AddZooToVoting(votingFrontEnd_, votingId, voter, amount);
    }

    void Fulfill(uint64_t word) {
        arena_->RequestRandom();
        policy_->FulfillRandomWords(word);
    }

    /// Decide every open pair with word and move on to the next epoch
    void FinishEpoch(uint64_t word) {
        MoveTo(Stage::Winner);
        Fulfill(word);
        const Epoch epoch = arena_->GetCurrentEpoch();
        const std::vector<NftPair> pairs = arena_->GetPairs(epoch);
        for (size_t i = 0; i < pairs.size(); ++i) {
            if (!pairs[i].playedInEpoch) {
                arena_->ChooseWinnerInPair(i);
            }
        }
        arena_->UpdateEpoch();
    }

    void ExpectError(ArenaError expected, const std::function<void()>& op) {
        try {
            op();
            ADD_FAILURE() << "expected " << ArenaErrorToString(expected);
        } catch (const ArenaException& e) {
            EXPECT_EQ(e.GetCode(), expected) << e.what();
        }
    }

    static constexpr Amount ARENA_ZOO_FUND = 100000000 * COIN;

    PolicyParams policyParams_;
    IncentiveParams incentiveParams_;

    Address self_;
    Address treasury_;
    Address stakingFrontEnd_;
    Address votingFrontEnd_;
    Address owner_;
    Address collection_;

    std::shared_ptr<sim::InMemoryToken> dai_;
    std::shared_ptr<sim::InMemoryToken> zoo_;
    std::shared_ptr<sim::InMemoryVault> vault_;
    std::shared_ptr<policy::ZooFunctions> policy_;
    std::shared_ptr<EpochStageClock> clock_;
    std::shared_ptr<listing::ListingList> registry_;
    std::shared_ptr<NftBattleArena> arena_;
};

/// Every position in league 0
class SingleLeagueFixture : public ArenaFixture {
protected:
    void Configure(PolicyParams& policy, IncentiveParams&) override {
        policy.leagueThresholds = {0};
        policy.leagueZooRewards = {10 * COIN};
    }
};

} // namespace test
} // namespace arena

#endif // ARENA_TESTS_ARENA_FIXTURE_H
