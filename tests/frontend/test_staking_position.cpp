// ARENA - NFT Staking Position Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena_fixture.h"

#include "arena/frontend/staking_position.h"

using namespace arena;
using namespace arena::test;
using arena::frontend::NftStakingPosition;

class StakingPositionTest : public ArenaFixture {
protected:
    void SetUp() override {
        ArenaFixture::SetUp();
        ape_ = std::make_shared<sim::InMemoryNft>("APE");
        positions_ = std::make_shared<sim::InMemoryNft>("STAKE-POS");
        staking_ = std::make_unique<NftStakingPosition>(stakingFrontEnd_, arena_, registry_,
                                                        positions_);
        staking_->AddCollection(collection_, ape_);
        ape_->Mint(Actor(1), 7);
    }

    std::shared_ptr<sim::InMemoryNft> ape_;
    std::shared_ptr<sim::InMemoryNft> positions_;
    std::unique_ptr<NftStakingPosition> staking_;
};

// ============================================================================
// Staking
// ============================================================================

TEST_F(StakingPositionTest, StakeTakesCustody) {
    PositionId id = staking_->StakeNft(Actor(1), collection_, 7);

    EXPECT_EQ(ape_->OwnerOf(7), stakingFrontEnd_);
    EXPECT_EQ(positions_->OwnerOf(id), Actor(1));

    auto staked = staking_->GetStakedToken(id);
    ASSERT_TRUE(staked.has_value());
    EXPECT_EQ(staked->collection, collection_);
    EXPECT_EQ(staked->tokenId, 7u);

    auto position = arena_->GetStakerPosition(id);
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->tokenId, 7u);
    EXPECT_TRUE(position->IsActive());
}

TEST_F(StakingPositionTest, StakeNeedsListedCollection) {
    registry_->DisallowContractFromStaking(owner_, collection_);
    ExpectError(ArenaError::COLLECTION_NOT_ELIGIBLE, [&]() {
        staking_->StakeNft(Actor(1), collection_, 7);
    });

    // Listed in the registry but without a token ledger in the front end
    const Address unknown = Address::FromUint64(0xC002);
    registry_->AllowNewContractForStaking(owner_, unknown);
    ExpectError(ArenaError::COLLECTION_NOT_ELIGIBLE, [&]() {
        staking_->StakeNft(Actor(1), unknown, 7);
    });
    EXPECT_EQ(ape_->OwnerOf(7), Actor(1));
}

TEST_F(StakingPositionTest, StakeNeedsOwnership) {
    ExpectError(ArenaError::NOT_OWNER, [&]() { staking_->StakeNft(Actor(2), collection_, 7); });
    ExpectError(ArenaError::NOT_OWNER, [&]() { staking_->StakeNft(Actor(1), collection_, 8); });
}

TEST_F(StakingPositionTest, FailedTransferOpensNothing) {
    ape_->SetFailTransfers(true);
    ExpectError(ArenaError::NFT_TRANSFER_FAILED, [&]() {
        staking_->StakeNft(Actor(1), collection_, 7);
    });
    EXPECT_EQ(ape_->OwnerOf(7), Actor(1));
    EXPECT_EQ(arena_->GetActivePositionCount(), 0u);
}

TEST_F(StakingPositionTest, ArenaRejectionReturnsNft) {
    MoveTo(Stage::DaiVote);
    ExpectError(ArenaError::INVALID_STAGE, [&]() {
        staking_->StakeNft(Actor(1), collection_, 7);
    });
    EXPECT_EQ(ape_->OwnerOf(7), Actor(1));
    EXPECT_EQ(positions_->BalanceOf(Actor(1)), 0u);
}

TEST_F(StakingPositionTest, PositionTokenMintFailureReturnsNft) {
    // Id 1 is already taken in the position token ledger
    positions_->Mint(Actor(5), 1);

    ExpectError(ArenaError::NFT_TRANSFER_FAILED, [&]() {
        staking_->StakeNft(Actor(1), collection_, 7);
    });
    EXPECT_EQ(ape_->OwnerOf(7), Actor(1));
    EXPECT_FALSE(staking_->GetStakedToken(1).has_value());
}

// ============================================================================
// Unstaking
// ============================================================================

TEST_F(StakingPositionTest, UnstakeReturnsNft) {
    PositionId id = staking_->StakeNft(Actor(1), collection_, 7);
    staking_->UnstakeNft(Actor(1), id);

    EXPECT_EQ(ape_->OwnerOf(7), Actor(1));
    EXPECT_FALSE(positions_->OwnerOf(id).has_value());
    EXPECT_FALSE(staking_->GetStakedToken(id).has_value());
    EXPECT_FALSE(arena_->GetStakerPosition(id)->IsActive());
}

TEST_F(StakingPositionTest, UnstakeNeedsPositionToken) {
    PositionId id = staking_->StakeNft(Actor(1), collection_, 7);
    ExpectError(ArenaError::NOT_OWNER, [&]() { staking_->UnstakeNft(Actor(2), id); });
    ExpectError(ArenaError::NOT_OWNER, [&]() { staking_->UnstakeNft(Actor(1), id + 1); });
}

TEST_F(StakingPositionTest, UnstakeOutsideStakeStageKeepsCustody) {
    PositionId id = staking_->StakeNft(Actor(1), collection_, 7);
    MoveTo(Stage::Pair);

    ExpectError(ArenaError::INVALID_STAGE, [&]() { staking_->UnstakeNft(Actor(1), id); });
    EXPECT_EQ(ape_->OwnerOf(7), stakingFrontEnd_);
    EXPECT_EQ(positions_->OwnerOf(id), Actor(1));
    EXPECT_TRUE(staking_->GetStakedToken(id).has_value());
}

TEST_F(StakingPositionTest, PositionTokenCarriesRights) {
    PositionId id = staking_->StakeNft(Actor(1), collection_, 7);
    ASSERT_TRUE(positions_->TransferFrom(Actor(1), Actor(2), id));

    ExpectError(ArenaError::NOT_OWNER, [&]() {
        staking_->ClaimRewardFromStaking(Actor(1), id, Actor(1));
    });
    EXPECT_EQ(staking_->ClaimRewardFromStaking(Actor(2), id, Actor(2)), 0);
    EXPECT_EQ(staking_->ClaimIncentiveStakerReward(Actor(2), id, Actor(2)), 0);

    staking_->UnstakeNft(Actor(2), id);
    EXPECT_EQ(ape_->OwnerOf(7), Actor(2));
}

TEST_F(StakingPositionTest, MissingCollaboratorsRejected) {
    EXPECT_THROW(NftStakingPosition(stakingFrontEnd_, nullptr, registry_, positions_),
                 std::invalid_argument);
    EXPECT_THROW(staking_->AddCollection(collection_, nullptr), std::invalid_argument);
}
