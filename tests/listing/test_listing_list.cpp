// ARENA - Listing List Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/core/error.h"
#include "arena/listing/listing_list.h"

#include <functional>
#include <memory>
#include <stdexcept>

using namespace arena;
using namespace arena::listing;

class ListingListTest : public ::testing::Test {
protected:
    void SetUp() override {
        list_ = std::make_unique<ListingList>(owner_, [this]() { return epoch_; });
        list_->SetArena(owner_, arena_);
        list_->AllowNewContractForStaking(owner_, collectionA_);
        list_->AllowNewContractForStaking(owner_, collectionB_);
    }

    void ExpectError(ArenaError expected, const std::function<void()>& op) {
        try {
            op();
            ADD_FAILURE() << "expected " << ArenaErrorToString(expected);
        } catch (const ArenaException& e) {
            EXPECT_EQ(e.GetCode(), expected);
        }
    }

    Epoch epoch_{1};
    Address owner_ = Address::FromUint64(0xA005);
    Address arena_ = Address::FromUint64(0xA000);
    Address collectionA_ = Address::FromUint64(0xC000);
    Address collectionB_ = Address::FromUint64(0xC001);
    std::unique_ptr<ListingList> list_;
};

TEST(ListingListConstruction, NeedsEpochSource) {
    EXPECT_THROW(ListingList(Address::FromUint64(1), EpochSource()), std::invalid_argument);
}

// ============================================================================
// Administration
// ============================================================================

TEST_F(ListingListTest, OwnerManagesEligibility) {
    EXPECT_TRUE(list_->IsEligible(collectionA_));
    EXPECT_EQ(list_->GetEligibleCollections().size(), 2u);

    list_->DisallowContractFromStaking(owner_, collectionB_);
    EXPECT_FALSE(list_->IsEligible(collectionB_));

    auto eligible = list_->GetEligibleCollections();
    ASSERT_EQ(eligible.size(), 1u);
    EXPECT_EQ(eligible[0], collectionA_);
}

TEST_F(ListingListTest, OthersCannotAdminister) {
    const Address stranger = Address::FromUint64(0xBAD);
    ExpectError(ArenaError::NOT_OWNER, [&]() {
        list_->AllowNewContractForStaking(stranger, Address::FromUint64(0xC002));
    });
    ExpectError(ArenaError::NOT_OWNER, [&]() {
        list_->DisallowContractFromStaking(stranger, collectionA_);
    });
    ExpectError(ArenaError::NOT_OWNER, [&]() { list_->SetArena(stranger, stranger); });
    EXPECT_TRUE(list_->IsEligible(collectionA_));
}

// ============================================================================
// Weight
// ============================================================================

TEST_F(ListingListTest, WeightAddsToCollectionAndTotal) {
    list_->AddVotesToVeZoo(arena_, collectionA_, 10 * COIN);
    list_->AddVotesToVeZoo(arena_, collectionB_, 30 * COIN);
    list_->AddVotesToVeZoo(arena_, collectionA_, 5 * COIN);

    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 1), 15 * COIN);
    EXPECT_EQ(list_->GetPoolWeight(collectionB_, 1), 30 * COIN);
    EXPECT_EQ(list_->GetTotalPoolWeight(1), 45 * COIN);
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 0), 0);
}

TEST_F(ListingListTest, WeightCarriesForward) {
    list_->AddVotesToVeZoo(arena_, collectionA_, 10 * COIN);

    epoch_ = 4;
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 3), 10 * COIN);
    EXPECT_EQ(list_->UpdateCurrentEpochAndReturnPoolWeight(collectionA_), 10 * COIN);

    list_->RemoveVotesFromVeZoo(arena_, collectionA_, 4 * COIN);
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 4), 6 * COIN);
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 2), 10 * COIN);
    EXPECT_EQ(list_->GetTotalPoolWeight(4), 6 * COIN);
    EXPECT_EQ(list_->GetTotalPoolWeight(9), 6 * COIN);
}

TEST_F(ListingListTest, UnknownCollectionHasNoWeight) {
    EXPECT_EQ(list_->UpdateCurrentEpochAndReturnPoolWeight(collectionA_), 0);
    EXPECT_EQ(list_->GetTotalPoolWeight(1), 0);
}

TEST_F(ListingListTest, WeightGuards) {
    ExpectError(ArenaError::UNAUTHORIZED_CALLER, [&]() {
        list_->AddVotesToVeZoo(owner_, collectionA_, COIN);
    });
    ExpectError(ArenaError::ZERO_AMOUNT, [&]() {
        list_->AddVotesToVeZoo(arena_, collectionA_, 0);
    });
    ExpectError(ArenaError::COLLECTION_NOT_ELIGIBLE, [&]() {
        list_->AddVotesToVeZoo(arena_, Address::FromUint64(0xC002), COIN);
    });

    list_->AddVotesToVeZoo(arena_, collectionA_, COIN);
    ExpectError(ArenaError::INSUFFICIENT_WEIGHT, [&]() {
        list_->RemoveVotesFromVeZoo(arena_, collectionA_, 2 * COIN);
    });
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 1), COIN);
}

TEST_F(ListingListTest, DisallowedCollectionCanStillRelease) {
    list_->AddVotesToVeZoo(arena_, collectionA_, 8 * COIN);
    list_->DisallowContractFromStaking(owner_, collectionA_);

    list_->RemoveVotesFromVeZoo(arena_, collectionA_, 8 * COIN);
    EXPECT_EQ(list_->GetPoolWeight(collectionA_, 1), 0);
    EXPECT_EQ(list_->GetTotalPoolWeight(1), 0);
}
