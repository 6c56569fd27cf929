// ARENA - Error Reporting Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/core/error.h"

#include <string>

namespace arena {
namespace {

TEST(ArenaErrorTest, Classification) {
    EXPECT_EQ(ClassifyArenaError(ArenaError::OK), ArenaErrorClass::None);
    EXPECT_EQ(ClassifyArenaError(ArenaError::INVALID_STAGE), ArenaErrorClass::StageViolation);
    EXPECT_EQ(ClassifyArenaError(ArenaError::NOT_OWNER), ArenaErrorClass::OwnershipViolation);
    EXPECT_EQ(ClassifyArenaError(ArenaError::UNAUTHORIZED_CALLER),
              ArenaErrorClass::OwnershipViolation);
    EXPECT_EQ(ClassifyArenaError(ArenaError::ZOO_EXCEEDS_DAI),
              ArenaErrorClass::InvariantViolation);
    EXPECT_EQ(ClassifyArenaError(ArenaError::ALREADY_PAIRED),
              ArenaErrorClass::InvariantViolation);
    EXPECT_EQ(ClassifyArenaError(ArenaError::RANDOM_NOT_READY), ArenaErrorClass::NotReady);
    EXPECT_EQ(ClassifyArenaError(ArenaError::EPOCH_NOT_FINISHED), ArenaErrorClass::NotReady);
    EXPECT_EQ(ClassifyArenaError(ArenaError::VAULT_REDEEM_FAILED),
              ArenaErrorClass::ExternalCollaboratorFailure);
    EXPECT_EQ(ClassifyArenaError(ArenaError::NFT_TRANSFER_FAILED),
              ArenaErrorClass::ExternalCollaboratorFailure);
}

TEST(ArenaErrorTest, ExceptionCarriesCodeAndDetail) {
    ArenaException plain(ArenaError::NO_VOTES);
    EXPECT_EQ(plain.GetCode(), ArenaError::NO_VOTES);
    EXPECT_STREQ(plain.what(), "Position has no votes");

    ArenaException detailed(ArenaError::INVALID_STAGE, "expected Pair, now Stake");
    EXPECT_EQ(detailed.GetClass(), ArenaErrorClass::StageViolation);
    EXPECT_EQ(std::string(detailed.what()), "Invalid stage: expected Pair, now Stake");
}

TEST(ArenaErrorTest, RequireThrowsOnlyOnFailure) {
    EXPECT_NO_THROW(Require(true, ArenaError::ZERO_AMOUNT));
    EXPECT_THROW(Require(false, ArenaError::ZERO_AMOUNT), ArenaException);

    try {
        Require(false, ArenaError::WITHDRAW_EXCEEDS_INVESTED, "5 > 4");
        FAIL() << "expected exception";
    } catch (const ArenaException& e) {
        EXPECT_EQ(e.GetCode(), ArenaError::WITHDRAW_EXCEEDS_INVESTED);
        EXPECT_NE(std::string(e.what()).find("5 > 4"), std::string::npos);
    }
}

TEST(ArenaErrorTest, ClassNames) {
    EXPECT_STREQ(ArenaErrorClassToString(ArenaErrorClass::NotReady), "NotReady");
    EXPECT_STREQ(ArenaErrorToString(ArenaError::RANDOM_ALREADY_REQUESTED),
                 "Random already requested");
}

} // namespace
} // namespace arena
