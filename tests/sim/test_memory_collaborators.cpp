// ARENA - In-Memory Collaborator Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/sim/memory_collaborators.h"

#include <memory>
#include <stdexcept>

using namespace arena;
using namespace arena::sim;

namespace {

const Address ALICE = Address::FromUint64(0x1);
const Address BOB = Address::FromUint64(0x2);
const Address VAULT = Address::FromUint64(0xA004);

} // namespace

// ============================================================================
// InMemoryToken
// ============================================================================

TEST(InMemoryTokenTest, MintAndTransfer) {
    InMemoryToken token("DAI");
    token.Mint(ALICE, 100);
    EXPECT_EQ(token.TotalSupply(), 100);

    EXPECT_TRUE(token.Transfer(ALICE, BOB, 40));
    EXPECT_EQ(token.BalanceOf(ALICE), 60);
    EXPECT_EQ(token.BalanceOf(BOB), 40);

    EXPECT_FALSE(token.Transfer(ALICE, BOB, 61));
    EXPECT_FALSE(token.Transfer(ALICE, BOB, -1));
    EXPECT_EQ(token.BalanceOf(ALICE), 60);
    EXPECT_EQ(token.GetSymbol(), "DAI");
}

TEST(InMemoryTokenTest, TransferFromSpendsAllowance) {
    InMemoryToken token("ZOO");
    token.Mint(ALICE, 100);

    EXPECT_FALSE(token.TransferFrom(BOB, ALICE, BOB, 10));

    EXPECT_TRUE(token.Approve(ALICE, BOB, 30));
    EXPECT_TRUE(token.TransferFrom(BOB, ALICE, BOB, 20));
    EXPECT_EQ(token.Allowance(ALICE, BOB), 10);
    EXPECT_FALSE(token.TransferFrom(BOB, ALICE, BOB, 11));

    // Approve replaces the allowance
    EXPECT_TRUE(token.Approve(ALICE, BOB, 5));
    EXPECT_EQ(token.Allowance(ALICE, BOB), 5);
    EXPECT_FALSE(token.Approve(ALICE, BOB, -5));
}

TEST(InMemoryTokenTest, FailTransfersKeepsAllowance) {
    InMemoryToken token("DAI");
    token.Mint(ALICE, 100);
    token.Approve(ALICE, BOB, 50);

    token.SetFailTransfers(true);
    EXPECT_FALSE(token.Transfer(ALICE, BOB, 1));
    EXPECT_FALSE(token.TransferFrom(BOB, ALICE, BOB, 1));
    EXPECT_EQ(token.Allowance(ALICE, BOB), 50);

    token.SetFailTransfers(false);
    EXPECT_TRUE(token.Transfer(ALICE, BOB, 1));
}

// ============================================================================
// InMemoryNft
// ============================================================================

TEST(InMemoryNftTest, OwnershipLifecycle) {
    InMemoryNft nft("APE");
    EXPECT_TRUE(nft.Mint(ALICE, 1));
    EXPECT_FALSE(nft.Mint(BOB, 1));
    EXPECT_TRUE(nft.Mint(ALICE, 2));
    EXPECT_EQ(nft.BalanceOf(ALICE), 2u);

    EXPECT_FALSE(nft.TransferFrom(BOB, ALICE, 1));
    EXPECT_TRUE(nft.TransferFrom(ALICE, BOB, 1));
    EXPECT_EQ(nft.OwnerOf(1), BOB);

    EXPECT_TRUE(nft.Burn(1));
    EXPECT_FALSE(nft.Burn(1));
    EXPECT_FALSE(nft.OwnerOf(1).has_value());
    EXPECT_FALSE(nft.TransferFrom(BOB, ALICE, 1));
}

TEST(InMemoryNftTest, FailTransfers) {
    InMemoryNft nft("APE");
    nft.Mint(ALICE, 1);
    nft.SetFailTransfers(true);
    EXPECT_FALSE(nft.TransferFrom(ALICE, BOB, 1));
    EXPECT_EQ(nft.OwnerOf(1), ALICE);
}

// ============================================================================
// InMemoryVault
// ============================================================================

class InMemoryVaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        dai_ = std::make_shared<InMemoryToken>("DAI");
        vault_ = std::make_unique<InMemoryVault>(dai_, VAULT);
        dai_->Mint(ALICE, 100 * COIN);
    }

    std::shared_ptr<InMemoryToken> dai_;
    std::unique_ptr<InMemoryVault> vault_;
};

TEST_F(InMemoryVaultTest, MintAtCurrentRate) {
    auto shares = vault_->Mint(ALICE, 100 * COIN);
    ASSERT_TRUE(shares.has_value());
    EXPECT_EQ(*shares, 100 * COIN);
    EXPECT_EQ(vault_->BalanceOf(ALICE), 100 * COIN);
    EXPECT_EQ(vault_->TotalShares(), 100 * COIN);
    EXPECT_EQ(dai_->BalanceOf(ALICE), 0);
    EXPECT_EQ(dai_->BalanceOf(VAULT), 100 * COIN);
}

TEST_F(InMemoryVaultTest, RateIncreaseIsBacked) {
    vault_->Mint(ALICE, 100 * COIN);
    vault_->SetExchangeRate(RATE_SCALE + RATE_SCALE / 10);
    EXPECT_EQ(dai_->BalanceOf(VAULT), 110 * COIN);

    auto assets = vault_->Redeem(ALICE, 50 * COIN);
    ASSERT_TRUE(assets.has_value());
    EXPECT_EQ(*assets, 55 * COIN);
    EXPECT_EQ(dai_->BalanceOf(ALICE), 55 * COIN);
    EXPECT_EQ(vault_->TotalShares(), 50 * COIN);

    EXPECT_EQ(*vault_->Redeem(ALICE, 50 * COIN), 55 * COIN);
    EXPECT_EQ(dai_->BalanceOf(VAULT), 0);
}

TEST_F(InMemoryVaultTest, RateNeverDecreases) {
    vault_->SetExchangeRate(2 * RATE_SCALE);
    EXPECT_THROW(vault_->SetExchangeRate(RATE_SCALE), std::invalid_argument);
    EXPECT_EQ(vault_->ExchangeRateCurrent(), 2 * RATE_SCALE);

    vault_->AccrueYield(500);
    EXPECT_EQ(vault_->ExchangeRateCurrent(), 2 * RATE_SCALE + RATE_SCALE / 10);
}

TEST_F(InMemoryVaultTest, MintAfterYieldBuysFewerShares) {
    vault_->AccrueYield(10000);
    auto shares = vault_->Mint(ALICE, 10 * COIN);
    ASSERT_TRUE(shares.has_value());
    EXPECT_EQ(*shares, 5 * COIN);
}

TEST_F(InMemoryVaultTest, FailuresLeaveBalances) {
    EXPECT_FALSE(vault_->Mint(ALICE, 0).has_value());
    EXPECT_FALSE(vault_->Mint(ALICE, 101 * COIN).has_value());
    EXPECT_EQ(dai_->BalanceOf(ALICE), 100 * COIN);

    vault_->SetFailMints(true);
    EXPECT_FALSE(vault_->Mint(ALICE, COIN).has_value());
    vault_->SetFailMints(false);

    vault_->Mint(ALICE, 10 * COIN);
    EXPECT_FALSE(vault_->Redeem(ALICE, 11 * COIN).has_value());
    EXPECT_FALSE(vault_->Redeem(BOB, COIN).has_value());

    vault_->SetFailRedeems(true);
    EXPECT_FALSE(vault_->Redeem(ALICE, COIN).has_value());
    EXPECT_EQ(vault_->BalanceOf(ALICE), 10 * COIN);
}

TEST(InMemoryVaultConstruction, Validation) {
    EXPECT_THROW(InMemoryVault(nullptr, VAULT), std::invalid_argument);
    EXPECT_THROW(InMemoryVault(std::make_shared<InMemoryToken>("DAI"), VAULT, 0),
                 std::invalid_argument);
}
