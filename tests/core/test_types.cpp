// ARENA - Core Types Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/core/error.h"
#include "arena/core/stage.h"
#include "arena/core/types.h"
#include "arena/interfaces/vault.h"

#include <limits>
#include <map>
#include <stdexcept>

namespace arena {
namespace {

// ============================================================================
// Checked Arithmetic
// ============================================================================

TEST(ArithmeticTest, MulDivUsesWideIntermediate) {
    // 1e12 * 1e12 overflows 64 bits before the division
    const Amount big = 1000000000000LL;
    EXPECT_EQ(MulDiv(big, big, big), big);
    EXPECT_EQ(MulDiv(7, 3, 2), 10);
    EXPECT_EQ(MulDiv(-7, 3, 2), -10);
}

TEST(ArithmeticTest, MulDivRoundUp) {
    EXPECT_EQ(MulDivRoundUp(7, 3, 2), 11);
    EXPECT_EQ(MulDivRoundUp(6, 3, 2), 9);
    EXPECT_EQ(MulDivRoundUp(0, 3, 2), 0);
    // Negative results keep truncating toward zero
    EXPECT_EQ(MulDivRoundUp(-7, 3, 2), -10);
}

TEST(ArithmeticTest, DivisionByZeroThrows) {
    EXPECT_THROW(MulDiv(1, 1, 0), ArenaException);
    EXPECT_THROW(MulDivRoundUp(1, 1, 0), ArenaException);
}

TEST(ArithmeticTest, OverflowThrows) {
    const Amount max = std::numeric_limits<Amount>::max();
    EXPECT_THROW(MulDiv(max, 2, 1), ArenaException);
    EXPECT_THROW(CheckedAdd(max, 1), ArenaException);
    EXPECT_THROW(CheckedSub(std::numeric_limits<Amount>::min(), 1), ArenaException);
    EXPECT_EQ(CheckedAdd(max - 1, 1), max);

    try {
        CheckedAdd(max, max);
        FAIL() << "expected overflow";
    } catch (const ArenaException& e) {
        EXPECT_EQ(e.GetCode(), ArenaError::ARITHMETIC_OVERFLOW);
    }
}

TEST(ArithmeticTest, MoneyRange) {
    EXPECT_TRUE(MoneyRange(0));
    EXPECT_TRUE(MoneyRange(MAX_MONEY));
    EXPECT_FALSE(MoneyRange(-1));
    EXPECT_FALSE(MoneyRange(MAX_MONEY + 1));
}

TEST(ArithmeticTest, ShareConversion) {
    EXPECT_EQ(AssetsToShares(1000, RATE_SCALE), 1000);
    EXPECT_EQ(AssetsToShares(1100, 110000000), 1000);
    EXPECT_EQ(SharesToAssets(1000, 110000000), 1100);
    // Both directions round down
    EXPECT_EQ(AssetsToShares(10, 300000000), 3);
    EXPECT_EQ(SharesToAssets(3, 150000000), 4);
}

// ============================================================================
// Address and Hash
// ============================================================================

TEST(AddressTest, DefaultIsNull) {
    Address addr;
    EXPECT_TRUE(addr.IsNull());
    EXPECT_EQ(addr.size(), 20u);
}

TEST(AddressTest, FromUint64IsDistinctAndOrdered) {
    Address a = Address::FromUint64(1);
    Address b = Address::FromUint64(2);
    EXPECT_FALSE(a.IsNull());
    EXPECT_NE(a, b);
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);

    std::map<Address, int> byAddress{{b, 2}, {a, 1}};
    EXPECT_EQ(byAddress.begin()->second, 1);
}

TEST(AddressTest, HexRoundTrip) {
    Address addr = Address::FromUint64(0xABCD);
    std::string hex = addr.ToHex();
    EXPECT_EQ(hex.size(), 40u);
    EXPECT_EQ(hex.substr(36), "abcd");
    EXPECT_EQ(Address::FromHex(hex), addr);
    EXPECT_EQ(Address::FromHex("0x" + hex), addr);
}

TEST(AddressTest, FromHexRejectsBadInput) {
    EXPECT_THROW(Address::FromHex("abcd"), std::invalid_argument);
    EXPECT_THROW(Address::FromHex(std::string(40, 'g')), std::invalid_argument);
}

TEST(HashTest, GetUint64ReadsLowBytes) {
    Hash256 hash;
    hash[0] = 0x01;
    hash[1] = 0x02;
    EXPECT_EQ(hash.GetUint64(), 0x0201u);
    hash.SetNull();
    EXPECT_TRUE(hash.IsNull());
}

// ============================================================================
// Stages
// ============================================================================

TEST(StageTest, Names) {
    EXPECT_STREQ(StageToString(Stage::Stake), "Stake");
    EXPECT_STREQ(StageToString(Stage::Winner), "Winner");
    EXPECT_LT(Stage::DaiVote, Stage::Pair);
}

TEST(StageTest, DurationsTotalAndValidity) {
    StageDurations d{10, 20, 30, 40, 50};
    EXPECT_TRUE(d.IsValid());
    EXPECT_EQ(d.Total(), 150);
    EXPECT_EQ(d.Get(Stage::Pair), 30);
    EXPECT_NE(d.ToString().find("zooVote=40"), std::string::npos);

    d.winner = 0;
    EXPECT_FALSE(d.IsValid());
    EXPECT_NE(d, (StageDurations{10, 20, 30, 40, 50}));
}

} // namespace
} // namespace arena
