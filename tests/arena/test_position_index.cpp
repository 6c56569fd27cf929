// ARENA - Active Position Index Tests
// Copyright (c) 2024 ARENA Developers
// MIT License

#include <gtest/gtest.h>

#include "arena/arena/position_index.h"

#include <algorithm>
#include <vector>

using namespace arena;

namespace {

bool HasMember(const std::vector<PositionId>& members, PositionId id) {
    return std::find(members.begin(), members.end(), id) != members.end();
}

} // namespace

TEST(PositionIndexTest, NewPositionsAreIdle) {
    ActivePositionIndex index;
    EXPECT_TRUE(index.Insert(1));
    EXPECT_TRUE(index.Insert(2));
    EXPECT_FALSE(index.Insert(1));

    EXPECT_EQ(index.Size(), 2u);
    EXPECT_EQ(index.InGameCount(), 0u);
    EXPECT_EQ(index.NonZeroVoteCount(), 0u);
    EXPECT_EQ(index.GetPartition(1), Partition::Idle);
    EXPECT_FALSE(index.GetPartition(3).has_value());
    EXPECT_TRUE(index.CheckConsistency());
}

TEST(PositionIndexTest, MoveKeepsPartitionsContiguous) {
    ActivePositionIndex index;
    for (PositionId id = 1; id <= 5; ++id) {
        index.Insert(id);
    }

    ASSERT_TRUE(index.Move(4, Partition::Eligible));
    ASSERT_TRUE(index.Move(2, Partition::Eligible));
    ASSERT_TRUE(index.Move(5, Partition::InGame));

    EXPECT_EQ(index.InGameCount(), 1u);
    EXPECT_EQ(index.NonZeroVoteCount(), 3u);
    EXPECT_EQ(index.GetMembers(Partition::InGame), std::vector<PositionId>{5});

    auto eligible = index.GetMembers(Partition::Eligible);
    EXPECT_EQ(eligible.size(), 2u);
    EXPECT_TRUE(HasMember(eligible, 2));
    EXPECT_TRUE(HasMember(eligible, 4));

    auto idle = index.GetMembers(Partition::Idle);
    EXPECT_EQ(idle.size(), 2u);
    EXPECT_TRUE(HasMember(idle, 1));
    EXPECT_TRUE(HasMember(idle, 3));
    EXPECT_TRUE(index.CheckConsistency());
}

TEST(PositionIndexTest, MoveDownFromInGame) {
    ActivePositionIndex index;
    index.Insert(1);
    index.Insert(2);
    index.Move(1, Partition::InGame);
    index.Move(2, Partition::InGame);

    ASSERT_TRUE(index.Move(1, Partition::Idle));
    EXPECT_EQ(index.GetPartition(1), Partition::Idle);
    EXPECT_EQ(index.GetPartition(2), Partition::InGame);
    EXPECT_EQ(index.InGameCount(), 1u);
    EXPECT_EQ(index.NonZeroVoteCount(), 1u);
    EXPECT_TRUE(index.CheckConsistency());
}

TEST(PositionIndexTest, EraseFromAnyPartition) {
    ActivePositionIndex index;
    for (PositionId id = 1; id <= 4; ++id) {
        index.Insert(id);
    }
    index.Move(1, Partition::InGame);
    index.Move(2, Partition::Eligible);

    EXPECT_TRUE(index.Erase(1));
    EXPECT_TRUE(index.Erase(2));
    EXPECT_FALSE(index.Erase(2));

    EXPECT_EQ(index.Size(), 2u);
    EXPECT_EQ(index.InGameCount(), 0u);
    EXPECT_EQ(index.NonZeroVoteCount(), 0u);
    EXPECT_FALSE(index.Contains(1));
    EXPECT_TRUE(index.Contains(3));
    EXPECT_TRUE(index.CheckConsistency());
}

TEST(PositionIndexTest, ResetGamesMakesEveryoneEligible) {
    ActivePositionIndex index;
    for (PositionId id = 1; id <= 3; ++id) {
        index.Insert(id);
        index.Move(id, Partition::InGame);
    }
    index.ResetGames();

    EXPECT_EQ(index.InGameCount(), 0u);
    EXPECT_EQ(index.NonZeroVoteCount(), 3u);
    EXPECT_EQ(index.GetMembers(Partition::Eligible).size(), 3u);
    EXPECT_TRUE(index.CheckConsistency());
}

TEST(PositionIndexTest, UnknownPositionCannotMove) {
    ActivePositionIndex index;
    EXPECT_FALSE(index.Move(9, Partition::Eligible));
}

TEST(PositionIndexTest, PartitionNames) {
    EXPECT_STREQ(PartitionToString(Partition::InGame), "InGame");
    EXPECT_STREQ(PartitionToString(Partition::Eligible), "Eligible");
    EXPECT_STREQ(PartitionToString(Partition::Idle), "Idle");
}
