// ARENA - Active Position Index
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Dense array of active staking positions split into three contiguous
// partitions:
//
//   [0, inGame)            paired in the current epoch
//   [inGame, nonZero)      non-zero votes, not yet paired
//   [nonZero, size)        zero votes
//
// All membership changes go through Insert, Erase and Move, which swap
// entries across partition boundaries so the layout always holds.

#ifndef ARENA_ARENA_POSITION_INDEX_H
#define ARENA_ARENA_POSITION_INDEX_H

#include "arena/core/types.h"

#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace arena {

enum class Partition {
    InGame = 0,
    Eligible = 1,
    Idle = 2,
};

const char* PartitionToString(Partition partition);

class ActivePositionIndex {
public:
    /// Add a new position to the Idle partition. Returns false if present.
    bool Insert(PositionId id);

    /// Remove a position from whichever partition holds it
    bool Erase(PositionId id);

    /// Move a position to target, shifting boundaries by one step per
    /// partition crossed. Returns false if the position is unknown.
    bool Move(PositionId id, Partition target);

    /// Start of an epoch: every in-game position becomes eligible again
    void ResetGames() { inGame_ = 0; }

    bool Contains(PositionId id) const { return slots_.count(id) != 0; }

    std::optional<Partition> GetPartition(PositionId id) const;

    size_t Size() const { return positions_.size(); }
    size_t InGameCount() const { return inGame_; }
    size_t NonZeroVoteCount() const { return nonZero_; }

    /// Members of one partition in slot order
    std::vector<PositionId> GetMembers(Partition partition) const;

    const std::vector<PositionId>& Positions() const { return positions_; }

    /// Slot table and boundaries agree with each other
    bool CheckConsistency() const;

private:
    Partition PartitionOfSlot(size_t slot) const;
    void SwapSlots(size_t a, size_t b);
    void StepDown(size_t slot);  // one partition toward Idle
    void StepUp(size_t slot);    // one partition toward InGame

    std::vector<PositionId> positions_;
    std::map<PositionId, size_t> slots_;
    size_t inGame_{0};
    size_t nonZero_{0};
};

} // namespace arena

#endif // ARENA_ARENA_POSITION_INDEX_H
