// ARENA - Active Position Index Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/position_index.h"

#include <utility>

namespace arena {

const char* PartitionToString(Partition partition) {
    switch (partition) {
        case Partition::InGame: return "InGame";
        case Partition::Eligible: return "Eligible";
        case Partition::Idle: return "Idle";
        default: return "Unknown";
    }
}

bool ActivePositionIndex::Insert(PositionId id) {
    if (Contains(id)) {
        return false;
    }
    slots_[id] = positions_.size();
    positions_.push_back(id);
    return true;
}

bool ActivePositionIndex::Erase(PositionId id) {
    if (!Move(id, Partition::Idle)) {
        return false;
    }
    SwapSlots(slots_.at(id), positions_.size() - 1);
    positions_.pop_back();
    slots_.erase(id);
    return true;
}

bool ActivePositionIndex::Move(PositionId id, Partition target) {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return false;
    }

    Partition current = PartitionOfSlot(it->second);
    while (current != target) {
        size_t slot = slots_.at(id);
        if (current < target) {
            StepDown(slot);
        } else {
            StepUp(slot);
        }
        current = PartitionOfSlot(slots_.at(id));
    }
    return true;
}

std::optional<Partition> ActivePositionIndex::GetPartition(PositionId id) const {
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        return std::nullopt;
    }
    return PartitionOfSlot(it->second);
}

std::vector<PositionId> ActivePositionIndex::GetMembers(Partition partition) const {
    size_t begin = 0;
    size_t end = 0;
    switch (partition) {
        case Partition::InGame: begin = 0; end = inGame_; break;
        case Partition::Eligible: begin = inGame_; end = nonZero_; break;
        case Partition::Idle: begin = nonZero_; end = positions_.size(); break;
    }
    return std::vector<PositionId>(positions_.begin() + begin, positions_.begin() + end);
}

bool ActivePositionIndex::CheckConsistency() const {
    if (inGame_ > nonZero_ || nonZero_ > positions_.size() ||
        slots_.size() != positions_.size()) {
        return false;
    }
    for (size_t slot = 0; slot < positions_.size(); ++slot) {
        auto it = slots_.find(positions_[slot]);
        if (it == slots_.end() || it->second != slot) {
            return false;
        }
    }
    return true;
}

Partition ActivePositionIndex::PartitionOfSlot(size_t slot) const {
    if (slot < inGame_) return Partition::InGame;
    if (slot < nonZero_) return Partition::Eligible;
    return Partition::Idle;
}

void ActivePositionIndex::SwapSlots(size_t a, size_t b) {
    if (a == b) {
        return;
    }
    std::swap(positions_[a], positions_[b]);
    slots_[positions_[a]] = a;
    slots_[positions_[b]] = b;
}

void ActivePositionIndex::StepDown(size_t slot) {
    if (PartitionOfSlot(slot) == Partition::InGame) {
        SwapSlots(slot, inGame_ - 1);
        --inGame_;
    } else {
        SwapSlots(slot, nonZero_ - 1);
        --nonZero_;
    }
}

void ActivePositionIndex::StepUp(size_t slot) {
    if (PartitionOfSlot(slot) == Partition::Idle) {
        SwapSlots(slot, nonZero_);
        ++nonZero_;
    } else {
        SwapSlots(slot, inGame_);
        ++inGame_;
    }
}

} // namespace arena
