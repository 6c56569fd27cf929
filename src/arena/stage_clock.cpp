// ARENA - Epoch Stage Clock Implementation
// Copyright (c) 2024 ARENA Developers
// MIT License

#include "arena/arena/stage_clock.h"
#include "arena/core/error.h"
#include "arena/util/logging.h"
#include "arena/util/time.h"

#include <sstream>
#include <stdexcept>

namespace arena {

EpochStageClock::EpochStageClock(const StageDurations& durations, Timestamp epochStartDate,
                                 Epoch epoch)
    : durations_(durations), epochStartDate_(epochStartDate), epoch_(epoch) {
    if (!durations_.IsValid()) {
        throw std::invalid_argument("Invalid stage durations: " + durations_.ToString());
    }
}

Stage EpochStageClock::GetCurrentStage() const {
    return GetStageAt(util::GetTime());
}

Stage EpochStageClock::GetStageAt(Timestamp now) const {
    int64_t elapsed = now - epochStartDate_;
    int64_t boundary = 0;
    for (Stage stage : {Stage::Stake, Stage::DaiVote, Stage::Pair, Stage::ZooVote}) {
        boundary += durations_.Get(stage);
        if (elapsed < boundary) {
            return stage;
        }
    }
    return Stage::Winner;
}

Timestamp EpochStageClock::GetStageStart(Stage stage) const {
    Timestamp start = epochStartDate_;
    for (size_t i = 0; i < static_cast<size_t>(stage); ++i) {
        start += durations_.Get(static_cast<Stage>(i));
    }
    return start;
}

void EpochStageClock::RequireStage(Stage stage) const {
    RequireStageIn(stage, stage);
}

void EpochStageClock::RequireStageIn(Stage first, Stage last) const {
    Stage current = GetCurrentStage();
    if (current < first || current > last) {
        std::string expected = StageToString(first);
        if (first != last) {
            expected += "-" + std::string(StageToString(last));
        }
        throw ArenaException(ArenaError::INVALID_STAGE,
                             std::string("expected ") + expected + ", now " + StageToString(current));
    }
}

bool EpochStageClock::IsEpochDurationElapsed() const {
    return util::GetTime() >= epochStartDate_ + durations_.Total();
}

void EpochStageClock::Advance(const StageDurations& next) {
    RequireStage(Stage::Winner);
    if (!next.IsValid()) {
        throw std::invalid_argument("Invalid stage durations: " + next.ToString());
    }

    durations_ = next;
    epochStartDate_ = util::GetTime();
    ++epoch_;

    LOG_INFO(util::LogCategory::STAGE) << "Epoch " << epoch_ << " started at "
                                       << epochStartDate_ << " with " << durations_.ToString();
}

std::string EpochStageClock::ToString() const {
    std::ostringstream oss;
    oss << "EpochStageClock(epoch=" << epoch_
        << ", start=" << epochStartDate_
        << ", stage=" << StageToString(GetCurrentStage()) << ")";
    return oss.str();
}

} // namespace arena
