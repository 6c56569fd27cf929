// ARENA - Epoch Stage Clock
// Copyright (c) 2024 ARENA Developers
// MIT License
//
// Five-stage per-epoch timer. Stage boundaries are cumulative offsets from
// the epoch start date; the Winner stage lasts until the epoch is advanced.

#ifndef ARENA_ARENA_STAGE_CLOCK_H
#define ARENA_ARENA_STAGE_CLOCK_H

#include "arena/core/stage.h"
#include "arena/core/types.h"

#include <string>

namespace arena {

class EpochStageClock {
public:
    /// Throws std::invalid_argument if any duration is not positive
    EpochStageClock(const StageDurations& durations, Timestamp epochStartDate,
                    Epoch epoch = FIRST_EPOCH);

    /// Stage at the current (possibly mocked) time
    Stage GetCurrentStage() const;

    Stage GetStageAt(Timestamp now) const;

    Epoch GetCurrentEpoch() const { return epoch_; }

    Timestamp GetEpochStartDate() const { return epochStartDate_; }

    const StageDurations& GetDurations() const { return durations_; }

    /// Time at which stage begins in the current epoch
    Timestamp GetStageStart(Stage stage) const;

    /// Throws ArenaException(INVALID_STAGE) unless the current stage is `stage`
    void RequireStage(Stage stage) const;

    /// Throws ArenaException(INVALID_STAGE) unless first <= current <= last
    void RequireStageIn(Stage first, Stage last) const;

    /// The configured total epoch length has passed
    bool IsEpochDurationElapsed() const;

    /**
     * Start the next epoch now with new stage lengths.
     * Requires the Winner stage. Whether the epoch may end is decided by
     * the caller, which knows the state of the epoch's pairs.
     */
    void Advance(const StageDurations& next);

    std::string ToString() const;

private:
    StageDurations durations_;
    Timestamp epochStartDate_;
    Epoch epoch_;
};

} // namespace arena

#endif // ARENA_ARENA_STAGE_CLOCK_H
