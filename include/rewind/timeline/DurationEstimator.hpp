// Repository: Rewind
// Component: Duration Estimator
// Purpose: Pick the total playback duration from imperfect candidate signals.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_DURATION_ESTIMATOR_HPP_
#define REWIND_TIMELINE_DURATION_ESTIMATOR_HPP_

#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::timeline {

enum class DurationSource {
  kPlayableDuration,  // Server-computed playable duration, taken verbatim
  kScreenshots,       // Last screenshot offset plus tail buffer
  kSessionEnd,        // endTime - startTime minus background time
  kStats,             // stats.duration
  kLastEvent,         // Last timeline event offset
  kFallback,          // Caller-supplied
};

const char* DurationSourceToString(DurationSource source);

struct DurationConfig {
  double fallback_s = 60.0;
  double screenshot_tail_s = 0.5;  // Keeps the last frame on screen briefly
};

struct DurationEstimate {
  double seconds = 0.0;
  DurationSource source = DurationSource::kFallback;
};

// playableDuration > 0 wins outright. Otherwise the largest strictly
// positive candidate wins (earlier candidates win ties). With no start time
// or no candidates, the fallback is returned.
DurationEstimate EstimateDuration(const session::SessionRecord& session,
                                  const std::vector<session::SessionEvent>& timeline,
                                  const DurationConfig& config = DurationConfig{});

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_DURATION_ESTIMATOR_HPP_
