// Repository: Rewind
// Component: Timeline Markers
// Purpose: App lifecycle state at the playhead and crash/ANR scrubber markers.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_TIMELINE_MARKERS_HPP_
#define REWIND_TIMELINE_TIMELINE_MARKERS_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::timeline {

struct LifecycleState {
  bool in_background = false;
  bool terminated = false;

  bool operator==(const LifecycleState& o) const {
    return in_background == o.in_background && terminated == o.terminated;
  }
  bool operator!=(const LifecycleState& o) const { return !(*this == o); }
};

// Folds app_background / app_foreground / app_terminated / session_end over
// the sorted timeline up to and including absolute_ms.
LifecycleState LifecycleAt(const std::vector<session::SessionEvent>& timeline,
                           double absolute_ms);

enum class MarkerKind {
  kCrash,
  kAnr,
};

struct TimelineMarker {
  MarkerKind kind = MarkerKind::kCrash;
  int64_t timestamp_ms = 0;
  double relative_time_s = 0.0;
  double position = 0.0;  // relative_time_s / duration, clamped to [0, 1]
  std::string label;
};

std::vector<TimelineMarker> BuildTimelineMarkers(
    const std::vector<session::SessionEvent>& timeline,
    int64_t session_start_ms,
    double duration_s);

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_TIMELINE_MARKERS_HPP_
