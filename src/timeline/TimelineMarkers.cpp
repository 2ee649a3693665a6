// Repository: Rewind
// Component: Timeline Markers
// Purpose: App lifecycle state at the playhead and crash/ANR scrubber markers.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/TimelineMarkers.hpp"

#include <algorithm>
#include <cmath>

namespace rewindreplay::timeline {

LifecycleState LifecycleAt(const std::vector<session::SessionEvent>& timeline,
                           double absolute_ms) {
  LifecycleState state;
  for (const auto& e : timeline) {
    if (static_cast<double>(e.timestamp_ms) > absolute_ms) break;
    const std::string type = session::ToLowerAscii(e.type);
    if (type == "app_background") {
      state.in_background = true;
    } else if (type == "app_foreground") {
      state.in_background = false;
    } else if (type == "app_terminated" || type == "session_end") {
      state.terminated = true;
    }
  }
  return state;
}

std::vector<TimelineMarker> BuildTimelineMarkers(
    const std::vector<session::SessionEvent>& timeline,
    int64_t session_start_ms,
    double duration_s) {
  std::vector<TimelineMarker> markers;
  if (!std::isfinite(duration_s) || duration_s <= 0.0) return markers;

  for (const auto& e : timeline) {
    const std::string type = session::ToLowerAscii(e.type);
    TimelineMarker m;
    if (type == "crash") {
      m.kind = MarkerKind::kCrash;
    } else if (type == "anr") {
      m.kind = MarkerKind::kAnr;
    } else {
      continue;
    }
    m.timestamp_ms = e.timestamp_ms;
    m.relative_time_s = static_cast<double>(e.timestamp_ms - session_start_ms) / 1000.0;
    m.position = std::clamp(m.relative_time_s / duration_s, 0.0, 1.0);
    m.label = e.name.empty() ? e.type : e.name;
    markers.push_back(std::move(m));
  }
  return markers;
}

}  // namespace rewindreplay::timeline
