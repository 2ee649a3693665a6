// Repository: Rewind
// Component: Density Aggregator
// Purpose: Fixed-width activity heatmaps along the replay scrubber.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/DensityAggregator.hpp"

#include <algorithm>
#include <cmath>

namespace rewindreplay::timeline {

namespace {

std::string EffectiveGestureType(const session::SessionEvent& event) {
  if (!event.gesture_type.empty()) return event.gesture_type;
  return session::PropertyAsString(event.properties, "gestureType").value_or("");
}

void Normalize(std::vector<double>* counts) {
  double max_count = 1.0;
  for (double c : *counts) max_count = std::max(max_count, c);
  for (double& c : *counts) c /= max_count;
}

}  // namespace

bool IsTouchActivity(const session::SessionEvent& event) {
  const std::string type = session::ToLowerAscii(event.type);
  if (type == "gesture" || type == "tap" || type == "touch" ||
      type == "scroll" || type == "input") {
    return true;
  }
  const std::string gesture = session::ToLowerAscii(EffectiveGestureType(event));
  return gesture.find("tap") != std::string::npos ||
         gesture.find("scroll") != std::string::npos;
}

bool IsApiActivity(const session::SessionEvent& event) {
  return session::ToLowerAscii(event.type) == "network_request";
}

DensityData AggregateDensity(const std::vector<session::SessionEvent>& timeline,
                             int64_t session_start_ms,
                             double duration_s,
                             size_t bucket_count) {
  DensityData out;
  if (!std::isfinite(duration_s) || duration_s <= 0.0 || bucket_count == 0) {
    return out;
  }

  out.bucket_width_ms = duration_s * 1000.0 / static_cast<double>(bucket_count);
  out.touch_density.assign(bucket_count, 0.0);
  out.api_density.assign(bucket_count, 0.0);

  for (const auto& e : timeline) {
    const double elapsed_ms = static_cast<double>(e.timestamp_ms - session_start_ms);
    const double slot = std::floor(elapsed_ms / out.bucket_width_ms);
    if (slot < 0.0 || slot >= static_cast<double>(bucket_count)) continue;
    const size_t index = static_cast<size_t>(slot);

    if (IsTouchActivity(e)) {
      out.touch_density[index] += 1.0;
      ++out.touch_events_placed;
    }
    if (IsApiActivity(e)) {
      out.api_density[index] += 1.0;
      ++out.api_events_placed;
    }
  }

  Normalize(&out.touch_density);
  Normalize(&out.api_density);
  return out;
}

}  // namespace rewindreplay::timeline
