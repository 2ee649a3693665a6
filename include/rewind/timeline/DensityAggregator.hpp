// Repository: Rewind
// Component: Density Aggregator
// Purpose: Fixed-width activity heatmaps along the replay scrubber.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_DENSITY_AGGREGATOR_HPP_
#define REWIND_TIMELINE_DENSITY_AGGREGATOR_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::timeline {

inline constexpr size_t kDefaultDensityBuckets = 40;
inline constexpr size_t kMaxDensityBuckets = 10000;

struct DensityData {
  std::vector<double> touch_density;  // Each in [0, 1]
  std::vector<double> api_density;    // Each in [0, 1]
  double bucket_width_ms = 0.0;
  size_t touch_events_placed = 0;
  size_t api_events_placed = 0;
};

bool IsTouchActivity(const session::SessionEvent& event);
bool IsApiActivity(const session::SessionEvent& event);

// Buckets events by elapsed time since session_start_ms. Events mapping
// outside [0, bucket_count) are dropped. Each channel is divided by its own
// maximum (at least 1). Non-positive duration or zero buckets yields empty
// arrays.
DensityData AggregateDensity(const std::vector<session::SessionEvent>& timeline,
                             int64_t session_start_ms,
                             double duration_s,
                             size_t bucket_count = kDefaultDensityBuckets);

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_DENSITY_AGGREGATOR_HPP_
