// Repository: Rewind
// Component: Replay Configuration
// Purpose: Compiled-in defaults for every replay constant, overridable by
//          the harness.
// Copyright (c) 2025 Rewind

#include "rewind/runtime/ReplayConfig.hpp"

#include <cmath>
#include <string>

namespace rewindreplay::runtime {

namespace {

bool Positive(double v) { return std::isfinite(v) && v > 0.0; }

}  // namespace

ConfigValidation ReplayConfig::Validate() const {
  if (rage_tap.window_ms <= 0) {
    return ConfigValidation::Failure("rage_tap.window_ms must be > 0");
  }
  if (!Positive(rage_tap.radius_px)) {
    return ConfigValidation::Failure("rage_tap.radius_px must be > 0");
  }
  if (rage_tap.min_taps < 2) {
    return ConfigValidation::Failure("rage_tap.min_taps must be >= 2");
  }
  if (overlay.touch_window_ms <= 0 || overlay.gesture_window_ms <= 0) {
    return ConfigValidation::Failure("overlay windows must be > 0");
  }
  if (!std::isfinite(overlay.coordinate_floor_px) || overlay.coordinate_floor_px < 0.0) {
    return ConfigValidation::Failure("overlay.coordinate_floor_px must be >= 0");
  }
  if (!Positive(overlay.coordinate_range_multiplier)) {
    return ConfigValidation::Failure("overlay.coordinate_range_multiplier must be > 0");
  }
  if (overlay.rage_propagation_ms < 0) {
    return ConfigValidation::Failure("overlay.rage_propagation_ms must be >= 0");
  }
  if (!Positive(duration.fallback_s)) {
    return ConfigValidation::Failure("duration.fallback_s must be > 0");
  }
  if (!std::isfinite(duration.screenshot_tail_s) || duration.screenshot_tail_s < 0.0) {
    return ConfigValidation::Failure("duration.screenshot_tail_s must be >= 0");
  }
  if (density_buckets == 0 || density_buckets > timeline::kMaxDensityBuckets) {
    return ConfigValidation::Failure("density_buckets must be in [1, " +
                                     std::to_string(timeline::kMaxDensityBuckets) + "]");
  }
  if (!Positive(playback.initial_rate)) {
    return ConfigValidation::Failure("playback.initial_rate must be > 0");
  }
  if (!Positive(playback.refresh_hz)) {
    return ConfigValidation::Failure("playback.refresh_hz must be > 0");
  }
  for (double speed : playback.speed_options) {
    if (!Positive(speed)) {
      return ConfigValidation::Failure("playback.speed_options must all be > 0");
    }
  }
  return ConfigValidation::Success();
}

}  // namespace rewindreplay::runtime
