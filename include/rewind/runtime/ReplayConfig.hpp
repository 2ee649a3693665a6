// Repository: Rewind
// Component: Replay Configuration
// Purpose: Compiled-in defaults for every replay constant, overridable by
//          the harness.
// Copyright (c) 2025 Rewind

#ifndef REWIND_RUNTIME_REPLAY_CONFIG_HPP_
#define REWIND_RUNTIME_REPLAY_CONFIG_HPP_

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "rewind/frames/FramePreloader.hpp"
#include "rewind/overlay/TouchOverlayProjector.hpp"
#include "rewind/timeline/DensityAggregator.hpp"
#include "rewind/timeline/DurationEstimator.hpp"
#include "rewind/timeline/RageTapDetector.hpp"

namespace rewindreplay::runtime {

struct ConfigValidation {
  bool ok = true;
  std::string error;

  static ConfigValidation Success() { return ConfigValidation{}; }
  static ConfigValidation Failure(std::string message) {
    ConfigValidation v;
    v.ok = false;
    v.error = std::move(message);
    return v;
  }
};

struct PlaybackConfig {
  double initial_rate = 1.0;
  double refresh_hz = 60.0;
  std::vector<double> speed_options{0.5, 1.0, 1.5, 2.0, 4.0};
  double skip_button_s = 10.0;
  double skip_key_s = 5.0;
  bool touch_overlay_enabled = true;
};

struct ReplayConfig {
  timeline::RageTapConfig rage_tap;
  overlay::OverlayConfig overlay;
  timeline::DurationConfig duration;
  size_t density_buckets = timeline::kDefaultDensityBuckets;
  PlaybackConfig playback;
  frames::PreloadConfig preload;

  // Returns the first violation found.
  ConfigValidation Validate() const;
};

}  // namespace rewindreplay::runtime

#endif  // REWIND_RUNTIME_REPLAY_CONFIG_HPP_
