// Repository: Rewind
// Component: Touch Overlay Projector
// Purpose: Select and validate the touch events visible at the playhead.
// Copyright (c) 2025 Rewind

#ifndef REWIND_OVERLAY_TOUCH_OVERLAY_PROJECTOR_HPP_
#define REWIND_OVERLAY_TOUCH_OVERLAY_PROJECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::overlay {

struct OverlayConfig {
  int64_t touch_window_ms = 1000;     // Trailing visibility for touch events
  int64_t gesture_window_ms = 1500;   // Trailing visibility for gesture events
  double coordinate_floor_px = 5.0;   // Points at or below are dropped
  double coordinate_range_multiplier = 3.0;  // Upper bound = screen dim * this
  int64_t rage_propagation_ms = 100;  // Strict distance to a rage-tap group
};

struct OverlayTouchPoint {
  double x = 0.0;
  double y = 0.0;
  int64_t timestamp_ms = 0;
  std::optional<double> force;
};

struct Velocity {
  double x = 0.0;
  double y = 0.0;
};

// Derived per tick; never persisted. touches is never empty.
struct TouchEvent {
  std::string id;
  int64_t timestamp_ms = 0;
  std::string gesture_type;
  std::vector<OverlayTouchPoint> touches;
  std::string target_label;
  std::optional<double> duration_ms;
  std::optional<Velocity> velocity;
  std::optional<double> max_force;
  size_t touch_count = 0;
};

class TouchOverlayProjector {
 public:
  explicit TouchOverlayProjector(OverlayConfig config = OverlayConfig{});

  // Pure projection of events visible at now_ms (absolute device time).
  std::vector<TouchEvent> Project(const std::vector<session::SessionEvent>& events,
                                  const std::vector<session::SessionEvent>& rage_taps,
                                  double now_ms,
                                  int screen_width,
                                  int screen_height) const;

  const OverlayConfig& config() const { return config_; }

 private:
  bool IsValidPoint(double x, double y, int screen_width, int screen_height) const;

  OverlayConfig config_;
};

}  // namespace rewindreplay::overlay

#endif  // REWIND_OVERLAY_TOUCH_OVERLAY_PROJECTOR_HPP_
