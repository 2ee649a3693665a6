// Repository: Rewind
// Component: Touch Overlay Projector
// Purpose: Select and validate the touch events visible at the playhead.
// Copyright (c) 2025 Rewind

#include "rewind/overlay/TouchOverlayProjector.hpp"

#include <cmath>
#include <cstdlib>

namespace rewindreplay::overlay {

namespace {

bool IsTouchOrGesture(const session::SessionEvent& e) {
  return e.type == "touch" || e.type == "gesture";
}

bool NearRageTap(const session::SessionEvent& e,
                 const std::vector<session::SessionEvent>& rage_taps,
                 int64_t window_ms) {
  for (const auto& rt : rage_taps) {
    if (std::llabs(rt.timestamp_ms - e.timestamp_ms) < window_ms) return true;
  }
  return false;
}

}  // namespace

TouchOverlayProjector::TouchOverlayProjector(OverlayConfig config)
    : config_(config) {}

bool TouchOverlayProjector::IsValidPoint(double x, double y,
                                         int screen_width, int screen_height) const {
  if (!std::isfinite(x) || !std::isfinite(y)) return false;
  const double max_x = static_cast<double>(screen_width) * config_.coordinate_range_multiplier;
  const double max_y = static_cast<double>(screen_height) * config_.coordinate_range_multiplier;
  return x > config_.coordinate_floor_px && y > config_.coordinate_floor_px &&
         x < max_x && y < max_y;
}

std::vector<TouchEvent> TouchOverlayProjector::Project(
    const std::vector<session::SessionEvent>& events,
    const std::vector<session::SessionEvent>& rage_taps,
    double now_ms,
    int screen_width,
    int screen_height) const {
  std::vector<TouchEvent> out;

  for (const auto& e : events) {
    if (!IsTouchOrGesture(e) || !e.HasTouches()) continue;

    const double age_ms = now_ms - static_cast<double>(e.timestamp_ms);
    const int64_t max_age = e.type == "gesture" ? config_.gesture_window_ms
                                                : config_.touch_window_ms;
    if (age_ms < 0.0 || age_ms >= static_cast<double>(max_age)) continue;

    std::string gesture = e.gesture_type;
    if (gesture.empty()) {
      gesture = session::PropertyAsString(e.properties, "gestureType").value_or("tap");
    }
    const bool is_tap = gesture.find("tap") != std::string::npos;
    if (is_tap && NearRageTap(e, rage_taps, config_.rage_propagation_ms)) {
      gesture = "rage_tap";
    } else if (is_tap && e.frustration_kind == "dead_tap") {
      gesture = "dead_tap";
    }

    TouchEvent te;
    for (const auto& p : *e.touches) {
      if (!IsValidPoint(p.x, p.y, screen_width, screen_height)) continue;
      OverlayTouchPoint op;
      op.x = p.x;
      op.y = p.y;
      op.timestamp_ms = p.timestamp_ms.value_or(e.timestamp_ms);
      op.force = p.force;
      te.touches.push_back(op);
    }
    if (te.touches.empty()) continue;

    te.id = !e.id.empty() ? e.id
                          : session::PropertyAsString(e.properties, "id").value_or("");
    if (te.id.empty()) {
      te.id = "touch-" + std::to_string(e.timestamp_ms) + "-" + std::to_string(out.size());
    }
    te.timestamp_ms = e.timestamp_ms;
    te.gesture_type = std::move(gesture);
    te.target_label = !e.target_label.empty()
                          ? e.target_label
                          : session::PropertyAsString(e.properties, "targetLabel").value_or("");
    te.duration_ms = session::PropertyAsNumber(e.properties, "duration");
    auto vx = session::PropertyAsNumber(e.properties, "velocity.x");
    auto vy = session::PropertyAsNumber(e.properties, "velocity.y");
    if (vx || vy) {
      te.velocity = Velocity{vx.value_or(0.0), vy.value_or(0.0)};
    }
    te.max_force = session::PropertyAsNumber(e.properties, "maxForce");
    te.touch_count = te.touches.size();
    out.push_back(std::move(te));
  }
  return out;
}

}  // namespace rewindreplay::overlay
