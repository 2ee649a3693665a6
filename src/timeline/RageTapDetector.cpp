// Repository: Rewind
// Component: Rage Tap Detector
// Purpose: Cluster rapid repeated taps at one spot into synthetic rage_tap events.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/RageTapDetector.hpp"

#include <cmath>

namespace rewindreplay::timeline {

namespace {

struct Point {
  double x = 0.0;
  double y = 0.0;
};

Point FirstTouch(const session::SessionEvent& event) {
  if (event.HasTouches()) {
    const auto& t = event.touches->front();
    return Point{t.x, t.y};
  }
  return Point{};
}

}  // namespace

bool IsTapGesture(const session::SessionEvent& event) {
  if (event.type != "gesture") return false;
  return event.gesture_type == "tap" || event.gesture_type == "double_tap";
}

std::vector<session::SessionEvent> DetectRageTaps(
    const std::vector<session::SessionEvent>& events,
    const RageTapConfig& config) {
  std::vector<const session::SessionEvent*> taps;
  for (const auto& e : events) {
    if (IsTapGesture(e)) taps.push_back(&e);
  }

  std::vector<session::SessionEvent> rage_taps;
  size_t i = 0;
  while (i < taps.size()) {
    const session::SessionEvent& anchor = *taps[i];
    const Point origin = FirstTouch(anchor);

    size_t count = 1;
    for (size_t j = i + 1; j < taps.size(); ++j) {
      if (taps[j]->timestamp_ms - anchor.timestamp_ms > config.window_ms) break;
      const Point p = FirstTouch(*taps[j]);
      if (std::hypot(p.x - origin.x, p.y - origin.y) <= config.radius_px) {
        ++count;
      }
    }

    if (count >= config.min_taps) {
      session::SessionEvent rage = anchor;
      rage.type = kRageTapType;
      rage.frustration_kind = kRageTapType;
      rage_taps.push_back(std::move(rage));
      i += count;
    } else {
      ++i;
    }
  }
  return rage_taps;
}

}  // namespace rewindreplay::timeline
