// Repository: Rewind
// Component: Rage Tap Detector
// Purpose: Cluster rapid repeated taps at one spot into synthetic rage_tap events.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_RAGE_TAP_DETECTOR_HPP_
#define REWIND_TIMELINE_RAGE_TAP_DETECTOR_HPP_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::timeline {

inline constexpr const char* kRageTapType = "rage_tap";

struct RageTapConfig {
  int64_t window_ms = 1500;   // Forward scan stops past this gap from the anchor tap
  double radius_px = 50.0;    // Inclusive distance between first touch points
  size_t min_taps = 3;        // Anchor tap included
};

// True for gesture events whose gestureType is tap or double_tap.
bool IsTapGesture(const session::SessionEvent& event);

// Scans taps in their original order. For each anchor tap, counts the taps
// within window_ms after it whose first touch point lies within radius_px of
// the anchor's. A group of at least min_taps emits one rage_tap event copied
// from the anchor and skips the consumed taps. A tap without touch data is
// treated as touching (0, 0).
std::vector<session::SessionEvent> DetectRageTaps(
    const std::vector<session::SessionEvent>& events,
    const RageTapConfig& config = RageTapConfig{});

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_RAGE_TAP_DETECTOR_HPP_
