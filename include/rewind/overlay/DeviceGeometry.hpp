// Repository: Rewind
// Component: Device Geometry
// Purpose: Screen size used to validate and place touch overlays.
// Copyright (c) 2025 Rewind

#ifndef REWIND_OVERLAY_DEVICE_GEOMETRY_HPP_
#define REWIND_OVERLAY_DEVICE_GEOMETRY_HPP_

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::overlay {

struct ScreenSize {
  int width = 0;
  int height = 0;
};

inline constexpr ScreenSize kDefaultIosScreen{375, 812};
inline constexpr ScreenSize kDefaultAndroidScreen{1080, 2400};

// Touch coordinates above this are device-reporting bugs and do not count
// towards the inferred extent.
inline constexpr double kMaxPlausibleTouchCoordinate = 100000.0;

// deviceInfo dimensions when both are positive; else the extent of the
// plausible touch coordinates scaled by 1.1 (rounded up) when both maxima
// exceed 100 px; else a platform default.
ScreenSize InferScreenSize(const session::SessionRecord& session);

}  // namespace rewindreplay::overlay

#endif  // REWIND_OVERLAY_DEVICE_GEOMETRY_HPP_
