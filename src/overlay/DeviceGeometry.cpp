// Repository: Rewind
// Component: Device Geometry
// Purpose: Screen size used to validate and place touch overlays.
// Copyright (c) 2025 Rewind

#include "rewind/overlay/DeviceGeometry.hpp"

#include <algorithm>
#include <cmath>

namespace rewindreplay::overlay {

ScreenSize InferScreenSize(const session::SessionRecord& session) {
  const auto& info = session.device_info;
  if (info.screen_width > 0 && info.screen_height > 0) {
    return ScreenSize{info.screen_width, info.screen_height};
  }

  double max_x = 0.0;
  double max_y = 0.0;
  for (const auto& e : session.events) {
    if ((e.type != "touch" && e.type != "gesture") || !e.HasTouches()) continue;
    for (const auto& p : *e.touches) {
      if (std::isfinite(p.x) && p.x <= kMaxPlausibleTouchCoordinate) max_x = std::max(max_x, p.x);
      if (std::isfinite(p.y) && p.y <= kMaxPlausibleTouchCoordinate) max_y = std::max(max_y, p.y);
    }
  }
  if (max_x > 100.0 && max_y > 100.0) {
    return ScreenSize{static_cast<int>(std::ceil(max_x * 1.1)),
                      static_cast<int>(std::ceil(max_y * 1.1))};
  }

  if (session::ToLowerAscii(session.platform) == "android") {
    return kDefaultAndroidScreen;
  }
  return kDefaultIosScreen;
}

}  // namespace rewindreplay::overlay
