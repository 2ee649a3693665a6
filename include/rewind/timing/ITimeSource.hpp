#pragma once
#include <cstdint>

namespace rewindreplay::timing {

// Monotonic wall-clock source driving playback. Microseconds from an
// arbitrary epoch; only differences are meaningful.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMonotonicUs() const = 0;
};

}  // namespace rewindreplay::timing
