// Repository: Rewind
// Component: Frame Scheduler Interface
// Purpose: Display-refresh callback scheduling for the replay clock.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMING_IFRAME_SCHEDULER_HPP_
#define REWIND_TIMING_IFRAME_SCHEDULER_HPP_

#include <cstdint>
#include <functional>

namespace rewindreplay::timing {

using FrameRequestId = uint64_t;
constexpr FrameRequestId kNoFrameRequest = 0;

// Callback receives the monotonic time (us) of the refresh it runs in.
using FrameCallback = std::function<void(int64_t now_us)>;

// IFrameScheduler runs each requested callback once, on the next display
// refresh, on the thread that drives the scheduler.
//
// Contract:
// - RequestFrame never returns kNoFrameRequest.
// - A callback requested while a refresh is being serviced runs on the
//   following refresh, not the current one.
// - After CancelFrame(id) returns, the callback for id never runs.
//   Cancelling an unknown or already-run id is a no-op.
class IFrameScheduler {
 public:
  virtual ~IFrameScheduler() = default;

  virtual FrameRequestId RequestFrame(FrameCallback callback) = 0;
  virtual void CancelFrame(FrameRequestId id) = 0;
};

}  // namespace rewindreplay::timing

#endif  // REWIND_TIMING_IFRAME_SCHEDULER_HPP_
