// Repository: Rewind
// Component: Paced Frame Scheduler
// Purpose: Refresh-rate paced IFrameScheduler for headless playback.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMING_PACED_FRAME_SCHEDULER_HPP_
#define REWIND_TIMING_PACED_FRAME_SCHEDULER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>

#include "rewind/timing/IFrameScheduler.hpp"
#include "rewind/timing/ITimeSource.hpp"
#include "rewind/timing/IWaitStrategy.hpp"

namespace rewindreplay::timing {

// =============================================================================
// PacedFrameScheduler
// Services pending callbacks in passes. Each pass waits (through the wait
// strategy) for the next refresh deadline, then runs every callback that was
// pending when the pass began, in request order.
//
// Deadlines advance by one refresh period per pass. If a pass overruns, the
// next deadline is re-anchored to now instead of bursting to catch up.
//
// Thread safety:
// - RequestFrame / CancelFrame / RunOnce / RunUntilIdle: driving thread only
// - RequestStop: any thread (signal handlers included)
// =============================================================================

class PacedFrameScheduler : public IFrameScheduler {
 public:
  PacedFrameScheduler(std::shared_ptr<ITimeSource> time_source,
                      std::shared_ptr<IWaitStrategy> wait_strategy,
                      double refresh_hz = 60.0);

  PacedFrameScheduler(const PacedFrameScheduler&) = delete;
  PacedFrameScheduler& operator=(const PacedFrameScheduler&) = delete;

  FrameRequestId RequestFrame(FrameCallback callback) override;
  void CancelFrame(FrameRequestId id) override;

  // Services one refresh. Returns the number of callbacks that ran.
  // Returns 0 without waiting when nothing is pending.
  size_t RunOnce();

  // Services refreshes until no callback is pending, RequestStop() is
  // called, or max_passes passes ran (0 = unlimited). Returns passes run.
  size_t RunUntilIdle(size_t max_passes = 0);

  void RequestStop() { stop_requested_.store(true, std::memory_order_release); }

  size_t PendingCount() const { return pending_.size() + in_flight_.size(); }
  int64_t PeriodUs() const { return period_us_; }

 private:
  std::shared_ptr<ITimeSource> time_source_;
  std::shared_ptr<IWaitStrategy> wait_strategy_;
  int64_t period_us_;
  int64_t next_deadline_us_ = -1;

  FrameRequestId next_id_ = 1;
  std::map<FrameRequestId, FrameCallback> pending_;    // Next pass
  std::map<FrameRequestId, FrameCallback> in_flight_;  // Current pass
  std::atomic<bool> stop_requested_{false};
};

}  // namespace rewindreplay::timing

#endif  // REWIND_TIMING_PACED_FRAME_SCHEDULER_HPP_
