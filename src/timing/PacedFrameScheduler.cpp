// Repository: Rewind
// Component: Paced Frame Scheduler
// Purpose: Refresh-rate paced IFrameScheduler for headless playback.
// Copyright (c) 2025 Rewind

#include "rewind/timing/PacedFrameScheduler.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rewindreplay::timing {

PacedFrameScheduler::PacedFrameScheduler(std::shared_ptr<ITimeSource> time_source,
                                         std::shared_ptr<IWaitStrategy> wait_strategy,
                                         double refresh_hz)
    : time_source_(std::move(time_source)),
      wait_strategy_(std::move(wait_strategy)) {
  if (!time_source_ || !wait_strategy_) {
    throw std::invalid_argument(
        "PacedFrameScheduler requires a time source and a wait strategy");
  }
  if (!std::isfinite(refresh_hz) || refresh_hz <= 0.0) {
    throw std::invalid_argument("PacedFrameScheduler refresh_hz must be > 0");
  }
  period_us_ = static_cast<int64_t>(std::llround(1'000'000.0 / refresh_hz));
  if (period_us_ <= 0) period_us_ = 1;
}

FrameRequestId PacedFrameScheduler::RequestFrame(FrameCallback callback) {
  FrameRequestId id = next_id_++;
  pending_.emplace(id, std::move(callback));
  return id;
}

void PacedFrameScheduler::CancelFrame(FrameRequestId id) {
  if (id == kNoFrameRequest) return;
  pending_.erase(id);
  in_flight_.erase(id);
}

size_t PacedFrameScheduler::RunOnce() {
  if (pending_.empty()) return 0;

  int64_t now_us = time_source_->NowMonotonicUs();
  if (next_deadline_us_ < 0 || next_deadline_us_ < now_us) {
    // First pass, or the previous pass overran: re-anchor.
    next_deadline_us_ = now_us + period_us_;
  }
  wait_strategy_->WaitUntilUs(next_deadline_us_);
  next_deadline_us_ += period_us_;

  int64_t frame_time_us = time_source_->NowMonotonicUs();
  in_flight_ = std::move(pending_);
  pending_.clear();

  size_t ran = 0;
  while (!in_flight_.empty()) {
    auto it = in_flight_.begin();
    FrameCallback callback = std::move(it->second);
    in_flight_.erase(it);
    if (callback) {
      callback(frame_time_us);
      ++ran;
    }
  }
  return ran;
}

size_t PacedFrameScheduler::RunUntilIdle(size_t max_passes) {
  size_t passes = 0;
  while (!pending_.empty()) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      util::Logger::Info("[PacedFrameScheduler] Stop requested after " +
                         std::to_string(passes) + " passes");
      break;
    }
    if (max_passes != 0 && passes >= max_passes) break;
    RunOnce();
    ++passes;
  }
  return passes;
}

}  // namespace rewindreplay::timing
