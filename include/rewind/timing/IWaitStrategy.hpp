// Repository: Rewind
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in PacedFrameScheduler.
//          Production: RealtimeWaitStrategy sleeps until deadline.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMING_IWAIT_STRATEGY_HPP_
#define REWIND_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>

#include "rewind/timing/ITimeSource.hpp"

namespace rewindreplay::timing {

// Deadlines are expressed in the ITimeSource domain (monotonic microseconds).
class IWaitStrategy {
 public:
  virtual void WaitUntilUs(int64_t deadline_us) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  explicit RealtimeWaitStrategy(std::shared_ptr<ITimeSource> time_source)
      : time_source_(std::move(time_source)) {
    if (!time_source_) {
      throw std::invalid_argument("RealtimeWaitStrategy requires a time source");
    }
  }

  void WaitUntilUs(int64_t deadline_us) override {
    int64_t remaining_us = deadline_us - time_source_->NowMonotonicUs();
    if (remaining_us > 0) {
      std::this_thread::sleep_for(std::chrono::microseconds(remaining_us));
    }
  }

 private:
  std::shared_ptr<ITimeSource> time_source_;
};

}  // namespace rewindreplay::timing

#endif  // REWIND_TIMING_IWAIT_STRATEGY_HPP_
