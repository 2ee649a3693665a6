// Repository: Rewind
// Component: Paced Frame Scheduler Contract Tests
// Purpose: Verify refresh pacing, pass boundaries, cancellation and stop
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include <functional>
#include <memory>
#include <stdexcept>
#include <vector>

#include "rewind/timing/PacedFrameScheduler.hpp"

#include "DeterministicTimeSource.hpp"
#include "DeterministicWaitStrategy.hpp"

namespace rewindreplay::timing::testing {
namespace {

class PacedFrameSchedulerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>(0);
    wait_ = std::make_shared<DeterministicWaitStrategy>(time_);
    scheduler_ = std::make_unique<PacedFrameScheduler>(time_, wait_, 60.0);
  }

  // Requests a callback that records its frame time and re-requests itself
  // until `remaining` reaches zero.
  void RequestChain(int remaining) {
    scheduler_->RequestFrame([this, remaining](int64_t now_us) {
      frame_times_.push_back(now_us);
      if (remaining > 1) RequestChain(remaining - 1);
    });
  }

  std::shared_ptr<DeterministicTimeSource> time_;
  std::shared_ptr<DeterministicWaitStrategy> wait_;
  std::unique_ptr<PacedFrameScheduler> scheduler_;
  std::vector<int64_t> frame_times_;
};

// =============================================================================
// A. CONSTRUCTION
// =============================================================================

TEST(PacedFrameSchedulerConstructionTest, RejectsInvalidArguments) {
  auto time = std::make_shared<DeterministicTimeSource>();
  auto wait = std::make_shared<DeterministicWaitStrategy>(time);

  EXPECT_THROW(PacedFrameScheduler(nullptr, wait), std::invalid_argument);
  EXPECT_THROW(PacedFrameScheduler(time, nullptr), std::invalid_argument);
  EXPECT_THROW(PacedFrameScheduler(time, wait, 0.0), std::invalid_argument);
  EXPECT_THROW(PacedFrameScheduler(time, wait, -30.0), std::invalid_argument);
}

TEST_F(PacedFrameSchedulerTest, PeriodFollowsRefreshRate) {
  EXPECT_EQ(scheduler_->PeriodUs(), 16'667);
  PacedFrameScheduler slow(time_, wait_, 10.0);
  EXPECT_EQ(slow.PeriodUs(), 100'000);
}

// =============================================================================
// B. PACING
// =============================================================================

TEST_F(PacedFrameSchedulerTest, DeadlinesAreSpacedByOnePeriod) {
  RequestChain(5);

  size_t passes = scheduler_->RunUntilIdle();

  EXPECT_EQ(passes, 5u);
  ASSERT_EQ(frame_times_.size(), 5u);
  for (size_t i = 0; i < frame_times_.size(); ++i) {
    EXPECT_EQ(frame_times_[i], static_cast<int64_t>(i + 1) * 16'667);
  }
  EXPECT_EQ(wait_->deadlines().size(), 5u);
}

TEST_F(PacedFrameSchedulerTest, OverrunReanchorsInsteadOfBursting) {
  scheduler_->RequestFrame([this](int64_t) {
    time_->AdvanceMs(50);
    scheduler_->RequestFrame([this](int64_t now_us) { frame_times_.push_back(now_us); });
  });

  scheduler_->RunUntilIdle();

  ASSERT_EQ(frame_times_.size(), 1u);
  // First pass at 16667, callback overran to 66667, next refresh one period later.
  EXPECT_EQ(frame_times_[0], 66'667 + 16'667);
}

TEST_F(PacedFrameSchedulerTest, RunOnceWithNothingPendingDoesNotWait) {
  EXPECT_EQ(scheduler_->RunOnce(), 0u);
  EXPECT_TRUE(wait_->deadlines().empty());
  EXPECT_EQ(time_->NowMonotonicUs(), 0);
}

// =============================================================================
// C. PASS BOUNDARIES
// =============================================================================

TEST_F(PacedFrameSchedulerTest, CallbacksRequestedDuringPassRunNextPass) {
  RequestChain(3);

  EXPECT_EQ(scheduler_->RunOnce(), 1u);
  EXPECT_EQ(scheduler_->PendingCount(), 1u);
  EXPECT_EQ(frame_times_.size(), 1u);
}

TEST_F(PacedFrameSchedulerTest, CallbacksRunInRequestOrderWithSharedFrameTime) {
  std::vector<int> order;
  std::vector<int64_t> times;
  for (int i = 0; i < 4; ++i) {
    scheduler_->RequestFrame([&order, &times, i](int64_t now_us) {
      order.push_back(i);
      times.push_back(now_us);
    });
  }

  EXPECT_EQ(scheduler_->RunOnce(), 4u);

  EXPECT_EQ(order, (std::vector<int>{0, 1, 2, 3}));
  for (int64_t t : times) EXPECT_EQ(t, times.front());
}

// =============================================================================
// D. CANCELLATION
// =============================================================================

TEST_F(PacedFrameSchedulerTest, CancelledRequestNeverRuns) {
  bool ran = false;
  FrameRequestId id = scheduler_->RequestFrame([&ran](int64_t) { ran = true; });
  scheduler_->CancelFrame(id);

  EXPECT_EQ(scheduler_->PendingCount(), 0u);
  EXPECT_EQ(scheduler_->RunUntilIdle(), 0u);
  EXPECT_FALSE(ran);
}

TEST_F(PacedFrameSchedulerTest, CancelInsidePassRemovesLaterCallback) {
  bool second_ran = false;
  FrameRequestId second = kNoFrameRequest;
  scheduler_->RequestFrame([this, &second](int64_t) { scheduler_->CancelFrame(second); });
  second = scheduler_->RequestFrame([&second_ran](int64_t) { second_ran = true; });

  EXPECT_EQ(scheduler_->RunOnce(), 1u);
  EXPECT_FALSE(second_ran);
}

TEST_F(PacedFrameSchedulerTest, CancelUnknownIdIsHarmless) {
  scheduler_->CancelFrame(kNoFrameRequest);
  scheduler_->CancelFrame(12345);
  EXPECT_EQ(scheduler_->PendingCount(), 0u);
}

// =============================================================================
// E. STOPPING
// =============================================================================

TEST_F(PacedFrameSchedulerTest, MaxPassesBoundsRun) {
  RequestChain(100);

  EXPECT_EQ(scheduler_->RunUntilIdle(3), 3u);
  EXPECT_EQ(frame_times_.size(), 3u);
  EXPECT_EQ(scheduler_->PendingCount(), 1u);
}

TEST_F(PacedFrameSchedulerTest, RequestStopEndsRun) {
  int count = 0;
  std::function<void(int64_t)> tick = [&](int64_t) {
    if (++count == 2) scheduler_->RequestStop();
    scheduler_->RequestFrame(tick);
  };
  scheduler_->RequestFrame(tick);

  EXPECT_EQ(scheduler_->RunUntilIdle(), 2u);
  EXPECT_EQ(count, 2);
}

}  // namespace
}  // namespace rewindreplay::timing::testing
