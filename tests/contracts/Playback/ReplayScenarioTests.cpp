// Repository: Rewind
// Component: Replay Scenario Tests
// Purpose: End-to-end replays of representative sessions through the controller
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include <memory>

#include "rewind/playback/ReplayController.hpp"

#include "DeterministicTimeSource.hpp"
#include "ManualFrameScheduler.h"
#include "RecordingObserver.h"
#include "SessionBuilders.h"

namespace rewindreplay::playback::testing {
namespace {

using rewindreplay::session::SessionRecord;
using rewindreplay::tests::fixtures::kSessionStartMs;
using rewindreplay::tests::fixtures::MakeEvent;
using rewindreplay::tests::fixtures::MakeSession;
using rewindreplay::tests::fixtures::MakeTap;
using rewindreplay::tests::fixtures::MakeTouch;
using rewindreplay::tests::fixtures::ManualFrameScheduler;
using rewindreplay::tests::fixtures::Point;
using rewindreplay::tests::fixtures::RecordingObserver;

class ReplayScenarioTest : public ::testing::Test
{
protected:
  std::unique_ptr<ReplayController> Load(SessionRecord session)
  {
    return std::make_unique<ReplayController>(std::move(session), runtime::ReplayConfig{},
                                              scheduler_, time_);
  }

  std::shared_ptr<ManualFrameScheduler> scheduler_ = std::make_shared<ManualFrameScheduler>();
  std::shared_ptr<DeterministicTimeSource> time_ = std::make_shared<DeterministicTimeSource>(0);
};

// =============================================================================
// Rapid taps at one spot
// =============================================================================

TEST_F(ReplayScenarioTest, RapidTapsReplayAsOneRageTap)
{
  SessionRecord s = MakeSession({0, 1000}, 5.0);
  s.events = {
      MakeTap(kSessionStartMs + 0, 100, 100),
      MakeTap(kSessionStartMs + 400, 110, 105),
      MakeTap(kSessionStartMs + 900, 95, 98),
  };
  auto controller = Load(s);

  ASSERT_EQ(controller->rage_taps().size(), 1u);
  EXPECT_EQ(controller->rage_taps()[0].timestamp_ms, kSessionStartMs);

  controller->Seek(0.95);
  ReplayFrame frame = controller->CurrentFrame();
  ASSERT_EQ(frame.touches.size(), 3u);
  EXPECT_EQ(frame.touches[0].gesture_type, "rage_tap");
  EXPECT_EQ(frame.touches[1].gesture_type, "tap");
  EXPECT_EQ(frame.touches[2].gesture_type, "tap");

  EXPECT_EQ(controller->Insights().rage_tap_count, 1u);
}

// =============================================================================
// Seeking between frames
// =============================================================================

TEST_F(ReplayScenarioTest, SeekShowsFrameAtOrBefore)
{
  auto controller = Load(MakeSession({0, 500, 1200, 2000}, 4.0));
  RecordingObserver observer;
  controller->SetObserver(&observer);

  controller->Seek(1.0);

  ASSERT_EQ(observer.frames.size(), 1u);
  EXPECT_EQ(observer.last().state.current_frame_index, 1u);
  EXPECT_EQ(observer.last().frame->url, "f500");
  controller->SetObserver(nullptr);
}

// =============================================================================
// Duration without a server value
// =============================================================================

TEST_F(ReplayScenarioTest, DurationTakesLargestCandidate)
{
  SessionRecord s = MakeSession({0, 11800}, std::nullopt);
  s.end_time_ms = kSessionStartMs + 10000;
  s.events = {MakeEvent("navigation", kSessionStartMs + 15700)};
  auto controller = Load(s);

  EXPECT_DOUBLE_EQ(controller->duration().seconds, 15.7);
  EXPECT_EQ(controller->duration().source, timeline::DurationSource::kLastEvent);

  controller->Skip(60.0);
  EXPECT_DOUBLE_EQ(controller->State().current_time_s, 15.7);
}

// =============================================================================
// Density buckets
// =============================================================================

TEST_F(ReplayScenarioTest, LateEventLandsInLastDensityBucket)
{
  SessionRecord s = MakeSession({0}, 10.0);
  s.events = {MakeTap(kSessionStartMs + 9990, 200, 200)};
  auto controller = Load(s);

  timeline::DensityData d = controller->Density();

  EXPECT_DOUBLE_EQ(d.bucket_width_ms, 250.0);
  ASSERT_EQ(d.touch_density.size(), 40u);
  EXPECT_DOUBLE_EQ(d.touch_density[39], 1.0);
}

// =============================================================================
// Touch validation
// =============================================================================

TEST_F(ReplayScenarioTest, TouchInsideFloorIsNotDrawn)
{
  SessionRecord s = MakeSession({0}, 5.0);
  s.device_info.screen_width = 375;
  s.device_info.screen_height = 812;
  s.events = {
      MakeTouch(kSessionStartMs + 1000, {Point(2, 2)}),
      MakeTouch(kSessionStartMs + 1100, {Point(2, 2), Point(180, 400)}),
  };
  auto controller = Load(s);

  controller->Seek(1.2);
  ReplayFrame frame = controller->CurrentFrame();

  ASSERT_EQ(frame.touches.size(), 1u);
  ASSERT_EQ(frame.touches[0].touches.size(), 1u);
  EXPECT_DOUBLE_EQ(frame.touches[0].touches[0].x, 180.0);
  EXPECT_EQ(frame.touches[0].touch_count, 1u);
}

// =============================================================================
// Lifecycle and markers during playback
// =============================================================================

TEST_F(ReplayScenarioTest, PlaybackReportsLifecycleAndMarkers)
{
  SessionRecord s = MakeSession({0, 1000, 2000}, 4.0);
  s.events = {
      MakeEvent("app_background", kSessionStartMs + 1000),
      MakeEvent("app_foreground", kSessionStartMs + 2000),
  };
  session::CrashRecord crash;
  crash.timestamp_ms = kSessionStartMs + 3000;
  crash.exception_name = "SIGABRT";
  s.crashes = {crash};
  auto controller = Load(s);
  RecordingObserver observer;
  controller->SetObserver(&observer);

  controller->Play();
  for (int i = 0; i < 15; ++i)
  {
    time_->AdvanceMs(100);
    scheduler_->Fire(time_->NowMonotonicUs());
  }

  EXPECT_NEAR(controller->State().current_time_s, 1.5, 1e-9);
  EXPECT_TRUE(observer.last().lifecycle.in_background);

  auto markers = controller->Markers();
  ASSERT_EQ(markers.size(), 1u);
  EXPECT_EQ(markers[0].label, "SIGABRT");
  EXPECT_DOUBLE_EQ(markers[0].position, 0.75);
  controller->SetObserver(nullptr);
}

}  // namespace
}  // namespace rewindreplay::playback::testing
