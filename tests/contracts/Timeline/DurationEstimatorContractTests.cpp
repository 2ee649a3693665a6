// Repository: Rewind
// Component: Duration Estimator Contract Tests
// Purpose: Verify candidate selection for the total playback duration
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include <vector>

#include "rewind/timeline/DurationEstimator.hpp"

#include "SessionBuilders.h"

namespace rewindreplay::timeline::testing {
namespace {

using rewindreplay::session::SessionEvent;
using rewindreplay::session::SessionRecord;
using rewindreplay::tests::fixtures::kSessionStartMs;
using rewindreplay::tests::fixtures::MakeEvent;
using rewindreplay::tests::fixtures::MakeSession;

// =============================================================================
// A. PLAYABLE DURATION
// =============================================================================

TEST(DurationEstimatorTest, PlayableDurationIsTakenVerbatim) {
  SessionRecord s = MakeSession({0, 30000}, 12.25);
  s.end_time_ms = kSessionStartMs + 90000;

  DurationEstimate d = EstimateDuration(s, {MakeEvent("log", kSessionStartMs + 80000)});

  EXPECT_DOUBLE_EQ(d.seconds, 12.25);
  EXPECT_EQ(d.source, DurationSource::kPlayableDuration);
}

TEST(DurationEstimatorTest, NonPositivePlayableDurationIsIgnored) {
  SessionRecord s = MakeSession({0, 4000}, 0.0);

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_NEAR(d.seconds, 4.5, 1e-9);
  EXPECT_EQ(d.source, DurationSource::kScreenshots);
}

// =============================================================================
// B. CANDIDATE MAXIMUM
// =============================================================================

TEST(DurationEstimatorTest, LargestCandidateWins) {
  // screenshots 11.8 + 0.5 = 12.3, endTime 10.0, last event 15.7
  SessionRecord s = MakeSession({0, 5000, 11800}, std::nullopt);
  s.end_time_ms = kSessionStartMs + 10000;
  std::vector<SessionEvent> timeline = {
      MakeEvent("log", kSessionStartMs + 2000),
      MakeEvent("log", kSessionStartMs + 15700),
  };

  DurationEstimate d = EstimateDuration(s, timeline);

  EXPECT_DOUBLE_EQ(d.seconds, 15.7);
  EXPECT_EQ(d.source, DurationSource::kLastEvent);
}

TEST(DurationEstimatorTest, ScreenshotCandidateUsesGreatestTimestamp) {
  SessionRecord s = MakeSession({8000, 2000, 500}, std::nullopt);

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_NEAR(d.seconds, 8.5, 1e-9);
  EXPECT_EQ(d.source, DurationSource::kScreenshots);
}

TEST(DurationEstimatorTest, BackgroundTimeIsSubtractedFromSessionEnd) {
  SessionRecord s = MakeSession({}, std::nullopt);
  s.end_time_ms = kSessionStartMs + 60000;
  s.background_time_s = 20.0;

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_DOUBLE_EQ(d.seconds, 40.0);
  EXPECT_EQ(d.source, DurationSource::kSessionEnd);
}

TEST(DurationEstimatorTest, StatsDurationParsesLeadingNumber) {
  SessionRecord s = MakeSession({}, std::nullopt);
  s.stats.duration = "42.5";

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_DOUBLE_EQ(d.seconds, 42.5);
  EXPECT_EQ(d.source, DurationSource::kStats);
}

TEST(DurationEstimatorTest, UnparseableStatsDurationIsIgnored) {
  SessionRecord s = MakeSession({}, std::nullopt);
  s.stats.duration = "n/a";
  s.end_time_ms = kSessionStartMs + 3000;

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_DOUBLE_EQ(d.seconds, 3.0);
  EXPECT_EQ(d.source, DurationSource::kSessionEnd);
}

TEST(DurationEstimatorTest, EarlierCandidateWinsTie) {
  SessionRecord s = MakeSession({}, std::nullopt);
  s.end_time_ms = kSessionStartMs + 7000;
  s.stats.duration = "7";

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_DOUBLE_EQ(d.seconds, 7.0);
  EXPECT_EQ(d.source, DurationSource::kSessionEnd);
}

// =============================================================================
// C. FALLBACK
// =============================================================================

TEST(DurationEstimatorTest, MissingStartTimeYieldsFallback) {
  SessionRecord s = MakeSession({0, 9000}, std::nullopt);
  s.start_time_ms = 0;

  DurationEstimate d = EstimateDuration(s, {});

  EXPECT_DOUBLE_EQ(d.seconds, 60.0);
  EXPECT_EQ(d.source, DurationSource::kFallback);
}

TEST(DurationEstimatorTest, NoCandidatesYieldsConfiguredFallback) {
  SessionRecord s = MakeSession({}, std::nullopt);
  DurationConfig config;
  config.fallback_s = 30.0;

  DurationEstimate d = EstimateDuration(s, {}, config);

  EXPECT_DOUBLE_EQ(d.seconds, 30.0);
  EXPECT_EQ(d.source, DurationSource::kFallback);
}

TEST(DurationEstimatorTest, EventsBeforeStartAreNotCandidates) {
  SessionRecord s = MakeSession({}, std::nullopt);

  DurationEstimate d = EstimateDuration(s, {MakeEvent("log", kSessionStartMs - 500)});

  EXPECT_EQ(d.source, DurationSource::kFallback);
}

TEST(DurationEstimatorTest, SourceNames) {
  EXPECT_STREQ(DurationSourceToString(DurationSource::kPlayableDuration), "playable_duration");
  EXPECT_STREQ(DurationSourceToString(DurationSource::kLastEvent), "last_event");
  EXPECT_STREQ(DurationSourceToString(DurationSource::kFallback), "fallback");
}

}  // namespace
}  // namespace rewindreplay::timeline::testing
