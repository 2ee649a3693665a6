// Repository: Rewind
// Component: Session Insights Contract Tests
// Purpose: Verify API health, issue timing and stability scoring
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include <vector>

#include "rewind/timeline/EventNormalizer.hpp"
#include "rewind/timeline/SessionInsights.hpp"

#include "SessionBuilders.h"

namespace rewindreplay::timeline::testing {
namespace {

using rewindreplay::session::CrashRecord;
using rewindreplay::session::SessionEvent;
using rewindreplay::session::SessionRecord;
using rewindreplay::tests::fixtures::kSessionStartMs;
using rewindreplay::tests::fixtures::MakeEvent;
using rewindreplay::tests::fixtures::MakeRequest;
using rewindreplay::tests::fixtures::MakeSession;
using rewindreplay::tests::fixtures::MakeTap;

// =============================================================================
// A. PERCENTILE
// =============================================================================

TEST(PercentileTest, NearestRank) {
  std::vector<double> values = {5, 1, 3, 2, 4};
  EXPECT_DOUBLE_EQ(Percentile(values, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(Percentile(values, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(Percentile(values, 100.0), 5.0);
  EXPECT_DOUBLE_EQ(Percentile(values, 95.0), 5.0);
  EXPECT_DOUBLE_EQ(Percentile({}, 95.0), 0.0);
}

// =============================================================================
// B. CLASSIFICATION
// =============================================================================

TEST(SessionInsightsTest, InteractionClassification) {
  EXPECT_TRUE(IsInteraction(MakeTap(0, 1, 1)));
  EXPECT_TRUE(IsInteraction(MakeEvent("scroll", 0)));
  SessionEvent swipe = MakeEvent("custom", 0);
  swipe.gesture_type = "swipe_left";
  EXPECT_TRUE(IsInteraction(swipe));
  EXPECT_FALSE(IsInteraction(MakeEvent("navigation", 0)));
}

TEST(SessionInsightsTest, IssueClassification) {
  EXPECT_TRUE(IsIssueEvent(MakeEvent("crash", 0)));
  EXPECT_TRUE(IsIssueEvent(MakeEvent("rage_tap", 0)));
  EXPECT_FALSE(IsIssueEvent(MakeEvent("navigation", 0)));

  SessionEvent ok = EventNormalizer::NetworkRequestToEvent(MakeRequest(1, "https://a/b", 200));
  SessionEvent failed = EventNormalizer::NetworkRequestToEvent(MakeRequest(1, "https://a/b", 500));
  EXPECT_FALSE(IsIssueEvent(ok));
  EXPECT_TRUE(IsIssueEvent(failed));
}

// =============================================================================
// C. AGGREGATES
// =============================================================================

class SessionInsightsFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    session_ = MakeSession({0, 1000}, 120.0);
    session_.events = {
        MakeEvent("navigation", kSessionStartMs + 200),
        MakeTap(kSessionStartMs + 1000, 50, 50),
        MakeEvent("log", kSessionStartMs + 1500),
    };
    session_.network_requests = {
        MakeRequest(kSessionStartMs + 1100, "https://api.test/a", 200, 100.0),
        MakeRequest(kSessionStartMs + 2500, "https://api.test/b", 500, 300.0),
        MakeRequest(kSessionStartMs + 3000, "https://api.test/c", 200, 200.0),
        MakeRequest(kSessionStartMs + 3500, "https://api.test/d", 404, 0.0),
    };
    session_.network_requests[0].response_body_size = 1000;
    session_.network_requests[2].request_body_size = 24;
    CrashRecord crash;
    crash.id = "c-1";
    crash.timestamp_ms = kSessionStartMs + 4000;
    session_.crashes = {crash};

    timeline_ = EventNormalizer().Normalize(session_);
    insights_ = ComputeInsights(session_, timeline_.events, timeline_.rage_taps, 120.0);
  }

  SessionRecord session_;
  NormalizedTimeline timeline_;
  SessionInsights insights_;
};

TEST_F(SessionInsightsFixture, CountsAndApiHealth) {
  EXPECT_EQ(insights_.crash_count, 1u);
  EXPECT_EQ(insights_.request_count, 4u);
  EXPECT_EQ(insights_.failed_request_count, 2u);
  EXPECT_EQ(insights_.interaction_count, 1u);
  EXPECT_EQ(insights_.rage_tap_count, 0u);
  EXPECT_DOUBLE_EQ(insights_.api_error_rate_pct, 50.0);
  // Zero-latency requests are not sampled.
  EXPECT_DOUBLE_EQ(insights_.api_p95_latency_ms, 300.0);
  EXPECT_EQ(insights_.total_payload_bytes, 1024);
}

TEST_F(SessionInsightsFixture, RatesAndFirstOccurrences) {
  EXPECT_EQ(insights_.issue_signals, 3u);
  EXPECT_DOUBLE_EQ(insights_.issue_signals_per_minute, 1.5);
  EXPECT_DOUBLE_EQ(insights_.interactions_per_minute, 0.5);
  ASSERT_TRUE(insights_.time_to_first_issue_ms.has_value());
  EXPECT_EQ(*insights_.time_to_first_issue_ms, 2500);
  ASSERT_TRUE(insights_.time_to_first_interaction_ms.has_value());
  EXPECT_EQ(*insights_.time_to_first_interaction_ms, 1000);
}

TEST_F(SessionInsightsFixture, StabilityScorePenalizesIssues) {
  // 100 - 1.5/min * 20 - 50% * 1.1
  EXPECT_NEAR(insights_.stability_score, 15.0, 1e-9);
}

TEST(SessionInsightsTest, QuietSessionScoresFullStability) {
  SessionRecord s = MakeSession({0}, 30.0);
  s.events = {MakeEvent("navigation", kSessionStartMs + 10)};

  SessionInsights insights = ComputeInsights(s, s.events, {}, 30.0);

  EXPECT_DOUBLE_EQ(insights.stability_score, 100.0);
  EXPECT_DOUBLE_EQ(insights.api_error_rate_pct, 0.0);
  EXPECT_FALSE(insights.time_to_first_issue_ms.has_value());
  EXPECT_FALSE(insights.time_to_first_interaction_ms.has_value());
}

TEST(SessionInsightsTest, StabilityScoreIsFloored) {
  SessionRecord s = MakeSession({0}, 60.0);
  for (int i = 0; i < 20; ++i) {
    CrashRecord c;
    c.timestamp_ms = kSessionStartMs + i * 100;
    s.crashes.push_back(c);
  }

  SessionInsights insights = ComputeInsights(s, {}, {}, 60.0);

  EXPECT_DOUBLE_EQ(insights.stability_score, 0.0);
}

}  // namespace
}  // namespace rewindreplay::timeline::testing
