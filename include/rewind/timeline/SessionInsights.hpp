// Repository: Rewind
// Component: Session Insights
// Purpose: Summary health signals derived from a normalized replay timeline.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_SESSION_INSIGHTS_HPP_
#define REWIND_TIMELINE_SESSION_INSIGHTS_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::timeline {

struct SessionInsights {
  size_t rage_tap_count = 0;
  size_t crash_count = 0;
  size_t anr_count = 0;
  size_t error_count = 0;
  size_t request_count = 0;
  size_t failed_request_count = 0;
  size_t interaction_count = 0;

  double api_error_rate_pct = 0.0;
  double api_p95_latency_ms = 0.0;

  size_t issue_signals = 0;
  double issue_signals_per_minute = 0.0;
  double interactions_per_minute = 0.0;

  std::optional<int64_t> time_to_first_issue_ms;
  std::optional<int64_t> time_to_first_interaction_ms;

  int64_t total_payload_bytes = 0;
  double stability_score = 100.0;  // [0, 100]
};

// Nearest-rank percentile over values; 0 when empty. p is clamped to [0, 100].
double Percentile(std::vector<double> values, double p);

// True for interaction events: tap/touch/gesture/scroll/input, or a
// gestureType mentioning tap, scroll, swipe or pan.
bool IsInteraction(const session::SessionEvent& event);

// True for events that count toward time-to-first-issue.
bool IsIssueEvent(const session::SessionEvent& event);

SessionInsights ComputeInsights(const session::SessionRecord& session,
                                const std::vector<session::SessionEvent>& timeline,
                                const std::vector<session::SessionEvent>& rage_taps,
                                double duration_s);

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_SESSION_INSIGHTS_HPP_
