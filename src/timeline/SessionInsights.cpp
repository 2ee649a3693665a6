// Repository: Rewind
// Component: Session Insights
// Purpose: Summary health signals derived from a normalized replay timeline.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/SessionInsights.hpp"

#include <algorithm>
#include <cmath>

#include "rewind/timeline/EventNormalizer.hpp"

namespace rewindreplay::timeline {

namespace {

std::string LowerGestureType(const session::SessionEvent& event) {
  if (!event.gesture_type.empty()) return session::ToLowerAscii(event.gesture_type);
  return session::ToLowerAscii(
      session::PropertyAsString(event.properties, "gestureType").value_or(""));
}

bool NetworkEventFailed(const session::SessionEvent& event) {
  if (auto success = session::PropertyAsBool(event.properties, "success")) {
    return !*success;
  }
  auto status = session::PropertyAsNumber(event.properties, "statusCode");
  return !(status && *status < 400.0);
}

double PerMinute(size_t count, double duration_s) {
  if (duration_s <= 0.0) return 0.0;
  return static_cast<double>(count) / std::max(1.0, duration_s / 60.0);
}

}  // namespace

double Percentile(std::vector<double> values, double p) {
  if (values.empty()) return 0.0;
  std::sort(values.begin(), values.end());
  const double clamped = std::clamp(p, 0.0, 100.0);
  const double n = static_cast<double>(values.size());
  long rank = static_cast<long>(std::ceil(clamped / 100.0 * n)) - 1;
  rank = std::min(rank, static_cast<long>(values.size()) - 1);
  rank = std::max(rank, 0L);
  return values[static_cast<size_t>(rank)];
}

bool IsInteraction(const session::SessionEvent& event) {
  const std::string type = session::ToLowerAscii(event.type);
  if (type == "tap" || type == "touch" || type == "gesture" ||
      type == "scroll" || type == "input") {
    return true;
  }
  const std::string gesture = LowerGestureType(event);
  return gesture.find("tap") != std::string::npos ||
         gesture.find("scroll") != std::string::npos ||
         gesture.find("swipe") != std::string::npos ||
         gesture.find("pan") != std::string::npos;
}

bool IsIssueEvent(const session::SessionEvent& event) {
  const std::string type = session::ToLowerAscii(event.type);
  if (type == "crash" || type == "anr" || type == "error" ||
      type == "rage_tap" || type == "dead_tap") {
    return true;
  }
  const std::string gesture = LowerGestureType(event);
  if (gesture == "rage_tap" || gesture == "dead_tap") return true;
  if (type == "network_request") return NetworkEventFailed(event);
  return false;
}

SessionInsights ComputeInsights(const session::SessionRecord& session,
                                const std::vector<session::SessionEvent>& timeline,
                                const std::vector<session::SessionEvent>& rage_taps,
                                double duration_s) {
  SessionInsights out;
  out.rage_tap_count = rage_taps.size();
  out.crash_count = session.crashes.size();
  out.anr_count = session.anrs.size();
  out.error_count = static_cast<size_t>(std::count_if(
      session.events.begin(), session.events.end(),
      [](const session::SessionEvent& e) { return session::ToLowerAscii(e.type) == "error"; }));
  out.interaction_count = static_cast<size_t>(std::count_if(
      session.events.begin(), session.events.end(), IsInteraction));

  out.request_count = session.network_requests.size();
  std::vector<double> latencies;
  for (const auto& req : session.network_requests) {
    if (!EventNormalizer::RequestSucceeded(req)) ++out.failed_request_count;
    if (std::isfinite(req.duration_ms) && req.duration_ms > 0.0) {
      latencies.push_back(req.duration_ms);
    }
    out.total_payload_bytes += req.request_body_size.value_or(0) +
                               req.response_body_size.value_or(0);
  }
  if (out.request_count > 0) {
    out.api_error_rate_pct = static_cast<double>(out.failed_request_count) /
                             static_cast<double>(out.request_count) * 100.0;
  }
  out.api_p95_latency_ms = Percentile(std::move(latencies), 95.0);

  out.issue_signals = out.crash_count + out.anr_count + out.error_count +
                      out.rage_tap_count + out.failed_request_count;
  out.issue_signals_per_minute = PerMinute(out.issue_signals, duration_s);
  out.interactions_per_minute = PerMinute(out.interaction_count, duration_s);

  const int64_t start = session.start_time_ms;
  for (const auto& e : timeline) {
    if (e.timestamp_ms < start) continue;
    const int64_t offset = e.timestamp_ms - start;
    if (IsIssueEvent(e) &&
        (!out.time_to_first_issue_ms || offset < *out.time_to_first_issue_ms)) {
      out.time_to_first_issue_ms = offset;
    }
    if (IsInteraction(e) &&
        (!out.time_to_first_interaction_ms || offset < *out.time_to_first_interaction_ms)) {
      out.time_to_first_interaction_ms = offset;
    }
  }

  const double penalty = out.issue_signals_per_minute * 20.0 +
                         out.api_error_rate_pct * 1.1 +
                         std::max(0.0, (out.api_p95_latency_ms - 400.0) / 35.0);
  out.stability_score = std::clamp(100.0 - penalty, 0.0, 100.0);
  return out;
}

}  // namespace rewindreplay::timeline
