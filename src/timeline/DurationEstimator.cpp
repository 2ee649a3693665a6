// Repository: Rewind
// Component: Duration Estimator
// Purpose: Pick the total playback duration from imperfect candidate signals.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/DurationEstimator.hpp"

#include <cmath>
#include <cstdlib>

namespace rewindreplay::timeline {

namespace {

// Leading-number parse: "12.5s" -> 12.5, "abc" -> nullopt.
std::optional<double> ParseLeadingDouble(const std::string& text) {
  if (text.empty()) return std::nullopt;
  const char* begin = text.c_str();
  char* end = nullptr;
  double value = std::strtod(begin, &end);
  if (end == begin || !std::isfinite(value)) return std::nullopt;
  return value;
}

}  // namespace

const char* DurationSourceToString(DurationSource source) {
  switch (source) {
    case DurationSource::kPlayableDuration: return "playable_duration";
    case DurationSource::kScreenshots:      return "screenshots";
    case DurationSource::kSessionEnd:       return "session_end";
    case DurationSource::kStats:            return "stats";
    case DurationSource::kLastEvent:        return "last_event";
    case DurationSource::kFallback:         return "fallback";
  }
  return "unknown";
}

DurationEstimate EstimateDuration(const session::SessionRecord& session,
                                  const std::vector<session::SessionEvent>& timeline,
                                  const DurationConfig& config) {
  if (session.playable_duration_s && *session.playable_duration_s > 0.0) {
    return DurationEstimate{*session.playable_duration_s, DurationSource::kPlayableDuration};
  }

  const DurationEstimate fallback{config.fallback_s, DurationSource::kFallback};
  const int64_t start = session.start_time_ms;
  if (start == 0) return fallback;

  DurationEstimate best{0.0, DurationSource::kFallback};
  bool found = false;
  auto consider = [&](double seconds, DurationSource source) {
    if (!std::isfinite(seconds) || seconds <= 0.0) return;
    if (!found || seconds > best.seconds) {
      best = DurationEstimate{seconds, source};
      found = true;
    }
  };

  if (!session.screenshot_frames.empty()) {
    int64_t last_ts = session.screenshot_frames.front().timestamp_ms;
    for (const auto& f : session.screenshot_frames) {
      if (f.timestamp_ms > last_ts) last_ts = f.timestamp_ms;
    }
    consider(static_cast<double>(last_ts - start) / 1000.0 + config.screenshot_tail_s,
             DurationSource::kScreenshots);
  }

  if (session.end_time_ms && *session.end_time_ms > start) {
    double seconds = static_cast<double>(*session.end_time_ms - start) / 1000.0;
    if (session.background_time_s && *session.background_time_s > 0.0) {
      seconds -= *session.background_time_s;
    }
    consider(seconds, DurationSource::kSessionEnd);
  }

  if (auto stats = ParseLeadingDouble(session.stats.duration)) {
    consider(*stats, DurationSource::kStats);
  }

  if (!timeline.empty() && timeline.back().timestamp_ms > start) {
    consider(static_cast<double>(timeline.back().timestamp_ms - start) / 1000.0,
             DurationSource::kLastEvent);
  }

  return found ? best : fallback;
}

}  // namespace rewindreplay::timeline
