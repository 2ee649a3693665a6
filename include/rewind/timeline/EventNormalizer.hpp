// Repository: Rewind
// Component: Event Normalizer
// Purpose: Merge raw events, network requests, crashes and ANRs into one
//          timestamp-ordered replay timeline.
// Copyright (c) 2025 Rewind

#ifndef REWIND_TIMELINE_EVENT_NORMALIZER_HPP_
#define REWIND_TIMELINE_EVENT_NORMALIZER_HPP_

#include <cstddef>
#include <string>
#include <vector>

#include "rewind/session/SessionTypes.hpp"
#include "rewind/timeline/RageTapDetector.hpp"

namespace rewindreplay::timeline {

struct NormalizedTimeline {
  // Sorted ascending by timestamp (stable). Includes the rage_tap events.
  std::vector<session::SessionEvent> events;
  // Rage-tap groups alone, in detection order.
  std::vector<session::SessionEvent> rage_taps;
  // Network requests without a positive timestamp or without any URL.
  size_t dropped_network_requests = 0;
};

class EventNormalizer {
 public:
  explicit EventNormalizer(RageTapConfig rage_config = RageTapConfig{});

  NormalizedTimeline Normalize(const std::vector<session::SessionEvent>& events,
                               const std::vector<session::NetworkRequest>& network_requests,
                               const std::vector<session::CrashRecord>& crashes,
                               const std::vector<session::AnrRecord>& anrs = {}) const;

  NormalizedTimeline Normalize(const session::SessionRecord& session) const;

  // Synthetic event conversions. Exposed for insights and tests.
  static session::SessionEvent NetworkRequestToEvent(const session::NetworkRequest& request);
  static session::SessionEvent CrashToEvent(const session::CrashRecord& crash);
  static session::SessionEvent AnrToEvent(const session::AnrRecord& anr);

  // Path component of an absolute or relative URL ("/" when empty).
  static std::string UrlPathOf(const std::string& url);

  // Effective success flag: explicit value, else statusCode < 400.
  static bool RequestSucceeded(const session::NetworkRequest& request);

 private:
  RageTapConfig rage_config_;
};

}  // namespace rewindreplay::timeline

#endif  // REWIND_TIMELINE_EVENT_NORMALIZER_HPP_
