// Repository: Rewind
// Component: Event Normalizer
// Purpose: Merge raw events, network requests, crashes and ANRs into one
//          timestamp-ordered replay timeline.
// Copyright (c) 2025 Rewind

#include "rewind/timeline/EventNormalizer.hpp"

#include <algorithm>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rewindreplay::timeline {

using session::SessionEvent;

EventNormalizer::EventNormalizer(RageTapConfig rage_config)
    : rage_config_(rage_config) {}

std::string EventNormalizer::UrlPathOf(const std::string& url) {
  size_t start = 0;
  size_t scheme = url.find("://");
  if (scheme != std::string::npos) {
    size_t slash = url.find('/', scheme + 3);
    if (slash == std::string::npos) return "/";
    start = slash;
  }
  size_t end = url.find_first_of("?#", start);
  std::string path = url.substr(start, end == std::string::npos ? std::string::npos : end - start);
  if (path.empty()) return "/";
  if (path.front() != '/') path.insert(path.begin(), '/');
  return path;
}

bool EventNormalizer::RequestSucceeded(const session::NetworkRequest& request) {
  if (request.success.has_value()) return *request.success;
  return request.status_code < 400;
}

SessionEvent EventNormalizer::NetworkRequestToEvent(const session::NetworkRequest& request) {
  SessionEvent e;
  e.type = "network_request";
  e.name = request.method.empty() ? "GET" : request.method;
  e.timestamp_ms = request.timestamp_ms;
  e.properties["url"] = request.url;
  e.properties["urlPath"] = request.url_path.empty() ? UrlPathOf(request.url) : request.url_path;
  e.properties["statusCode"] = static_cast<double>(request.status_code);
  e.properties["success"] = RequestSucceeded(request);
  e.properties["duration"] = request.duration_ms;
  if (request.request_body_size) {
    e.properties["requestBodySize"] = static_cast<double>(*request.request_body_size);
  }
  if (request.response_body_size) {
    e.properties["responseBodySize"] = static_cast<double>(*request.response_body_size);
  }
  return e;
}

SessionEvent EventNormalizer::CrashToEvent(const session::CrashRecord& crash) {
  SessionEvent e;
  e.id = crash.id;
  e.type = "crash";
  e.name = crash.exception_name.empty() ? "Crash" : crash.exception_name;
  e.timestamp_ms = crash.timestamp_ms;
  e.properties["exceptionName"] = crash.exception_name;
  e.properties["reason"] = crash.reason;
  e.properties["crashId"] = crash.id;
  return e;
}

SessionEvent EventNormalizer::AnrToEvent(const session::AnrRecord& anr) {
  SessionEvent e;
  e.id = anr.id;
  e.type = "anr";
  e.name = "ANR";
  e.timestamp_ms = anr.timestamp_ms;
  if (anr.duration_ms) {
    e.properties["durationMs"] = static_cast<double>(*anr.duration_ms);
  }
  e.properties["threadState"] = anr.thread_state;
  return e;
}

NormalizedTimeline EventNormalizer::Normalize(
    const std::vector<SessionEvent>& events,
    const std::vector<session::NetworkRequest>& network_requests,
    const std::vector<session::CrashRecord>& crashes,
    const std::vector<session::AnrRecord>& anrs) const {
  NormalizedTimeline out;
  out.events.reserve(events.size() + network_requests.size() + crashes.size() + anrs.size());
  out.events.insert(out.events.end(), events.begin(), events.end());

  for (const auto& req : network_requests) {
    if (req.timestamp_ms <= 0 || (req.url.empty() && req.url_path.empty())) {
      ++out.dropped_network_requests;
      continue;
    }
    out.events.push_back(NetworkRequestToEvent(req));
  }
  for (const auto& crash : crashes) {
    out.events.push_back(CrashToEvent(crash));
  }
  for (const auto& anr : anrs) {
    out.events.push_back(AnrToEvent(anr));
  }

  out.rage_taps = DetectRageTaps(events, rage_config_);
  out.events.insert(out.events.end(), out.rage_taps.begin(), out.rage_taps.end());

  std::stable_sort(out.events.begin(), out.events.end(),
                   [](const SessionEvent& a, const SessionEvent& b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });

  if (out.dropped_network_requests > 0) {
    util::Logger::Debug("[EventNormalizer] Dropped " +
                        std::to_string(out.dropped_network_requests) +
                        " network requests without timestamp or URL");
  }
  return out;
}

NormalizedTimeline EventNormalizer::Normalize(const session::SessionRecord& session) const {
  return Normalize(session.events, session.network_requests, session.crashes, session.anrs);
}

}  // namespace rewindreplay::timeline
