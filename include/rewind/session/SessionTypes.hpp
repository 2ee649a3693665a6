// Repository: Rewind
// Component: Session Types
// Purpose: Immutable in-memory session record shared by every replay module.
// Copyright (c) 2025 Rewind

#ifndef REWIND_SESSION_SESSION_TYPES_HPP_
#define REWIND_SESSION_SESSION_TYPES_HPP_

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rewindreplay::session {

// =============================================================================
// Property values
// Dynamic event properties are normalized at ingest into a fixed variant.
// Nested objects are flattened into dotted keys ("velocity.x"); arrays are
// dropped.
// =============================================================================

using PropertyValue = std::variant<std::monostate, bool, double, std::string>;
using PropertyMap = std::map<std::string, PropertyValue>;

std::optional<double> PropertyAsNumber(const PropertyMap& props, const std::string& key);
std::optional<std::string> PropertyAsString(const PropertyMap& props, const std::string& key);
std::optional<bool> PropertyAsBool(const PropertyMap& props, const std::string& key);

// =============================================================================
// Event stream
// =============================================================================

struct TouchPoint {
  double x = 0.0;
  double y = 0.0;
  std::optional<double> force;
  std::optional<int64_t> timestamp_ms;
};

// Absolute device-clock timestamps (epoch ms) throughout.
// Empty strings mean "absent".
struct SessionEvent {
  std::string id;
  std::string type;
  std::string name;
  int64_t timestamp_ms = 0;
  PropertyMap properties;
  std::string gesture_type;
  std::string frustration_kind;
  std::string target_label;

  // std::nullopt = no touch data (distinct from an empty list).
  std::optional<std::vector<TouchPoint>> touches;

  bool HasTouches() const { return touches.has_value() && !touches->empty(); }
};

struct NetworkRequest {
  int64_t timestamp_ms = 0;
  std::string method;
  std::string url;
  std::string url_path;
  int32_t status_code = 0;
  double duration_ms = 0.0;
  std::optional<bool> success;
  std::optional<int64_t> request_body_size;
  std::optional<int64_t> response_body_size;
};

struct CrashRecord {
  std::string id;
  int64_t timestamp_ms = 0;
  std::string exception_name;
  std::string reason;
  std::string status;
};

struct AnrRecord {
  std::string id;
  int64_t timestamp_ms = 0;
  std::optional<int64_t> duration_ms;
  std::string thread_state;
};

struct ScreenshotFrame {
  int64_t timestamp_ms = 0;
  std::string url;
  int64_t index = 0;
};

struct DeviceInfo {
  int32_t screen_width = 0;
  int32_t screen_height = 0;
  std::string model;
  std::string system_name;
};

struct SessionStats {
  std::string duration;  // Seconds, as reported by the provider
};

// =============================================================================
// SessionRecord
// Produced once by Session Ingest; never mutated afterwards.
// =============================================================================

struct SessionRecord {
  std::string id;
  std::string platform;
  int64_t start_time_ms = 0;  // 0 = unknown
  std::optional<int64_t> end_time_ms;
  std::optional<double> background_time_s;
  std::optional<double> playable_duration_s;

  std::vector<SessionEvent> events;
  std::vector<NetworkRequest> network_requests;
  std::vector<CrashRecord> crashes;
  std::vector<AnrRecord> anrs;
  std::vector<ScreenshotFrame> screenshot_frames;

  DeviceInfo device_info;
  SessionStats stats;
};

// Case-insensitive helpers used by classifiers.
std::string ToLowerAscii(const std::string& s);
bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle);

}  // namespace rewindreplay::session

#endif  // REWIND_SESSION_SESSION_TYPES_HPP_
