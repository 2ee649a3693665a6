// Repository: Rewind
// Component: Session Ingest
// Purpose: Parse the provider's JSON replay payload into a SessionRecord.
// Copyright (c) 2025 Rewind

#include "rewind/session/SessionIngest.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "session_payload.pb.h"
#include "rewind/util/Logger.hpp"

namespace rewindreplay::session {

namespace {

using google::protobuf::Struct;
using google::protobuf::Value;

int64_t RoundToInt64(double value) {
  if (!std::isfinite(value)) return 0;
  if (value >= 9.2e18) return std::numeric_limits<int64_t>::max();
  if (value <= -9.2e18) return std::numeric_limits<int64_t>::min();
  return static_cast<int64_t>(std::llround(value));
}

int32_t ClampToInt32(double value) {
  if (!std::isfinite(value)) return 0;
  if (value >= static_cast<double>(std::numeric_limits<int32_t>::max())) {
    return std::numeric_limits<int32_t>::max();
  }
  if (value <= static_cast<double>(std::numeric_limits<int32_t>::min())) {
    return std::numeric_limits<int32_t>::min();
  }
  return static_cast<int32_t>(std::lround(value));
}

// Numbers, and strings that hold a complete finite number.
std::optional<double> NumberOf(const Value& v) {
  if (v.kind_case() == Value::kNumberValue) return v.number_value();
  if (v.kind_case() == Value::kStringValue) {
    const std::string& text = v.string_value();
    if (text.empty()) return std::nullopt;
    char* end = nullptr;
    double parsed = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0' || !std::isfinite(parsed)) return std::nullopt;
    return parsed;
  }
  return std::nullopt;
}

std::string StringOf(const Value& v) {
  switch (v.kind_case()) {
    case Value::kStringValue:
      return v.string_value();
    case Value::kNumberValue: {
      double n = v.number_value();
      if (std::isfinite(n) && n == std::floor(n) && std::fabs(n) < 1e15) {
        return std::to_string(static_cast<long long>(n));
      }
      std::ostringstream oss;
      oss << std::setprecision(15) << n;
      return oss.str();
    }
    case Value::kBoolValue:
      return v.bool_value() ? "true" : "false";
    default:
      return std::string();
  }
}

std::optional<bool> BoolOf(const Value& v) {
  if (v.kind_case() == Value::kBoolValue) return v.bool_value();
  if (v.kind_case() == Value::kStringValue) {
    std::string lower = ToLowerAscii(v.string_value());
    if (lower == "true") return true;
    if (lower == "false") return false;
  }
  return std::nullopt;
}

std::optional<double> NumberField(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end()) return std::nullopt;
  if (it->second.kind_case() != Value::kNumberValue) return std::nullopt;
  return it->second.number_value();
}

// Flattens a Struct into dotted keys. Arrays are dropped; touches are
// extracted separately.
void FlattenStruct(const Struct& s, const std::string& prefix, PropertyMap* out) {
  for (const auto& field : s.fields()) {
    const std::string key = prefix.empty() ? field.first : prefix + "." + field.first;
    const Value& v = field.second;
    switch (v.kind_case()) {
      case Value::kNullValue:
        (*out)[key] = std::monostate{};
        break;
      case Value::kNumberValue:
        (*out)[key] = v.number_value();
        break;
      case Value::kStringValue:
        (*out)[key] = v.string_value();
        break;
      case Value::kBoolValue:
        (*out)[key] = v.bool_value();
        break;
      case Value::kStructValue:
        FlattenStruct(v.struct_value(), key, out);
        break;
      case Value::kListValue:
      case Value::KIND_NOT_SET:
        break;
    }
  }
}

// A non-array value means "no touch data". Entries without numeric x/y get 0.
std::optional<std::vector<TouchPoint>> TouchesFromValue(const Value& v) {
  if (v.kind_case() != Value::kListValue) return std::nullopt;
  std::vector<TouchPoint> points;
  points.reserve(static_cast<size_t>(v.list_value().values_size()));
  for (const Value& item : v.list_value().values()) {
    TouchPoint p;
    if (item.kind_case() == Value::kStructValue) {
      const Struct& s = item.struct_value();
      p.x = NumberField(s, "x").value_or(0.0);
      p.y = NumberField(s, "y").value_or(0.0);
      p.force = NumberField(s, "force");
      if (auto ts = NumberField(s, "timestamp")) {
        p.timestamp_ms = RoundToInt64(*ts);
      }
    }
    points.push_back(p);
  }
  return points;
}

SessionEvent EventFromPayload(const proto::SessionEventPayload& e) {
  SessionEvent out;
  out.id = StringOf(e.id());
  out.type = e.type();
  out.name = e.name();
  out.timestamp_ms = RoundToInt64(e.timestamp());
  out.gesture_type = e.gesture_type();
  out.frustration_kind = e.frustration_kind();
  out.target_label = e.target_label();

  // Array or scalar properties carry nothing addressable by key.
  const bool object_properties =
      e.has_properties() && e.properties().kind_case() == Value::kStructValue;
  if (object_properties) {
    FlattenStruct(e.properties().struct_value(), "", &out.properties);
  }

  if (e.has_touches()) {
    out.touches = TouchesFromValue(e.touches());
  } else if (object_properties) {
    const Struct& props = e.properties().struct_value();
    auto it = props.fields().find("touches");
    if (it != props.fields().end()) {
      out.touches = TouchesFromValue(it->second);
    }
  }
  return out;
}

// =============================================================================
// Entry-wise parsing
// =============================================================================

struct ListField {
  const char* json_name;
  const char* proto_name;
};

constexpr ListField kEvents{"events", "events"};
constexpr ListField kNetworkRequests{"networkRequests", "network_requests"};
constexpr ListField kCrashes{"crashes", "crashes"};
constexpr ListField kAnrs{"anrs", "anrs"};
constexpr ListField kScreenshotFrames{"screenshotFrames", "screenshot_frames"};

google::protobuf::util::JsonParseOptions LenientOptions() {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;
  return options;
}

// Removes a list field from the root object. Returns false when the field is
// present with a shape other than array or null.
bool TakeList(Struct* root, const ListField& field, Value* out) {
  for (const char* name : {field.json_name, field.proto_name}) {
    auto it = root->mutable_fields()->find(name);
    if (it == root->mutable_fields()->end()) continue;
    Value taken = it->second;
    root->mutable_fields()->erase(it);
    if (taken.kind_case() == Value::kListValue) {
      *out = std::move(taken);
    } else if (taken.kind_case() != Value::kNullValue) {
      return false;
    }
  }
  return true;
}

template <typename Entry>
size_t ParseEntries(const Value& list, const ListField& field,
                    google::protobuf::RepeatedPtrField<Entry>* out) {
  if (list.kind_case() != Value::kListValue) return 0;
  const auto options = LenientOptions();
  size_t dropped = 0;
  int position = 0;
  for (const Value& item : list.list_value().values()) {
    std::string entry_json;
    Entry entry;
    bool ok = item.kind_case() == Value::kStructValue &&
              google::protobuf::util::MessageToJsonString(item, &entry_json).ok();
    std::string reason = "not an object";
    if (ok) {
      auto status = google::protobuf::util::JsonStringToMessage(entry_json, &entry, options);
      ok = status.ok();
      if (!ok) reason = status.ToString();
    }
    if (ok) {
      *out->Add() = std::move(entry);
    } else {
      ++dropped;
      util::Logger::Warn("[SessionIngest] Skipping " + std::string(field.json_name) + "[" +
                         std::to_string(position) + "]: " + reason);
    }
    ++position;
  }
  return dropped;
}

}  // namespace

SessionRecord SessionFromPayload(const proto::SessionPayload& payload) {
  SessionRecord record;
  record.id = StringOf(payload.id());
  record.platform = payload.platform();
  record.start_time_ms = RoundToInt64(payload.start_time());
  if (payload.has_end_time()) record.end_time_ms = RoundToInt64(payload.end_time());
  if (payload.has_background_time()) record.background_time_s = payload.background_time();
  if (payload.has_playable_duration()) record.playable_duration_s = payload.playable_duration();

  record.events.reserve(static_cast<size_t>(payload.events_size()));
  for (const auto& e : payload.events()) {
    record.events.push_back(EventFromPayload(e));
  }

  for (const auto& n : payload.network_requests()) {
    NetworkRequest req;
    req.timestamp_ms = RoundToInt64(n.timestamp());
    req.method = n.method();
    req.url = n.url();
    req.url_path = n.url_path();
    req.status_code = ClampToInt32(NumberOf(n.status_code()).value_or(0.0));
    req.duration_ms = NumberOf(n.duration()).value_or(0.0);
    req.success = BoolOf(n.success());
    if (auto size = NumberOf(n.request_body_size())) req.request_body_size = RoundToInt64(*size);
    if (auto size = NumberOf(n.response_body_size())) req.response_body_size = RoundToInt64(*size);
    record.network_requests.push_back(std::move(req));
  }

  for (const auto& c : payload.crashes()) {
    CrashRecord crash;
    crash.id = StringOf(c.id());
    crash.timestamp_ms = RoundToInt64(c.timestamp());
    crash.exception_name = c.exception_name();
    crash.reason = c.reason();
    crash.status = c.status();
    record.crashes.push_back(std::move(crash));
  }

  for (const auto& a : payload.anrs()) {
    AnrRecord anr;
    anr.id = StringOf(a.id());
    anr.timestamp_ms = RoundToInt64(a.timestamp());
    if (auto ms = NumberOf(a.duration_ms())) anr.duration_ms = RoundToInt64(*ms);
    anr.thread_state = a.thread_state();
    record.anrs.push_back(std::move(anr));
  }

  for (const auto& f : payload.screenshot_frames()) {
    ScreenshotFrame frame;
    frame.timestamp_ms = RoundToInt64(f.timestamp());
    frame.url = f.url();
    frame.index = RoundToInt64(NumberOf(f.index()).value_or(0.0));
    record.screenshot_frames.push_back(std::move(frame));
  }

  if (payload.has_device_info()) {
    const auto& d = payload.device_info();
    record.device_info.screen_width = ClampToInt32(NumberOf(d.screen_width()).value_or(0.0));
    record.device_info.screen_height = ClampToInt32(NumberOf(d.screen_height()).value_or(0.0));
    record.device_info.model = d.model();
    record.device_info.system_name = d.system_name().empty() ? d.os() : d.system_name();
  }
  if (payload.has_stats()) {
    record.stats.duration = StringOf(payload.stats().duration());
  }
  return record;
}

IngestResult ParseSessionJson(const std::string& json) {
  if (json.empty()) {
    return IngestResult::Failure("empty payload");
  }

  const auto options = LenientOptions();
  Struct root;
  auto status = google::protobuf::util::JsonStringToMessage(json, &root, options);
  if (!status.ok()) {
    util::Logger::Error("[SessionIngest] Payload rejected: " + status.ToString());
    return IngestResult::Failure(status.ToString());
  }

  Value events, network_requests, crashes, anrs, frames;
  for (auto [field, out] : {std::make_pair(&kEvents, &events),
                            std::make_pair(&kNetworkRequests, &network_requests),
                            std::make_pair(&kCrashes, &crashes),
                            std::make_pair(&kAnrs, &anrs),
                            std::make_pair(&kScreenshotFrames, &frames)}) {
    if (!TakeList(&root, *field, out)) {
      std::string message = std::string(field->json_name) + " is not an array";
      util::Logger::Error("[SessionIngest] Payload rejected: " + message);
      return IngestResult::Failure(message);
    }
  }

  // Session-level fields, with the lists removed.
  proto::SessionPayload payload;
  std::string head_json;
  status = google::protobuf::util::MessageToJsonString(root, &head_json);
  if (status.ok()) {
    status = google::protobuf::util::JsonStringToMessage(head_json, &payload, options);
  }
  if (!status.ok()) {
    util::Logger::Error("[SessionIngest] Payload rejected: " + status.ToString());
    return IngestResult::Failure(status.ToString());
  }

  size_t dropped = 0;
  dropped += ParseEntries(events, kEvents, payload.mutable_events());
  dropped += ParseEntries(network_requests, kNetworkRequests, payload.mutable_network_requests());
  dropped += ParseEntries(crashes, kCrashes, payload.mutable_crashes());
  dropped += ParseEntries(anrs, kAnrs, payload.mutable_anrs());
  dropped += ParseEntries(frames, kScreenshotFrames, payload.mutable_screenshot_frames());

  SessionRecord record = SessionFromPayload(payload);
  if (util::Logger::DebugEnabled()) {
    util::Logger::Debug("[SessionIngest] Parsed session id=" + record.id +
                        " events=" + std::to_string(record.events.size()) +
                        " network=" + std::to_string(record.network_requests.size()) +
                        " frames=" + std::to_string(record.screenshot_frames.size()) +
                        " dropped=" + std::to_string(dropped));
  }
  IngestResult result = IngestResult::Success(std::move(record));
  result.dropped_entries = dropped;
  return result;
}

IngestResult LoadSessionFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    util::Logger::Error("[SessionIngest] Cannot open " + path);
    return IngestResult::Failure("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseSessionJson(buffer.str());
}

}  // namespace rewindreplay::session
