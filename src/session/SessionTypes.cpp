// Repository: Rewind
// Component: Session Types
// Purpose: Property accessors and string helpers for session records.
// Copyright (c) 2025 Rewind

#include "rewind/session/SessionTypes.hpp"

#include <algorithm>
#include <cctype>

namespace rewindreplay::session {

namespace {

const PropertyValue* Find(const PropertyMap& props, const std::string& key) {
  auto it = props.find(key);
  if (it == props.end()) return nullptr;
  return &it->second;
}

}  // namespace

std::optional<double> PropertyAsNumber(const PropertyMap& props, const std::string& key) {
  const PropertyValue* v = Find(props, key);
  if (v == nullptr) return std::nullopt;
  if (const double* d = std::get_if<double>(v)) return *d;
  return std::nullopt;
}

std::optional<std::string> PropertyAsString(const PropertyMap& props, const std::string& key) {
  const PropertyValue* v = Find(props, key);
  if (v == nullptr) return std::nullopt;
  if (const std::string* s = std::get_if<std::string>(v)) return *s;
  return std::nullopt;
}

std::optional<bool> PropertyAsBool(const PropertyMap& props, const std::string& key) {
  const PropertyValue* v = Find(props, key);
  if (v == nullptr) return std::nullopt;
  if (const bool* b = std::get_if<bool>(v)) return *b;
  return std::nullopt;
}

std::string ToLowerAscii(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsIgnoreCase(const std::string& haystack, const std::string& needle) {
  return ToLowerAscii(haystack).find(ToLowerAscii(needle)) != std::string::npos;
}

}  // namespace rewindreplay::session
