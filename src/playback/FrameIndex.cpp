// Repository: Rewind
// Component: Frame Index
// Purpose: Sorted screenshot frames with relative offsets and O(log n) lookup.
// Copyright (c) 2025 Rewind

#include "rewind/playback/FrameIndex.hpp"

#include <algorithm>
#include <cmath>

namespace rewindreplay::playback {

FrameIndex FrameIndex::Build(const std::vector<session::ScreenshotFrame>& raw,
                             int64_t session_start_ms) {
  std::vector<session::ScreenshotFrame> sorted = raw;
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const session::ScreenshotFrame& a, const session::ScreenshotFrame& b) {
                     return a.timestamp_ms < b.timestamp_ms;
                   });

  FrameIndex index;
  index.frames_.reserve(sorted.size());
  for (size_t i = 0; i < sorted.size(); ++i) {
    IndexedFrame f;
    f.timestamp_ms = sorted[i].timestamp_ms;
    f.url = std::move(sorted[i].url);
    f.index = i;
    f.relative_time_s = static_cast<double>(f.timestamp_ms - session_start_ms) / 1000.0;
    index.frames_.push_back(std::move(f));
  }
  return index;
}

size_t FrameIndex::FrameAtOrBefore(double relative_time_s) const {
  if (frames_.empty() || std::isnan(relative_time_s)) return 0;
  auto it = std::upper_bound(frames_.begin(), frames_.end(), relative_time_s,
                             [](double t, const IndexedFrame& f) {
                               return t < f.relative_time_s;
                             });
  if (it == frames_.begin()) return 0;
  return static_cast<size_t>(std::distance(frames_.begin(), it)) - 1;
}

std::vector<std::string> FrameIndex::Urls() const {
  std::vector<std::string> urls;
  urls.reserve(frames_.size());
  for (const auto& f : frames_) urls.push_back(f.url);
  return urls;
}

}  // namespace rewindreplay::playback
