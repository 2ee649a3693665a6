// Repository: Rewind
// Component: Frame Index
// Purpose: Sorted screenshot frames with relative offsets and O(log n) lookup.
// Copyright (c) 2025 Rewind

#ifndef REWIND_PLAYBACK_FRAME_INDEX_HPP_
#define REWIND_PLAYBACK_FRAME_INDEX_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::playback {

struct IndexedFrame {
  int64_t timestamp_ms = 0;
  std::string url;
  size_t index = 0;              // Dense 0..N-1 after sorting
  double relative_time_s = 0.0;  // (timestamp - session start) / 1000
};

class FrameIndex {
 public:
  FrameIndex() = default;

  // Stable sort by timestamp; duplicate timestamps keep payload order.
  static FrameIndex Build(const std::vector<session::ScreenshotFrame>& raw,
                          int64_t session_start_ms);

  // Rightmost frame with relative_time_s <= t, or 0 when t precedes every
  // frame (and for an empty index).
  size_t FrameAtOrBefore(double relative_time_s) const;

  const std::vector<IndexedFrame>& frames() const { return frames_; }
  size_t size() const { return frames_.size(); }
  bool empty() const { return frames_.empty(); }

  // nullptr when out of range.
  const IndexedFrame* At(size_t index) const {
    return index < frames_.size() ? &frames_[index] : nullptr;
  }

  std::vector<std::string> Urls() const;

 private:
  std::vector<IndexedFrame> frames_;
};

}  // namespace rewindreplay::playback

#endif  // REWIND_PLAYBACK_FRAME_INDEX_HPP_
