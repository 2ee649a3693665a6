// Repository: Rewind
// Component: Frame Image Cache
// Purpose: URL-keyed store of decoded screenshots, filled off-thread.
// Copyright (c) 2025 Rewind

#ifndef REWIND_FRAMES_FRAME_IMAGE_CACHE_HPP_
#define REWIND_FRAMES_FRAME_IMAGE_CACHE_HPP_

#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

#include "rewind/frames/FrameImage.hpp"

namespace rewindreplay::frames {

// Thread safety: every method takes mutex_. The preloader worker writes,
// the clock thread reads during the draw step.
class FrameImageCache {
 public:
  FrameImageCache() = default;

  FrameImageCache(const FrameImageCache&) = delete;
  FrameImageCache& operator=(const FrameImageCache&) = delete;

  void Put(const std::string& url, std::shared_ptr<const FrameImage> image);

  // nullptr when not cached.
  std::shared_ptr<const FrameImage> Get(const std::string& url) const;
  bool Contains(const std::string& url) const;

  // Records a URL that could not be fetched or decoded.
  void MarkFailed(const std::string& url);
  bool HasFailed(const std::string& url) const;

  size_t Size() const;
  size_t FailedCount() const;
  void Clear();

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<const FrameImage>> images_;
  std::set<std::string> failed_;
};

}  // namespace rewindreplay::frames

#endif  // REWIND_FRAMES_FRAME_IMAGE_CACHE_HPP_
