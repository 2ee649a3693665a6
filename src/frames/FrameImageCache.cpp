// Repository: Rewind
// Component: Frame Image Cache
// Purpose: URL-keyed store of decoded screenshots, filled off-thread.
// Copyright (c) 2025 Rewind

#include "rewind/frames/FrameImageCache.hpp"

namespace rewindreplay::frames {

void FrameImageCache::Put(const std::string& url, std::shared_ptr<const FrameImage> image) {
  if (!image) return;
  std::lock_guard<std::mutex> lock(mutex_);
  images_[url] = std::move(image);
  failed_.erase(url);
}

std::shared_ptr<const FrameImage> FrameImageCache::Get(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = images_.find(url);
  return it == images_.end() ? nullptr : it->second;
}

bool FrameImageCache::Contains(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return images_.count(url) > 0;
}

void FrameImageCache::MarkFailed(const std::string& url) {
  std::lock_guard<std::mutex> lock(mutex_);
  failed_.insert(url);
}

bool FrameImageCache::HasFailed(const std::string& url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_.count(url) > 0;
}

size_t FrameImageCache::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return images_.size();
}

size_t FrameImageCache::FailedCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_.size();
}

void FrameImageCache::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  images_.clear();
  failed_.clear();
}

}  // namespace rewindreplay::frames
