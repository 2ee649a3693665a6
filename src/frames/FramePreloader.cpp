// Repository: Rewind
// Component: Frame Preloader
// Purpose: Best-effort background fetch and decode of screenshot frames
// Copyright (c) 2025 Rewind

#include "rewind/frames/FramePreloader.hpp"

#include <chrono>
#include <set>
#include <stdexcept>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rewindreplay::frames {

namespace {

int64_t MicrosSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(
      std::chrono::steady_clock::now() - start).count();
}

}  // namespace

FramePreloader::FramePreloader(std::shared_ptr<IFrameFetcher> fetcher,
                               std::shared_ptr<IFrameDecoder> decoder,
                               std::shared_ptr<FrameImageCache> cache,
                               PreloadConfig config)
    : fetcher_(std::move(fetcher)),
      decoder_(std::move(decoder)),
      cache_(std::move(cache)),
      config_(config) {
  if (!fetcher_ || !decoder_ || !cache_) {
    throw std::invalid_argument("FramePreloader requires a fetcher, decoder and cache");
  }
}

FramePreloader::~FramePreloader() {
  Cancel();
}

void FramePreloader::JoinThread() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void FramePreloader::StartPreload(const std::vector<std::string>& urls) {
  Cancel();

  // Split into eager and background batches, skipping duplicates and empties.
  std::vector<std::string> eager;
  std::vector<std::string> background;
  std::set<std::string> seen;
  for (const auto& url : urls) {
    if (url.empty() || !seen.insert(url).second) continue;
    if (eager.size() < config_.eager_count) {
      eager.push_back(url);
    } else if (background.size() < config_.background_cap) {
      background.push_back(url);
    } else {
      break;
    }
  }

  cancel_requested_.store(false, std::memory_order_release);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_ = PreloadStats{};
    stats_.requested = eager.size() + background.size();
  }

  thread_ = std::thread(&FramePreloader::PreloadWorker, this,
                        std::move(eager), std::move(background));
}

void FramePreloader::Cancel() {
  cancel_requested_.store(true, std::memory_order_release);
  JoinThread();
}

void FramePreloader::WaitForCompletion() {
  JoinThread();
}

PreloadStats FramePreloader::Stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

void FramePreloader::LoadOne(const std::string& url) {
  if (cache_->Contains(url)) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.already_cached;
    return;
  }

  FetchResult fetched = fetcher_->Fetch(url);
  if (!fetched.ok) {
    util::Logger::Warn("[FramePreloader] Fetch failed url=" + url + " err=" + fetched.error);
    cache_->MarkFailed(url);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.failed;
    return;
  }

  DecodeResult decoded = decoder_->Decode(fetched.bytes);
  if (!decoded.ok || !decoded.image) {
    util::Logger::Warn("[FramePreloader] Decode failed url=" + url + " err=" + decoded.error);
    cache_->MarkFailed(url);
    std::lock_guard<std::mutex> lock(mutex_);
    ++stats_.failed;
    return;
  }

  cache_->Put(url, std::move(decoded.image));
  std::lock_guard<std::mutex> lock(mutex_);
  ++stats_.loaded;
}

bool FramePreloader::LoadBatch(const std::vector<std::string>& urls) {
  for (const auto& url : urls) {
    if (cancel_requested_.load(std::memory_order_acquire)) {
      return false;
    }
    LoadOne(url);
  }
  return !cancel_requested_.load(std::memory_order_acquire);
}

// =============================================================================
// PreloadWorker: runs on background thread
// Eager batch first so the opening seconds of the replay draw immediately,
// then the capped background batch. Checks cancel_requested_ between loads.
// =============================================================================

void FramePreloader::PreloadWorker(std::vector<std::string> eager,
                                   std::vector<std::string> background) {
  auto start = std::chrono::steady_clock::now();

  if (!LoadBatch(eager)) return;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.eager_complete = true;
    stats_.eager_us = MicrosSince(start);
  }

  if (!LoadBatch(background)) return;

  PreloadStats snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.complete = true;
    stats_.total_us = MicrosSince(start);
    snapshot = stats_;
  }

  util::Logger::Info("[FramePreloader] Preload complete: requested=" +
                     std::to_string(snapshot.requested) +
                     " loaded=" + std::to_string(snapshot.loaded) +
                     " failed=" + std::to_string(snapshot.failed) +
                     " cached=" + std::to_string(snapshot.already_cached) +
                     " eager_us=" + std::to_string(snapshot.eager_us) +
                     " total_us=" + std::to_string(snapshot.total_us));
}

}  // namespace rewindreplay::frames
