// Repository: Rewind
// Component: Frame Preloader
// Purpose: Best-effort background fetch and decode of screenshot frames
// Copyright (c) 2025 Rewind
//
// Preloading is advisory. If a frame is not cached when the draw step needs
// it, the previous drawable frame stays on screen. Preloading never blocks
// or alters the playback clock.

#ifndef REWIND_FRAMES_FRAME_PRELOADER_HPP_
#define REWIND_FRAMES_FRAME_PRELOADER_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "rewind/frames/FrameImage.hpp"
#include "rewind/frames/FrameImageCache.hpp"

namespace rewindreplay::frames {

struct PreloadConfig {
  size_t eager_count = 20;      // Loaded first, in frame order
  size_t background_cap = 200;  // Frames loaded after the eager batch
};

struct PreloadStats {
  size_t requested = 0;       // eager + background URLs scheduled
  size_t loaded = 0;
  size_t failed = 0;
  size_t already_cached = 0;
  bool eager_complete = false;
  bool complete = false;
  int64_t eager_us = 0;       // Wall time for the eager batch
  int64_t total_us = 0;
};

// =============================================================================
// FramePreloader
// Runs a background thread that fetches and decodes frame URLs into the
// shared FrameImageCache: the eager batch first, then the background batch.
//
// Thread safety:
// - StartPreload / Cancel / WaitForCompletion / Stats: owner thread
// - PreloadWorker runs on its own thread and writes stats_ under mutex_
// - cancel_requested_ is atomic for cross-thread signaling
//
// Lifecycle:
// - StartPreload() cancels any in-progress preload before starting a new one
// - Cancel() joins the thread (blocks until the current load returns)
// - Destructor calls Cancel()
// =============================================================================

class FramePreloader {
 public:
  FramePreloader(std::shared_ptr<IFrameFetcher> fetcher,
                 std::shared_ptr<IFrameDecoder> decoder,
                 std::shared_ptr<FrameImageCache> cache,
                 PreloadConfig config = PreloadConfig{});
  ~FramePreloader();

  FramePreloader(const FramePreloader&) = delete;
  FramePreloader& operator=(const FramePreloader&) = delete;

  // urls are in frame order. Duplicates are loaded once.
  void StartPreload(const std::vector<std::string>& urls);

  // Safe to call repeatedly or with no preload running.
  void Cancel();

  // Blocks until the worker finishes on its own.
  void WaitForCompletion();

  PreloadStats Stats() const;

 private:
  void PreloadWorker(std::vector<std::string> eager, std::vector<std::string> background);

  // Returns false when cancelled mid-batch.
  bool LoadBatch(const std::vector<std::string>& urls);
  void LoadOne(const std::string& url);

  void JoinThread();

  std::shared_ptr<IFrameFetcher> fetcher_;
  std::shared_ptr<IFrameDecoder> decoder_;
  std::shared_ptr<FrameImageCache> cache_;
  PreloadConfig config_;

  std::thread thread_;
  mutable std::mutex mutex_;
  std::atomic<bool> cancel_requested_{false};
  PreloadStats stats_;  // Guarded by mutex_
};

}  // namespace rewindreplay::frames

#endif  // REWIND_FRAMES_FRAME_PRELOADER_HPP_
