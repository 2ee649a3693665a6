// Repository: Rewind
// Component: Frame Preloader Contract Tests
// Purpose: Verify batch ordering, caps, failure handling and cancellation
// Copyright (c) 2025 Rewind

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "rewind/frames/FramePreloader.hpp"

#include "FakeFrameSources.h"

namespace rewindreplay::frames::testing {
namespace {

using rewindreplay::tests::fixtures::FakeFrameDecoder;
using rewindreplay::tests::fixtures::FakeFrameFetcher;
using rewindreplay::tests::fixtures::MakeImage;

std::vector<std::string> Urls(int count) {
  std::vector<std::string> urls;
  for (int i = 0; i < count; ++i) urls.push_back("frame-" + std::to_string(i));
  return urls;
}

class FramePreloadTest : public ::testing::Test {
 protected:
  void SetUp() override {
    fetcher_ = std::make_shared<FakeFrameFetcher>();
    decoder_ = std::make_shared<FakeFrameDecoder>();
    cache_ = std::make_shared<FrameImageCache>();
  }

  void ServeAll(const std::vector<std::string>& urls) {
    for (size_t i = 0; i < urls.size(); ++i) {
      fetcher_->Serve(urls[i], {static_cast<uint8_t>(i % 256)});
    }
  }

  std::unique_ptr<FramePreloader> MakePreloader(PreloadConfig config = PreloadConfig{}) {
    return std::make_unique<FramePreloader>(fetcher_, decoder_, cache_, config);
  }

  std::shared_ptr<FakeFrameFetcher> fetcher_;
  std::shared_ptr<FakeFrameDecoder> decoder_;
  std::shared_ptr<FrameImageCache> cache_;
};

// =============================================================================
// A. CONSTRUCTION
// =============================================================================

TEST_F(FramePreloadTest, NullCollaboratorsThrow) {
  EXPECT_THROW(FramePreloader(nullptr, decoder_, cache_), std::invalid_argument);
  EXPECT_THROW(FramePreloader(fetcher_, nullptr, cache_), std::invalid_argument);
  EXPECT_THROW(FramePreloader(fetcher_, decoder_, nullptr), std::invalid_argument);
}

// =============================================================================
// B. ORDERING AND CAPS
// =============================================================================

TEST_F(FramePreloadTest, EagerBatchLoadsFirstInFrameOrder) {
  auto urls = Urls(30);
  ServeAll(urls);
  PreloadConfig config;
  config.eager_count = 5;
  auto preloader = MakePreloader(config);

  preloader->StartPreload(urls);
  preloader->WaitForCompletion();

  auto calls = fetcher_->calls();
  ASSERT_EQ(calls.size(), 30u);
  for (size_t i = 0; i < calls.size(); ++i) {
    EXPECT_EQ(calls[i], urls[i]);
  }
  PreloadStats stats = preloader->Stats();
  EXPECT_TRUE(stats.eager_complete);
  EXPECT_TRUE(stats.complete);
  EXPECT_EQ(stats.loaded, 30u);
  EXPECT_EQ(cache_->Size(), 30u);
  EXPECT_EQ(static_cast<int>(cache_->Get("frame-3")->rgba[0]), 3);
}

TEST_F(FramePreloadTest, BackgroundBatchIsCapped) {
  auto urls = Urls(50);
  ServeAll(urls);
  PreloadConfig config;
  config.eager_count = 10;
  config.background_cap = 15;
  auto preloader = MakePreloader(config);

  preloader->StartPreload(urls);
  preloader->WaitForCompletion();

  PreloadStats stats = preloader->Stats();
  EXPECT_EQ(stats.requested, 25u);
  EXPECT_EQ(stats.loaded, 25u);
  EXPECT_TRUE(cache_->Contains("frame-24"));
  EXPECT_FALSE(cache_->Contains("frame-25"));
}

TEST_F(FramePreloadTest, DuplicateAndEmptyUrlsLoadOnce) {
  std::vector<std::string> urls = {"a", "b", "a", "", "c", "b"};
  ServeAll({"a", "b", "c"});
  auto preloader = MakePreloader();

  preloader->StartPreload(urls);
  preloader->WaitForCompletion();

  EXPECT_EQ(fetcher_->calls(), (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(preloader->Stats().requested, 3u);
}

TEST_F(FramePreloadTest, AlreadyCachedUrlsAreNotFetched) {
  ServeAll({"a", "b"});
  cache_->Put("a", MakeImage(99));
  auto preloader = MakePreloader();

  preloader->StartPreload({"a", "b"});
  preloader->WaitForCompletion();

  EXPECT_EQ(fetcher_->calls(), (std::vector<std::string>{"b"}));
  PreloadStats stats = preloader->Stats();
  EXPECT_EQ(stats.already_cached, 1u);
  EXPECT_EQ(stats.loaded, 1u);
  EXPECT_EQ(static_cast<int>(cache_->Get("a")->rgba[0]), 99);
}

// =============================================================================
// C. FAILURES
// =============================================================================

TEST_F(FramePreloadTest, FailedFetchOrDecodeIsMarkedAndSkipped) {
  fetcher_->Serve("ok", {1});
  fetcher_->Serve("empty", {});
  fetcher_->Fail("broken");
  auto preloader = MakePreloader();

  preloader->StartPreload({"broken", "empty", "missing", "ok"});
  preloader->WaitForCompletion();

  PreloadStats stats = preloader->Stats();
  EXPECT_EQ(stats.failed, 3u);
  EXPECT_EQ(stats.loaded, 1u);
  EXPECT_TRUE(stats.complete);
  EXPECT_TRUE(cache_->HasFailed("broken"));
  EXPECT_TRUE(cache_->HasFailed("empty"));
  EXPECT_TRUE(cache_->HasFailed("missing"));
  EXPECT_TRUE(cache_->Contains("ok"));
}

// =============================================================================
// D. CANCELLATION
// =============================================================================

TEST_F(FramePreloadTest, CancelStopsBetweenLoads) {
  auto urls = Urls(50);
  ServeAll(urls);
  fetcher_->SetDelay(std::chrono::milliseconds(20));
  auto preloader = MakePreloader();

  preloader->StartPreload(urls);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  preloader->Cancel();

  PreloadStats stats = preloader->Stats();
  EXPECT_FALSE(stats.complete);
  EXPECT_LT(fetcher_->calls().size(), urls.size());
  // Repeated cancel is harmless.
  preloader->Cancel();
}

TEST_F(FramePreloadTest, DestructionDuringPreloadJoinsCleanly) {
  auto urls = Urls(40);
  ServeAll(urls);
  fetcher_->SetDelay(std::chrono::milliseconds(10));

  {
    auto preloader = MakePreloader();
    preloader->StartPreload(urls);
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
  }

  const size_t calls_after_destroy = fetcher_->calls().size();
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(fetcher_->calls().size(), calls_after_destroy);
}

TEST_F(FramePreloadTest, RestartReplacesRunningPreload) {
  auto first = Urls(40);
  ServeAll(first);
  ServeAll({"x", "y"});
  fetcher_->SetDelay(std::chrono::milliseconds(5));
  auto preloader = MakePreloader();

  preloader->StartPreload(first);
  preloader->StartPreload({"x", "y"});
  preloader->WaitForCompletion();

  PreloadStats stats = preloader->Stats();
  EXPECT_EQ(stats.requested, 2u);
  EXPECT_TRUE(stats.complete);
  EXPECT_TRUE(cache_->Contains("x"));
  EXPECT_TRUE(cache_->Contains("y"));
}

}  // namespace
}  // namespace rewindreplay::frames::testing
