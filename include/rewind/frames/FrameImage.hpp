// Repository: Rewind
// Component: Frame Image Types
// Purpose: Decoded screenshot image and the fetch/decode collaborator seams.
// Copyright (c) 2025 Rewind

#ifndef REWIND_FRAMES_FRAME_IMAGE_HPP_
#define REWIND_FRAMES_FRAME_IMAGE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace rewindreplay::frames {

// Tightly packed RGBA8, row-major, width * height * 4 bytes.
struct FrameImage {
  int width = 0;
  int height = 0;
  std::vector<uint8_t> rgba;
};

struct FetchResult {
  bool ok = false;
  std::vector<uint8_t> bytes;
  std::string error;

  static FetchResult Success(std::vector<uint8_t> data) {
    FetchResult r;
    r.ok = true;
    r.bytes = std::move(data);
    return r;
  }
  static FetchResult Failure(std::string message) {
    FetchResult r;
    r.error = std::move(message);
    return r;
  }
};

struct DecodeResult {
  bool ok = false;
  std::shared_ptr<const FrameImage> image;
  std::string error;

  static DecodeResult Success(std::shared_ptr<const FrameImage> img) {
    DecodeResult r;
    r.ok = true;
    r.image = std::move(img);
    return r;
  }
  static DecodeResult Failure(std::string message) {
    DecodeResult r;
    r.error = std::move(message);
    return r;
  }
};

// Resolves a frame URL to encoded image bytes. Called from the preloader
// worker thread; implementations must be safe to call off the clock thread.
class IFrameFetcher {
 public:
  virtual ~IFrameFetcher() = default;
  virtual FetchResult Fetch(const std::string& url) = 0;
};

// Decodes encoded still-image bytes. Called from the preloader worker thread.
class IFrameDecoder {
 public:
  virtual ~IFrameDecoder() = default;
  virtual DecodeResult Decode(const std::vector<uint8_t>& bytes) = 0;
};

}  // namespace rewindreplay::frames

#endif  // REWIND_FRAMES_FRAME_IMAGE_HPP_
