// Repository: Rewind
// Component: FFmpeg Image Decoder
// Purpose: Decode PNG/JPEG/WebP screenshot stills to RGBA using libavcodec
//          and libswscale.
// Copyright (c) 2025 Rewind

#ifndef REWIND_DECODE_FFMPEG_IMAGE_DECODER_HPP_
#define REWIND_DECODE_FFMPEG_IMAGE_DECODER_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "rewind/frames/FrameImage.hpp"

namespace rewindreplay::decode {

enum class ImageFormat {
  kUnknown = 0,
  kPng,
  kJpeg,
  kWebp,
};

const char* ImageFormatToString(ImageFormat format);

// Signature sniffing on the first bytes of the payload.
ImageFormat DetectImageFormat(const std::vector<uint8_t>& bytes);

// FFmpegImageDecoder decodes a single still image per call.
//
// Each Decode() opens a fresh codec context, sends one packet, drains one
// frame and converts it to packed RGBA. No state is kept between calls, so
// one instance may serve the preloader worker while another thread decodes.
//
// Error Handling:
// - Returns DecodeResult::Failure with an av_strerror message; never throws.
class FFmpegImageDecoder : public frames::IFrameDecoder {
 public:
  FFmpegImageDecoder() = default;

  frames::DecodeResult Decode(const std::vector<uint8_t>& bytes) override;
};

}  // namespace rewindreplay::decode

#endif  // REWIND_DECODE_FFMPEG_IMAGE_DECODER_HPP_
