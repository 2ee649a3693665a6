// Repository: Rewind
// Component: FFmpeg Image Decoder
// Purpose: Decode PNG/JPEG/WebP screenshot stills to RGBA using libavcodec
//          and libswscale.
// Copyright (c) 2025 Rewind

#include "rewind/decode/FFmpegImageDecoder.hpp"

#include <cstring>
#include <memory>

#include "rewind/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace rewindreplay::decode {

namespace {

struct CodecContextDeleter {
  void operator()(AVCodecContext* ctx) const { avcodec_free_context(&ctx); }
};
struct PacketDeleter {
  void operator()(AVPacket* pkt) const { av_packet_free(&pkt); }
};
struct FrameDeleter {
  void operator()(AVFrame* frame) const { av_frame_free(&frame); }
};
struct SwsDeleter {
  void operator()(SwsContext* sws) const { sws_freeContext(sws); }
};

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(ret, errbuf, sizeof(errbuf));
  return std::string(errbuf);
}

frames::DecodeResult Fail(const std::string& message) {
  util::Logger::Warn("[FFmpegImageDecoder] " + message);
  return frames::DecodeResult::Failure(message);
}

AVCodecID CodecFor(ImageFormat format) {
  switch (format) {
    case ImageFormat::kPng:  return AV_CODEC_ID_PNG;
    case ImageFormat::kJpeg: return AV_CODEC_ID_MJPEG;
    case ImageFormat::kWebp: return AV_CODEC_ID_WEBP;
    case ImageFormat::kUnknown: break;
  }
  return AV_CODEC_ID_NONE;
}

}  // namespace

const char* ImageFormatToString(ImageFormat format) {
  switch (format) {
    case ImageFormat::kPng:     return "png";
    case ImageFormat::kJpeg:    return "jpeg";
    case ImageFormat::kWebp:    return "webp";
    case ImageFormat::kUnknown: return "unknown";
  }
  return "unknown";
}

ImageFormat DetectImageFormat(const std::vector<uint8_t>& bytes) {
  static const uint8_t kPngMagic[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
  if (bytes.size() >= 8 && std::memcmp(bytes.data(), kPngMagic, 8) == 0) {
    return ImageFormat::kPng;
  }
  if (bytes.size() >= 3 && bytes[0] == 0xFF && bytes[1] == 0xD8 && bytes[2] == 0xFF) {
    return ImageFormat::kJpeg;
  }
  if (bytes.size() >= 12 && std::memcmp(bytes.data(), "RIFF", 4) == 0 &&
      std::memcmp(bytes.data() + 8, "WEBP", 4) == 0) {
    return ImageFormat::kWebp;
  }
  return ImageFormat::kUnknown;
}

frames::DecodeResult FFmpegImageDecoder::Decode(const std::vector<uint8_t>& bytes) {
  const ImageFormat format = DetectImageFormat(bytes);
  if (format == ImageFormat::kUnknown) {
    return Fail("Unrecognized image signature (" + std::to_string(bytes.size()) + " bytes)");
  }

  const AVCodec* codec = avcodec_find_decoder(CodecFor(format));
  if (codec == nullptr) {
    return Fail(std::string("No decoder for ") + ImageFormatToString(format));
  }

  std::unique_ptr<AVCodecContext, CodecContextDeleter> ctx(avcodec_alloc_context3(codec));
  if (!ctx) return Fail("avcodec_alloc_context3 failed");

  int ret = avcodec_open2(ctx.get(), codec, nullptr);
  if (ret < 0) {
    return Fail("avcodec_open2 failed err=" + AvError(ret));
  }

  std::unique_ptr<AVPacket, PacketDeleter> packet(av_packet_alloc());
  if (!packet) return Fail("av_packet_alloc failed");
  // av_new_packet allocates the input padding libavcodec requires.
  ret = av_new_packet(packet.get(), static_cast<int>(bytes.size()));
  if (ret < 0) {
    return Fail("av_new_packet failed err=" + AvError(ret));
  }
  std::memcpy(packet->data, bytes.data(), bytes.size());

  ret = avcodec_send_packet(ctx.get(), packet.get());
  if (ret < 0) {
    return Fail("avcodec_send_packet failed err=" + AvError(ret));
  }
  // Flush so single-packet decoders release the frame.
  ret = avcodec_send_packet(ctx.get(), nullptr);
  if (ret < 0 && ret != AVERROR_EOF) {
    return Fail("avcodec_send_packet(flush) failed err=" + AvError(ret));
  }

  std::unique_ptr<AVFrame, FrameDeleter> frame(av_frame_alloc());
  if (!frame) return Fail("av_frame_alloc failed");
  ret = avcodec_receive_frame(ctx.get(), frame.get());
  if (ret < 0) {
    return Fail("avcodec_receive_frame failed err=" + AvError(ret));
  }

  const int width = frame->width;
  const int height = frame->height;
  if (width <= 0 || height <= 0) {
    return Fail("Decoded frame has no dimensions");
  }

  std::unique_ptr<SwsContext, SwsDeleter> sws(sws_getContext(
      width, height, static_cast<AVPixelFormat>(frame->format),
      width, height, AV_PIX_FMT_RGBA,
      SWS_BILINEAR, nullptr, nullptr, nullptr));
  if (!sws) {
    return Fail("sws_getContext failed");
  }

  auto image = std::make_shared<frames::FrameImage>();
  image->width = width;
  image->height = height;
  image->rgba.resize(static_cast<size_t>(width) * static_cast<size_t>(height) * 4);

  uint8_t* dst_data[4] = {image->rgba.data(), nullptr, nullptr, nullptr};
  int dst_linesize[4] = {width * 4, 0, 0, 0};
  int rows = sws_scale(sws.get(), frame->data, frame->linesize, 0, height,
                       dst_data, dst_linesize);
  if (rows != height) {
    return Fail("sws_scale converted " + std::to_string(rows) + "/" +
                std::to_string(height) + " rows");
  }

  util::Logger::Debug("[FFmpegImageDecoder] Decoded " + std::string(ImageFormatToString(format)) +
                      " " + std::to_string(width) + "x" + std::to_string(height));
  return frames::DecodeResult::Success(std::move(image));
}

}  // namespace rewindreplay::decode
