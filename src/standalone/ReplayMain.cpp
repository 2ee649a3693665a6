// Repository: Rewind
// Component: Standalone Replay Harness
// Purpose: Load a session payload, print its derived replay data, and
//          optionally load frame images and run headless playback for
//          diagnostics
// Copyright (c) 2025 Rewind
//
// This binary is for testing and diagnostics only. It renders nothing; the
// observer prints frame changes and overlay counts instead.

#include <algorithm>
#include <atomic>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#ifdef REWIND_FFMPEG_AVAILABLE
#include "rewind/decode/FFmpegImageDecoder.hpp"
#endif
#include "rewind/frames/FileFrameFetcher.hpp"
#include "rewind/frames/FrameImageCache.hpp"
#include "rewind/frames/FramePreloader.hpp"
#include "rewind/playback/ReplayController.hpp"
#include "rewind/runtime/ReplayConfig.hpp"
#include "rewind/session/SessionIngest.hpp"
#include "rewind/timing/IWaitStrategy.hpp"
#include "rewind/timing/PacedFrameScheduler.hpp"
#include "rewind/timing/SystemTimeSource.hpp"
#include "rewind/util/Logger.hpp"

namespace {

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<rewindreplay::timing::PacedFrameScheduler*> g_scheduler{nullptr};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    if (auto* scheduler = g_scheduler.load(std::memory_order_acquire)) {
      scheduler->RequestStop();
    }
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string session_path;
  double rate = 1.0;
  double seek_s = 0.0;
  double play_s = 0.0;  // 0 = no headless playback
  size_t buckets = rewindreplay::timeline::kDefaultDensityBuckets;
  std::string frames_dir;  // Empty = no frame images
  bool diagnostic = false;
  bool help = false;
  bool valid = false;
  std::string error;
};

constexpr double kMaxPlaySeconds = 24.0 * 60.0 * 60.0;

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --session PATH [OPTIONS]\n"
            << "\n"
            << "Standalone replay harness for testing and diagnostics.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --session PATH       Session replay payload (JSON)\n"
            << "  --rate R             Playback rate (default: 1)\n"
            << "  --seek S             Start position in seconds (default: 0)\n"
            << "  --play SECONDS       Run headless playback for SECONDS of wall time\n"
            << "  --buckets N          Density bucket count (default: 40, max: 10000)\n"
            << "  --frames DIR         Load frame images from DIR (requires FFmpeg)\n"
            << "  --diagnostic         Print every published frame\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --session session.json\n"
            << "  " << program_name << " --session session.json --rate 2 --play 5 --diagnostic\n"
            << "\n";
}

bool ParseDouble(const std::string& text, double* out) {
  char* end = nullptr;
  double v = std::strtod(text.c_str(), &end);
  if (end == text.c_str() || *end != '\0' || !std::isfinite(v)) return false;
  *out = v;
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--session" && i + 1 < argc) {
      args.session_path = argv[++i];
    } else if (arg == "--rate" && i + 1 < argc) {
      if (!ParseDouble(argv[++i], &args.rate)) {
        args.error = "--rate expects a number";
        return args;
      }
    } else if (arg == "--seek" && i + 1 < argc) {
      if (!ParseDouble(argv[++i], &args.seek_s)) {
        args.error = "--seek expects a number";
        return args;
      }
    } else if (arg == "--play" && i + 1 < argc) {
      if (!ParseDouble(argv[++i], &args.play_s) || args.play_s < 0.0 ||
          args.play_s > kMaxPlaySeconds) {
        args.error = "--play expects a number of seconds between 0 and 86400";
        return args;
      }
    } else if (arg == "--buckets" && i + 1 < argc) {
      double buckets = 0.0;
      if (!ParseDouble(argv[++i], &buckets) || buckets < 1.0 ||
          buckets > static_cast<double>(rewindreplay::timeline::kMaxDensityBuckets) ||
          buckets != std::floor(buckets)) {
        args.error = "--buckets expects an integer between 1 and 10000";
        return args;
      }
      args.buckets = static_cast<size_t>(buckets);
    } else if (arg == "--frames" && i + 1 < argc) {
      args.frames_dir = argv[++i];
    } else if (arg == "--diagnostic") {
      args.diagnostic = true;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.session_path.empty()) {
    args.error = "Must specify --session";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Diagnostic observer
// =============================================================================
class PrintingObserver : public rewindreplay::playback::IReplayObserver {
 public:
  // controller is non-null only when frame images are loaded.
  PrintingObserver(bool verbose, rewindreplay::playback::ReplayController* controller)
      : verbose_(verbose), controller_(controller) {}

  void OnReplayFrame(const rewindreplay::playback::ReplayFrame& frame) override {
    ++frames_;
    bool frame_changed = frame.state.current_frame_index != last_frame_index_;
    last_frame_index_ = frame.state.current_frame_index;
    if (!verbose_ && !frame_changed && !frame.reached_end) return;

    std::cout << "[HARNESS] t=" << std::fixed << std::setprecision(3)
              << frame.state.current_time_s
              << " frame=" << frame.state.current_frame_index
              << " playing=" << (frame.state.is_playing ? 1 : 0)
              << " touches=" << frame.touches.size()
              << " bg=" << (frame.lifecycle.in_background ? 1 : 0)
              << " terminated=" << (frame.lifecycle.terminated ? 1 : 0);
    if (controller_ != nullptr) {
      auto image = controller_->DrawableFrame();
      if (image) {
        std::cout << " image=" << image->width << "x" << image->height;
      } else {
        std::cout << " image=none";
      }
    }
    if (frame.reached_end) std::cout << " END";
    std::cout << "\n";
  }

  uint64_t frames() const { return frames_; }

 private:
  bool verbose_;
  rewindreplay::playback::ReplayController* controller_;
  uint64_t frames_ = 0;
  size_t last_frame_index_ = static_cast<size_t>(-1);
};

std::string FormatDensity(const std::vector<double>& values) {
  static const char* kLevels = " .:-=+*#%@";
  std::string out;
  for (double v : values) {
    int level = static_cast<int>(std::lround(v * 9.0));
    out.push_back(kLevels[std::max(0, std::min(9, level))]);
  }
  return out;
}

void PrintSummary(const rewindreplay::playback::ReplayController& controller, size_t buckets) {
  using rewindreplay::timeline::DurationSourceToString;
  const auto& duration = controller.duration();
  auto density = controller.Density(buckets);
  auto insights = controller.Insights();

  std::cout << "========================================\n"
            << "Session:        " << controller.session().id << "\n"
            << "Availability:   "
            << rewindreplay::playback::ReplayAvailabilityToString(controller.Availability()) << "\n"
            << "Duration:       " << duration.seconds << "s ("
            << DurationSourceToString(duration.source) << ")\n"
            << "Frames:         " << controller.frame_index().size() << "\n"
            << "Timeline:       " << controller.timeline().size() << " events\n"
            << "Rage taps:      " << controller.rage_taps().size() << "\n"
            << "Screen:         " << controller.screen_size().width << "x"
            << controller.screen_size().height << "\n"
            << "Touch density:  [" << FormatDensity(density.touch_density) << "]\n"
            << "API density:    [" << FormatDensity(density.api_density) << "]\n"
            << "Requests:       " << insights.request_count << " ("
            << insights.failed_request_count << " failed, "
            << insights.api_error_rate_pct << "% error rate, p95 "
            << insights.api_p95_latency_ms << "ms)\n"
            << "Issue signals:  " << insights.issue_signals << " ("
            << insights.issue_signals_per_minute << "/min)\n"
            << "First issue:    ";
  if (insights.time_to_first_issue_ms) {
    std::cout << *insights.time_to_first_issue_ms << "ms\n";
  } else {
    std::cout << "none\n";
  }
  std::cout << "Stability:      " << std::lround(insights.stability_score) << "\n";
  for (const auto& marker : controller.Markers()) {
    std::cout << "Marker:         "
              << (marker.kind == rewindreplay::timeline::MarkerKind::kCrash ? "crash" : "anr")
              << " at " << marker.relative_time_s << "s (" << marker.label << ")\n";
  }
  std::cout << "========================================\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using rewindreplay::util::Logger;

  CliArgs args = ParseArgs(argc, argv);
  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  auto ingest = rewindreplay::session::LoadSessionFile(args.session_path);
  if (!ingest.ok) {
    Logger::Error("[HARNESS] Cannot load session: " + ingest.error);
    return 1;
  }

  rewindreplay::runtime::ReplayConfig config;
  config.density_buckets = args.buckets;
  auto validation = config.Validate();
  if (!validation.ok) {
    Logger::Error("[HARNESS] Invalid config: " + validation.error);
    return 1;
  }

  auto time_source = std::make_shared<rewindreplay::timing::SystemTimeSource>();
  auto wait = std::make_shared<rewindreplay::timing::RealtimeWaitStrategy>(time_source);
  auto scheduler = std::make_shared<rewindreplay::timing::PacedFrameScheduler>(
      time_source, wait, config.playback.refresh_hz);

  rewindreplay::playback::ReplayController controller(std::move(ingest.session), config,
                                                scheduler, time_source);
  PrintSummary(controller, args.buckets);

  std::unique_ptr<rewindreplay::frames::FramePreloader> preloader;
  if (!args.frames_dir.empty()) {
#ifdef REWIND_FFMPEG_AVAILABLE
    auto cache = std::make_shared<rewindreplay::frames::FrameImageCache>();
    preloader = std::make_unique<rewindreplay::frames::FramePreloader>(
        std::make_shared<rewindreplay::frames::FileFrameFetcher>(args.frames_dir),
        std::make_shared<rewindreplay::decode::FFmpegImageDecoder>(), cache, config.preload);
    std::vector<std::string> urls;
    for (const auto& frame : controller.frame_index().frames()) urls.push_back(frame.url);
    preloader->StartPreload(urls);
    preloader->WaitForCompletion();
    auto stats = preloader->Stats();
    std::ostringstream loaded;
    loaded << "[HARNESS] Frames loaded=" << stats.loaded << " failed=" << stats.failed
           << " cached=" << stats.already_cached << " of " << stats.requested
           << " in " << stats.total_us / 1000 << "ms";
    Logger::Info(loaded.str());
    controller.SetFrameCache(cache);
#else
    Logger::Error("[HARNESS] --frames needs a build with FFmpeg");
    return 1;
#endif
  }

  if (args.play_s <= 0.0) return 0;
  if (!controller.IsAvailable()) {
    Logger::Warn("[HARNESS] Replay not available, skipping playback");
    return 0;
  }

  PrintingObserver observer(args.diagnostic, preloader ? &controller : nullptr);
  controller.SetObserver(&observer);
  if (!controller.SetRate(args.rate)) return 1;
  controller.Seek(args.seek_s);
  if (!controller.Play()) {
    Logger::Warn("[HARNESS] Play rejected");
    return 0;
  }

  g_scheduler.store(scheduler.get(), std::memory_order_release);
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  size_t max_passes = static_cast<size_t>(std::ceil(args.play_s * config.playback.refresh_hz));
  size_t passes = scheduler->RunUntilIdle(max_passes);

  g_scheduler.store(nullptr, std::memory_order_release);
  if (controller.State().is_playing) controller.Pause();
  controller.SetObserver(nullptr);

  std::ostringstream oss;
  oss << "[HARNESS] Ran " << passes << " refreshes, published " << observer.frames()
      << " frames, stopped at " << controller.State().current_time_s << "s";
  Logger::Info(oss.str());
  return 0;
}
