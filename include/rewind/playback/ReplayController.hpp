// Repository: Rewind
// Component: Replay Controller
// Purpose: Owns the playback clock of one session replay and publishes one
//          consistent frame/overlay snapshot per display refresh.
// Copyright (c) 2025 Rewind

#ifndef REWIND_PLAYBACK_REPLAY_CONTROLLER_HPP_
#define REWIND_PLAYBACK_REPLAY_CONTROLLER_HPP_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "rewind/frames/FrameImageCache.hpp"
#include "rewind/overlay/DeviceGeometry.hpp"
#include "rewind/overlay/TouchOverlayProjector.hpp"
#include "rewind/playback/FrameIndex.hpp"
#include "rewind/playback/PlaybackClock.hpp"
#include "rewind/runtime/ReplayConfig.hpp"
#include "rewind/session/SessionTypes.hpp"
#include "rewind/timeline/DensityAggregator.hpp"
#include "rewind/timeline/DurationEstimator.hpp"
#include "rewind/timeline/EventNormalizer.hpp"
#include "rewind/timeline/SessionInsights.hpp"
#include "rewind/timeline/TimelineMarkers.hpp"
#include "rewind/timing/IFrameScheduler.hpp"
#include "rewind/timing/ITimeSource.hpp"

namespace rewindreplay::playback {

enum class ReplayAvailability {
  kAvailable = 0,
  kNoFrames,     // Session has no screenshot frames
  kNoStartTime,  // Session start is unknown; frames cannot be placed
  kNoDuration,   // Duration resolved to <= 0
};

const char* ReplayAvailabilityToString(ReplayAvailability availability);

// Everything a render target needs for one refresh. Frame selection and
// overlay projection are computed from the same current_time_s.
struct ReplayFrame {
  PlaybackState state;
  double absolute_time_ms = 0.0;
  std::optional<IndexedFrame> frame;   // nullopt when the index is empty
  std::vector<overlay::TouchEvent> touches;
  timeline::LifecycleState lifecycle;
  bool reached_end = false;
};

// Render target. Called on the thread driving the frame scheduler.
class IReplayObserver {
 public:
  virtual ~IReplayObserver() = default;
  virtual void OnReplayFrame(const ReplayFrame& frame) = 0;
};

// =============================================================================
// ReplayController
// Derives the timeline, rage taps, duration, frame index and screen size once
// from an immutable SessionRecord, then drives a PlaybackClock from a frame
// scheduler.
//
// Scheduling:
// - While playing, exactly one frame request is outstanding.
// - Each callback reads the live clock, ticks it, publishes, and requests the
//   next refresh only if the clock is still playing.
// - Pause, end of timeline, scrub start and destruction cancel the
//   outstanding request.
//
// Not thread-safe: every method runs on the scheduler's driving thread.
// =============================================================================

class ReplayController {
 public:
  // Throws std::invalid_argument for a null scheduler or time source, or an
  // invalid config.
  ReplayController(session::SessionRecord session,
                   runtime::ReplayConfig config,
                   std::shared_ptr<timing::IFrameScheduler> scheduler,
                   std::shared_ptr<timing::ITimeSource> time_source);
  ~ReplayController();

  ReplayController(const ReplayController&) = delete;
  ReplayController& operator=(const ReplayController&) = delete;

  // Non-owning; nullptr detaches. Must outlive the controller or be detached.
  void SetObserver(IReplayObserver* observer) { observer_ = observer; }

  // Source for DrawableFrame(). Typically shared with a FramePreloader.
  void SetFrameCache(std::shared_ptr<frames::FrameImageCache> cache);

  ReplayAvailability Availability() const;
  bool IsAvailable() const { return Availability() == ReplayAvailability::kAvailable; }

  // Transport. Each returns false (and does nothing) when the replay is not
  // available or the command is rejected by the clock.
  bool Play();
  bool Pause();
  bool TogglePlayPause();
  bool Seek(double target_s);
  bool SeekToTimestamp(int64_t absolute_ms);
  bool Skip(double delta_s);
  bool SetRate(double rate);
  bool Restart();

  // Drag-seek. Ticking and overlay projection are suspended between
  // BeginScrub and EndScrub.
  bool BeginScrub();
  bool ScrubTo(double target_s);
  bool EndScrub();

  void SetTouchOverlayEnabled(bool enabled);
  bool touch_overlay_enabled() const { return overlay_enabled_; }

  PlaybackState State() const { return clock_.Snapshot(); }
  ReplayFrame CurrentFrame() const;

  // Image for the current frame if cached, else the last image that was
  // drawable (nullptr before any). Warns once per unresolvable URL.
  std::shared_ptr<const frames::FrameImage> DrawableFrame();

  const session::SessionRecord& session() const { return session_; }
  const std::vector<session::SessionEvent>& timeline() const { return normalized_.events; }
  const std::vector<session::SessionEvent>& rage_taps() const { return normalized_.rage_taps; }
  const timeline::DurationEstimate& duration() const { return duration_; }
  const FrameIndex& frame_index() const { return frames_; }
  const overlay::ScreenSize& screen_size() const { return screen_; }
  const runtime::ReplayConfig& config() const { return config_; }

  timeline::DensityData Density() const;
  timeline::DensityData Density(size_t bucket_count) const;
  timeline::SessionInsights Insights() const;
  std::vector<timeline::TimelineMarker> Markers() const;

  bool HasPendingFrameRequest() const { return pending_request_ != timing::kNoFrameRequest; }
  uint64_t frames_published() const { return frames_published_; }

 private:
  bool TransportAvailable(const char* command) const;
  void ScheduleNextTick();
  void CancelPendingTick();
  void OnAnimationFrame(int64_t now_us);
  ReplayFrame BuildFrame(bool reached_end) const;
  void Publish(bool reached_end = false);
  double AbsoluteTimeMs() const;

  session::SessionRecord session_;
  runtime::ReplayConfig config_;
  std::shared_ptr<timing::IFrameScheduler> scheduler_;
  std::shared_ptr<timing::ITimeSource> time_source_;

  timeline::NormalizedTimeline normalized_;
  timeline::DurationEstimate duration_;
  FrameIndex frames_;
  overlay::ScreenSize screen_;
  overlay::TouchOverlayProjector projector_;
  PlaybackClock clock_;  // References frames_; declared after it

  IReplayObserver* observer_ = nullptr;
  bool overlay_enabled_ = true;
  timing::FrameRequestId pending_request_ = timing::kNoFrameRequest;
  uint64_t frames_published_ = 0;

  std::shared_ptr<frames::FrameImageCache> cache_;
  std::shared_ptr<const frames::FrameImage> last_drawable_;
  std::set<std::string> warned_urls_;
};

}  // namespace rewindreplay::playback

#endif  // REWIND_PLAYBACK_REPLAY_CONTROLLER_HPP_
