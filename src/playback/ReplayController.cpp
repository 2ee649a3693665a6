// Repository: Rewind
// Component: Replay Controller
// Purpose: Owns the playback clock of one session replay and publishes one
//          consistent frame/overlay snapshot per display refresh.
// Copyright (c) 2025 Rewind

#include "rewind/playback/ReplayController.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rewindreplay::playback {

const char* ReplayAvailabilityToString(ReplayAvailability availability) {
  switch (availability) {
    case ReplayAvailability::kAvailable:  return "available";
    case ReplayAvailability::kNoFrames:   return "no_frames";
    case ReplayAvailability::kNoStartTime: return "no_start_time";
    case ReplayAvailability::kNoDuration: return "no_duration";
  }
  return "unknown";
}

ReplayController::ReplayController(session::SessionRecord session,
                                   runtime::ReplayConfig config,
                                   std::shared_ptr<timing::IFrameScheduler> scheduler,
                                   std::shared_ptr<timing::ITimeSource> time_source)
    : session_(std::move(session)),
      config_(std::move(config)),
      scheduler_(std::move(scheduler)),
      time_source_(std::move(time_source)),
      normalized_(timeline::EventNormalizer(config_.rage_tap).Normalize(session_)),
      duration_(timeline::EstimateDuration(session_, normalized_.events, config_.duration)),
      frames_(FrameIndex::Build(session_.screenshot_frames, session_.start_time_ms)),
      screen_(overlay::InferScreenSize(session_)),
      projector_(config_.overlay),
      clock_(frames_, duration_.seconds, config_.playback.initial_rate),
      overlay_enabled_(config_.playback.touch_overlay_enabled) {
  if (!scheduler_) {
    throw std::invalid_argument("ReplayController requires a frame scheduler");
  }
  if (!time_source_) {
    throw std::invalid_argument("ReplayController requires a time source");
  }
  auto validation = config_.Validate();
  if (!validation.ok) {
    throw std::invalid_argument("ReplayController config invalid: " + validation.error);
  }

  std::ostringstream oss;
  oss << "[ReplayController] Session " << (session_.id.empty() ? "<unnamed>" : session_.id)
      << " availability=" << ReplayAvailabilityToString(Availability())
      << " duration_s=" << duration_.seconds
      << " source=" << timeline::DurationSourceToString(duration_.source)
      << " frames=" << frames_.size()
      << " events=" << normalized_.events.size()
      << " rage_taps=" << normalized_.rage_taps.size()
      << " screen=" << screen_.width << "x" << screen_.height;
  util::Logger::Info(oss.str());
}

ReplayController::~ReplayController() {
  CancelPendingTick();
}

void ReplayController::SetFrameCache(std::shared_ptr<frames::FrameImageCache> cache) {
  cache_ = std::move(cache);
  last_drawable_.reset();
  warned_urls_.clear();
}

ReplayAvailability ReplayController::Availability() const {
  if (frames_.empty()) return ReplayAvailability::kNoFrames;
  if (session_.start_time_ms <= 0) return ReplayAvailability::kNoStartTime;
  if (duration_.seconds <= 0.0) return ReplayAvailability::kNoDuration;
  return ReplayAvailability::kAvailable;
}

bool ReplayController::TransportAvailable(const char* command) const {
  if (IsAvailable()) return true;
  util::Logger::Debug(std::string("[ReplayController] Ignoring ") + command +
                      ": replay " + ReplayAvailabilityToString(Availability()));
  return false;
}

// =============================================================================
// Scheduling
// =============================================================================

void ReplayController::ScheduleNextTick() {
  if (pending_request_ != timing::kNoFrameRequest) return;
  if (!clock_.IsPlaying() || clock_.IsScrubbing()) return;
  pending_request_ = scheduler_->RequestFrame(
      [this](int64_t now_us) { OnAnimationFrame(now_us); });
}

void ReplayController::CancelPendingTick() {
  if (pending_request_ == timing::kNoFrameRequest) return;
  scheduler_->CancelFrame(pending_request_);
  pending_request_ = timing::kNoFrameRequest;
}

void ReplayController::OnAnimationFrame(int64_t now_us) {
  pending_request_ = timing::kNoFrameRequest;
  if (!clock_.IsPlaying() || clock_.IsScrubbing()) return;

  PlaybackClock::TickResult result = clock_.Tick(now_us);
  Publish(result.reached_end);

  if (result.reached_end) {
    util::Logger::Info("[ReplayController] Reached end at " +
                       std::to_string(clock_.current_time_s()) + "s");
    return;
  }
  ScheduleNextTick();
}

// =============================================================================
// Publishing
// =============================================================================

double ReplayController::AbsoluteTimeMs() const {
  return static_cast<double>(session_.start_time_ms) + clock_.current_time_s() * 1000.0;
}

ReplayFrame ReplayController::BuildFrame(bool reached_end) const {
  ReplayFrame frame;
  frame.state = clock_.Snapshot();
  frame.absolute_time_ms = AbsoluteTimeMs();
  frame.reached_end = reached_end;
  if (const IndexedFrame* f = frames_.At(frame.state.current_frame_index)) {
    frame.frame = *f;
  }
  if (overlay_enabled_ && !clock_.IsScrubbing()) {
    frame.touches = projector_.Project(normalized_.events, normalized_.rage_taps,
                                       frame.absolute_time_ms,
                                       screen_.width, screen_.height);
  }
  frame.lifecycle = timeline::LifecycleAt(normalized_.events, frame.absolute_time_ms);
  return frame;
}

void ReplayController::Publish(bool reached_end) {
  ++frames_published_;
  if (observer_ == nullptr) return;
  observer_->OnReplayFrame(BuildFrame(reached_end));
}

ReplayFrame ReplayController::CurrentFrame() const {
  return BuildFrame(false);
}

// =============================================================================
// Transport
// =============================================================================

bool ReplayController::Play() {
  if (!TransportAvailable("play")) return false;
  if (!clock_.Play(time_source_->NowMonotonicUs())) return false;
  Publish();
  ScheduleNextTick();
  return true;
}

bool ReplayController::Pause() {
  if (!TransportAvailable("pause")) return false;
  if (!clock_.Pause()) return false;
  CancelPendingTick();
  Publish();
  return true;
}

bool ReplayController::TogglePlayPause() {
  return clock_.IsPlaying() ? Pause() : Play();
}

bool ReplayController::Seek(double target_s) {
  if (!TransportAvailable("seek")) return false;
  clock_.Seek(target_s);
  Publish();
  return true;
}

bool ReplayController::SeekToTimestamp(int64_t absolute_ms) {
  return Seek(static_cast<double>(absolute_ms - session_.start_time_ms) / 1000.0);
}

bool ReplayController::Skip(double delta_s) {
  if (!TransportAvailable("skip")) return false;
  clock_.Skip(delta_s);
  Publish();
  return true;
}

bool ReplayController::SetRate(double rate) {
  if (!TransportAvailable("set_rate")) return false;
  if (!clock_.SetRate(rate)) return false;
  Publish();
  return true;
}

bool ReplayController::Restart() {
  if (!TransportAvailable("restart")) return false;
  clock_.Restart(time_source_->NowMonotonicUs());
  Publish();
  ScheduleNextTick();
  return true;
}

bool ReplayController::BeginScrub() {
  if (!TransportAvailable("begin_scrub")) return false;
  if (!clock_.BeginScrub()) return false;
  CancelPendingTick();
  Publish();
  return true;
}

bool ReplayController::ScrubTo(double target_s) {
  if (!TransportAvailable("scrub")) return false;
  clock_.ScrubTo(target_s);
  Publish();
  return true;
}

bool ReplayController::EndScrub() {
  if (!TransportAvailable("end_scrub")) return false;
  if (!clock_.EndScrub(time_source_->NowMonotonicUs())) return false;
  Publish();
  ScheduleNextTick();
  return true;
}

void ReplayController::SetTouchOverlayEnabled(bool enabled) {
  overlay_enabled_ = enabled;
}

// =============================================================================
// Draw step
// =============================================================================

std::shared_ptr<const frames::FrameImage> ReplayController::DrawableFrame() {
  if (!cache_) return last_drawable_;
  const IndexedFrame* f = frames_.At(clock_.current_frame_index());
  if (f == nullptr) return last_drawable_;

  if (auto image = cache_->Get(f->url)) {
    last_drawable_ = image;
    return image;
  }

  if (warned_urls_.insert(f->url).second) {
    util::Logger::Warn("[ReplayController] Frame " + std::to_string(f->index) +
                       (cache_->HasFailed(f->url) ? " failed to load" : " not loaded yet") +
                       ", keeping previous frame url=" + f->url);
  }
  return last_drawable_;
}

// =============================================================================
// Derived views
// =============================================================================

timeline::DensityData ReplayController::Density() const {
  return Density(config_.density_buckets);
}

timeline::DensityData ReplayController::Density(size_t bucket_count) const {
  return timeline::AggregateDensity(normalized_.events, session_.start_time_ms,
                                    duration_.seconds, bucket_count);
}

timeline::SessionInsights ReplayController::Insights() const {
  return timeline::ComputeInsights(session_, normalized_.events, normalized_.rage_taps,
                                   duration_.seconds);
}

std::vector<timeline::TimelineMarker> ReplayController::Markers() const {
  return timeline::BuildTimelineMarkers(normalized_.events, session_.start_time_ms,
                                        duration_.seconds);
}

}  // namespace rewindreplay::playback
