// Repository: Rewind
// Component: Playback Clock
// Purpose: Virtual time cursor over a replay, advanced by scaled wall-clock
//          time while playing or moved directly by seeks.
// Copyright (c) 2025 Rewind

#include "rewind/playback/PlaybackClock.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

#include "rewind/util/Logger.hpp"

namespace rewindreplay::playback {

PlaybackClock::PlaybackClock(const FrameIndex& frames, double duration_s, double initial_rate)
    : frames_(&frames),
      duration_s_(std::isfinite(duration_s) ? std::max(0.0, duration_s) : 0.0),
      rate_(std::isfinite(initial_rate) && initial_rate > 0.0 ? initial_rate : 1.0) {
  current_frame_index_ = frames_->FrameAtOrBefore(0.0);
}

const char* PlaybackClock::StateToString(State state) {
  switch (state) {
    case State::kPaused:  return "paused";
    case State::kPlaying: return "playing";
  }
  return "unknown";
}

bool PlaybackClock::SetTime(double t) {
  current_time_s_ = t;
  size_t frame = frames_->FrameAtOrBefore(t);
  bool changed = frame != current_frame_index_;
  current_frame_index_ = frame;
  return changed;
}

bool PlaybackClock::Play(int64_t now_us) {
  if (state_ == State::kPlaying || duration_s_ <= 0.0) {
    ++rejected_command_total_;
    return false;
  }
  if (AtEnd()) {
    SetTime(0.0);
  }
  state_ = State::kPlaying;
  last_tick_us_ = now_us;
  return true;
}

bool PlaybackClock::Pause() {
  if (state_ != State::kPlaying) {
    ++rejected_command_total_;
    return false;
  }
  state_ = State::kPaused;
  return true;
}

PlaybackClock::TickResult PlaybackClock::Tick(int64_t now_us) {
  TickResult result;
  if (state_ != State::kPlaying || scrubbing_) return result;

  int64_t elapsed_us = std::max<int64_t>(0, now_us - last_tick_us_);
  last_tick_us_ = now_us;

  double next = current_time_s_ + static_cast<double>(elapsed_us) / 1'000'000.0 * rate_;
  if (next >= duration_s_) {
    next = duration_s_;
    state_ = State::kPaused;
    result.reached_end = true;
  }
  result.advanced_s = next - current_time_s_;
  result.frame_changed = SetTime(next);
  return result;
}

void PlaybackClock::Seek(double target_s) {
  if (std::isnan(target_s)) {
    util::Logger::Warn("[PlaybackClock] Ignoring NaN seek target");
    ++rejected_command_total_;
    return;
  }
  SetTime(std::clamp(target_s, 0.0, duration_s_));
}

void PlaybackClock::Skip(double delta_s) {
  Seek(current_time_s_ + delta_s);
}

bool PlaybackClock::SetRate(double rate) {
  if (!std::isfinite(rate) || rate <= 0.0) {
    std::ostringstream oss;
    oss << "[PlaybackClock] Rejected playback rate " << rate << " (keeping " << rate_ << ")";
    util::Logger::Warn(oss.str());
    ++rejected_command_total_;
    return false;
  }
  rate_ = rate;
  return true;
}

void PlaybackClock::Restart(int64_t now_us) {
  SetTime(0.0);
  if (state_ == State::kPlaying) {
    last_tick_us_ = now_us;
  } else {
    Play(now_us);
  }
}

bool PlaybackClock::BeginScrub() {
  if (scrubbing_) return false;
  scrubbing_ = true;
  return true;
}

void PlaybackClock::ScrubTo(double target_s) {
  Seek(target_s);
}

bool PlaybackClock::EndScrub(int64_t now_us) {
  if (!scrubbing_) return false;
  scrubbing_ = false;
  last_tick_us_ = now_us;
  return true;
}

PlaybackState PlaybackClock::Snapshot() const {
  PlaybackState s;
  s.current_time_s = current_time_s_;
  s.is_playing = state_ == State::kPlaying;
  s.rate = rate_;
  s.current_frame_index = current_frame_index_;
  s.is_scrubbing = scrubbing_;
  return s;
}

}  // namespace rewindreplay::playback
