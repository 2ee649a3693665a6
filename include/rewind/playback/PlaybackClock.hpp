// Repository: Rewind
// Component: Playback Clock
// Purpose: Virtual time cursor over a replay, advanced by scaled wall-clock
//          time while playing or moved directly by seeks.
// Copyright (c) 2025 Rewind

#ifndef REWIND_PLAYBACK_PLAYBACK_CLOCK_HPP_
#define REWIND_PLAYBACK_PLAYBACK_CLOCK_HPP_

#include <cstddef>
#include <cstdint>

#include "rewind/playback/FrameIndex.hpp"

namespace rewindreplay::playback {

// Snapshot of the clock. Invariants:
//   0 <= current_time_s <= duration
//   current_frame_index == FrameIndex::FrameAtOrBefore(current_time_s)
struct PlaybackState {
  double current_time_s = 0.0;
  bool is_playing = false;
  double rate = 1.0;
  size_t current_frame_index = 0;
  bool is_scrubbing = false;
};

// =============================================================================
// PlaybackClock
// Two states, kPaused and kPlaying. Wall-clock time (monotonic us) is passed
// in by the caller; the clock owns no timer.
//
// - Play():    kPaused -> kPlaying, anchors the wall-clock reference. At the
//              end of the timeline, playback restarts from 0.
// - Tick():    kPlaying only. Advances by (now - last tick) * rate. Reaching
//              the duration clamps and transitions to kPaused.
// - Seek():    clamps to [0, duration]; play state unchanged.
// - Scrub:     while scrubbing, Tick() is a no-op; EndScrub() re-anchors so
//              the time spent dragging is not played.
//
// Not thread-safe: owned and driven by one thread.
// =============================================================================

class PlaybackClock {
 public:
  enum class State {
    kPaused = 0,
    kPlaying = 1,
  };

  struct TickResult {
    double advanced_s = 0.0;
    bool frame_changed = false;
    bool reached_end = false;
  };

  // frames must outlive the clock.
  PlaybackClock(const FrameIndex& frames, double duration_s, double initial_rate = 1.0);

  PlaybackClock(const PlaybackClock&) = delete;
  PlaybackClock& operator=(const PlaybackClock&) = delete;

  // Returns false (and counts a rejected command) when already playing or
  // when there is nothing to play.
  bool Play(int64_t now_us);
  bool Pause();

  TickResult Tick(int64_t now_us);

  void Seek(double target_s);
  void Skip(double delta_s);

  // Rejects non-finite or non-positive rates; the rate is unchanged.
  bool SetRate(double rate);

  // Seek(0) then Play(now).
  void Restart(int64_t now_us);

  bool BeginScrub();
  void ScrubTo(double target_s);
  bool EndScrub(int64_t now_us);

  PlaybackState Snapshot() const;

  State state() const { return state_; }
  bool IsPlaying() const { return state_ == State::kPlaying; }
  bool IsScrubbing() const { return scrubbing_; }
  bool AtEnd() const { return current_time_s_ >= duration_s_; }
  double current_time_s() const { return current_time_s_; }
  double duration_s() const { return duration_s_; }
  double rate() const { return rate_; }
  size_t current_frame_index() const { return current_frame_index_; }
  uint64_t rejected_command_total() const { return rejected_command_total_; }

  static const char* StateToString(State state);

 private:
  // Sets time and frame together; returns true when the frame changed.
  bool SetTime(double t);

  const FrameIndex* frames_;
  double duration_s_;
  double rate_;
  State state_ = State::kPaused;
  bool scrubbing_ = false;
  double current_time_s_ = 0.0;
  size_t current_frame_index_ = 0;
  int64_t last_tick_us_ = 0;
  uint64_t rejected_command_total_ = 0;
};

}  // namespace rewindreplay::playback

#endif  // REWIND_PLAYBACK_PLAYBACK_CLOCK_HPP_
