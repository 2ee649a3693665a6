// Repository: Rewind
// Component: Thread-Safe Logger
// Purpose: Tagged, mutex-protected diagnostics shared by the scheduler
//          thread, the frame preloader worker and ingest.
// Copyright (c) 2025 Rewind

#ifndef REWIND_UTIL_LOGGER_HPP_
#define REWIND_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace rewindreplay::util {

// Logger is the single diagnostics channel of the replay engine. Lines come
// from the thread that drives the frame scheduler (ReplayController,
// PlaybackClock), from the FramePreloader worker, and from ingest. Every line
// starts with a bracketed component tag ("[ReplayController] ...") so the
// harness output can be filtered per module. One static mutex guards the
// streams and the sinks; a line is written whole and flushed.
//
// Info  -> stdout: session summaries, end of playback, preload totals
// Debug -> stdout when REWIND_DEBUG is set: ignored transport commands, ingest
//          counts
// Warn  -> stderr: recovered input (skipped entries, rejected rate, frame
//          not drawable)
// Error -> stderr: payload or file unusable, decoder faults
//
// Test-only: a sink receives every line of its level in addition to the
// stream, so contract tests can assert on the diagnostics a module emits.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Read once from REWIND_DEBUG. Lets callers skip building Debug lines.
  static bool DebugEnabled();

  // Test-only. Call with nullptr to clear.
  static void SetErrorSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetInfoSink(Sink sink);

 private:
  static std::mutex mutex_;
  static Sink error_sink_;
  static Sink warn_sink_;
  static Sink info_sink_;
};

}  // namespace rewindreplay::util

#endif  // REWIND_UTIL_LOGGER_HPP_
