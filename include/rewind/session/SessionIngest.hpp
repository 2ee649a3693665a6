// Repository: Rewind
// Component: Session Ingest
// Purpose: Parse the provider's JSON replay payload into a SessionRecord.
// Copyright (c) 2025 Rewind

#ifndef REWIND_SESSION_SESSION_INGEST_HPP_
#define REWIND_SESSION_SESSION_INGEST_HPP_

#include <cstddef>
#include <string>
#include <utility>

#include "rewind/session/SessionTypes.hpp"

namespace rewindreplay::proto {
class SessionPayload;
}

namespace rewindreplay::session {

// Result of ingesting a payload. When ok is false, error describes why the
// payload as a whole is unusable and session is default-constructed.
struct IngestResult {
  bool ok = false;
  std::string error;
  SessionRecord session;
  // List entries (events, requests, crashes, ANRs, frames) that could not be
  // read and were skipped.
  size_t dropped_entries = 0;

  static IngestResult Success(SessionRecord record) {
    IngestResult r;
    r.ok = true;
    r.session = std::move(record);
    return r;
  }

  static IngestResult Failure(std::string message) {
    IngestResult r;
    r.error = std::move(message);
    return r;
  }
};

// Parses a JSON payload. Unknown fields are ignored. The payload fails as a
// whole only when it is not a JSON object, a list field is not an array, or a
// session-level field has the wrong type. A malformed list entry is skipped
// with a warning; loosely typed entry fields (string status codes, numeric
// stats.duration, array properties, non-array touches) are coerced.
IngestResult ParseSessionJson(const std::string& json);

// Reads and parses a JSON payload file.
IngestResult LoadSessionFile(const std::string& path);

// Normalizes dynamic payload shapes into the fixed SessionRecord types.
SessionRecord SessionFromPayload(const proto::SessionPayload& payload);

}  // namespace rewindreplay::session

#endif  // REWIND_SESSION_SESSION_INGEST_HPP_
