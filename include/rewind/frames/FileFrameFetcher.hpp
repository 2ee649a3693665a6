// Repository: Rewind
// Component: File Frame Fetcher
// Purpose: Resolve screenshot frame URLs to images stored on local disk.
// Copyright (c) 2025 Rewind

#ifndef REWIND_FRAMES_FILE_FRAME_FETCHER_HPP_
#define REWIND_FRAMES_FILE_FRAME_FETCHER_HPP_

#include <string>

#include "rewind/frames/FrameImage.hpp"

namespace rewindreplay::frames {

// Reads frames from a directory of downloaded screenshots. A file:// URL maps
// to its own path; any other URL maps to its last path segment (query and
// fragment stripped) inside frames_dir.
class FileFrameFetcher : public IFrameFetcher {
 public:
  explicit FileFrameFetcher(std::string frames_dir);

  FetchResult Fetch(const std::string& url) override;

  std::string ResolvePath(const std::string& url) const;

 private:
  std::string frames_dir_;
};

}  // namespace rewindreplay::frames

#endif  // REWIND_FRAMES_FILE_FRAME_FETCHER_HPP_
