// Repository: Rewind
// Component: File Frame Fetcher
// Purpose: Resolve screenshot frame URLs to images stored on local disk.
// Copyright (c) 2025 Rewind

#include "rewind/frames/FileFrameFetcher.hpp"

#include <cstdint>
#include <fstream>
#include <iterator>
#include <utility>
#include <vector>

namespace rewindreplay::frames {

namespace {
constexpr const char* kFileScheme = "file://";
}  // namespace

FileFrameFetcher::FileFrameFetcher(std::string frames_dir)
    : frames_dir_(std::move(frames_dir)) {
  while (frames_dir_.size() > 1 && frames_dir_.back() == '/') {
    frames_dir_.pop_back();
  }
}

std::string FileFrameFetcher::ResolvePath(const std::string& url) const {
  const std::string scheme(kFileScheme);
  if (url.compare(0, scheme.size(), scheme) == 0) {
    return url.substr(scheme.size());
  }

  std::string path = url.substr(0, url.find_first_of("?#"));
  size_t slash = path.find_last_of('/');
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  if (name.empty()) return std::string();
  if (frames_dir_.empty()) return name;
  return frames_dir_ + "/" + name;
}

FetchResult FileFrameFetcher::Fetch(const std::string& url) {
  std::string path = ResolvePath(url);
  if (path.empty()) {
    return FetchResult::Failure("no file name in " + url);
  }

  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) {
    return FetchResult::Failure("cannot open " + path);
  }
  std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (bytes.empty()) {
    return FetchResult::Failure("empty file " + path);
  }
  return FetchResult::Success(std::move(bytes));
}

}  // namespace rewindreplay::frames
