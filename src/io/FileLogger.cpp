/* @file FileLogger.cpp
 * @brief chunked stdio writer backing the log export
 *
 * © 2025 Qube Monitor — MIT-licensed.
 */

#include "io/FileLogger.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <iostream>

#include <errno.h>

using namespace qube::io;

FileLogger::~FileLogger() { close(); }

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "w");
  if (!fp_) {
    std::cerr << "Error " << errno << " from fopen(" << path << "): " << strerror(errno) << "\n";
    return false;
  }
  buffer_.reserve(kChunk);
  return true;
}

bool FileLogger::write(const std::string& text) {
  if (!fp_)
    return false;
  buffer_.insert(buffer_.end(), text.begin(), text.end());
  if (buffer_.size() >= kChunk)
    return flush();
  return true;
}

bool FileLogger::flush() {
  if (!fp_)
    return false;

  std::size_t offset = 0;
  while (offset < buffer_.size()) {
    const std::size_t n = std::min(kChunk, buffer_.size() - offset);
    const std::size_t written = std::fwrite(buffer_.data() + offset, 1, n, fp_);
    if (written != n) {
      std::cerr << "Error " << errno << " from fwrite: " << strerror(errno) << "\n";
      // keep only what stdio did not accept, so a retry cannot repeat it
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(offset + written));
      return false;
    }
    offset += n;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

bool FileLogger::close() {
  if (!fp_)
    return true;
  const bool flushed = flush();
  const bool closed = std::fclose(fp_) == 0;
  fp_ = nullptr;
  buffer_.clear();
  return flushed && closed;
}
