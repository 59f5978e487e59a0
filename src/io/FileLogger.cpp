/* @file FileLogger.cpp
 * @brief chunked fwrite journal writer
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <utility>

// VibeDJ headers
#include "io/FileLogger.hpp"

using namespace vibedj::io;

FileLogger::~FileLogger() { close(); }

FileLogger::FileLogger(FileLogger&& other) noexcept
    : fp_(std::exchange(other.fp_, nullptr)), buffer_(std::move(other.buffer_)), wasEmpty_(other.wasEmpty_) {}

FileLogger& FileLogger::operator=(FileLogger&& other) noexcept {
  if (this != &other) {
    close();
    fp_ = std::exchange(other.fp_, nullptr);
    buffer_ = std::move(other.buffer_);
    wasEmpty_ = other.wasEmpty_;
  }
  return *this;
}

bool FileLogger::open(const std::string& path) {
  close();
  fp_ = std::fopen(path.c_str(), "ab");
  if (fp_ == nullptr)
    return false;
  std::fseek(fp_, 0, SEEK_END);
  wasEmpty_ = std::ftell(fp_) == 0;
  buffer_.reserve(kChunkBytes);
  return true;
}

void FileLogger::write(const std::string& line) {
  if (fp_ == nullptr)
    return;
  buffer_.insert(buffer_.end(), line.begin(), line.end());
  if (buffer_.size() >= kChunkBytes)
    flush();
}

bool FileLogger::flush() {
  if (fp_ == nullptr)
    return false;
  std::size_t done = 0;
  while (done < buffer_.size()) {
    const std::size_t chunk = std::min(kChunkBytes, buffer_.size() - done);
    if (std::fwrite(buffer_.data() + done, 1, chunk, fp_) != chunk) {
      buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(done));
      return false;
    }
    done += chunk;
  }
  buffer_.clear();
  return std::fflush(fp_) == 0;
}

void FileLogger::close() {
  if (fp_ == nullptr)
    return;
  flush();
  std::fclose(fp_);
  fp_ = nullptr;
}
