/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <algorithm>

// VibeDJ headers
#include "core/ErrorMonitor.hpp"

using namespace vibedj::core;

void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
  std::lock_guard<std::mutex> lock(mtx_);
  escalation_ = std::move(cb);
}

void ErrorMonitor::notifyFailure(const std::string& message) {
  if (!markSeen(message))
    return;

  std::function<void(const std::string&)> cb;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cb = escalation_;
  }
  if (cb)
    cb(message);
}

void ErrorMonitor::reset() {
  std::lock_guard<std::mutex> lock(mtx_);
  seen_.clear();
}

std::size_t ErrorMonitor::distinctFailures() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return seen_.size();
}

bool ErrorMonitor::markSeen(const std::string& message) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
    return false;
  seen_.push_back(message);
  return true;
}
