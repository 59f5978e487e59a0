#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace vibedj::core {

  /**
 * @class ErrorMonitor
 * @brief Subsystems call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error until `reset()`.
 *
 * * Thread-safe (mutex-protected vector). The callback runs outside the lock.
 * * Debounces duplicate failures so a retry loop doesn't spam the operator.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (logs it, pages, ...).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by subsystems on fault; forwards to the escalation callback if new.
    virtual void notifyFailure(const std::string& message);

    /// Forget every seen failure, e.g. after the system recovered.
    void reset();

    /// Number of distinct failures seen since the last reset.
    std::size_t distinctFailures() const;

  private:
    bool markSeen(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    mutable std::mutex mtx_;
  };

} // namespace vibedj::core
