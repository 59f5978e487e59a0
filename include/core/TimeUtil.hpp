#pragma once
/** @file  TimeUtil.hpp
 *  @brief Wall-clock helpers: ISO-8601 formatting/parsing, UTC calendar fields.
 *
 *  © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace vibedj::core {

  using SystemClock = std::chrono::system_clock;
  using TimePoint = SystemClock::time_point;

  /// Injectable wall-clock source; tests pass a lambda over a controllable time point.
  using ClockFn = std::function<TimePoint()>;

  inline TimePoint systemNow() { return SystemClock::now(); }

  /// Broken-down UTC calendar fields used by the play-count period resets.
  struct UtcDate {
    int year{ 0 };
    int month{ 0 };   ///< 1..12
    int day{ 0 };     ///< 1..31
    int isoWeek{ 0 }; ///< ISO-8601 week number 1..53
  };

  UtcDate utcDate(TimePoint tp);

  /// "YYYY-MM-DD" in UTC.
  std::string utcDateString(TimePoint tp);

  /// Parses "YYYY-MM-DD" as midnight UTC.
  std::optional<TimePoint> parseUtcDateString(const std::string& s);

  /// "YYYY-MM-DDTHH:MM:SSZ"
  std::string toIsoUtc(TimePoint tp);

  /// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and a trailing "Z" or "+00:00".
  std::optional<TimePoint> parseIsoUtc(const std::string& s);

  /// Local weekday name, e.g. "Monday".
  std::string localDayOfWeek(TimePoint tp);

  std::int64_t toUnixMillis(TimePoint tp);
  TimePoint fromUnixMillis(std::int64_t ms);

  /// Fractional hours from \p from to \p to (negative when \p to precedes \p from).
  double hoursBetween(TimePoint from, TimePoint to);
  double minutesBetween(TimePoint from, TimePoint to);

} // namespace vibedj::core
