/* @file TimeUtil.cpp
 * @brief POSIX time conversions (gmtime_r/timegm/strftime)
 *
 * © 2025 VibeDJ — MIT-licensed.
 */

// STL headers
#include <cctype>
#include <cstdio>
#include <ctime>
#include <string>

// VibeDJ headers
#include "core/TimeUtil.hpp"

namespace vibedj::core {

  namespace {

    std::tm toUtcTm(TimePoint tp) {
      const std::time_t t = SystemClock::to_time_t(tp);
      std::tm out{};
      gmtime_r(&t, &out);
      return out;
    }

    std::string format(const std::tm& tm, const char* fmt) {
      char buf[64];
      const std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
      return std::string(buf, n);
    }

  } // namespace

  UtcDate utcDate(TimePoint tp) {
    const std::tm tm = toUtcTm(tp);
    UtcDate d;
    d.year = tm.tm_year + 1900;
    d.month = tm.tm_mon + 1;
    d.day = tm.tm_mday;
    d.isoWeek = std::stoi(format(tm, "%V"));
    return d;
  }

  std::string utcDateString(TimePoint tp) { return format(toUtcTm(tp), "%Y-%m-%d"); }

  std::optional<TimePoint> parseUtcDateString(const std::string& s) {
    int y = 0, m = 0, d = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d", &y, &m, &d) != 3)
      return std::nullopt;
    if (m < 1 || m > 12 || d < 1 || d > 31)
      return std::nullopt;
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = m - 1;
    tm.tm_mday = d;
    return SystemClock::from_time_t(timegm(&tm));
  }

  std::string toIsoUtc(TimePoint tp) { return format(toUtcTm(tp), "%Y-%m-%dT%H:%M:%SZ"); }

  std::optional<TimePoint> parseIsoUtc(const std::string& s) {
    int y = 0, mo = 0, d = 0, h = 0, mi = 0, sec = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d", &y, &mo, &d, &h, &mi, &sec) != 6)
      return std::nullopt;
    if (mo < 1 || mo > 12 || d < 1 || d > 31 || h > 23 || mi > 59 || sec > 60)
      return std::nullopt;
    std::tm tm{};
    tm.tm_year = y - 1900;
    tm.tm_mon = mo - 1;
    tm.tm_mday = d;
    tm.tm_hour = h;
    tm.tm_min = mi;
    tm.tm_sec = sec;
    TimePoint tp = SystemClock::from_time_t(timegm(&tm));

    // optional ".fff" fraction
    const auto dot = s.find('.', 19);
    if (dot == 19) {
      long long frac = 0;
      int digits = 0;
      for (std::size_t i = dot + 1; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]));
           ++i) {
        if (digits < 3) {
          frac = frac * 10 + (s[i] - '0');
          ++digits;
        }
      }
      while (digits < 3) {
        frac *= 10;
        ++digits;
      }
      tp += std::chrono::milliseconds(frac);
    }
    return tp;
  }

  std::string localDayOfWeek(TimePoint tp) {
    const std::time_t t = SystemClock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    return format(tm, "%A");
  }

  std::int64_t toUnixMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
  }

  TimePoint fromUnixMillis(std::int64_t ms) {
    return TimePoint(std::chrono::duration_cast<SystemClock::duration>(std::chrono::milliseconds(ms)));
  }

  double hoursBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<3600>>(to - from).count();
  }

  double minutesBetween(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::ratio<60>>(to - from).count();
  }

} // namespace vibedj::core
