#pragma once

#include <date/date.h>

#include <chrono>
#include <ctime>
#include <functional>

namespace lanlens {

// Wall clock source; components take one so tests can move time.
using WallClock = std::function<std::chrono::system_clock::time_point()>;

inline WallClock system_wall_clock() {
  return [] { return std::chrono::system_clock::now(); };
}

// Hour (0-23) a timestamp falls in.
using HourOfDay = std::function<int(std::chrono::system_clock::time_point)>;

inline int utc_hour_of_day(std::chrono::system_clock::time_point tp) {
  auto since_midnight = tp - date::floor<date::days>(tp);
  return static_cast<int>(
      date::hh_mm_ss<std::chrono::system_clock::duration>(since_midnight)
          .hours()
          .count());
}

inline int local_hour_of_day(std::chrono::system_clock::time_point tp) {
  std::time_t raw = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  if (localtime_r(&raw, &tm) == nullptr) {
    return utc_hour_of_day(tp);
  }
  return tm.tm_hour;
}

} // namespace lanlens
