#pragma once

#include <date/date.h>

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lanlens {
namespace stringutil {

std::string generate_uuid(const std::string& prefix = "", bool no_dash = false);

// Trim leading and trailing whitespace from a string
inline void trim(std::string& str) {
  auto start = std::find_if_not(str.begin(), str.end(), ::isspace);
  auto end = std::find_if_not(str.rbegin(), str.rend(), ::isspace).base();
  str = start < end ? std::string(start, end) : std::string{};
}

inline std::string trimmed(std::string str) {
  trim(str);
  return str;
}

inline std::string toLowerCase(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpperCase(std::string_view str) {
  std::string result(str);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline bool contains(std::string_view haystack, std::string_view needle) {
  return haystack.find(needle) != std::string_view::npos;
}

inline bool contains_any(std::string_view haystack,
                         std::initializer_list<std::string_view> needles) {
  return std::any_of(needles.begin(), needles.end(),
                     [&](std::string_view n) { return contains(haystack, n); });
}

inline bool starts_with(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool ends_with(std::string_view str, std::string_view suffix) {
  return str.size() >= suffix.size() &&
         str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_trim(const std::string& str, char delim = ' ',
                                    bool skip_empty = true);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

std::string replace_all(std::string input, std::string_view from,
                        std::string_view to);

inline std::string formatISO8601(
    const std::chrono::system_clock::time_point& tp) {
  return date::format("%FT%TZ", date::floor<std::chrono::seconds>(tp));
}

// Parses "YYYY-MM-DDTHH:MM:SSZ"; fractional seconds are dropped.
std::optional<std::chrono::system_clock::time_point> parseISO8601(
    const std::string& iso8601);

inline int64_t to_epoch_seconds(const std::chrono::system_clock::time_point& tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch())
      .count();
}

inline std::chrono::system_clock::time_point from_epoch_seconds(int64_t secs) {
  return std::chrono::system_clock::time_point(std::chrono::seconds(secs));
}

std::string readFile(const std::string& filePath, std::error_code& ec);

}  // namespace stringutil
}  // namespace lanlens
