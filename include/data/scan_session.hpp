#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lanlens::data {
namespace json = boost::json;

enum class ScanType { quick, full, passive };

std::string to_string(ScanType t);

enum class ScanErrorSource {
  arpScanner,
  portScanner,
  mdnsListener,
  ssdpListener,
  fingerprinting,
  network,
  permission
};

std::string to_string(ScanErrorSource s);

struct ScanError {
  std::chrono::system_clock::time_point timestamp{};
  ScanErrorSource source{ScanErrorSource::network};
  std::string message;
  std::optional<int> code;
  bool is_recoverable{true};
};

// Bookkeeping for one scan run. Failures of single-device work land in
// `errors`, they never abort the session.
struct ScanSession {
  std::string id;
  std::chrono::system_clock::time_point start_time{};
  ScanType type{ScanType::quick};
  std::optional<std::chrono::system_clock::time_point> end_time;
  int discovered_count{0};
  int updated_count{0};
  std::vector<ScanError> errors;

  static ScanSession begin(ScanType type,
                           std::chrono::system_clock::time_point now =
                               std::chrono::system_clock::now());

  void finish(std::chrono::system_clock::time_point now =
                  std::chrono::system_clock::now()) {
    end_time = now;
  }

  void add_error(ScanErrorSource source, std::string message,
                 std::optional<int> code = std::nullopt,
                 bool recoverable = true,
                 std::chrono::system_clock::time_point now =
                     std::chrono::system_clock::now());

  std::optional<std::chrono::duration<double>> duration() const {
    if (!end_time) return std::nullopt;
    return std::chrono::duration<double>(*end_time - start_time);
  }
  bool is_complete() const { return end_time.has_value(); }
  bool is_successful() const { return is_complete() && errors.empty(); }
  int total_devices_affected() const { return discovered_count + updated_count; }

  // "350 ms", "12.5 sec" or "2m 5s".
  std::optional<std::string> formatted_duration() const;

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const ScanSession &s);
};

} // namespace lanlens::data
