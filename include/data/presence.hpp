#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lanlens::data {
namespace json = boost::json;

// One timestamped online/offline sample for a device.
struct PresenceRecord {
  std::string mac;
  std::chrono::system_clock::time_point timestamp{};
  bool is_online{false};
  std::optional<std::string> ip_address;
  std::vector<std::string> available_services;

  bool operator==(const PresenceRecord &) const = default;
};

enum class BehaviorClassification {
  infrastructure,
  server,
  workstation,
  portable,
  mobile,
  iot,
  guest,
  unknown
};

std::string to_string(BehaviorClassification c);

struct BehaviorProfile {
  std::string mac;
  std::vector<PresenceRecord> presence_history;
  int observation_count{0};
  double uptime_percent{0.0};
  std::vector<int> peak_hours;
  bool has_daily_pattern{false};
  BehaviorClassification classification{BehaviorClassification::unknown};
  std::set<std::string> consistent_services;
  bool is_always_on{false};
  bool is_intermittent{false};
  std::chrono::system_clock::time_point first_observed{};
  std::chrono::system_clock::time_point last_observed{};

  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const BehaviorProfile &p);
};

struct UptimeStats {
  int total_records{0};
  int online_records{0};
  std::optional<std::chrono::system_clock::time_point> first_seen;
  std::optional<std::chrono::system_clock::time_point> last_seen;

  double uptime_percent() const {
    if (total_records <= 0) return 0.0;
    return static_cast<double>(online_records) / total_records * 100.0;
  }
};

} // namespace lanlens::data
