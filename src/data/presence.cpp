#include "data/presence.hpp"

#include "util/string_util.hpp"

namespace lanlens::data {

std::string to_string(BehaviorClassification c) {
  switch (c) {
  case BehaviorClassification::infrastructure:
    return "infrastructure";
  case BehaviorClassification::server:
    return "server";
  case BehaviorClassification::workstation:
    return "workstation";
  case BehaviorClassification::portable:
    return "portable";
  case BehaviorClassification::mobile:
    return "mobile";
  case BehaviorClassification::iot:
    return "iot";
  case BehaviorClassification::guest:
    return "guest";
  case BehaviorClassification::unknown:
    break;
  }
  return "unknown";
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const BehaviorProfile &p) {
  json::array peaks;
  for (int h : p.peak_hours) {
    peaks.push_back(h);
  }
  json::array services;
  for (const auto &s : p.consistent_services) {
    services.push_back(json::string(s));
  }
  jv = json::object{
      {"mac", p.mac},
      {"observationCount", p.observation_count},
      {"uptimePercent", p.uptime_percent},
      {"peakHours", std::move(peaks)},
      {"hasDailyPattern", p.has_daily_pattern},
      {"classification", to_string(p.classification)},
      {"consistentServices", std::move(services)},
      {"isAlwaysOn", p.is_always_on},
      {"isIntermittent", p.is_intermittent},
      {"firstObserved", stringutil::formatISO8601(p.first_observed)},
      {"lastObserved", stringutil::formatISO8601(p.last_observed)},
  };
}

} // namespace lanlens::data
