#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace lanlens::data {
namespace json = boost::json;

// Ordered by severity.
enum class RiskLevel { low, medium, high, critical };

std::string to_string(RiskLevel r);
RiskLevel risk_level_from_string(const std::string &s);

struct RiskFactor {
  std::string category;
  std::string description;
  RiskLevel severity{RiskLevel::low};
  int score_contribution{0};
  std::string remediation;

  bool operator==(const RiskFactor &) const = default;
};

struct SecurityPosture {
  RiskLevel risk_level{RiskLevel::low};
  int risk_score{0}; // 0..100
  std::vector<RiskFactor> risk_factors;
  std::vector<int> risky_ports;
  bool has_web_interface{false};
  bool uses_encryption{false};
  std::chrono::system_clock::time_point assessed_at{};

  bool operator==(const SecurityPosture &) const = default;

  friend SecurityPosture tag_invoke(const json::value_to_tag<SecurityPosture> &,
                                    const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const SecurityPosture &p);
};

} // namespace lanlens::data
