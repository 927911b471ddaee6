#include "data/security.hpp"

#include <stdexcept>

#include "util/string_util.hpp"

namespace lanlens::data {

std::string to_string(RiskLevel r) {
  switch (r) {
  case RiskLevel::low:
    return "low";
  case RiskLevel::medium:
    return "medium";
  case RiskLevel::high:
    return "high";
  case RiskLevel::critical:
    return "critical";
  }
  return "low";
}

RiskLevel risk_level_from_string(const std::string &s) {
  if (s == "critical") return RiskLevel::critical;
  if (s == "high") return RiskLevel::high;
  if (s == "medium") return RiskLevel::medium;
  return RiskLevel::low;
}

SecurityPosture tag_invoke(const json::value_to_tag<SecurityPosture> &,
                           const json::value &jv) {
  auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("SecurityPosture is not an object");
  }
  const auto &jo = *jo_p;
  SecurityPosture p{};
  if (auto *v = jo.if_contains("riskLevel"); v && v->is_string())
    p.risk_level = risk_level_from_string(v->as_string().c_str());
  if (auto *v = jo.if_contains("riskScore"); v && v->is_number())
    p.risk_score = static_cast<int>(v->to_number<int64_t>());
  if (auto *v = jo.if_contains("riskFactors"); v && v->is_array()) {
    for (const auto &fv : v->as_array()) {
      const auto &fo = fv.as_object();
      RiskFactor f{};
      if (auto *c = fo.if_contains("category"); c && c->is_string())
        f.category = c->as_string().c_str();
      if (auto *d = fo.if_contains("description"); d && d->is_string())
        f.description = d->as_string().c_str();
      if (auto *s = fo.if_contains("severity"); s && s->is_string())
        f.severity = risk_level_from_string(s->as_string().c_str());
      if (auto *n = fo.if_contains("scoreContribution"); n && n->is_number())
        f.score_contribution = static_cast<int>(n->to_number<int64_t>());
      if (auto *r = fo.if_contains("remediation"); r && r->is_string())
        f.remediation = r->as_string().c_str();
      p.risk_factors.push_back(std::move(f));
    }
  }
  if (auto *v = jo.if_contains("riskyPorts"); v && v->is_array()) {
    for (const auto &pv : v->as_array()) {
      if (pv.is_number()) p.risky_ports.push_back(static_cast<int>(pv.to_number<int64_t>()));
    }
  }
  if (auto *v = jo.if_contains("hasWebInterface"); v && v->is_bool())
    p.has_web_interface = v->as_bool();
  if (auto *v = jo.if_contains("usesEncryption"); v && v->is_bool())
    p.uses_encryption = v->as_bool();
  if (auto *v = jo.if_contains("assessedAt"); v && v->is_string()) {
    if (auto tp = stringutil::parseISO8601(v->as_string().c_str())) p.assessed_at = *tp;
  }
  return p;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const SecurityPosture &p) {
  json::array factors;
  for (const auto &f : p.risk_factors) {
    factors.push_back(json::object{{"category", f.category},
                                   {"description", f.description},
                                   {"severity", to_string(f.severity)},
                                   {"scoreContribution", f.score_contribution},
                                   {"remediation", f.remediation}});
  }
  json::array ports;
  for (int port : p.risky_ports) ports.push_back(port);
  jv = json::object{{"riskLevel", to_string(p.risk_level)},
                    {"riskScore", p.risk_score},
                    {"riskFactors", std::move(factors)},
                    {"riskyPorts", std::move(ports)},
                    {"hasWebInterface", p.has_web_interface},
                    {"usesEncryption", p.uses_encryption},
                    {"assessedAt", stringutil::formatISO8601(p.assessed_at)}};
}

} // namespace lanlens::data
