#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "data/observations.hpp"
#include "data/security.hpp"

namespace lanlens {

/**
 * Scores how exposed a device looks from the LAN.
 *
 * Inputs are what discovery already collected: open TCP ports, the
 * hostname and raw service banners. Levels:
 * critical when a database port or Telnet is open or any factor is
 * critical; high for RDP/VNC, three or more risky ports, two high factors
 * or a score of 25+; medium from a score of 10; low otherwise. The score is
 * capped at 100.
 */
class SecurityPostureAssessor {
public:
  data::SecurityPosture assess(const std::optional<std::string> &hostname,
                               const std::vector<int> &open_ports,
                               const data::BannerData &banners,
                               std::chrono::system_clock::time_point now) const;

  // Keeps [A-Za-z0-9._-] of the first 63 characters.
  static std::string sanitize_hostname(const std::string &hostname);

private:
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
