#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "data/observations.hpp"
#include "result_monad.hpp"

namespace lanlens {

inline constexpr const char *kSsdpMulticastGroup = "239.255.255.250";
inline constexpr unsigned short kSsdpPort = 1900;

// M-SEARCH request for the given search target.
std::string build_msearch(int mx = 3, std::string_view search_target = "ssdp:all");

/**
 * Parses an SSDP search response or NOTIFY. Header names are matched case
 * insensitively. LOCATION and USN are required. The host comes from the
 * LOCATION URL, falling back to `sender_ip`. NT stands in for a missing ST.
 */
std::optional<data::SsdpAnnouncement>
parse_ssdp_response(std::string_view message, const std::string &sender_ip = {});

class ISsdpSearcher {
public:
  virtual ~ISsdpSearcher() = default;

  // Sends one M-SEARCH and collects answers for `listen`, one per USN.
  virtual monad::MyResult<std::vector<data::SsdpAnnouncement>>
  search(std::chrono::seconds listen) = 0;
};

class AsioSsdpSearcher : public ISsdpSearcher {
public:
  monad::MyResult<std::vector<data::SsdpAnnouncement>>
  search(std::chrono::seconds listen) override;

private:
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
