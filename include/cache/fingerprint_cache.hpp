#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/fingerprint.hpp"
#include "result_monad.hpp"
#include "state/fingerprint_cache_store.hpp"
#include "util/clock.hpp"

namespace lanlens {

struct UpnpCacheStats {
  size_t entry_count{0};
  int64_t hits{0};
  int64_t misses{0};
};

/**
 * Two-level fingerprint cache.
 *
 * UPnP descriptions are held in memory, keyed by MAC and description URL,
 * for cache.upnp_ttl_hours. Remote lookups go to the durable store and are
 * validated against the signal hash of the device's secondary signals, so a
 * changed DHCP fingerprint or user agent set misses before the TTL runs out.
 */
class FingerprintCache {
public:
  FingerprintCache(IFingerprintCacheStore &store,
                   ILanlensConfigProvider &config_provider);

  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  // sha256 hex of "<MAC>[:<dhcp>][:<ua1,ua2,...>]", user agents sorted.
  static std::string
  signal_hash(const std::string &mac,
              const std::optional<std::string> &dhcp_fingerprint,
              const std::optional<std::vector<std::string>> &user_agents);

  std::optional<data::DeviceFingerprint>
  get_upnp(const std::string &mac, const std::string &location_url);
  void put_upnp(const std::string &mac, const std::string &location_url,
                const data::DeviceFingerprint &fp);

  // Corrupt entries are dropped and reported as a miss.
  std::optional<data::DeviceFingerprint>
  get_remote(const std::string &mac,
             const std::optional<std::string> &dhcp_fingerprint,
             const std::optional<std::vector<std::string>> &user_agents);
  void put_remote(const std::string &mac, const data::DeviceFingerprint &fp,
                  const std::optional<std::string> &dhcp_fingerprint,
                  const std::optional<std::vector<std::string>> &user_agents);

  void invalidate(const std::string &mac);
  // Expired UPnP entries plus expired durable rows; returns the total removed.
  int64_t prune();
  void clear();

  UpnpCacheStats upnp_stats() const;
  monad::MyResult<FingerprintCacheStats> remote_stats() const;

private:
  struct UpnpEntry {
    data::DeviceFingerprint fingerprint;
    std::chrono::system_clock::time_point expires_at;
  };

  IFingerprintCacheStore &store_;
  std::chrono::hours upnp_ttl_;
  std::chrono::seconds remote_ttl_;
  WallClock clock_{system_wall_clock()};

  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, UpnpEntry> upnp_;
  int64_t upnp_hits_{0};
  int64_t upnp_misses_{0};
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
