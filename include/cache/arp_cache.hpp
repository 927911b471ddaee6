#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/observations.hpp"
#include "discovery/proc_arp_reader.hpp"
#include "result_monad.hpp"
#include "util/clock.hpp"

namespace lanlens {

struct ArpCacheStats {
  size_t entry_count{0};
  int64_t hits{0};
  int64_t misses{0};
  int64_t refresh_count{0};
  std::optional<std::chrono::system_clock::time_point> last_refresh;

  double hit_rate() const {
    auto total = hits + misses;
    return total > 0 ? static_cast<double>(hits) / total : 0.0;
  }
};

/**
 * TTL cache in front of the system ARP table. Entries are keyed by MAC with
 * a reverse IP index. When a refresh would push the entry count past the
 * ceiling, the entries with the oldest insertion time go first.
 */
class ArpCache {
public:
  ArpCache(IArpTableReader &reader, ILanlensConfigProvider &config_provider);

  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  std::optional<data::ArpEntry> get_by_mac(const std::string &mac);
  std::optional<data::ArpEntry> get_by_ip(const std::string &ip);

  // Refreshes first when forced or when the last refresh is older than TTL.
  monad::MyResult<std::vector<data::ArpEntry>> get_table(bool force_refresh = false);

  // Re-reads the system table and returns exactly the entries it held, with
  // MACs normalized. Entries that left the table stay cached until they
  // expire, but are not part of the returned snapshot.
  monad::MyResult<std::vector<data::ArpEntry>> refresh();
  void clear();

  // Drops entries older than the TTL. Returns how many were removed.
  size_t prune();

  // Inserts entries as if read from the table, without counting a refresh.
  void put(const std::vector<data::ArpEntry> &entries);

  ArpCacheStats stats() const;
  void reset_stats();

private:
  struct CachedEntry {
    data::ArpEntry entry;
    std::chrono::system_clock::time_point cached_at;
  };

  bool expired(const CachedEntry &e,
               std::chrono::system_clock::time_point now) const;
  void update_locked(const std::vector<data::ArpEntry> &entries);
  void evict_oldest_locked(size_t count);

  IArpTableReader &reader_;
  std::chrono::seconds ttl_;
  size_t max_entries_;
  WallClock clock_{system_wall_clock()};

  mutable std::mutex mutex_;
  std::map<std::string, CachedEntry> cache_;
  std::map<std::string, std::string> ip_index_;
  std::optional<std::chrono::system_clock::time_point> last_refresh_;
  int64_t hits_{0};
  int64_t misses_{0};
  int64_t refresh_count_{0};
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
