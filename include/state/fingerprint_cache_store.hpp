#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/fingerprint.hpp"
#include "result_monad.hpp"
#include "state/sqlite_connection.hpp"

namespace lanlens {

struct FingerprintCacheStats {
  int64_t total_entries{0};
  int64_t valid_entries{0};
  int64_t total_hits{0};
  int64_t total_misses{0};
  std::optional<std::chrono::system_clock::time_point> last_prune_at;

  double hit_rate() const {
    auto total = total_hits + total_misses;
    return total > 0 ? static_cast<double>(total_hits) / total : 0.0;
  }
};

// Durable cache of remote fingerprint lookups, keyed by MAC and validated by
// the hash of the signals the lookup was made with.
class IFingerprintCacheStore {
public:
  using time_point = std::chrono::system_clock::time_point;

  virtual ~IFingerprintCacheStore() = default;

  // Entry for `mac` when it has not expired at `now` and its signal hash
  // equals `signal_hash`. A hit bumps the hit counters, anything else counts
  // as a miss. Returned fingerprints carry cache_hit = true.
  virtual monad::MyResult<std::optional<data::DeviceFingerprint>>
  get(const std::string &mac, const std::string &signal_hash,
      time_point now) = 0;

  virtual std::optional<std::string>
  put(const std::string &mac, const data::DeviceFingerprint &fp,
      const std::string &signal_hash,
      const std::optional<std::string> &dhcp_fingerprint,
      const std::optional<std::vector<std::string>> &user_agents,
      std::chrono::seconds ttl, time_point now) = 0;

  virtual std::optional<std::string> invalidate(const std::string &mac) = 0;
  virtual monad::MyResult<int64_t> prune_expired(time_point now) = 0;
  virtual std::optional<std::string> clear() = 0;
  virtual monad::MyResult<FingerprintCacheStats> stats(time_point now) const = 0;
  virtual bool available() const = 0;
};

class SqliteFingerprintCacheStore : public IFingerprintCacheStore {
public:
  explicit SqliteFingerprintCacheStore(ILanlensConfigProvider &config_provider);

  monad::MyResult<std::optional<data::DeviceFingerprint>>
  get(const std::string &mac, const std::string &signal_hash,
      time_point now) override;
  std::optional<std::string>
  put(const std::string &mac, const data::DeviceFingerprint &fp,
      const std::string &signal_hash,
      const std::optional<std::string> &dhcp_fingerprint,
      const std::optional<std::vector<std::string>> &user_agents,
      std::chrono::seconds ttl, time_point now) override;
  std::optional<std::string> invalidate(const std::string &mac) override;
  monad::MyResult<int64_t> prune_expired(time_point now) override;
  std::optional<std::string> clear() override;
  monad::MyResult<FingerprintCacheStats> stats(time_point now) const override;
  bool available() const override;

private:
  bool ensure_initialized() const;
  std::optional<std::string> bump_stat(const char *sql) const;

  ILanlensConfigProvider &config_provider_;
  mutable std::mutex mutex_;
  mutable std::unique_ptr<SqliteConnection> db_;
  mutable bool initialized_{false};
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
