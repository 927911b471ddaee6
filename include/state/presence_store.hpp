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
#include "data/presence.hpp"
#include "result_monad.hpp"
#include "state/sqlite_connection.hpp"

namespace lanlens {

// Durable presence history, one row per observation.
class IPresenceStore {
public:
  using time_point = std::chrono::system_clock::time_point;

  virtual ~IPresenceStore() = default;

  virtual std::optional<std::string> record(const data::PresenceRecord &r) = 0;
  virtual std::optional<std::string>
  record_batch(const std::vector<data::PresenceRecord> &records) = 0;

  // Ascending by timestamp. `since` unset returns everything.
  virtual monad::MyResult<std::vector<data::PresenceRecord>>
  history_since(const std::string &mac,
                std::optional<time_point> since) const = 0;
  virtual monad::MyResult<std::vector<data::PresenceRecord>>
  history_range(const std::string &mac, time_point from,
                time_point to) const = 0;
  virtual monad::MyResult<std::vector<std::string>>
  devices_seen_between(time_point from, time_point to) const = 0;

  // Records for `mac`, or all records when `mac` is unset.
  virtual monad::MyResult<int64_t> count(const std::optional<std::string> &mac) const = 0;
  virtual std::optional<std::string> delete_by_mac(const std::string &mac) = 0;
  virtual monad::MyResult<int64_t> prune_older_than(time_point cutoff) = 0;
  virtual monad::MyResult<data::UptimeStats>
  uptime_stats(const std::string &mac, std::optional<time_point> since) const = 0;
  virtual monad::MyResult<std::optional<data::PresenceRecord>>
  latest_record(const std::string &mac) const = 0;

  virtual bool available() const = 0;
};

class SqlitePresenceStore : public IPresenceStore {
public:
  explicit SqlitePresenceStore(ILanlensConfigProvider &config_provider);
  ~SqlitePresenceStore() override = default;

  std::optional<std::string> record(const data::PresenceRecord &r) override;
  std::optional<std::string>
  record_batch(const std::vector<data::PresenceRecord> &records) override;
  monad::MyResult<std::vector<data::PresenceRecord>>
  history_since(const std::string &mac,
                std::optional<time_point> since) const override;
  monad::MyResult<std::vector<data::PresenceRecord>>
  history_range(const std::string &mac, time_point from,
                time_point to) const override;
  monad::MyResult<std::vector<std::string>>
  devices_seen_between(time_point from, time_point to) const override;
  monad::MyResult<int64_t> count(const std::optional<std::string> &mac) const override;
  std::optional<std::string> delete_by_mac(const std::string &mac) override;
  monad::MyResult<int64_t> prune_older_than(time_point cutoff) override;
  monad::MyResult<data::UptimeStats>
  uptime_stats(const std::string &mac,
               std::optional<time_point> since) const override;
  monad::MyResult<std::optional<data::PresenceRecord>>
  latest_record(const std::string &mac) const override;
  bool available() const override;

private:
  bool ensure_initialized() const;
  std::optional<std::string> insert_locked(const data::PresenceRecord &r) const;
  monad::MyResult<std::vector<data::PresenceRecord>>
  query_records(const char *sql, const std::string &mac,
                std::optional<int64_t> a, std::optional<int64_t> b) const;

  ILanlensConfigProvider &config_provider_;
  mutable std::mutex mutex_;
  mutable std::unique_ptr<SqliteConnection> db_;
  mutable bool initialized_{false};
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
