#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "conf/lanlens_config.hpp"
#include "data/presence.hpp"
#include "inference/signal.hpp"
#include "state/presence_store.hpp"
#include "util/clock.hpp"

namespace lanlens {

/**
 * Per-device presence accumulator and behavior classifier.
 *
 * Profiles live in an in-memory cache bounded by behavior.max_profiles with
 * least-recently-accessed eviction; evicting a profile never touches the
 * durable history in IPresenceStore. Observations are queued and written in
 * batches every behavior.persist_interval records. A failed write keeps the
 * batch queued for the next flush.
 */
class BehaviorTracker {
public:
  using time_point = std::chrono::system_clock::time_point;

  BehaviorTracker(IPresenceStore &store,
                  ILanlensConfigProvider &config_provider);
  ~BehaviorTracker();

  BehaviorTracker(const BehaviorTracker &) = delete;
  BehaviorTracker &operator=(const BehaviorTracker &) = delete;

  void set_clock(WallClock clock) { clock_ = std::move(clock); }
  void set_hour_of_day(HourOfDay fn) { hour_of_day_ = std::move(fn); }

  // Store salted SHA-256 digests instead of MAC addresses. An empty salt
  // draws a random one.
  void set_hash_device_ids(bool enabled, std::string salt = {});

  void record_presence(const std::string &device_id, bool is_online,
                       const std::vector<std::string> &services = {},
                       const std::optional<std::string> &ip = std::nullopt);

  // Cached profile, else one rebuilt from the durable history.
  std::optional<data::BehaviorProfile> get_profile(const std::string &device_id);

  data::BehaviorClassification
  update_classification(const std::string &device_id);

  // Reclassifies first, then maps the classification to inference signals.
  std::vector<Signal> signals_for(const std::string &device_id);

  static std::vector<Signal>
  generate_signals(const data::BehaviorProfile &profile,
                   int min_observations = 10);

  void remove_profile(const std::string &device_id);
  // Memory only; durable history stays.
  void clear_all_profiles();
  size_t tracked_device_count() const;

  monad::MyVoidResult flush_pending();
  size_t pending_count() const;

  // Defaults to behavior.retention_days.
  int64_t prune_old_records(std::optional<int> retention_days = std::nullopt);
  std::vector<data::PresenceRecord>
  presence_history(const std::string &device_id,
                   std::optional<time_point> since = std::nullopt);
  data::UptimeStats uptime_stats(const std::string &device_id,
                                 std::optional<time_point> since = std::nullopt);
  std::vector<std::string> devices_seen_between(time_point from, time_point to);

  // Loads profiles for devices seen in the last `days` days.
  void warm_from_store(int days = 7);

  std::string storage_id(const std::string &device_id);

  static double uptime_percent(const std::vector<data::PresenceRecord> &history);
  static std::vector<int>
  peak_hours(const std::vector<data::PresenceRecord> &history,
             const HourOfDay &hour_of_day);
  static bool detect_daily_pattern(const std::vector<int> &peak_hours);
  static data::BehaviorClassification classify(double uptime_percent,
                                               bool has_daily_pattern,
                                               int observation_count,
                                               int min_observations = 10);
  static bool is_business_hours_peak(const std::vector<int> &peak_hours);
  static bool is_evening_peak(const std::vector<int> &peak_hours);
  static std::set<std::string>
  consistent_services(const std::vector<data::PresenceRecord> &history);

private:
  struct CachedProfile {
    data::BehaviorProfile profile;
    uint64_t last_access{0};
  };

  std::string storage_id_locked(const std::string &device_id);
  data::BehaviorProfile
  build_profile(const std::string &id,
                const std::vector<data::PresenceRecord> &history) const;
  // Cached or rebuilt from the store; nullptr when there is no history.
  data::BehaviorProfile *profile_locked(const std::string &id);
  void evict_if_needed_locked();

  IPresenceStore &store_;
  size_t max_history_;
  int min_observations_;
  size_t max_profiles_;
  int persist_interval_;
  int retention_days_;
  WallClock clock_{system_wall_clock()};
  HourOfDay hour_of_day_{local_hour_of_day};

  mutable std::mutex mutex_;
  std::map<std::string, CachedProfile> profiles_;
  uint64_t access_seq_{0};
  std::vector<data::PresenceRecord> pending_;
  int updates_since_persist_{0};
  bool hash_ids_{false};
  std::string salt_;
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
