#include "behavior/behavior_tracker.hpp"

#include <algorithm>

#include "lanlens_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace {

constexpr double kInfrastructureUptime = 95.0;
constexpr double kIotUptime = 85.0;
constexpr double kWorkstationUptime = 50.0;
constexpr double kPortableUptime = 20.0;
constexpr double kMobileUptime = 5.0;

int count_in_range(const std::vector<int> &peak_hours, int from, int to) {
  return static_cast<int>(std::count_if(
      peak_hours.begin(), peak_hours.end(),
      [from, to](int h) { return h >= from && h <= to; }));
}

} // namespace

BehaviorTracker::BehaviorTracker(IPresenceStore &store,
                                 ILanlensConfigProvider &config_provider)
    : store_(store) {
  const auto &cfg = config_provider.get().behavior;
  max_history_ = static_cast<size_t>(std::max(1, cfg.max_history));
  min_observations_ = std::max(1, cfg.min_observations);
  max_profiles_ = static_cast<size_t>(std::max(1, cfg.max_profiles));
  persist_interval_ = std::max(1, cfg.persist_interval);
  retention_days_ = std::max(1, cfg.retention_days);
}

BehaviorTracker::~BehaviorTracker() {
  auto r = flush_pending();
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Dropping " << pending_count()
        << " unsaved presence records: " << r.error().what;
  }
}

void BehaviorTracker::set_hash_device_ids(bool enabled, std::string salt) {
  std::scoped_lock lock(mutex_);
  hash_ids_ = enabled;
  if (!salt.empty()) {
    salt_ = std::move(salt);
  }
}

std::string BehaviorTracker::storage_id(const std::string &device_id) {
  std::scoped_lock lock(mutex_);
  return storage_id_locked(device_id);
}

std::string BehaviorTracker::storage_id_locked(const std::string &device_id) {
  auto normalized = stringutil::toUpperCase(device_id);
  if (!hash_ids_) {
    return normalized;
  }
  if (salt_.empty()) {
    auto bytes = opensslutil::random_bytes(16);
    salt_ = opensslutil::to_hex(bytes.data(), bytes.size());
  }
  return opensslutil::sha256_hex(salt_ + normalized);
}

void BehaviorTracker::record_presence(const std::string &device_id,
                                      bool is_online,
                                      const std::vector<std::string> &services,
                                      const std::optional<std::string> &ip) {
  bool flush_due = false;
  {
    std::scoped_lock lock(mutex_);
    const auto id = storage_id_locked(device_id);
    const auto now = clock_();

    data::PresenceRecord record{id, now, is_online, ip, services};

    auto [it, inserted] = profiles_.try_emplace(id);
    auto &profile = it->second.profile;
    if (inserted) {
      profile.mac = id;
      profile.first_observed = now;
    }
    profile.last_observed = now;
    profile.observation_count += 1;
    profile.presence_history.push_back(record);
    if (profile.presence_history.size() > max_history_) {
      auto overflow = profile.presence_history.size() - max_history_;
      profile.presence_history.erase(
          profile.presence_history.begin(),
          profile.presence_history.begin() +
              static_cast<std::ptrdiff_t>(overflow));
    }
    if (is_online && !services.empty()) {
      profile.consistent_services = consistent_services(profile.presence_history);
    }
    it->second.last_access = ++access_seq_;

    pending_.push_back(std::move(record));
    evict_if_needed_locked();

    if (++updates_since_persist_ >= persist_interval_) {
      updates_since_persist_ = 0;
      flush_due = true;
    }
    BOOST_LOG_SEV(lg_, trivial::trace)
        << "Presence " << id << " online=" << is_online
        << " observations=" << profile.observation_count;
  }
  if (flush_due) {
    if (auto r = flush_pending(); r.is_err()) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Presence flush failed, records kept for retry: "
          << r.error().what;
    }
  }
}

monad::MyVoidResult BehaviorTracker::flush_pending() {
  std::vector<data::PresenceRecord> batch;
  {
    std::scoped_lock lock(mutex_);
    if (pending_.empty()) {
      return monad::MyVoidResult::Ok();
    }
    batch.swap(pending_);
  }
  if (auto err = store_.record_batch(batch)) {
    std::scoped_lock lock(mutex_);
    // Keep submission order: the failed batch goes back in front.
    batch.insert(batch.end(), std::make_move_iterator(pending_.begin()),
                 std::make_move_iterator(pending_.end()));
    pending_.swap(batch);
    return monad::MyVoidResult::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED, *err));
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Flushed " << batch.size() << " presence records";
  return monad::MyVoidResult::Ok();
}

size_t BehaviorTracker::pending_count() const {
  std::scoped_lock lock(mutex_);
  return pending_.size();
}

data::BehaviorProfile BehaviorTracker::build_profile(
    const std::string &id,
    const std::vector<data::PresenceRecord> &history) const {
  data::BehaviorProfile profile;
  profile.mac = id;
  if (history.empty()) {
    return profile;
  }
  auto [first, last] = std::minmax_element(
      history.begin(), history.end(),
      [](const auto &a, const auto &b) { return a.timestamp < b.timestamp; });
  profile.first_observed = first->timestamp;
  profile.last_observed = last->timestamp;
  profile.observation_count = static_cast<int>(history.size());
  auto start = history.size() > max_history_ ? history.size() - max_history_ : 0;
  profile.presence_history.assign(
      history.begin() + static_cast<std::ptrdiff_t>(start), history.end());
  profile.consistent_services = consistent_services(profile.presence_history);
  return profile;
}

data::BehaviorProfile *BehaviorTracker::profile_locked(const std::string &id) {
  auto it = profiles_.find(id);
  if (it != profiles_.end()) {
    it->second.last_access = ++access_seq_;
    return &it->second.profile;
  }
  auto history = store_.history_since(id, std::nullopt);
  if (history.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to load presence history for " << id << ": "
        << history.error().what;
    return nullptr;
  }
  // Records not yet flushed belong to the history too.
  auto records = std::move(history.value());
  for (const auto &r : pending_) {
    if (r.mac == id) records.push_back(r);
  }
  if (records.empty()) {
    return nullptr;
  }
  std::stable_sort(records.begin(), records.end(),
                   [](const auto &a, const auto &b) { return a.timestamp < b.timestamp; });
  auto &slot = profiles_[id];
  slot.profile = build_profile(id, records);
  slot.last_access = ++access_seq_;
  evict_if_needed_locked();
  auto again = profiles_.find(id);
  return again == profiles_.end() ? nullptr : &again->second.profile;
}

std::optional<data::BehaviorProfile>
BehaviorTracker::get_profile(const std::string &device_id) {
  std::scoped_lock lock(mutex_);
  if (auto *p = profile_locked(storage_id_locked(device_id))) {
    return *p;
  }
  return std::nullopt;
}

data::BehaviorClassification
BehaviorTracker::update_classification(const std::string &device_id) {
  std::scoped_lock lock(mutex_);
  const auto id = storage_id_locked(device_id);
  auto *profile = profile_locked(id);
  if (!profile) {
    return data::BehaviorClassification::unknown;
  }

  profile->uptime_percent = uptime_percent(profile->presence_history);
  profile->peak_hours = peak_hours(profile->presence_history, hour_of_day_);
  profile->has_daily_pattern = detect_daily_pattern(profile->peak_hours);
  profile->classification =
      classify(profile->uptime_percent, profile->has_daily_pattern,
               profile->observation_count, min_observations_);

  using C = data::BehaviorClassification;
  const auto c = profile->classification;
  profile->is_always_on = c == C::infrastructure || c == C::server || c == C::iot;
  profile->is_intermittent = c == C::portable || c == C::mobile || c == C::guest;

  BOOST_LOG_SEV(lg_, trivial::info)
      << "Classified " << id << " as " << data::to_string(c)
      << fmt::format(" (uptime {:.1f}%, observations {})",
                     profile->uptime_percent, profile->observation_count);
  return c;
}

std::vector<Signal> BehaviorTracker::signals_for(const std::string &device_id) {
  update_classification(device_id);
  std::scoped_lock lock(mutex_);
  auto it = profiles_.find(storage_id_locked(device_id));
  if (it == profiles_.end()) {
    return {};
  }
  return generate_signals(it->second.profile, min_observations_);
}

std::vector<Signal>
BehaviorTracker::generate_signals(const data::BehaviorProfile &profile,
                                  int min_observations) {
  using C = data::BehaviorClassification;
  using T = data::DeviceType;
  if (profile.observation_count < min_observations) {
    return {};
  }
  const auto behavior = SignalSource::behavior;
  switch (profile.classification) {
  case C::infrastructure:
    return {Signal(behavior, T::router, 0.40)};
  case C::server:
    return {Signal(behavior, T::nas, 0.35)};
  case C::iot:
    if (is_evening_peak(profile.peak_hours)) {
      return {Signal(behavior, T::smartTV, 0.35)};
    }
    return {Signal(behavior, T::hub, 0.30)};
  case C::workstation:
    if (is_business_hours_peak(profile.peak_hours)) {
      return {Signal(behavior, T::computer, 0.35)};
    }
    if (is_evening_peak(profile.peak_hours)) {
      return {Signal(behavior, T::smartTV, 0.35)};
    }
    return {Signal(behavior, T::computer, 0.30)};
  case C::portable:
    return {Signal(behavior, T::computer, 0.30)};
  case C::mobile:
    return {Signal(behavior, T::phone, 0.30)};
  case C::guest:
    return {Signal(behavior, T::phone, 0.25)};
  case C::unknown:
    break;
  }
  return {};
}

void BehaviorTracker::remove_profile(const std::string &device_id) {
  std::scoped_lock lock(mutex_);
  const auto id = storage_id_locked(device_id);
  profiles_.erase(id);
  std::erase_if(pending_, [&id](const auto &r) { return r.mac == id; });
  if (auto err = store_.delete_by_mac(id)) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to delete presence records for " << id << ": " << *err;
  }
}

void BehaviorTracker::clear_all_profiles() {
  std::scoped_lock lock(mutex_);
  profiles_.clear();
  pending_.clear();
  updates_since_persist_ = 0;
  BOOST_LOG_SEV(lg_, trivial::info) << "Cleared in-memory behavior profiles";
}

size_t BehaviorTracker::tracked_device_count() const {
  std::scoped_lock lock(mutex_);
  return profiles_.size();
}

void BehaviorTracker::evict_if_needed_locked() {
  if (profiles_.size() <= max_profiles_) {
    return;
  }
  auto count = profiles_.size() - max_profiles_;
  std::vector<std::pair<uint64_t, std::string>> order;
  order.reserve(profiles_.size());
  for (const auto &[id, cached] : profiles_) {
    order.emplace_back(cached.last_access, id);
  }
  std::sort(order.begin(), order.end());
  for (size_t i = 0; i < count; ++i) {
    profiles_.erase(order[i].second);
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Evicted behavior profile " << order[i].second;
  }
}

int64_t BehaviorTracker::prune_old_records(std::optional<int> retention_days) {
  const int days = retention_days.value_or(retention_days_);
  const auto cutoff = clock_() - std::chrono::hours(24 * days);
  auto r = store_.prune_older_than(cutoff);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to prune presence records: " << r.error().what;
    return 0;
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Pruned " << r.value()
                                    << " presence records older than " << days
                                    << " days";
  return r.value();
}

std::vector<data::PresenceRecord>
BehaviorTracker::presence_history(const std::string &device_id,
                                  std::optional<time_point> since) {
  auto id = storage_id(device_id);
  auto r = store_.history_since(id, since);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to fetch presence history for " << id << ": "
        << r.error().what;
    return {};
  }
  return r.value();
}

data::UptimeStats
BehaviorTracker::uptime_stats(const std::string &device_id,
                              std::optional<time_point> since) {
  auto id = storage_id(device_id);
  auto r = store_.uptime_stats(id, since);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to compute uptime for " << id << ": " << r.error().what;
    return {};
  }
  return r.value();
}

std::vector<std::string> BehaviorTracker::devices_seen_between(time_point from,
                                                               time_point to) {
  auto r = store_.devices_seen_between(from, to);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to list devices seen in range: " << r.error().what;
    return {};
  }
  return r.value();
}

void BehaviorTracker::warm_from_store(int days) {
  const auto now = clock_();
  const auto since = now - std::chrono::hours(24 * days);
  auto macs = store_.devices_seen_between(since, now);
  if (macs.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Failed to warm behavior profiles: " << macs.error().what;
    return;
  }
  std::scoped_lock lock(mutex_);
  for (const auto &id : macs.value()) {
    if (profiles_.size() >= max_profiles_) break;
    if (profiles_.contains(id)) continue;
    auto history = store_.history_since(id, since);
    if (history.is_err() || history.value().empty()) continue;
    auto &slot = profiles_[id];
    slot.profile = build_profile(id, history.value());
    slot.last_access = ++access_seq_;
  }
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Loaded " << profiles_.size() << " behavior profiles";
}

double
BehaviorTracker::uptime_percent(const std::vector<data::PresenceRecord> &history) {
  if (history.empty()) return 0.0;
  auto online = std::count_if(history.begin(), history.end(),
                              [](const auto &r) { return r.is_online; });
  return static_cast<double>(online) / static_cast<double>(history.size()) *
         100.0;
}

std::vector<int>
BehaviorTracker::peak_hours(const std::vector<data::PresenceRecord> &history,
                            const HourOfDay &hour_of_day) {
  std::map<int, int> counts;
  for (const auto &r : history) {
    if (r.is_online) {
      counts[hour_of_day(r.timestamp)] += 1;
    }
  }
  if (counts.empty()) return {};
  int max_count = 0;
  for (const auto &[hour, n] : counts) max_count = std::max(max_count, n);
  const int threshold = max_count / 2;
  std::vector<int> peaks;
  for (const auto &[hour, n] : counts) {
    if (n >= threshold) peaks.push_back(hour);
  }
  return peaks;
}

bool BehaviorTracker::detect_daily_pattern(const std::vector<int> &peak_hours) {
  if (peak_hours.size() < 2 || peak_hours.size() > 16) {
    return false;
  }
  int gaps = 0;
  for (size_t i = 1; i < peak_hours.size(); ++i) {
    if (peak_hours[i] - peak_hours[i - 1] > 1) ++gaps;
  }
  return gaps <= 2;
}

data::BehaviorClassification
BehaviorTracker::classify(double uptime, bool has_daily_pattern,
                          int observation_count, int min_observations) {
  using C = data::BehaviorClassification;
  if (observation_count < min_observations) return C::unknown;
  if (uptime >= kInfrastructureUptime) return C::infrastructure;
  if (uptime >= kIotUptime) return has_daily_pattern ? C::server : C::iot;
  if (uptime >= kWorkstationUptime)
    return has_daily_pattern ? C::workstation : C::portable;
  if (uptime >= kPortableUptime) return has_daily_pattern ? C::portable : C::mobile;
  if (uptime >= kMobileUptime) return C::mobile;
  return C::guest;
}

bool BehaviorTracker::is_business_hours_peak(const std::vector<int> &peak_hours) {
  if (peak_hours.empty()) return false;
  return count_in_range(peak_hours, 9, 17) >
         static_cast<int>(peak_hours.size()) / 2;
}

bool BehaviorTracker::is_evening_peak(const std::vector<int> &peak_hours) {
  if (peak_hours.empty()) return false;
  return count_in_range(peak_hours, 18, 23) >
         static_cast<int>(peak_hours.size()) / 2;
}

std::set<std::string> BehaviorTracker::consistent_services(
    const std::vector<data::PresenceRecord> &history) {
  std::map<std::string, int> counts;
  int online = 0;
  for (const auto &r : history) {
    if (!r.is_online) continue;
    ++online;
    for (const auto &svc : r.available_services) counts[svc] += 1;
  }
  const int threshold = std::max(1, online * 80 / 100);
  std::set<std::string> out;
  for (const auto &[svc, n] : counts) {
    if (n >= threshold) out.insert(svc);
  }
  return out;
}

} // namespace lanlens
