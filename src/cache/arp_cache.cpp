#include "cache/arp_cache.hpp"

#include <algorithm>

#include "util/mac_address.hpp"
#include "util/my_logging.hpp"

namespace lanlens {

ArpCache::ArpCache(IArpTableReader &reader,
                   ILanlensConfigProvider &config_provider)
    : reader_(reader),
      ttl_(std::chrono::seconds(config_provider.get().cache.arp_ttl_seconds)),
      max_entries_(static_cast<size_t>(
          std::max(1, config_provider.get().cache.arp_max_entries))) {}

bool ArpCache::expired(const CachedEntry &e,
                       std::chrono::system_clock::time_point now) const {
  return now - e.cached_at > ttl_;
}

std::optional<data::ArpEntry> ArpCache::get_by_mac(const std::string &mac) {
  std::scoped_lock lock(mutex_);
  auto it = cache_.find(macaddr::normalize_or_upper(mac));
  if (it == cache_.end() || expired(it->second, clock_())) {
    ++misses_;
    return std::nullopt;
  }
  ++hits_;
  return it->second.entry;
}

std::optional<data::ArpEntry> ArpCache::get_by_ip(const std::string &ip) {
  std::scoped_lock lock(mutex_);
  auto idx = ip_index_.find(ip);
  if (idx != ip_index_.end()) {
    auto it = cache_.find(idx->second);
    if (it != cache_.end() && !expired(it->second, clock_())) {
      ++hits_;
      return it->second.entry;
    }
  }
  ++misses_;
  return std::nullopt;
}

monad::MyResult<std::vector<data::ArpEntry>> ArpCache::get_table(bool force_refresh) {
  bool needs_refresh;
  {
    std::scoped_lock lock(mutex_);
    needs_refresh = force_refresh || !last_refresh_ ||
                    clock_() - *last_refresh_ > ttl_;
  }
  if (needs_refresh) {
    if (auto r = refresh(); r.is_err()) {
      return monad::MyResult<std::vector<data::ArpEntry>>::Err(r.error());
    }
  }
  std::scoped_lock lock(mutex_);
  std::vector<data::ArpEntry> out;
  out.reserve(cache_.size());
  for (const auto &[mac, cached] : cache_) {
    out.push_back(cached.entry);
  }
  return monad::MyResult<std::vector<data::ArpEntry>>::Ok(std::move(out));
}

monad::MyResult<std::vector<data::ArpEntry>> ArpCache::refresh() {
  // Read outside the lock; the table read is I/O.
  auto table = reader_.read_table();
  if (table.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "ARP table refresh failed: " << table.error().what;
    return monad::MyResult<std::vector<data::ArpEntry>>::Err(table.error());
  }
  std::vector<data::ArpEntry> fresh;
  fresh.reserve(table.value().size());
  for (const auto &e : table.value()) {
    data::ArpEntry normalized = e;
    normalized.mac = macaddr::normalize_or_upper(e.mac);
    fresh.push_back(std::move(normalized));
  }
  std::scoped_lock lock(mutex_);
  update_locked(fresh);
  last_refresh_ = clock_();
  ++refresh_count_;
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "ARP cache refreshed: " << fresh.size() << " entries";
  return monad::MyResult<std::vector<data::ArpEntry>>::Ok(std::move(fresh));
}

size_t ArpCache::prune() {
  std::scoped_lock lock(mutex_);
  const auto now = clock_();
  size_t removed = 0;
  for (auto it = cache_.begin(); it != cache_.end();) {
    if (!expired(it->second, now)) {
      ++it;
      continue;
    }
    auto ip_it = ip_index_.find(it->second.entry.ip);
    if (ip_it != ip_index_.end() && ip_it->second == it->first) {
      ip_index_.erase(ip_it);
    }
    it = cache_.erase(it);
    ++removed;
  }
  if (removed > 0) {
    BOOST_LOG_SEV(lg_, trivial::debug) << "ARP cache pruned " << removed
                                       << " expired entries";
  }
  return removed;
}

void ArpCache::put(const std::vector<data::ArpEntry> &entries) {
  std::scoped_lock lock(mutex_);
  update_locked(entries);
}

void ArpCache::clear() {
  std::scoped_lock lock(mutex_);
  cache_.clear();
  ip_index_.clear();
  last_refresh_.reset();
  BOOST_LOG_SEV(lg_, trivial::debug) << "ARP cache cleared";
}

ArpCacheStats ArpCache::stats() const {
  std::scoped_lock lock(mutex_);
  return ArpCacheStats{cache_.size(), hits_, misses_, refresh_count_,
                       last_refresh_};
}

void ArpCache::reset_stats() {
  std::scoped_lock lock(mutex_);
  hits_ = 0;
  misses_ = 0;
  refresh_count_ = 0;
}

void ArpCache::update_locked(const std::vector<data::ArpEntry> &entries) {
  const auto now = clock_();
  size_t incoming = 0;
  for (const auto &e : entries) {
    if (!cache_.count(macaddr::normalize_or_upper(e.mac))) ++incoming;
  }
  if (cache_.size() + incoming > max_entries_) {
    evict_oldest_locked(cache_.size() + incoming - max_entries_);
  }
  for (const auto &e : entries) {
    const std::string mac = macaddr::normalize_or_upper(e.mac);
    auto it = cache_.find(mac);
    if (it != cache_.end() && it->second.entry.ip != e.ip) {
      ip_index_.erase(it->second.entry.ip);
    }
    data::ArpEntry stored = e;
    stored.mac = mac;
    cache_[mac] = CachedEntry{std::move(stored), now};
    ip_index_[e.ip] = mac;
  }
}

void ArpCache::evict_oldest_locked(size_t count) {
  std::vector<std::map<std::string, CachedEntry>::iterator> order;
  order.reserve(cache_.size());
  for (auto it = cache_.begin(); it != cache_.end(); ++it) {
    order.push_back(it);
  }
  std::stable_sort(order.begin(), order.end(), [](auto a, auto b) {
    return a->second.cached_at < b->second.cached_at;
  });
  count = std::min(count, order.size());
  for (size_t i = 0; i < count; ++i) {
    auto ip_it = ip_index_.find(order[i]->second.entry.ip);
    if (ip_it != ip_index_.end() && ip_it->second == order[i]->first) {
      ip_index_.erase(ip_it);
    }
    cache_.erase(order[i]);
  }
  BOOST_LOG_SEV(lg_, trivial::debug) << "ARP cache evicted " << count
                                     << " entries";
}

} // namespace lanlens
