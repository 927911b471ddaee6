#include "cache/fingerprint_cache.hpp"

#include <algorithm>

#include "lanlens_error_codes.hpp"
#include "openssl/openssl_raii.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

FingerprintCache::FingerprintCache(IFingerprintCacheStore &store,
                                   ILanlensConfigProvider &config_provider)
    : store_(store),
      upnp_ttl_(std::max(1, config_provider.get().cache.upnp_ttl_hours)),
      remote_ttl_(std::chrono::hours(
          24 * std::max(1, config_provider.get().fingerbank.cache_ttl_days))) {}

std::string FingerprintCache::signal_hash(
    const std::string &mac, const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents) {
  std::string input = stringutil::toUpperCase(mac);
  if (dhcp_fingerprint && !dhcp_fingerprint->empty()) {
    input += ":" + *dhcp_fingerprint;
  }
  if (user_agents && !user_agents->empty()) {
    auto sorted = *user_agents;
    std::sort(sorted.begin(), sorted.end());
    input += ":" + stringutil::join(sorted, ",");
  }
  return opensslutil::sha256_hex(input);
}

std::optional<data::DeviceFingerprint>
FingerprintCache::get_upnp(const std::string &mac,
                           const std::string &location_url) {
  std::scoped_lock lock(mutex_);
  auto key = std::make_pair(macaddr::normalize_or_upper(mac), location_url);
  auto it = upnp_.find(key);
  if (it == upnp_.end()) {
    ++upnp_misses_;
    return std::nullopt;
  }
  if (clock_() >= it->second.expires_at) {
    upnp_.erase(it);
    ++upnp_misses_;
    return std::nullopt;
  }
  ++upnp_hits_;
  auto fp = it->second.fingerprint;
  fp.cache_hit = true;
  return fp;
}

void FingerprintCache::put_upnp(const std::string &mac,
                                const std::string &location_url,
                                const data::DeviceFingerprint &fp) {
  std::scoped_lock lock(mutex_);
  upnp_[std::make_pair(macaddr::normalize_or_upper(mac), location_url)] =
      UpnpEntry{fp, clock_() + upnp_ttl_};
}

std::optional<data::DeviceFingerprint> FingerprintCache::get_remote(
    const std::string &mac, const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents) {
  auto normalized = macaddr::normalize_or_upper(mac);
  auto hash = signal_hash(normalized, dhcp_fingerprint, user_agents);
  auto r = store_.get(normalized, hash, clock_());
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Fingerprint cache read failed for " << normalized << ": "
        << r.error().what;
    if (r.error().code == lanlens_errors::STORAGE::CORRUPT_ENTRY) {
      if (auto err = store_.invalidate(normalized)) {
        BOOST_LOG_SEV(lg_, trivial::warning)
            << "Failed to drop corrupt cache entry: " << *err;
      }
    }
    return std::nullopt;
  }
  return r.value();
}

void FingerprintCache::put_remote(
    const std::string &mac, const data::DeviceFingerprint &fp,
    const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents) {
  auto normalized = macaddr::normalize_or_upper(mac);
  auto hash = signal_hash(normalized, dhcp_fingerprint, user_agents);
  if (auto err = store_.put(normalized, fp, hash, dhcp_fingerprint,
                            user_agents, remote_ttl_, clock_())) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to cache fingerprint for " << normalized << ": " << *err;
  }
}

void FingerprintCache::invalidate(const std::string &mac) {
  auto normalized = macaddr::normalize_or_upper(mac);
  {
    std::scoped_lock lock(mutex_);
    for (auto it = upnp_.begin(); it != upnp_.end();) {
      if (it->first.first == normalized) {
        it = upnp_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (auto err = store_.invalidate(normalized)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to invalidate fingerprint cache for " << normalized << ": "
        << *err;
  }
}

int64_t FingerprintCache::prune() {
  const auto now = clock_();
  int64_t removed = 0;
  {
    std::scoped_lock lock(mutex_);
    removed += static_cast<int64_t>(std::erase_if(
        upnp_, [now](const auto &kv) { return now >= kv.second.expires_at; }));
  }
  auto r = store_.prune_expired(now);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Fingerprint cache prune failed: " << r.error().what;
  } else {
    removed += r.value();
  }
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Pruned " << removed << " expired fingerprint cache entries";
  return removed;
}

void FingerprintCache::clear() {
  {
    std::scoped_lock lock(mutex_);
    upnp_.clear();
    upnp_hits_ = 0;
    upnp_misses_ = 0;
  }
  if (auto err = store_.clear()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to clear fingerprint cache: " << *err;
  }
}

UpnpCacheStats FingerprintCache::upnp_stats() const {
  std::scoped_lock lock(mutex_);
  return UpnpCacheStats{upnp_.size(), upnp_hits_, upnp_misses_};
}

monad::MyResult<FingerprintCacheStats> FingerprintCache::remote_stats() const {
  return store_.stats(clock_());
}

} // namespace lanlens
