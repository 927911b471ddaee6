#include "state/fingerprint_cache_store.hpp"

#include <sqlite3.h>

#include "lanlens_error_codes.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"

namespace lanlens {

namespace {

constexpr const char kCreateCacheSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS fingerprint_cache (
  mac TEXT PRIMARY KEY,
  fingerprint_json TEXT NOT NULL,
  dhcp_fingerprint TEXT,
  user_agents TEXT,
  signal_hash TEXT NOT NULL,
  fetched_at_ms INTEGER NOT NULL,
  expires_at_ms INTEGER NOT NULL,
  hit_count INTEGER NOT NULL DEFAULT 0,
  last_hit_at_ms INTEGER
);
)SQL";

constexpr const char kCreateExpiresIndexSql[] = R"SQL(
CREATE INDEX IF NOT EXISTS idx_fingerprint_cache_expires
  ON fingerprint_cache(expires_at_ms);
)SQL";

constexpr const char kCreateStatsSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS fingerprint_cache_stats (
  id INTEGER PRIMARY KEY CHECK (id = 1),
  total_hits INTEGER NOT NULL DEFAULT 0,
  total_misses INTEGER NOT NULL DEFAULT 0,
  last_prune_at_ms INTEGER
);
)SQL";

constexpr const char kSeedStatsSql[] = R"SQL(
INSERT OR IGNORE INTO fingerprint_cache_stats(id, total_hits, total_misses)
VALUES(1, 0, 0);
)SQL";

constexpr const char kSelectSql[] = R"SQL(
SELECT fingerprint_json, signal_hash, expires_at_ms
FROM fingerprint_cache WHERE mac = ?1 LIMIT 1;
)SQL";

constexpr const char kUpsertSql[] = R"SQL(
INSERT INTO fingerprint_cache(mac, fingerprint_json, dhcp_fingerprint,
                              user_agents, signal_hash, fetched_at_ms,
                              expires_at_ms, hit_count, last_hit_at_ms)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, 0, NULL)
ON CONFLICT(mac) DO UPDATE SET
  fingerprint_json = excluded.fingerprint_json,
  dhcp_fingerprint = excluded.dhcp_fingerprint,
  user_agents = excluded.user_agents,
  signal_hash = excluded.signal_hash,
  fetched_at_ms = excluded.fetched_at_ms,
  expires_at_ms = excluded.expires_at_ms,
  hit_count = 0,
  last_hit_at_ms = NULL;
)SQL";

constexpr const char kTouchHitSql[] = R"SQL(
UPDATE fingerprint_cache SET hit_count = hit_count + 1, last_hit_at_ms = ?2
WHERE mac = ?1;
)SQL";

constexpr const char kStatsHitSql[] = R"SQL(
UPDATE fingerprint_cache_stats SET total_hits = total_hits + 1 WHERE id = 1;
)SQL";

constexpr const char kStatsMissSql[] = R"SQL(
UPDATE fingerprint_cache_stats SET total_misses = total_misses + 1
WHERE id = 1;
)SQL";

constexpr const char kDeleteSql[] = R"SQL(
DELETE FROM fingerprint_cache WHERE mac = ?1;
)SQL";

constexpr const char kPruneSql[] = R"SQL(
DELETE FROM fingerprint_cache WHERE expires_at_ms < ?1;
)SQL";

constexpr const char kStatsPruneSql[] = R"SQL(
UPDATE fingerprint_cache_stats SET last_prune_at_ms = ?1 WHERE id = 1;
)SQL";

constexpr const char kClearSql[] = R"SQL(
DELETE FROM fingerprint_cache;
)SQL";

constexpr const char kResetStatsSql[] = R"SQL(
UPDATE fingerprint_cache_stats
SET total_hits = 0, total_misses = 0, last_prune_at_ms = NULL WHERE id = 1;
)SQL";

constexpr const char kSelectStatsSql[] = R"SQL(
SELECT (SELECT COUNT(*) FROM fingerprint_cache),
       (SELECT COUNT(*) FROM fingerprint_cache WHERE expires_at_ms >= ?1),
       total_hits, total_misses, last_prune_at_ms
FROM fingerprint_cache_stats WHERE id = 1;
)SQL";

constexpr const char kUnavailable[] = "Fingerprint cache database unavailable";

int64_t to_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace

SqliteFingerprintCacheStore::SqliteFingerprintCacheStore(
    ILanlensConfigProvider &config_provider)
    : config_provider_(config_provider) {}

bool SqliteFingerprintCacheStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

bool SqliteFingerprintCacheStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }
  initialized_ = true;
  const auto runtime_dir = config_provider_.get().runtime_dir;
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "FingerprintCacheStore disabled: runtime_dir not configured";
    return false;
  }
  std::string error;
  db_ = SqliteConnection::open(
      state_database_path(runtime_dir),
      {kCreateCacheSql, kCreateExpiresIndexSql, kCreateStatsSql, kSeedStatsSql},
      error);
  if (!db_) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "FingerprintCacheStore disabled: " << error;
    return false;
  }
  return true;
}

std::optional<std::string>
SqliteFingerprintCacheStore::bump_stat(const char *sql) const {
  if (auto err = db_->exec(sql)) {
    return "Failed to update cache statistics: " + *err;
  }
  return std::nullopt;
}

monad::MyResult<std::optional<data::DeviceFingerprint>>
SqliteFingerprintCacheStore::get(const std::string &mac,
                                 const std::string &signal_hash,
                                 time_point now) {
  using R = monad::MyResult<std::optional<data::DeviceFingerprint>>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  const std::string key = macaddr::normalize_or_upper(mac);

  std::optional<std::string> fingerprint_json;
  {
    SqliteStatement stmt(*db_, kSelectSql);
    if (!stmt.ok()) {
      return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                               db_->last_error()));
    }
    stmt.bind(1, key);
    int rc = stmt.step();
    if (rc == SQLITE_ROW) {
      if (stmt.column_int64(2) < to_ms(now)) {
        BOOST_LOG_SEV(lg_, trivial::debug)
            << "Cache entry expired for MAC " << key;
      } else if (stmt.column_text(1) != signal_hash) {
        BOOST_LOG_SEV(lg_, trivial::debug)
            << "Cache entry signal mismatch for MAC " << key;
      } else {
        fingerprint_json = stmt.column_text(0);
      }
    } else if (rc != SQLITE_DONE) {
      return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                               db_->last_error()));
    }
  }

  if (!fingerprint_json) {
    if (auto err = bump_stat(kStatsMissSql)) {
      BOOST_LOG_SEV(lg_, trivial::warning) << *err;
    }
    return R::Ok(std::nullopt);
  }

  boost::system::error_code ec;
  auto jv = json::parse(*fingerprint_json, ec);
  if (ec) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::CORRUPT_ENTRY,
                             "Corrupt cache entry for " + key + ": " +
                                 ec.message()));
  }
  data::DeviceFingerprint fp;
  try {
    fp = json::value_to<data::DeviceFingerprint>(jv);
  } catch (const std::exception &e) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::CORRUPT_ENTRY,
                             "Corrupt cache entry for " + key + ": " +
                                 e.what()));
  }
  fp.cache_hit = true;

  auto touch_err = db_->with_transaction([&]() -> std::optional<std::string> {
    SqliteStatement touch(*db_, kTouchHitSql);
    if (!touch.ok()) {
      return db_->last_error();
    }
    touch.bind(1, key);
    touch.bind(2, to_ms(now));
    if (touch.step() != SQLITE_DONE) {
      return db_->last_error();
    }
    return bump_stat(kStatsHitSql);
  });
  if (touch_err) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Failed to record cache hit for " << key << ": " << *touch_err;
  }
  BOOST_LOG_SEV(lg_, trivial::debug) << "Cache hit for MAC " << key;
  return R::Ok(std::move(fp));
}

std::optional<std::string> SqliteFingerprintCacheStore::put(
    const std::string &mac, const data::DeviceFingerprint &fp,
    const std::string &signal_hash,
    const std::optional<std::string> &dhcp_fingerprint,
    const std::optional<std::vector<std::string>> &user_agents,
    std::chrono::seconds ttl, time_point now) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  const std::string key = macaddr::normalize_or_upper(mac);
  data::DeviceFingerprint stored = fp;
  stored.cache_hit = false;

  std::optional<std::string> agents_json;
  if (user_agents) {
    json::array arr;
    for (const auto &ua : *user_agents) arr.emplace_back(ua);
    agents_json = json::serialize(arr);
  }

  SqliteStatement stmt(*db_, kUpsertSql);
  if (!stmt.ok()) {
    return "Failed to prepare cache upsert: " + db_->last_error();
  }
  stmt.bind(1, key);
  stmt.bind(2, json::serialize(json::value_from(stored)));
  stmt.bind(3, dhcp_fingerprint);
  stmt.bind(4, agents_json);
  stmt.bind(5, signal_hash);
  stmt.bind(6, to_ms(now));
  stmt.bind(7, to_ms(now + ttl));
  if (stmt.step() != SQLITE_DONE) {
    return "Failed to store cache entry for " + key + ": " + db_->last_error();
  }
  return std::nullopt;
}

std::optional<std::string>
SqliteFingerprintCacheStore::invalidate(const std::string &mac) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  SqliteStatement stmt(*db_, kDeleteSql);
  if (!stmt.ok()) {
    return "Failed to prepare cache delete: " + db_->last_error();
  }
  stmt.bind(1, macaddr::normalize_or_upper(mac));
  if (stmt.step() != SQLITE_DONE) {
    return "Failed to invalidate cache entry for " + mac;
  }
  return std::nullopt;
}

monad::MyResult<int64_t> SqliteFingerprintCacheStore::prune_expired(time_point now) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyResult<int64_t>::Err(
        monad::make_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  int64_t pruned = 0;
  auto err = db_->with_transaction([&]() -> std::optional<std::string> {
    SqliteStatement del(*db_, kPruneSql);
    if (!del.ok()) return db_->last_error();
    del.bind(1, to_ms(now));
    if (del.step() != SQLITE_DONE) return db_->last_error();
    pruned = db_->changes();

    SqliteStatement mark(*db_, kStatsPruneSql);
    if (!mark.ok()) return db_->last_error();
    mark.bind(1, to_ms(now));
    if (mark.step() != SQLITE_DONE) return db_->last_error();
    return std::nullopt;
  });
  if (err) {
    return monad::MyResult<int64_t>::Err(
        monad::make_error(lanlens_errors::STORAGE::TRANSACTION_FAILED, *err));
  }
  if (pruned > 0) {
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Pruned " << pruned << " expired fingerprint cache entries";
  }
  return monad::MyResult<int64_t>::Ok(pruned);
}

std::optional<std::string> SqliteFingerprintCacheStore::clear() {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  auto err = db_->with_transaction([&]() -> std::optional<std::string> {
    if (auto e = db_->exec(kClearSql)) return e;
    return db_->exec(kResetStatsSql);
  });
  if (!err) {
    BOOST_LOG_SEV(lg_, trivial::info) << "Cleared fingerprint cache";
  }
  return err;
}

monad::MyResult<FingerprintCacheStats>
SqliteFingerprintCacheStore::stats(time_point now) const {
  using R = monad::MyResult<FingerprintCacheStats>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  SqliteStatement stmt(*db_, kSelectStatsSql);
  if (!stmt.ok()) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                             db_->last_error()));
  }
  stmt.bind(1, to_ms(now));
  if (stmt.step() != SQLITE_ROW) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                             "Cache statistics row missing"));
  }
  FingerprintCacheStats s;
  s.total_entries = stmt.column_int64(0);
  s.valid_entries = stmt.column_int64(1);
  s.total_hits = stmt.column_int64(2);
  s.total_misses = stmt.column_int64(3);
  if (!stmt.column_is_null(4)) {
    s.last_prune_at = std::chrono::system_clock::time_point(
        std::chrono::milliseconds(stmt.column_int64(4)));
  }
  return R::Ok(s);
}

} // namespace lanlens
