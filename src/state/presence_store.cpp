#include "state/presence_store.hpp"

#include <sqlite3.h>

#include "lanlens_error_codes.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace {

constexpr const char kCreatePresenceSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS presence_records (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  mac TEXT NOT NULL,
  timestamp_ms INTEGER NOT NULL,
  is_online INTEGER NOT NULL,
  ip_address TEXT,
  available_services TEXT NOT NULL DEFAULT '[]'
);
)SQL";

constexpr const char kCreatePresenceIndexSql[] = R"SQL(
CREATE INDEX IF NOT EXISTS idx_presence_mac_timestamp
  ON presence_records(mac, timestamp_ms);
)SQL";

constexpr const char kCreatePresenceTsIndexSql[] = R"SQL(
CREATE INDEX IF NOT EXISTS idx_presence_timestamp
  ON presence_records(timestamp_ms);
)SQL";

constexpr const char kInsertSql[] = R"SQL(
INSERT INTO presence_records(mac, timestamp_ms, is_online, ip_address,
                             available_services)
VALUES(?1, ?2, ?3, ?4, ?5);
)SQL";

constexpr const char kSelectAllForMacSql[] = R"SQL(
SELECT mac, timestamp_ms, is_online, ip_address, available_services
FROM presence_records WHERE mac = ?1 ORDER BY timestamp_ms ASC, id ASC;
)SQL";

constexpr const char kSelectSinceSql[] = R"SQL(
SELECT mac, timestamp_ms, is_online, ip_address, available_services
FROM presence_records WHERE mac = ?1 AND timestamp_ms >= ?2
ORDER BY timestamp_ms ASC, id ASC;
)SQL";

constexpr const char kSelectRangeSql[] = R"SQL(
SELECT mac, timestamp_ms, is_online, ip_address, available_services
FROM presence_records WHERE mac = ?1 AND timestamp_ms >= ?2
  AND timestamp_ms <= ?3
ORDER BY timestamp_ms ASC, id ASC;
)SQL";

constexpr const char kSelectLatestSql[] = R"SQL(
SELECT mac, timestamp_ms, is_online, ip_address, available_services
FROM presence_records WHERE mac = ?1
ORDER BY timestamp_ms DESC, id DESC LIMIT 1;
)SQL";

constexpr const char kSelectSeenBetweenSql[] = R"SQL(
SELECT DISTINCT mac FROM presence_records
WHERE timestamp_ms >= ?1 AND timestamp_ms <= ?2 AND is_online = 1
ORDER BY mac;
)SQL";

constexpr const char kCountForMacSql[] = R"SQL(
SELECT COUNT(*) FROM presence_records WHERE mac = ?1;
)SQL";

constexpr const char kCountAllSql[] = R"SQL(
SELECT COUNT(*) FROM presence_records;
)SQL";

constexpr const char kDeleteForMacSql[] = R"SQL(
DELETE FROM presence_records WHERE mac = ?1;
)SQL";

constexpr const char kPruneSql[] = R"SQL(
DELETE FROM presence_records WHERE timestamp_ms < ?1;
)SQL";

constexpr const char kUptimeAllSql[] = R"SQL(
SELECT COUNT(*), COALESCE(SUM(is_online), 0), MIN(timestamp_ms),
       MAX(timestamp_ms)
FROM presence_records WHERE mac = ?1;
)SQL";

constexpr const char kUptimeSinceSql[] = R"SQL(
SELECT COUNT(*), COALESCE(SUM(is_online), 0), MIN(timestamp_ms),
       MAX(timestamp_ms)
FROM presence_records WHERE mac = ?1 AND timestamp_ms >= ?2;
)SQL";

constexpr const char kUnavailable[] = "Presence database unavailable";

int64_t to_ms(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

std::chrono::system_clock::time_point from_ms(int64_t ms) {
  return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

std::string services_to_json(const std::vector<std::string> &services) {
  json::array arr;
  for (const auto &s : services) arr.emplace_back(s);
  return json::serialize(arr);
}

std::vector<std::string> services_from_json(const std::string &text) {
  std::vector<std::string> out;
  boost::system::error_code ec;
  auto jv = json::parse(text, ec);
  if (ec || !jv.is_array()) return out;
  for (const auto &v : jv.as_array()) {
    if (v.is_string()) out.emplace_back(v.as_string().c_str());
  }
  return out;
}

data::PresenceRecord read_row(const SqliteStatement &stmt) {
  data::PresenceRecord r;
  r.mac = stmt.column_text(0);
  r.timestamp = from_ms(stmt.column_int64(1));
  r.is_online = stmt.column_int64(2) != 0;
  r.ip_address = stmt.column_optional_text(3);
  r.available_services = services_from_json(stmt.column_text(4));
  return r;
}

monad::Error storage_error(int code, std::string what) {
  return monad::make_error(code, std::move(what));
}

} // namespace

SqlitePresenceStore::SqlitePresenceStore(ILanlensConfigProvider &config_provider)
    : config_provider_(config_provider) {}

bool SqlitePresenceStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

bool SqlitePresenceStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }
  initialized_ = true;
  const auto runtime_dir = config_provider_.get().runtime_dir;
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "PresenceStore disabled: runtime_dir not configured";
    return false;
  }
  std::string error;
  db_ = SqliteConnection::open(state_database_path(runtime_dir),
                               {kCreatePresenceSql, kCreatePresenceIndexSql,
                                kCreatePresenceTsIndexSql},
                               error);
  if (!db_) {
    BOOST_LOG_SEV(lg_, trivial::error) << "PresenceStore disabled: " << error;
    return false;
  }
  return true;
}

std::optional<std::string>
SqlitePresenceStore::insert_locked(const data::PresenceRecord &r) const {
  SqliteStatement stmt(*db_, kInsertSql);
  if (!stmt.ok()) {
    return std::string{"Failed to prepare presence insert: "} +
           db_->last_error();
  }
  stmt.bind(1, macaddr::normalize_or_upper(r.mac));
  stmt.bind(2, to_ms(r.timestamp));
  stmt.bind(3, static_cast<int64_t>(r.is_online ? 1 : 0));
  stmt.bind(4, r.ip_address);
  stmt.bind(5, services_to_json(r.available_services));
  if (stmt.step() != SQLITE_DONE) {
    return std::string{"Failed to insert presence record for "} + r.mac +
           ": " + db_->last_error();
  }
  return std::nullopt;
}

std::optional<std::string>
SqlitePresenceStore::record(const data::PresenceRecord &r) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  return insert_locked(r);
}

std::optional<std::string> SqlitePresenceStore::record_batch(
    const std::vector<data::PresenceRecord> &records) {
  if (records.empty()) {
    return std::nullopt;
  }
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  return db_->with_transaction([&]() -> std::optional<std::string> {
    for (const auto &r : records) {
      if (auto err = insert_locked(r)) {
        return err;
      }
    }
    return std::nullopt;
  });
}

monad::MyResult<std::vector<data::PresenceRecord>>
SqlitePresenceStore::query_records(const char *sql, const std::string &mac,
                                   std::optional<int64_t> a,
                                   std::optional<int64_t> b) const {
  using R = monad::MyResult<std::vector<data::PresenceRecord>>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::UNAVAILABLE,
                                kUnavailable));
  }
  SqliteStatement stmt(*db_, sql);
  if (!stmt.ok()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  stmt.bind(1, macaddr::normalize_or_upper(mac));
  if (a) stmt.bind(2, *a);
  if (b) stmt.bind(3, *b);
  std::vector<data::PresenceRecord> out;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    out.push_back(read_row(stmt));
  }
  if (rc != SQLITE_DONE) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  return R::Ok(std::move(out));
}

monad::MyResult<std::vector<data::PresenceRecord>>
SqlitePresenceStore::history_since(const std::string &mac,
                                   std::optional<time_point> since) const {
  if (!since) {
    return query_records(kSelectAllForMacSql, mac, std::nullopt, std::nullopt);
  }
  return query_records(kSelectSinceSql, mac, to_ms(*since), std::nullopt);
}

monad::MyResult<std::vector<data::PresenceRecord>>
SqlitePresenceStore::history_range(const std::string &mac, time_point from,
                                   time_point to) const {
  return query_records(kSelectRangeSql, mac, to_ms(from), to_ms(to));
}

monad::MyResult<std::vector<std::string>>
SqlitePresenceStore::devices_seen_between(time_point from,
                                          time_point to) const {
  using R = monad::MyResult<std::vector<std::string>>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::UNAVAILABLE,
                                kUnavailable));
  }
  SqliteStatement stmt(*db_, kSelectSeenBetweenSql);
  if (!stmt.ok()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  stmt.bind(1, to_ms(from));
  stmt.bind(2, to_ms(to));
  std::vector<std::string> macs;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    macs.push_back(stmt.column_text(0));
  }
  if (rc != SQLITE_DONE) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  return R::Ok(std::move(macs));
}

monad::MyResult<int64_t>
SqlitePresenceStore::count(const std::optional<std::string> &mac) const {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyResult<int64_t>::Err(
        storage_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  SqliteStatement stmt(*db_, mac ? kCountForMacSql : kCountAllSql);
  if (!stmt.ok()) {
    return monad::MyResult<int64_t>::Err(storage_error(
        lanlens_errors::STORAGE::QUERY_FAILED, db_->last_error()));
  }
  if (mac) stmt.bind(1, macaddr::normalize_or_upper(*mac));
  if (stmt.step() != SQLITE_ROW) {
    return monad::MyResult<int64_t>::Err(storage_error(
        lanlens_errors::STORAGE::QUERY_FAILED, db_->last_error()));
  }
  return monad::MyResult<int64_t>::Ok(stmt.column_int64(0));
}

std::optional<std::string>
SqlitePresenceStore::delete_by_mac(const std::string &mac) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  SqliteStatement stmt(*db_, kDeleteForMacSql);
  if (!stmt.ok()) {
    return std::string{"Failed to prepare presence delete"};
  }
  stmt.bind(1, macaddr::normalize_or_upper(mac));
  if (stmt.step() != SQLITE_DONE) {
    return std::string{"Failed to delete presence records for "} + mac;
  }
  return std::nullopt;
}

monad::MyResult<int64_t> SqlitePresenceStore::prune_older_than(time_point cutoff) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return monad::MyResult<int64_t>::Err(
        storage_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  SqliteStatement stmt(*db_, kPruneSql);
  if (!stmt.ok()) {
    return monad::MyResult<int64_t>::Err(storage_error(
        lanlens_errors::STORAGE::QUERY_FAILED, db_->last_error()));
  }
  stmt.bind(1, to_ms(cutoff));
  if (stmt.step() != SQLITE_DONE) {
    return monad::MyResult<int64_t>::Err(storage_error(
        lanlens_errors::STORAGE::QUERY_FAILED, db_->last_error()));
  }
  int64_t deleted = db_->changes();
  if (deleted > 0) {
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Pruned " << deleted << " presence records older than "
        << stringutil::formatISO8601(cutoff);
  }
  return monad::MyResult<int64_t>::Ok(deleted);
}

monad::MyResult<data::UptimeStats>
SqlitePresenceStore::uptime_stats(const std::string &mac,
                                  std::optional<time_point> since) const {
  using R = monad::MyResult<data::UptimeStats>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::UNAVAILABLE,
                                kUnavailable));
  }
  SqliteStatement stmt(*db_, since ? kUptimeSinceSql : kUptimeAllSql);
  if (!stmt.ok()) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  stmt.bind(1, macaddr::normalize_or_upper(mac));
  if (since) stmt.bind(2, to_ms(*since));
  if (stmt.step() != SQLITE_ROW) {
    return R::Err(storage_error(lanlens_errors::STORAGE::QUERY_FAILED,
                                db_->last_error()));
  }
  data::UptimeStats stats;
  stats.total_records = static_cast<int>(stmt.column_int64(0));
  stats.online_records = static_cast<int>(stmt.column_int64(1));
  if (!stmt.column_is_null(2)) stats.first_seen = from_ms(stmt.column_int64(2));
  if (!stmt.column_is_null(3)) stats.last_seen = from_ms(stmt.column_int64(3));
  return R::Ok(stats);
}

monad::MyResult<std::optional<data::PresenceRecord>>
SqlitePresenceStore::latest_record(const std::string &mac) const {
  using R = monad::MyResult<std::optional<data::PresenceRecord>>;
  auto rows = query_records(kSelectLatestSql, mac, std::nullopt, std::nullopt);
  if (rows.is_err()) {
    return R::Err(rows.error());
  }
  if (rows.value().empty()) {
    return R::Ok(std::nullopt);
  }
  return R::Ok(rows.value().front());
}

} // namespace lanlens
