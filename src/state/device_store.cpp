#include "state/device_store.hpp"

#include <sqlite3.h>

#include "lanlens_error_codes.hpp"
#include "util/my_logging.hpp"

namespace lanlens {

namespace {

constexpr const char kCreateDevicesSql[] = R"SQL(
CREATE TABLE IF NOT EXISTS devices (
  mac TEXT PRIMARY KEY,
  device_json TEXT NOT NULL,
  last_seen_ms INTEGER NOT NULL,
  updated_at INTEGER NOT NULL DEFAULT (strftime('%s','now'))
);
)SQL";

constexpr const char kUpsertSql[] = R"SQL(
INSERT INTO devices(mac, device_json, last_seen_ms, updated_at)
VALUES(?1, ?2, ?3, strftime('%s','now'))
ON CONFLICT(mac) DO UPDATE SET
  device_json = excluded.device_json,
  last_seen_ms = excluded.last_seen_ms,
  updated_at = excluded.updated_at;
)SQL";

constexpr const char kSelectAllSql[] = R"SQL(
SELECT mac, device_json FROM devices ORDER BY last_seen_ms DESC;
)SQL";

constexpr const char kDeleteSql[] = R"SQL(
DELETE FROM devices WHERE mac = ?1;
)SQL";

constexpr const char kClearSql[] = R"SQL(
DELETE FROM devices;
)SQL";

constexpr const char kUnavailable[] = "Device database unavailable";

} // namespace

SqliteDeviceStore::SqliteDeviceStore(ILanlensConfigProvider &config_provider)
    : config_provider_(config_provider) {}

bool SqliteDeviceStore::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_initialized();
}

bool SqliteDeviceStore::ensure_initialized() const {
  if (initialized_) {
    return db_ != nullptr;
  }
  initialized_ = true;
  const auto runtime_dir = config_provider_.get().runtime_dir;
  if (runtime_dir.empty()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "DeviceStore disabled: runtime_dir not configured";
    return false;
  }
  std::string error;
  db_ = SqliteConnection::open(state_database_path(runtime_dir),
                               {kCreateDevicesSql}, error);
  if (!db_) {
    BOOST_LOG_SEV(lg_, trivial::error) << "DeviceStore disabled: " << error;
    return false;
  }
  return true;
}

monad::MyResult<std::vector<data::Device>> SqliteDeviceStore::load_all() const {
  using R = monad::MyResult<std::vector<data::Device>>;
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::UNAVAILABLE, kUnavailable));
  }
  SqliteStatement stmt(*db_, kSelectAllSql);
  if (!stmt.ok()) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                             db_->last_error()));
  }
  std::vector<data::Device> devices;
  int rc;
  while ((rc = stmt.step()) == SQLITE_ROW) {
    const std::string mac = stmt.column_text(0);
    boost::system::error_code ec;
    auto jv = json::parse(stmt.column_text(1), ec);
    if (ec) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Skipping corrupt device snapshot for " << mac << ": "
          << ec.message();
      continue;
    }
    try {
      devices.push_back(json::value_to<data::Device>(jv));
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::warning)
          << "Skipping corrupt device snapshot for " << mac << ": "
          << e.what();
    }
  }
  if (rc != SQLITE_DONE) {
    return R::Err(monad::make_error(lanlens_errors::STORAGE::QUERY_FAILED,
                             db_->last_error()));
  }
  return R::Ok(std::move(devices));
}

std::optional<std::string> SqliteDeviceStore::save(const data::Device &device) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  SqliteStatement stmt(*db_, kUpsertSql);
  if (!stmt.ok()) {
    return "Failed to prepare device upsert: " + db_->last_error();
  }
  stmt.bind(1, device.mac);
  stmt.bind(2, json::serialize(json::value_from(device)));
  stmt.bind(3, std::chrono::duration_cast<std::chrono::milliseconds>(
                   device.last_seen.time_since_epoch())
                   .count());
  if (stmt.step() != SQLITE_DONE) {
    return "Failed to save device " + device.mac + ": " + db_->last_error();
  }
  return std::nullopt;
}

std::optional<std::string> SqliteDeviceStore::remove(const std::string &mac) {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  SqliteStatement stmt(*db_, kDeleteSql);
  if (!stmt.ok()) {
    return "Failed to prepare device delete: " + db_->last_error();
  }
  stmt.bind(1, mac);
  if (stmt.step() != SQLITE_DONE) {
    return "Failed to delete device " + mac;
  }
  return std::nullopt;
}

std::optional<std::string> SqliteDeviceStore::clear() {
  std::scoped_lock lock(mutex_);
  if (!ensure_initialized()) {
    return std::string{kUnavailable};
  }
  return db_->exec(kClearSql);
}

} // namespace lanlens
