#include "state/bundled_database.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <boost/json.hpp>
#include <cctype>

#include "util/my_logging.hpp"

namespace lanlens {

namespace {

constexpr const char kSelectOuiSql[] = R"SQL(
SELECT device_name, device_types, vendor, operating_system, confidence
FROM oui_entries WHERE oui = ?1 LIMIT 1;
)SQL";

constexpr const char kSelectDhcpSql[] = R"SQL(
SELECT device_name, device_types, vendor, operating_system, confidence
FROM dhcp_entries WHERE dhcp_hash = ?1 LIMIT 1;
)SQL";

constexpr const char kSelectVersionSql[] = R"SQL(
SELECT value FROM metadata WHERE key = 'version' LIMIT 1;
)SQL";

constexpr const char kCountEntriesSql[] = R"SQL(
SELECT (SELECT COUNT(*) FROM oui_entries) + (SELECT COUNT(*) FROM dhcp_entries);
)SQL";

std::vector<std::string> parse_types(const std::string &text) {
  std::vector<std::string> out;
  boost::system::error_code ec;
  auto jv = boost::json::parse(text, ec);
  if (ec || !jv.is_array()) return out;
  for (const auto &v : jv.as_array()) {
    if (v.is_string()) out.emplace_back(v.as_string().c_str());
  }
  return out;
}

} // namespace

data::DeviceType BundledFingerprintEntry::primary_device_type() const {
  for (const auto &t : device_types) {
    std::string lower = t;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    for (auto type : data::kAllDeviceTypes) {
      std::string name = data::to_string(type);
      std::transform(name.begin(), name.end(), name.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      if (name == lower) return type;
    }
  }
  return data::DeviceType::unknown;
}

data::DeviceFingerprint BundledFingerprintEntry::to_fingerprint(
    std::chrono::system_clock::time_point now) const {
  data::DeviceFingerprint fp;
  fp.fingerbank_device_name = device_name;
  if (vendor) {
    fp.fingerbank_parents = std::vector<std::string>{*vendor};
  }
  fp.fingerbank_score = static_cast<int64_t>(confidence * 100.0 + 0.5);
  fp.operating_system = operating_system;
  fp.source = data::FingerprintSource::fingerbank;
  fp.timestamp = now;
  fp.cache_hit = true;
  return fp;
}

SqliteBundledDatabase::SqliteBundledDatabase(std::filesystem::path path)
    : path_(std::move(path)) {}

std::string SqliteBundledDatabase::normalize_oui(const std::string &oui) {
  std::string cleaned;
  for (char c : oui) {
    if (c == ':' || c == '-' || c == '.') continue;
    cleaned.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    if (cleaned.size() == 6) break;
  }
  return cleaned;
}

bool SqliteBundledDatabase::ensure_loaded() const {
  if (loaded_) {
    return db_ != nullptr;
  }
  loaded_ = true;
  std::string error;
  db_ = SqliteConnection::open_read_only(path_, error);
  if (!db_) {
    metadata_.load_error = error;
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Bundled fingerprint database not loaded: " << error;
    return false;
  }

  {
    SqliteStatement stmt(*db_, kSelectVersionSql);
    if (stmt.ok() && stmt.step() == SQLITE_ROW) {
      metadata_.version = stmt.column_text(0);
    }
  }
  SqliteStatement count(*db_, kCountEntriesSql);
  if (!count.ok() || count.step() != SQLITE_ROW) {
    metadata_.load_error = "Bundled database schema invalid: " + db_->last_error();
    BOOST_LOG_SEV(lg_, trivial::error) << *metadata_.load_error;
    db_.reset();
    return false;
  }
  metadata_.entry_count = count.column_int64(0);
  metadata_.is_loaded = true;
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Loaded bundled fingerprint database " << path_.string()
      << " version " << metadata_.version << " with "
      << metadata_.entry_count << " entries";
  return true;
}

std::optional<BundledFingerprintEntry>
SqliteBundledDatabase::lookup(const char *sql, const std::string &key) const {
  SqliteStatement stmt(*db_, sql);
  if (!stmt.ok()) {
    BOOST_LOG_SEV(lg_, trivial::error)
        << "Bundled database query failed: " << db_->last_error();
    return std::nullopt;
  }
  stmt.bind(1, key);
  int rc = stmt.step();
  if (rc != SQLITE_ROW) {
    if (rc != SQLITE_DONE) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Bundled database query failed: " << db_->last_error();
    }
    return std::nullopt;
  }
  BundledFingerprintEntry entry;
  entry.device_name = stmt.column_text(0);
  entry.device_types = parse_types(stmt.column_text(1));
  entry.vendor = stmt.column_optional_text(2);
  entry.operating_system = stmt.column_optional_text(3);
  entry.confidence = std::clamp(stmt.column_double(4), 0.0, 1.0);
  return entry;
}

std::optional<BundledFingerprintEntry>
SqliteBundledDatabase::lookup_oui(const std::string &oui) const {
  std::scoped_lock lock(mutex_);
  if (!ensure_loaded()) {
    return std::nullopt;
  }
  auto normalized = normalize_oui(oui);
  if (normalized.size() != 6) {
    BOOST_LOG_SEV(lg_, trivial::debug) << "Invalid OUI format: " << oui;
    return std::nullopt;
  }
  auto entry = lookup(kSelectOuiSql, normalized);
  if (entry) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Bundled database OUI hit for " << normalized;
  }
  return entry;
}

std::optional<BundledFingerprintEntry>
SqliteBundledDatabase::lookup_dhcp_hash(const std::string &hash) const {
  if (hash.empty()) {
    return std::nullopt;
  }
  std::scoped_lock lock(mutex_);
  if (!ensure_loaded()) {
    return std::nullopt;
  }
  return lookup(kSelectDhcpSql, hash);
}

BundledDatabaseMetadata SqliteBundledDatabase::metadata() const {
  std::scoped_lock lock(mutex_);
  ensure_loaded();
  return metadata_;
}

bool SqliteBundledDatabase::available() const {
  std::scoped_lock lock(mutex_);
  return ensure_loaded();
}

} // namespace lanlens
