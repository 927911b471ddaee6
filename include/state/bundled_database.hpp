#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "data/device.hpp"
#include "data/fingerprint.hpp"
#include "state/sqlite_connection.hpp"

namespace lanlens {

// One row of the offline fingerprint database.
struct BundledFingerprintEntry {
  std::string device_name;
  std::vector<std::string> device_types;
  std::optional<std::string> vendor;
  std::optional<std::string> operating_system;
  double confidence{0.0}; // clamped to [0, 1]

  data::DeviceType primary_device_type() const;

  // Fingerprint attributed to the remote origin, marked as a cache hit.
  data::DeviceFingerprint
  to_fingerprint(std::chrono::system_clock::time_point now) const;
};

struct BundledDatabaseMetadata {
  std::string version{"0.0.0"};
  int64_t entry_count{0};
  bool is_loaded{false};
  std::optional<std::string> load_error;
};

class IBundledDatabase {
public:
  virtual ~IBundledDatabase() = default;

  // `oui` in any separator style; only the first 6 hex digits are used.
  virtual std::optional<BundledFingerprintEntry>
  lookup_oui(const std::string &oui) const = 0;
  virtual std::optional<BundledFingerprintEntry>
  lookup_dhcp_hash(const std::string &hash) const = 0;
  virtual BundledDatabaseMetadata metadata() const = 0;
  virtual bool available() const = 0;
};

// Read-only SQLite database shipped next to the binary. Opened lazily; a
// missing file leaves the lookups empty.
class SqliteBundledDatabase : public IBundledDatabase {
public:
  explicit SqliteBundledDatabase(std::filesystem::path path);

  std::optional<BundledFingerprintEntry>
  lookup_oui(const std::string &oui) const override;
  std::optional<BundledFingerprintEntry>
  lookup_dhcp_hash(const std::string &hash) const override;
  BundledDatabaseMetadata metadata() const override;
  bool available() const override;

  static std::string normalize_oui(const std::string &oui);

private:
  bool ensure_loaded() const;
  std::optional<BundledFingerprintEntry>
  lookup(const char *sql, const std::string &key) const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
  mutable std::unique_ptr<SqliteConnection> db_;
  mutable bool loaded_{false};
  mutable BundledDatabaseMetadata metadata_;
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
