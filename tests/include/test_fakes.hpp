#pragma once

#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "discovery/port_scanner.hpp"
#include "discovery/proc_arp_reader.hpp"
#include "discovery/ssdp_search.hpp"
#include "fingerprint/fingerbank_client.hpp"
#include "fingerprint/fingerprint_pipeline.hpp"
#include "fingerprint/http_fetch.hpp"
#include "fingerprint/upnp_description_fetcher.hpp"
#include "lanlens_error_codes.hpp"
#include "state/bundled_database.hpp"
#include "state/device_store.hpp"
#include "state/presence_store.hpp"

namespace testinfra {

using lanlens::Result;

class FakeArpReader : public lanlens::IArpTableReader {
public:
  std::vector<lanlens::data::ArpEntry> entries;
  std::optional<monad::Error> failure;
  std::atomic<int> reads{0};

  monad::MyResult<std::vector<lanlens::data::ArpEntry>> read_table() override {
    ++reads;
    if (failure) {
      return monad::MyResult<std::vector<lanlens::data::ArpEntry>>::Err(*failure);
    }
    return monad::MyResult<std::vector<lanlens::data::ArpEntry>>::Ok(entries);
  }
};

class FakePortScanner : public lanlens::IPortScanner {
  std::mutex mutex_;

public:
  // Open ports per IP; IPs listed in `failing` report a connect error.
  std::map<std::string, std::vector<int>> open;
  std::vector<std::string> failing;
  std::vector<std::string> scanned;

  monad::MyResult<std::vector<lanlens::data::PortScanResult>>
  scan(const std::string &ip, const std::vector<int> &ports) override {
    std::scoped_lock lock(mutex_);
    scanned.push_back(ip);
    if (std::find(failing.begin(), failing.end(), ip) != failing.end()) {
      return monad::MyResult<std::vector<lanlens::data::PortScanResult>>::Err(
          monad::make_error(lanlens_errors::NETWORK::CONNECT_ERROR,
                              "host unreachable"));
    }
    std::vector<lanlens::data::PortScanResult> results;
    for (int port : open[ip]) {
      if (std::find(ports.begin(), ports.end(), port) != ports.end()) {
        results.push_back(lanlens::portscan::make_result(port));
      }
    }
    return monad::MyResult<std::vector<lanlens::data::PortScanResult>>::Ok(results);
  }
};

class FakeSsdpSearcher : public lanlens::ISsdpSearcher {
public:
  std::vector<lanlens::data::SsdpAnnouncement> announcements;
  std::optional<monad::Error> failure;
  std::atomic<int> searches{0};

  monad::MyResult<std::vector<lanlens::data::SsdpAnnouncement>>
  search(std::chrono::seconds) override {
    ++searches;
    if (failure) {
      return monad::MyResult<std::vector<lanlens::data::SsdpAnnouncement>>::Err(*failure);
    }
    return monad::MyResult<std::vector<lanlens::data::SsdpAnnouncement>>::Ok(
        announcements);
  }
};

// Canned responses keyed by URL; records every request.
class FakeHttpTransport : public lanlens::IHttpTransport {
  std::mutex mutex_;

public:
  std::map<std::string, lanlens::HttpResponse> responses;
  std::optional<monad::Error> failure;
  std::vector<lanlens::HttpRequest> requests;

  monad::MyResult<lanlens::HttpResponse>
  perform(const lanlens::HttpRequest &request) override {
    std::scoped_lock lock(mutex_);
    requests.push_back(request);
    if (failure) {
      return monad::MyResult<lanlens::HttpResponse>::Err(*failure);
    }
    auto it = responses.find(request.url);
    if (it == responses.end()) {
      lanlens::HttpResponse not_found;
      not_found.status = 404;
      return monad::MyResult<lanlens::HttpResponse>::Ok(not_found);
    }
    return monad::MyResult<lanlens::HttpResponse>::Ok(it->second);
  }

  size_t request_count() {
    std::scoped_lock lock(mutex_);
    return requests.size();
  }
};

class FakeUpnpFetcher : public lanlens::IUpnpDescriptionFetcher {
public:
  std::map<std::string, lanlens::data::DeviceFingerprint> descriptions;
  std::atomic<int> fetches{0};

  std::optional<lanlens::data::DeviceFingerprint>
  fetch(const std::string &location_url) override {
    ++fetches;
    auto it = descriptions.find(location_url);
    if (it == descriptions.end()) return std::nullopt;
    return it->second;
  }
};

class FakeFingerbankClient : public lanlens::IFingerbankClient {
public:
  bool is_enabled{true};
  std::optional<lanlens::data::DeviceFingerprint> answer;
  std::optional<monad::Error> failure;
  std::atomic<int> calls{0};

  monad::MyResult<lanlens::data::DeviceFingerprint>
  interrogate(const std::string &, const std::optional<std::string> &,
              const std::optional<std::vector<std::string>> &) override {
    ++calls;
    if (failure) {
      return monad::MyResult<lanlens::data::DeviceFingerprint>::Err(*failure);
    }
    return monad::MyResult<lanlens::data::DeviceFingerprint>::Ok(
        answer.value_or(lanlens::data::DeviceFingerprint{}));
  }

  bool enabled() const override { return is_enabled; }
};

class FakeFingerprintPipeline : public lanlens::IFingerprintPipeline {
  std::mutex mutex_;
  int prunes_{0};

public:
  std::map<std::string, lanlens::data::DeviceFingerprint> by_mac;
  std::vector<lanlens::FingerprintRequest> requests;

  std::optional<lanlens::data::DeviceFingerprint>
  resolve(const lanlens::FingerprintRequest &request) override {
    std::scoped_lock lock(mutex_);
    requests.push_back(request);
    auto it = by_mac.find(request.mac);
    if (it == by_mac.end()) return std::nullopt;
    return it->second;
  }

  int64_t prune_caches() override {
    std::scoped_lock lock(mutex_);
    ++prunes_;
    return 0;
  }

  int prune_count() {
    std::scoped_lock lock(mutex_);
    return prunes_;
  }

  size_t request_count() {
    std::scoped_lock lock(mutex_);
    return requests.size();
  }
};

class FakeBundledDatabase : public lanlens::IBundledDatabase {
public:
  std::map<std::string, lanlens::BundledFingerprintEntry> ouis;
  std::map<std::string, lanlens::BundledFingerprintEntry> dhcp_hashes;

  std::optional<lanlens::BundledFingerprintEntry>
  lookup_oui(const std::string &oui) const override {
    auto it = ouis.find(lanlens::SqliteBundledDatabase::normalize_oui(oui));
    if (it == ouis.end()) return std::nullopt;
    return it->second;
  }
  std::optional<lanlens::BundledFingerprintEntry>
  lookup_dhcp_hash(const std::string &hash) const override {
    auto it = dhcp_hashes.find(hash);
    if (it == dhcp_hashes.end()) return std::nullopt;
    return it->second;
  }
  lanlens::BundledDatabaseMetadata metadata() const override {
    lanlens::BundledDatabaseMetadata m;
    m.version = "test";
    m.entry_count = static_cast<int64_t>(ouis.size() + dhcp_hashes.size());
    m.is_loaded = true;
    return m;
  }
  bool available() const override { return true; }
};

class FakeDeviceStore : public lanlens::IDeviceStore {
  mutable std::mutex mutex_;

public:
  std::map<std::string, lanlens::data::Device> saved;
  bool fail_writes{false};

  monad::MyResult<std::vector<lanlens::data::Device>> load_all() const override {
    std::scoped_lock lock(mutex_);
    std::vector<lanlens::data::Device> out;
    for (const auto &[mac, d] : saved) out.push_back(d);
    return monad::MyResult<std::vector<lanlens::data::Device>>::Ok(out);
  }
  std::optional<std::string> save(const lanlens::data::Device &device) override {
    std::scoped_lock lock(mutex_);
    if (fail_writes) return std::string("disk full");
    saved[device.mac] = device;
    return std::nullopt;
  }
  std::optional<std::string> remove(const std::string &mac) override {
    std::scoped_lock lock(mutex_);
    saved.erase(mac);
    return std::nullopt;
  }
  std::optional<std::string> clear() override {
    std::scoped_lock lock(mutex_);
    saved.clear();
    return std::nullopt;
  }
  bool available() const override { return true; }
};

// In-memory presence history. `fail_writes` makes record/record_batch fail.
class FakePresenceStore : public lanlens::IPresenceStore {
  mutable std::mutex mutex_;

public:
  std::vector<lanlens::data::PresenceRecord> rows;
  bool fail_writes{false};
  int batch_writes{0};

  std::optional<std::string>
  record(const lanlens::data::PresenceRecord &r) override {
    std::scoped_lock lock(mutex_);
    if (fail_writes) return std::string("database is locked");
    rows.push_back(r);
    return std::nullopt;
  }
  std::optional<std::string>
  record_batch(const std::vector<lanlens::data::PresenceRecord> &records) override {
    std::scoped_lock lock(mutex_);
    if (fail_writes) return std::string("database is locked");
    ++batch_writes;
    rows.insert(rows.end(), records.begin(), records.end());
    return std::nullopt;
  }
  monad::MyResult<std::vector<lanlens::data::PresenceRecord>>
  history_since(const std::string &mac,
                std::optional<time_point> since) const override {
    std::scoped_lock lock(mutex_);
    std::vector<lanlens::data::PresenceRecord> out;
    for (const auto &r : rows) {
      if (r.mac == mac && (!since || r.timestamp >= *since)) out.push_back(r);
    }
    std::stable_sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
      return a.timestamp < b.timestamp;
    });
    return monad::MyResult<std::vector<lanlens::data::PresenceRecord>>::Ok(out);
  }
  monad::MyResult<std::vector<lanlens::data::PresenceRecord>>
  history_range(const std::string &mac, time_point from,
                time_point to) const override {
    auto all = history_since(mac, from);
    std::vector<lanlens::data::PresenceRecord> out;
    for (const auto &r : all.value()) {
      if (r.timestamp <= to) out.push_back(r);
    }
    return monad::MyResult<std::vector<lanlens::data::PresenceRecord>>::Ok(out);
  }
  monad::MyResult<std::vector<std::string>>
  devices_seen_between(time_point from, time_point to) const override {
    std::scoped_lock lock(mutex_);
    std::set<std::string> macs;
    for (const auto &r : rows) {
      if (r.timestamp >= from && r.timestamp <= to) macs.insert(r.mac);
    }
    return monad::MyResult<std::vector<std::string>>::Ok(
        std::vector<std::string>(macs.begin(), macs.end()));
  }
  monad::MyResult<int64_t> count(const std::optional<std::string> &mac) const override {
    std::scoped_lock lock(mutex_);
    int64_t n = 0;
    for (const auto &r : rows) {
      if (!mac || r.mac == *mac) ++n;
    }
    return monad::MyResult<int64_t>::Ok(n);
  }
  std::optional<std::string> delete_by_mac(const std::string &mac) override {
    std::scoped_lock lock(mutex_);
    std::erase_if(rows, [&mac](const auto &r) { return r.mac == mac; });
    return std::nullopt;
  }
  monad::MyResult<int64_t> prune_older_than(time_point cutoff) override {
    std::scoped_lock lock(mutex_);
    auto n = std::erase_if(rows, [cutoff](const auto &r) {
      return r.timestamp < cutoff;
    });
    return monad::MyResult<int64_t>::Ok(static_cast<int64_t>(n));
  }
  monad::MyResult<lanlens::data::UptimeStats>
  uptime_stats(const std::string &mac,
               std::optional<time_point> since) const override {
    lanlens::data::UptimeStats stats;
    auto history = history_since(mac, since);
    for (const auto &r : history.value()) {
      ++stats.total_records;
      if (r.is_online) ++stats.online_records;
      if (!stats.first_seen) stats.first_seen = r.timestamp;
      stats.last_seen = r.timestamp;
    }
    return monad::MyResult<lanlens::data::UptimeStats>::Ok(stats);
  }
  monad::MyResult<std::optional<lanlens::data::PresenceRecord>>
  latest_record(const std::string &mac) const override {
    auto history = history_since(mac, std::nullopt).value();
    if (history.empty()) {
      return monad::MyResult<std::optional<lanlens::data::PresenceRecord>>::Ok(
          std::nullopt);
    }
    return monad::MyResult<std::optional<lanlens::data::PresenceRecord>>::Ok(
        history.back());
  }
  bool available() const override { return true; }

  size_t size() const {
    std::scoped_lock lock(mutex_);
    return rows.size();
  }
};

} // namespace testinfra
