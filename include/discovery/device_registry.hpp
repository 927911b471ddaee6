#pragma once

#include <boost/asio/thread_pool.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "behavior/behavior_tracker.hpp"
#include "cache/arp_cache.hpp"
#include "conf/lanlens_config.hpp"
#include "data/device.hpp"
#include "data/observations.hpp"
#include "data/scan_session.hpp"
#include "discovery/event_debouncer.hpp"
#include "discovery/port_scanner.hpp"
#include "discovery/ssdp_search.hpp"
#include "fingerprint/dhcp_fingerprint.hpp"
#include "fingerprint/fingerprint_pipeline.hpp"
#include "inference/inference_engine.hpp"
#include "inference/mac_analyzer.hpp"
#include "inference/security_posture.hpp"
#include "result_monad.hpp"
#include "state/bundled_database.hpp"
#include "state/device_store.hpp"
#include "util/clock.hpp"
#include "util/mac_vendor_lookup.hpp"

namespace lanlens {

using DeviceObserver =
    std::function<void(const std::vector<data::DeviceEvent> &)>;

/**
 * Owner of the MAC -> Device map.
 *
 * Every mutation runs under one lock, so updates to a device are totally
 * ordered, and produces exactly one event. Events reach observers in
 * debounced batches. Network and fingerprint work happens outside the
 * lock; results are written back through the same mutation path.
 * Snapshots go to the device store after each mutation; a failed write is
 * logged and the in-memory record stays authoritative.
 */
class DeviceRegistry {
public:
  DeviceRegistry(ILanlensConfigProvider &config_provider, ArpCache &arp_cache,
                 IPortScanner &port_scanner, ISsdpSearcher &ssdp_search,
                 IFingerprintPipeline &pipeline, BehaviorTracker &behavior,
                 IDeviceStore &device_store, IBundledDatabase &bundled);
  ~DeviceRegistry();

  DeviceRegistry(const DeviceRegistry &) = delete;
  DeviceRegistry &operator=(const DeviceRegistry &) = delete;

  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  // Restores snapshots written by earlier runs. No events are emitted.
  monad::MyResult<size_t> load_from_store();

  // Creates (discovered) or refreshes (updated) the device for `mac`.
  data::DeviceEvent upsert_from_observation(const std::string &mac,
                                            const std::string &ip,
                                            const std::string &source_label);

  std::optional<data::Device>
  apply_port_scan(const std::string &mac,
                  const std::vector<data::PortScanResult> &results);
  // Resolves the host IP through the ARP cache; unknown hosts are skipped.
  std::optional<data::Device>
  apply_service_discovery(const data::ServiceRecord &record);
  std::optional<data::Device> apply_ssdp(const data::SsdpAnnouncement &ssdp);

  // Records the device's DHCP Option 55 list and, when it differs from the
  // stored one, resolves the fingerprint again with the new value. Known
  // devices only.
  std::optional<data::Device> apply_dhcp_fingerprint(const std::string &mac,
                                                     const std::string &option55);
  // Same for an HTTP User-Agent seen from the device. Keeps the latest few.
  std::optional<data::Device> apply_user_agent(const std::string &mac,
                                               const std::string &user_agent);

  // Background resolution unless the device already has a fingerprint or a
  // lookup for it is running.
  void trigger_fingerprint(const std::string &mac,
                           std::optional<std::string> location_url = std::nullopt);
  // Blocks until no fingerprint lookup is running or `timeout` elapses.
  bool wait_for_fingerprints(std::chrono::milliseconds timeout);

  std::vector<data::Device> get_all_devices() const;
  std::vector<data::Device>
  get_smart_devices(std::optional<int> min_score = std::nullopt) const;
  std::optional<data::Device> get_device(const std::string &mac) const;
  size_t device_count() const;

  monad::MyVoidResult set_user_label(const std::string &mac,
                            std::optional<std::string> label);

  // Online devices not seen for `threshold` go offline. Returns how many.
  int sweep_offline(std::optional<std::chrono::seconds> threshold = std::nullopt);

  // Full inference over everything known about the device, including MAC
  // analysis and behavior. Replaces the stored type when it is not unknown.
  monad::MyResult<InferenceResult> reclassify(const std::string &mac);

  data::ScanSession run_arp_scan();
  data::ScanSession run_quick_scan();
  data::ScanSession run_full_scan();
  void stop_scan();
  std::vector<data::ScanSession> recent_sessions() const;

  // Expired ARP entries and fingerprint cache rows. Passive discovery runs
  // this periodically. Returns how many were dropped.
  size_t prune_caches();

  bool start_passive_discovery();
  void stop_passive_discovery();
  bool is_passive_running() const;

  size_t subscribe(DeviceObserver observer);
  void unsubscribe(size_t id);
  // Hands pending events to observers now.
  void flush_events();

  static int mdns_smart_weight(const std::string &service_type);
  static std::optional<std::string> extract_device_name(const std::string &server);
  static std::optional<std::string> extract_service_name(const std::string &server);

private:
  data::DeviceEvent upsert_locked(const std::string &mac, const std::string &ip,
                                  const std::string &source_label);
  void recompute_locked(data::Device &device);
  void assess_locked(data::Device &device);
  void start_fingerprint(const std::string &normalized, FingerprintRequest request,
                         bool replace_existing);
  void commit_locked(const data::Device &device, data::UpdateKind kind);
  void emit(data::DeviceEvent event);
  void deliver(const std::vector<data::DeviceEvent> &batch);
  std::optional<std::string> lookup_vendor(const std::string &mac) const;
  std::optional<std::string> resolve_mac(const std::string &ip);
  data::ScanSession run_scan(data::ScanType type, const std::vector<int> *ports);
  void passive_loop();

  ILanlensConfigProvider &config_provider_;
  ArpCache &arp_cache_;
  IPortScanner &port_scanner_;
  ISsdpSearcher &ssdp_search_;
  IFingerprintPipeline &pipeline_;
  BehaviorTracker &behavior_;
  IDeviceStore &device_store_;
  IBundledDatabase &bundled_;
  InferenceEngine engine_;
  MacAnalyzer mac_analyzer_;
  MacVendorLookup vendor_lookup_;
  dhcp::DhcpFingerprintMatcher dhcp_matcher_{bundled_};
  SecurityPostureAssessor security_;
  WallClock clock_{system_wall_clock()};

  mutable std::mutex mutex_;
  std::map<std::string, data::Device> devices_;
  std::map<std::string, std::set<std::string>> mdns_types_;
  std::map<std::string, std::map<std::string, std::map<std::string, std::string>>>
      mdns_txt_;

  std::mutex fingerprint_mutex_;
  std::condition_variable fingerprint_cv_;
  std::set<std::string> fingerprints_in_flight_;

  mutable std::mutex sessions_mutex_;
  std::deque<data::ScanSession> sessions_;
  std::atomic<bool> scan_stop_requested_{false};

  std::mutex passive_mutex_;
  std::condition_variable passive_cv_;
  std::thread passive_thread_;
  std::atomic<bool> passive_running_{false};
  bool passive_stop_{false};
  std::chrono::system_clock::time_point last_cache_prune_{}; // passive thread only

  std::mutex observers_mutex_;
  std::map<size_t, DeviceObserver> observers_;
  size_t next_observer_id_{1};

  boost::asio::thread_pool pool_;
  std::unique_ptr<EventDebouncer> debouncer_;
  mutable boost::log::sources::severity_logger<
      boost::log::trivial::severity_level>
      lg_;
};

} // namespace lanlens
