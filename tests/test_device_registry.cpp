#include <gtest/gtest.h>

#include <algorithm>
#include <thread>

#include "behavior/behavior_tracker.hpp"
#include "cache/arp_cache.hpp"
#include "discovery/device_registry.hpp"
#include "lanlens_error_codes.hpp"
#include "test_config_utils.hpp"
#include "test_fakes.hpp"

namespace {

using lanlens::DeviceRegistry;
using lanlens::LanlensConfigProviderValue;
using lanlens::data::Device;
using lanlens::data::DeviceEvent;
using lanlens::data::DeviceType;
using lanlens::data::ScanErrorSource;
using lanlens::data::UpdateKind;
using namespace std::chrono_literals;

constexpr const char kTvMac[] = "A4:77:33:00:00:01";
constexpr const char kTvIp[] = "192.168.1.30";
constexpr const char kNasMac[] = "00:11:32:00:00:02";
constexpr const char kNasIp[] = "192.168.1.40";

class DeviceRegistryTest : public ::testing::Test {
protected:
  DeviceRegistryTest()
      : provider_(testinfra::make_test_config("/tmp")),
        arp_cache_(arp_reader_, provider_), behavior_(presence_, provider_),
        registry_(provider_, arp_cache_, scanner_, ssdp_, pipeline_, behavior_,
                  device_store_, bundled_) {
    arp_cache_.set_clock(clock_.fn());
    behavior_.set_clock(clock_.fn());
    registry_.set_clock(clock_.fn());
    arp_reader_.entries = {{kTvIp, "a4:77:33:00:00:01", "eth0"},
                           {kNasIp, "00-11-32-00-00-02", "eth0"}};
    observer_id_ = registry_.subscribe([this](const auto &batch) {
      std::scoped_lock lock(events_mutex_);
      events_.insert(events_.end(), batch.begin(), batch.end());
    });
  }

  std::vector<DeviceEvent> drain_events() {
    registry_.flush_events();
    std::scoped_lock lock(events_mutex_);
    auto out = std::move(events_);
    events_.clear();
    return out;
  }

  testinfra::ManualClock clock_;
  testinfra::FakeArpReader arp_reader_;
  testinfra::FakePortScanner scanner_;
  testinfra::FakeSsdpSearcher ssdp_;
  testinfra::FakeFingerprintPipeline pipeline_;
  testinfra::FakePresenceStore presence_;
  testinfra::FakeDeviceStore device_store_;
  testinfra::FakeBundledDatabase bundled_;
  LanlensConfigProviderValue provider_;
  lanlens::ArpCache arp_cache_;
  lanlens::BehaviorTracker behavior_;
  std::mutex events_mutex_;
  std::vector<DeviceEvent> events_;
  DeviceRegistry registry_;
  size_t observer_id_{0};
};

TEST_F(DeviceRegistryTest, UpsertIsIdempotentAndLastSeenMonotonic) {
  auto first = registry_.upsert_from_observation("a4-77-33-00-00-01", kTvIp, "test");
  EXPECT_EQ(first.kind, UpdateKind::discovered);
  EXPECT_EQ(first.device.mac, kTvMac);
  const auto t0 = clock_.now();

  clock_.advance(10s);
  auto second = registry_.upsert_from_observation(kTvMac, "192.168.1.31", "test");
  EXPECT_EQ(second.kind, UpdateKind::updated);
  EXPECT_EQ(second.device.ip, "192.168.1.31");
  EXPECT_EQ(second.device.first_seen, t0);
  EXPECT_EQ(second.device.last_seen, t0 + 10s);

  // An observation stamped earlier never moves last_seen backwards.
  clock_.set(t0 + 5s);
  auto third = registry_.upsert_from_observation(kTvMac, "192.168.1.31", "test");
  EXPECT_EQ(third.device.last_seen, t0 + 10s);

  EXPECT_EQ(registry_.device_count(), 1u);
  ASSERT_TRUE(device_store_.saved.count(kTvMac));
  EXPECT_EQ(device_store_.saved[kTvMac].ip, "192.168.1.31");
}

TEST_F(DeviceRegistryTest, EachMutationEmitsExactlyOneEvent) {
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  ASSERT_TRUE(registry_.set_user_label(kTvMac, std::string("Living room TV"))
                  .is_ok());

  auto events = drain_events();
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].kind, UpdateKind::discovered);
  EXPECT_EQ(events[1].kind, UpdateKind::updated);
  EXPECT_EQ(events[2].kind, UpdateKind::updated);
  EXPECT_EQ(events[2].device.user_label, "Living room TV");
}

TEST_F(DeviceRegistryTest, UnsubscribedObserverGetsNothing) {
  registry_.unsubscribe(observer_id_);
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  EXPECT_TRUE(drain_events().empty());
}

TEST_F(DeviceRegistryTest, PortScanAddsSignalsAndType) {
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  auto d = registry_.apply_port_scan(
      kTvMac, {lanlens::portscan::make_result(8008),
               lanlens::portscan::make_result(443)});
  ASSERT_TRUE(d);
  ASSERT_EQ(d->open_ports.size(), 2u);
  EXPECT_EQ(d->open_ports[0].number, 443);
  EXPECT_EQ(d->device_type, DeviceType::smartTV);
  ASSERT_EQ(d->smart_signals.size(), 1u);
  EXPECT_EQ(d->smart_signals[0].weight, 20);
  EXPECT_EQ(d->smart_score, 30);

  // Same results again do not duplicate ports or signals.
  d = registry_.apply_port_scan(kTvMac, {lanlens::portscan::make_result(8008)});
  ASSERT_TRUE(d);
  EXPECT_EQ(d->open_ports.size(), 2u);
  EXPECT_EQ(d->smart_score, 30);

  EXPECT_FALSE(registry_.apply_port_scan("02:00:00:00:00:99",
                                         {lanlens::portscan::make_result(80)}));
}

TEST_F(DeviceRegistryTest, SmartScoreIsCappedAtHundred) {
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  std::vector<lanlens::data::PortScanResult> results;
  for (int port : {554, 1400, 1883, 7000, 8008, 8009, 8123, 8883, 32400}) {
    results.push_back(lanlens::portscan::make_result(port));
  }
  auto d = registry_.apply_port_scan(kNasMac, results);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->smart_score, 100);
}

TEST_F(DeviceRegistryTest, ServiceDiscoveryResolvesHostThroughArp) {
  lanlens::data::ServiceRecord record;
  record.name = "Living Room._googlecast._tcp.local";
  record.type = "_googlecast._tcp";
  record.port = 8009;
  record.txt_records = {{"md", "Chromecast"}, {"fn", "Living Room"}};
  record.host_ip = kTvIp;

  auto d = registry_.apply_service_discovery(record);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->mac, kTvMac);
  ASSERT_EQ(d->services.size(), 1u);
  EXPECT_EQ(d->services[0].type, lanlens::data::ServiceDiscoveryType::mdns);
  ASSERT_EQ(d->smart_signals.size(), 1u);
  EXPECT_EQ(d->smart_signals[0].description, "mDNS: _googlecast._tcp");
  EXPECT_EQ(d->smart_score, 30);

  record.host_ip = "192.168.1.250";
  EXPECT_FALSE(registry_.apply_service_discovery(record));
  EXPECT_EQ(registry_.device_count(), 1u);
}

TEST_F(DeviceRegistryTest, SsdpAnnouncementTriggersFingerprint) {
  lanlens::data::DeviceFingerprint fp;
  fp.friendly_name = "Office";
  fp.manufacturer = "Sonos, Inc.";
  fp.model_name = "Sonos One";
  fp.source = lanlens::data::FingerprintSource::upnp;
  pipeline_.by_mac[kNasMac] = fp;

  lanlens::data::SsdpAnnouncement ann;
  ann.location = "http://192.168.1.40:1400/xml/device_description.xml";
  ann.server = "Linux UPnP/1.0 Sonos/70.3-35220 (ZPS12)";
  ann.usn = "uuid:RINCON_000E58000001::urn:schemas-upnp-org:device:ZonePlayer:1";
  ann.st = "urn:schemas-upnp-org:device:ZonePlayer:1";
  ann.host_ip = kNasIp;

  auto d = registry_.apply_ssdp(ann);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->hostname, "Sonos");
  ASSERT_EQ(d->services.size(), 1u);
  EXPECT_EQ(d->services[0].txt.at("location"), ann.location);
  EXPECT_EQ(d->smart_score, 25);

  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  ASSERT_EQ(pipeline_.request_count(), 1u);
  EXPECT_EQ(pipeline_.requests[0].location_url, ann.location);

  auto stored = registry_.get_device(kNasMac);
  ASSERT_TRUE(stored);
  ASSERT_TRUE(stored->fingerprint);
  EXPECT_EQ(stored->fingerprint->model_name, "Sonos One");

  // A device with a fingerprint is not looked up again.
  registry_.apply_ssdp(ann);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  EXPECT_EQ(pipeline_.request_count(), 1u);
  EXPECT_EQ(registry_.get_device(kNasMac)->services.size(), 1u);
}

TEST_F(DeviceRegistryTest, UserLabelIsTrimmedAndClearable) {
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  ASSERT_TRUE(registry_.set_user_label(kTvMac, std::string("  Kitchen TV ")).is_ok());
  EXPECT_EQ(registry_.get_device(kTvMac)->user_label, "Kitchen TV");
  EXPECT_EQ(registry_.get_device(kTvMac)->display_name(), "Kitchen TV");

  ASSERT_TRUE(registry_.set_user_label(kTvMac, std::string("   ")).is_ok());
  EXPECT_FALSE(registry_.get_device(kTvMac)->user_label);

  auto missing = registry_.set_user_label("02:00:00:00:00:99", std::string("x"));
  ASSERT_TRUE(missing.is_err());
  EXPECT_EQ(missing.error().code, lanlens_errors::GENERAL::NOT_FOUND);
}

TEST_F(DeviceRegistryTest, SweepMarksStaleDevicesOffline) {
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  clock_.advance(200s);
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  clock_.advance(101s);
  drain_events();

  EXPECT_EQ(registry_.sweep_offline(), 1);
  EXPECT_FALSE(registry_.get_device(kTvMac)->is_online);
  EXPECT_TRUE(registry_.get_device(kNasMac)->is_online);
  EXPECT_EQ(registry_.sweep_offline(), 0);

  auto events = drain_events();
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, UpdateKind::wentOffline);
  EXPECT_EQ(events[0].device.mac, kTvMac);

  ASSERT_TRUE(behavior_.flush_pending().is_ok());
  auto history = behavior_.presence_history(kTvMac);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_FALSE(history.back().is_online);

  // Seen again, the device comes back online.
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  EXPECT_TRUE(registry_.get_device(kTvMac)->is_online);
}

TEST_F(DeviceRegistryTest, QueriesOrderByRecencyAndScore) {
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  clock_.advance(1s);
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  registry_.apply_port_scan(kTvMac, {lanlens::portscan::make_result(8008)});

  auto all = registry_.get_all_devices();
  ASSERT_EQ(all.size(), 2u);
  EXPECT_EQ(all[0].mac, kNasMac);

  auto smart = registry_.get_smart_devices();
  ASSERT_EQ(smart.size(), 1u);
  EXPECT_EQ(smart[0].mac, kTvMac);
  EXPECT_EQ(registry_.get_smart_devices(0).size(), 2u);
}

TEST_F(DeviceRegistryTest, LoadFromStoreRestoresWithoutEvents) {
  Device saved;
  saved.mac = "aa:bb:cc:00:00:77";
  saved.ip = "192.168.1.77";
  saved.device_type = DeviceType::printer;
  saved.user_label = "Office printer";
  device_store_.saved[saved.mac] = saved;

  auto loaded = registry_.load_from_store();
  ASSERT_TRUE(loaded.is_ok());
  EXPECT_EQ(loaded.value(), 1u);
  auto d = registry_.get_device("AA:BB:CC:00:00:77");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->device_type, DeviceType::printer);
  EXPECT_EQ(d->user_label, "Office printer");
  EXPECT_TRUE(drain_events().empty());
}

TEST_F(DeviceRegistryTest, FailedSnapshotWriteKeepsMemoryState) {
  device_store_.fail_writes = true;
  auto ev = registry_.upsert_from_observation(kTvMac, kTvIp, "test");
  EXPECT_EQ(ev.kind, UpdateKind::discovered);
  EXPECT_TRUE(registry_.get_device(kTvMac));
  EXPECT_TRUE(device_store_.saved.empty());
  EXPECT_EQ(drain_events().size(), 1u);
}

TEST_F(DeviceRegistryTest, ReclassifyUnknownDeviceFails) {
  auto r = registry_.reclassify("02:00:00:00:00:99");
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, lanlens_errors::GENERAL::NOT_FOUND);
}

TEST_F(DeviceRegistryTest, ReclassifyUsesPortEvidence) {
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  registry_.apply_port_scan(kNasMac, {lanlens::portscan::make_result(9100)});
  auto r = registry_.reclassify(kNasMac);
  ASSERT_TRUE(r.is_ok());
  auto d = registry_.get_device(kNasMac);
  ASSERT_TRUE(d);
  if (r.value().type != DeviceType::unknown) {
    EXPECT_EQ(d->device_type, r.value().type);
  } else {
    EXPECT_EQ(d->device_type, DeviceType::printer);
  }
}

TEST_F(DeviceRegistryTest, QuickScanUpsertsScansAndFingerprints) {
  scanner_.open[kTvIp] = {8008, 9999};
  scanner_.failing = {kNasIp};

  auto session = registry_.run_quick_scan();
  EXPECT_TRUE(session.is_complete());
  EXPECT_EQ(session.type, lanlens::data::ScanType::quick);
  EXPECT_EQ(session.discovered_count, 2);
  EXPECT_EQ(session.updated_count, 0);
  ASSERT_EQ(session.errors.size(), 1u);
  EXPECT_EQ(session.errors[0].source, ScanErrorSource::portScanner);
  EXPECT_FALSE(session.is_successful());

  auto tv = registry_.get_device(kTvMac);
  ASSERT_TRUE(tv);
  ASSERT_EQ(tv->open_ports.size(), 1u);
  EXPECT_EQ(tv->open_ports[0].number, 8008);
  EXPECT_EQ(tv->device_type, DeviceType::smartTV);

  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  EXPECT_EQ(pipeline_.request_count(), 2u);

  scanner_.failing.clear();
  auto second = registry_.run_quick_scan();
  EXPECT_EQ(second.discovered_count, 0);
  EXPECT_EQ(second.updated_count, 2);
  EXPECT_TRUE(second.is_successful());
  EXPECT_EQ(registry_.recent_sessions().size(), 2u);
}

TEST_F(DeviceRegistryTest, ArpFailureIsRecordedInSession) {
  arp_reader_.failure = monad::make_error(
      lanlens_errors::GENERAL::PERMISSION_DENIED, "cannot read ARP table");
  auto session = registry_.run_arp_scan();
  EXPECT_TRUE(session.is_complete());
  EXPECT_EQ(session.discovered_count, 0);
  ASSERT_EQ(session.errors.size(), 1u);
  EXPECT_EQ(session.errors[0].source, ScanErrorSource::arpScanner);
  EXPECT_EQ(session.errors[0].code, lanlens_errors::GENERAL::PERMISSION_DENIED);
  EXPECT_TRUE(scanner_.scanned.empty());
}

TEST_F(DeviceRegistryTest, PassiveDiscoveryAppliesSsdpAnnouncements) {
  lanlens::data::SsdpAnnouncement ann;
  ann.location = "http://192.168.1.30:8060/";
  ann.server = "Roku/9.4.0 UPnP/1.0 Roku/9.4.0";
  ann.st = "roku:ecp";
  ann.host_ip = kTvIp;
  ssdp_.announcements = {ann};

  ASSERT_TRUE(registry_.start_passive_discovery());
  EXPECT_FALSE(registry_.start_passive_discovery());
  EXPECT_TRUE(registry_.is_passive_running());

  for (int i = 0; i < 200 && !registry_.get_device(kTvMac); ++i) {
    std::this_thread::sleep_for(10ms);
  }
  registry_.stop_passive_discovery();
  EXPECT_FALSE(registry_.is_passive_running());

  auto d = registry_.get_device(kTvMac);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->hostname, "Roku");
  EXPECT_GE(ssdp_.searches.load(), 1);
}

TEST_F(DeviceRegistryTest, HostLeavingArpTableGoesOfflineAfterThreshold) {
  auto first = registry_.run_arp_scan();
  ASSERT_EQ(first.discovered_count, 2);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  drain_events();

  // The NAS drops out of the kernel table; scans keep running every minute.
  arp_reader_.entries = {{kTvIp, "a4:77:33:00:00:01", "eth0"}};
  for (int i = 0; i < 12; ++i) {
    clock_.advance(60s);
    auto session = registry_.run_arp_scan();
    EXPECT_EQ(session.updated_count, 1) << "scan " << i;
    ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  }

  auto nas = registry_.get_device(kNasMac);
  ASSERT_TRUE(nas);
  EXPECT_FALSE(nas->is_online);
  EXPECT_TRUE(registry_.get_device(kTvMac)->is_online);

  auto events = drain_events();
  auto offline = std::count_if(events.begin(), events.end(), [](const auto &e) {
    return e.kind == UpdateKind::wentOffline;
  });
  EXPECT_EQ(offline, 1);
  for (const auto &e : events) {
    if (e.kind == UpdateKind::wentOffline) EXPECT_EQ(e.device.mac, kNasMac);
  }
}

TEST_F(DeviceRegistryTest, PruneCachesDropsExpiredArpEntries) {
  ASSERT_TRUE(arp_cache_.refresh().is_ok());
  arp_reader_.entries = {{kTvIp, "a4:77:33:00:00:01", "eth0"}};
  clock_.advance(20s);
  ASSERT_TRUE(arp_cache_.refresh().is_ok());
  clock_.advance(15s);

  EXPECT_EQ(registry_.prune_caches(), 1u);
  EXPECT_EQ(pipeline_.prune_count(), 1);
  EXPECT_EQ(arp_cache_.stats().entry_count, 1u);
  EXPECT_FALSE(arp_cache_.get_by_ip(kNasIp));
}

TEST_F(DeviceRegistryTest, PassiveDiscoveryPrunesCaches) {
  ASSERT_TRUE(registry_.start_passive_discovery());
  for (int i = 0; i < 200 && pipeline_.prune_count() == 0; ++i) {
    std::this_thread::sleep_for(10ms);
  }
  registry_.stop_passive_discovery();
  EXPECT_GE(pipeline_.prune_count(), 1);
}

TEST_F(DeviceRegistryTest, ChangedDhcpFingerprintResolvesAgain) {
  lanlens::data::DeviceFingerprint fp;
  fp.fingerbank_device_name = "Apple iPhone";
  fp.source = lanlens::data::FingerprintSource::fingerbank;
  pipeline_.by_mac[kTvMac] = fp;
  registry_.upsert_from_observation(kTvMac, kTvIp, "test");

  // Apple mobile parameter list in hex notation.
  auto d = registry_.apply_dhcp_fingerprint(kTvMac, "01:03:06:0f:77:fc");
  ASSERT_TRUE(d);
  EXPECT_EQ(d->dhcp_fingerprint, "1,3,6,15,119,252");
  EXPECT_EQ(d->device_type, DeviceType::phone);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  ASSERT_EQ(pipeline_.request_count(), 1u);
  EXPECT_EQ(pipeline_.requests[0].dhcp_fingerprint, "1,3,6,15,119,252");
  ASSERT_TRUE(registry_.get_device(kTvMac)->fingerprint);

  // Same list in another notation: nothing new to look up.
  registry_.apply_dhcp_fingerprint(kTvMac, "252,119,15,6,3,1");
  registry_.trigger_fingerprint(kTvMac);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  EXPECT_EQ(pipeline_.request_count(), 1u);

  // A different list asks again even though a fingerprint is stored.
  fp.fingerbank_device_name = "Apple MacBook";
  pipeline_.by_mac[kTvMac] = fp;
  registry_.apply_dhcp_fingerprint(kTvMac, "1,3,6,15,119,95,252,44,46");
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  ASSERT_EQ(pipeline_.request_count(), 2u);
  EXPECT_EQ(pipeline_.requests[1].dhcp_fingerprint, "1,3,6,15,44,46,95,119,252");
  EXPECT_EQ(registry_.get_device(kTvMac)->fingerprint->fingerbank_device_name,
            "Apple MacBook");
  EXPECT_EQ(device_store_.saved[kTvMac].dhcp_fingerprint,
            "1,3,6,15,44,46,95,119,252");

  EXPECT_FALSE(registry_.apply_dhcp_fingerprint(kTvMac, "zz"));
  EXPECT_FALSE(registry_.apply_dhcp_fingerprint("02:00:00:00:00:99", "1,3,6"));
}

TEST_F(DeviceRegistryTest, UserAgentsAreCarriedIntoLookups) {
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  const std::string ua = "Synology DSM/7.2 (Linux; x86_64)";
  auto d = registry_.apply_user_agent(kNasMac, "  " + ua + " ");
  ASSERT_TRUE(d);
  ASSERT_EQ(d->user_agents.size(), 1u);
  EXPECT_EQ(d->user_agents[0], ua);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  ASSERT_EQ(pipeline_.request_count(), 1u);
  ASSERT_TRUE(pipeline_.requests[0].user_agents);
  EXPECT_EQ(*pipeline_.requests[0].user_agents, std::vector<std::string>{ua});

  registry_.apply_user_agent(kNasMac, ua);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  EXPECT_EQ(pipeline_.request_count(), 1u);
  EXPECT_EQ(registry_.get_device(kNasMac)->user_agents.size(), 1u);
}

TEST_F(DeviceRegistryTest, PortScanAttachesSecurityPosture) {
  registry_.upsert_from_observation(kNasMac, kNasIp, "test");
  auto d = registry_.apply_port_scan(
      kNasMac, {lanlens::portscan::make_result(23),
                lanlens::portscan::make_result(445)});
  ASSERT_TRUE(d);
  ASSERT_TRUE(d->security_posture);
  EXPECT_EQ(d->security_posture->risk_level, lanlens::data::RiskLevel::critical);
  EXPECT_EQ(d->security_posture->risky_ports, (std::vector<int>{23, 445}));
  EXPECT_EQ(d->security_posture->risk_score, 33);
  EXPECT_EQ(d->security_posture->assessed_at, clock_.now());
  ASSERT_TRUE(device_store_.saved[kNasMac].security_posture);

  // A later hostname feeds the next assessment.
  lanlens::data::SsdpAnnouncement ann;
  ann.server = "Linux/4.4 UPnP/1.0 Netgear/1.0";
  ann.location = "http://192.168.1.40:5000/rootDesc.xml";
  ann.host_ip = kNasIp;
  registry_.apply_ssdp(ann);
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));
  ASSERT_TRUE(registry_.reclassify(kNasMac).is_ok());
  auto posture = registry_.get_device(kNasMac)->security_posture;
  ASSERT_TRUE(posture);
  EXPECT_EQ(posture->risk_score, 38);
}

TEST_F(DeviceRegistryTest, ArpOnlyDeviceBecomesSmartTvFromSsdpAndAirplay) {
  constexpr const char kMac[] = "AA:BB:CC:11:22:33";
  constexpr const char kIp[] = "192.168.1.60";
  arp_reader_.entries.push_back({kIp, "aa:bb:cc:11:22:33", "eth0"});

  auto seen = registry_.upsert_from_observation(kMac, kIp, "ARP table");
  EXPECT_EQ(seen.kind, UpdateKind::discovered);
  EXPECT_EQ(seen.device.device_type, DeviceType::unknown);
  EXPECT_EQ(seen.device.smart_score, 0);

  lanlens::data::SsdpAnnouncement ann;
  ann.location = "http://192.168.1.60:8060/";
  ann.server = "Roku/9.4.0 UPnP/1.0 Roku/9.4.0";
  ann.st = "roku:ecp";
  ann.host_ip = kIp;
  ASSERT_TRUE(registry_.apply_ssdp(ann));

  lanlens::data::ServiceRecord airplay;
  airplay.name = "Living Room._airplay._tcp.local";
  airplay.type = "_airplay._tcp";
  airplay.port = 7000;
  airplay.host_ip = kIp;
  ASSERT_TRUE(registry_.apply_service_discovery(airplay));
  ASSERT_TRUE(registry_.wait_for_fingerprints(5s));

  auto r = registry_.reclassify(kMac);
  ASSERT_TRUE(r.is_ok());
  EXPECT_EQ(r.value().type, DeviceType::smartTV);
  auto d = registry_.get_device(kMac);
  ASSERT_TRUE(d);
  EXPECT_EQ(d->device_type, DeviceType::smartTV);
  EXPECT_GT(d->smart_score, 0);
}

TEST(DeviceRegistryHelpersTest, MdnsWeights) {
  EXPECT_EQ(DeviceRegistry::mdns_smart_weight("_hap._tcp"), 30);
  EXPECT_EQ(DeviceRegistry::mdns_smart_weight("_airplay._tcp"), 25);
  EXPECT_EQ(DeviceRegistry::mdns_smart_weight("_mqtt._tcp"), 25);
  EXPECT_EQ(DeviceRegistry::mdns_smart_weight("_http._tcp"), 15);
  EXPECT_EQ(DeviceRegistry::mdns_smart_weight("_ssh._tcp"), 10);
}

TEST(DeviceRegistryHelpersTest, NamesFromServerHeaders) {
  EXPECT_EQ(DeviceRegistry::extract_device_name(
                "Linux/3.14 UPnP/1.0 Sonos/70.3-35220 (ZPS12)"),
            "Sonos");
  EXPECT_EQ(DeviceRegistry::extract_device_name("Linux/4.9 UPnP/1.0 MyMediaBox/2.1"),
            "MyMediaBox");
  EXPECT_EQ(DeviceRegistry::extract_service_name("Linux UPnP/1.0 Sonos/70.3"),
            "Sonos Player");
  EXPECT_EQ(DeviceRegistry::extract_service_name("DLNADOC/1.50 UPnP/1.0"),
            "DLNA");
  EXPECT_FALSE(DeviceRegistry::extract_service_name(""));
}

} // namespace
