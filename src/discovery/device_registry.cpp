#include "discovery/device_registry.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <latch>

#include "fingerprint/dhcp_fingerprint.hpp"
#include "lanlens_error_codes.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"
#include "util/string_util.hpp"

namespace lanlens {

namespace net = boost::asio;

namespace {

constexpr int kSsdpSmartWeight = 20;
constexpr size_t kMaxRecentSessions = 20;
constexpr std::chrono::seconds kPassiveSearchInterval{30};
constexpr std::chrono::minutes kCachePruneInterval{10};
constexpr size_t kMaxUserAgents = 10;

bool meaningful_token(const std::string &token) {
  auto lower = stringutil::toLowerCase(token);
  return token.size() > 2 && lower != "upnp" && lower != "linux" &&
         lower != "http" && token.find('.') == std::string::npos;
}

std::optional<std::string> first_meaningful_token(const std::string &server) {
  std::string token;
  auto flush = [&token]() -> std::optional<std::string> {
    auto t = stringutil::trimmed(token);
    token.clear();
    if (!t.empty() && meaningful_token(t)) return t;
    return std::nullopt;
  };
  for (char c : server) {
    if (c == '/' || c == ' ') {
      if (auto t = flush()) return t;
    } else {
      token.push_back(c);
    }
  }
  return flush();
}

data::BannerData banners_of(const data::Device &d) {
  data::BannerData banners;
  for (const auto &port : d.open_ports) {
    if (!port.banner) continue;
    if (port.number == 22) banners.ssh = port.banner;
    else if (port.number == 80 || port.number == 8080) banners.http_server = port.banner;
    else if (port.number == 554) banners.rtsp = port.banner;
  }
  return banners;
}

} // namespace

DeviceRegistry::DeviceRegistry(ILanlensConfigProvider &config_provider,
                               ArpCache &arp_cache, IPortScanner &port_scanner,
                               ISsdpSearcher &ssdp_search,
                               IFingerprintPipeline &pipeline,
                               BehaviorTracker &behavior,
                               IDeviceStore &device_store,
                               IBundledDatabase &bundled)
    : config_provider_(config_provider), arp_cache_(arp_cache),
      port_scanner_(port_scanner), ssdp_search_(ssdp_search),
      pipeline_(pipeline), behavior_(behavior), device_store_(device_store),
      bundled_(bundled),
      pool_(static_cast<size_t>(
          std::max(1, config_provider.get().discovery.scan_concurrency))) {
  debouncer_ = std::make_unique<EventDebouncer>(
      pool_.get_executor(),
      std::chrono::milliseconds(
          std::max(0, config_provider.get().discovery.event_debounce_ms)),
      [this](const std::vector<data::DeviceEvent> &batch) { deliver(batch); });
}

DeviceRegistry::~DeviceRegistry() {
  stop_passive_discovery();
  stop_scan();
  wait_for_fingerprints(std::chrono::seconds(10));
  debouncer_->drain();
  pool_.join();
}

// ---------------------------------------------------------------------------
// Mutation path

std::optional<std::string>
DeviceRegistry::lookup_vendor(const std::string &mac) const {
  if (auto v = vendor_lookup_.lookup(mac)) {
    return v;
  }
  if (bundled_.available()) {
    if (auto entry = bundled_.lookup_oui(macaddr::oui(mac))) {
      if (entry->vendor) return entry->vendor;
    }
  }
  return std::nullopt;
}

data::DeviceEvent DeviceRegistry::upsert_locked(const std::string &mac,
                                                const std::string &ip,
                                                const std::string &source_label) {
  const auto now = clock_();
  auto it = devices_.find(mac);
  if (it == devices_.end()) {
    data::Device d;
    d.mac = mac;
    d.ip = ip;
    d.vendor = lookup_vendor(mac);
    d.first_seen = now;
    d.last_seen = now;
    d.is_online = true;
    BOOST_LOG_SEV(lg_, trivial::info)
        << "Discovered " << mac << " at " << ip << " via " << source_label
        << " (" << d.vendor.value_or("unknown vendor") << ")";
    devices_.emplace(mac, d);
    return data::DeviceEvent{d, data::UpdateKind::discovered};
  }
  auto &d = it->second;
  d.ip = ip;
  d.last_seen = std::max(d.last_seen, now);
  d.is_online = true;
  BOOST_LOG_SEV(lg_, trivial::trace)
      << "Seen " << mac << " at " << ip << " via " << source_label;
  return data::DeviceEvent{d, data::UpdateKind::updated};
}

void DeviceRegistry::recompute_locked(data::Device &device) {
  device.smart_score = data::compute_smart_score(device);
}

void DeviceRegistry::assess_locked(data::Device &device) {
  std::vector<int> ports;
  for (const auto &p : device.open_ports) {
    if (p.state == data::PortState::open) ports.push_back(p.number);
  }
  device.security_posture =
      security_.assess(device.hostname, ports, banners_of(device), clock_());
}

void DeviceRegistry::commit_locked(const data::Device &device,
                                   data::UpdateKind kind) {
  if (auto err = device_store_.save(device)) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Device snapshot for " << device.mac << " not saved: " << *err;
  }
  emit(data::DeviceEvent{device, kind});
}

void DeviceRegistry::emit(data::DeviceEvent event) {
  debouncer_->post(std::move(event));
}

void DeviceRegistry::deliver(const std::vector<data::DeviceEvent> &batch) {
  std::vector<DeviceObserver> observers;
  {
    std::scoped_lock lock(observers_mutex_);
    for (const auto &[id, ob] : observers_) observers.push_back(ob);
  }
  for (const auto &ob : observers) {
    try {
      ob(batch);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::error) << "Device observer failed: " << e.what();
    }
  }
}

data::DeviceEvent
DeviceRegistry::upsert_from_observation(const std::string &mac,
                                        const std::string &ip,
                                        const std::string &source_label) {
  const auto normalized = macaddr::normalize_or_upper(mac);
  data::DeviceEvent ev;
  {
    std::scoped_lock lock(mutex_);
    ev = upsert_locked(normalized, ip, source_label);
    commit_locked(ev.device, ev.kind);
  }
  std::vector<std::string> services;
  for (const auto &svc : ev.device.services) services.push_back(svc.name);
  behavior_.record_presence(normalized, true, services, ip);
  return ev;
}

std::optional<data::Device>
DeviceRegistry::apply_port_scan(const std::string &mac,
                                const std::vector<data::PortScanResult> &results) {
  std::scoped_lock lock(mutex_);
  auto it = devices_.find(macaddr::normalize_or_upper(mac));
  if (it == devices_.end()) {
    return std::nullopt;
  }
  auto &d = it->second;
  for (const auto &r : results) {
    if (!d.has_port(r.port)) {
      data::Port port;
      port.number = r.port;
      port.protocol = r.protocol;
      port.state = data::PortState::open;
      if (!r.service.empty()) port.service_name = r.service;
      port.banner = r.banner;
      d.open_ports.push_back(std::move(port));
    }
    if (r.is_smart_indicator) {
      data::SmartSignal signal{
          data::SmartSignalType::openPort,
          fmt::format("Port {}: {}", r.port, r.service.empty() ? "open" : r.service),
          portscan::smart_weight(r.port)};
      if (std::find(d.smart_signals.begin(), d.smart_signals.end(), signal) ==
          d.smart_signals.end()) {
        d.smart_signals.push_back(std::move(signal));
      }
    }
    if (d.device_type == data::DeviceType::unknown && r.inferred_type &&
        *r.inferred_type != data::DeviceType::unknown) {
      d.device_type = *r.inferred_type;
    }
  }
  std::sort(d.open_ports.begin(), d.open_ports.end(),
            [](const auto &a, const auto &b) { return a.number < b.number; });
  recompute_locked(d);
  assess_locked(d);
  commit_locked(d, data::UpdateKind::updated);
  return d;
}

std::optional<std::string> DeviceRegistry::resolve_mac(const std::string &ip) {
  if (auto entry = arp_cache_.get_by_ip(ip)) {
    return entry->mac;
  }
  if (auto r = arp_cache_.refresh(); r.is_err()) {
    return std::nullopt;
  }
  if (auto entry = arp_cache_.get_by_ip(ip)) {
    return entry->mac;
  }
  return std::nullopt;
}

std::optional<data::Device>
DeviceRegistry::apply_service_discovery(const data::ServiceRecord &record) {
  auto ip = stringutil::replace_all(
      stringutil::replace_all(record.host_ip, "[", ""), "]", "");
  auto mac = resolve_mac(ip);
  if (!mac) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "No ARP entry for " << ip << ", skipping service " << record.name;
    return std::nullopt;
  }
  const auto normalized = macaddr::normalize_or_upper(*mac);
  data::Device snapshot;
  {
    std::scoped_lock lock(mutex_);
    auto ev = upsert_locked(normalized, ip, "mDNS");
    auto &d = devices_.at(normalized);

    data::DiscoveredService svc{record.name, data::ServiceDiscoveryType::mdns,
                                record.port, record.txt_records};
    if (!d.has_service(svc)) {
      d.services.push_back(std::move(svc));
    }
    data::SmartSignal signal{data::SmartSignalType::mdnsService,
                             "mDNS: " + record.type,
                             mdns_smart_weight(record.type)};
    if (std::find(d.smart_signals.begin(), d.smart_signals.end(), signal) ==
        d.smart_signals.end()) {
      d.smart_signals.push_back(std::move(signal));
    }
    mdns_types_[normalized].insert(record.type);
    if (!record.txt_records.empty()) {
      mdns_txt_[normalized][record.type] = record.txt_records;
    }
    if (d.device_type == data::DeviceType::unknown) {
      d.device_type =
          engine_.infer(engine_.signals_from_mdns_service_type(record.type));
    }
    recompute_locked(d);
    commit_locked(d, ev.kind);
    snapshot = d;
  }
  std::vector<std::string> services;
  for (const auto &s : snapshot.services) services.push_back(s.name);
  behavior_.record_presence(normalized, true, services, ip);
  return snapshot;
}

std::optional<data::Device>
DeviceRegistry::apply_ssdp(const data::SsdpAnnouncement &ssdp) {
  if (ssdp.host_ip.empty()) {
    BOOST_LOG_SEV(lg_, trivial::debug) << "SSDP announcement without host";
    return std::nullopt;
  }
  auto mac = resolve_mac(ssdp.host_ip);
  if (!mac) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "No ARP entry for SSDP host " << ssdp.host_ip;
    return std::nullopt;
  }
  const auto normalized = macaddr::normalize_or_upper(*mac);
  data::Device snapshot;
  {
    std::scoped_lock lock(mutex_);
    auto ev = upsert_locked(normalized, ssdp.host_ip, "SSDP");
    auto &d = devices_.at(normalized);

    std::string name = !ssdp.st.empty() ? ssdp.st
                       : extract_service_name(ssdp.server).value_or("UPnP Service");
    bool duplicate = std::any_of(
        d.services.begin(), d.services.end(), [&ssdp](const auto &s) {
          if (s.type != data::ServiceDiscoveryType::ssdp) return false;
          auto loc = s.txt.find("location");
          return loc != s.txt.end() && loc->second == ssdp.location;
        });
    if (!duplicate) {
      d.services.push_back(data::DiscoveredService{
          name, data::ServiceDiscoveryType::ssdp, std::nullopt,
          {{"location", ssdp.location}, {"server", ssdp.server}}});
    }
    data::SmartSignal signal{
        data::SmartSignalType::ssdpService,
        "SSDP: " + (ssdp.server.empty() ? std::string("UPnP device") : ssdp.server),
        kSsdpSmartWeight};
    if (std::find(d.smart_signals.begin(), d.smart_signals.end(), signal) ==
        d.smart_signals.end()) {
      d.smart_signals.push_back(std::move(signal));
    }
    if (d.device_type == data::DeviceType::unknown) {
      d.device_type = engine_.infer(
          engine_.signals_from_ssdp(ssdp.server, ssdp.usn, ssdp.st));
    }
    if (!d.hostname && !ssdp.server.empty()) {
      d.hostname = extract_device_name(ssdp.server);
    }
    recompute_locked(d);
    commit_locked(d, ev.kind);
    snapshot = d;
  }
  std::vector<std::string> services;
  for (const auto &s : snapshot.services) services.push_back(s.name);
  behavior_.record_presence(normalized, true, services, ssdp.host_ip);
  trigger_fingerprint(normalized, ssdp.location);
  return snapshot;
}

// ---------------------------------------------------------------------------
// Fingerprinting

void DeviceRegistry::trigger_fingerprint(const std::string &mac,
                                         std::optional<std::string> location_url) {
  const auto normalized = macaddr::normalize_or_upper(mac);
  FingerprintRequest request;
  {
    std::scoped_lock lock(mutex_);
    auto it = devices_.find(normalized);
    if (it == devices_.end() || it->second.fingerprint) {
      return;
    }
    request = FingerprintPipeline::request_for(it->second);
    if (location_url && !location_url->empty()) {
      request.location_url = std::move(location_url);
    }
  }
  start_fingerprint(normalized, std::move(request), false);
}

void DeviceRegistry::start_fingerprint(const std::string &normalized,
                                       FingerprintRequest request,
                                       bool replace_existing) {
  {
    std::scoped_lock lock(fingerprint_mutex_);
    if (!fingerprints_in_flight_.insert(normalized).second) {
      BOOST_LOG_SEV(lg_, trivial::trace)
          << "Fingerprint lookup for " << normalized << " already running";
      return;
    }
  }

  net::post(pool_, [this, normalized, replace_existing,
                    request = std::move(request)]() {
    std::optional<data::DeviceFingerprint> fp;
    try {
      fp = pipeline_.resolve(request);
    } catch (const std::exception &e) {
      BOOST_LOG_SEV(lg_, trivial::error)
          << "Fingerprint lookup for " << normalized << " threw: " << e.what();
    }
    if (fp) {
      std::scoped_lock lock(mutex_);
      auto it = devices_.find(normalized);
      if (it != devices_.end() && (replace_existing || !it->second.fingerprint)) {
        auto &d = it->second;
        d.fingerprint = *fp;
        if (d.device_type == data::DeviceType::unknown) {
          d.device_type = engine_.infer(engine_.signals_from_fingerprint(*fp));
        }
        if (!d.hostname && fp->friendly_name) {
          d.hostname = fp->friendly_name;
        }
        BOOST_LOG_SEV(lg_, trivial::info)
            << "Fingerprinted " << normalized << ": "
            << fp->best_name().value_or("unnamed") << " ["
            << data::to_string(fp->source) << "]";
        commit_locked(d, data::UpdateKind::updated);
      }
    } else {
      BOOST_LOG_SEV(lg_, trivial::debug) << "No fingerprint for " << normalized;
    }
    {
      std::scoped_lock lock(fingerprint_mutex_);
      fingerprints_in_flight_.erase(normalized);
    }
    fingerprint_cv_.notify_all();
  });
}

std::optional<data::Device>
DeviceRegistry::apply_dhcp_fingerprint(const std::string &mac,
                                       const std::string &option55) {
  const auto normalized = macaddr::normalize_or_upper(mac);
  auto value = dhcp::normalize_option55(option55);
  if (value.empty()) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Ignoring unparseable DHCP fingerprint for " << normalized << ": "
        << option55;
    return std::nullopt;
  }
  auto match = dhcp_matcher_.match(value);
  data::Device snapshot;
  FingerprintRequest request;
  {
    std::scoped_lock lock(mutex_);
    auto it = devices_.find(normalized);
    if (it == devices_.end()) {
      return std::nullopt;
    }
    auto &d = it->second;
    if (d.dhcp_fingerprint == value) {
      return d;
    }
    BOOST_LOG_SEV(lg_, trivial::info)
        << "DHCP fingerprint for " << normalized << " is now " << value
        << (match ? " (" + match->device_name + ")" : std::string{});
    d.dhcp_fingerprint = value;
    if (d.device_type == data::DeviceType::unknown && match) {
      d.device_type = engine_.infer(dhcp::DhcpFingerprintMatcher::signals(*match));
    }
    recompute_locked(d);
    commit_locked(d, data::UpdateKind::updated);
    snapshot = d;
    request = FingerprintPipeline::request_for(d);
  }
  start_fingerprint(normalized, std::move(request), true);
  return snapshot;
}

std::optional<data::Device>
DeviceRegistry::apply_user_agent(const std::string &mac,
                                 const std::string &user_agent) {
  const auto normalized = macaddr::normalize_or_upper(mac);
  auto ua = stringutil::trimmed(user_agent);
  if (ua.empty()) {
    return std::nullopt;
  }
  data::Device snapshot;
  FingerprintRequest request;
  {
    std::scoped_lock lock(mutex_);
    auto it = devices_.find(normalized);
    if (it == devices_.end()) {
      return std::nullopt;
    }
    auto &d = it->second;
    if (std::find(d.user_agents.begin(), d.user_agents.end(), ua) !=
        d.user_agents.end()) {
      return d;
    }
    d.user_agents.push_back(ua);
    if (d.user_agents.size() > kMaxUserAgents) {
      d.user_agents.erase(d.user_agents.begin());
    }
    commit_locked(d, data::UpdateKind::updated);
    snapshot = d;
    request = FingerprintPipeline::request_for(d);
  }
  start_fingerprint(normalized, std::move(request), true);
  return snapshot;
}

bool DeviceRegistry::wait_for_fingerprints(std::chrono::milliseconds timeout) {
  std::unique_lock lock(fingerprint_mutex_);
  return fingerprint_cv_.wait_for(
      lock, timeout, [this] { return fingerprints_in_flight_.empty(); });
}

// ---------------------------------------------------------------------------
// Queries

std::vector<data::Device> DeviceRegistry::get_all_devices() const {
  std::vector<data::Device> out;
  {
    std::scoped_lock lock(mutex_);
    out.reserve(devices_.size());
    for (const auto &[mac, d] : devices_) out.push_back(d);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
    return a.last_seen > b.last_seen;
  });
  return out;
}

std::vector<data::Device>
DeviceRegistry::get_smart_devices(std::optional<int> min_score) const {
  const int threshold =
      min_score.value_or(config_provider_.get().discovery.min_smart_score);
  std::vector<data::Device> out;
  {
    std::scoped_lock lock(mutex_);
    for (const auto &[mac, d] : devices_) {
      if (d.smart_score >= threshold) out.push_back(d);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto &a, const auto &b) {
    return a.smart_score > b.smart_score;
  });
  return out;
}

std::optional<data::Device>
DeviceRegistry::get_device(const std::string &mac) const {
  std::scoped_lock lock(mutex_);
  auto it = devices_.find(macaddr::normalize_or_upper(mac));
  if (it == devices_.end()) return std::nullopt;
  return it->second;
}

size_t DeviceRegistry::device_count() const {
  std::scoped_lock lock(mutex_);
  return devices_.size();
}

monad::MyVoidResult DeviceRegistry::set_user_label(const std::string &mac,
                                          std::optional<std::string> label) {
  std::scoped_lock lock(mutex_);
  auto it = devices_.find(macaddr::normalize_or_upper(mac));
  if (it == devices_.end()) {
    return monad::MyVoidResult::Err(
        monad::make_error(lanlens_errors::GENERAL::NOT_FOUND, "Unknown device " + mac));
  }
  if (label) {
    stringutil::trim(*label);
    if (label->empty()) label.reset();
  }
  it->second.user_label = std::move(label);
  commit_locked(it->second, data::UpdateKind::updated);
  return monad::MyVoidResult::Ok();
}

int DeviceRegistry::sweep_offline(std::optional<std::chrono::seconds> threshold) {
  const auto limit = threshold.value_or(std::chrono::seconds(
      config_provider_.get().discovery.offline_after_seconds));
  const auto now = clock_();
  std::vector<std::pair<std::string, std::optional<std::string>>> gone;
  {
    std::scoped_lock lock(mutex_);
    for (auto &[mac, d] : devices_) {
      if (d.is_online && now - d.last_seen > limit) {
        d.is_online = false;
        commit_locked(d, data::UpdateKind::wentOffline);
        gone.emplace_back(mac, d.ip);
      }
    }
  }
  for (const auto &[mac, ip] : gone) {
    BOOST_LOG_SEV(lg_, trivial::info) << mac << " went offline";
    behavior_.record_presence(mac, false, {}, ip);
  }
  return static_cast<int>(gone.size());
}

monad::MyResult<InferenceResult> DeviceRegistry::reclassify(const std::string &mac) {
  const auto normalized = macaddr::normalize_or_upper(mac);
  data::Device d;
  std::set<std::string> mdns_types;
  std::map<std::string, std::map<std::string, std::string>> txt;
  {
    std::scoped_lock lock(mutex_);
    auto it = devices_.find(normalized);
    if (it == devices_.end()) {
      return monad::MyResult<InferenceResult>::Err(monad::make_error(
          lanlens_errors::GENERAL::NOT_FOUND, "Unknown device " + mac));
    }
    d = it->second;
    if (auto m = mdns_types_.find(normalized); m != mdns_types_.end()) {
      mdns_types = m->second;
    }
    if (auto t = mdns_txt_.find(normalized); t != mdns_txt_.end()) {
      txt = t->second;
    }
  }

  std::vector<Signal> signals;
  auto append = [&signals](std::vector<Signal> more) {
    signals.insert(signals.end(), more.begin(), more.end());
  };
  for (const auto &svc : d.services) {
    if (svc.type == data::ServiceDiscoveryType::ssdp) {
      auto server = svc.txt.find("server");
      append(engine_.signals_from_ssdp(
          server != svc.txt.end() ? server->second : std::string{}, "", svc.name));
    }
  }
  for (const auto &type : mdns_types) {
    append(engine_.signals_from_mdns_service_type(type));
  }
  for (const auto &port : d.open_ports) {
    append(engine_.signals_from_port(port.number));
  }
  if (d.fingerprint) append(engine_.signals_from_fingerprint(*d.fingerprint));
  if (d.hostname) append(engine_.signals_from_hostname(*d.hostname));
  if (d.dhcp_fingerprint) {
    if (auto match = dhcp_matcher_.match(*d.dhcp_fingerprint)) {
      append(dhcp::DhcpFingerprintMatcher::signals(*match));
    }
  }
  append(behavior_.signals_for(normalized));

  EnhancedEvidence evidence;
  for (const auto &[type, records] : txt) {
    evidence.mdns_txt.push_back(MdnsTxtData{type, records});
  }
  auto banners = banners_of(d);
  if (!banners.empty()) evidence.banners = banners;
  evidence.mac_analysis = mac_analyzer_.analyze(d.mac, d.vendor);

  auto result = engine_.infer_enhanced(std::move(signals), evidence);
  {
    std::scoped_lock lock(mutex_);
    auto it = devices_.find(normalized);
    if (it != devices_.end()) {
      auto &current = it->second;
      auto previous = current.security_posture;
      assess_locked(current);
      bool changed = !previous ||
                     previous->risk_level != current.security_posture->risk_level ||
                     previous->risk_factors != current.security_posture->risk_factors;
      if (result.type != data::DeviceType::unknown &&
          current.device_type != result.type) {
        current.device_type = result.type;
        changed = true;
      }
      if (changed) commit_locked(current, data::UpdateKind::updated);
    }
  }
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Reclassified " << normalized << " as " << data::to_string(result.type)
      << fmt::format(" ({:.2f})", result.confidence);
  return monad::MyResult<InferenceResult>::Ok(result);
}

// ---------------------------------------------------------------------------
// Scans

data::ScanSession DeviceRegistry::run_arp_scan() {
  return run_scan(data::ScanType::passive, nullptr);
}

data::ScanSession DeviceRegistry::run_quick_scan() {
  return run_scan(data::ScanType::quick, &portscan::quick_ports());
}

data::ScanSession DeviceRegistry::run_full_scan() {
  return run_scan(data::ScanType::full, &portscan::smart_device_ports());
}

void DeviceRegistry::stop_scan() { scan_stop_requested_ = true; }

data::ScanSession DeviceRegistry::run_scan(data::ScanType type,
                                           const std::vector<int> *ports) {
  scan_stop_requested_ = false;
  auto session = data::ScanSession::begin(type, clock_());
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Starting " << data::to_string(type) << " scan " << session.id;

  // Only the live table counts as a sighting.
  auto table = arp_cache_.refresh();
  if (table.is_err()) {
    session.add_error(data::ScanErrorSource::arpScanner, table.error().what,
                      table.error().code, true, clock_());
  } else {
    std::vector<std::pair<std::string, std::string>> targets;
    for (const auto &entry : table.value()) {
      auto ev = upsert_from_observation(entry.mac, entry.ip, "ARP table");
      if (ev.kind == data::UpdateKind::discovered) {
        ++session.discovered_count;
      } else {
        ++session.updated_count;
      }
      targets.emplace_back(ev.device.mac, ev.device.ip);
    }

    if (ports) {
      std::mutex session_mutex;
      std::latch done(static_cast<std::ptrdiff_t>(targets.size()));
      for (const auto &[mac, ip] : targets) {
        net::post(pool_, [&, mac = mac, ip = ip]() {
          if (!scan_stop_requested_) {
            auto r = port_scanner_.scan(ip, *ports);
            if (r.is_err()) {
              std::scoped_lock lock(session_mutex);
              session.add_error(data::ScanErrorSource::portScanner,
                                mac + ": " + r.error().what, r.error().code,
                                true, clock_());
            } else {
              apply_port_scan(mac, r.value());
            }
          }
          done.count_down();
        });
      }
      done.wait();
    }

    if (!scan_stop_requested_) {
      for (const auto &[mac, ip] : targets) {
        trigger_fingerprint(mac);
      }
    }
  }

  sweep_offline();
  session.finish(clock_());
  if (scan_stop_requested_) {
    BOOST_LOG_SEV(lg_, trivial::warning) << "Scan " << session.id << " stopped";
  }
  BOOST_LOG_SEV(lg_, trivial::info)
      << "Scan " << session.id << " finished: " << session.discovered_count
      << " discovered, " << session.updated_count << " updated, "
      << session.errors.size() << " errors";
  {
    std::scoped_lock lock(sessions_mutex_);
    sessions_.push_back(session);
    while (sessions_.size() > kMaxRecentSessions) sessions_.pop_front();
  }
  return session;
}

std::vector<data::ScanSession> DeviceRegistry::recent_sessions() const {
  std::scoped_lock lock(sessions_mutex_);
  return {sessions_.begin(), sessions_.end()};
}

// ---------------------------------------------------------------------------
// Passive discovery

bool DeviceRegistry::start_passive_discovery() {
  if (passive_running_.exchange(true)) {
    return false;
  }
  {
    std::scoped_lock lock(passive_mutex_);
    passive_stop_ = false;
  }
  passive_thread_ = std::thread([this] { passive_loop(); });
  BOOST_LOG_SEV(lg_, trivial::info) << "Passive discovery started";
  return true;
}

void DeviceRegistry::stop_passive_discovery() {
  {
    std::scoped_lock lock(passive_mutex_);
    passive_stop_ = true;
  }
  passive_cv_.notify_all();
  if (passive_thread_.joinable()) {
    passive_thread_.join();
    BOOST_LOG_SEV(lg_, trivial::info) << "Passive discovery stopped";
  }
  passive_running_ = false;
}

bool DeviceRegistry::is_passive_running() const { return passive_running_; }

size_t DeviceRegistry::prune_caches() {
  auto arp = arp_cache_.prune();
  auto fingerprints = pipeline_.prune_caches();
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Pruned " << arp << " ARP entries and " << fingerprints
      << " fingerprint cache rows";
  return arp + static_cast<size_t>(std::max<int64_t>(0, fingerprints));
}

void DeviceRegistry::passive_loop() {
  const auto listen = std::chrono::seconds(
      std::max(1, config_provider_.get().discovery.ssdp_listen_seconds));
  bool source_failed = false;
  for (;;) {
    {
      std::scoped_lock lock(passive_mutex_);
      if (passive_stop_) break;
    }
    if (auto now = clock_(); now - last_cache_prune_ >= kCachePruneInterval) {
      last_cache_prune_ = now;
      prune_caches();
    }
    auto found = ssdp_search_.search(listen);
    if (found.is_err()) {
      if (!source_failed) {
        BOOST_LOG_SEV(lg_, trivial::warning)
            << "SSDP source unavailable: " << found.error().what;
        source_failed = true;
      }
    } else {
      source_failed = false;
      for (const auto &ann : found.value()) {
        {
          std::scoped_lock lock(passive_mutex_);
          if (passive_stop_) break;
        }
        apply_ssdp(ann);
      }
    }
    std::unique_lock lock(passive_mutex_);
    if (passive_cv_.wait_for(lock, kPassiveSearchInterval,
                             [this] { return passive_stop_; })) {
      break;
    }
  }
}

// ---------------------------------------------------------------------------
// Observers and persistence

size_t DeviceRegistry::subscribe(DeviceObserver observer) {
  std::scoped_lock lock(observers_mutex_);
  auto id = next_observer_id_++;
  observers_.emplace(id, std::move(observer));
  return id;
}

void DeviceRegistry::unsubscribe(size_t id) {
  std::scoped_lock lock(observers_mutex_);
  observers_.erase(id);
}

void DeviceRegistry::flush_events() { debouncer_->drain(); }

monad::MyResult<size_t> DeviceRegistry::load_from_store() {
  auto loaded = device_store_.load_all();
  if (loaded.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::warning)
        << "Device snapshots unavailable: " << loaded.error().what;
    return monad::MyResult<size_t>::Err(loaded.error());
  }
  std::scoped_lock lock(mutex_);
  size_t added = 0;
  for (auto &d : loaded.value()) {
    auto mac = macaddr::normalize_or_upper(d.mac);
    d.mac = mac;
    if (devices_.emplace(mac, std::move(d)).second) ++added;
  }
  BOOST_LOG_SEV(lg_, trivial::info) << "Restored " << added << " devices";
  return monad::MyResult<size_t>::Ok(added);
}

// ---------------------------------------------------------------------------
// Header helpers

int DeviceRegistry::mdns_smart_weight(const std::string &service_type) {
  if (service_type == "_hap._tcp" || service_type == "_homekit._tcp") return 30;
  if (service_type == "_googlecast._tcp" || service_type == "_airplay._tcp")
    return 25;
  if (service_type == "_mqtt._tcp" || service_type == "_coap._udp") return 25;
  if (service_type == "_http._tcp" || service_type == "_https._tcp") return 15;
  return 10;
}

std::optional<std::string>
DeviceRegistry::extract_device_name(const std::string &server) {
  static const std::vector<std::string> kBrands{
      "Sonos",  "Roku",  "Samsung", "LG",      "Sony",    "Vizio",   "Philips",
      "Bose",   "Denon", "Yamaha",  "Onkyo",   "Pioneer", "Hue",     "Ring",
      "Nest",   "Ecobee", "Wemo",   "TP-Link", "Netgear", "Asus",    "Linksys"};
  const auto lower = stringutil::toLowerCase(server);
  for (const auto &brand : kBrands) {
    if (stringutil::contains(lower, stringutil::toLowerCase(brand))) {
      return brand;
    }
  }
  return first_meaningful_token(server);
}

std::optional<std::string>
DeviceRegistry::extract_service_name(const std::string &server) {
  static const std::vector<std::pair<std::string, std::string>> kServices{
      {"sonos", "Sonos Player"},
      {"roku", "Roku"},
      {"samsung", "Samsung TV"},
      {"lg", "LG TV"},
      {"philips", "Philips"},
      {"hue", "Philips Hue"},
      {"ring", "Ring"},
      {"nest", "Nest"},
      {"wemo", "Wemo"},
      {"streammagic", "StreamMagic"},
      {"dlna", "DLNA"},
      {"mediarenderer", "Media Renderer"},
      {"mediaserver", "Media Server"}};
  if (server.empty()) return std::nullopt;
  const auto lower = stringutil::toLowerCase(server);
  for (const auto &[pattern, name] : kServices) {
    if (stringutil::contains(lower, pattern)) return name;
  }
  return first_meaningful_token(server);
}

} // namespace lanlens
