#include "fingerprint/fingerprint_pipeline.hpp"

#include "fingerprint/dhcp_fingerprint.hpp"
#include "util/mac_address.hpp"
#include "util/my_logging.hpp"

namespace lanlens {

FingerprintPipeline::FingerprintPipeline(IUpnpDescriptionFetcher &upnp_fetcher,
                                         IFingerbankClient &fingerbank,
                                         FingerprintCache &cache,
                                         IBundledDatabase &bundled)
    : upnp_fetcher_(upnp_fetcher), fingerbank_(fingerbank), cache_(cache),
      bundled_(bundled) {}

std::optional<std::string>
FingerprintPipeline::location_url(const data::Device &device) {
  for (const auto &svc : device.services) {
    if (svc.type != data::ServiceDiscoveryType::ssdp) continue;
    auto it = svc.txt.find("location");
    if (it != svc.txt.end() && !it->second.empty()) {
      return it->second;
    }
  }
  return std::nullopt;
}

FingerprintRequest FingerprintPipeline::request_for(const data::Device &device,
                                                    bool force_refresh) {
  FingerprintRequest req;
  req.mac = device.mac;
  req.location_url = location_url(device);
  req.dhcp_fingerprint = device.dhcp_fingerprint;
  if (!device.user_agents.empty()) req.user_agents = device.user_agents;
  req.force_refresh = force_refresh;
  return req;
}

std::string
FingerprintPipeline::bundled_dhcp_hash(const std::string &dhcp_fingerprint) {
  return dhcp::option55_hash(dhcp_fingerprint);
}

std::optional<data::DeviceFingerprint>
FingerprintPipeline::resolve(const FingerprintRequest &request) {
  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Fingerprinting " << request.mac
      << " location=" << request.location_url.value_or("none")
      << " force_refresh=" << request.force_refresh;

  auto upnp = resolve_upnp(request);
  auto remote = resolve_remote(request);
  auto merged = merge(upnp, remote, clock_());

  BOOST_LOG_SEV(lg_, trivial::debug)
      << "Fingerprint for " << request.mac << ": "
      << (merged ? data::to_string(merged->source) : std::string("none"));
  return merged;
}

std::optional<data::DeviceFingerprint>
FingerprintPipeline::resolve_upnp(const FingerprintRequest &request) {
  if (!request.location_url || request.location_url->empty()) {
    return std::nullopt;
  }
  const auto &location = *request.location_url;
  if (!request.force_refresh) {
    if (auto cached = cache_.get_upnp(request.mac, location)) {
      BOOST_LOG_SEV(lg_, trivial::trace) << "UPnP cache hit for " << request.mac;
      return cached;
    }
  }
  auto fetched = upnp_fetcher_.fetch(location);
  if (fetched) {
    cache_.put_upnp(request.mac, location, *fetched);
  }
  return fetched;
}

std::optional<data::DeviceFingerprint>
FingerprintPipeline::lookup_bundled(const FingerprintRequest &request) {
  if (!bundled_.available()) {
    return std::nullopt;
  }
  auto oui = macaddr::oui(request.mac);
  if (auto entry = bundled_.lookup_oui(oui)) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Bundled database OUI match " << oui << " -> " << entry->device_name;
    return entry->to_fingerprint(clock_());
  }
  if (request.dhcp_fingerprint && !request.dhcp_fingerprint->empty()) {
    if (auto entry =
            bundled_.lookup_dhcp_hash(bundled_dhcp_hash(*request.dhcp_fingerprint))) {
      BOOST_LOG_SEV(lg_, trivial::debug)
          << "Bundled database DHCP match -> " << entry->device_name;
      return entry->to_fingerprint(clock_());
    }
  }
  return std::nullopt;
}

std::optional<data::DeviceFingerprint>
FingerprintPipeline::resolve_remote(const FingerprintRequest &request) {
  if (!request.force_refresh) {
    if (auto cached = cache_.get_remote(request.mac, request.dhcp_fingerprint,
                                        request.user_agents)) {
      BOOST_LOG_SEV(lg_, trivial::trace)
          << "Remote fingerprint cache hit for " << request.mac;
      return cached;
    }
    if (auto bundled = lookup_bundled(request)) {
      return bundled;
    }
  }

  if (!fingerbank_.enabled()) {
    return std::nullopt;
  }
  auto r = fingerbank_.interrogate(request.mac, request.dhcp_fingerprint,
                                   request.user_agents);
  if (r.is_err()) {
    BOOST_LOG_SEV(lg_, trivial::debug)
        << "Remote lookup for " << request.mac
        << " yielded nothing: " << r.error().what;
    return std::nullopt;
  }
  // The whole answer is cached, including one that names no device.
  cache_.put_remote(request.mac, r.value(), request.dhcp_fingerprint,
                    request.user_agents);
  if (!r.value().has_data()) {
    return std::nullopt;
  }
  return r.value();
}

std::optional<data::DeviceFingerprint>
FingerprintPipeline::merge(const std::optional<data::DeviceFingerprint> &upnp,
                           const std::optional<data::DeviceFingerprint> &remote,
                           std::chrono::system_clock::time_point now) {
  if (!upnp && !remote) {
    return std::nullopt;
  }
  data::DeviceFingerprint out;
  if (upnp) {
    out.friendly_name = upnp->friendly_name;
    out.manufacturer = upnp->manufacturer;
    out.manufacturer_url = upnp->manufacturer_url;
    out.model_description = upnp->model_description;
    out.model_name = upnp->model_name;
    out.model_number = upnp->model_number;
    out.serial_number = upnp->serial_number;
    out.upnp_device_type = upnp->upnp_device_type;
    out.upnp_services = upnp->upnp_services;
  }
  if (remote) {
    out.fingerbank_device_name = remote->fingerbank_device_name;
    out.fingerbank_device_id = remote->fingerbank_device_id;
    out.fingerbank_parents = remote->fingerbank_parents;
    out.fingerbank_score = remote->fingerbank_score;
    out.operating_system = remote->operating_system;
    out.os_version = remote->os_version;
    out.is_mobile = remote->is_mobile;
    out.is_tablet = remote->is_tablet;
  }
  if (upnp && remote) {
    out.source = data::FingerprintSource::both;
  } else if (upnp) {
    out.source = data::FingerprintSource::upnp;
  } else {
    out.source = data::FingerprintSource::fingerbank;
  }
  out.cache_hit = (!upnp || upnp->cache_hit) && (!remote || remote->cache_hit);
  out.timestamp = now;
  return out;
}

} // namespace lanlens
