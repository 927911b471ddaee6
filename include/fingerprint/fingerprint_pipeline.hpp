#pragma once

#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/trivial.hpp>

#include <optional>
#include <string>
#include <vector>

#include "cache/fingerprint_cache.hpp"
#include "data/device.hpp"
#include "data/fingerprint.hpp"
#include "fingerprint/fingerbank_client.hpp"
#include "fingerprint/upnp_description_fetcher.hpp"
#include "state/bundled_database.hpp"
#include "util/clock.hpp"

namespace lanlens {

struct FingerprintRequest {
  std::string mac;
  std::optional<std::string> location_url;
  std::optional<std::string> dhcp_fingerprint;
  std::optional<std::vector<std::string>> user_agents;
  bool force_refresh{false};
};

class IFingerprintPipeline {
public:
  virtual ~IFingerprintPipeline() = default;

  // nullopt when no origin produced anything. Never fails.
  virtual std::optional<data::DeviceFingerprint>
  resolve(const FingerprintRequest &request) = 0;

  // Drops expired cache rows. Returns how many were removed.
  virtual int64_t prune_caches() = 0;
};

/**
 * Resolves a device fingerprint from two origins.
 *
 * UPnP: in-memory cache, then the device's own description document.
 * Remote: durable cache (MAC + signal hash), then the bundled offline
 * database (OUI, then DHCP hash), then the remote API when a key is set.
 * `force_refresh` skips every cache and the bundled database. Remote
 * failures of any kind degrade to "no remote data".
 */
class FingerprintPipeline : public IFingerprintPipeline {
public:
  FingerprintPipeline(IUpnpDescriptionFetcher &upnp_fetcher,
                      IFingerbankClient &fingerbank,
                      FingerprintCache &cache,
                      IBundledDatabase &bundled);

  void set_clock(WallClock clock) { clock_ = std::move(clock); }

  std::optional<data::DeviceFingerprint>
  resolve(const FingerprintRequest &request) override;

  int64_t prune_caches() override { return cache_.prune(); }

  // Builds a request from what the device record already knows.
  static FingerprintRequest request_for(const data::Device &device,
                                        bool force_refresh = false);

  // LOCATION of the first SSDP service that advertises one.
  static std::optional<std::string>
  location_url(const data::Device &device);

  // Key of the bundled dhcp_entries table.
  static std::string bundled_dhcp_hash(const std::string &dhcp_fingerprint);

  static std::optional<data::DeviceFingerprint>
  merge(const std::optional<data::DeviceFingerprint> &upnp,
        const std::optional<data::DeviceFingerprint> &remote,
        std::chrono::system_clock::time_point now);

private:
  std::optional<data::DeviceFingerprint>
  resolve_upnp(const FingerprintRequest &request);
  std::optional<data::DeviceFingerprint>
  resolve_remote(const FingerprintRequest &request);
  std::optional<data::DeviceFingerprint>
  lookup_bundled(const FingerprintRequest &request);

  IUpnpDescriptionFetcher &upnp_fetcher_;
  IFingerbankClient &fingerbank_;
  FingerprintCache &cache_;
  IBundledDatabase &bundled_;
  WallClock clock_{system_wall_clock()};
  boost::log::sources::severity_logger<boost::log::trivial::severity_level> lg_;
};

} // namespace lanlens
