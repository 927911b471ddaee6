#pragma once

#include <boost/json.hpp>
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lanlens::data {
namespace json = boost::json;

enum class FingerprintSource { upnp, fingerbank, both, none };

std::string to_string(FingerprintSource s);
FingerprintSource fingerprint_source_from_string(const std::string &s);

struct UpnpService {
  std::string service_type;
  std::string service_id;
  std::optional<std::string> control_url;
  std::optional<std::string> event_sub_url;
  std::optional<std::string> scpd_url;

  bool operator==(const UpnpService &) const = default;
};

// Identification data merged from a device's own UPnP description and the
// remote fingerprint service. Each block of fields belongs to one origin.
struct DeviceFingerprint {
  // UPnP description fields
  std::optional<std::string> friendly_name;
  std::optional<std::string> manufacturer;
  std::optional<std::string> manufacturer_url;
  std::optional<std::string> model_description;
  std::optional<std::string> model_name;
  std::optional<std::string> model_number;
  std::optional<std::string> serial_number;
  std::optional<std::string> upnp_device_type;
  std::optional<std::vector<UpnpService>> upnp_services;

  // Remote fingerprint fields
  std::optional<std::string> fingerbank_device_name;
  std::optional<int64_t> fingerbank_device_id;
  std::optional<std::vector<std::string>> fingerbank_parents;
  std::optional<int64_t> fingerbank_score;
  std::optional<std::string> operating_system;
  std::optional<std::string> os_version;
  std::optional<bool> is_mobile;
  std::optional<bool> is_tablet;

  FingerprintSource source{FingerprintSource::none};
  std::chrono::system_clock::time_point timestamp{};
  bool cache_hit{false};

  bool has_data() const {
    return friendly_name || manufacturer || model_name ||
           fingerbank_device_name || fingerbank_score;
  }

  std::optional<std::string> best_name() const {
    if (fingerbank_device_name) return fingerbank_device_name;
    if (friendly_name) return friendly_name;
    return model_name;
  }

  std::optional<std::string> best_manufacturer() const {
    if (manufacturer) return manufacturer;
    if (fingerbank_parents && !fingerbank_parents->empty())
      return fingerbank_parents->front();
    return std::nullopt;
  }

  bool operator==(const DeviceFingerprint &) const = default;

  friend DeviceFingerprint tag_invoke(
      const json::value_to_tag<DeviceFingerprint> &, const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const DeviceFingerprint &fp);
};

UpnpService tag_invoke(const json::value_to_tag<UpnpService> &,
                       const json::value &jv);
void tag_invoke(const json::value_from_tag &, json::value &jv,
                const UpnpService &s);

} // namespace lanlens::data
