#include "data/fingerprint.hpp"

#include <stdexcept>

#include "util/string_util.hpp"

namespace lanlens::data {

namespace {

std::optional<std::string> opt_string(const json::object &jo,
                                      std::string_view key) {
  if (auto *p = jo.if_contains(key)) {
    if (p->is_string()) return std::string(p->as_string().c_str());
  }
  return std::nullopt;
}

std::optional<int64_t> opt_int(const json::object &jo, std::string_view key) {
  if (auto *p = jo.if_contains(key)) {
    if (p->is_number()) return p->to_number<int64_t>();
  }
  return std::nullopt;
}

std::optional<bool> opt_bool(const json::object &jo, std::string_view key) {
  if (auto *p = jo.if_contains(key)) {
    if (p->is_bool()) return p->as_bool();
  }
  return std::nullopt;
}

template <typename T>
void put_opt(json::object &jo, std::string_view key,
             const std::optional<T> &v) {
  if (v) jo[key] = json::value_from(*v);
}

} // namespace

std::string to_string(FingerprintSource s) {
  switch (s) {
  case FingerprintSource::upnp:
    return "upnp";
  case FingerprintSource::fingerbank:
    return "fingerbank";
  case FingerprintSource::both:
    return "both";
  case FingerprintSource::none:
    break;
  }
  return "none";
}

FingerprintSource fingerprint_source_from_string(const std::string &s) {
  if (s == "upnp") return FingerprintSource::upnp;
  if (s == "fingerbank") return FingerprintSource::fingerbank;
  if (s == "both") return FingerprintSource::both;
  return FingerprintSource::none;
}

UpnpService tag_invoke(const json::value_to_tag<UpnpService> &,
                       const json::value &jv) {
  const auto &jo = jv.as_object();
  UpnpService s{};
  s.service_type = opt_string(jo, "serviceType").value_or("");
  s.service_id = opt_string(jo, "serviceId").value_or("");
  s.control_url = opt_string(jo, "controlURL");
  s.event_sub_url = opt_string(jo, "eventSubURL");
  s.scpd_url = opt_string(jo, "SCPDURL");
  return s;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const UpnpService &s) {
  json::object jo{{"serviceType", s.service_type},
                  {"serviceId", s.service_id}};
  put_opt(jo, "controlURL", s.control_url);
  put_opt(jo, "eventSubURL", s.event_sub_url);
  put_opt(jo, "SCPDURL", s.scpd_url);
  jv = std::move(jo);
}

DeviceFingerprint tag_invoke(const json::value_to_tag<DeviceFingerprint> &,
                             const json::value &jv) {
  auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("DeviceFingerprint is not an object");
  }
  const auto &jo = *jo_p;
  DeviceFingerprint fp{};
  fp.friendly_name = opt_string(jo, "friendlyName");
  fp.manufacturer = opt_string(jo, "manufacturer");
  fp.manufacturer_url = opt_string(jo, "manufacturerURL");
  fp.model_description = opt_string(jo, "modelDescription");
  fp.model_name = opt_string(jo, "modelName");
  fp.model_number = opt_string(jo, "modelNumber");
  fp.serial_number = opt_string(jo, "serialNumber");
  fp.upnp_device_type = opt_string(jo, "upnpDeviceType");
  if (auto *p = jo.if_contains("upnpServices"); p && p->is_array()) {
    fp.upnp_services = json::value_to<std::vector<UpnpService>>(*p);
  }
  fp.fingerbank_device_name = opt_string(jo, "fingerbankDeviceName");
  fp.fingerbank_device_id = opt_int(jo, "fingerbankDeviceId");
  if (auto *p = jo.if_contains("fingerbankParents"); p && p->is_array()) {
    fp.fingerbank_parents = json::value_to<std::vector<std::string>>(*p);
  }
  fp.fingerbank_score = opt_int(jo, "fingerbankScore");
  fp.operating_system = opt_string(jo, "operatingSystem");
  fp.os_version = opt_string(jo, "osVersion");
  fp.is_mobile = opt_bool(jo, "isMobile");
  fp.is_tablet = opt_bool(jo, "isTablet");
  fp.source =
      fingerprint_source_from_string(opt_string(jo, "source").value_or(""));
  if (auto ts = opt_string(jo, "timestamp")) {
    if (auto tp = stringutil::parseISO8601(*ts)) fp.timestamp = *tp;
  }
  fp.cache_hit = opt_bool(jo, "cacheHit").value_or(false);
  return fp;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const DeviceFingerprint &fp) {
  json::object jo;
  put_opt(jo, "friendlyName", fp.friendly_name);
  put_opt(jo, "manufacturer", fp.manufacturer);
  put_opt(jo, "manufacturerURL", fp.manufacturer_url);
  put_opt(jo, "modelDescription", fp.model_description);
  put_opt(jo, "modelName", fp.model_name);
  put_opt(jo, "modelNumber", fp.model_number);
  put_opt(jo, "serialNumber", fp.serial_number);
  put_opt(jo, "upnpDeviceType", fp.upnp_device_type);
  put_opt(jo, "upnpServices", fp.upnp_services);
  put_opt(jo, "fingerbankDeviceName", fp.fingerbank_device_name);
  put_opt(jo, "fingerbankDeviceId", fp.fingerbank_device_id);
  put_opt(jo, "fingerbankParents", fp.fingerbank_parents);
  put_opt(jo, "fingerbankScore", fp.fingerbank_score);
  put_opt(jo, "operatingSystem", fp.operating_system);
  put_opt(jo, "osVersion", fp.os_version);
  put_opt(jo, "isMobile", fp.is_mobile);
  put_opt(jo, "isTablet", fp.is_tablet);
  jo["source"] = to_string(fp.source);
  jo["timestamp"] = stringutil::formatISO8601(fp.timestamp);
  jo["cacheHit"] = fp.cache_hit;
  jv = std::move(jo);
}

} // namespace lanlens::data
