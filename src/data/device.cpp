#include "data/device.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

#include "util/string_util.hpp"

namespace lanlens::data {

namespace {

struct TypeName {
  DeviceType type;
  const char *name;
};

constexpr TypeName kTypeNames[] = {
    {DeviceType::smartTV, "smartTV"},     {DeviceType::speaker, "speaker"},
    {DeviceType::camera, "camera"},       {DeviceType::thermostat, "thermostat"},
    {DeviceType::light, "light"},         {DeviceType::plug, "plug"},
    {DeviceType::hub, "hub"},             {DeviceType::printer, "printer"},
    {DeviceType::nas, "nas"},             {DeviceType::computer, "computer"},
    {DeviceType::phone, "phone"},         {DeviceType::tablet, "tablet"},
    {DeviceType::router, "router"},       {DeviceType::accessPoint, "accessPoint"},
    {DeviceType::appliance, "appliance"}, {DeviceType::unknown, "unknown"},
};

const char *to_cstr(TransportProtocol p) {
  return p == TransportProtocol::udp ? "udp" : "tcp";
}

const char *to_cstr(PortState s) {
  switch (s) {
  case PortState::closed:
    return "closed";
  case PortState::filtered:
    return "filtered";
  case PortState::open:
    break;
  }
  return "open";
}

const char *to_cstr(ServiceDiscoveryType t) {
  switch (t) {
  case ServiceDiscoveryType::ssdp:
    return "ssdp";
  case ServiceDiscoveryType::upnp:
    return "upnp";
  case ServiceDiscoveryType::mdns:
    break;
  }
  return "mdns";
}

ServiceDiscoveryType service_type_from(const std::string &s) {
  if (s == "ssdp") return ServiceDiscoveryType::ssdp;
  if (s == "upnp") return ServiceDiscoveryType::upnp;
  return ServiceDiscoveryType::mdns;
}

constexpr const char *kSmartSignalNames[] = {
    "openPort", "mdnsService", "ssdpService", "httpServer", "macVendor",
    "hostname"};

SmartSignalType smart_signal_type_from(const std::string &s) {
  for (size_t i = 0; i < std::size(kSmartSignalNames); ++i) {
    if (s == kSmartSignalNames[i]) return static_cast<SmartSignalType>(i);
  }
  return SmartSignalType::openPort;
}

std::optional<std::string> opt_string(const json::object &jo,
                                      std::string_view key) {
  if (auto *p = jo.if_contains(key); p && p->is_string())
    return std::string(p->as_string().c_str());
  return std::nullopt;
}

std::chrono::system_clock::time_point time_field(const json::object &jo,
                                                 std::string_view key) {
  if (auto s = opt_string(jo, key)) {
    if (auto tp = stringutil::parseISO8601(*s)) return *tp;
  }
  return {};
}

} // namespace

std::string to_string(DeviceType t) {
  for (const auto &tn : kTypeNames) {
    if (tn.type == t) return tn.name;
  }
  return "unknown";
}

DeviceType device_type_from_string(const std::string &s) {
  for (const auto &tn : kTypeNames) {
    if (s == tn.name) return tn.type;
  }
  return DeviceType::unknown;
}

std::string to_string(UpdateKind k) {
  switch (k) {
  case UpdateKind::discovered:
    return "discovered";
  case UpdateKind::wentOffline:
    return "wentOffline";
  case UpdateKind::updated:
    break;
  }
  return "updated";
}

std::string Device::display_name() const {
  if (user_label && !user_label->empty()) {
    return *user_label;
  }
  if (hostname && !hostname->empty()) {
    return *hostname;
  }
  std::string suffix = mac.size() >= 5 ? mac.substr(mac.size() - 5) : mac;
  suffix.erase(std::remove(suffix.begin(), suffix.end(), ':'), suffix.end());
  if (fingerprint && fingerprint->fingerbank_device_name &&
      !fingerprint->fingerbank_device_name->empty()) {
    return *fingerprint->fingerbank_device_name + " (" + suffix + ")";
  }
  if (vendor && !vendor->empty()) {
    return *vendor + " (" + suffix + ")";
  }
  return "Device (" + suffix + ")";
}

bool Device::has_port(int number) const {
  return std::any_of(open_ports.begin(), open_ports.end(),
                     [number](const Port &p) { return p.number == number; });
}

bool Device::has_service(const DiscoveredService &svc) const {
  return std::find(services.begin(), services.end(), svc) != services.end();
}

int compute_smart_score(const Device &d) {
  int score = 0;
  for (const auto &s : d.smart_signals) {
    score += s.weight;
  }
  if (!d.services.empty()) {
    score += 5;
  }
  score += static_cast<int>(d.open_ports.size()) * 5;
  return std::clamp(score, 0, 100);
}

Device tag_invoke(const json::value_to_tag<Device> &, const json::value &jv) {
  auto *jo_p = jv.if_object();
  if (!jo_p) {
    throw std::runtime_error("Device is not an object");
  }
  const auto &jo = *jo_p;
  Device d{};
  d.mac = jo.at("mac").as_string().c_str();
  d.ip = opt_string(jo, "ip").value_or("");
  d.hostname = opt_string(jo, "hostname");
  d.vendor = opt_string(jo, "vendor");
  d.first_seen = time_field(jo, "firstSeen");
  d.last_seen = time_field(jo, "lastSeen");
  if (auto *p = jo.if_contains("isOnline"); p && p->is_bool())
    d.is_online = p->as_bool();
  if (auto *p = jo.if_contains("openPorts"); p && p->is_array()) {
    for (const auto &pv : p->as_array()) {
      const auto &po = pv.as_object();
      Port port{};
      port.number = static_cast<int>(po.at("number").to_number<int64_t>());
      port.protocol = opt_string(po, "protocol").value_or("tcp") == "udp"
                          ? TransportProtocol::udp
                          : TransportProtocol::tcp;
      auto state = opt_string(po, "state").value_or("open");
      port.state = state == "closed"     ? PortState::closed
                   : state == "filtered" ? PortState::filtered
                                         : PortState::open;
      port.service_name = opt_string(po, "serviceName");
      port.banner = opt_string(po, "banner");
      d.open_ports.push_back(std::move(port));
    }
  }
  if (auto *p = jo.if_contains("services"); p && p->is_array()) {
    for (const auto &sv : p->as_array()) {
      const auto &so = sv.as_object();
      DiscoveredService svc{};
      svc.name = opt_string(so, "name").value_or("");
      svc.type = service_type_from(opt_string(so, "type").value_or("mdns"));
      if (auto *pp = so.if_contains("port"); pp && pp->is_number())
        svc.port = static_cast<int>(pp->to_number<int64_t>());
      if (auto *tp = so.if_contains("txt"); tp && tp->is_object()) {
        for (const auto &[k, v] : tp->as_object()) {
          if (v.is_string()) svc.txt[std::string(k)] = v.as_string().c_str();
        }
      }
      d.services.push_back(std::move(svc));
    }
  }
  if (auto *p = jo.if_contains("smartScore"); p && p->is_number())
    d.smart_score = static_cast<int>(p->to_number<int64_t>());
  if (auto *p = jo.if_contains("smartSignals"); p && p->is_array()) {
    for (const auto &sv : p->as_array()) {
      const auto &so = sv.as_object();
      SmartSignal sig{};
      sig.type = smart_signal_type_from(opt_string(so, "type").value_or(""));
      sig.description = opt_string(so, "description").value_or("");
      if (auto *w = so.if_contains("weight"); w && w->is_number())
        sig.weight = static_cast<int>(w->to_number<int64_t>());
      d.smart_signals.push_back(std::move(sig));
    }
  }
  d.device_type =
      device_type_from_string(opt_string(jo, "deviceType").value_or("unknown"));
  d.user_label = opt_string(jo, "userLabel");
  if (auto *p = jo.if_contains("fingerprint"); p && p->is_object()) {
    d.fingerprint = json::value_to<DeviceFingerprint>(*p);
  }
  d.dhcp_fingerprint = opt_string(jo, "dhcpFingerprint");
  if (auto *p = jo.if_contains("userAgents"); p && p->is_array()) {
    for (const auto &uv : p->as_array()) {
      if (uv.is_string()) d.user_agents.emplace_back(uv.as_string().c_str());
    }
  }
  if (auto *p = jo.if_contains("securityPosture"); p && p->is_object()) {
    d.security_posture = json::value_to<SecurityPosture>(*p);
  }
  return d;
}

void tag_invoke(const json::value_from_tag &, json::value &jv,
                const Device &d) {
  json::object jo;
  jo["mac"] = d.mac;
  jo["ip"] = d.ip;
  if (d.hostname) jo["hostname"] = *d.hostname;
  if (d.vendor) jo["vendor"] = *d.vendor;
  jo["firstSeen"] = stringutil::formatISO8601(d.first_seen);
  jo["lastSeen"] = stringutil::formatISO8601(d.last_seen);
  jo["isOnline"] = d.is_online;
  json::array ports;
  for (const auto &p : d.open_ports) {
    json::object po{{"number", p.number},
                    {"protocol", to_cstr(p.protocol)},
                    {"state", to_cstr(p.state)}};
    if (p.service_name) po["serviceName"] = *p.service_name;
    if (p.banner) po["banner"] = *p.banner;
    ports.push_back(std::move(po));
  }
  jo["openPorts"] = std::move(ports);
  json::array services;
  for (const auto &s : d.services) {
    json::object so{{"name", s.name}, {"type", to_cstr(s.type)}};
    if (s.port) so["port"] = *s.port;
    json::object txt;
    for (const auto &[k, v] : s.txt) {
      txt[k] = v;
    }
    so["txt"] = std::move(txt);
    services.push_back(std::move(so));
  }
  jo["services"] = std::move(services);
  jo["smartScore"] = d.smart_score;
  json::array signals;
  for (const auto &s : d.smart_signals) {
    signals.push_back(json::object{
        {"type", kSmartSignalNames[static_cast<size_t>(s.type)]},
        {"description", s.description},
        {"weight", s.weight}});
  }
  jo["smartSignals"] = std::move(signals);
  jo["deviceType"] = to_string(d.device_type);
  jo["displayName"] = d.display_name();
  if (d.user_label) jo["userLabel"] = *d.user_label;
  if (d.fingerprint) jo["fingerprint"] = json::value_from(*d.fingerprint);
  if (d.dhcp_fingerprint) jo["dhcpFingerprint"] = *d.dhcp_fingerprint;
  if (!d.user_agents.empty()) {
    json::array uas;
    for (const auto &ua : d.user_agents) uas.push_back(json::string(ua));
    jo["userAgents"] = std::move(uas);
  }
  if (d.security_posture)
    jo["securityPosture"] = json::value_from(*d.security_posture);
  jv = std::move(jo);
}

} // namespace lanlens::data
