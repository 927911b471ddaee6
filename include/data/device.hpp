#pragma once

#include <boost/json.hpp>
#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "data/fingerprint.hpp"
#include "data/security.hpp"

namespace lanlens::data {
namespace json = boost::json;

// Declaration order is the inference tie-break order: earlier wins.
enum class DeviceType {
  smartTV,
  speaker,
  camera,
  thermostat,
  light,
  plug,
  hub,
  printer,
  nas,
  computer,
  phone,
  tablet,
  router,
  accessPoint,
  appliance,
  unknown
};

inline constexpr std::array<DeviceType, 16> kAllDeviceTypes{
    DeviceType::smartTV,  DeviceType::speaker,     DeviceType::camera,
    DeviceType::thermostat, DeviceType::light,     DeviceType::plug,
    DeviceType::hub,      DeviceType::printer,     DeviceType::nas,
    DeviceType::computer, DeviceType::phone,       DeviceType::tablet,
    DeviceType::router,   DeviceType::accessPoint, DeviceType::appliance,
    DeviceType::unknown};

std::string to_string(DeviceType t);
DeviceType device_type_from_string(const std::string &s);

enum class TransportProtocol { tcp, udp };
enum class PortState { open, closed, filtered };

struct Port {
  int number{0};
  TransportProtocol protocol{TransportProtocol::tcp};
  PortState state{PortState::open};
  std::optional<std::string> service_name;
  std::optional<std::string> banner;

  bool operator==(const Port &) const = default;
};

enum class ServiceDiscoveryType { mdns, ssdp, upnp };

struct DiscoveredService {
  std::string name;
  ServiceDiscoveryType type{ServiceDiscoveryType::mdns};
  std::optional<int> port;
  std::map<std::string, std::string> txt;

  bool operator==(const DiscoveredService &) const = default;
};

enum class SmartSignalType {
  openPort,
  mdnsService,
  ssdpService,
  httpServer,
  macVendor,
  hostname
};

// Contribution to the smart score. Not to be confused with inference
// evidence, see inference/signal.hpp.
struct SmartSignal {
  SmartSignalType type{SmartSignalType::openPort};
  std::string description;
  int weight{0};

  bool operator==(const SmartSignal &) const = default;
};

struct Device {
  std::string mac;
  std::string ip;
  std::optional<std::string> hostname;
  std::optional<std::string> vendor;
  std::chrono::system_clock::time_point first_seen{};
  std::chrono::system_clock::time_point last_seen{};
  bool is_online{true};
  std::vector<Port> open_ports;
  std::vector<DiscoveredService> services;
  int smart_score{0};
  std::vector<SmartSignal> smart_signals;
  DeviceType device_type{DeviceType::unknown};
  std::optional<std::string> user_label;
  std::optional<DeviceFingerprint> fingerprint;
  // Normalized DHCP Option 55 list, e.g. "1,3,6,15,119,252".
  std::optional<std::string> dhcp_fingerprint;
  std::vector<std::string> user_agents;
  std::optional<SecurityPosture> security_posture;

  std::string display_name() const;

  bool has_port(int number) const;
  bool has_service(const DiscoveredService &svc) const;

  friend Device tag_invoke(const json::value_to_tag<Device> &,
                           const json::value &jv);
  friend void tag_invoke(const json::value_from_tag &, json::value &jv,
                         const Device &d);
};

// sum(weights) + 5 if any service + 5 per open port, capped at 100.
int compute_smart_score(const Device &d);

enum class UpdateKind { discovered, updated, wentOffline };

std::string to_string(UpdateKind k);

struct DeviceEvent {
  Device device;
  UpdateKind kind{UpdateKind::updated};
};

} // namespace lanlens::data
