#pragma once

#include <map>
#include <optional>
#include <string>

#include "data/device.hpp"

namespace lanlens::data {

// Raw records produced by the source adapters.

struct ArpEntry {
  std::string ip;
  std::string mac;
  std::string interface_name;

  bool operator==(const ArpEntry &) const = default;
};

// mDNS / DNS-SD / SSDP service record.
struct ServiceRecord {
  std::string name;
  std::string type;
  std::optional<int> port;
  std::map<std::string, std::string> txt_records;
  std::string host_ip;
};

struct SsdpAnnouncement {
  std::string location;
  std::string server;
  std::string usn;
  std::string st;
  std::string host_ip;
};

struct PortScanResult {
  int port{0};
  TransportProtocol protocol{TransportProtocol::tcp};
  std::string service;
  bool is_smart_indicator{false};
  std::optional<DeviceType> inferred_type;
  std::optional<std::string> banner;
};

struct BannerData {
  std::optional<std::string> ssh;
  std::optional<std::string> http_server;
  std::optional<std::string> rtsp;

  bool empty() const { return !ssh && !http_server && !rtsp; }
};

} // namespace lanlens::data
