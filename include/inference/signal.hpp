#pragma once

#include <algorithm>
#include <string>

#include "data/device.hpp"

namespace lanlens {

enum class SignalSource {
  ssdp,
  mdns,
  port,
  fingerprint,
  upnp,
  hostname,
  mdnsTXT,
  portBanner,
  macAnalysis,
  behavior,
  dhcpFingerprint
};

std::string to_string(SignalSource s);

// One piece of typed evidence. Confidence is clamped to [0, 1].
struct Signal {
  SignalSource source{SignalSource::port};
  data::DeviceType suggested_type{data::DeviceType::unknown};
  double confidence{0.0};

  Signal() = default;
  Signal(SignalSource src, data::DeviceType type, double conf)
      : source(src), suggested_type(type),
        confidence(std::clamp(conf, 0.0, 1.0)) {}

  bool operator==(const Signal &) const = default;
};

} // namespace lanlens
