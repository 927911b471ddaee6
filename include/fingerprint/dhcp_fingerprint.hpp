#pragma once

#include <optional>
#include <string>
#include <vector>

#include "data/device.hpp"
#include "inference/signal.hpp"
#include "state/bundled_database.hpp"

namespace lanlens {
namespace dhcp {

enum class OsHint {
  apple,
  windows,
  android,
  linux_like,
  networkEquipment,
  iot,
  unknown
};

std::string to_string(OsHint h);

// DHCP Option 55 (parameter request list) as option numbers. Accepts
// "1,3,6,15", "01:03:06:0f", "1 3 6 15" and hex byte lists such as
// "01,03,06,0f". Invalid tokens are dropped.
std::vector<int> parse_option55(const std::string &raw);

// Sorted, de-duplicated, comma-joined decimal form. Empty when nothing
// parsed.
std::string normalize_option55(const std::string &raw);

// SHA-256 hex of the normalized form; empty for empty input.
std::string option55_hash(const std::string &raw);

// Coarse OS family from the set of requested options.
OsHint quick_hint(const std::vector<int> &options);

struct DhcpMatch {
  std::string normalized;
  std::string device_name;
  std::vector<data::DeviceType> device_types;
  std::optional<std::string> operating_system;
  double confidence{0.0};
  bool from_database{false};
};

/**
 * Resolves an Option 55 list to a device guess. An exact hit in the
 * bundled database wins; otherwise the OS heuristic answers at a fixed,
 * lower confidence. Unparseable input resolves to nothing.
 */
class DhcpFingerprintMatcher {
public:
  explicit DhcpFingerprintMatcher(const IBundledDatabase &bundled)
      : bundled_(bundled) {}

  std::optional<DhcpMatch> match(const std::string &raw) const;

  // One dhcpFingerprint signal per suggested type. A match without types
  // falls back to the types its operating system implies, discounted.
  static std::vector<Signal> signals(const DhcpMatch &match);

  static std::optional<DhcpMatch> heuristic(const std::vector<int> &options);

private:
  const IBundledDatabase &bundled_;
};

} // namespace dhcp
} // namespace lanlens
