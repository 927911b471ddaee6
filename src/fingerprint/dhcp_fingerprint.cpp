#include "fingerprint/dhcp_fingerprint.hpp"

#include <algorithm>
#include <charconv>
#include <set>
#include <string_view>

#include "openssl/openssl_raii.hpp"
#include "util/string_util.hpp"

namespace lanlens {
namespace dhcp {

using data::DeviceType;

namespace {

constexpr double kOsTypeDiscount = 0.8;

std::optional<int> parse_byte(std::string_view token, int base) {
  if (token.empty()) return std::nullopt;
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(token.data(), token.data() + token.size(), value, base);
  if (ec != std::errc{} || ptr != token.data() + token.size()) return std::nullopt;
  if (value < 0 || value > 255) return std::nullopt;
  return value;
}

// Hex when any component carries a-f, or looks like a zero-padded byte.
bool looks_hex(const std::vector<std::string> &parts) {
  for (const auto &p : parts) {
    if (p.find_first_of("abcdefABCDEF") != std::string::npos) return true;
    if (p.size() == 2 && p[0] == '0' && p[1] >= '0' && p[1] <= '9') return true;
  }
  return false;
}

std::vector<int> parse_all(const std::vector<std::string> &parts, int base) {
  std::vector<int> out;
  for (const auto &p : parts) {
    if (auto v = parse_byte(p, base)) out.push_back(*v);
  }
  return out;
}

bool has(const std::set<int> &opts, int code) { return opts.count(code) > 0; }

std::vector<DeviceType> types_for_os(const std::string &os) {
  auto lower = stringutil::toLowerCase(os);
  auto any = [&lower](std::initializer_list<std::string_view> keys) {
    return std::any_of(keys.begin(), keys.end(), [&lower](std::string_view k) {
      return stringutil::contains(lower, k);
    });
  };
  if (any({"ipados", "ipad"})) return {DeviceType::tablet};
  if (any({"ios", "iphone"})) return {DeviceType::phone};
  if (any({"macos", "mac os"})) return {DeviceType::computer};
  if (any({"tvos"})) return {DeviceType::smartTV};
  if (any({"fire os"})) return {DeviceType::smartTV, DeviceType::tablet};
  if (any({"android"})) return {DeviceType::phone, DeviceType::tablet};
  if (any({"windows"})) return {DeviceType::computer};
  if (any({"roku", "tizen", "webos"})) return {DeviceType::smartTV};
  if (any({"bsd"})) return {DeviceType::nas, DeviceType::router};
  if (any({"linux"})) return {DeviceType::computer, DeviceType::nas};
  return {};
}

} // namespace

std::string to_string(OsHint h) {
  switch (h) {
  case OsHint::apple:
    return "apple";
  case OsHint::windows:
    return "windows";
  case OsHint::android:
    return "android";
  case OsHint::linux_like:
    return "linux";
  case OsHint::networkEquipment:
    return "networkEquipment";
  case OsHint::iot:
    return "iot";
  case OsHint::unknown:
    break;
  }
  return "unknown";
}

std::vector<int> parse_option55(const std::string &raw) {
  auto input = stringutil::trimmed(raw);
  if (input.empty()) return {};
  if (input.find(':') != std::string::npos) {
    return parse_all(stringutil::split_trim(input, ':'), 16);
  }
  if (input.find(',') != std::string::npos) {
    auto parts = stringutil::split_trim(input, ',');
    return parse_all(parts, looks_hex(parts) ? 16 : 10);
  }
  if (input.find(' ') != std::string::npos) {
    return parse_all(stringutil::split_trim(input, ' '), 10);
  }
  if (auto v = parse_byte(input, 10)) return {*v};
  if (input.size() == 2) {
    if (auto v = parse_byte(input, 16)) return {*v};
  }
  return {};
}

std::string normalize_option55(const std::string &raw) {
  auto values = parse_option55(raw);
  std::set<int> unique(values.begin(), values.end());
  std::vector<std::string> parts;
  parts.reserve(unique.size());
  for (int v : unique) parts.push_back(std::to_string(v));
  return stringutil::join(parts, ",");
}

std::string option55_hash(const std::string &raw) {
  auto normalized = normalize_option55(raw);
  if (normalized.empty()) return {};
  return opensslutil::sha256_hex(normalized);
}

OsHint quick_hint(const std::vector<int> &options) {
  std::set<int> opts(options.begin(), options.end());
  const auto n = opts.size();
  if (has(opts, 252) && has(opts, 119) && n < 10) return OsHint::apple;
  if (has(opts, 31) && has(opts, 33) && (has(opts, 249) || has(opts, 121)))
    return OsHint::windows;
  if (has(opts, 26) && has(opts, 28) && n < 15) return OsHint::android;
  if (has(opts, 77)) return OsHint::linux_like;
  if (n <= 6 && has(opts, 1) && has(opts, 3) && has(opts, 6))
    return OsHint::linux_like;
  if (n <= 4) return OsHint::networkEquipment;
  if (has(opts, 43) && n < 8) return OsHint::iot;
  return OsHint::unknown;
}

std::optional<DhcpMatch>
DhcpFingerprintMatcher::heuristic(const std::vector<int> &options) {
  std::set<int> unique(options.begin(), options.end());
  if (unique.empty()) return std::nullopt;
  DhcpMatch m;
  switch (quick_hint(options)) {
  case OsHint::apple:
    if (unique.size() <= 7) {
      m.device_name = "Apple Mobile Device";
      m.device_types = {DeviceType::phone, DeviceType::tablet};
      m.operating_system = "iOS";
    } else {
      m.device_name = "Apple Computer";
      m.device_types = {DeviceType::computer};
      m.operating_system = "macOS";
    }
    m.confidence = 0.55;
    break;
  case OsHint::windows:
    m.device_name = "Windows Device";
    m.device_types = {DeviceType::computer};
    m.operating_system = "Windows";
    m.confidence = 0.50;
    break;
  case OsHint::android:
    m.device_name = "Android Device";
    m.device_types = {DeviceType::phone, DeviceType::tablet};
    m.operating_system = "Android";
    m.confidence = 0.50;
    break;
  case OsHint::linux_like:
    m.device_name = "Linux Device";
    m.device_types = {DeviceType::computer, DeviceType::nas};
    m.operating_system = "Linux";
    m.confidence = 0.40;
    break;
  case OsHint::networkEquipment:
    m.device_name = "Network Equipment";
    m.device_types = {DeviceType::router, DeviceType::accessPoint};
    m.confidence = 0.45;
    break;
  case OsHint::iot:
    m.device_name = "IoT Device";
    m.device_types = {DeviceType::hub, DeviceType::appliance};
    m.confidence = 0.35;
    break;
  case OsHint::unknown:
    return std::nullopt;
  }
  return m;
}

std::optional<DhcpMatch>
DhcpFingerprintMatcher::match(const std::string &raw) const {
  auto options = parse_option55(raw);
  auto normalized = normalize_option55(raw);
  if (normalized.empty()) return std::nullopt;

  if (bundled_.available()) {
    if (auto entry = bundled_.lookup_dhcp_hash(opensslutil::sha256_hex(normalized))) {
      DhcpMatch m;
      m.normalized = normalized;
      m.device_name = entry->device_name;
      for (const auto &t : entry->device_types) {
        auto type = data::device_type_from_string(t);
        if (type != DeviceType::unknown) m.device_types.push_back(type);
      }
      m.operating_system = entry->operating_system;
      m.confidence = entry->confidence;
      m.from_database = true;
      return m;
    }
  }
  auto m = heuristic(options);
  if (m) m->normalized = normalized;
  return m;
}

std::vector<Signal> DhcpFingerprintMatcher::signals(const DhcpMatch &match) {
  std::vector<Signal> out;
  for (auto type : match.device_types) {
    out.emplace_back(SignalSource::dhcpFingerprint, type, match.confidence);
  }
  if (out.empty() && match.operating_system) {
    for (auto type : types_for_os(*match.operating_system)) {
      out.emplace_back(SignalSource::dhcpFingerprint, type,
                       match.confidence * kOsTypeDiscount);
    }
  }
  return out;
}

} // namespace dhcp
} // namespace lanlens
