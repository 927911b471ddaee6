#include "inference/mac_analyzer.hpp"

#include <algorithm>
#include <string_view>
#include <utility>

#include "util/mac_address.hpp"
#include "util/string_util.hpp"

namespace lanlens {

using data::DeviceType;

namespace {

constexpr std::string_view kVmOuis[] = {
    "00:0C:29", "00:50:56", // VMware
    "00:1C:42",             // Parallels
    "00:03:FF",             // Hyper-V
    "08:00:27",             // VirtualBox
    "52:54:00",             // QEMU/KVM
    "00:16:3E",             // Xen
};

constexpr std::string_view kLegacyVendors[] = {
    "3com",    "novell",  "dec",            "sgi",      "digital",
    "cabletron", "compaq", "proteon", "ungermann-bass", "wellfleet"};

constexpr std::string_view kEstablishedVendors[] = {
    "cisco",   "hp",    "dell",  "netgear", "linksys", "d-link",
    "buffalo", "zyxel", "juniper", "aruba", "motorola"};

constexpr std::string_view kModernVendors[] = {
    "ubiquiti", "ring",  "nest",   "wemo", "belkin", "lifx",
    "ecobee",   "august", "arlo", "dropcam", "canary"};

constexpr std::string_view kRecentVendors[] = {
    "wyze", "eufy",  "meross", "govee", "switchbot",
    "tuya", "shelly", "tapo",  "kasa"};

constexpr std::string_view kHighConfidenceVendors[] = {
    "apple", "samsung", "google", "amazon", "sony",  "lg",
    "microsoft", "intel", "nvidia", "amd", "dell", "hp",
    "lenovo", "asus", "cisco", "netgear", "ubiquiti"};

constexpr std::string_view kMediumConfidenceVendors[] = {
    "tp-link", "d-link",  "zyxel",  "buffalo", "belkin",   "linksys",
    "arris",   "motorola", "huawei", "xiaomi", "roku",     "sonos",
    "philips", "nest",    "ring",   "ecobee",  "honeywell", "lutron",
    "synology", "qnap",   "raspberry pi"};

struct VendorCategories {
  std::string_view key;
  std::vector<DeviceType> categories;
};

// More specific keys come before the generic brand they contain.
const std::vector<VendorCategories> &vendor_categories() {
  static const std::vector<VendorCategories> table{
      {"google nest", {DeviceType::thermostat, DeviceType::speaker,
                       DeviceType::camera, DeviceType::hub}},
      {"philips hue", {DeviceType::light, DeviceType::hub}},
      {"tp-link kasa", {DeviceType::plug, DeviceType::light}},
      {"belkin wemo", {DeviceType::plug}},
      {"apple", {DeviceType::phone, DeviceType::tablet, DeviceType::computer,
                 DeviceType::smartTV, DeviceType::speaker,
                 DeviceType::accessPoint}},
      {"samsung", {DeviceType::phone, DeviceType::tablet, DeviceType::smartTV,
                   DeviceType::appliance}},
      {"google", {DeviceType::phone, DeviceType::smartTV, DeviceType::speaker,
                  DeviceType::thermostat, DeviceType::hub}},
      {"amazon", {DeviceType::speaker, DeviceType::smartTV, DeviceType::tablet,
                  DeviceType::hub}},
      {"ring", {DeviceType::camera}},
      {"sony", {DeviceType::smartTV, DeviceType::speaker, DeviceType::camera}},
      {"lg", {DeviceType::smartTV, DeviceType::appliance}},
      {"roku", {DeviceType::smartTV}},
      {"sonos", {DeviceType::speaker}},
      {"philips", {DeviceType::smartTV, DeviceType::light}},
      {"nest", {DeviceType::thermostat, DeviceType::camera, DeviceType::speaker}},
      {"ecobee", {DeviceType::thermostat}},
      {"ubiquiti", {DeviceType::router, DeviceType::accessPoint,
                    DeviceType::camera}},
      {"cisco", {DeviceType::router, DeviceType::accessPoint, DeviceType::hub}},
      {"netgear", {DeviceType::router, DeviceType::accessPoint, DeviceType::nas}},
      {"tp-link", {DeviceType::router, DeviceType::accessPoint, DeviceType::plug}},
      {"linksys", {DeviceType::router, DeviceType::accessPoint}},
      {"asus", {DeviceType::router, DeviceType::computer}},
      {"synology", {DeviceType::nas}},
      {"qnap", {DeviceType::nas}},
      {"hp", {DeviceType::printer, DeviceType::computer}},
      {"dell", {DeviceType::computer}},
      {"intel", {DeviceType::computer}},
      {"raspberry pi", {DeviceType::computer, DeviceType::hub}},
      {"espressif", {DeviceType::plug, DeviceType::light, DeviceType::appliance}},
      {"tuya", {DeviceType::plug, DeviceType::light, DeviceType::appliance}},
      {"wyze", {DeviceType::camera, DeviceType::plug, DeviceType::light}},
      {"arlo", {DeviceType::camera}},
      {"logitech", {DeviceType::camera, DeviceType::computer}},
      {"august", {DeviceType::appliance}},
      {"schlage", {DeviceType::appliance}},
      {"honeywell", {DeviceType::thermostat, DeviceType::appliance}},
      {"lutron", {DeviceType::light, DeviceType::hub}},
      {"lifx", {DeviceType::light}},
      {"nanoleaf", {DeviceType::light}},
      {"yeelight", {DeviceType::light}},
      {"belkin", {DeviceType::plug, DeviceType::router}},
      {"simplisafe", {DeviceType::hub, DeviceType::camera}},
      {"xiaomi", {DeviceType::phone, DeviceType::appliance, DeviceType::camera}},
  };
  return table;
}

constexpr std::pair<std::string_view, DeviceType> kVendorSpecializations[] = {
    {"philips hue", DeviceType::light}, {"sonos", DeviceType::speaker},
    {"roku", DeviceType::smartTV},      {"ecobee", DeviceType::thermostat},
    {"ring", DeviceType::camera},       {"arlo", DeviceType::camera},
    {"synology", DeviceType::nas},      {"qnap", DeviceType::nas},
    {"lifx", DeviceType::light},        {"nanoleaf", DeviceType::light},
    {"yeelight", DeviceType::light},    {"august", DeviceType::appliance},
    {"schlage", DeviceType::appliance}, {"simplisafe", DeviceType::hub},
};

template <size_t N>
bool contains_any_of(const std::string &haystack,
                     const std::string_view (&needles)[N]) {
  return std::any_of(std::begin(needles), std::end(needles),
                     [&](std::string_view n) {
                       return haystack.find(n) != std::string::npos;
                     });
}

VendorConfidence vendor_confidence(const std::optional<std::string> &vendor,
                                   bool randomized) {
  if (randomized) {
    return VendorConfidence::randomized;
  }
  if (!vendor) {
    return VendorConfidence::unknown;
  }
  auto lower = stringutil::toLowerCase(*vendor);
  if (contains_any_of(lower, kHighConfidenceVendors)) {
    return VendorConfidence::high;
  }
  if (contains_any_of(lower, kMediumConfidenceVendors)) {
    return VendorConfidence::medium;
  }
  return VendorConfidence::low;
}

OuiAgeEstimate age_estimate(const std::optional<std::string> &vendor) {
  if (!vendor) {
    return OuiAgeEstimate::unknown;
  }
  auto lower = stringutil::toLowerCase(*vendor);
  if (contains_any_of(lower, kLegacyVendors)) return OuiAgeEstimate::legacy;
  if (contains_any_of(lower, kRecentVendors)) return OuiAgeEstimate::recent;
  if (contains_any_of(lower, kModernVendors)) return OuiAgeEstimate::modern;
  if (contains_any_of(lower, kEstablishedVendors))
    return OuiAgeEstimate::established;
  if (contains_any_of(lower, kHighConfidenceVendors))
    return OuiAgeEstimate::established;
  return OuiAgeEstimate::unknown;
}

} // namespace

std::string to_string(OuiAgeEstimate a) {
  switch (a) {
  case OuiAgeEstimate::legacy:
    return "legacy";
  case OuiAgeEstimate::established:
    return "established";
  case OuiAgeEstimate::modern:
    return "modern";
  case OuiAgeEstimate::recent:
    return "recent";
  case OuiAgeEstimate::unknown:
    break;
  }
  return "unknown";
}

std::string to_string(VendorConfidence c) {
  switch (c) {
  case VendorConfidence::high:
    return "high";
  case VendorConfidence::medium:
    return "medium";
  case VendorConfidence::low:
    return "low";
  case VendorConfidence::randomized:
    return "randomized";
  case VendorConfidence::unknown:
    break;
  }
  return "unknown";
}

MacAnalysis MacAnalyzer::analyze(const std::string &mac,
                                 const std::optional<std::string> &vendor) const {
  MacAnalysis out{};
  out.oui = macaddr::oui_prefix(mac);
  out.vendor = vendor;
  unsigned first = macaddr::first_octet(mac).value_or(0);
  out.is_locally_administered = macaddr::is_locally_administered(first);
  out.is_randomized =
      out.is_locally_administered && !macaddr::is_multicast(first);
  out.is_virtual_machine =
      std::find(std::begin(kVmOuis), std::end(kVmOuis), out.oui) !=
      std::end(kVmOuis);
  out.vendor_confidence = vendor_confidence(vendor, out.is_randomized);
  out.age_estimate = age_estimate(vendor);

  if (vendor) {
    auto lower = stringutil::toLowerCase(*vendor);
    auto category_of = [&](std::string_view key)
        -> std::optional<std::vector<DeviceType>> {
      for (const auto &vc : vendor_categories()) {
        if (vc.key == key) return vc.categories;
      }
      return std::nullopt;
    };
    for (const auto &[key, type] : kVendorSpecializations) {
      if (lower.find(key) != std::string::npos) {
        out.vendor_specialization = type;
        out.vendor_categories =
            category_of(key).value_or(std::vector<DeviceType>{type});
        return out;
      }
    }
    for (const auto &vc : vendor_categories()) {
      if (lower.find(vc.key) != std::string::npos) {
        out.vendor_categories = vc.categories;
        break;
      }
    }
  }
  return out;
}

std::vector<Signal> MacAnalyzer::generate_signals(const MacAnalysis &a) {
  std::vector<Signal> signals;
  if (a.is_randomized) {
    signals.emplace_back(SignalSource::macAnalysis, DeviceType::phone, 0.60);
  }
  if (a.is_virtual_machine) {
    signals.emplace_back(SignalSource::macAnalysis, DeviceType::computer, 0.85);
  }
  if (a.age_estimate == OuiAgeEstimate::legacy) {
    signals.emplace_back(SignalSource::macAnalysis, DeviceType::router, 0.40);
  }
  if (a.vendor_specialization &&
      (a.vendor_confidence == VendorConfidence::high ||
       a.vendor_confidence == VendorConfidence::medium)) {
    double conf = a.vendor_confidence == VendorConfidence::high ? 0.70 : 0.55;
    signals.emplace_back(SignalSource::macAnalysis, *a.vendor_specialization,
                         conf);
  }
  if (a.vendor_categories.size() == 1 &&
      a.vendor_confidence == VendorConfidence::high &&
      a.vendor_specialization != a.vendor_categories.front()) {
    signals.emplace_back(SignalSource::macAnalysis, a.vendor_categories.front(),
                         0.65);
  }
  return signals;
}

} // namespace lanlens
