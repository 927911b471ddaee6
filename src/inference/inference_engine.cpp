#include "inference/inference_engine.hpp"

#include <boost/log/sources/record_ostream.hpp>

#include <algorithm>
#include <array>
#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens {

using data::DeviceType;

namespace {

using stringutil::contains;
using stringutil::ends_with;
using stringutil::toLowerCase;

constexpr std::pair<SignalSource, double> kSourceWeights[] = {
    {SignalSource::fingerprint, 0.9},  {SignalSource::mdnsTXT, 0.85},
    {SignalSource::upnp, 0.8},         {SignalSource::portBanner, 0.75},
    {SignalSource::mdns, 0.7},         {SignalSource::ssdp, 0.7},
    {SignalSource::dhcpFingerprint, 0.65}, {SignalSource::hostname, 0.6},
    {SignalSource::macAnalysis, 0.6},  {SignalSource::behavior, 0.6},
    {SignalSource::port, 0.5},
};

constexpr double kDefaultWeight = 0.5;
constexpr double kMaxSourceWeight = 0.9;

// ---- SSDP ----------------------------------------------------------------

enum SsdpField : unsigned { kServer = 1, kUsn = 2, kSt = 4 };

struct SsdpKeyword {
  unsigned fields;
  std::string_view keyword;
};

struct SsdpRule {
  std::vector<SsdpKeyword> any_of;
  DeviceType type;
  double confidence;
};

const std::vector<SsdpRule> &ssdp_rules() {
  static const std::vector<SsdpRule> rules{
      {{{kServer, "roku"}}, DeviceType::smartTV, 0.95},
      {{{kServer, "samsung"}, {kServer, "lg"}, {kServer, "sony"},
        {kServer, "vizio"}, {kServer, "tcl"}, {kServer, "hisense"}},
       DeviceType::smartTV, 0.85},
      {{{kServer | kUsn, "sonos"}}, DeviceType::speaker, 0.95},
      {{{kServer, "philips-hue"}, {kUsn, "hue"}}, DeviceType::hub, 0.95},
      {{{kServer | kSt, "printer"}}, DeviceType::printer, 0.90},
      {{{kSt, "mediaserver"}, {kSt, "mediarenderer"}}, DeviceType::smartTV, 0.75},
      {{{kServer, "synology"}, {kServer, "qnap"}, {kServer, "drobo"},
        {kServer, "netgear readynas"}},
       DeviceType::nas, 0.90},
      {{{kServer, "router"}, {kServer, "gateway"},
        {kSt, "internetgatewaydevice"}},
       DeviceType::router, 0.85},
      {{{kServer, "bose"}, {kServer, "denon"}, {kServer, "yamaha"},
        {kServer, "onkyo"}},
       DeviceType::speaker, 0.85},
      {{{kServer, "streammagic"}, {kServer, "cambridge audio"}},
       DeviceType::speaker, 0.90},
      {{{kServer, "ring"}}, DeviceType::camera, 0.85},
      {{{kServer, "nest"}}, DeviceType::thermostat, 0.60},
      {{{kServer, "wemo"}}, DeviceType::plug, 0.85},
  };
  return rules;
}

// ---- mDNS service types (exact match) -----------------------------------

struct ServiceTypeRule {
  std::string_view service_type;
  DeviceType type;
  double confidence;
};

constexpr ServiceTypeRule kMdnsRules[] = {
    {"_hap._tcp", DeviceType::hub, 0.80},
    {"_homekit._tcp", DeviceType::hub, 0.80},
    {"_airplay._tcp", DeviceType::smartTV, 0.80},
    {"_raop._tcp", DeviceType::smartTV, 0.80},
    {"_googlecast._tcp", DeviceType::smartTV, 0.85},
    {"_spotify-connect._tcp", DeviceType::speaker, 0.90},
    {"_sonos._tcp", DeviceType::speaker, 0.90},
    {"_printer._tcp", DeviceType::printer, 0.95},
    {"_ipp._tcp", DeviceType::printer, 0.95},
    {"_scanner._tcp", DeviceType::printer, 0.85},
    {"_hue._tcp", DeviceType::light, 0.95},
    {"_ecobee._tcp", DeviceType::thermostat, 0.90},
    {"_nest._tcp", DeviceType::thermostat, 0.90},
    {"_amzn-wplay._tcp", DeviceType::speaker, 0.85},
    {"_alexa._tcp", DeviceType::speaker, 0.85},
    {"_ssh._tcp", DeviceType::computer, 0.70},
    {"_smb._tcp", DeviceType::computer, 0.70},
    {"_afpovertcp._tcp", DeviceType::computer, 0.70},
    {"_bond._tcp", DeviceType::appliance, 0.85},
    {"_leap._tcp", DeviceType::hub, 0.85},
    {"_mqtt._tcp", DeviceType::hub, 0.60},
    {"_dacp._tcp", DeviceType::smartTV, 0.70},
    {"_touch-able._tcp", DeviceType::smartTV, 0.70},
    {"_companion-link._tcp", DeviceType::smartTV, 0.65},
};

// ---- ports ---------------------------------------------------------------

struct PortRule {
  int port;
  DeviceType type;
  double confidence;
};

constexpr PortRule kPortRules[] = {
    {554, DeviceType::camera, 0.75},    {1400, DeviceType::speaker, 0.85},
    {7000, DeviceType::smartTV, 0.75},  {8008, DeviceType::smartTV, 0.80},
    {8009, DeviceType::smartTV, 0.80},  {8123, DeviceType::hub, 0.90},
    {32400, DeviceType::computer, 0.70}, {9100, DeviceType::printer, 0.85},
    {1883, DeviceType::hub, 0.60},      {8883, DeviceType::hub, 0.60},
    {5000, DeviceType::nas, 0.50},      {5001, DeviceType::nas, 0.50},
    {3689, DeviceType::computer, 0.60}, {548, DeviceType::computer, 0.65},
};

// ---- fingerprint ---------------------------------------------------------

const std::vector<KeywordRule> &parent_rules() {
  static const std::vector<KeywordRule> rules{
      {{"iphone", "android", "phone"}, {}, {}, {}, DeviceType::phone, 0.95},
      {{"ipad", "tablet"}, {}, {}, {}, DeviceType::tablet, 0.95},
      {{"macbook", "imac", "mac", "windows", "laptop", "desktop", "pc"},
       {}, {}, {}, DeviceType::computer, 0.90},
      {{"roku", "chromecast", "apple tv", "fire tv", "smart tv", "androidtv"},
       {}, {}, {}, DeviceType::smartTV, 0.95},
      {{"sonos", "speaker", "echo", "homepod", "soundbar"},
       {}, {}, {}, DeviceType::speaker, 0.90},
      {{"camera", "ring", "nest cam", "arlo", "wyze"},
       {}, {}, {}, DeviceType::camera, 0.90},
      {{"ecobee", "thermostat"}, {}, {}, {}, DeviceType::thermostat, 0.90},
      {{"hue", "light", "lifx", "nanoleaf"}, {}, {}, {}, DeviceType::light, 0.85},
      {{"printer", "laserjet", "inkjet"}, {}, {}, {}, DeviceType::printer, 0.95},
      {{"synology", "qnap", "nas", "drobo"}, {}, {}, {}, DeviceType::nas, 0.90},
      {{"router", "gateway", "access point", "wifi"},
       {}, {}, {}, DeviceType::router, 0.85},
      {{"wemo", "smart plug", "kasa"}, {}, {}, {}, DeviceType::plug, 0.85},
      {{"hub", "bridge", "smartthings"}, {}, {}, {}, DeviceType::hub, 0.80},
  };
  return rules;
}

const std::vector<KeywordRule> &upnp_type_rules() {
  static const std::vector<KeywordRule> rules{
      {{"mediarenderer", "tv", "player"}, {}, {}, {}, DeviceType::smartTV, 0.85},
      {{"printer"}, {}, {}, {}, DeviceType::printer, 0.90},
      {{"bridge", "hub"}, {}, {}, {}, DeviceType::hub, 0.85},
      {{}, {}, {"basic", "device"}, {}, DeviceType::hub, 0.40},
  };
  return rules;
}

struct ManufacturerRule {
  KeywordRule maker;
  std::vector<std::string_view> model_any;
};

const std::vector<ManufacturerRule> &manufacturer_rules() {
  static const std::vector<ManufacturerRule> rules{
      {{{"roku", "samsung", "lg", "sony", "vizio", "tcl", "hisense"},
        {}, {}, {}, DeviceType::smartTV, 0.80}, {}},
      {{{"sonos", "bose", "harman", "jbl"}, {}, {}, {}, DeviceType::speaker, 0.85},
       {}},
      {{{"hp", "canon", "epson", "brother", "xerox"},
        {}, {}, {}, DeviceType::printer, 0.80}, {}},
      {{{"philips"}, {}, {}, {}, DeviceType::hub, 0.90}, {"hue"}},
      {{{"apple"}, {}, {}, {}, DeviceType::smartTV, 0.95}, {"tv"}},
      {{{"apple"}, {}, {}, {}, DeviceType::speaker, 0.95}, {"homepod"}},
      {{{"synology", "qnap"}, {}, {}, {}, DeviceType::nas, 0.90}, {}},
      {{{"netgear"}, {}, {}, {"synology", "qnap"}, DeviceType::nas, 0.90},
       {"readynas"}},
      {{{"ubiquiti", "cisco", "netgear", "tp-link", "asus", "linksys"},
        {}, {}, {}, DeviceType::router, 0.60}, {}},
  };
  return rules;
}

// ---- hostname ------------------------------------------------------------

const std::vector<KeywordRule> &hostname_rules() {
  static const std::vector<KeywordRule> rules{
      {{"iphone"}, {}, {}, {}, DeviceType::phone, 0.85},
      {{"ipad"}, {}, {}, {}, DeviceType::tablet, 0.85},
      {{"macbook", "imac", "-mac", "macmini", "macpro"},
       {"s-mac", "s-mbp", "s-mba"}, {}, {}, DeviceType::computer, 0.80},
      {{"apple-tv", "appletv"}, {}, {}, {}, DeviceType::smartTV, 0.90},
      {{"homepod"}, {}, {}, {}, DeviceType::speaker, 0.90},
      {{"roku"}, {}, {}, {}, DeviceType::smartTV, 0.85},
      {{"chromecast", "google-home"}, {}, {}, {}, DeviceType::smartTV, 0.85},
      {{"sonos"}, {}, {}, {}, DeviceType::speaker, 0.90},
      {{"echo", "alexa"}, {}, {}, {}, DeviceType::speaker, 0.85},
      {{"hue", "philips-hue"}, {}, {}, {}, DeviceType::hub, 0.85},
      {{"doorbell", "camera"}, {}, {"ring"}, {}, DeviceType::camera, 0.85},
      {{"cam"}, {}, {"nest"}, {}, DeviceType::camera, 0.85},
      {{"thermostat"}, {}, {"nest"}, {"cam"}, DeviceType::thermostat, 0.85},
      {{}, {}, {"nest"}, {"cam", "thermostat"}, DeviceType::thermostat, 0.50},
      {{"printer", "laserjet", "deskjet", "officejet", "pixma"},
       {}, {}, {}, DeviceType::printer, 0.85},
      {{"nas", "synology", "diskstation", "qnap"},
       {}, {}, {}, DeviceType::nas, 0.85},
      {{"router", "gateway", "ap-", "accesspoint", "unifi"},
       {}, {}, {}, DeviceType::router, 0.75},
      {{"android", "galaxy", "pixel"}, {}, {}, {}, DeviceType::phone, 0.75},
      {{"desktop", "laptop", "-pc"}, {}, {}, {}, DeviceType::computer, 0.70},
      {{"wemo", "kasa", "smart-plug"}, {}, {}, {}, DeviceType::plug, 0.80},
      {{"camera", "cam-", "arlo", "wyze"}, {}, {}, {}, DeviceType::camera, 0.80},
  };
  return rules;
}

// ---- mDNS TXT ------------------------------------------------------------

// AirPlay "model" and RAOP "am" carry Apple model identifiers.
const std::vector<KeywordRule> &apple_model_rules() {
  static const std::vector<KeywordRule> rules{
      {{"appletv"}, {}, {}, {}, DeviceType::smartTV, 0.95},
      {{"homepod", "audioaccessory"}, {}, {}, {}, DeviceType::speaker, 0.95},
      {{"airport"}, {}, {}, {}, DeviceType::hub, 0.85},
      {{"macbook", "mac", "imac"}, {}, {}, {}, DeviceType::computer, 0.90},
      {{"ipad"}, {}, {}, {}, DeviceType::tablet, 0.90},
      {{"iphone"}, {}, {}, {}, DeviceType::phone, 0.90},
  };
  return rules;
}

// Google Cast "md" model names.
const std::vector<KeywordRule> &cast_model_rules() {
  static const std::vector<KeywordRule> rules{
      {{"chromecast"}, {}, {}, {}, DeviceType::smartTV, 0.95},
      {{"google home", "nest audio", "home mini", "home max", "nest mini"},
       {}, {}, {}, DeviceType::speaker, 0.90},
      {{"nest hub", "home hub"}, {}, {}, {}, DeviceType::smartTV, 0.85},
  };
  return rules;
}

struct HomeKitCategory {
  int id;
  DeviceType type;
  double confidence;
};

// HAP accessory category ("ci") to device type.
constexpr HomeKitCategory kHomeKitCategories[] = {
    {2, DeviceType::hub, 0.90},         {3, DeviceType::appliance, 0.80},
    {4, DeviceType::appliance, 0.90},   {5, DeviceType::light, 0.90},
    {6, DeviceType::appliance, 0.90},   {7, DeviceType::light, 0.90},
    {8, DeviceType::light, 0.90},       {9, DeviceType::thermostat, 0.95},
    {10, DeviceType::hub, 0.80},        {11, DeviceType::hub, 0.80},
    {12, DeviceType::appliance, 0.80},  {13, DeviceType::appliance, 0.80},
    {14, DeviceType::appliance, 0.80},  {15, DeviceType::hub, 0.80},
    {16, DeviceType::hub, 0.80},        {17, DeviceType::camera, 0.95},
    {18, DeviceType::camera, 0.95},     {19, DeviceType::appliance, 0.80},
    {20, DeviceType::thermostat, 0.95}, {21, DeviceType::thermostat, 0.95},
    {22, DeviceType::appliance, 0.80},  {23, DeviceType::appliance, 0.80},
    {24, DeviceType::smartTV, 0.95},    {25, DeviceType::speaker, 0.95},
    {26, DeviceType::speaker, 0.95},    {27, DeviceType::hub, 0.90},
    {28, DeviceType::appliance, 0.80},  {29, DeviceType::appliance, 0.80},
    {30, DeviceType::appliance, 0.80},  {31, DeviceType::smartTV, 0.95},
    {33, DeviceType::hub, 0.90},        {34, DeviceType::speaker, 0.80},
    {35, DeviceType::smartTV, 0.80},    {36, DeviceType::smartTV, 0.80},
};

// ---- banners ---------------------------------------------------------------

// OS hint from an SSH banner, first match wins.
const std::vector<KeywordRule> &ssh_os_rules() {
  static const std::vector<KeywordRule> rules{
      {{"ubuntu", "debian", "fedora", "centos", "redhat", "linux"},
       {}, {}, {}, DeviceType::computer, 0.60},
      {{"freebsd", "openbsd", "netbsd"}, {}, {}, {}, DeviceType::nas, 0.55},
      {{"dropbear"}, {}, {}, {}, DeviceType::hub, 0.65},
      {{"apple", "macos", "darwin"}, {}, {}, {}, DeviceType::computer, 0.80},
      {{"windows"}, {}, {}, {}, DeviceType::computer, 0.75},
  };
  return rules;
}

const std::vector<KeywordRule> &ssh_device_rules() {
  static const std::vector<KeywordRule> rules{
      {{"cisco", "juniper", "mikrotik", "ubiquiti", "routeros", "edgeos"},
       {}, {}, {}, DeviceType::router, 0.80},
      {{"synology", "qnap", "drobo", "readynas", "terramaster"},
       {}, {}, {}, DeviceType::nas, 0.80},
  };
  return rules;
}

const std::vector<KeywordRule> &http_server_rules() {
  static const std::vector<KeywordRule> rules{
      {{"synology", "qnap", "dsm"}, {}, {}, {}, DeviceType::nas, 0.95},
      {{"printer", "cups"}, {}, {}, {}, DeviceType::printer, 0.90},
      {{"hikvision", "dahua", "axis", "foscam", "amcrest", "reolink"},
       {}, {}, {}, DeviceType::camera, 0.90},
      {{"mini_httpd", "micro_httpd", "lighttpd/1.4"}, {}, {}, {},
       DeviceType::router, 0.50},
      {{"apache", "nginx", "iis"}, {}, {}, {}, DeviceType::computer, 0.40},
  };
  return rules;
}

constexpr std::string_view kCameraVendors[] = {
    "hikvision", "dahua", "axis", "foscam", "amcrest", "reolink", "hipcam"};

void apply_rules(const std::vector<KeywordRule> &rules, const std::string &lower,
                 SignalSource source, std::vector<Signal> &out) {
  for (const auto &rule : rules) {
    if (rule.matches(lower)) {
      out.emplace_back(source, rule.type, rule.confidence);
    }
  }
}

// First matching rule only.
void apply_first_rule(const std::vector<KeywordRule> &rules,
                      const std::string &lower, SignalSource source,
                      std::vector<Signal> &out) {
  for (const auto &rule : rules) {
    if (rule.matches(lower)) {
      out.emplace_back(source, rule.type, rule.confidence);
      return;
    }
  }
}

// Highest aggregate score, scanning types in declaration order so the
// earlier type keeps a tie.
std::pair<DeviceType, double> best_scoring(const std::vector<Signal> &signals) {
  std::array<double, data::kAllDeviceTypes.size()> scores{};
  for (const auto &s : signals) {
    if (s.suggested_type == DeviceType::unknown) continue;
    scores[static_cast<size_t>(s.suggested_type)] +=
        s.confidence * InferenceEngine::source_weight(s.source);
  }
  DeviceType best = DeviceType::unknown;
  double best_score = 0.0;
  for (auto type : data::kAllDeviceTypes) {
    double score = scores[static_cast<size_t>(type)];
    if (score > best_score) {
      best_score = score;
      best = type;
    }
  }
  return {best, best_score};
}

std::optional<std::string> txt_value(const MdnsTxtData &txt,
                                     std::string_view key) {
  auto it = txt.records.find(std::string(key));
  if (it == txt.records.end() || it->second.empty()) return std::nullopt;
  return it->second;
}

} // namespace

std::string to_string(SignalSource s) {
  switch (s) {
  case SignalSource::ssdp:
    return "ssdp";
  case SignalSource::mdns:
    return "mdns";
  case SignalSource::port:
    return "port";
  case SignalSource::fingerprint:
    return "fingerprint";
  case SignalSource::upnp:
    return "upnp";
  case SignalSource::hostname:
    return "hostname";
  case SignalSource::mdnsTXT:
    return "mdnsTXT";
  case SignalSource::portBanner:
    return "portBanner";
  case SignalSource::macAnalysis:
    return "macAnalysis";
  case SignalSource::behavior:
    return "behavior";
  case SignalSource::dhcpFingerprint:
    return "dhcpFingerprint";
  }
  return "unknown";
}

bool KeywordRule::matches(const std::string &lower) const {
  bool any_ok = any_of.empty() && suffix_any.empty();
  for (auto k : any_of) {
    if (contains(lower, k)) {
      any_ok = true;
      break;
    }
  }
  if (!any_ok) {
    for (auto k : suffix_any) {
      if (ends_with(lower, k)) {
        any_ok = true;
        break;
      }
    }
  }
  if (!any_ok) return false;
  for (auto k : all_of) {
    if (!contains(lower, k)) return false;
  }
  for (auto k : none_of) {
    if (contains(lower, k)) return false;
  }
  return true;
}

double InferenceEngine::source_weight(SignalSource source) {
  for (const auto &[src, w] : kSourceWeights) {
    if (src == source) return w;
  }
  return kDefaultWeight;
}

DeviceType InferenceEngine::infer(const std::vector<Signal> &signals) const {
  if (signals.empty()) {
    return DeviceType::unknown;
  }
  return best_scoring(signals).first;
}

InferenceResult InferenceEngine::infer_enhanced(
    std::vector<Signal> signals, const EnhancedEvidence &evidence) const {
  for (const auto &txt : evidence.mdns_txt) {
    auto extra = signals_from_mdns_txt(txt);
    signals.insert(signals.end(), extra.begin(), extra.end());
  }
  if (evidence.banners) {
    auto extra = signals_from_banners(*evidence.banners);
    signals.insert(signals.end(), extra.begin(), extra.end());
  }
  if (evidence.mac_analysis) {
    auto extra = MacAnalyzer::generate_signals(*evidence.mac_analysis);
    signals.insert(signals.end(), extra.begin(), extra.end());
  }
  if (signals.empty()) {
    return {};
  }

  auto [best, best_score] = best_scoring(signals);
  if (best == DeviceType::unknown) {
    return {};
  }
  double max_possible = static_cast<double>(signals.size()) * kMaxSourceWeight;
  double normalized = std::min(1.0, best_score / std::max(1.0, max_possible));

  BOOST_LOG_SEV(lg_, boost::log::trivial::debug)
      << "Enhanced inference result: " << data::to_string(best)
      << fmt::format(" confidence {:.2f}", normalized) << " from "
      << signals.size() << " signals";
  return InferenceResult{.type = best, .confidence = normalized};
}

std::vector<Signal> InferenceEngine::signals_from_ssdp(std::string_view server,
                                                       std::string_view usn,
                                                       std::string_view st) const {
  const std::string fields[] = {toLowerCase(server), toLowerCase(usn),
                                toLowerCase(st)};
  std::vector<Signal> out;
  for (const auto &rule : ssdp_rules()) {
    bool hit = std::any_of(
        rule.any_of.begin(), rule.any_of.end(), [&](const SsdpKeyword &k) {
          for (unsigned bit = 0; bit < 3; ++bit) {
            if ((k.fields & (1u << bit)) && contains(fields[bit], k.keyword))
              return true;
          }
          return false;
        });
    if (hit) {
      out.emplace_back(SignalSource::ssdp, rule.type, rule.confidence);
    }
  }
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_mdns_service_type(
    std::string_view service_type) const {
  std::vector<Signal> out;
  for (const auto &rule : kMdnsRules) {
    if (rule.service_type == service_type) {
      out.emplace_back(SignalSource::mdns, rule.type, rule.confidence);
    }
  }
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_port(int port) const {
  std::vector<Signal> out;
  for (const auto &rule : kPortRules) {
    if (rule.port == port) {
      out.emplace_back(SignalSource::port, rule.type, rule.confidence);
    }
  }
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_fingerprint(
    const data::DeviceFingerprint &fp) const {
  std::vector<Signal> out;
  if (fp.fingerbank_parents) {
    auto combined = toLowerCase(stringutil::join(*fp.fingerbank_parents, " "));
    apply_rules(parent_rules(), combined, SignalSource::fingerprint, out);
  }
  if (fp.upnp_device_type) {
    apply_rules(upnp_type_rules(), toLowerCase(*fp.upnp_device_type),
                SignalSource::upnp, out);
  }
  if (fp.manufacturer) {
    auto maker = toLowerCase(*fp.manufacturer);
    auto model = toLowerCase(fp.model_name.value_or(""));
    for (const auto &rule : manufacturer_rules()) {
      if (!rule.maker.matches(maker)) continue;
      if (!rule.model_any.empty() &&
          std::none_of(rule.model_any.begin(), rule.model_any.end(),
                       [&](std::string_view k) { return contains(model, k); }))
        continue;
      out.emplace_back(SignalSource::fingerprint, rule.maker.type,
                       rule.maker.confidence);
    }
  }
  if (fp.is_mobile.value_or(false)) {
    out.emplace_back(SignalSource::fingerprint, DeviceType::phone, 0.90);
  }
  if (fp.is_tablet.value_or(false)) {
    out.emplace_back(SignalSource::fingerprint, DeviceType::tablet, 0.90);
  }
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_hostname(
    std::string_view hostname) const {
  std::vector<Signal> out;
  apply_rules(hostname_rules(), toLowerCase(hostname), SignalSource::hostname,
              out);
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_mdns_txt(
    const MdnsTxtData &txt) const {
  std::vector<Signal> out;
  const auto &type = txt.service_type;
  if (type == "_airplay._tcp") {
    if (auto model = txt_value(txt, "model")) {
      apply_first_rule(apple_model_rules(), toLowerCase(*model),
                       SignalSource::mdnsTXT, out);
    }
  } else if (type == "_raop._tcp") {
    if (auto model = txt_value(txt, "am")) {
      apply_first_rule(apple_model_rules(), toLowerCase(*model),
                       SignalSource::mdnsTXT, out);
    }
  } else if (type == "_googlecast._tcp") {
    if (auto model = txt_value(txt, "md")) {
      apply_first_rule(cast_model_rules(), toLowerCase(*model),
                       SignalSource::mdnsTXT, out);
    }
  } else if (type == "_hap._tcp" || type == "_homekit._tcp") {
    if (auto ci = txt_value(txt, "ci")) {
      int id = 0;
      try {
        id = std::stoi(*ci);
      } catch (const std::exception &) {
        BOOST_LOG_SEV(lg_, boost::log::trivial::debug)
            << "Ignoring malformed HomeKit category '" << *ci << "'";
        return out;
      }
      for (const auto &cat : kHomeKitCategories) {
        if (cat.id == id) {
          out.emplace_back(SignalSource::mdnsTXT, cat.type, cat.confidence);
          break;
        }
      }
    }
  }
  return out;
}

std::vector<Signal> InferenceEngine::signals_from_banners(
    const data::BannerData &banners) const {
  std::vector<Signal> out;
  if (banners.ssh) {
    auto lower = toLowerCase(*banners.ssh);
    apply_first_rule(ssh_os_rules(), lower, SignalSource::portBanner, out);
    apply_rules(ssh_device_rules(), lower, SignalSource::portBanner, out);
  }
  if (banners.http_server) {
    apply_rules(http_server_rules(), toLowerCase(*banners.http_server),
                SignalSource::portBanner, out);
  }
  if (banners.rtsp) {
    auto lower = toLowerCase(*banners.rtsp);
    bool streaming = stringutil::contains_any(lower, {"describe", "play", "setup"});
    bool camera_vendor =
        std::any_of(std::begin(kCameraVendors), std::end(kCameraVendors),
                    [&](std::string_view v) { return contains(lower, v); });
    if (streaming) {
      out.emplace_back(SignalSource::portBanner, DeviceType::camera, 0.85);
    }
    if (camera_vendor) {
      out.emplace_back(SignalSource::portBanner, DeviceType::camera, 0.95);
    }
    if (!streaming && contains(lower, "server:")) {
      out.emplace_back(SignalSource::portBanner, DeviceType::smartTV, 0.50);
    }
  }
  return out;
}

DeviceType InferenceEngine::infer_from_all_sources(
    const std::optional<data::SsdpAnnouncement> &ssdp,
    const std::vector<std::string> &mdns_service_types,
    const std::vector<int> &open_ports,
    const std::optional<data::DeviceFingerprint> &fingerprint,
    const std::optional<std::string> &hostname) const {
  std::vector<Signal> all;
  auto append = [&all](std::vector<Signal> &&more) {
    all.insert(all.end(), more.begin(), more.end());
  };
  if (ssdp) {
    append(signals_from_ssdp(ssdp->server, ssdp->usn, ssdp->st));
  }
  for (const auto &st : mdns_service_types) {
    append(signals_from_mdns_service_type(st));
  }
  for (int port : open_ports) {
    append(signals_from_port(port));
  }
  if (fingerprint) {
    append(signals_from_fingerprint(*fingerprint));
  }
  if (hostname) {
    append(signals_from_hostname(*hostname));
  }
  return infer(all);
}

} // namespace lanlens
