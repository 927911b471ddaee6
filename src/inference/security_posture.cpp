#include "inference/security_posture.hpp"

#include <boost/log/sources/record_ostream.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <set>
#include <string_view>

#include <fmt/format.h>

#include "util/string_util.hpp"

namespace lanlens {

using data::RiskFactor;
using data::RiskLevel;

namespace {

struct RiskyPort {
  RiskLevel severity;
  std::string_view description;
  std::string_view remediation;
};

const std::map<int, RiskyPort> &risky_ports() {
  static const std::map<int, RiskyPort> table{
      {21, {RiskLevel::medium, "FTP - Unencrypted file transfer protocol",
            "Disable FTP and use SFTP or SCP for secure file transfers"}},
      {23, {RiskLevel::critical,
            "Telnet - Unencrypted remote access with plaintext credentials",
            "Disable Telnet and use SSH for secure remote access"}},
      {25, {RiskLevel::medium, "SMTP - Mail server exposed, potential spam relay",
            "Ensure SMTP authentication is enabled and restrict relay access"}},
      {110, {RiskLevel::medium, "POP3 - Unencrypted email retrieval",
             "Use POP3S (port 995) or IMAPS for encrypted email access"}},
      {135, {RiskLevel::medium, "Windows RPC - Microsoft RPC endpoint mapper",
             "Block from external access using firewall rules"}},
      {139, {RiskLevel::medium, "NetBIOS Session - Windows file sharing (legacy)",
             "Disable NetBIOS over TCP/IP if not needed"}},
      {445, {RiskLevel::medium, "SMB - Windows file sharing, common attack vector",
             "Restrict SMB to trusted networks and enable SMB signing"}},
      {1433, {RiskLevel::critical,
              "Microsoft SQL Server - Database exposed to network",
              "Restrict database access to application servers only"}},
      {1521, {RiskLevel::critical, "Oracle Database - Database listener exposed",
              "Use firewall rules to restrict access to authorized clients"}},
      {3306, {RiskLevel::critical, "MySQL - Database exposed to network",
              "Bind MySQL to localhost and use SSH tunneling for remote access"}},
      {3389, {RiskLevel::high, "RDP - Remote Desktop Protocol exposed",
              "Use VPN for RDP access or enable Network Level Authentication"}},
      {5900, {RiskLevel::high, "VNC - Virtual Network Computing exposed",
              "Use SSH tunneling for VNC access or restrict to local network"}},
      {6379, {RiskLevel::critical,
              "Redis - In-memory database exposed without authentication",
              "Enable Redis AUTH and bind to localhost"}},
      {27017, {RiskLevel::critical, "MongoDB - NoSQL database exposed",
               "Enable authentication and restrict network access"}},
  };
  return table;
}

const std::set<int> kDatabasePorts{1433, 1521, 3306, 5432, 6379,
                                   27017, 9042, 7000, 7001};
const std::set<int> kRemoteDesktopPorts{3389, 5900, 5901, 5902};
const std::set<int> kUnencryptedPorts{21, 23, 25, 110, 143, 80};
const std::set<int> kEncryptedPorts{22, 443, 465, 587, 993, 995, 8443};
const std::set<int> kWebPorts{80, 443, 8080, 8443};

constexpr std::string_view kDefaultHostnamePatterns[] = {
    "router",  "gateway", "admin",    "default",  "setup",   "wireless",
    "linksys", "netgear", "tp-link",  "tplink",   "asus",    "dlink",
    "belkin",  "arris",   "motorola", "ubiquiti", "unifi",   "mikrotik",
    "openwrt", "dd-wrt",  "tomato"};

constexpr std::string_view kWeakHostnamePatterns[] = {
    "desktop-", "laptop-", "android-", "iphone",  "ipad",
    "galaxy",   "pixel",   "oneplus",  "huawei-", "xiaomi-",
    "computer", "device",  "unknown",  "client",  "guest"};

int contribution(RiskLevel severity) {
  switch (severity) {
  case RiskLevel::critical:
    return 25;
  case RiskLevel::high:
    return 15;
  case RiskLevel::medium:
    return 8;
  case RiskLevel::low:
    break;
  }
  return 3;
}

template <typename Range> bool intersects(const Range &ports, const std::set<int> &set) {
  return std::any_of(std::begin(ports), std::end(ports),
                     [&set](int p) { return set.count(p) > 0; });
}

// "SSH-2.0-OpenSSH_6.6.1p1 Ubuntu" -> {"2.0", "OpenSSH_6.6.1p1 Ubuntu"}
std::pair<std::string, std::string> split_ssh_banner(const std::string &banner) {
  if (!stringutil::starts_with(banner, "SSH-")) return {};
  auto rest = banner.substr(4);
  auto dash = rest.find('-');
  if (dash == std::string::npos) return {rest, ""};
  return {rest.substr(0, dash), rest.substr(dash + 1)};
}

std::optional<int> openssh_major(const std::string &software) {
  auto pos = software.find("OpenSSH_");
  if (pos == std::string::npos) return std::nullopt;
  const char *begin = software.data() + pos + 8;
  const char *end = software.data() + software.size();
  int major = 0;
  auto [ptr, ec] = std::from_chars(begin, end, major);
  if (ec != std::errc{} || ptr == begin) return std::nullopt;
  return major;
}

void add(std::vector<RiskFactor> &factors, int &score, std::string category,
         std::string description, RiskLevel severity, int points,
         std::string remediation) {
  factors.push_back(RiskFactor{std::move(category), std::move(description),
                               severity, points, std::move(remediation)});
  score += points;
}

} // namespace

std::string SecurityPostureAssessor::sanitize_hostname(const std::string &hostname) {
  std::string out;
  for (char c : hostname.substr(0, 63)) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || c == '-' || c == '.' || c == '_') out.push_back(c);
  }
  return out;
}

data::SecurityPosture SecurityPostureAssessor::assess(
    const std::optional<std::string> &hostname, const std::vector<int> &open_ports,
    const data::BannerData &banners,
    std::chrono::system_clock::time_point now) const {
  data::SecurityPosture posture;
  auto &factors = posture.risk_factors;
  int score = 0;

  for (int port : open_ports) {
    auto it = risky_ports().find(port);
    if (it == risky_ports().end()) continue;
    posture.risky_ports.push_back(port);
    const auto &def = it->second;
    add(factors, score, "Open Port",
        fmt::format("Port {}: {}", port, def.description), def.severity,
        contribution(def.severity), std::string(def.remediation));
  }
  if (posture.risky_ports.size() >= 3) {
    add(factors, score, "Attack Surface",
        fmt::format("Multiple risky ports exposed ({} ports)",
                    posture.risky_ports.size()),
        RiskLevel::high, 10,
        "Review all exposed services and disable unnecessary ones");
  }
  std::set<int> databases;
  for (int port : open_ports) {
    if (kDatabasePorts.count(port)) databases.insert(port);
  }
  if (databases.size() > 1) {
    add(factors, score, "Database Exposure",
        fmt::format("Multiple database ports exposed ({} databases)",
                    databases.size()),
        RiskLevel::critical, 15,
        "Restrict database access to application servers using firewall rules");
  }

  if (hostname && !hostname->empty()) {
    auto clean = sanitize_hostname(*hostname);
    auto lower = stringutil::toLowerCase(clean);
    bool flagged = false;
    for (auto pattern : kDefaultHostnamePatterns) {
      if (!stringutil::contains(lower, pattern)) continue;
      add(factors, score, "Configuration",
          fmt::format("Default hostname detected: '{}' contains '{}'", clean,
                      pattern),
          RiskLevel::medium, 5,
          "Change the device hostname to a unique, non-descriptive name");
      flagged = true;
      break;
    }
    if (!flagged) {
      for (auto pattern : kWeakHostnamePatterns) {
        if (!stringutil::contains(lower, pattern)) continue;
        add(factors, score, "Configuration",
            fmt::format("Weak hostname pattern: '{}' appears to be factory-generated",
                        clean),
            RiskLevel::low, 2,
            "Consider using a custom hostname for easier device identification");
        break;
      }
    }
  }

  if (banners.ssh) {
    auto [protocol, software] = split_ssh_banner(*banners.ssh);
    if (protocol == "1" || protocol == "1.0" || protocol == "1.5") {
      add(factors, score, "Encryption",
          "SSH Protocol version 1 is deprecated and insecure", RiskLevel::critical,
          20, "Upgrade to SSH protocol version 2 or replace the device");
    }
    if (auto major = openssh_major(software); major && *major < 7) {
      add(factors, score, "Outdated Software",
          fmt::format("Outdated SSH version ({}) with known vulnerabilities",
                      software),
          RiskLevel::high, 10, "Update SSH server to the latest version");
    }
  }
  if (banners.http_server) {
    const auto &server = *banners.http_server;
    auto lower = stringutil::toLowerCase(server);
    if (stringutil::contains(lower, "apache/1.")) {
      add(factors, score, "Outdated Software",
          "Apache 1.x is end-of-life and has known vulnerabilities",
          RiskLevel::high, 12, "Upgrade to Apache 2.4.x or newer");
    }
    if (stringutil::contains_any(lower, {"iis/6", "iis/5"})) {
      add(factors, score, "Outdated Software",
          "IIS 6 or older is end-of-life and has critical vulnerabilities",
          RiskLevel::critical, 18,
          "Upgrade to a supported version of Windows Server and IIS");
    }
    if (server.find('/') != std::string::npos) {
      add(factors, score, "Information Disclosure",
          fmt::format("Server version exposed in headers: {}", server),
          RiskLevel::low, 2,
          "Configure server to hide version information in headers");
    }
  }
  // Only a status line tells whether the stream answered without a challenge.
  if (banners.rtsp && stringutil::starts_with(*banners.rtsp, "RTSP/") &&
      stringutil::contains(*banners.rtsp, " 200")) {
    add(factors, score, "Authentication",
        "RTSP stream accessible without authentication", RiskLevel::high, 12,
        "Enable authentication on the camera/streaming device");
  }

  const auto high_count =
      std::count_if(factors.begin(), factors.end(),
                    [](const RiskFactor &f) { return f.severity == RiskLevel::high; });
  const bool any_critical =
      std::any_of(factors.begin(), factors.end(), [](const RiskFactor &f) {
        return f.severity == RiskLevel::critical;
      });
  const auto &risky = posture.risky_ports;
  if (any_critical || intersects(risky, kDatabasePorts) ||
      std::find(risky.begin(), risky.end(), 23) != risky.end()) {
    posture.risk_level = RiskLevel::critical;
  } else if (intersects(risky, kRemoteDesktopPorts) || high_count >= 2 ||
             risky.size() >= 3 || score >= 25) {
    posture.risk_level = RiskLevel::high;
  } else if (score >= 10) {
    posture.risk_level = RiskLevel::medium;
  } else {
    posture.risk_level = RiskLevel::low;
  }

  posture.risk_score = std::min(score, 100);
  posture.has_web_interface = intersects(open_ports, kWebPorts);
  const bool only_unencrypted =
      std::all_of(open_ports.begin(), open_ports.end(),
                  [](int p) { return kUnencryptedPorts.count(p) > 0; });
  posture.uses_encryption =
      intersects(open_ports, kEncryptedPorts) || !only_unencrypted;
  posture.assessed_at = now;

  BOOST_LOG_SEV(lg_, boost::log::trivial::debug)
      << "Security assessment: risk=" << data::to_string(posture.risk_level)
      << " score=" << posture.risk_score << " factors=" << factors.size();
  return posture;
}

} // namespace lanlens
