#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "data/device.hpp"
#include "inference/security_posture.hpp"

namespace {

using lanlens::SecurityPostureAssessor;
using lanlens::data::BannerData;
using lanlens::data::RiskLevel;
using lanlens::data::SecurityPosture;
namespace json = boost::json;

const auto kNow = std::chrono::system_clock::time_point(std::chrono::hours(480000));

class SecurityPostureTest : public ::testing::Test {
protected:
  SecurityPosture assess(std::optional<std::string> hostname, std::vector<int> ports,
                         BannerData banners = {}) {
    return assessor_.assess(hostname, ports, banners, kNow);
  }

  SecurityPostureAssessor assessor_;
};

TEST_F(SecurityPostureTest, QuietDeviceIsLowRisk) {
  auto p = assess(std::string("kitchen-display"), {443});
  EXPECT_EQ(p.risk_level, RiskLevel::low);
  EXPECT_EQ(p.risk_score, 0);
  EXPECT_TRUE(p.risk_factors.empty());
  EXPECT_TRUE(p.has_web_interface);
  EXPECT_TRUE(p.uses_encryption);
  EXPECT_EQ(p.assessed_at, kNow);
}

TEST_F(SecurityPostureTest, TelnetAndDatabasesAreCritical) {
  auto telnet = assess(std::nullopt, {23});
  EXPECT_EQ(telnet.risk_level, RiskLevel::critical);
  EXPECT_FALSE(telnet.uses_encryption);

  auto db = assess(std::nullopt, {3306, 6379});
  EXPECT_EQ(db.risk_level, RiskLevel::critical);
  // 25 + 25 per port, plus 15 for more than one database.
  EXPECT_EQ(db.risk_score, 65);
  EXPECT_EQ(db.risky_ports, (std::vector<int>{3306, 6379}));
}

TEST_F(SecurityPostureTest, RemoteDesktopIsHigh) {
  auto p = assess(std::nullopt, {3389});
  EXPECT_EQ(p.risk_level, RiskLevel::high);
  EXPECT_EQ(p.risk_score, 15);
}

TEST_F(SecurityPostureTest, ThreeRiskyPortsWidenTheAttackSurface) {
  auto p = assess(std::nullopt, {21, 139, 445});
  EXPECT_EQ(p.risk_level, RiskLevel::high);
  EXPECT_EQ(p.risk_score, 34);
  EXPECT_EQ(p.risk_factors.back().category, "Attack Surface");
  EXPECT_FALSE(p.has_web_interface);
}

TEST_F(SecurityPostureTest, HostnamePatterns) {
  auto router = assess(std::string("NETGEAR-5G"), {});
  ASSERT_EQ(router.risk_factors.size(), 1u);
  EXPECT_EQ(router.risk_factors[0].severity, RiskLevel::medium);
  EXPECT_EQ(router.risk_score, 5);
  EXPECT_EQ(router.risk_level, RiskLevel::low);

  auto laptop = assess(std::string("DESKTOP-4F2K9"), {});
  ASSERT_EQ(laptop.risk_factors.size(), 1u);
  EXPECT_EQ(laptop.risk_factors[0].severity, RiskLevel::low);
  EXPECT_EQ(laptop.risk_score, 2);

  // Only one hostname factor even when both lists match.
  auto both = assess(std::string("router-guest"), {});
  EXPECT_EQ(both.risk_factors.size(), 1u);
}

TEST_F(SecurityPostureTest, BannersRevealOutdatedSoftware) {
  BannerData banners;
  banners.ssh = "SSH-2.0-OpenSSH_6.6.1p1 Ubuntu-2ubuntu2";
  banners.http_server = "Apache/1.3.42";
  auto p = assess(std::nullopt, {22, 80}, banners);
  // SSH 10, Apache 1.x 12, version disclosure 2.
  EXPECT_EQ(p.risk_score, 24);
  EXPECT_EQ(p.risk_level, RiskLevel::high);

  banners = {};
  banners.ssh = "SSH-1.5-OpenSSH_8.9";
  EXPECT_EQ(assess(std::nullopt, {22}, banners).risk_level, RiskLevel::critical);

  banners = {};
  banners.ssh = "SSH-2.0-dropbear_2020.81";
  EXPECT_EQ(assess(std::nullopt, {22}, banners).risk_score, 0);
}

TEST_F(SecurityPostureTest, OpenRtspStreamIsFlagged) {
  BannerData banners;
  banners.rtsp = "RTSP/1.0 200 OK";
  auto open = assess(std::nullopt, {554}, banners);
  EXPECT_EQ(open.risk_score, 12);
  EXPECT_EQ(open.risk_level, RiskLevel::medium);

  banners.rtsp = "RTSP/1.0 401 Unauthorized";
  EXPECT_EQ(assess(std::nullopt, {554}, banners).risk_score, 0);
}

TEST_F(SecurityPostureTest, HostnameIsSanitized) {
  EXPECT_EQ(SecurityPostureAssessor::sanitize_hostname("tv<script>.lan\n"),
            "tvscript.lan");
  EXPECT_EQ(SecurityPostureAssessor::sanitize_hostname(std::string(80, 'a')).size(),
            63u);
}

TEST_F(SecurityPostureTest, ScoreIsCappedAtHundred) {
  auto p = assess(std::string("admin"), {21, 23, 25, 110, 1433, 1521, 3306, 6379, 27017});
  EXPECT_EQ(p.risk_score, 100);
  EXPECT_EQ(p.risk_level, RiskLevel::critical);
}

TEST_F(SecurityPostureTest, PostureTravelsWithTheDeviceJson) {
  lanlens::data::Device d;
  d.mac = "AA:BB:CC:00:00:01";
  d.security_posture = assess(std::nullopt, {23, 80});
  auto jv = json::value_from(d);
  const auto &posture = jv.as_object().at("securityPosture").as_object();
  EXPECT_EQ(std::string(posture.at("riskLevel").as_string().c_str()), "critical");

  auto back = json::value_to<lanlens::data::Device>(jv);
  ASSERT_TRUE(back.security_posture);
  EXPECT_EQ(*back.security_posture, *d.security_posture);
}

} // namespace
