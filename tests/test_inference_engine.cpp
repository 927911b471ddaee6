#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <random>

#include "inference/inference_engine.hpp"

namespace {

using lanlens::EnhancedEvidence;
using lanlens::InferenceEngine;
using lanlens::MdnsTxtData;
using lanlens::Signal;
using lanlens::SignalSource;
using lanlens::data::DeviceType;

bool has_signal(const std::vector<Signal> &signals, DeviceType type,
                double confidence) {
  return std::any_of(signals.begin(), signals.end(), [&](const Signal &s) {
    return s.suggested_type == type && std::abs(s.confidence - confidence) < 1e-9;
  });
}

TEST(InferenceEngineTest, NoSignalsIsUnknown) {
  InferenceEngine engine;
  EXPECT_EQ(engine.infer({}), DeviceType::unknown);
  auto r = engine.infer_enhanced({}, EnhancedEvidence{});
  EXPECT_EQ(r.type, DeviceType::unknown);
  EXPECT_DOUBLE_EQ(r.confidence, 0.0);
}

TEST(InferenceEngineTest, SourceWeightsFavourFingerprints) {
  EXPECT_DOUBLE_EQ(InferenceEngine::source_weight(SignalSource::fingerprint), 0.9);
  EXPECT_DOUBLE_EQ(InferenceEngine::source_weight(SignalSource::mdnsTXT), 0.85);
  EXPECT_DOUBLE_EQ(InferenceEngine::source_weight(SignalSource::ssdp), 0.7);
  EXPECT_DOUBLE_EQ(InferenceEngine::source_weight(SignalSource::behavior), 0.6);
  EXPECT_DOUBLE_EQ(InferenceEngine::source_weight(SignalSource::port), 0.5);

  InferenceEngine engine;
  // 0.5 * 0.9 beats 0.8 * 0.5
  std::vector<Signal> signals{Signal(SignalSource::port, DeviceType::camera, 0.8),
                              Signal(SignalSource::fingerprint, DeviceType::nas, 0.5)};
  EXPECT_EQ(engine.infer(signals), DeviceType::nas);
}

TEST(InferenceEngineTest, TiesGoToEarlierDeclaredType) {
  InferenceEngine engine;
  std::vector<Signal> signals{Signal(SignalSource::port, DeviceType::speaker, 0.8),
                              Signal(SignalSource::port, DeviceType::smartTV, 0.8)};
  EXPECT_EQ(engine.infer(signals), DeviceType::smartTV);

  std::vector<Signal> later{Signal(SignalSource::port, DeviceType::router, 0.6),
                            Signal(SignalSource::port, DeviceType::nas, 0.6)};
  EXPECT_EQ(engine.infer(later), DeviceType::nas);
}

TEST(InferenceEngineTest, ResultDoesNotDependOnSignalOrder) {
  InferenceEngine engine;
  std::vector<Signal> signals{
      Signal(SignalSource::ssdp, DeviceType::speaker, 0.95),
      Signal(SignalSource::port, DeviceType::smartTV, 0.8),
      Signal(SignalSource::hostname, DeviceType::speaker, 0.5),
      Signal(SignalSource::mdns, DeviceType::smartTV, 0.85),
      Signal(SignalSource::behavior, DeviceType::hub, 0.3)};
  const auto expected = engine.infer_enhanced(signals, {});

  std::mt19937 gen(7);
  for (int i = 0; i < 10; ++i) {
    std::shuffle(signals.begin(), signals.end(), gen);
    auto r = engine.infer_enhanced(signals, {});
    EXPECT_EQ(r.type, expected.type);
    EXPECT_DOUBLE_EQ(r.confidence, expected.confidence);
  }
}

TEST(InferenceEngineTest, SignalConfidenceIsClamped) {
  Signal high(SignalSource::port, DeviceType::hub, 1.7);
  Signal low(SignalSource::port, DeviceType::hub, -0.2);
  EXPECT_DOUBLE_EQ(high.confidence, 1.0);
  EXPECT_DOUBLE_EQ(low.confidence, 0.0);
}

TEST(InferenceEngineTest, SsdpServerUsnAndSearchTarget) {
  InferenceEngine engine;
  auto roku = engine.signals_from_ssdp("Roku/9.7 UPnP/1.0 Roku/9.7", "", "");
  EXPECT_TRUE(has_signal(roku, DeviceType::smartTV, 0.95));

  auto sonos = engine.signals_from_ssdp("Linux UPnP/1.0", "uuid:RINCON_sonos_1400",
                                        "urn:schemas-upnp-org:device:ZonePlayer:1");
  EXPECT_TRUE(has_signal(sonos, DeviceType::speaker, 0.95));

  auto renderer = engine.signals_from_ssdp(
      "", "", "urn:schemas-upnp-org:device:MediaRenderer:1");
  EXPECT_TRUE(has_signal(renderer, DeviceType::smartTV, 0.75));

  auto gateway = engine.signals_from_ssdp(
      "", "", "urn:schemas-upnp-org:device:InternetGatewayDevice:1");
  EXPECT_TRUE(has_signal(gateway, DeviceType::router, 0.85));

  EXPECT_TRUE(engine.signals_from_ssdp("", "", "").empty());
}

TEST(InferenceEngineTest, MdnsServiceTypesMatchExactly) {
  InferenceEngine engine;
  auto cast = engine.signals_from_mdns_service_type("_googlecast._tcp");
  ASSERT_EQ(cast.size(), 1u);
  EXPECT_EQ(cast[0].suggested_type, DeviceType::smartTV);
  EXPECT_DOUBLE_EQ(cast[0].confidence, 0.85);
  EXPECT_EQ(cast[0].source, SignalSource::mdns);

  EXPECT_TRUE(engine.signals_from_mdns_service_type("_googlecast._tcp.local").empty());
  EXPECT_TRUE(engine.signals_from_mdns_service_type("_unknown._tcp").empty());
}

TEST(InferenceEngineTest, PortsAndHostnames) {
  InferenceEngine engine;
  auto p = engine.signals_from_port(8123);
  ASSERT_EQ(p.size(), 1u);
  EXPECT_EQ(p[0].suggested_type, DeviceType::hub);
  EXPECT_TRUE(engine.signals_from_port(12345).empty());

  EXPECT_TRUE(has_signal(engine.signals_from_hostname("Living-Room-Roku"),
                         DeviceType::smartTV, 0.85));
  EXPECT_TRUE(has_signal(engine.signals_from_hostname("Johns-iPhone"),
                         DeviceType::phone, 0.85));

  auto nest = engine.signals_from_hostname("nest-thermostat-hall");
  ASSERT_EQ(nest.size(), 1u);
  EXPECT_EQ(nest[0].suggested_type, DeviceType::thermostat);
  EXPECT_DOUBLE_EQ(nest[0].confidence, 0.85);

  auto nest_cam = engine.signals_from_hostname("nest-cam-garage");
  EXPECT_TRUE(has_signal(nest_cam, DeviceType::camera, 0.85));
  EXPECT_FALSE(has_signal(nest_cam, DeviceType::thermostat, 0.50));
}

TEST(InferenceEngineTest, FingerprintParentsManufacturerAndFlags) {
  InferenceEngine engine;
  lanlens::data::DeviceFingerprint fp;
  fp.fingerbank_parents = std::vector<std::string>{"Apple TV", "Apple"};
  fp.is_mobile = false;
  auto signals = engine.signals_from_fingerprint(fp);
  EXPECT_TRUE(has_signal(signals, DeviceType::smartTV, 0.95));

  lanlens::data::DeviceFingerprint hue;
  hue.manufacturer = "Philips";
  hue.model_name = "Philips hue bridge 2015";
  hue.upnp_device_type = "urn:schemas-upnp-org:device:Basic:1";
  auto hs = engine.signals_from_fingerprint(hue);
  EXPECT_TRUE(has_signal(hs, DeviceType::hub, 0.90));
  EXPECT_TRUE(has_signal(hs, DeviceType::hub, 0.40));

  lanlens::data::DeviceFingerprint phone;
  phone.is_mobile = true;
  EXPECT_TRUE(has_signal(engine.signals_from_fingerprint(phone),
                         DeviceType::phone, 0.90));
}

TEST(InferenceEngineTest, MdnsTxtRecords) {
  InferenceEngine engine;
  auto thermostat =
      engine.signals_from_mdns_txt(MdnsTxtData{"_hap._tcp", {{"ci", "9"}}});
  ASSERT_EQ(thermostat.size(), 1u);
  EXPECT_EQ(thermostat[0].suggested_type, DeviceType::thermostat);
  EXPECT_EQ(thermostat[0].source, SignalSource::mdnsTXT);

  EXPECT_TRUE(
      engine.signals_from_mdns_txt(MdnsTxtData{"_hap._tcp", {{"ci", "abc"}}})
          .empty());

  auto appletv = engine.signals_from_mdns_txt(
      MdnsTxtData{"_airplay._tcp", {{"model", "AppleTV6,2"}}});
  EXPECT_TRUE(has_signal(appletv, DeviceType::smartTV, 0.95));

  auto speaker = engine.signals_from_mdns_txt(
      MdnsTxtData{"_googlecast._tcp", {{"md", "Google Home Mini"}}});
  EXPECT_TRUE(has_signal(speaker, DeviceType::speaker, 0.90));
}

TEST(InferenceEngineTest, Banners) {
  InferenceEngine engine;
  lanlens::data::BannerData banners;
  banners.ssh = "SSH-2.0-OpenSSH_8.9p1 Ubuntu-3ubuntu0.1";
  banners.http_server = "nginx/1.18.0 (Synology DSM)";
  banners.rtsp = "RTSP/1.0 200 OK\r\nServer: Hikvision-Webs";
  auto signals = engine.signals_from_banners(banners);
  EXPECT_TRUE(has_signal(signals, DeviceType::computer, 0.60));
  EXPECT_TRUE(has_signal(signals, DeviceType::nas, 0.95));
  EXPECT_TRUE(has_signal(signals, DeviceType::camera, 0.95));
  EXPECT_TRUE(has_signal(signals, DeviceType::smartTV, 0.50));

  lanlens::data::BannerData dropbear;
  dropbear.ssh = "SSH-2.0-dropbear_2019.78";
  auto ds = engine.signals_from_banners(dropbear);
  ASSERT_EQ(ds.size(), 1u);
  EXPECT_EQ(ds[0].suggested_type, DeviceType::hub);
}

TEST(InferenceEngineTest, StreamingStickResolvesToSmartTv) {
  InferenceEngine engine;
  lanlens::MacAnalyzer analyzer;

  std::vector<Signal> signals = engine.signals_from_ssdp(
      "Roku/9.7 UPnP/1.0 Roku/9.7", "uuid:roku:ecp:1GU48T017973",
      "roku:ecp");
  auto port = engine.signals_from_port(8008);
  signals.insert(signals.end(), port.begin(), port.end());

  EnhancedEvidence evidence;
  evidence.mac_analysis = analyzer.analyze("00:0D:4B:12:34:56", "Roku");

  auto r = engine.infer_enhanced(signals, evidence);
  EXPECT_EQ(r.type, DeviceType::smartTV);
  EXPECT_GT(r.confidence, 0.0);
  EXPECT_LE(r.confidence, 1.0);
}

TEST(InferenceEngineTest, InferFromAllSources) {
  InferenceEngine engine;
  lanlens::data::SsdpAnnouncement ssdp;
  ssdp.server = "Linux UPnP/1.0 Sonos/57.3-77280 (ZPS9)";
  auto type = engine.infer_from_all_sources(ssdp, {"_sonos._tcp"}, {1400},
                                            std::nullopt, std::string("Kitchen"));
  EXPECT_EQ(type, DeviceType::speaker);

  EXPECT_EQ(engine.infer_from_all_sources(std::nullopt, {}, {}, std::nullopt,
                                          std::nullopt),
            DeviceType::unknown);
}

} // namespace
