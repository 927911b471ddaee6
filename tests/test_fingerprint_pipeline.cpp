#include <gtest/gtest.h>

#include "cache/fingerprint_cache.hpp"
#include "fingerprint/fingerprint_pipeline.hpp"
#include "lanlens_error_codes.hpp"
#include "state/fingerprint_cache_store.hpp"
#include "test_config_utils.hpp"
#include "test_fakes.hpp"

namespace {

using lanlens::FingerprintCache;
using lanlens::FingerprintPipeline;
using lanlens::FingerprintRequest;
using lanlens::LanlensConfigProviderValue;
using lanlens::SqliteFingerprintCacheStore;
using lanlens::data::DeviceFingerprint;
using lanlens::data::FingerprintSource;
using namespace std::chrono_literals;

constexpr const char kMac[] = "B8:27:EB:12:34:56";
constexpr const char kLocation[] = "http://192.168.1.50:49152/description.xml";

DeviceFingerprint hue_bridge() {
  DeviceFingerprint fp;
  fp.friendly_name = "Philips hue (192.168.1.50)";
  fp.manufacturer = "Signify";
  fp.model_name = "Philips hue bridge 2015";
  fp.upnp_device_type = "urn:schemas-upnp-org:device:Basic:1";
  fp.source = FingerprintSource::upnp;
  return fp;
}

DeviceFingerprint api_answer(const std::string &name) {
  DeviceFingerprint fp;
  fp.fingerbank_device_name = name;
  fp.fingerbank_device_id = 17;
  fp.fingerbank_score = 73;
  fp.operating_system = "Linux";
  fp.source = FingerprintSource::fingerbank;
  return fp;
}

class FingerprintPipelineTest : public ::testing::Test {
protected:
  FingerprintPipelineTest()
      : provider_(testinfra::make_test_config(dir_.path())),
        store_(provider_), cache_(store_, provider_),
        pipeline_(upnp_, fingerbank_, cache_, bundled_) {
    cache_.set_clock(clock_.fn());
    pipeline_.set_clock(clock_.fn());
  }

  FingerprintRequest request(bool force = false) const {
    FingerprintRequest req;
    req.mac = kMac;
    req.location_url = kLocation;
    req.dhcp_fingerprint = "1,3,6,12,15,28,42";
    req.force_refresh = force;
    return req;
  }

  testinfra::TempDir dir_{"lanlens-pipeline"};
  testinfra::ManualClock clock_;
  LanlensConfigProviderValue provider_;
  SqliteFingerprintCacheStore store_;
  FingerprintCache cache_;
  testinfra::FakeUpnpFetcher upnp_;
  testinfra::FakeFingerbankClient fingerbank_;
  testinfra::FakeBundledDatabase bundled_;
  FingerprintPipeline pipeline_;
};

TEST_F(FingerprintPipelineTest, MergesBothOriginsOnFirstResolve) {
  upnp_.descriptions[kLocation] = hue_bridge();
  fingerbank_.answer = api_answer("Philips Hue Bridge");

  auto fp = pipeline_.resolve(request());
  ASSERT_TRUE(fp);
  EXPECT_EQ(fp->source, FingerprintSource::both);
  EXPECT_FALSE(fp->cache_hit);
  EXPECT_EQ(fp->manufacturer, "Signify");
  EXPECT_EQ(fp->fingerbank_device_name, "Philips Hue Bridge");
  EXPECT_EQ(fp->timestamp, clock_.now());
  EXPECT_EQ(upnp_.fetches.load(), 1);
  EXPECT_EQ(fingerbank_.calls.load(), 1);
}

TEST_F(FingerprintPipelineTest, SecondResolveIsServedFromCaches) {
  upnp_.descriptions[kLocation] = hue_bridge();
  fingerbank_.answer = api_answer("Philips Hue Bridge");
  ASSERT_TRUE(pipeline_.resolve(request()));

  clock_.advance(1h);
  auto fp = pipeline_.resolve(request());
  ASSERT_TRUE(fp);
  EXPECT_TRUE(fp->cache_hit);
  EXPECT_EQ(fp->source, FingerprintSource::both);
  EXPECT_EQ(upnp_.fetches.load(), 1);
  EXPECT_EQ(fingerbank_.calls.load(), 1);
}

TEST_F(FingerprintPipelineTest, ForceRefreshBypassesCachesAndBundledData) {
  upnp_.descriptions[kLocation] = hue_bridge();
  fingerbank_.answer = api_answer("Philips Hue Bridge");
  lanlens::BundledFingerprintEntry entry;
  entry.device_name = "Raspberry Pi";
  entry.confidence = 0.8;
  bundled_.ouis["B827EB"] = entry;

  // The bundled OUI entry answers the remote half without asking the API.
  auto first = pipeline_.resolve(request());
  ASSERT_TRUE(first);
  EXPECT_EQ(first->fingerbank_device_name, "Raspberry Pi");
  EXPECT_EQ(fingerbank_.calls.load(), 0);

  auto fp = pipeline_.resolve(request(true));
  ASSERT_TRUE(fp);
  EXPECT_FALSE(fp->cache_hit);
  EXPECT_EQ(fp->fingerbank_device_name, "Philips Hue Bridge");
  EXPECT_EQ(upnp_.fetches.load(), 2);
  EXPECT_EQ(fingerbank_.calls.load(), 1);

  // Once the API answer is cached it wins over the bundled entry.
  auto cached = pipeline_.resolve(request());
  ASSERT_TRUE(cached);
  EXPECT_EQ(cached->fingerbank_device_name, "Philips Hue Bridge");
  EXPECT_TRUE(cached->cache_hit);

  fingerbank_.calls = 0;
  cache_.clear();
  auto bundled = pipeline_.resolve(request());
  ASSERT_TRUE(bundled);
  EXPECT_EQ(bundled->fingerbank_device_name, "Raspberry Pi");
  EXPECT_EQ(bundled->fingerbank_score, 80);
  EXPECT_EQ(fingerbank_.calls.load(), 0);
}

TEST_F(FingerprintPipelineTest, BundledDhcpHashUsedWhenOuiUnknown) {
  lanlens::BundledFingerprintEntry entry;
  entry.device_name = "Google Chromecast";
  entry.vendor = "Google";
  entry.confidence = 0.9;
  bundled_.dhcp_hashes[FingerprintPipeline::bundled_dhcp_hash(
      "1,3,6,12,15,28,42")] = entry;

  auto req = request();
  req.location_url.reset();
  auto fp = pipeline_.resolve(req);
  ASSERT_TRUE(fp);
  EXPECT_EQ(fp->source, FingerprintSource::fingerbank);
  EXPECT_EQ(fp->fingerbank_device_name, "Google Chromecast");
  EXPECT_EQ(fp->best_manufacturer(), "Google");
  EXPECT_TRUE(fp->cache_hit);
  EXPECT_EQ(fingerbank_.calls.load(), 0);
}

TEST_F(FingerprintPipelineTest, BundledDhcpHashIgnoresNotation) {
  EXPECT_EQ(FingerprintPipeline::bundled_dhcp_hash("01,03,06,0c,0f,1c,2a"),
            FingerprintPipeline::bundled_dhcp_hash("1,3,6,12,15,28,42"));
  EXPECT_EQ(FingerprintPipeline::bundled_dhcp_hash("42 28 15 12 6 3 1"),
            FingerprintPipeline::bundled_dhcp_hash("1,3,6,12,15,28,42"));
}

TEST_F(FingerprintPipelineTest, ChangedDhcpListAsksTheApiAgain) {
  fingerbank_.answer = api_answer("Apple iPhone");
  auto req = request();
  req.location_url.reset();

  ASSERT_TRUE(pipeline_.resolve(req));
  ASSERT_TRUE(pipeline_.resolve(req));
  EXPECT_EQ(fingerbank_.calls.load(), 1);

  req.dhcp_fingerprint = "1,3,6,15,119,252";
  fingerbank_.answer = api_answer("Apple iPad");
  auto fp = pipeline_.resolve(req);
  ASSERT_TRUE(fp);
  EXPECT_FALSE(fp->cache_hit);
  EXPECT_EQ(fp->fingerbank_device_name, "Apple iPad");
  EXPECT_EQ(fingerbank_.calls.load(), 2);
}

TEST_F(FingerprintPipelineTest, EmptyApiAnswerIsCachedButNotReturned) {
  fingerbank_.answer = DeviceFingerprint{};
  auto req = request();
  req.location_url.reset();

  EXPECT_FALSE(pipeline_.resolve(req));
  EXPECT_EQ(fingerbank_.calls.load(), 1);

  // The cached empty answer is a hit, so the API is not asked again.
  auto again = pipeline_.resolve(req);
  ASSERT_TRUE(again);
  EXPECT_EQ(again->source, FingerprintSource::fingerbank);
  EXPECT_FALSE(again->has_data());
  EXPECT_EQ(fingerbank_.calls.load(), 1);
}

TEST_F(FingerprintPipelineTest, RemoteFailureDegradesToUpnpOnly) {
  upnp_.descriptions[kLocation] = hue_bridge();
  fingerbank_.failure = monad::make_error(
      lanlens_errors::FINGERPRINT::RATE_LIMITED, "rate limited");

  auto fp = pipeline_.resolve(request());
  ASSERT_TRUE(fp);
  EXPECT_EQ(fp->source, FingerprintSource::upnp);
  EXPECT_FALSE(fp->fingerbank_device_name);
}

TEST_F(FingerprintPipelineTest, NothingResolvedWithoutAnyOrigin) {
  fingerbank_.is_enabled = false;
  auto req = request();
  req.location_url.reset();
  EXPECT_FALSE(pipeline_.resolve(req));
  EXPECT_EQ(fingerbank_.calls.load(), 0);
}

TEST(FingerprintPipelineStaticTest, MergeKeepsFieldsFromTheirOrigin) {
  DeviceFingerprint upnp = hue_bridge();
  upnp.fingerbank_device_name = "ignored";
  upnp.cache_hit = true;
  DeviceFingerprint remote = api_answer("Hue Bridge");
  remote.manufacturer = "ignored";
  remote.cache_hit = false;

  auto now = std::chrono::system_clock::time_point(std::chrono::hours(1000));
  auto merged = FingerprintPipeline::merge(upnp, remote, now);
  ASSERT_TRUE(merged);
  EXPECT_EQ(merged->manufacturer, "Signify");
  EXPECT_EQ(merged->fingerbank_device_name, "Hue Bridge");
  EXPECT_FALSE(merged->cache_hit);
  EXPECT_EQ(merged->timestamp, now);

  EXPECT_FALSE(FingerprintPipeline::merge(std::nullopt, std::nullopt, now));
  auto upnp_only = FingerprintPipeline::merge(upnp, std::nullopt, now);
  ASSERT_TRUE(upnp_only);
  EXPECT_EQ(upnp_only->source, FingerprintSource::upnp);
  EXPECT_TRUE(upnp_only->cache_hit);
}

TEST(FingerprintPipelineStaticTest, RequestUsesFirstSsdpLocation) {
  lanlens::data::Device device;
  device.mac = kMac;
  lanlens::data::DiscoveredService mdns;
  mdns.name = "_hue._tcp";
  mdns.type = lanlens::data::ServiceDiscoveryType::mdns;
  mdns.txt["location"] = "http://wrong/";
  lanlens::data::DiscoveredService ssdp;
  ssdp.name = "urn:schemas-upnp-org:device:Basic:1";
  ssdp.type = lanlens::data::ServiceDiscoveryType::ssdp;
  ssdp.txt["location"] = kLocation;
  device.services = {mdns, ssdp};

  auto req = FingerprintPipeline::request_for(device, true);
  EXPECT_EQ(req.mac, kMac);
  EXPECT_EQ(req.location_url, kLocation);
  EXPECT_TRUE(req.force_refresh);
  EXPECT_FALSE(req.dhcp_fingerprint);
  EXPECT_FALSE(req.user_agents);

  device.dhcp_fingerprint = "1,3,6,15,119,252";
  device.user_agents = {"AppleCoreMedia/1.0.0.20G75 (iPhone; U; CPU OS 16_6)"};
  auto with_signals = FingerprintPipeline::request_for(device);
  EXPECT_EQ(with_signals.dhcp_fingerprint, "1,3,6,15,119,252");
  ASSERT_TRUE(with_signals.user_agents);
  EXPECT_EQ(with_signals.user_agents->size(), 1u);
  EXPECT_FALSE(with_signals.force_refresh);
}

} // namespace
