#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "fingerprint/fingerbank_client.hpp"
#include "lanlens_error_codes.hpp"
#include "test_config_utils.hpp"
#include "test_fakes.hpp"

namespace {

namespace json = boost::json;
using lanlens::FingerbankClient;
using namespace std::chrono_literals;

constexpr const char *kApiUrl =
    "https://fingerbank.test/api/v2/combinations/interrogate";

constexpr const char *kAppleTvResponse = R"({
  "device": {
    "id": 33453,
    "name": "Apple TV 4K",
    "mobile": false,
    "tablet": false,
    "parents": [{"id": 1, "name": "Apple TV"}, {"id": 2, "name": "Apple"}]
  },
  "score": 87,
  "version": "tvOS 17.1"
})";

class FingerbankClientTest : public ::testing::Test {
protected:
  FingerbankClientTest()
      : provider_(make_config()), client_(transport_, provider_) {
    client_.set_clock(clock_.fn());
  }

  static lanlens::LanlensConfig make_config() {
    auto cfg = testinfra::make_test_config("/tmp");
    cfg.fingerbank.rate_limit_backoff_seconds = 3600;
    return cfg;
  }

  void respond(int status, std::string body = "{}") {
    lanlens::HttpResponse res;
    res.status = status;
    res.body = std::move(body);
    transport_.responses[kApiUrl] = res;
  }

  testinfra::ManualClock clock_;
  testinfra::FakeHttpTransport transport_;
  lanlens::LanlensConfigProviderValue provider_;
  FingerbankClient client_;
};

TEST_F(FingerbankClientTest, RequestBodyCarriesOptionalSignals) {
  auto body = FingerbankClient::build_request_body(
      "aa-bb-cc-dd-ee-ff", std::string("1,3,6,15"),
      std::vector<std::string>{"AppleCoreMedia/1.0"});
  EXPECT_EQ(body.at("mac").as_string(), "AA:BB:CC:DD:EE:FF");
  EXPECT_EQ(body.at("dhcp_fingerprint").as_string(), "1,3,6,15");
  ASSERT_EQ(body.at("user_agents").as_array().size(), 1u);

  auto bare = FingerbankClient::build_request_body("aa:bb:cc:dd:ee:ff",
                                                   std::string(""), std::nullopt);
  EXPECT_FALSE(bare.contains("dhcp_fingerprint"));
  EXPECT_FALSE(bare.contains("user_agents"));
}

TEST_F(FingerbankClientTest, SuccessfulInterrogation) {
  respond(200, kAppleTvResponse);
  auto r = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(r.is_ok()) << r.error().what;
  const auto &fp = r.value();
  EXPECT_EQ(fp.fingerbank_device_name, std::optional<std::string>("Apple TV 4K"));
  EXPECT_EQ(fp.fingerbank_device_id, std::optional<int64_t>(33453));
  EXPECT_EQ(fp.fingerbank_score, std::optional<int64_t>(87));
  EXPECT_EQ(fp.operating_system, std::optional<std::string>("tvOS"));
  EXPECT_EQ(fp.os_version, std::optional<std::string>("17.1"));
  ASSERT_TRUE(fp.fingerbank_parents);
  EXPECT_EQ(fp.fingerbank_parents->front(), "Apple TV");
  EXPECT_EQ(fp.source, lanlens::data::FingerprintSource::fingerbank);
  EXPECT_EQ(fp.timestamp, clock_.now());

  ASSERT_EQ(transport_.requests.size(), 1u);
  const auto &req = transport_.requests[0];
  EXPECT_EQ(req.method, "POST");
  EXPECT_EQ(req.headers.at("Authorization"), "Bearer test-key");
  auto sent = json::parse(req.body).as_object();
  EXPECT_EQ(sent.at("mac").as_string(), "AA:BB:CC:DD:EE:FF");
}

TEST_F(FingerbankClientTest, UnauthorizedDisablesForTheSession) {
  respond(401);
  auto first = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(first.is_err());
  EXPECT_EQ(first.error().code, lanlens_errors::FINGERPRINT::INVALID_API_KEY);
  EXPECT_FALSE(client_.enabled());

  respond(200, kAppleTvResponse);
  auto second = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(second.is_err());
  EXPECT_EQ(second.error().code, lanlens_errors::FINGERPRINT::DISABLED);
  EXPECT_EQ(transport_.requests.size(), 1u);
}

TEST_F(FingerbankClientTest, RateLimitBacksOffForConfiguredWindow) {
  respond(429);
  auto first = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(first.is_err());
  EXPECT_EQ(first.error().code, lanlens_errors::FINGERPRINT::RATE_LIMITED);

  respond(200, kAppleTvResponse);
  clock_.advance(59min);
  auto blocked = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(blocked.is_err());
  EXPECT_EQ(blocked.error().code, lanlens_errors::FINGERPRINT::RATE_LIMITED);
  EXPECT_EQ(transport_.requests.size(), 1u);
  EXPECT_TRUE(client_.enabled());

  clock_.advance(1min);
  auto after = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  EXPECT_TRUE(after.is_ok());
  EXPECT_EQ(transport_.requests.size(), 2u);
}

TEST_F(FingerbankClientTest, MissingKeyAndServerErrors) {
  provider_.get().fingerbank.api_key.clear();
  EXPECT_FALSE(client_.enabled());
  auto no_key = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(no_key.is_err());
  EXPECT_EQ(no_key.error().code, lanlens_errors::FINGERPRINT::NO_API_KEY);
  EXPECT_TRUE(transport_.requests.empty());

  provider_.get().fingerbank.api_key = "k";
  respond(503);
  auto server = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(server.is_err());
  EXPECT_EQ(server.error().code, lanlens_errors::FINGERPRINT::SERVER_ERROR);

  respond(200, "not json");
  auto garbled = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(garbled.is_err());
  EXPECT_EQ(garbled.error().code, lanlens_errors::JSON::DECODE_ERROR);
}

TEST_F(FingerbankClientTest, TransportErrorPassesThrough) {
  transport_.failure = monad::make_error(lanlens_errors::NETWORK::CONNECT_ERROR,
                                           "connection refused");
  auto r = client_.interrogate("aa:bb:cc:dd:ee:ff", std::nullopt, std::nullopt);
  ASSERT_TRUE(r.is_err());
  EXPECT_EQ(r.error().code, lanlens_errors::NETWORK::CONNECT_ERROR);
  EXPECT_TRUE(client_.enabled());
}

} // namespace
