#include <gtest/gtest.h>

#include <boost/json.hpp>

#include "data/scan_session.hpp"

namespace {

using lanlens::data::ScanErrorSource;
using lanlens::data::ScanSession;
using lanlens::data::ScanType;
using namespace std::chrono_literals;

const std::chrono::system_clock::time_point kStart{std::chrono::hours(24 * 20000)};

TEST(ScanSessionTest, BeginAssignsIdAndType) {
  auto a = ScanSession::begin(ScanType::full, kStart);
  auto b = ScanSession::begin(ScanType::full, kStart);
  EXPECT_FALSE(a.id.empty());
  EXPECT_NE(a.id, b.id);
  EXPECT_EQ(a.type, ScanType::full);
  EXPECT_EQ(a.start_time, kStart);
  EXPECT_FALSE(a.is_complete());
  EXPECT_FALSE(a.is_successful());
  EXPECT_FALSE(a.duration());
  EXPECT_FALSE(a.formatted_duration());
}

TEST(ScanSessionTest, ErrorsMakeCompletedSessionUnsuccessful) {
  auto s = ScanSession::begin(ScanType::quick, kStart);
  s.discovered_count = 3;
  s.updated_count = 4;
  s.add_error(ScanErrorSource::portScanner, "192.168.1.5: host unreachable",
              5200, true, kStart + 1s);
  s.finish(kStart + 2s);

  EXPECT_TRUE(s.is_complete());
  EXPECT_FALSE(s.is_successful());
  EXPECT_EQ(s.total_devices_affected(), 7);
  ASSERT_EQ(s.errors.size(), 1u);
  EXPECT_EQ(s.errors[0].code, 5200);
  EXPECT_EQ(s.errors[0].timestamp, kStart + 1s);
  EXPECT_TRUE(s.errors[0].is_recoverable);
}

TEST(ScanSessionTest, FormattedDurationPicksUnit) {
  auto s = ScanSession::begin(ScanType::quick, kStart);
  s.finish(kStart + 350ms);
  EXPECT_EQ(s.formatted_duration(), "350 ms");
  EXPECT_TRUE(s.is_successful());

  s.finish(kStart + 12500ms);
  EXPECT_EQ(s.formatted_duration(), "12.5 sec");

  s.finish(kStart + 125s);
  EXPECT_EQ(s.formatted_duration(), "2m 5s");
}

TEST(ScanSessionTest, JsonCarriesCountsAndErrors) {
  auto s = ScanSession::begin(ScanType::passive, kStart);
  s.discovered_count = 2;
  s.add_error(ScanErrorSource::arpScanner, "permission denied", std::nullopt,
              false, kStart);
  s.finish(kStart + 3s);

  auto jv = boost::json::value_from(s);
  const auto &jo = jv.as_object();
  EXPECT_EQ(jo.at("id").as_string(), s.id);
  EXPECT_EQ(jo.at("type").as_string(), "passive");
  EXPECT_EQ(jo.at("startTime").as_string(), "2024-10-04T00:00:00Z");
  EXPECT_EQ(jo.at("endTime").as_string(), "2024-10-04T00:00:03Z");
  EXPECT_EQ(jo.at("duration").as_string(), "3.0 sec");
  EXPECT_EQ(jo.at("discoveredCount").to_number<int>(), 2);
  const auto &errors = jo.at("errors").as_array();
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_EQ(errors[0].as_object().at("source").as_string(), "ARPScanner");
  EXPECT_FALSE(errors[0].as_object().at("isRecoverable").as_bool());
  EXPECT_FALSE(errors[0].as_object().contains("code"));
}

TEST(ScanSessionTest, NamesOfTypesAndSources) {
  EXPECT_EQ(lanlens::data::to_string(ScanType::quick), "quick");
  EXPECT_EQ(lanlens::data::to_string(ScanType::full), "full");
  EXPECT_EQ(lanlens::data::to_string(ScanErrorSource::mdnsListener),
            "MDNSListener");
  EXPECT_EQ(lanlens::data::to_string(ScanErrorSource::network), "Network");
}

} // namespace
