#include <gtest/gtest.h>

#include "inference/mac_analyzer.hpp"

namespace {

using lanlens::MacAnalyzer;
using lanlens::OuiAgeEstimate;
using lanlens::SignalSource;
using lanlens::VendorConfidence;
using lanlens::data::DeviceType;

TEST(MacAnalyzerTest, RandomizedAddressSuggestsPhone) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("da:a1:19:00:00:01", std::nullopt);
  EXPECT_EQ(a.oui, "DA:A1:19");
  EXPECT_TRUE(a.is_locally_administered);
  EXPECT_TRUE(a.is_randomized);
  EXPECT_EQ(a.vendor_confidence, VendorConfidence::randomized);

  auto signals = MacAnalyzer::generate_signals(a);
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].source, SignalSource::macAnalysis);
  EXPECT_EQ(signals[0].suggested_type, DeviceType::phone);
  EXPECT_DOUBLE_EQ(signals[0].confidence, 0.60);
}

TEST(MacAnalyzerTest, VirtualMachineOui) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("08:00:27:aa:bb:cc", std::string("PCS Systemtechnik"));
  EXPECT_TRUE(a.is_virtual_machine);
  EXPECT_FALSE(a.is_randomized);
  auto signals = MacAnalyzer::generate_signals(a);
  ASSERT_FALSE(signals.empty());
  EXPECT_EQ(signals[0].suggested_type, DeviceType::computer);
  EXPECT_DOUBLE_EQ(signals[0].confidence, 0.85);
}

TEST(MacAnalyzerTest, SpecializedVendorWithMediumConfidence) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("00:11:32:01:02:03", std::string("Synology"));
  EXPECT_EQ(a.vendor_confidence, VendorConfidence::medium);
  ASSERT_TRUE(a.vendor_specialization);
  EXPECT_EQ(*a.vendor_specialization, DeviceType::nas);
  EXPECT_EQ(a.vendor_categories, std::vector<DeviceType>{DeviceType::nas});

  auto signals = MacAnalyzer::generate_signals(a);
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].suggested_type, DeviceType::nas);
  EXPECT_DOUBLE_EQ(signals[0].confidence, 0.55);
}

TEST(MacAnalyzerTest, SingleCategoryHighConfidenceVendor) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("00:06:5B:01:02:03", std::string("Dell Inc."));
  EXPECT_EQ(a.vendor_confidence, VendorConfidence::high);
  EXPECT_EQ(a.age_estimate, OuiAgeEstimate::established);
  EXPECT_FALSE(a.vendor_specialization.has_value());

  auto signals = MacAnalyzer::generate_signals(a);
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].suggested_type, DeviceType::computer);
  EXPECT_DOUBLE_EQ(signals[0].confidence, 0.65);
}

TEST(MacAnalyzerTest, LegacyVendorLeansRouter) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("00:60:08:01:02:03", std::string("3Com Corporation"));
  EXPECT_EQ(a.age_estimate, OuiAgeEstimate::legacy);
  EXPECT_EQ(a.vendor_confidence, VendorConfidence::low);
  auto signals = MacAnalyzer::generate_signals(a);
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].suggested_type, DeviceType::router);
  EXPECT_DOUBLE_EQ(signals[0].confidence, 0.40);
}

TEST(MacAnalyzerTest, UnknownVendorProducesNoSignals) {
  MacAnalyzer analyzer;
  auto a = analyzer.analyze("00:11:22:33:44:55", std::nullopt);
  EXPECT_EQ(a.vendor_confidence, VendorConfidence::unknown);
  EXPECT_EQ(a.age_estimate, OuiAgeEstimate::unknown);
  EXPECT_TRUE(MacAnalyzer::generate_signals(a).empty());
}

} // namespace
