#include <gtest/gtest.h>

#include "util/mac_address.hpp"
#include "util/mac_vendor_lookup.hpp"
#include "util/string_util.hpp"

namespace {

using namespace lanlens;

TEST(MacAddressTest, NormalizesSeparatorsCaseAndShortOctets) {
  EXPECT_EQ(macaddr::normalize("aa:bb:cc:dd:ee:ff"),
            std::optional<std::string>("AA:BB:CC:DD:EE:FF"));
  EXPECT_EQ(macaddr::normalize("aa-bb-cc-dd-ee-ff"),
            std::optional<std::string>("AA:BB:CC:DD:EE:FF"));
  EXPECT_EQ(macaddr::normalize("a:b:c:1:22:3"),
            std::optional<std::string>("0A:0B:0C:01:22:03"));
  EXPECT_EQ(macaddr::normalize(" 001132aabbcc "),
            std::optional<std::string>("00:11:32:AA:BB:CC"));
}

TEST(MacAddressTest, RejectsMalformedInput) {
  EXPECT_FALSE(macaddr::normalize("").has_value());
  EXPECT_FALSE(macaddr::normalize("aa:bb:cc:dd:ee").has_value());
  EXPECT_FALSE(macaddr::normalize("aa:bb:cc:dd:ee:gg").has_value());
  EXPECT_FALSE(macaddr::normalize("aa:bb:cc:dd:ee:ff:00").has_value());
  EXPECT_FALSE(macaddr::normalize("aabbccddee").has_value());
  // fallback keeps the raw text, uppercased
  EXPECT_EQ(macaddr::normalize_or_upper("incomplete"), "INCOMPLETE");
}

TEST(MacAddressTest, OuiAndFlags) {
  EXPECT_EQ(macaddr::oui("00:11:32:aa:bb:cc"), "001132");
  EXPECT_EQ(macaddr::oui_prefix("00-11-32-aa-bb-cc"), "00:11:32");
  EXPECT_EQ(macaddr::oui("garbage"), "");

  auto first = macaddr::first_octet("DA:A1:19:00:00:01");
  ASSERT_TRUE(first);
  EXPECT_TRUE(macaddr::is_locally_administered(*first));
  EXPECT_FALSE(macaddr::is_multicast(*first));
  EXPECT_TRUE(macaddr::is_multicast(0x01));

  EXPECT_TRUE(macaddr::is_broadcast_or_zero("ff:ff:ff:ff:ff:ff"));
  EXPECT_TRUE(macaddr::is_broadcast_or_zero("00:00:00:00:00:00"));
  EXPECT_TRUE(macaddr::is_broadcast_or_zero("nonsense"));
  EXPECT_FALSE(macaddr::is_broadcast_or_zero("00:11:32:aa:bb:cc"));
}

TEST(MacVendorLookupTest, KnownPrefixesResolve) {
  MacVendorLookup lookup;
  EXPECT_GT(lookup.size(), 50u);
  EXPECT_EQ(lookup.lookup("00:11:32:01:02:03"), std::optional<std::string>("Synology"));
  EXPECT_EQ(lookup.lookup("00-0e-58-01-02-03"), std::optional<std::string>("Sonos"));
  EXPECT_EQ(lookup.lookup("00:0D:4B:99:88:77"), std::optional<std::string>("Roku"));
  EXPECT_FALSE(lookup.lookup("02:00:00:00:00:01").has_value());
  EXPECT_FALSE(lookup.lookup("not-a-mac").has_value());
}

TEST(StringUtilTest, Iso8601RoundTripsAtSecondPrecision) {
  auto tp = stringutil::from_epoch_seconds(1700000000);
  auto text = stringutil::formatISO8601(tp);
  EXPECT_EQ(text, "2023-11-14T22:13:20Z");
  auto back = stringutil::parseISO8601(text);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(stringutil::to_epoch_seconds(*back), 1700000000);
  EXPECT_FALSE(stringutil::parseISO8601("yesterday").has_value());
}

TEST(StringUtilTest, SplitJoinReplace) {
  auto parts = stringutil::split_trim(" a , b ,, c ", ',');
  EXPECT_EQ(stringutil::join(parts, "|"), "a|b|c");
  EXPECT_EQ(stringutil::replace_all("[fe80::1]", "[", ""), "fe80::1]");
  EXPECT_TRUE(stringutil::ends_with("_hap._tcp", "._tcp"));
}

} // namespace
