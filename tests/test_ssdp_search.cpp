#include <gtest/gtest.h>

#include "discovery/ssdp_search.hpp"
#include "util/string_util.hpp"

namespace {

using lanlens::parse_ssdp_response;

TEST(SsdpSearcherTest, MsearchRequestShape) {
  auto req = lanlens::build_msearch(2);
  EXPECT_TRUE(lanlens::stringutil::starts_with(req, "M-SEARCH * HTTP/1.1\r\n"));
  EXPECT_NE(req.find("HOST: 239.255.255.250:1900\r\n"), std::string::npos);
  EXPECT_NE(req.find("MAN: \"ssdp:discover\"\r\n"), std::string::npos);
  EXPECT_NE(req.find("MX: 2\r\n"), std::string::npos);
  EXPECT_NE(req.find("ST: ssdp:all\r\n"), std::string::npos);
  EXPECT_TRUE(lanlens::stringutil::ends_with(req, "\r\n\r\n"));
}

TEST(SsdpSearcherTest, ParsesSearchResponseCaseInsensitively) {
  const char *msg = "HTTP/1.1 200 OK\r\n"
                    "Cache-Control: max-age=3600\r\n"
                    "st: roku:ecp\r\n"
                    "Location: http://192.168.1.30:8060/\r\n"
                    "usn: uuid:roku:ecp:1GU48T017973\r\n"
                    "Server: Roku/9.7 UPnP/1.0 Roku/9.7\r\n"
                    "\r\n";
  auto ann = parse_ssdp_response(msg, "192.168.1.99");
  ASSERT_TRUE(ann);
  EXPECT_EQ(ann->location, "http://192.168.1.30:8060/");
  EXPECT_EQ(ann->usn, "uuid:roku:ecp:1GU48T017973");
  EXPECT_EQ(ann->st, "roku:ecp");
  EXPECT_EQ(ann->server, "Roku/9.7 UPnP/1.0 Roku/9.7");
  // host comes from LOCATION, not the sender
  EXPECT_EQ(ann->host_ip, "192.168.1.30");
}

TEST(SsdpSearcherTest, NotifyUsesNtAndSenderFallback) {
  const char *msg = "NOTIFY * HTTP/1.1\r\n"
                    "NT: urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
                    "NTS: ssdp:alive\r\n"
                    "LOCATION: /description.xml\r\n"
                    "USN: uuid:abc::urn:schemas-upnp-org:device:MediaRenderer:1\r\n"
                    "\r\n";
  auto ann = parse_ssdp_response(msg, "192.168.1.44");
  ASSERT_TRUE(ann);
  EXPECT_EQ(ann->st, "urn:schemas-upnp-org:device:MediaRenderer:1");
  EXPECT_EQ(ann->host_ip, "192.168.1.44");
  EXPECT_TRUE(ann->server.empty());
}

TEST(SsdpSearcherTest, MissingLocationOrUsnIsRejected) {
  EXPECT_FALSE(parse_ssdp_response("HTTP/1.1 200 OK\r\nUSN: uuid:x\r\n\r\n"));
  EXPECT_FALSE(parse_ssdp_response(
      "HTTP/1.1 200 OK\r\nLOCATION: http://10.0.0.2/\r\n\r\n"));
  EXPECT_FALSE(parse_ssdp_response(
      "HTTP/1.1 200 OK\r\nLOCATION:\r\nUSN: uuid:x\r\n\r\n"));
  EXPECT_FALSE(parse_ssdp_response(""));
}

} // namespace
