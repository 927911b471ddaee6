#include <gtest/gtest.h>

#include "cache/arp_cache.hpp"
#include "lanlens_error_codes.hpp"
#include "test_config_utils.hpp"
#include "test_fakes.hpp"

namespace {

using lanlens::ArpCache;
using lanlens::LanlensConfigProviderValue;
using lanlens::data::ArpEntry;
using namespace std::chrono_literals;

class ArpCacheTest : public ::testing::Test {
protected:
  ArpCacheTest()
      : provider_(make_config()), cache_(reader_, provider_) {
    cache_.set_clock(clock_.fn());
    reader_.entries = {{"192.168.1.10", "aa:bb:cc:00:00:10", "eth0"},
                       {"192.168.1.20", "aa-bb-cc-00-00-20", "eth0"}};
  }

  static lanlens::LanlensConfig make_config() {
    auto cfg = testinfra::make_test_config("/tmp");
    cfg.cache.arp_ttl_seconds = 30;
    cfg.cache.arp_max_entries = 3;
    return cfg;
  }

  testinfra::ManualClock clock_;
  testinfra::FakeArpReader reader_;
  LanlensConfigProviderValue provider_;
  ArpCache cache_;
};

TEST_F(ArpCacheTest, LookupsByMacAndIpAfterRefresh) {
  ASSERT_TRUE(cache_.refresh().is_ok());

  auto by_ip = cache_.get_by_ip("192.168.1.20");
  ASSERT_TRUE(by_ip);
  EXPECT_EQ(by_ip->mac, "AA:BB:CC:00:00:20");

  auto by_mac = cache_.get_by_mac("aa:bb:cc:00:00:10");
  ASSERT_TRUE(by_mac);
  EXPECT_EQ(by_mac->ip, "192.168.1.10");

  EXPECT_FALSE(cache_.get_by_ip("192.168.1.99"));

  auto stats = cache_.stats();
  EXPECT_EQ(stats.entry_count, 2u);
  EXPECT_EQ(stats.hits, 2);
  EXPECT_EQ(stats.misses, 1);
  EXPECT_EQ(stats.refresh_count, 1);
  EXPECT_NEAR(stats.hit_rate(), 2.0 / 3.0, 1e-9);
}

TEST_F(ArpCacheTest, EntriesExpireJustAfterTtl) {
  ASSERT_TRUE(cache_.refresh().is_ok());

  clock_.advance(30s);
  EXPECT_TRUE(cache_.get_by_ip("192.168.1.10"));

  clock_.advance(1ms);
  EXPECT_FALSE(cache_.get_by_ip("192.168.1.10"));
  EXPECT_FALSE(cache_.get_by_mac("AA:BB:CC:00:00:10"));
}

TEST_F(ArpCacheTest, GetTableRefreshesOnlyWhenStaleOrForced) {
  ASSERT_TRUE(cache_.get_table().is_ok());
  EXPECT_EQ(reader_.reads.load(), 1);

  clock_.advance(10s);
  ASSERT_TRUE(cache_.get_table().is_ok());
  EXPECT_EQ(reader_.reads.load(), 1);

  ASSERT_TRUE(cache_.get_table(true).is_ok());
  EXPECT_EQ(reader_.reads.load(), 2);

  clock_.advance(31s);
  auto table = cache_.get_table();
  ASSERT_TRUE(table.is_ok());
  EXPECT_EQ(reader_.reads.load(), 3);
  EXPECT_EQ(table.value().size(), 2u);
}

TEST_F(ArpCacheTest, ReaderFailurePropagates) {
  reader_.failure = monad::make_error(lanlens_errors::GENERAL::FILE_READ_WRITE,
                                        "permission denied");
  auto table = cache_.get_table(true);
  ASSERT_TRUE(table.is_err());
  EXPECT_EQ(table.error().code, lanlens_errors::GENERAL::FILE_READ_WRITE);
  EXPECT_EQ(cache_.stats().refresh_count, 0);
}

TEST_F(ArpCacheTest, OldestInsertedEntriesAreEvictedAtCapacity) {
  cache_.put({{"10.0.0.1", "02:00:00:00:00:01", "eth0"}});
  clock_.advance(1s);
  cache_.put({{"10.0.0.2", "02:00:00:00:00:02", "eth0"}});
  clock_.advance(1s);
  cache_.put({{"10.0.0.3", "02:00:00:00:00:03", "eth0"}});
  clock_.advance(1s);
  cache_.put({{"10.0.0.4", "02:00:00:00:00:04", "eth0"}});

  EXPECT_EQ(cache_.stats().entry_count, 3u);
  EXPECT_FALSE(cache_.get_by_ip("10.0.0.1"));
  EXPECT_TRUE(cache_.get_by_ip("10.0.0.2"));
  EXPECT_TRUE(cache_.get_by_ip("10.0.0.4"));
}

TEST_F(ArpCacheTest, IpChangeMovesReverseIndex) {
  cache_.put({{"10.0.0.1", "02:00:00:00:00:01", "eth0"}});
  cache_.put({{"10.0.0.9", "02:00:00:00:00:01", "eth0"}});
  EXPECT_FALSE(cache_.get_by_ip("10.0.0.1"));
  auto moved = cache_.get_by_ip("10.0.0.9");
  ASSERT_TRUE(moved);
  EXPECT_EQ(moved->mac, "02:00:00:00:00:01");
  EXPECT_EQ(cache_.stats().entry_count, 1u);
}

TEST_F(ArpCacheTest, ClearDropsEntriesAndForcesNextRefresh) {
  ASSERT_TRUE(cache_.get_table().is_ok());
  cache_.clear();
  EXPECT_EQ(cache_.stats().entry_count, 0u);
  ASSERT_TRUE(cache_.get_table().is_ok());
  EXPECT_EQ(reader_.reads.load(), 2);

  cache_.reset_stats();
  EXPECT_EQ(cache_.stats().hits, 0);
  EXPECT_EQ(cache_.stats().refresh_count, 0);
}

TEST_F(ArpCacheTest, RefreshReturnsOnlyTheLiveTable) {
  ASSERT_TRUE(cache_.refresh().is_ok());
  reader_.entries.pop_back();

  clock_.advance(10s);
  auto live = cache_.refresh();
  ASSERT_TRUE(live.is_ok());
  ASSERT_EQ(live.value().size(), 1u);
  EXPECT_EQ(live.value()[0].mac, "AA:BB:CC:00:00:10");
  // The departed host stays cached until its TTL runs out.
  EXPECT_EQ(cache_.stats().entry_count, 2u);
}

TEST_F(ArpCacheTest, PruneDropsExpiredEntriesAndTheirIpRows) {
  ASSERT_TRUE(cache_.refresh().is_ok());
  reader_.entries.pop_back();
  clock_.advance(20s);
  ASSERT_TRUE(cache_.refresh().is_ok());

  EXPECT_EQ(cache_.prune(), 0u);
  clock_.advance(15s);
  EXPECT_EQ(cache_.prune(), 1u);
  EXPECT_EQ(cache_.stats().entry_count, 1u);
  EXPECT_EQ(cache_.prune(), 0u);

  EXPECT_FALSE(cache_.get_by_ip("192.168.1.20"));
  EXPECT_TRUE(cache_.get_by_ip("192.168.1.10"));

  // A new host may reuse the freed address.
  cache_.put({{"192.168.1.20", "02:00:00:00:00:99", "eth0"}});
  auto reused = cache_.get_by_ip("192.168.1.20");
  ASSERT_TRUE(reused);
  EXPECT_EQ(reused->mac, "02:00:00:00:00:99");
}

} // namespace
