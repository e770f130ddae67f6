#include "core/CacheManager.hpp"

#include "support/TestDoubles.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using dnscache::common::RecordType;
using dnscache::common::ResourceRecord;
using dnscache::common::toCode;
using dnscache::core::CacheManager;
using dnscache::test::makeRecord;
using dnscache::test::ManualClock;
using dnscache::test::payloads;
using namespace std::chrono_literals;

namespace {

constexpr uint16_t kA = toCode(RecordType::A);
constexpr uint16_t kMX = toCode(RecordType::MX);

}  // namespace

class CacheManagerTest : public ::testing::Test {
 protected:
  ManualClock _clock;
  CacheManager _cm{4, _clock.fn()};

  std::vector<ResourceRecord> twoAddresses(std::chrono::seconds durTtl) {
    return {makeRecord("wiki.archlinux.org", kA, "95.217.163.246", 0, durTtl, _clock.now()),
            makeRecord("wiki.archlinux.org", kA, "95.217.163.247", 0, durTtl, _clock.now())};
  }
};

TEST_F(CacheManagerTest, MissOnEmptyCache) {
  EXPECT_FALSE(_cm.get("wiki.archlinux.org", kA).has_value());
  EXPECT_EQ(_cm.stats().uMisses, 1u);
}

TEST_F(CacheManagerTest, PutThenGetReturnsRecords) {
  _cm.put("wiki.archlinux.org", kA, twoAddresses(300s), _clock.now() + 300s);

  auto oHit = _cm.get("wiki.archlinux.org", kA);
  ASSERT_TRUE(oHit.has_value());
  EXPECT_EQ(oHit->vRecords.size(), 2u);
  EXPECT_EQ(_cm.stats().uHits, 1u);
  EXPECT_EQ(_cm.stats().uEntries, 1u);
}

TEST_F(CacheManagerTest, KeyIsCaseAndTrailingDotInsensitive) {
  _cm.put("Wiki.ArchLinux.org.", kA, twoAddresses(300s), _clock.now() + 300s);
  EXPECT_TRUE(_cm.get("wiki.archlinux.org", kA).has_value());
  EXPECT_FALSE(_cm.get("wiki.archlinux.org", kMX).has_value());
}

TEST_F(CacheManagerTest, EntryExpiresAtEarliestMemberExpiration) {
  auto vRecords = twoAddresses(300s);
  vRecords[1].tpExpiresAt = _clock.now() + 60s;
  _cm.put("wiki.archlinux.org", kA, vRecords, _clock.now() + 300s);

  _clock.advance(59s);
  EXPECT_TRUE(_cm.get("wiki.archlinux.org", kA).has_value());
  _clock.advance(1s);
  EXPECT_FALSE(_cm.get("wiki.archlinux.org", kA).has_value());
  // Lazily erased on the failed read
  EXPECT_EQ(_cm.stats().uEntries, 0u);
}

TEST_F(CacheManagerTest, ExplicitExpirationCapsEntryLifetime) {
  _cm.put("wiki.archlinux.org", kA, twoAddresses(300s), _clock.now() + 10s);
  _clock.advance(10s);
  EXPECT_FALSE(_cm.get("wiki.archlinux.org", kA).has_value());
}

TEST_F(CacheManagerTest, EmptyPutIsIgnored) {
  _cm.put("wiki.archlinux.org", kA, {}, _clock.now() + 300s);
  EXPECT_FALSE(_cm.get("wiki.archlinux.org", kA).has_value());
}

TEST_F(CacheManagerTest, PutSortsByPriority) {
  std::vector<ResourceRecord> vRecords{
      makeRecord("mail.test", kMX, "mx10", 10, 300s, _clock.now()),
      makeRecord("mail.test", kMX, "mx20", 20, 300s, _clock.now()),
      makeRecord("mail.test", kMX, "mx5", 5, 300s, _clock.now()),
  };
  _cm.put("mail.test", kMX, vRecords, _clock.now() + 300s);

  auto oHit = _cm.get("mail.test", kMX);
  ASSERT_TRUE(oHit.has_value());
  EXPECT_EQ(payloads(oHit->vRecords), (std::vector<std::string>{"mx5", "mx10", "mx20"}));
}

TEST_F(CacheManagerTest, TicketsAdvancePerReadFromFirstTicket) {
  _cm.put("wiki.archlinux.org", kA, twoAddresses(300s), _clock.now() + 300s, 1);
  EXPECT_EQ(_cm.get("wiki.archlinux.org", kA)->uTicket, 1u);
  EXPECT_EQ(_cm.get("wiki.archlinux.org", kA)->uTicket, 2u);
  EXPECT_EQ(_cm.get("wiki.archlinux.org", kA)->uTicket, 3u);
}

TEST_F(CacheManagerTest, PutReplacesExistingEntry) {
  _cm.put("wiki.archlinux.org", kA, twoAddresses(300s), _clock.now() + 300s);
  _cm.put("wiki.archlinux.org", kA,
          {makeRecord("wiki.archlinux.org", kA, "10.0.0.1", 0, 300s, _clock.now())},
          _clock.now() + 300s);

  auto oHit = _cm.get("wiki.archlinux.org", kA);
  ASSERT_TRUE(oHit.has_value());
  EXPECT_EQ(payloads(oHit->vRecords), (std::vector<std::string>{"10.0.0.1"}));
}

TEST_F(CacheManagerTest, InvalidateRemovesOnlyThatKey) {
  _cm.put("a.test", kA, {makeRecord("a.test", kA, "10.0.0.1", 0, 300s, _clock.now())},
          _clock.now() + 300s);
  _cm.put("b.test", kA, {makeRecord("b.test", kA, "10.0.0.2", 0, 300s, _clock.now())},
          _clock.now() + 300s);

  _cm.invalidate("a.test", kA);
  _cm.invalidate("never-cached.test", kA);

  EXPECT_FALSE(_cm.get("a.test", kA).has_value());
  EXPECT_TRUE(_cm.get("b.test", kA).has_value());
}

TEST_F(CacheManagerTest, RemoveExpiredSweepsAllShards) {
  for (int i = 0; i < 20; ++i) {
    const std::string sDomain = "host" + std::to_string(i) + ".test";
    const auto durTtl = (i % 2 == 0) ? 30s : 600s;
    _cm.put(sDomain, kA, {makeRecord(sDomain, kA, "10.0.0.1", 0, durTtl, _clock.now())},
            _clock.now() + durTtl);
  }
  _clock.advance(30s);
  EXPECT_EQ(_cm.removeExpired(_clock.now()), 10u);
  EXPECT_EQ(_cm.stats().uEntries, 10u);
}

TEST_F(CacheManagerTest, ClearDropsEverything) {
  _cm.put("wiki.archlinux.org", kA, twoAddresses(300s), _clock.now() + 300s);
  _cm.clear();
  EXPECT_EQ(_cm.stats().uEntries, 0u);
}

TEST_F(CacheManagerTest, ConcurrentReadersAndWritersOnDistinctKeys) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 200;
  std::atomic<int> iHits{0};
  std::vector<std::thread> vThreads;

  for (int t = 0; t < kThreads; ++t) {
    vThreads.emplace_back([this, t, &iHits]() {
      for (int i = 0; i < kPerThread; ++i) {
        const std::string sDomain = "t" + std::to_string(t) + "-" + std::to_string(i) + ".test";
        _cm.put(sDomain, kA,
                {makeRecord(sDomain, kA, "10.0.0.1", 0, 300s, ManualClock::origin())},
                ManualClock::origin() + 300s);
        if (_cm.get(sDomain, kA)) iHits.fetch_add(1);
      }
    });
  }
  for (auto& th : vThreads) th.join();

  EXPECT_EQ(iHits.load(), kThreads * kPerThread);
  EXPECT_EQ(_cm.stats().uEntries, static_cast<std::size_t>(kThreads * kPerThread));
}
