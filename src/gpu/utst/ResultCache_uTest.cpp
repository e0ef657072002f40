/**
 * @file ResultCache_uTest.cpp
 * @brief Unit tests for gpuinfo::gpu::ResultCache.
 *
 * Notes:
 *  - Time is driven by ManualClock; no test sleeps.
 */

#include "src/gpu/inc/ResultCache.hpp"
#include "src/gpu/utst/GpuTestSupport.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using gpuinfo::gpu::CacheConfig;
using gpuinfo::gpu::CacheKey;
using gpuinfo::gpu::DEFAULT_CACHE_TTL;
using gpuinfo::gpu::DeviceRecord;
using gpuinfo::gpu::MAX_CACHE_TTL;
using gpuinfo::gpu::ResultCache;
using gpuinfo::gpu::VendorId;
using gpuinfo::gpu::test::makeRecord;
using gpuinfo::gpu::test::ManualClock;
using std::chrono::milliseconds;

/* ----------------------------- CacheKey Tests ----------------------------- */

/** @test Device and primary keys are distinct and printable. */
TEST(CacheKeyTest, Basics) {
  EXPECT_TRUE(CacheKey::primary().isPrimary());
  EXPECT_FALSE(CacheKey::device(0).isPrimary());
  EXPECT_FALSE(CacheKey::device(0) == CacheKey::primary());
  EXPECT_EQ(CacheKey::device(3).toString(), "gpu3");
  EXPECT_EQ(CacheKey::primary().toString(), "primary");
}

/** @test Default policy is 500 ms TTL with no bound. */
TEST(CacheConfigTest, Defaults) {
  const CacheConfig CFG{};
  EXPECT_EQ(CFG.ttl, DEFAULT_CACHE_TTL);
  EXPECT_EQ(CFG.ttl, milliseconds(500));
  EXPECT_FALSE(CFG.maxEntries.has_value());
}

/* ----------------------------- TTL Tests ----------------------------- */

class ResultCacheTest : public ::testing::Test {
protected:
  ManualClock clock_;
};

/** @test Fresh entries hit, expired entries miss and are removed. */
TEST_F(ResultCacheTest, TtlExpiry) {
  ResultCache cache(CacheConfig{milliseconds(100), std::nullopt}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A", 60.0));

  clock_.advance(milliseconds(99));
  auto hit = cache.get(CacheKey::device(0));
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(*hit->temperatureC, 60.0);

  clock_.advance(milliseconds(1));
  EXPECT_EQ(cache.get(CacheKey::device(0)), nullptr);
  EXPECT_FALSE(cache.contains(CacheKey::device(0)));
  EXPECT_EQ(cache.size(), 0U);
}

/** @test A zero TTL never serves a hit. */
TEST_F(ResultCacheTest, ZeroTtl) {
  ResultCache cache(CacheConfig{milliseconds(0), std::nullopt}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::amd(), "A"));
  EXPECT_EQ(cache.get(CacheKey::device(0)), nullptr);
}

/** @test An oversized TTL is clamped and still serves hits. */
TEST_F(ResultCacheTest, HugeTtlClamped) {
  ResultCache cache(CacheConfig{milliseconds(10'000'000'000'000), std::nullopt}, clock_.fn());
  EXPECT_EQ(cache.config().ttl, MAX_CACHE_TTL);

  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A", 60.0));
  ASSERT_NE(cache.get(CacheKey::device(0)), nullptr);

  clock_.advance(std::chrono::hours(24 * 365 * 100));
  EXPECT_NE(cache.get(CacheKey::device(0)), nullptr);

  ResultCache maxed(CacheConfig{milliseconds::max(), std::nullopt}, clock_.fn());
  EXPECT_EQ(maxed.config().ttl, MAX_CACHE_TTL);
  maxed.put(CacheKey::primary(), makeRecord(VendorId::nvidia(), "A"));
  EXPECT_NE(maxed.get(CacheKey::primary()), nullptr);
}

/** @test A negative TTL behaves as zero. */
TEST_F(ResultCacheTest, NegativeTtl) {
  ResultCache cache(CacheConfig{milliseconds(-5), std::nullopt}, clock_.fn());
  EXPECT_EQ(cache.config().ttl, milliseconds(0));
  cache.put(CacheKey::device(0), makeRecord(VendorId::amd(), "A"));
  EXPECT_EQ(cache.get(CacheKey::device(0)), nullptr);
}

/** @test put replaces an existing key and restarts its TTL. */
TEST_F(ResultCacheTest, ReplaceResetsAge) {
  ResultCache cache(CacheConfig{milliseconds(100), std::nullopt}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A", 60.0));
  clock_.advance(milliseconds(80));
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A", 70.0));
  clock_.advance(milliseconds(80));

  auto hit = cache.get(CacheKey::device(0));
  ASSERT_NE(hit, nullptr);
  EXPECT_EQ(*hit->temperatureC, 70.0);
  EXPECT_EQ(cache.size(), 1U);
}

/** @test Snapshots handed out stay valid after invalidation. */
TEST_F(ResultCacheTest, SnapshotOutlivesEntry) {
  ResultCache cache(CacheConfig{}, clock_.fn());
  auto stored = cache.put(CacheKey::primary(), makeRecord(VendorId::nvidia(), "A", 42.0));
  cache.invalidate(CacheKey::primary());
  ASSERT_NE(stored, nullptr);
  EXPECT_EQ(*stored->temperatureC, 42.0);
  EXPECT_EQ(cache.get(CacheKey::primary()), nullptr);
}

/* ----------------------------- LRU Tests ----------------------------- */

/** @test The bound is never exceeded and the least recently used entry goes first. */
TEST_F(ResultCacheTest, LruEviction) {
  ResultCache cache(CacheConfig{milliseconds(10'000), 2}, clock_.fn());

  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A"));
  clock_.advance(milliseconds(1));
  cache.put(CacheKey::device(1), makeRecord(VendorId::nvidia(), "B"));
  clock_.advance(milliseconds(1));
  ASSERT_NE(cache.get(CacheKey::device(0)), nullptr); // device 1 is now least recent

  clock_.advance(milliseconds(1));
  cache.put(CacheKey::device(2), makeRecord(VendorId::nvidia(), "C"));

  EXPECT_EQ(cache.size(), 2U);
  EXPECT_TRUE(cache.contains(CacheKey::device(0)));
  EXPECT_FALSE(cache.contains(CacheKey::device(1)));
  EXPECT_TRUE(cache.contains(CacheKey::device(2)));
}

/** @test Equal access times fall back to access count, then insertion order. */
TEST_F(ResultCacheTest, LruTieBreak) {
  ResultCache cache(CacheConfig{milliseconds(10'000), 2}, clock_.fn());

  // Same timestamp for both inserts and no hits: earliest insertion is evicted.
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A"));
  cache.put(CacheKey::device(1), makeRecord(VendorId::nvidia(), "B"));
  cache.put(CacheKey::device(2), makeRecord(VendorId::nvidia(), "C"));
  EXPECT_FALSE(cache.contains(CacheKey::device(0)));
  EXPECT_TRUE(cache.contains(CacheKey::device(1)));
  EXPECT_TRUE(cache.contains(CacheKey::device(2)));

  // Same access time, different counts: fewer hits is evicted.
  clock_.advance(milliseconds(5));
  ASSERT_NE(cache.get(CacheKey::device(1)), nullptr);
  ASSERT_NE(cache.get(CacheKey::device(1)), nullptr);
  ASSERT_NE(cache.get(CacheKey::device(2)), nullptr);
  cache.put(CacheKey::device(3), makeRecord(VendorId::nvidia(), "D"));
  EXPECT_TRUE(cache.contains(CacheKey::device(1)));
  EXPECT_FALSE(cache.contains(CacheKey::device(2)));
  EXPECT_TRUE(cache.contains(CacheKey::device(3)));
}

/** @test Replacing an existing key in a full cache does not evict. */
TEST_F(ResultCacheTest, ReplaceInFullCache) {
  ResultCache cache(CacheConfig{milliseconds(10'000), 2}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A"));
  cache.put(CacheKey::device(1), makeRecord(VendorId::nvidia(), "B"));
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A", 10.0));
  EXPECT_EQ(cache.size(), 2U);
  EXPECT_TRUE(cache.contains(CacheKey::device(1)));
}

/** @test maxEntries of zero stores nothing but still returns the snapshot. */
TEST_F(ResultCacheTest, ZeroCapacityDisables) {
  ResultCache cache(CacheConfig{milliseconds(10'000), 0}, clock_.fn());
  auto stored = cache.put(CacheKey::device(0), makeRecord(VendorId::amd(), "A", 33.0));
  ASSERT_NE(stored, nullptr);
  EXPECT_EQ(*stored->temperatureC, 33.0);
  EXPECT_EQ(cache.size(), 0U);
  EXPECT_EQ(cache.get(CacheKey::device(0)), nullptr);
}

/* ----------------------------- Stats Tests ----------------------------- */

/** @test Empty cache stats. */
TEST_F(ResultCacheTest, EmptyStats) {
  ResultCache cache(CacheConfig{}, clock_.fn());
  const auto STATS = cache.stats();
  EXPECT_EQ(STATS.totalEntries, 0U);
  EXPECT_EQ(STATS.totalAccesses, 0U);
  EXPECT_FALSE(STATS.oldestEntryAge.has_value());
  EXPECT_NE(STATS.toJson().find("\"oldestEntryAgeMs\":null"), std::string::npos);
}

/** @test Stats count hits and report the oldest entry age. */
TEST_F(ResultCacheTest, StatsAccounting) {
  ResultCache cache(CacheConfig{milliseconds(10'000), std::nullopt}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A"));
  clock_.advance(milliseconds(30));
  cache.put(CacheKey::device(1), makeRecord(VendorId::nvidia(), "B"));
  clock_.advance(milliseconds(20));

  ASSERT_NE(cache.get(CacheKey::device(0)), nullptr);
  ASSERT_NE(cache.get(CacheKey::device(0)), nullptr);
  ASSERT_NE(cache.get(CacheKey::device(1)), nullptr);
  EXPECT_EQ(cache.get(CacheKey::device(7)), nullptr);

  const auto STATS = cache.stats();
  EXPECT_EQ(STATS.totalEntries, 2U);
  EXPECT_EQ(STATS.totalAccesses, 3U);
  ASSERT_TRUE(STATS.oldestEntryAge.has_value());
  EXPECT_EQ(*STATS.oldestEntryAge, milliseconds(50));
  EXPECT_NE(STATS.toString().find("entries=2"), std::string::npos);
}

/** @test clear empties the cache. */
TEST_F(ResultCacheTest, Clear) {
  ResultCache cache(CacheConfig{}, clock_.fn());
  cache.put(CacheKey::device(0), makeRecord(VendorId::nvidia(), "A"));
  cache.put(CacheKey::primary(), makeRecord(VendorId::nvidia(), "A"));
  cache.clear();
  EXPECT_EQ(cache.size(), 0U);
  EXPECT_EQ(cache.stats().totalEntries, 0U);
}

/* ----------------------------- Concurrency Tests ----------------------------- */

/** @test Readers racing writers on one key see a whole snapshot, old or new. */
TEST(ResultCacheConcurrencyTest, ReadersSeeWholeEntries) {
  ResultCache cache(CacheConfig{milliseconds(10'000), std::nullopt});
  const CacheKey KEY = CacheKey::device(0);

  auto record = [](int generation) {
    DeviceRecord rec = makeRecord(VendorId::nvidia(), "A", static_cast<double>(generation));
    rec.utilizationPercent = static_cast<double>(generation);
    rec.powerUsageW = static_cast<double>(generation);
    rec.coreClockMHz = static_cast<std::uint32_t>(generation);
    return rec;
  };
  cache.put(KEY, record(0));

  std::atomic<bool> stop{false};
  std::atomic<int> torn{0};
  std::atomic<int> hits{0};
  std::vector<std::thread> readers;
  for (int r = 0; r < 4; ++r) {
    readers.emplace_back([&] {
      while (!stop.load()) {
        const auto SNAP = cache.get(KEY);
        if (!SNAP) {
          continue;
        }
        ++hits;
        const double GEN = *SNAP->temperatureC;
        if (*SNAP->utilizationPercent != GEN || *SNAP->powerUsageW != GEN ||
            static_cast<double>(*SNAP->coreClockMHz) != GEN) {
          ++torn;
        }
      }
    });
  }

  std::vector<std::thread> writers;
  for (int w = 0; w < 2; ++w) {
    writers.emplace_back([&, w] {
      for (int i = 1; i <= 2000; ++i) {
        cache.put(KEY, record(i * 2 + w));
        if (i % 100 == 0) {
          cache.invalidate(KEY);
        }
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }
  stop = true;
  for (auto& t : readers) {
    t.join();
  }

  EXPECT_EQ(torn.load(), 0);
  EXPECT_GT(hits.load(), 0);
  EXPECT_LE(cache.size(), 1U);
}
