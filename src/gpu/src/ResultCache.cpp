/**
 * @file ResultCache.cpp
 * @brief TTL + LRU snapshot cache.
 */

#include "src/gpu/inc/ResultCache.hpp"

#include <mutex>   // std::unique_lock
#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

using std::chrono::duration_cast;
using std::chrono::milliseconds;

/* ----------------------------- CacheKey ----------------------------- */

std::string CacheKey::toString() const {
  return isPrimary() ? std::string("primary") : fmt::format("gpu{}", value);
}

/* ----------------------------- CacheStats ----------------------------- */

std::string CacheStats::toString() const {
  return fmt::format("entries={} accesses={} oldest={}", totalEntries, totalAccesses,
                     oldestEntryAge ? fmt::format("{}ms", oldestEntryAge->count())
                                    : std::string("N/A"));
}

std::string CacheStats::toJson() const {
  return fmt::format("{{\"totalEntries\":{},\"totalAccesses\":{},\"oldestEntryAgeMs\":{}}}",
                     totalEntries, totalAccesses,
                     oldestEntryAge ? fmt::format("{}", oldestEntryAge->count())
                                    : std::string("null"));
}

/* ----------------------------- CacheEntry ----------------------------- */

CacheEntry::CacheEntry(std::shared_ptr<const DeviceRecord> snapshot, Clock::time_point createdAt,
                       std::uint64_t sequence) noexcept
    : snapshot_(std::move(snapshot)), createdAt_(createdAt), sequence_(sequence),
      lastAccessedTicks_(createdAt.time_since_epoch().count()) {}

CacheEntry::Clock::time_point CacheEntry::lastAccessedAt() const noexcept {
  return Clock::time_point(Clock::duration(lastAccessedTicks_.load(std::memory_order_relaxed)));
}

std::uint64_t CacheEntry::accessCount() const noexcept {
  return accessCount_.load(std::memory_order_relaxed);
}

void CacheEntry::touch(Clock::time_point now) const noexcept {
  lastAccessedTicks_.store(now.time_since_epoch().count(), std::memory_order_relaxed);
  accessCount_.fetch_add(1, std::memory_order_relaxed);
}

/* ----------------------------- ResultCache ----------------------------- */

namespace {

/// TTL within [0, MAX_CACHE_TTL] so freshness checks cannot overflow.
CacheConfig boundedConfig(CacheConfig config) {
  if (config.ttl > MAX_CACHE_TTL) {
    spdlog::warn("cache ttl {}ms too large, clamped to {}ms", config.ttl.count(),
                 MAX_CACHE_TTL.count());
    config.ttl = MAX_CACHE_TTL;
  } else if (config.ttl < milliseconds::zero()) {
    spdlog::warn("negative cache ttl {}ms treated as 0", config.ttl.count());
    config.ttl = milliseconds::zero();
  }
  return config;
}

} // namespace

ResultCache::ResultCache(CacheConfig config, ClockFn clock)
    : config_(boundedConfig(config)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })) {}

std::shared_ptr<const DeviceRecord> ResultCache::get(const CacheKey& key) const {
  const auto NOW = clock_();
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto IT = entries_.find(key);
    if (IT == entries_.end()) {
      return nullptr;
    }
    if (IT->second->isFresh(NOW, config_.ttl)) {
      IT->second->touch(NOW);
      return IT->second->snapshot();
    }
  }

  // Expired: drop it unless a writer already replaced it with a fresh entry.
  std::unique_lock<std::shared_mutex> lock(mutex_);
  const auto IT = entries_.find(key);
  if (IT != entries_.end() && !IT->second->isFresh(NOW, config_.ttl)) {
    entries_.erase(IT);
    spdlog::debug("cache entry {} expired", key.toString());
  }
  return nullptr;
}

std::shared_ptr<const DeviceRecord> ResultCache::put(const CacheKey& key, DeviceRecord record) {
  auto snapshot = std::make_shared<const DeviceRecord>(std::move(record));
  if (config_.maxEntries && *config_.maxEntries == 0) {
    return snapshot;
  }

  const auto NOW = clock_();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto entry = std::make_shared<const CacheEntry>(snapshot, NOW, nextSequence_++);

  const auto IT = entries_.find(key);
  if (IT != entries_.end()) {
    IT->second = std::move(entry);
    return snapshot;
  }

  if (config_.maxEntries) {
    while (entries_.size() >= *config_.maxEntries) {
      evictOneLocked();
    }
  }
  entries_.emplace(key, std::move(entry));
  return snapshot;
}

void ResultCache::evictOneLocked() {
  auto victim = entries_.end();
  for (auto it = entries_.begin(); it != entries_.end(); ++it) {
    if (victim == entries_.end()) {
      victim = it;
      continue;
    }
    const CacheEntry& CAND = *it->second;
    const CacheEntry& BEST = *victim->second;
    const auto CAND_AT = CAND.lastAccessedAt();
    const auto BEST_AT = BEST.lastAccessedAt();
    if (CAND_AT != BEST_AT) {
      if (CAND_AT < BEST_AT) {
        victim = it;
      }
      continue;
    }
    if (CAND.accessCount() != BEST.accessCount()) {
      if (CAND.accessCount() < BEST.accessCount()) {
        victim = it;
      }
      continue;
    }
    if (CAND.sequence() < BEST.sequence()) {
      victim = it;
    }
  }

  if (victim != entries_.end()) {
    spdlog::debug("cache evicting {} (accesses={})", victim->first.toString(),
                  victim->second->accessCount());
    entries_.erase(victim);
  }
}

void ResultCache::invalidate(const CacheKey& key) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.erase(key);
}

void ResultCache::clear() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.clear();
}

CacheStats ResultCache::stats() const {
  const auto NOW = clock_();
  CacheStats stats{};

  std::shared_lock<std::shared_mutex> lock(mutex_);
  stats.totalEntries = entries_.size();
  for (const auto& KV : entries_) {
    stats.totalAccesses += KV.second->accessCount();
    const auto AGE = duration_cast<milliseconds>(NOW - KV.second->createdAt());
    if (!stats.oldestEntryAge || AGE > *stats.oldestEntryAge) {
      stats.oldestEntryAge = AGE;
    }
  }
  return stats;
}

std::size_t ResultCache::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

bool ResultCache::contains(const CacheKey& key) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.count(key) != 0;
}

} // namespace gpu

} // namespace gpuinfo
