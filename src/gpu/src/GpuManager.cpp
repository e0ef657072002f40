/**
 * @file GpuManager.cpp
 * @brief Cache-first dispatch to the backend registry.
 */

#include "src/gpu/inc/GpuManager.hpp"

#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

/* ----------------------------- GpuStatistics ----------------------------- */

std::optional<double> GpuStatistics::averageTemperatureC() const noexcept {
  if (temperatureReadings == 0) {
    return std::nullopt;
  }
  return totalTemperatureC / static_cast<double>(temperatureReadings);
}

std::optional<double> GpuStatistics::totalPowerConsumptionW() const noexcept {
  if (powerReadings == 0) {
    return std::nullopt;
  }
  return totalPowerW;
}

std::string GpuStatistics::toString() const {
  const auto AVG = averageTemperatureC();
  const auto POWER = totalPowerConsumptionW();
  return fmt::format("{} GPU(s) (NVIDIA {}, AMD {}, Intel {}, unknown {}), active {}, "
                     "avg temp {}, total power {}",
                     totalGpus, nvidiaCount, amdCount, intelCount, unknownCount, activeCount,
                     AVG ? fmt::format("{:.1f} C", *AVG) : std::string("N/A"),
                     POWER ? fmt::format("{:.1f} W", *POWER) : std::string("N/A"));
}

/* ----------------------------- Construction ----------------------------- */

GpuManager::GpuManager(std::shared_ptr<BackendRegistry> registry, CacheConfig cacheConfig,
                       ResultCache::ClockFn clock)
    : registry_(registry ? std::move(registry) : std::make_shared<BackendRegistry>()),
      cache_(cacheConfig, std::move(clock)) {}

GpuManager GpuManager::withCacheConfig(std::shared_ptr<BackendRegistry> registry,
                                       std::chrono::milliseconds ttl,
                                       std::optional<std::size_t> maxEntries) {
  return GpuManager(std::move(registry), CacheConfig{ttl, maxEntries});
}

/* ----------------------------- Detection ----------------------------- */

void GpuManager::ensureDetected() {
  if (store_.initialized()) {
    return;
  }
  std::lock_guard<std::mutex> lock(detectMutex_);
  if (store_.initialized()) {
    return;
  }
  store_.replace(registry_->detectAll());
}

std::size_t GpuManager::detectAll() {
  std::lock_guard<std::mutex> lock(detectMutex_);
  auto devices = registry_->detectAll();

  std::lock_guard<std::mutex> publish(publishMutex_);
  store_.replace(std::move(devices));
  cache_.clear();
  return store_.size();
}

/* ----------------------------- Cached Queries ----------------------------- */

QueryResult GpuManager::refreshInto(const CacheKey& key, std::optional<StoredRecord> current) {
  if (!current) {
    return QueryResult{nullptr, GpuStatus::NOT_FOUND, false};
  }

  DeviceRecord updated = current->record;
  const GpuStatus STATUS = registry_->refresh(updated);
  if (STATUS != GpuStatus::OK) {
    spdlog::warn("refresh of gpu{} failed ({}), returning last known record", current->index,
                 toString(STATUS));
    return QueryResult{std::make_shared<const DeviceRecord>(std::move(current->record)), STATUS,
                       false};
  }

  std::lock_guard<std::mutex> publish(publishMutex_);
  if (!store_.update(*current, updated)) {
    spdlog::debug("gpu{} replaced during refresh, result not cached", current->index);
    return QueryResult{std::make_shared<const DeviceRecord>(std::move(updated)), GpuStatus::OK,
                       false};
  }
  return QueryResult{cache_.put(key, std::move(updated)), GpuStatus::OK, false};
}

QueryResult GpuManager::getGpuCached(std::size_t index) {
  ensureDetected();

  const CacheKey KEY = CacheKey::device(index);
  if (auto hit = cache_.get(KEY)) {
    spdlog::debug("cache hit for {}", KEY.toString());
    return QueryResult{std::move(hit), GpuStatus::OK, true};
  }
  spdlog::debug("cache miss for {}", KEY.toString());
  return refreshInto(KEY, store_.stored(index));
}

QueryResult GpuManager::getPrimaryGpuCached() {
  ensureDetected();

  const CacheKey KEY = CacheKey::primary();
  if (auto hit = cache_.get(KEY)) {
    spdlog::debug("cache hit for {}", KEY.toString());
    return QueryResult{std::move(hit), GpuStatus::OK, true};
  }

  auto current = store_.storedPrimary();
  if (!current) {
    return QueryResult{std::make_shared<const DeviceRecord>(DeviceRecord::unknown()),
                       GpuStatus::OK, false};
  }
  spdlog::debug("cache miss for {}", KEY.toString());
  return refreshInto(KEY, std::move(current));
}

std::shared_ptr<const DeviceRecord> GpuManager::get() {
  auto result = getPrimaryGpuCached();
  if (!result.snapshot) {
    return std::make_shared<const DeviceRecord>(DeviceRecord::unknown());
  }
  return std::move(result.snapshot);
}

CacheStats GpuManager::getCacheStats() const { return cache_.stats(); }

/* ----------------------------- Explicit Refresh ----------------------------- */

QueryResult GpuManager::refreshGpu(std::size_t index) {
  ensureDetected();

  const CacheKey KEY = CacheKey::device(index);
  cache_.invalidate(KEY);
  if (index == store_.primaryIndex()) {
    cache_.invalidate(CacheKey::primary());
  }
  return refreshInto(KEY, store_.stored(index));
}

QueryResult GpuManager::refreshPrimaryGpu() {
  ensureDetected();

  auto current = store_.storedPrimary();
  if (!current) {
    return QueryResult{nullptr, GpuStatus::NOT_FOUND, false};
  }
  const CacheKey KEY = CacheKey::device(current->index);
  cache_.invalidate(KEY);
  cache_.invalidate(CacheKey::primary());
  return refreshInto(KEY, std::move(current));
}

GpuStatus GpuManager::refreshRecord(DeviceRecord& record) { return registry_->refresh(record); }

GpuStatus GpuManager::refreshAll() {
  ensureDetected();

  GpuStatus first = GpuStatus::OK;
  const std::size_t COUNT = store_.size();
  for (std::size_t i = 0; i < COUNT; ++i) {
    auto current = store_.get(i);
    if (!current) {
      break;
    }
    const GpuStatus STATUS = registry_->refresh(*current);
    if (STATUS != GpuStatus::OK) {
      spdlog::error("failed to refresh gpu{}: {}", i, toString(STATUS));
      if (first == GpuStatus::OK) {
        first = STATUS;
      }
      continue;
    }
    if (!store_.update(i, *current)) {
      spdlog::debug("gpu{} changed during refresh, store not updated", i);
    }
  }

  cache_.clear();
  return first;
}

/* ----------------------------- Collection View ----------------------------- */

std::size_t GpuManager::gpuCount() {
  ensureDetected();
  return store_.size();
}

std::vector<DeviceRecord> GpuManager::allGpus() {
  ensureDetected();
  return store_.collection().devices;
}

std::optional<DeviceRecord> GpuManager::gpuByIndex(std::size_t index) {
  ensureDetected();
  return store_.get(index);
}

std::vector<DeviceRecord> GpuManager::gpusByVendor(const VendorId& vendor) {
  std::vector<DeviceRecord> out;
  for (auto& rec : allGpus()) {
    if (sameFamily(rec.vendor, vendor)) {
      out.push_back(std::move(rec));
    }
  }
  return out;
}

std::size_t GpuManager::primaryIndex() {
  ensureDetected();
  return store_.primaryIndex();
}

GpuStatus GpuManager::setPrimaryGpu(std::size_t index) {
  ensureDetected();
  GpuStatus status = GpuStatus::OK;
  {
    std::lock_guard<std::mutex> publish(publishMutex_);
    status = store_.setPrimary(index);
    if (status == GpuStatus::OK) {
      cache_.invalidate(CacheKey::primary());
    }
  }
  if (status != GpuStatus::OK) {
    spdlog::warn("cannot select gpu{} as primary: {}", index, toString(status));
    return status;
  }
  spdlog::info("primary gpu set to gpu{}", index);
  return GpuStatus::OK;
}

GpuStatistics GpuManager::statistics() {
  GpuStatistics stats{};
  for (const auto& REC : allGpus()) {
    ++stats.totalGpus;
    switch (REC.vendor.vendor) {
    case GpuVendor::Nvidia:
      ++stats.nvidiaCount;
      break;
    case GpuVendor::Amd:
      ++stats.amdCount;
      break;
    case GpuVendor::Intel:
      ++stats.intelCount;
      break;
    default:
      ++stats.unknownCount;
      break;
    }
    if (REC.active.value_or(false)) {
      ++stats.activeCount;
    }
    if (REC.temperatureC) {
      stats.totalTemperatureC += *REC.temperatureC;
      ++stats.temperatureReadings;
    }
    if (REC.powerUsageW) {
      stats.totalPowerW += *REC.powerUsageW;
      ++stats.powerReadings;
    }
  }
  return stats;
}

std::vector<std::size_t> GpuManager::activeGpuIndices() {
  std::vector<std::size_t> out;
  const auto DEVICES = allGpus();
  for (std::size_t i = 0; i < DEVICES.size(); ++i) {
    if (DEVICES[i].active.value_or(false)) {
      out.push_back(i);
    }
  }
  return out;
}

bool GpuManager::allGpusActive() {
  const auto DEVICES = allGpus();
  if (DEVICES.empty()) {
    return false;
  }
  for (const auto& REC : DEVICES) {
    if (!REC.active.value_or(false)) {
      return false;
    }
  }
  return true;
}

GpuQuery GpuManager::query() { return GpuQuery(allGpus()); }

} // namespace gpu

} // namespace gpuinfo
