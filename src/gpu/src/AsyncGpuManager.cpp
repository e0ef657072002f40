/**
 * @file AsyncGpuManager.cpp
 * @brief Pool-backed async queries with an optional wait bound.
 */

#include "src/gpu/inc/AsyncGpuManager.hpp"

#include <memory>  // std::make_shared
#include <utility> // std::move
#include <vector>  // std::vector

#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

/* ----------------------------- PendingQuery ----------------------------- */

PendingQuery::PendingQuery(std::future<QueryResult> future,
                           std::optional<std::chrono::milliseconds> timeout)
    : future_(std::move(future)), timeout_(timeout) {}

QueryResult PendingQuery::get() {
  if (result_) {
    return *result_;
  }
  if (timeout_ && future_.wait_for(*timeout_) != std::future_status::ready) {
    spdlog::warn("async gpu query exceeded {}ms", timeout_->count());
    return QueryResult{std::make_shared<const DeviceRecord>(DeviceRecord::unknown()),
                       GpuStatus::TIMEOUT, false};
  }
  result_ = future_.get();
  return *result_;
}

bool PendingQuery::ready() const {
  return result_.has_value() ||
         future_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

void PendingQuery::wait() const {
  if (!result_) {
    future_.wait();
  }
}

/* ----------------------------- AsyncGpuManager ----------------------------- */

AsyncGpuManager::AsyncGpuManager(GpuManager& manager, WorkerPool& pool, AsyncOptions options)
    : manager_(manager), pool_(pool), options_(options) {
  if (options_.timeout && *options_.timeout > MAX_CONFIG_DURATION) {
    spdlog::warn("async timeout {}ms too large, clamped to {}ms", options_.timeout->count(),
                 MAX_CONFIG_DURATION.count());
    options_.timeout = MAX_CONFIG_DURATION;
  }
}

PendingQuery AsyncGpuManager::getAsync() {
  return PendingQuery(pool_.submit([mgr = &manager_] { return mgr->getPrimaryGpuCached(); }),
                      options_.timeout);
}

PendingQuery AsyncGpuManager::getGpuCachedAsync(std::size_t index) {
  return PendingQuery(pool_.submit([mgr = &manager_, index] { return mgr->getGpuCached(index); }),
                      options_.timeout);
}

PendingQuery AsyncGpuManager::refreshGpuAsync(std::size_t index) {
  return PendingQuery(pool_.submit([mgr = &manager_, index] { return mgr->refreshGpu(index); }),
                      options_.timeout);
}

std::future<std::vector<QueryResult>> AsyncGpuManager::getAllAsync() {
  return pool_.submit([mgr = &manager_] {
    std::vector<QueryResult> out;
    const std::size_t COUNT = mgr->gpuCount();
    out.reserve(COUNT);
    for (std::size_t i = 0; i < COUNT; ++i) {
      out.push_back(mgr->getGpuCached(i));
    }
    return out;
  });
}

PendingQuery AsyncGpuManager::refreshRecordAsync(DeviceRecord record) {
  return PendingQuery(pool_.submit([mgr = &manager_, rec = std::move(record)]() mutable {
                        const GpuStatus STATUS = mgr->refreshRecord(rec);
                        return QueryResult{std::make_shared<const DeviceRecord>(std::move(rec)),
                                           STATUS, false};
                      }),
                      options_.timeout);
}

std::future<std::size_t> AsyncGpuManager::detectAllAsync() {
  return pool_.submit([mgr = &manager_] { return mgr->detectAll(); });
}

} // namespace gpu

} // namespace gpuinfo
