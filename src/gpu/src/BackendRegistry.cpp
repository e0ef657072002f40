/**
 * @file BackendRegistry.cpp
 * @brief Backend registration and fallback dispatch.
 */

#include "src/gpu/inc/BackendRegistry.hpp"

#include <exception> // std::exception
#include <utility>   // std::move

#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

namespace {

/// Run one backend's detect(), converting escaped exceptions to a status.
GpuStatus guardedDetect(GpuBackend& backend, std::vector<DeviceRecord>& out) {
  try {
    return backend.detect(out);
  } catch (const std::exception& ex) {
    spdlog::error("gpu backend '{}' threw during detect: {}", backend.name(), ex.what());
    return GpuStatus::DETECTION_FAILED;
  }
}

/// Run one backend's refresh(), converting escaped exceptions to a status.
GpuStatus guardedRefresh(GpuBackend& backend, DeviceRecord& record) {
  try {
    return backend.refresh(record);
  } catch (const std::exception& ex) {
    spdlog::error("gpu backend '{}' threw during refresh: {}", backend.name(), ex.what());
    return GpuStatus::DETECTION_FAILED;
  }
}

} // namespace

/* ----------------------------- Registration ----------------------------- */

GpuStatus BackendRegistry::registerBackend(const VendorId& vendor,
                                           std::shared_ptr<GpuBackend> backend) {
  if (!backend) {
    spdlog::warn("rejected null gpu backend for vendor {}", vendor.displayName());
    return GpuStatus::INVALID_ARGUMENT;
  }

  const char* NAME = backend->name();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(Entry{vendor, std::move(backend)});
  }
  spdlog::debug("registered gpu backend '{}' for {}", NAME, vendor.displayName());
  return GpuStatus::OK;
}

std::vector<BackendRegistry::Entry> BackendRegistry::snapshot(const VendorId* vendor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (vendor == nullptr) {
    return entries_;
  }
  std::vector<Entry> out;
  for (const auto& ENTRY : entries_) {
    if (sameFamily(ENTRY.vendor, *vendor)) {
      out.push_back(ENTRY);
    }
  }
  return out;
}

/* ----------------------------- Dispatch ----------------------------- */

std::vector<DeviceRecord> BackendRegistry::detectAll() const {
  std::vector<DeviceRecord> result;

  for (const auto& ENTRY : snapshot(nullptr)) {
    std::vector<DeviceRecord> found;
    const GpuStatus STATUS = guardedDetect(*ENTRY.backend, found);
    if (STATUS != GpuStatus::OK) {
      spdlog::warn("gpu backend '{}' ({}) detection failed: {}", ENTRY.backend->name(),
                   ENTRY.vendor.displayName(), toString(STATUS));
      continue;
    }
    spdlog::debug("gpu backend '{}' detected {} device(s)", ENTRY.backend->name(), found.size());
    for (auto& rec : found) {
      result.push_back(std::move(rec));
    }
  }

  spdlog::info("gpu detection found {} device(s)", result.size());
  return result;
}

GpuStatus BackendRegistry::refresh(DeviceRecord& record) const {
  const auto CANDIDATES = snapshot(&record.vendor);
  if (CANDIDATES.empty()) {
    spdlog::debug("no gpu backend registered for {}", record.vendor.displayName());
    return GpuStatus::NO_BACKEND;
  }

  for (const auto& ENTRY : CANDIDATES) {
    DeviceRecord attempt = record;
    const GpuStatus STATUS = guardedRefresh(*ENTRY.backend, attempt);
    if (STATUS == GpuStatus::OK) {
      record = std::move(attempt);
      return GpuStatus::OK;
    }
    spdlog::warn("gpu backend '{}' failed to refresh '{}': {}", ENTRY.backend->name(),
                 record.name.value_or("?"), toString(STATUS));
  }

  spdlog::error("all {} backend(s) for {} failed to refresh '{}'", CANDIDATES.size(),
                record.vendor.displayName(), record.name.value_or("?"));
  return GpuStatus::DETECTION_FAILED;
}

/* ----------------------------- Introspection ----------------------------- */

std::vector<VendorId> BackendRegistry::registeredVendors() const {
  std::vector<VendorId> vendors;
  for (const auto& ENTRY : snapshot(nullptr)) {
    bool seen = false;
    for (const auto& V : vendors) {
      if (V == ENTRY.vendor) {
        seen = true;
        break;
      }
    }
    if (!seen) {
      vendors.push_back(ENTRY.vendor);
    }
  }
  return vendors;
}

bool BackendRegistry::isVendorSupported(const VendorId& vendor) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& ENTRY : entries_) {
    if (sameFamily(ENTRY.vendor, vendor)) {
      return true;
    }
  }
  return false;
}

std::size_t BackendRegistry::backendCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

std::vector<std::string> BackendRegistry::backendNames(const VendorId& vendor) const {
  std::vector<std::string> names;
  for (const auto& ENTRY : snapshot(&vendor)) {
    names.emplace_back(ENTRY.backend->name());
  }
  return names;
}

} // namespace gpu

} // namespace gpuinfo
