/**
 * @file GpuQuery.cpp
 * @brief Device filter evaluation.
 */

#include "src/gpu/inc/GpuQuery.hpp"

#include <utility> // std::move

namespace gpuinfo {

namespace gpu {

namespace {

/// Present and >= bound (or no bound set).
inline bool atLeast(const std::optional<double>& value, const std::optional<double>& bound) {
  return !bound || (value && *value >= *bound);
}

/// Present and <= bound (or no bound set).
inline bool atMost(const std::optional<double>& value, const std::optional<double>& bound) {
  return !bound || (value && *value <= *bound);
}

} // namespace

GpuQuery::GpuQuery(std::vector<DeviceRecord> devices) : devices_(std::move(devices)) {}

/* ----------------------------- Builders ----------------------------- */

GpuQuery& GpuQuery::vendor(const VendorId& vendor) {
  vendor_ = vendor;
  return *this;
}

GpuQuery& GpuQuery::minTemperature(double celsius) {
  minTemp_ = celsius;
  return *this;
}

GpuQuery& GpuQuery::maxTemperature(double celsius) {
  maxTemp_ = celsius;
  return *this;
}

GpuQuery& GpuQuery::minUtilization(double percent) {
  minUtil_ = percent;
  return *this;
}

GpuQuery& GpuQuery::maxUtilization(double percent) {
  maxUtil_ = percent;
  return *this;
}

GpuQuery& GpuQuery::activeOnly() {
  activeOnly_ = true;
  return *this;
}

GpuQuery& GpuQuery::withTemperature() {
  withTemperature_ = true;
  return *this;
}

GpuQuery& GpuQuery::withPower() {
  withPower_ = true;
  return *this;
}

/* ----------------------------- Terminals ----------------------------- */

bool GpuQuery::matches(const DeviceRecord& record) const noexcept {
  if (vendor_ && !sameFamily(record.vendor, *vendor_)) {
    return false;
  }
  if (!atLeast(record.temperatureC, minTemp_) || !atMost(record.temperatureC, maxTemp_)) {
    return false;
  }
  if (!atLeast(record.utilizationPercent, minUtil_) ||
      !atMost(record.utilizationPercent, maxUtil_)) {
    return false;
  }
  if (activeOnly_ && !record.active.value_or(false)) {
    return false;
  }
  if (withTemperature_ && !record.temperatureC) {
    return false;
  }
  if (withPower_ && !record.powerUsageW) {
    return false;
  }
  return true;
}

std::vector<DeviceRecord> GpuQuery::collect() const {
  std::vector<DeviceRecord> out;
  for (const auto& REC : devices_) {
    if (matches(REC)) {
      out.push_back(REC);
    }
  }
  return out;
}

std::optional<DeviceRecord> GpuQuery::first() const {
  for (const auto& REC : devices_) {
    if (matches(REC)) {
      return REC;
    }
  }
  return std::nullopt;
}

std::size_t GpuQuery::count() const {
  std::size_t n = 0;
  for (const auto& REC : devices_) {
    if (matches(REC)) {
      ++n;
    }
  }
  return n;
}

bool GpuQuery::exists() const { return first().has_value(); }

} // namespace gpu

} // namespace gpuinfo
