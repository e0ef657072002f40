/**
 * @file DeviceRecord.cpp
 * @brief DeviceRecord validation and formatting.
 */

#include "src/gpu/inc/DeviceRecord.hpp"

#include "src/helpers/inc/Format.hpp"

#include <functional> // std::hash

#include <fmt/core.h>

namespace gpuinfo {

namespace gpu {

using gpuinfo::helpers::format::bytesOrNa;
using gpuinfo::helpers::format::jsonValue;
using gpuinfo::helpers::format::orNa;

/* ----------------------------- DeviceRecord ----------------------------- */

bool DeviceRecord::isUnknown() const noexcept { return sameSnapshot(*this, DeviceRecord{}); }

bool DeviceRecord::isValid() const noexcept {
  if (!vendor.isKnown() && !name) {
    return false;
  }
  if (temperatureC &&
      (*temperatureC < MIN_PLAUSIBLE_TEMP_C || *temperatureC > MAX_PLAUSIBLE_TEMP_C)) {
    return false;
  }
  if (utilizationPercent && (*utilizationPercent < 0.0 || *utilizationPercent > 100.0)) {
    return false;
  }
  if ((powerUsageW && *powerUsageW < 0.0) || (powerLimitW && *powerLimitW < 0.0)) {
    return false;
  }
  if (memoryUsedBytes && memoryTotalBytes && *memoryUsedBytes > *memoryTotalBytes) {
    return false;
  }
  return true;
}

std::optional<double> DeviceRecord::memoryUtilizationPercent() const noexcept {
  if (!memoryUsedBytes || !memoryTotalBytes || *memoryTotalBytes == 0) {
    return std::nullopt;
  }
  return static_cast<double>(*memoryUsedBytes) * 100.0 / static_cast<double>(*memoryTotalBytes);
}

std::string DeviceRecord::toString() const {
  return fmt::format("[{}] {} (driver {}) - temp {}, util {}, core {}, mem {}, power {} / {}, "
                     "vram {} / {}, active {}",
                     vendor.displayName(), name.value_or(gpuinfo::helpers::format::NOT_AVAILABLE),
                     driverVersion.value_or(gpuinfo::helpers::format::NOT_AVAILABLE),
                     orNa(temperatureC, "{:.1f}", "C"), orNa(utilizationPercent, "{:.1f}", "%"),
                     orNa(coreClockMHz, "{}", "MHz"), orNa(memoryClockMHz, "{}", "MHz"),
                     orNa(powerUsageW, "{:.1f}", "W"), orNa(powerLimitW, "{:.1f}", "W"),
                     bytesOrNa(memoryUsedBytes), bytesOrNa(memoryTotalBytes),
                     active ? (*active ? "yes" : "no") : gpuinfo::helpers::format::NOT_AVAILABLE);
}

std::string DeviceRecord::toJson() const {
  std::string out = "{";
  out += fmt::format("\"vendor\":\"{}\",", gpuinfo::gpu::toString(vendor.vendor));
  out += fmt::format("\"intelKind\":{},",
                     vendor.vendor == GpuVendor::Intel
                         ? fmt::format("\"{}\"", gpuinfo::gpu::toString(vendor.intel))
                         : std::string("null"));
  out += fmt::format("\"name\":{},", jsonValue(name));
  out += fmt::format("\"driverVersion\":{},", jsonValue(driverVersion));
  out += fmt::format("\"temperatureC\":{},", jsonValue(temperatureC));
  out += fmt::format("\"utilizationPercent\":{},", jsonValue(utilizationPercent));
  out += fmt::format("\"coreClockMHz\":{},", jsonValue(coreClockMHz));
  out += fmt::format("\"memoryClockMHz\":{},", jsonValue(memoryClockMHz));
  out += fmt::format("\"maxClockMHz\":{},", jsonValue(maxClockMHz));
  out += fmt::format("\"powerUsageW\":{},", jsonValue(powerUsageW));
  out += fmt::format("\"powerLimitW\":{},", jsonValue(powerLimitW));
  out += fmt::format("\"memoryUsedBytes\":{},", jsonValue(memoryUsedBytes));
  out += fmt::format("\"memoryTotalBytes\":{},", jsonValue(memoryTotalBytes));
  out += fmt::format("\"active\":{}", jsonValue(active));
  out += "}";
  return out;
}

/* ----------------------------- Free Functions ----------------------------- */

bool sameSnapshot(const DeviceRecord& a, const DeviceRecord& b) noexcept {
  return a.vendor == b.vendor && a.name == b.name && a.driverVersion == b.driverVersion &&
         a.temperatureC == b.temperatureC && a.utilizationPercent == b.utilizationPercent &&
         a.coreClockMHz == b.coreClockMHz && a.memoryClockMHz == b.memoryClockMHz &&
         a.maxClockMHz == b.maxClockMHz && a.powerUsageW == b.powerUsageW &&
         a.powerLimitW == b.powerLimitW && a.memoryUsedBytes == b.memoryUsedBytes &&
         a.memoryTotalBytes == b.memoryTotalBytes && a.active == b.active;
}

std::size_t DeviceIdentityHash::operator()(const DeviceRecord& record) const noexcept {
  std::size_t seed = hashValue(record.vendor);
  const std::size_t NAME_HASH = record.name ? std::hash<std::string>{}(*record.name) : 0;
  seed ^= NAME_HASH + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
  return seed;
}

} // namespace gpu

} // namespace gpuinfo
