#ifndef GPUINFO_GPU_QUERY_HPP
#define GPUINFO_GPU_QUERY_HPP
/**
 * @file GpuQuery.hpp
 * @brief Filter builder over a detected device list.
 * @note Filters are evaluated only when a terminal (collect/first/count/exists) runs.
 */

#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/GpuVendor.hpp"

#include <cstddef>  // std::size_t
#include <optional> // std::optional
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- GpuQuery ----------------------------- */

/**
 * @brief Chainable device filter.
 *
 * Range filters reject devices that do not report the metric at all.
 * Usage: manager.query().vendor(VendorId::nvidia()).minTemperature(70.0).collect()
 */
class GpuQuery {
public:
  /// @param devices Snapshot of the devices to filter (detection order).
  explicit GpuQuery(std::vector<DeviceRecord> devices);

  /// Keep devices of the same vendor family.
  GpuQuery& vendor(const VendorId& vendor);
  GpuQuery& minTemperature(double celsius);
  GpuQuery& maxTemperature(double celsius);
  GpuQuery& minUtilization(double percent);
  GpuQuery& maxUtilization(double percent);
  /// Keep devices reporting active == true.
  GpuQuery& activeOnly();
  /// Keep devices reporting a temperature.
  GpuQuery& withTemperature();
  /// Keep devices reporting power usage.
  GpuQuery& withPower();

  [[nodiscard]] std::vector<DeviceRecord> collect() const;
  [[nodiscard]] std::optional<DeviceRecord> first() const;
  [[nodiscard]] std::size_t count() const;
  [[nodiscard]] bool exists() const;

  /// @brief Evaluate every configured filter against one device.
  [[nodiscard]] bool matches(const DeviceRecord& record) const noexcept;

private:
  std::vector<DeviceRecord> devices_;

  std::optional<VendorId> vendor_;
  std::optional<double> minTemp_;
  std::optional<double> maxTemp_;
  std::optional<double> minUtil_;
  std::optional<double> maxUtil_;
  bool activeOnly_{false};
  bool withTemperature_{false};
  bool withPower_{false};
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_QUERY_HPP
