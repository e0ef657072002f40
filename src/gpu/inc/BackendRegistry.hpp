#ifndef GPUINFO_GPU_BACKEND_REGISTRY_HPP
#define GPUINFO_GPU_BACKEND_REGISTRY_HPP
/**
 * @file BackendRegistry.hpp
 * @brief Ordered backend registry with per-vendor fallback.
 * @note Thread-safe: Registration and dispatch may run concurrently. Backend
 *       calls are made outside the registry lock.
 */

#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/GpuBackend.hpp"
#include "src/gpu/inc/GpuStatus.hpp"
#include "src/gpu/inc/GpuVendor.hpp"

#include <cstddef> // std::size_t
#include <memory>  // std::shared_ptr
#include <mutex>   // std::mutex
#include <string>  // std::string
#include <vector>  // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- BackendRegistry ----------------------------- */

/**
 * @brief Holds backends in global registration order.
 *
 * Several backends may serve one vendor; refresh() tries them in the order
 * they were registered and stops at the first success.
 */
class BackendRegistry {
public:
  BackendRegistry() = default;

  BackendRegistry(const BackendRegistry&) = delete;
  BackendRegistry& operator=(const BackendRegistry&) = delete;

  /**
   * @brief Append a backend for a vendor. Never replaces existing entries.
   * @return OK, or INVALID_ARGUMENT for a null backend.
   */
  GpuStatus registerBackend(const VendorId& vendor, std::shared_ptr<GpuBackend> backend);

  /**
   * @brief Run every backend's detect() once, in registration order.
   * @return Concatenated records from successful backends. Failures are
   *         logged and contribute nothing.
   */
  [[nodiscard]] std::vector<DeviceRecord> detectAll() const;

  /**
   * @brief Refresh a record through the backends of its vendor family.
   * @param record Replaced by the first successful backend; untouched otherwise.
   * @return OK, NO_BACKEND when the family has no backend, or
   *         DETECTION_FAILED when every candidate failed.
   */
  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) const;

  /// @brief Distinct vendors with at least one backend, in first-registration order.
  [[nodiscard]] std::vector<VendorId> registeredVendors() const;

  /// @brief True if any backend serves the vendor's family.
  [[nodiscard]] bool isVendorSupported(const VendorId& vendor) const;

  /// @brief Total registered backends.
  [[nodiscard]] std::size_t backendCount() const;

  /// @brief Names of the backends serving the vendor's family, in dispatch order.
  [[nodiscard]] std::vector<std::string> backendNames(const VendorId& vendor) const;

private:
  struct Entry {
    VendorId vendor;
    std::shared_ptr<GpuBackend> backend;
  };

  /// Copy of the entries matching a family (or all when vendor is null).
  [[nodiscard]] std::vector<Entry> snapshot(const VendorId* vendor) const;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_BACKEND_REGISTRY_HPP
