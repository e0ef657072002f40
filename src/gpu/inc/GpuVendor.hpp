#ifndef GPUINFO_GPU_VENDOR_HPP
#define GPUINFO_GPU_VENDOR_HPP
/**
 * @file GpuVendor.hpp
 * @brief GPU vendor identity: closed vendor tag plus Intel subkind.
 * @note Thread-safe: Value types and pure functions only.
 */

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint32_t
#include <string_view> // std::string_view

namespace gpuinfo {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// PCI vendor IDs.
inline constexpr std::uint32_t PCI_VENDOR_NVIDIA = 0x10de;
inline constexpr std::uint32_t PCI_VENDOR_AMD = 0x1002;
inline constexpr std::uint32_t PCI_VENDOR_INTEL = 0x8086;

/* ----------------------------- GpuVendor ----------------------------- */

/**
 * @brief GPU vendor enumeration.
 */
enum class GpuVendor : int { Unknown = 0, Nvidia = 1, Amd = 2, Intel = 3 };

/**
 * @brief Intel GPU subkind. Only meaningful when the vendor is Intel.
 */
enum class IntelKind : int { Unknown = 0, Integrated = 1, Discrete = 2 };

/// Convert vendor enum to string ("NVIDIA", "AMD", "Intel", "Unknown").
[[nodiscard]] const char* toString(GpuVendor vendor) noexcept;

/// Convert Intel subkind to string.
[[nodiscard]] const char* toString(IntelKind kind) noexcept;

/* ----------------------------- VendorId ----------------------------- */

/**
 * @brief Full vendor identity used for dispatch and device identity.
 *
 * Equality compares vendor and subkind; use sameFamily() to ignore the
 * Intel integrated/discrete distinction.
 */
struct VendorId {
  GpuVendor vendor{GpuVendor::Unknown};
  IntelKind intel{IntelKind::Unknown};

  [[nodiscard]] static constexpr VendorId nvidia() noexcept { return {GpuVendor::Nvidia}; }
  [[nodiscard]] static constexpr VendorId amd() noexcept { return {GpuVendor::Amd}; }
  [[nodiscard]] static constexpr VendorId intelGpu(IntelKind kind = IntelKind::Unknown) noexcept {
    return {GpuVendor::Intel, kind};
  }
  [[nodiscard]] static constexpr VendorId unknown() noexcept { return {}; }

  [[nodiscard]] constexpr bool isKnown() const noexcept { return vendor != GpuVendor::Unknown; }

  /// @brief Display name, e.g. "Intel (integrated)".
  [[nodiscard]] const char* displayName() const noexcept;

  friend constexpr bool operator==(const VendorId& a, const VendorId& b) noexcept {
    return a.vendor == b.vendor && (a.vendor != GpuVendor::Intel || a.intel == b.intel);
  }
};

/// True when both identities belong to the same vendor, ignoring subfields.
[[nodiscard]] constexpr bool sameFamily(const VendorId& a, const VendorId& b) noexcept {
  return a.vendor == b.vendor;
}

/// Hash of a VendorId consistent with operator==.
[[nodiscard]] std::size_t hashValue(const VendorId& id) noexcept;

/* ----------------------------- Classification ----------------------------- */

/**
 * @brief Map a PCI vendor ID to a vendor identity.
 * @param pciVendorId Value of sysfs "vendor" (e.g. 0x10de).
 * @return Matching identity; Unknown for anything else.
 */
[[nodiscard]] VendorId vendorFromPciId(std::uint32_t pciVendorId) noexcept;

/**
 * @brief Classify an Intel GPU from its marketing name.
 * @param name Device name (e.g. "Intel(R) Arc(TM) A770 Graphics").
 * @return Discrete for Arc / Iris Xe MAX / DG parts, Integrated for UHD, Iris
 *         and HD Graphics, Unknown otherwise.
 */
[[nodiscard]] IntelKind intelKindFromName(std::string_view name) noexcept;

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_VENDOR_HPP
