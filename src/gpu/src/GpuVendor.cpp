/**
 * @file GpuVendor.cpp
 * @brief Vendor identity helpers.
 */

#include "src/gpu/inc/GpuVendor.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <functional> // std::hash

namespace gpuinfo {

namespace gpu {

using gpuinfo::helpers::strings::containsIgnoreCase;

/* ----------------------------- GpuVendor ----------------------------- */

const char* toString(GpuVendor vendor) noexcept {
  switch (vendor) {
  case GpuVendor::Nvidia:
    return "NVIDIA";
  case GpuVendor::Amd:
    return "AMD";
  case GpuVendor::Intel:
    return "Intel";
  default:
    return "Unknown";
  }
}

const char* toString(IntelKind kind) noexcept {
  switch (kind) {
  case IntelKind::Integrated:
    return "integrated";
  case IntelKind::Discrete:
    return "discrete";
  default:
    return "unknown";
  }
}

/* ----------------------------- VendorId ----------------------------- */

const char* VendorId::displayName() const noexcept {
  if (vendor != GpuVendor::Intel) {
    return gpuinfo::gpu::toString(vendor);
  }
  switch (intel) {
  case IntelKind::Integrated:
    return "Intel (integrated)";
  case IntelKind::Discrete:
    return "Intel (discrete)";
  default:
    return "Intel";
  }
}

std::size_t hashValue(const VendorId& id) noexcept {
  // Subkind only participates for Intel, mirroring operator==.
  const int SUB = (id.vendor == GpuVendor::Intel) ? static_cast<int>(id.intel) : 0;
  return std::hash<int>{}(static_cast<int>(id.vendor) * 8 + SUB);
}

/* ----------------------------- Classification ----------------------------- */

VendorId vendorFromPciId(std::uint32_t pciVendorId) noexcept {
  switch (pciVendorId) {
  case PCI_VENDOR_NVIDIA:
    return VendorId::nvidia();
  case PCI_VENDOR_AMD:
    return VendorId::amd();
  case PCI_VENDOR_INTEL:
    return VendorId::intelGpu();
  default:
    return VendorId::unknown();
  }
}

IntelKind intelKindFromName(std::string_view name) noexcept {
  if (containsIgnoreCase(name, "Arc") || containsIgnoreCase(name, "Xe MAX") ||
      containsIgnoreCase(name, "DG1") || containsIgnoreCase(name, "DG2")) {
    return IntelKind::Discrete;
  }
  if (containsIgnoreCase(name, "UHD") || containsIgnoreCase(name, "Iris") ||
      containsIgnoreCase(name, "HD Graphics")) {
    return IntelKind::Integrated;
  }
  return IntelKind::Unknown;
}

} // namespace gpu

} // namespace gpuinfo
