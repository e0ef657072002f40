/**
 * @file IntelSysfsBackend.cpp
 * @brief Intel DRM sysfs telemetry.
 */

#include "src/gpu/inc/IntelSysfsBackend.hpp"

#include "src/helpers/inc/Files.hpp"

#include <utility> // std::move

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

using gpuinfo::helpers::files::readLine;
using gpuinfo::helpers::files::readUint64;

namespace {

/// Frequency attribute from the card node, falling back to the device node.
std::optional<std::uint32_t> readFreq(const drm::DrmCard& card, const char* attr) {
  if (auto val = drm::readUint32(card.cardPath + "/" + attr)) {
    return val;
  }
  return drm::readUint32(card.devicePath + "/" + attr);
}

} // namespace

IntelSysfsBackend::IntelSysfsBackend(std::string sysRoot) : sysRoot_(std::move(sysRoot)) {}

DeviceRecord IntelSysfsBackend::readCard(const drm::DrmCard& card) const {
  const std::string& DEV = card.devicePath;

  DeviceRecord rec{};
  if (auto label = readLine(DEV + "/label")) {
    rec.name = std::move(*label);
  } else {
    rec.name = fmt::format("Intel GPU (Device ID: 0x{:04x})", card.pciDevice.value_or(0));
  }

  IntelKind kind = intelKindFromName(*rec.name);
  if (kind == IntelKind::Unknown) {
    kind = IntelKind::Integrated;
  }
  rec.vendor = VendorId::intelGpu(kind);

  rec.driverVersion = drm::moduleVersion(sysRoot_, "i915");
  if (!rec.driverVersion) {
    rec.driverVersion = drm::moduleVersion(sysRoot_, "xe");
  }

  rec.coreClockMHz = readFreq(card, "gt_cur_freq_mhz");
  if (!rec.coreClockMHz) {
    rec.coreClockMHz = readFreq(card, "gt_act_freq_mhz");
  }
  rec.maxClockMHz = readFreq(card, "gt_max_freq_mhz");
  if (!rec.maxClockMHz) {
    rec.maxClockMHz = readFreq(card, "gt_boost_freq_mhz");
  }

  rec.temperatureC = drm::hwmonTemperatureC(DEV);
  rec.powerLimitW = drm::hwmonPowerW(DEV, "power1_max");

  rec.memoryUsedBytes = readUint64(DEV + "/mem_info_vram_used");
  rec.memoryTotalBytes = readUint64(DEV + "/mem_info_vram_total");

  rec.active = true;
  return rec;
}

GpuStatus IntelSysfsBackend::detect(std::vector<DeviceRecord>& out) {
  const auto CARDS = drm::listCards(sysRoot_, PCI_VENDOR_INTEL);
  if (CARDS.empty()) {
    spdlog::debug("intel-sysfs: no Intel card under {}", sysRoot_);
    return GpuStatus::DETECTION_FAILED;
  }

  for (const auto& CARD : CARDS) {
    DeviceRecord rec = readCard(CARD);
    spdlog::info("found {} GPU {} at {}", rec.vendor.displayName(), rec.name.value_or("?"),
                 CARD.name);
    out.push_back(std::move(rec));
  }
  return GpuStatus::OK;
}

GpuStatus IntelSysfsBackend::refresh(DeviceRecord& record) {
  for (const auto& CARD : drm::listCards(sysRoot_, PCI_VENDOR_INTEL)) {
    DeviceRecord fresh = readCard(CARD);
    if (fresh.name == record.name) {
      record = std::move(fresh);
      return GpuStatus::OK;
    }
  }
  return GpuStatus::DETECTION_FAILED;
}

} // namespace gpu

} // namespace gpuinfo
