/**
 * @file SysfsBackends_uTest.cpp
 * @brief Unit tests for the DRM sysfs readers and the AMD/Intel backends.
 *
 * Notes:
 *  - Each test builds a fake sysfs tree under a temporary directory:
 *      card1  Intel Arc A770 (label, card-node clocks, hwmon temp)
 *      card2  Intel iGPU without label (fallback clock attributes)
 *      card3  AMD RX 7900 XTX (full amdgpu attribute set)
 *      card3-DP-1 connector (must be skipped)
 *      card10 AMD without product_name
 *      card4  virtio GPU (other vendor)
 */

#include "src/gpu/inc/AmdSysfsBackend.hpp"
#include "src/gpu/inc/BackendRegistry.hpp"
#include "src/gpu/inc/DefaultBackends.hpp"
#include "src/gpu/inc/DrmSysfs.hpp"
#include "src/gpu/inc/GpuManager.hpp"
#include "src/gpu/inc/IntelSysfsBackend.hpp"

#include <gtest/gtest.h>

#include <unistd.h> // getpid

#include <atomic>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

using gpuinfo::gpu::AmdSysfsBackend;
using gpuinfo::gpu::BackendRegistry;
using gpuinfo::gpu::DeviceRecord;
using gpuinfo::gpu::GpuManager;
using gpuinfo::gpu::GpuStatus;
using gpuinfo::gpu::IntelKind;
using gpuinfo::gpu::IntelSysfsBackend;
using gpuinfo::gpu::makeDefaultRegistry;
using gpuinfo::gpu::PCI_VENDOR_AMD;
using gpuinfo::gpu::PCI_VENDOR_INTEL;
using gpuinfo::gpu::VendorId;
namespace drm = gpuinfo::gpu::drm;

namespace {

void writeFile(const fs::path& path, const std::string& text) {
  fs::create_directories(path.parent_path());
  std::ofstream(path) << text;
}

constexpr const char* RX_SCLK = "0: 500Mhz\n1: 1800Mhz *\n2: 2500Mhz\n";
constexpr const char* RX_MCLK = "0: 96Mhz\n1: 1250Mhz *\n";

} // namespace

class SysfsBackendsTest : public ::testing::Test {
protected:
  fs::path root_;

  void SetUp() override {
    static std::atomic<int> counter{0};
    root_ = fs::temp_directory_path() /
            ("gpuinfo_sysfs_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
    fs::remove_all(root_);

    const fs::path DRM = root_ / "class" / "drm";

    // Intel Arc
    const fs::path ARC = DRM / "card1";
    writeFile(ARC / "device" / "vendor", "0x8086\n");
    writeFile(ARC / "device" / "device", "0x56a0\n");
    writeFile(ARC / "device" / "label", "Intel(R) Arc(TM) A770 Graphics\n");
    writeFile(ARC / "device" / "hwmon" / "hwmon5" / "temp1_input", "48000\n");
    writeFile(ARC / "device" / "hwmon" / "hwmon5" / "power1_max", "225000000\n");
    writeFile(ARC / "gt_cur_freq_mhz", "1200\n");
    writeFile(ARC / "gt_max_freq_mhz", "2400\n");

    // Intel iGPU
    const fs::path IGPU = DRM / "card2";
    writeFile(IGPU / "device" / "vendor", "0x8086\n");
    writeFile(IGPU / "device" / "device", "0x4680\n");
    writeFile(IGPU / "gt_act_freq_mhz", "300\n");
    writeFile(IGPU / "device" / "gt_boost_freq_mhz", "1550\n");

    // AMD RX 7900 XTX
    const fs::path RX = DRM / "card3";
    writeFile(RX / "device" / "vendor", "0x1002\n");
    writeFile(RX / "device" / "device", "0x744c\n");
    writeFile(RX / "device" / "product_name", "AMD Radeon RX 7900 XTX\n");
    writeFile(RX / "device" / "gpu_busy_percent", "37\n");
    writeFile(RX / "device" / "mem_info_vram_used", "1073741824\n");
    writeFile(RX / "device" / "mem_info_vram_total", "25753026560\n");
    writeFile(RX / "device" / "pp_dpm_sclk", RX_SCLK);
    writeFile(RX / "device" / "pp_dpm_mclk", RX_MCLK);
    writeFile(RX / "device" / "hwmon" / "hwmon3" / "temp1_input", "52000\n");
    writeFile(RX / "device" / "hwmon" / "hwmon3" / "power1_average", "85000000\n");
    writeFile(RX / "device" / "hwmon" / "hwmon3" / "power1_cap", "303000000\n");

    // Connector node under the AMD card
    writeFile(DRM / "card3-DP-1" / "device" / "vendor", "0x1002\n");

    // AMD without product_name
    const fs::path RX2 = DRM / "card10";
    writeFile(RX2 / "device" / "vendor", "0x1002\n");
    writeFile(RX2 / "device" / "device", "0x73bf\n");

    // Other vendor
    writeFile(DRM / "card4" / "device" / "vendor", "0x1af4\n");

    writeFile(root_ / "module" / "amdgpu" / "version", "6.7.0\n");
    writeFile(root_ / "module" / "xe" / "version", "1.1\n");
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  [[nodiscard]] std::string root() const { return root_.string(); }
};

/* ----------------------------- DrmSysfs Tests ----------------------------- */

/** @test Cards are filtered by vendor, connectors skipped, sorted numerically. */
TEST_F(SysfsBackendsTest, ListCards) {
  const auto AMD = drm::listCards(root(), PCI_VENDOR_AMD);
  ASSERT_EQ(AMD.size(), 2U);
  EXPECT_EQ(AMD[0].name, "card3");
  EXPECT_EQ(AMD[1].name, "card10");
  EXPECT_EQ(AMD[0].pciVendor, PCI_VENDOR_AMD);
  ASSERT_TRUE(AMD[0].pciDevice.has_value());
  EXPECT_EQ(*AMD[0].pciDevice, 0x744cU);

  EXPECT_EQ(drm::listCards(root(), PCI_VENDOR_INTEL).size(), 2U);
  EXPECT_TRUE(drm::listCards(root() + "/missing", PCI_VENDOR_AMD).empty());
}

/** @test DPM tables yield the starred level or the highest level. */
TEST(DrmSysfsTest, ParseDpmClock) {
  EXPECT_EQ(drm::parseDpmClockMHz(RX_SCLK, true), 1800U);
  EXPECT_EQ(drm::parseDpmClockMHz(RX_SCLK, false), 2500U);
  EXPECT_FALSE(drm::parseDpmClockMHz("0: 500Mhz\n1: 900Mhz\n", true).has_value());
  EXPECT_FALSE(drm::parseDpmClockMHz("", false).has_value());
}

/** @test hwmon readers convert units. */
TEST_F(SysfsBackendsTest, HwmonReaders) {
  const std::string DEV = root() + "/class/drm/card3/device";
  const auto TEMP = drm::hwmonTemperatureC(DEV);
  ASSERT_TRUE(TEMP.has_value());
  EXPECT_DOUBLE_EQ(*TEMP, 52.0);

  const auto POWER = drm::hwmonPowerW(DEV, "power1_average");
  ASSERT_TRUE(POWER.has_value());
  EXPECT_DOUBLE_EQ(*POWER, 85.0);

  EXPECT_FALSE(drm::hwmonPowerW(DEV, "power1_input").has_value());
  EXPECT_FALSE(drm::hwmonTemperatureC(root() + "/class/drm/card10/device").has_value());
}

/** @test Sub-zero temperatures are kept; malformed attributes read as unsupported. */
TEST_F(SysfsBackendsTest, HwmonSignedAndMalformed) {
  const fs::path DEV = root_ / "class" / "drm" / "card20" / "device";
  writeFile(DEV / "hwmon" / "hwmon0" / "temp1_input", "12abc\n");
  writeFile(DEV / "hwmon" / "hwmon1" / "temp1_input", "-5000\n");
  writeFile(DEV / "hwmon" / "hwmon1" / "power1_average", "85000000W\n");

  const auto TEMP = drm::hwmonTemperatureC(DEV.string());
  ASSERT_TRUE(TEMP.has_value());
  EXPECT_DOUBLE_EQ(*TEMP, -5.0);
  EXPECT_FALSE(drm::hwmonPowerW(DEV.string(), "power1_average").has_value());

  writeFile(DEV / "hwmon" / "hwmon1" / "temp1_input", "-5000x\n");
  EXPECT_FALSE(drm::hwmonTemperatureC(DEV.string()).has_value());
}

/** @test A card whose vendor ID carries trailing garbage is not listed. */
TEST_F(SysfsBackendsTest, MalformedVendorSkipped) {
  writeFile(root_ / "class" / "drm" / "card30" / "device" / "vendor", "0x1002zz\n");
  for (const auto& CARD : drm::listCards(root(), PCI_VENDOR_AMD)) {
    EXPECT_NE(CARD.name, "card30");
  }
}

/** @test Module versions are read from the module directory. */
TEST_F(SysfsBackendsTest, ModuleVersion) {
  EXPECT_EQ(drm::moduleVersion(root(), "amdgpu"), std::optional<std::string>("6.7.0"));
  EXPECT_FALSE(drm::moduleVersion(root(), "i915").has_value());
}

/* ----------------------------- AMD Tests ----------------------------- */

/** @test AMD detection reads every amdgpu attribute. */
TEST_F(SysfsBackendsTest, AmdDetect) {
  AmdSysfsBackend backend(root());
  std::vector<DeviceRecord> out;
  ASSERT_EQ(backend.detect(out), GpuStatus::OK);
  ASSERT_EQ(out.size(), 2U);

  const DeviceRecord& RX = out[0];
  EXPECT_EQ(RX.vendor, VendorId::amd());
  EXPECT_EQ(*RX.name, "AMD Radeon RX 7900 XTX");
  EXPECT_EQ(*RX.driverVersion, "6.7.0");
  EXPECT_DOUBLE_EQ(*RX.temperatureC, 52.0);
  EXPECT_DOUBLE_EQ(*RX.utilizationPercent, 37.0);
  EXPECT_DOUBLE_EQ(*RX.powerUsageW, 85.0);
  EXPECT_DOUBLE_EQ(*RX.powerLimitW, 303.0);
  EXPECT_EQ(*RX.coreClockMHz, 1800U);
  EXPECT_EQ(*RX.maxClockMHz, 2500U);
  EXPECT_EQ(*RX.memoryClockMHz, 1250U);
  EXPECT_EQ(*RX.memoryUsedBytes, 1073741824ULL);
  EXPECT_EQ(*RX.memoryTotalBytes, 25753026560ULL);
  EXPECT_TRUE(*RX.active);
  EXPECT_TRUE(RX.isValid());

  const DeviceRecord& BARE = out[1];
  EXPECT_EQ(*BARE.name, "AMD GPU (Device ID: 0x73bf)");
  EXPECT_FALSE(BARE.temperatureC.has_value());
  EXPECT_FALSE(BARE.coreClockMHz.has_value());
}

/** @test AMD refresh re-reads live values for the same card. */
TEST_F(SysfsBackendsTest, AmdRefresh) {
  AmdSysfsBackend backend(root());
  std::vector<DeviceRecord> out;
  ASSERT_EQ(backend.detect(out), GpuStatus::OK);

  writeFile(root_ / "class" / "drm" / "card3" / "device" / "hwmon" / "hwmon3" / "temp1_input",
            "61500\n");
  DeviceRecord rec = out[0];
  ASSERT_EQ(backend.refresh(rec), GpuStatus::OK);
  EXPECT_DOUBLE_EQ(*rec.temperatureC, 61.5);

  DeviceRecord gone{};
  gone.vendor = VendorId::amd();
  gone.name = "AMD Radeon RX 6600";
  EXPECT_EQ(backend.refresh(gone), GpuStatus::DETECTION_FAILED);
}

/* ----------------------------- Intel Tests ----------------------------- */

/** @test Intel detection classifies subkinds and reads clocks with fallbacks. */
TEST_F(SysfsBackendsTest, IntelDetect) {
  IntelSysfsBackend backend(root());
  std::vector<DeviceRecord> out;
  ASSERT_EQ(backend.detect(out), GpuStatus::OK);
  ASSERT_EQ(out.size(), 2U);

  const DeviceRecord& ARC = out[0];
  EXPECT_EQ(ARC.vendor, VendorId::intelGpu(IntelKind::Discrete));
  EXPECT_EQ(*ARC.name, "Intel(R) Arc(TM) A770 Graphics");
  EXPECT_EQ(*ARC.driverVersion, "1.1");
  EXPECT_EQ(*ARC.coreClockMHz, 1200U);
  EXPECT_EQ(*ARC.maxClockMHz, 2400U);
  EXPECT_DOUBLE_EQ(*ARC.temperatureC, 48.0);
  EXPECT_DOUBLE_EQ(*ARC.powerLimitW, 225.0);

  const DeviceRecord& IGPU = out[1];
  EXPECT_EQ(IGPU.vendor, VendorId::intelGpu(IntelKind::Integrated));
  EXPECT_EQ(*IGPU.name, "Intel GPU (Device ID: 0x4680)");
  EXPECT_EQ(*IGPU.coreClockMHz, 300U);
  EXPECT_EQ(*IGPU.maxClockMHz, 1550U);
  EXPECT_FALSE(IGPU.temperatureC.has_value());
}

/** @test Intel refresh follows frequency changes. */
TEST_F(SysfsBackendsTest, IntelRefresh) {
  IntelSysfsBackend backend(root());
  std::vector<DeviceRecord> out;
  ASSERT_EQ(backend.detect(out), GpuStatus::OK);

  writeFile(root_ / "class" / "drm" / "card1" / "gt_cur_freq_mhz", "2000\n");
  DeviceRecord rec = out[0];
  ASSERT_EQ(backend.refresh(rec), GpuStatus::OK);
  EXPECT_EQ(*rec.coreClockMHz, 2000U);
}

/** @test Backends fail detection on an empty tree. */
TEST_F(SysfsBackendsTest, EmptyTreeFails) {
  const std::string EMPTY = root() + "/nothing";
  std::vector<DeviceRecord> out;
  EXPECT_EQ(AmdSysfsBackend(EMPTY).detect(out), GpuStatus::DETECTION_FAILED);
  EXPECT_EQ(IntelSysfsBackend(EMPTY).detect(out), GpuStatus::DETECTION_FAILED);
  EXPECT_TRUE(out.empty());
}

/* ----------------------------- Integration Tests ----------------------------- */

/** @test A manager over the sysfs backends sees every card and refreshes through them. */
TEST_F(SysfsBackendsTest, ManagerOverSysfs) {
  auto registry = std::make_shared<BackendRegistry>();
  registry->registerBackend(VendorId::amd(), std::make_shared<AmdSysfsBackend>(root()));
  registry->registerBackend(VendorId::intelGpu(), std::make_shared<IntelSysfsBackend>(root()));

  GpuManager mgr(registry);
  EXPECT_EQ(mgr.gpuCount(), 4U);

  const auto FIRST = mgr.getGpuCached(0);
  ASSERT_TRUE(FIRST.ok());
  EXPECT_EQ(*FIRST.snapshot->name, "AMD Radeon RX 7900 XTX");

  const auto ARC = mgr.getGpuCached(2);
  ASSERT_TRUE(ARC.ok());
  EXPECT_EQ(ARC.snapshot->vendor, VendorId::intelGpu(IntelKind::Discrete));

  const auto STATS = mgr.statistics();
  EXPECT_EQ(STATS.amdCount, 2U);
  EXPECT_EQ(STATS.intelCount, 2U);
}

/** @test The default registry wires every Linux backend in fallback order. */
TEST_F(SysfsBackendsTest, DefaultRegistry) {
  const auto REGISTRY = makeDefaultRegistry(root());
  EXPECT_TRUE(REGISTRY->isVendorSupported(VendorId::nvidia()));
  EXPECT_TRUE(REGISTRY->isVendorSupported(VendorId::amd()));
  EXPECT_TRUE(REGISTRY->isVendorSupported(VendorId::intelGpu(IntelKind::Discrete)));

  const auto NV = REGISTRY->backendNames(VendorId::nvidia());
  ASSERT_FALSE(NV.empty());
  EXPECT_EQ(NV.back(), "nvidia-smi");
  EXPECT_EQ(REGISTRY->backendNames(VendorId::amd()), std::vector<std::string>{"amd-sysfs"});
}
