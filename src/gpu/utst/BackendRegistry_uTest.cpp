/**
 * @file BackendRegistry_uTest.cpp
 * @brief Unit tests for gpuinfo::gpu::BackendRegistry.
 *
 * Notes:
 *  - Backends are MockBackend instances; no hardware is touched.
 *  - Fallback failures are checked through the captured spdlog output.
 */

#include "src/gpu/inc/BackendRegistry.hpp"
#include "src/gpu/utst/GpuTestSupport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

using gpuinfo::gpu::BackendRegistry;
using gpuinfo::gpu::DeviceRecord;
using gpuinfo::gpu::GpuStatus;
using gpuinfo::gpu::IntelKind;
using gpuinfo::gpu::VendorId;
using gpuinfo::gpu::test::LogCapture;
using gpuinfo::gpu::test::makeRecord;
using gpuinfo::gpu::test::MockBackend;

class BackendRegistryTest : public ::testing::Test {
protected:
  BackendRegistry registry_;
  LogCapture log_;
};

/* ----------------------------- Registration Tests ----------------------------- */

/** @test Empty registry supports nothing. */
TEST_F(BackendRegistryTest, EmptyRegistry) {
  EXPECT_EQ(registry_.backendCount(), 0U);
  EXPECT_TRUE(registry_.registeredVendors().empty());
  EXPECT_FALSE(registry_.isVendorSupported(VendorId::nvidia()));
  EXPECT_TRUE(registry_.detectAll().empty());
}

/** @test Null backends are rejected. */
TEST_F(BackendRegistryTest, NullBackendRejected) {
  EXPECT_EQ(registry_.registerBackend(VendorId::amd(), nullptr), GpuStatus::INVALID_ARGUMENT);
  EXPECT_EQ(registry_.backendCount(), 0U);
}

/** @test Registration appends in order and lists distinct vendors. */
TEST_F(BackendRegistryTest, RegistrationOrder) {
  EXPECT_EQ(registry_.registerBackend(VendorId::nvidia(),
                                      std::make_shared<MockBackend>(VendorId::nvidia(), "first")),
            GpuStatus::OK);
  EXPECT_EQ(registry_.registerBackend(VendorId::amd(),
                                      std::make_shared<MockBackend>(VendorId::amd(), "amd")),
            GpuStatus::OK);
  EXPECT_EQ(registry_.registerBackend(VendorId::nvidia(),
                                      std::make_shared<MockBackend>(VendorId::nvidia(), "second")),
            GpuStatus::OK);

  EXPECT_EQ(registry_.backendCount(), 3U);
  const auto VENDORS = registry_.registeredVendors();
  ASSERT_EQ(VENDORS.size(), 2U);
  EXPECT_EQ(VENDORS[0], VendorId::nvidia());
  EXPECT_EQ(VENDORS[1], VendorId::amd());

  const std::vector<std::string> EXPECTED{"first", "second"};
  EXPECT_EQ(registry_.backendNames(VendorId::nvidia()), EXPECTED);
}

/** @test Support checks match the whole Intel family. */
TEST_F(BackendRegistryTest, IntelFamilySupport) {
  registry_.registerBackend(VendorId::intelGpu(),
                            std::make_shared<MockBackend>(VendorId::intelGpu(), "intel"));
  EXPECT_TRUE(registry_.isVendorSupported(VendorId::intelGpu(IntelKind::Discrete)));
  EXPECT_TRUE(registry_.isVendorSupported(VendorId::intelGpu(IntelKind::Integrated)));
  EXPECT_FALSE(registry_.isVendorSupported(VendorId::amd()));
}

/* ----------------------------- Detection Tests ----------------------------- */

/** @test detectAll concatenates in registration order and skips failures. */
TEST_F(BackendRegistryTest, DetectAllConcatenates) {
  auto nv = std::make_shared<MockBackend>(
      VendorId::nvidia(), "nv", std::vector<DeviceRecord>{makeRecord(VendorId::nvidia(), "A")});
  auto broken = std::make_shared<MockBackend>(VendorId::amd(), "broken-amd");
  broken->detectStatus = GpuStatus::DETECTION_FAILED;
  auto intel = std::make_shared<MockBackend>(
      VendorId::intelGpu(), "intel",
      std::vector<DeviceRecord>{makeRecord(VendorId::intelGpu(IntelKind::Integrated), "B"),
                                makeRecord(VendorId::intelGpu(IntelKind::Discrete), "C")});

  registry_.registerBackend(VendorId::nvidia(), nv);
  registry_.registerBackend(VendorId::amd(), broken);
  registry_.registerBackend(VendorId::intelGpu(), intel);

  const auto DEVICES = registry_.detectAll();
  ASSERT_EQ(DEVICES.size(), 3U);
  EXPECT_EQ(*DEVICES[0].name, "A");
  EXPECT_EQ(*DEVICES[1].name, "B");
  EXPECT_EQ(*DEVICES[2].name, "C");
  EXPECT_EQ(broken->detectCalls.load(), 1);
  EXPECT_TRUE(log_.containsBoth("warning", "broken-amd"));
}

/* ----------------------------- Refresh Tests ----------------------------- */

/** @test No backend for the vendor family gives NO_BACKEND. */
TEST_F(BackendRegistryTest, RefreshWithoutBackend) {
  registry_.registerBackend(VendorId::amd(), std::make_shared<MockBackend>(VendorId::amd(), "amd"));
  DeviceRecord rec = makeRecord(VendorId::nvidia(), "RTX", 50.0);
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::NO_BACKEND);
  EXPECT_EQ(*rec.temperatureC, 50.0);
}

/** @test A failing first backend falls through to the next one, and the failure is logged. */
TEST_F(BackendRegistryTest, RefreshFallback) {
  const DeviceRecord DEVICE = makeRecord(VendorId::nvidia(), "RTX", 40.0);

  auto primary = std::make_shared<MockBackend>(VendorId::nvidia(), "primary-nv",
                                               std::vector<DeviceRecord>{DEVICE});
  primary->refreshStatus = GpuStatus::DETECTION_FAILED;
  auto fallback = std::make_shared<MockBackend>(VendorId::nvidia(), "fallback-nv",
                                                std::vector<DeviceRecord>{DEVICE});
  fallback->onRefresh = [](DeviceRecord& rec) { rec.temperatureC = 71.0; };

  registry_.registerBackend(VendorId::nvidia(), primary);
  registry_.registerBackend(VendorId::nvidia(), fallback);

  DeviceRecord rec = DEVICE;
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::OK);
  EXPECT_EQ(*rec.temperatureC, 71.0);
  EXPECT_EQ(primary->refreshCalls.load(), 1);
  EXPECT_EQ(fallback->refreshCalls.load(), 1);
  EXPECT_TRUE(log_.containsBoth("warning", "primary-nv"));
}

/** @test The first success stops dispatch. */
TEST_F(BackendRegistryTest, RefreshStopsAtFirstSuccess) {
  const DeviceRecord DEVICE = makeRecord(VendorId::amd(), "RX 7900");
  auto first = std::make_shared<MockBackend>(VendorId::amd(), "first",
                                             std::vector<DeviceRecord>{DEVICE});
  auto second = std::make_shared<MockBackend>(VendorId::amd(), "second",
                                              std::vector<DeviceRecord>{DEVICE});
  registry_.registerBackend(VendorId::amd(), first);
  registry_.registerBackend(VendorId::amd(), second);

  DeviceRecord rec = DEVICE;
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::OK);
  EXPECT_EQ(first->refreshCalls.load(), 1);
  EXPECT_EQ(second->refreshCalls.load(), 0);
}

/** @test All candidates failing leaves the record untouched. */
TEST_F(BackendRegistryTest, RefreshAllFail) {
  auto a = std::make_shared<MockBackend>(VendorId::amd(), "a");
  auto b = std::make_shared<MockBackend>(VendorId::amd(), "b");
  a->refreshStatus = GpuStatus::DETECTION_FAILED;
  b->refreshStatus = GpuStatus::DETECTION_FAILED;
  registry_.registerBackend(VendorId::amd(), a);
  registry_.registerBackend(VendorId::amd(), b);

  DeviceRecord rec = makeRecord(VendorId::amd(), "RX", 55.0);
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::DETECTION_FAILED);
  EXPECT_EQ(*rec.temperatureC, 55.0);
  EXPECT_TRUE(log_.contains("error"));
}

/** @test A throwing backend is reported as a failure, not propagated. */
TEST_F(BackendRegistryTest, ThrowingBackendContained) {
  const DeviceRecord DEVICE = makeRecord(VendorId::nvidia(), "RTX");
  auto bad = std::make_shared<MockBackend>(VendorId::nvidia(), "thrower",
                                           std::vector<DeviceRecord>{DEVICE});
  bad->throwOnRefresh = true;
  registry_.registerBackend(VendorId::nvidia(), bad);

  DeviceRecord rec = DEVICE;
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::DETECTION_FAILED);
  EXPECT_TRUE(log_.containsBoth("thrower", "mock backend exploded"));
}

/** @test Intel records dispatch to a backend registered for either subkind. */
TEST_F(BackendRegistryTest, IntelSubkindDispatch) {
  const DeviceRecord ARC = makeRecord(VendorId::intelGpu(IntelKind::Discrete), "Arc A770");
  auto intel = std::make_shared<MockBackend>(VendorId::intelGpu(), "intel",
                                             std::vector<DeviceRecord>{ARC});
  registry_.registerBackend(VendorId::intelGpu(), intel);

  DeviceRecord rec = ARC;
  EXPECT_EQ(registry_.refresh(rec), GpuStatus::OK);
  EXPECT_EQ(intel->refreshCalls.load(), 1);
}
