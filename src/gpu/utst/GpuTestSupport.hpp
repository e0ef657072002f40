#ifndef GPUINFO_GPU_UTST_GPU_TEST_SUPPORT_HPP
#define GPUINFO_GPU_UTST_GPU_TEST_SUPPORT_HPP
/**
 * @file GpuTestSupport.hpp
 * @brief Test doubles shared by the gpu unit tests.
 *
 *  - MockBackend: scripted backend with call counters.
 *  - ManualClock: steady_clock stand-in advanced by hand.
 *  - LogCapture: swaps the spdlog default logger for a ringbuffer sink.
 */

#include "src/gpu/inc/DeviceRecord.hpp"
#include "src/gpu/inc/GpuBackend.hpp"
#include "src/gpu/inc/ResultCache.hpp"

#include <atomic>      // std::atomic
#include <chrono>      // std::chrono
#include <functional>  // std::function
#include <memory>      // std::shared_ptr
#include <mutex>       // std::mutex
#include <optional>    // std::optional
#include <stdexcept>   // std::runtime_error
#include <string>      // std::string
#include <string_view> // std::string_view
#include <thread>      // std::this_thread
#include <utility>     // std::move
#include <vector>      // std::vector

#include <spdlog/sinks/ringbuffer_sink.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

namespace test {

/* ----------------------------- Records ----------------------------- */

/// Minimal record with a vendor, a name and an optional temperature.
inline DeviceRecord makeRecord(VendorId vendor, std::string name,
                               std::optional<double> temperatureC = std::nullopt) {
  DeviceRecord rec{};
  rec.vendor = vendor;
  rec.name = std::move(name);
  rec.temperatureC = temperatureC;
  rec.active = true;
  return rec;
}

/* ----------------------------- MockBackend ----------------------------- */

/**
 * @brief Backend returning a fixed device list.
 *
 * refresh() looks up the stored device with the same identity, waits
 * refreshDelay, then copies it into the record and applies onRefresh, if set.
 * Counters are atomic so the mock can be driven from worker threads.
 */
class MockBackend final : public GpuBackend {
public:
  MockBackend(VendorId vendor, std::string name, std::vector<DeviceRecord> devices = {})
      : vendor_(vendor), name_(std::move(name)), devices_(std::move(devices)) {}

  [[nodiscard]] VendorId vendor() const noexcept override { return vendor_; }
  [[nodiscard]] const char* name() const noexcept override { return name_.c_str(); }

  [[nodiscard]] GpuStatus detect(std::vector<DeviceRecord>& out) override {
    ++detectCalls;
    if (detectStatus.load() != GpuStatus::OK) {
      return detectStatus.load();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    out.insert(out.end(), devices_.begin(), devices_.end());
    return GpuStatus::OK;
  }

  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) override {
    ++refreshCalls;
    std::optional<DeviceRecord> match;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (const auto& DEV : devices_) {
        if (DEV == record) {
          match = DEV;
          break;
        }
      }
    }

    if (refreshDelay.count() > 0) {
      std::this_thread::sleep_for(refreshDelay);
    }
    if (throwOnRefresh.load()) {
      throw std::runtime_error("mock backend exploded");
    }
    if (refreshStatus.load() != GpuStatus::OK) {
      return refreshStatus.load();
    }
    if (!match) {
      return GpuStatus::DETECTION_FAILED;
    }

    record = *match;
    if (onRefresh) {
      onRefresh(record);
    }
    return GpuStatus::OK;
  }

  /// Replace the device list (what the next detect/refresh sees).
  void setDevices(std::vector<DeviceRecord> devices) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = std::move(devices);
  }

  std::atomic<int> detectCalls{0};
  std::atomic<int> refreshCalls{0};
  std::atomic<GpuStatus> detectStatus{GpuStatus::OK};
  std::atomic<GpuStatus> refreshStatus{GpuStatus::OK};
  std::atomic<bool> throwOnRefresh{false};
  std::chrono::milliseconds refreshDelay{0};
  std::function<void(DeviceRecord&)> onRefresh;

private:
  VendorId vendor_;
  std::string name_;
  std::mutex mutex_;
  std::vector<DeviceRecord> devices_;
};

/* ----------------------------- ManualClock ----------------------------- */

/**
 * @brief Time source for ResultCache that only moves when advanced.
 */
class ManualClock {
public:
  using Clock = ResultCache::Clock;

  [[nodiscard]] ResultCache::ClockFn fn() {
    return [this] { return now(); };
  }

  [[nodiscard]] Clock::time_point now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void advance(std::chrono::milliseconds delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
  }

private:
  mutable std::mutex mutex_;
  Clock::time_point now_{std::chrono::seconds(1000)};
};

/* ----------------------------- LogCapture ----------------------------- */

/**
 * @brief Routes the default spdlog logger into a ringbuffer for the scope's lifetime.
 */
class LogCapture {
public:
  static constexpr std::size_t CAPACITY = 256;

  LogCapture()
      : previous_(spdlog::default_logger()),
        sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(CAPACITY)) {
    auto logger = std::make_shared<spdlog::logger>("capture", sink_);
    logger->set_pattern("%l %v");
    logger->set_level(spdlog::level::trace);
    spdlog::set_default_logger(std::move(logger));
  }

  ~LogCapture() { spdlog::set_default_logger(previous_); }

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  /// True if any captured line contains text.
  [[nodiscard]] bool contains(std::string_view text) const {
    for (const auto& LINE : sink_->last_formatted()) {
      if (LINE.find(text) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

  /// True if one captured line contains both texts.
  [[nodiscard]] bool containsBoth(std::string_view a, std::string_view b) const {
    for (const auto& LINE : sink_->last_formatted()) {
      if (LINE.find(a) != std::string::npos && LINE.find(b) != std::string::npos) {
        return true;
      }
    }
    return false;
  }

private:
  std::shared_ptr<spdlog::logger> previous_;
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace test

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_UTST_GPU_TEST_SUPPORT_HPP
