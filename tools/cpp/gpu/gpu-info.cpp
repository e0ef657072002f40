/**
 * @file gpu-info.cpp
 * @brief GPU inventory and live telemetry through the cached manager.
 *
 * Detects every GPU the registered backends can see (NVML, nvidia-smi, AMD
 * and Intel sysfs), queries each through the cache, and prints the result.
 * Cache policy and async settings come from GPUINFO_* environment variables,
 * overridable on the command line.
 */

#include "src/gpu/inc/AsyncGpuManager.hpp"
#include "src/gpu/inc/DefaultBackends.hpp"
#include "src/gpu/inc/GpuConfig.hpp"
#include "src/gpu/inc/GpuManager.hpp"
#include "src/gpu/inc/WorkerPool.hpp"
#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/system/inc/OsInfo.hpp"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace gpu = gpuinfo::gpu;
namespace args = gpuinfo::helpers::args;

using gpuinfo::helpers::format::bytesOrNa;
using gpuinfo::helpers::format::orNa;

namespace {

/// Argument keys.
enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_JSON = 1,
  ARG_DEVICE = 2,
  ARG_ASYNC = 3,
  ARG_TTL = 4,
  ARG_MAX_ENTRIES = 5,
  ARG_STATS = 6,
  ARG_OS = 7,
  ARG_VERBOSE = 8,
};

/// Environment variable selecting the log level (trace..off).
constexpr const char* ENV_LOG_LEVEL = "GPUINFO_LOG_LEVEL";

/// Tool description for --help.
constexpr std::string_view DESCRIPTION =
    "Display detected GPUs with live telemetry: temperature, utilization, clocks, power, memory.";

/// Build argument definitions.
args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_JSON] = {"--json", 0, false, "Output in JSON format"};
  map[ARG_DEVICE] = {"--device", 1, false, "GPU device index (default: all)"};
  map[ARG_ASYNC] = {"--async", 0, false, "Query devices concurrently on the worker pool"};
  map[ARG_TTL] = {"--ttl", 1, false, "Cache TTL in milliseconds"};
  map[ARG_MAX_ENTRIES] = {"--max-entries", 1, false, "Cache entry bound (0 disables caching)"};
  map[ARG_STATS] = {"--stats", 0, false, "Show aggregate and cache statistics"};
  map[ARG_OS] = {"--os", 0, false, "Show operating system identity"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Debug logging on stderr"};
  return map;
}

/// Route logs to stderr at the requested level.
void setupLogging(bool verbose) {
  spdlog::set_default_logger(spdlog::stderr_color_mt("gpu-info"));
  spdlog::set_level(spdlog::level::warn);

  if (const char* env = std::getenv(ENV_LOG_LEVEL); env != nullptr && *env != '\0') {
    spdlog::set_level(spdlog::level::from_str(env));
  }
  if (verbose) {
    spdlog::set_level(spdlog::level::debug);
  }
}

/// One queried device.
struct DeviceResult {
  std::size_t index{0};
  gpu::QueryResult result;
};

/// Query the selected devices, synchronously or on the pool.
std::vector<DeviceResult> queryDevices(gpu::GpuManager& mgr, const gpu::AsyncOptions& asyncOpts,
                                       bool useAsync, std::optional<std::size_t> target) {
  std::vector<std::size_t> indices;
  if (target) {
    indices.push_back(*target);
  } else {
    for (std::size_t i = 0; i < mgr.gpuCount(); ++i) {
      indices.push_back(i);
    }
  }

  std::vector<DeviceResult> out;
  out.reserve(indices.size());

  if (!useAsync) {
    for (const std::size_t IDX : indices) {
      out.push_back(DeviceResult{IDX, mgr.getGpuCached(IDX)});
    }
    return out;
  }

  gpu::WorkerPool pool(asyncOpts.threads);
  gpu::AsyncGpuManager bridge(mgr, pool, asyncOpts);
  std::vector<gpu::PendingQuery> pending;
  pending.reserve(indices.size());
  for (const std::size_t IDX : indices) {
    pending.push_back(bridge.getGpuCachedAsync(IDX));
  }
  for (std::size_t i = 0; i < indices.size(); ++i) {
    out.push_back(DeviceResult{indices[i], pending[i].get()});
  }
  return out;
}

/* ----------------------------- Human Output ----------------------------- */

void printDevice(const DeviceResult& dev) {
  fmt::print("=== GPU {} ===\n", dev.index);
  if (!dev.result.snapshot) {
    fmt::print("  Status:      {}\n", gpu::toString(dev.result.status));
    return;
  }

  const gpu::DeviceRecord& REC = *dev.result.snapshot;
  fmt::print("  Name:        {}\n", REC.name.value_or("N/A"));
  fmt::print("  Vendor:      {}\n", REC.vendor.displayName());
  fmt::print("  Driver:      {}\n", REC.driverVersion.value_or("N/A"));
  fmt::print("  Temperature: {}\n", orNa(REC.temperatureC, "{:.1f}", "C"));
  fmt::print("  Utilization: {}\n", orNa(REC.utilizationPercent, "{:.0f}", "%"));
  fmt::print("  Core Clock:  {} (max {})\n", orNa(REC.coreClockMHz, "{}", "MHz"),
             orNa(REC.maxClockMHz, "{}", "MHz"));
  fmt::print("  Mem Clock:   {}\n", orNa(REC.memoryClockMHz, "{}", "MHz"));
  fmt::print("  Power:       {} / {}\n", orNa(REC.powerUsageW, "{:.1f}", "W"),
             orNa(REC.powerLimitW, "{:.0f}", "W"));
  fmt::print("  Memory:      {} / {}", bytesOrNa(REC.memoryUsedBytes),
             bytesOrNa(REC.memoryTotalBytes));
  if (const auto PCT = REC.memoryUtilizationPercent()) {
    fmt::print(" ({:.1f}% used)", *PCT);
  }
  fmt::print("\n");

  if (!dev.result.ok()) {
    fmt::print("  \033[33mStatus:      {} (last known values)\033[0m\n",
               gpu::toString(dev.result.status));
  } else if (dev.result.fromCache) {
    fmt::print("  Source:      cache\n");
  }
}

void printHuman(const std::vector<DeviceResult>& devices, const gpu::GpuStatistics* stats,
                const gpu::CacheStats* cache, const gpuinfo::system::OsInfo* os) {
  if (os != nullptr) {
    fmt::print("OS: {}\n\n", os->toString());
  }

  if (devices.empty()) {
    fmt::print("No GPUs detected.\n");
  }
  bool first = true;
  for (const auto& DEV : devices) {
    if (!first) {
      fmt::print("\n");
    }
    first = false;
    printDevice(DEV);
  }

  if (stats != nullptr) {
    fmt::print("\nSummary: {}\n", stats->toString());
  }
  if (cache != nullptr) {
    fmt::print("Cache:   {}\n", cache->toString());
  }
}

/* ----------------------------- JSON Output ----------------------------- */

void printJson(const std::vector<DeviceResult>& devices, const gpu::GpuStatistics* stats,
               const gpu::CacheStats* cache, const gpuinfo::system::OsInfo* os) {
  fmt::print("{{\n");
  if (os != nullptr) {
    fmt::print("  \"os\": {},\n", os->toJson());
  }

  fmt::print("  \"devices\": [");
  for (std::size_t i = 0; i < devices.size(); ++i) {
    const auto& DEV = devices[i];
    fmt::print("{}\n    {{\"index\": {}, \"status\": \"{}\", \"fromCache\": {}, \"record\": {}}}",
               i == 0 ? "" : ",", DEV.index, gpu::toString(DEV.result.status),
               DEV.result.fromCache, DEV.result.snapshot ? DEV.result.snapshot->toJson() : "null");
  }
  fmt::print("{}]", devices.empty() ? "" : "\n  ");

  if (stats != nullptr) {
    const auto AVG = stats->averageTemperatureC();
    const auto POWER = stats->totalPowerConsumptionW();
    fmt::print(",\n  \"statistics\": {{\"totalGpus\": {}, \"nvidia\": {}, \"amd\": {}, "
               "\"intel\": {}, \"unknown\": {}, \"active\": {}, \"averageTemperatureC\": {}, "
               "\"totalPowerW\": {}}}",
               stats->totalGpus, stats->nvidiaCount, stats->amdCount, stats->intelCount,
               stats->unknownCount, stats->activeCount,
               gpuinfo::helpers::format::jsonValue(AVG),
               gpuinfo::helpers::format::jsonValue(POWER));
  }
  if (cache != nullptr) {
    fmt::print(",\n  \"cache\": {}", cache->toJson());
  }
  fmt::print("\n}}\n");
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }

  setupLogging(pargs.count(ARG_VERBOSE) != 0);

  gpu::ManagerConfig config = gpu::ManagerConfig::fromEnvironment();
  if (pargs.count(ARG_TTL) != 0) {
    const auto TTL = args::uintValue(pargs, ARG_TTL);
    if (!TTL) {
      fmt::print(stderr, "Error: --ttl expects a non-negative integer\n");
      return 1;
    }
    if (*TTL > static_cast<std::uint64_t>(gpu::MAX_CONFIG_DURATION.count())) {
      fmt::print(stderr, "Error: --ttl must not exceed {} ms\n",
                 gpu::MAX_CONFIG_DURATION.count());
      return 1;
    }
    config.cache.ttl = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*TTL));
  }
  if (pargs.count(ARG_MAX_ENTRIES) != 0) {
    const auto MAX = args::uintValue(pargs, ARG_MAX_ENTRIES);
    if (!MAX) {
      fmt::print(stderr, "Error: --max-entries expects a non-negative integer\n");
      return 1;
    }
    config.cache.maxEntries = static_cast<std::size_t>(*MAX);
  }

  std::optional<std::size_t> target;
  if (pargs.count(ARG_DEVICE) != 0) {
    const auto IDX = args::uintValue(pargs, ARG_DEVICE);
    if (!IDX) {
      fmt::print(stderr, "Error: --device expects a device index\n");
      return 1;
    }
    target = static_cast<std::size_t>(*IDX);
  }
  spdlog::debug("configuration: {}", config.toString());

  gpu::GpuManager mgr(gpu::makeDefaultRegistry(), config.cache);
  if (target && *target >= mgr.gpuCount()) {
    fmt::print(stderr, "Error: GPU {} not found ({} detected)\n", *target, mgr.gpuCount());
    return 1;
  }

  const std::vector<DeviceResult> DEVICES =
      queryDevices(mgr, config.async, pargs.count(ARG_ASYNC) != 0, target);

  std::optional<gpu::GpuStatistics> stats;
  std::optional<gpu::CacheStats> cache;
  if (pargs.count(ARG_STATS) != 0) {
    stats = mgr.statistics();
    cache = mgr.getCacheStats();
  }
  std::optional<gpuinfo::system::OsInfo> os;
  if (pargs.count(ARG_OS) != 0) {
    os = gpuinfo::system::getOsInfo();
  }

  const gpu::GpuStatistics* statsPtr = stats ? &*stats : nullptr;
  const gpu::CacheStats* cachePtr = cache ? &*cache : nullptr;
  const gpuinfo::system::OsInfo* osPtr = os ? &*os : nullptr;
  if (pargs.count(ARG_JSON) != 0) {
    printJson(DEVICES, statsPtr, cachePtr, osPtr);
  } else {
    printHuman(DEVICES, statsPtr, cachePtr, osPtr);
  }

  for (const auto& DEV : DEVICES) {
    if (!DEV.result.ok()) {
      return 2;
    }
  }
  return 0;
}
