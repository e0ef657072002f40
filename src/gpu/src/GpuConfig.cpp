/**
 * @file GpuConfig.cpp
 * @brief Environment-driven configuration.
 */

#include "src/gpu/inc/GpuConfig.hpp"

#include <cerrno>  // errno
#include <chrono>  // std::chrono::milliseconds
#include <cstdint> // std::uint64_t
#include <cstdlib> // std::getenv, std::strtoull

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

namespace {

/// Parse an unsigned decimal environment variable; nullopt when unset or malformed.
std::optional<std::uint64_t> envUint(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  if (*raw == '-') {
    spdlog::warn("ignoring {}='{}': not an unsigned integer", name, raw);
    return std::nullopt;
  }

  errno = 0;
  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0') {
    spdlog::warn("ignoring {}='{}': not an unsigned integer", name, raw);
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/// Millisecond setting bounded by MAX_CONFIG_DURATION; nullopt when unset or invalid.
std::optional<std::chrono::milliseconds> envMillis(const char* name) {
  const auto VAL = envUint(name);
  if (!VAL) {
    return std::nullopt;
  }
  if (*VAL > static_cast<std::uint64_t>(MAX_CONFIG_DURATION.count())) {
    spdlog::warn("ignoring {}={}: exceeds {}ms", name, *VAL, MAX_CONFIG_DURATION.count());
    return std::nullopt;
  }
  return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(*VAL));
}

} // namespace

ManagerConfig ManagerConfig::fromEnvironment() {
  ManagerConfig cfg{};

  if (const auto TTL = envMillis(ENV_CACHE_TTL_MS)) {
    cfg.cache.ttl = *TTL;
  }
  if (const auto MAX = envUint(ENV_CACHE_MAX_ENTRIES)) {
    cfg.cache.maxEntries = static_cast<std::size_t>(*MAX);
  }
  if (const auto THREADS = envUint(ENV_ASYNC_THREADS)) {
    if (*THREADS == 0) {
      spdlog::warn("ignoring {}=0: the worker pool needs at least one thread", ENV_ASYNC_THREADS);
    } else {
      cfg.async.threads = static_cast<std::size_t>(*THREADS);
    }
  }
  if (const auto TIMEOUT = envMillis(ENV_ASYNC_TIMEOUT_MS)) {
    cfg.async.timeout = *TIMEOUT;
  }

  return cfg;
}

std::string ManagerConfig::toString() const {
  return fmt::format("ttl={}ms maxEntries={} threads={} timeout={}", cache.ttl.count(),
                     cache.maxEntries ? fmt::format("{}", *cache.maxEntries) : "unbounded",
                     async.threads,
                     async.timeout ? fmt::format("{}ms", async.timeout->count()) : "none");
}

} // namespace gpu

} // namespace gpuinfo
