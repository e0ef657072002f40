/**
 * @file NvidiaSmiBackend.cpp
 * @brief nvidia-smi CSV telemetry.
 */

#include "src/gpu/inc/NvidiaSmiBackend.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <sys/wait.h> // WIFEXITED, WEXITSTATUS

#include <array>   // std::array
#include <cmath>   // std::lround
#include <cstdio>  // popen, pclose, fgets
#include <memory>  // std::unique_ptr
#include <sstream> // std::istringstream
#include <utility> // std::move

#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace gpu {

using gpuinfo::helpers::strings::parseDouble;
using gpuinfo::helpers::strings::split;

namespace {

constexpr std::uint64_t MIB = 1024ULL * 1024ULL;

/// Closes a popen() stream.
struct PipeCloser {
  void operator()(FILE* pipe) const noexcept {
    if (pipe != nullptr) {
      ::pclose(pipe);
    }
  }
};

/// Non-negative whole number field (clocks).
std::optional<std::uint32_t> parseMHz(const std::string& field) {
  const auto VAL = parseDouble(field);
  if (!VAL || *VAL < 0.0) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(std::lround(*VAL));
}

/// MiB field converted to bytes.
std::optional<std::uint64_t> parseMiB(const std::string& field) {
  const auto VAL = parseDouble(field);
  if (!VAL || *VAL < 0.0) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(std::llround(*VAL)) * MIB;
}

/// Text field, absent when empty or bracketed ("[N/A]").
std::optional<std::string> parseText(const std::string& field) {
  if (field.empty() || field.front() == '[') {
    return std::nullopt;
  }
  return field;
}

} // namespace

/* ----------------------------- Parsing ----------------------------- */

std::optional<DeviceRecord> parseNvidiaSmiLine(const std::string& line) {
  const auto FIELDS = split(line, ',');
  if (FIELDS.size() != NVIDIA_SMI_FIELD_COUNT) {
    return std::nullopt;
  }

  DeviceRecord rec{};
  rec.vendor = VendorId::nvidia();
  rec.name = parseText(FIELDS[0]);
  if (!rec.name) {
    return std::nullopt;
  }
  rec.driverVersion = parseText(FIELDS[1]);
  rec.temperatureC = parseDouble(FIELDS[2]);
  rec.utilizationPercent = parseDouble(FIELDS[3]);
  rec.coreClockMHz = parseMHz(FIELDS[4]);
  rec.memoryClockMHz = parseMHz(FIELDS[5]);
  rec.maxClockMHz = parseMHz(FIELDS[6]);
  rec.powerUsageW = parseDouble(FIELDS[7]);
  rec.powerLimitW = parseDouble(FIELDS[8]);
  rec.memoryUsedBytes = parseMiB(FIELDS[9]);
  rec.memoryTotalBytes = parseMiB(FIELDS[10]);
  rec.active = true;
  return rec;
}

std::vector<DeviceRecord> parseNvidiaSmiOutput(const std::string& output) {
  std::vector<DeviceRecord> out;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    if (gpuinfo::helpers::strings::trim(line).empty()) {
      continue;
    }
    if (auto rec = parseNvidiaSmiLine(line)) {
      out.push_back(std::move(*rec));
    } else {
      spdlog::debug("nvidia-smi: skipping malformed line '{}'", line);
    }
  }
  return out;
}

/* ----------------------------- NvidiaSmiBackend ----------------------------- */

NvidiaSmiBackend::NvidiaSmiBackend(std::string command) : command_(std::move(command)) {}

std::optional<std::string> NvidiaSmiBackend::run() const {
  FILE* raw = ::popen(command_.c_str(), "r");
  if (raw == nullptr) {
    spdlog::debug("nvidia-smi: popen failed");
    return std::nullopt;
  }

  std::string output;
  {
    std::unique_ptr<FILE, PipeCloser> pipe(raw);
    std::array<char, 512> buffer{};
    while (std::fgets(buffer.data(), static_cast<int>(buffer.size()), pipe.get()) != nullptr) {
      output += buffer.data();
    }
    const int STATUS = ::pclose(pipe.release());
    if (STATUS == -1 || !WIFEXITED(STATUS) || WEXITSTATUS(STATUS) != 0) {
      spdlog::debug("nvidia-smi: command exited with status {}", STATUS);
      return std::nullopt;
    }
  }
  return output;
}

GpuStatus NvidiaSmiBackend::detect(std::vector<DeviceRecord>& out) {
  const auto OUTPUT = run();
  if (!OUTPUT) {
    return GpuStatus::DETECTION_FAILED;
  }
  auto devices = parseNvidiaSmiOutput(*OUTPUT);
  if (devices.empty()) {
    return GpuStatus::DETECTION_FAILED;
  }
  for (auto& rec : devices) {
    spdlog::info("found NVIDIA GPU {} via nvidia-smi", rec.name.value_or("?"));
    out.push_back(std::move(rec));
  }
  return GpuStatus::OK;
}

GpuStatus NvidiaSmiBackend::refresh(DeviceRecord& record) {
  const auto OUTPUT = run();
  if (!OUTPUT) {
    return GpuStatus::DETECTION_FAILED;
  }
  for (auto& rec : parseNvidiaSmiOutput(*OUTPUT)) {
    if (rec == record) {
      record = std::move(rec);
      return GpuStatus::OK;
    }
  }
  return GpuStatus::DETECTION_FAILED;
}

} // namespace gpu

} // namespace gpuinfo
