#ifndef GPUINFO_GPU_NVIDIA_SMI_BACKEND_HPP
#define GPUINFO_GPU_NVIDIA_SMI_BACKEND_HPP
/**
 * @file NvidiaSmiBackend.hpp
 * @brief NVIDIA backend parsing `nvidia-smi --query-gpu` CSV output.
 * @note Spawns a process per call; used as the fallback behind NVML.
 */

#include "src/gpu/inc/GpuBackend.hpp"

#include <cstddef>  // std::size_t
#include <optional> // std::optional
#include <string>   // std::string
#include <vector>   // std::vector

namespace gpuinfo {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// Number of comma-separated fields per output line.
inline constexpr std::size_t NVIDIA_SMI_FIELD_COUNT = 11;

/// Default command line. Memory fields are MiB, power fields W.
inline constexpr const char* NVIDIA_SMI_COMMAND =
    "nvidia-smi --query-gpu=name,driver_version,temperature.gpu,utilization.gpu,"
    "clocks.current.graphics,clocks.current.memory,clocks.max.graphics,power.draw,power.limit,"
    "memory.used,memory.total --format=csv,noheader,nounits 2>/dev/null";

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse one CSV line in the NVIDIA_SMI_COMMAND field order.
 *
 * "[N/A]" and "[Not Supported]" fields become absent values.
 *
 * @return Record, or nullopt when the field count is wrong or the name is empty.
 */
[[nodiscard]] std::optional<DeviceRecord> parseNvidiaSmiLine(const std::string& line);

/// Parse every non-empty line; malformed lines are skipped.
[[nodiscard]] std::vector<DeviceRecord> parseNvidiaSmiOutput(const std::string& output);

/* ----------------------------- NvidiaSmiBackend ----------------------------- */

class NvidiaSmiBackend final : public GpuBackend {
public:
  /// @param command Shell command producing the CSV (overridable for tests).
  explicit NvidiaSmiBackend(std::string command = NVIDIA_SMI_COMMAND);

  [[nodiscard]] VendorId vendor() const noexcept override { return VendorId::nvidia(); }
  [[nodiscard]] const char* name() const noexcept override { return "nvidia-smi"; }

  /// @return DETECTION_FAILED when the command fails or prints no device.
  [[nodiscard]] GpuStatus detect(std::vector<DeviceRecord>& out) override;

  /// @return DETECTION_FAILED when no device with the record's name is reported.
  [[nodiscard]] GpuStatus refresh(DeviceRecord& record) override;

private:
  /// Run the command; nullopt when it cannot start or exits non-zero.
  [[nodiscard]] std::optional<std::string> run() const;

  std::string command_;
};

} // namespace gpu

} // namespace gpuinfo

#endif // GPUINFO_GPU_NVIDIA_SMI_BACKEND_HPP
