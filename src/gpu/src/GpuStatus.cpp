/**
 * @file GpuStatus.cpp
 * @brief Status code strings.
 */

#include "src/gpu/inc/GpuStatus.hpp"

namespace gpuinfo {

namespace gpu {

const char* toString(GpuStatus status) noexcept {
  switch (status) {
  case GpuStatus::OK:
    return "OK";
  case GpuStatus::NO_BACKEND:
    return "NO_BACKEND";
  case GpuStatus::DETECTION_FAILED:
    return "DETECTION_FAILED";
  case GpuStatus::NOT_FOUND:
    return "NOT_FOUND";
  case GpuStatus::INVALID_ARGUMENT:
    return "INVALID_ARGUMENT";
  case GpuStatus::TIMEOUT:
    return "TIMEOUT";
  }
  return "UNKNOWN";
}

} // namespace gpu

} // namespace gpuinfo
