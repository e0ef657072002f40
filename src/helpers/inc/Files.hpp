#ifndef GPUINFO_HELPERS_FILES_HPP
#define GPUINFO_HELPERS_FILES_HPP
/**
 * @file Files.hpp
 * @brief Small sysfs/procfs reading utilities.
 *
 * Values read from sysfs are returned as std::optional so that a missing or
 * unparsable attribute ("unsupported") stays distinct from a reading of zero.
 *
 * @note Cold-path: Uses std::string and std::filesystem.
 */

#include "src/helpers/inc/Strings.hpp"

#include <sys/stat.h> // stat, S_ISDIR

#include <algorithm>  // std::sort
#include <cerrno>     // errno, ERANGE
#include <cstdint>    // std::int64_t, std::uint32_t, std::uint64_t
#include <cstdlib>    // strtoull, strtoll
#include <filesystem> // std::filesystem
#include <fstream>    // std::ifstream
#include <optional>   // std::optional
#include <sstream>    // std::ostringstream
#include <string>     // std::string
#include <utility>    // std::move
#include <vector>     // std::vector

namespace gpuinfo {
namespace helpers {
namespace files {

/* ----------------------------- File Reading ----------------------------- */

/**
 * @brief Read an entire text file.
 * @param path File path.
 * @return File contents, or nullopt if the file cannot be opened.
 */
[[nodiscard]] inline std::optional<std::string> readText(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

/**
 * @brief Read the first line of a file with surrounding whitespace stripped.
 * @param path File path.
 * @return Trimmed first line; nullopt if unreadable or empty.
 */
[[nodiscard]] inline std::optional<std::string> readLine(const std::string& path) {
  std::ifstream file(path);
  if (!file) {
    return std::nullopt;
  }
  std::string line;
  std::getline(file, line);
  line = gpuinfo::helpers::strings::trim(line);
  if (line.empty()) {
    return std::nullopt;
  }
  return line;
}

/**
 * @brief Read an unsigned decimal integer (e.g. "mem_info_vram_used").
 * @param path File path.
 * @return Parsed value; nullopt on read failure, trailing garbage, sign or overflow.
 */
[[nodiscard]] inline std::optional<std::uint64_t> readUint64(const std::string& path) {
  const auto LINE = readLine(path);
  if (!LINE || LINE->front() == '-' || LINE->front() == '+') {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(LINE->c_str(), &end, 10);
  if (end == LINE->c_str() || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/**
 * @brief Read a signed decimal integer (e.g. hwmon "temp1_input", which may be negative).
 * @param path File path.
 * @return Parsed value; nullopt on read failure, trailing garbage or overflow.
 */
[[nodiscard]] inline std::optional<std::int64_t> readInt64(const std::string& path) {
  const auto LINE = readLine(path);
  if (!LINE) {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const long long VAL = std::strtoll(LINE->c_str(), &end, 10);
  if (end == LINE->c_str() || *end != '\0' || errno == ERANGE) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(VAL);
}

/**
 * @brief Read a hexadecimal value such as a PCI vendor ID ("0x10de").
 * @param path File path.
 * @return Parsed value; nullopt on read failure, trailing garbage or a value wider than 32 bits.
 */
[[nodiscard]] inline std::optional<std::uint32_t> readHex(const std::string& path) {
  const auto LINE = readLine(path);
  if (!LINE || LINE->front() == '-' || LINE->front() == '+') {
    return std::nullopt;
  }
  char* end = nullptr;
  errno = 0;
  const unsigned long long VAL = std::strtoull(LINE->c_str(), &end, 16);
  if (end == LINE->c_str() || *end != '\0' || errno == ERANGE || VAL > 0xFFFFFFFFULL) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(VAL);
}

/* ----------------------------- Path Utilities ----------------------------- */

/// Check if path is a directory.
[[nodiscard]] inline bool isDirectory(const std::string& path) noexcept {
  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    return false;
  }
  return S_ISDIR(st.st_mode);
}

/**
 * @brief List directory entry names starting with a prefix, sorted.
 * @param dir Directory to list.
 * @param prefix Required name prefix ("" matches everything).
 * @return Sorted entry names; empty if the directory is unreadable.
 */
[[nodiscard]] inline std::vector<std::string> listEntries(const std::string& dir,
                                                          const std::string& prefix = "") {
  std::vector<std::string> names;
  std::error_code ec;
  for (const auto& ENTRY : std::filesystem::directory_iterator(dir, ec)) {
    std::string name = ENTRY.path().filename().string();
    if (gpuinfo::helpers::strings::startsWith(name, prefix)) {
      names.push_back(std::move(name));
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace files
} // namespace helpers
} // namespace gpuinfo

#endif // GPUINFO_HELPERS_FILES_HPP
