#ifndef GPUINFO_SYSTEM_OS_INFO_HPP
#define GPUINFO_SYSTEM_OS_INFO_HPP
/**
 * @file OsInfo.hpp
 * @brief Operating system identity: distribution, version, architecture.
 * @note Linux-only. Reads /etc/os-release (fallback /usr/lib/os-release) and uname(2).
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 */

#include <cstdint> // std::uint8_t
#include <string>  // std::string

namespace gpuinfo {

namespace system {

/* ----------------------------- Constants ----------------------------- */

/// Primary os-release location.
inline constexpr const char* OS_RELEASE_PATH = "/etc/os-release";

/// Fallback os-release location.
inline constexpr const char* OS_RELEASE_FALLBACK_PATH = "/usr/lib/os-release";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Distribution classification from the os-release ID field.
 */
enum class OsType : std::uint8_t {
  UNKNOWN = 0, ///< Could not determine the OS
  LINUX,       ///< Linux with an unrecognized distribution ID
  ALMA_LINUX,
  ALPINE,
  AMAZON,
  ARCH,
  CENTOS,
  DEBIAN,
  FEDORA,
  KALI,
  MINT,
  NIXOS,
  OPENSUSE,
  ORACLE_LINUX,
  RHEL,
  ROCKY,
  SUSE,
  UBUNTU,
  VOID,
};

/// @brief Human-readable distribution name (e.g. "Ubuntu").
[[nodiscard]] const char* toString(OsType type) noexcept;

/// @brief Classify an os-release ID (e.g. "ubuntu", "opensuse-leap").
[[nodiscard]] OsType osTypeFromId(const std::string& id) noexcept;

/* ----------------------------- OsInfo ----------------------------- */

/**
 * @brief OS identity snapshot. Empty strings mean "not reported".
 */
struct OsInfo {
  OsType type{OsType::UNKNOWN}; ///< Classified distribution
  std::string id;               ///< os-release ID
  std::string name;             ///< os-release PRETTY_NAME (or NAME)
  std::string version;          ///< os-release VERSION_ID
  std::string codename;         ///< os-release VERSION_CODENAME
  std::string architecture;     ///< uname machine (e.g. "x86_64")
  int bitDepth{0};              ///< 32 or 64; 0 if unknown
  std::string kernelRelease;    ///< uname release

  /// @note Allocates for string building.
  [[nodiscard]] std::string toString() const;

  /// @note Allocates for string building.
  [[nodiscard]] std::string toJson() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Fill the os-release fields of info from file contents.
 * @param text Contents in KEY=VALUE form; values may be single or double quoted.
 * @param info Updated with type, id, name, version and codename.
 * @return true if an ID line was found.
 */
bool parseOsRelease(const std::string& text, OsInfo& info);

/**
 * @brief Collect OS identity for the running system.
 * @return Populated info; type is UNKNOWN if nothing could be read.
 */
[[nodiscard]] OsInfo getOsInfo();

} // namespace system

} // namespace gpuinfo

#endif // GPUINFO_SYSTEM_OS_INFO_HPP
