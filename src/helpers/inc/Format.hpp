#ifndef GPUINFO_HELPERS_FORMAT_HPP
#define GPUINFO_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable and JSON formatting for optional telemetry values.
 *
 * Absent values render as "N/A" for humans and as JSON null, never as a
 * numeric sentinel, so "unsupported" and "zero" stay distinguishable.
 *
 * @note NOT RT-SAFE: All functions return std::string (heap allocation).
 */

#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string

#include <fmt/core.h>
#include <fmt/format.h>

namespace gpuinfo {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

/// Placeholder for absent values in human output.
inline constexpr const char* NOT_AVAILABLE = "N/A";

/* ----------------------------- Human ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/**
 * @brief Format an optional value with a unit suffix, or "N/A".
 * @param value Optional reading.
 * @param spec fmt replacement field applied to the value (e.g. "{:.1f}").
 * @param unit Unit suffix appended after a space (may be empty).
 */
template <typename T>
[[nodiscard]] std::string orNa(const std::optional<T>& value, fmt::string_view spec = "{}",
                               fmt::string_view unit = "") {
  if (!value) {
    return NOT_AVAILABLE;
  }
  std::string out = fmt::vformat(spec, fmt::make_format_args(*value));
  if (unit.size() > 0) {
    out += ' ';
    out.append(unit.data(), unit.size());
  }
  return out;
}

/// Optional byte count rendered with bytesBinary(), or "N/A".
[[nodiscard]] inline std::string bytesOrNa(const std::optional<std::uint64_t>& bytes) {
  return bytes ? bytesBinary(*bytes) : std::string(NOT_AVAILABLE);
}

/* ----------------------------- JSON ----------------------------- */

/// Escape a string for inclusion inside JSON quotes.
[[nodiscard]] inline std::string jsonEscape(const std::string& str) {
  std::string out;
  out.reserve(str.size() + 2);
  for (const char C : str) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(C));
      } else {
        out += C;
      }
    }
  }
  return out;
}

/// JSON literal for an optional number: the value, or null.
template <typename T> [[nodiscard]] std::string jsonValue(const std::optional<T>& value) {
  return value ? fmt::format("{}", *value) : std::string("null");
}

/// JSON literal for an optional string: the quoted value, or null.
[[nodiscard]] inline std::string jsonValue(const std::optional<std::string>& value) {
  return value ? fmt::format("\"{}\"", jsonEscape(*value)) : std::string("null");
}

/// JSON literal for an optional bool: true/false, or null.
[[nodiscard]] inline std::string jsonValue(const std::optional<bool>& value) {
  if (!value) {
    return "null";
  }
  return *value ? "true" : "false";
}

} // namespace format
} // namespace helpers
} // namespace gpuinfo

#endif // GPUINFO_HELPERS_FORMAT_HPP
