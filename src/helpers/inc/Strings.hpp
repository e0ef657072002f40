#ifndef GPUINFO_HELPERS_STRINGS_HPP
#define GPUINFO_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing sysfs attributes and tool output.
 * @note Cold-path: Functions returning std::string allocate.
 */

#include <algorithm>   // std::search
#include <cctype>      // std::tolower, std::isspace
#include <cstdlib>     // strtod
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace gpuinfo {
namespace helpers {
namespace strings {

/* ----------------------------- Inspection ----------------------------- */

/// Check if str starts with prefix.
[[nodiscard]] inline bool startsWith(std::string_view str, std::string_view prefix) noexcept {
  return str.substr(0, prefix.size()) == prefix;
}

/// Case-insensitive substring search.
[[nodiscard]] inline bool containsIgnoreCase(std::string_view haystack,
                                             std::string_view needle) noexcept {
  if (needle.empty()) {
    return true;
  }
  const auto IT = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                              [](char a, char b) {
                                return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b));
                              });
  return IT != haystack.end();
}

/* ----------------------------- Manipulation ----------------------------- */

/// Strip leading and trailing whitespace (spaces, tabs, CR, LF).
[[nodiscard]] inline std::string trim(std::string_view str) {
  std::size_t begin = 0;
  std::size_t end = str.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(str[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(str[end - 1])) != 0) {
    --end;
  }
  return std::string(str.substr(begin, end - begin));
}

/// Split on a single-character delimiter; fields are trimmed, empty fields kept.
[[nodiscard]] inline std::vector<std::string> split(std::string_view str, char delim) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t POS = str.find(delim, start);
    if (POS == std::string_view::npos) {
      out.push_back(trim(str.substr(start)));
      break;
    }
    out.push_back(trim(str.substr(start, POS - start)));
    start = POS + 1;
  }
  return out;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse a floating-point number occupying the whole (trimmed) field.
 * @return Value, or nullopt for empty, "[N/A]", "[Not Supported]" or garbage.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view field) {
  const std::string TEXT = trim(field);
  if (TEXT.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double VAL = std::strtod(TEXT.c_str(), &end);
  if (end == TEXT.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return VAL;
}

} // namespace strings
} // namespace helpers
} // namespace gpuinfo

#endif // GPUINFO_HELPERS_STRINGS_HPP
