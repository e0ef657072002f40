#ifndef GPUINFO_HELPERS_ARGS_HPP
#define GPUINFO_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the gpuinfo tools.
 * @note Cold-path: Allocates for parsed results and messages.
 */

#include <algorithm>     // std::sort
#include <cstddef>       // std::size_t, std::ptrdiff_t
#include <cstdint>       // std::uint8_t, std::uint64_t
#include <cstdlib>       // strtoull
#include <optional>      // std::optional
#include <span>          // std::span
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map
#include <utility>       // std::pair
#include <vector>        // std::vector

#include <fmt/core.h>

namespace gpuinfo {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--ttl"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for --help
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 *
 * Unknown tokens are ignored. A matched flag consumes the next nargs tokens
 * literally as its values.
 *
 * @param args Argument views (must outlive pargs).
 * @param map Accepted flags.
 * @param pargs Output map of parsed values.
 * @param error Set to a message on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::uint8_t> byFlag;
  byFlag.reserve(map.size());
  for (const auto& [KEY, DEF] : map) {
    byFlag.emplace(DEF.flag, KEY);
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = byFlag.find(args[i]);
    if (IT == byFlag.end()) {
      continue;
    }
    const ArgDef& DEF = map.at(IT->second);
    if (i + DEF.nargs >= args.size()) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& values = pargs[IT->second];
    values.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
                  args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    i += DEF.nargs;
  }

  for (const auto& [KEY, DEF] : map) {
    if (DEF.required && pargs.count(KEY) == 0) {
      error = fmt::format("Missing required argument '{}'", DEF.flag);
      return false;
    }
  }

  return true;
}

/**
 * @brief Parse a flag value as an unsigned integer.
 * @return Value, or nullopt if the flag is absent or not a number.
 */
[[nodiscard]] inline std::optional<std::uint64_t> uintValue(const ParsedArgs& pargs,
                                                            std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  const std::string TEXT(IT->second.front());
  char* end = nullptr;
  const unsigned long long VAL = std::strtoull(TEXT.c_str(), &end, 10);
  if (TEXT.empty() || TEXT.front() == '-' || *end != '\0') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VAL);
}

/**
 * @brief Print usage text generated from the argument map.
 * @param progName Program name (argv[0]).
 * @param description One-line tool description.
 * @param map Accepted flags.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<std::pair<std::string, const ArgDef*>> rows;
  rows.reserve(map.size());
  for (const auto& KV : map) {
    std::string left(KV.second.flag);
    for (std::uint8_t n = 0; n < KV.second.nargs; ++n) {
      left += " <value>";
    }
    rows.emplace_back(std::move(left), &KV.second);
  }
  std::sort(rows.begin(), rows.end(),
            [](const auto& a, const auto& b) { return a.second->flag < b.second->flag; });

  for (const auto& ROW : rows) {
    fmt::print("  {:<22}  {}{}\n", ROW.first, ROW.second->desc,
               ROW.second->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace gpuinfo

#endif // GPUINFO_HELPERS_ARGS_HPP
