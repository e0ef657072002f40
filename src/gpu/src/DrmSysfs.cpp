/**
 * @file DrmSysfs.cpp
 * @brief DRM card enumeration and hwmon readers.
 */

#include "src/gpu/inc/DrmSysfs.hpp"

#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <algorithm> // std::sort
#include <cstdlib>   // std::strtoul
#include <limits>    // std::numeric_limits
#include <sstream>   // std::istringstream
#include <utility>   // std::pair, std::move

namespace gpuinfo {

namespace gpu {

namespace drm {

using gpuinfo::helpers::files::isDirectory;
using gpuinfo::helpers::files::listEntries;
using gpuinfo::helpers::files::readHex;
using gpuinfo::helpers::files::readInt64;
using gpuinfo::helpers::files::readLine;
using gpuinfo::helpers::files::readUint64;

namespace {

/// Numeric suffix of "cardN"; nullopt for connectors such as "card0-HDMI-A-1".
std::optional<unsigned long> cardNumber(const std::string& name) {
  if (name.size() <= 4 || name.find('-') != std::string::npos) {
    return std::nullopt;
  }
  const std::string DIGITS = name.substr(4);
  char* end = nullptr;
  const unsigned long NUM = std::strtoul(DIGITS.c_str(), &end, 10);
  if (end == DIGITS.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return NUM;
}

/// hwmon directories under a PCI device, sorted.
std::vector<std::string> hwmonDirs(const std::string& devicePath) {
  std::vector<std::string> out;
  const std::string BASE = devicePath + "/hwmon";
  for (const auto& NAME : listEntries(BASE, "hwmon")) {
    out.push_back(BASE + "/" + NAME);
  }
  return out;
}

} // namespace

/* ----------------------------- Cards ----------------------------- */

std::vector<DrmCard> listCards(const std::string& sysRoot, std::uint32_t pciVendor) {
  const std::string DRM_DIR = sysRoot + "/class/drm";

  std::vector<std::pair<unsigned long, DrmCard>> found;
  for (const auto& NAME : listEntries(DRM_DIR, "card")) {
    const auto NUM = cardNumber(NAME);
    if (!NUM) {
      continue;
    }

    DrmCard card{};
    card.name = NAME;
    card.cardPath = DRM_DIR + "/" + NAME;
    card.devicePath = card.cardPath + "/device";
    if (!isDirectory(card.devicePath)) {
      continue;
    }
    const auto VENDOR = readHex(card.devicePath + "/vendor");
    if (!VENDOR || *VENDOR != pciVendor) {
      continue;
    }
    card.pciVendor = *VENDOR;
    card.pciDevice = readHex(card.devicePath + "/device");
    found.emplace_back(*NUM, std::move(card));
  }

  std::sort(found.begin(), found.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  std::vector<DrmCard> cards;
  cards.reserve(found.size());
  for (auto& entry : found) {
    cards.push_back(std::move(entry.second));
  }
  return cards;
}

/* ----------------------------- hwmon ----------------------------- */

std::optional<double> hwmonTemperatureC(const std::string& devicePath) {
  for (const auto& DIR : hwmonDirs(devicePath)) {
    if (const auto MILLI = readInt64(DIR + "/temp1_input")) {
      return static_cast<double>(*MILLI) / 1000.0;
    }
  }
  return std::nullopt;
}

std::optional<double> hwmonPowerW(const std::string& devicePath, const std::string& attribute) {
  for (const auto& DIR : hwmonDirs(devicePath)) {
    if (const auto MICRO = readUint64(DIR + "/" + attribute)) {
      return static_cast<double>(*MICRO) / 1'000'000.0;
    }
  }
  return std::nullopt;
}

/* ----------------------------- Attributes ----------------------------- */

std::optional<std::uint32_t> readUint32(const std::string& path) {
  const auto VAL = readUint64(path);
  if (!VAL || *VAL > std::numeric_limits<std::uint32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*VAL);
}

std::optional<std::uint32_t> parseDpmClockMHz(const std::string& text, bool activeOnly) {
  std::optional<std::uint32_t> best;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const std::size_t COLON = line.find(':');
    if (COLON == std::string::npos) {
      continue;
    }
    const bool ACTIVE = line.find('*') != std::string::npos;
    if (activeOnly && !ACTIVE) {
      continue;
    }

    const std::string FIELD = gpuinfo::helpers::strings::trim(line.substr(COLON + 1));
    char* end = nullptr;
    const unsigned long MHZ = std::strtoul(FIELD.c_str(), &end, 10);
    if (end == FIELD.c_str()) {
      continue;
    }
    const auto VALUE = static_cast<std::uint32_t>(MHZ);
    if (activeOnly) {
      return VALUE;
    }
    if (!best || VALUE > *best) {
      best = VALUE;
    }
  }
  return best;
}

std::optional<std::string> moduleVersion(const std::string& sysRoot, const std::string& module) {
  return readLine(sysRoot + "/module/" + module + "/version");
}

} // namespace drm

} // namespace gpu

} // namespace gpuinfo
