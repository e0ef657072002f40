/**
 * @file OsInfo.cpp
 * @brief os-release and uname collection.
 */

#include "src/system/inc/OsInfo.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <sys/utsname.h> // uname

#include <sstream> // std::istringstream

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace gpuinfo {

namespace system {

namespace {

using gpuinfo::helpers::files::readText;
using gpuinfo::helpers::format::jsonEscape;
using gpuinfo::helpers::strings::trim;

/// Strip one level of matching single or double quotes.
std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') &&
      value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

/// Bit depth from a uname machine string.
int bitDepthFromMachine(const std::string& machine) noexcept {
  if (machine == "x86_64" || machine == "aarch64" || machine == "ppc64" ||
      machine == "ppc64le" || machine == "s390x" || machine == "riscv64" ||
      machine == "loongarch64" || machine == "mips64") {
    return 64;
  }
  if (machine == "i386" || machine == "i586" || machine == "i686" || machine == "armv7l" ||
      machine == "armv6l" || machine == "riscv32" || machine == "mips") {
    return 32;
  }
  return 0;
}

} // namespace

/* ----------------------------- OsType ----------------------------- */

const char* toString(OsType type) noexcept {
  switch (type) {
  case OsType::LINUX:
    return "Linux";
  case OsType::ALMA_LINUX:
    return "AlmaLinux";
  case OsType::ALPINE:
    return "Alpine Linux";
  case OsType::AMAZON:
    return "Amazon Linux";
  case OsType::ARCH:
    return "Arch Linux";
  case OsType::CENTOS:
    return "CentOS";
  case OsType::DEBIAN:
    return "Debian";
  case OsType::FEDORA:
    return "Fedora";
  case OsType::KALI:
    return "Kali Linux";
  case OsType::MINT:
    return "Linux Mint";
  case OsType::NIXOS:
    return "NixOS";
  case OsType::OPENSUSE:
    return "openSUSE";
  case OsType::ORACLE_LINUX:
    return "Oracle Linux";
  case OsType::RHEL:
    return "Red Hat Enterprise Linux";
  case OsType::ROCKY:
    return "Rocky Linux";
  case OsType::SUSE:
    return "SUSE Linux Enterprise";
  case OsType::UBUNTU:
    return "Ubuntu";
  case OsType::VOID:
    return "Void Linux";
  default:
    return "Unknown";
  }
}

OsType osTypeFromId(const std::string& id) noexcept {
  if (id.empty()) {
    return OsType::UNKNOWN;
  }
  if (id == "almalinux")
    return OsType::ALMA_LINUX;
  if (id == "alpine")
    return OsType::ALPINE;
  if (id == "amzn")
    return OsType::AMAZON;
  if (id == "arch" || id == "archarm")
    return OsType::ARCH;
  if (id == "centos")
    return OsType::CENTOS;
  if (id == "debian")
    return OsType::DEBIAN;
  if (id == "fedora")
    return OsType::FEDORA;
  if (id == "kali")
    return OsType::KALI;
  if (id == "linuxmint")
    return OsType::MINT;
  if (id == "nixos")
    return OsType::NIXOS;
  if (id == "opensuse" || id == "opensuse-leap" || id == "opensuse-tumbleweed" ||
      id == "opensuse-microos")
    return OsType::OPENSUSE;
  if (id == "ol")
    return OsType::ORACLE_LINUX;
  if (id == "rhel")
    return OsType::RHEL;
  if (id == "rocky")
    return OsType::ROCKY;
  if (id == "sles" || id == "sled" || id == "sles_sap")
    return OsType::SUSE;
  if (id == "ubuntu")
    return OsType::UBUNTU;
  if (id == "void")
    return OsType::VOID;
  return OsType::LINUX;
}

/* ----------------------------- OsInfo ----------------------------- */

std::string OsInfo::toString() const {
  return fmt::format("{} {} ({}), kernel {}, {} {}-bit",
                     name.empty() ? gpuinfo::system::toString(type) : name,
                     version.empty() ? "N/A" : version, codename.empty() ? "N/A" : codename,
                     kernelRelease.empty() ? "N/A" : kernelRelease,
                     architecture.empty() ? "N/A" : architecture, bitDepth);
}

std::string OsInfo::toJson() const {
  return fmt::format("{{\"type\":\"{}\",\"id\":\"{}\",\"name\":\"{}\",\"version\":\"{}\","
                     "\"codename\":\"{}\",\"architecture\":\"{}\",\"bitDepth\":{},"
                     "\"kernelRelease\":\"{}\"}}",
                     gpuinfo::system::toString(type), jsonEscape(id), jsonEscape(name),
                     jsonEscape(version), jsonEscape(codename), jsonEscape(architecture),
                     bitDepth, jsonEscape(kernelRelease));
}

/* ----------------------------- API ----------------------------- */

bool parseOsRelease(const std::string& text, OsInfo& info) {
  std::string prettyName;
  std::string plainName;
  bool haveId = false;

  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    const std::string TRIMMED = trim(line);
    if (TRIMMED.empty() || TRIMMED.front() == '#') {
      continue;
    }
    const std::size_t EQ = TRIMMED.find('=');
    if (EQ == std::string::npos) {
      continue;
    }
    const std::string KEY = TRIMMED.substr(0, EQ);
    const std::string VALUE = unquote(TRIMMED.substr(EQ + 1));

    if (KEY == "ID") {
      info.id = VALUE;
      haveId = true;
    } else if (KEY == "PRETTY_NAME") {
      prettyName = VALUE;
    } else if (KEY == "NAME") {
      plainName = VALUE;
    } else if (KEY == "VERSION_ID") {
      info.version = VALUE;
    } else if (KEY == "VERSION_CODENAME") {
      info.codename = VALUE;
    }
  }

  info.name = prettyName.empty() ? plainName : prettyName;
  info.type = haveId ? osTypeFromId(info.id) : OsType::UNKNOWN;
  return haveId;
}

OsInfo getOsInfo() {
  OsInfo info{};

  auto text = readText(OS_RELEASE_PATH);
  if (!text) {
    text = readText(OS_RELEASE_FALLBACK_PATH);
  }
  if (!text || !parseOsRelease(*text, info)) {
    spdlog::debug("os-release not readable, OS distribution unknown");
  }

  struct utsname uts{};
  if (::uname(&uts) == 0) {
    info.architecture = uts.machine;
    info.kernelRelease = uts.release;
    info.bitDepth = bitDepthFromMachine(info.architecture);
    if (info.type == OsType::UNKNOWN) {
      info.type = OsType::LINUX;
    }
  } else {
    spdlog::warn("uname failed, architecture unknown");
  }

  return info;
}

} // namespace system

} // namespace gpuinfo
