/**
 * @file OsInfo_uTest.cpp
 * @brief Unit tests for gpuinfo::system::OsInfo.
 *
 * Notes:
 *  - os-release parsing is tested on fixed text.
 *  - getOsInfo() tests assert invariants only; distributions vary.
 */

#include "src/system/inc/OsInfo.hpp"

#include <gtest/gtest.h>

#include <string>

using gpuinfo::system::getOsInfo;
using gpuinfo::system::OsInfo;
using gpuinfo::system::osTypeFromId;
using gpuinfo::system::OsType;
using gpuinfo::system::parseOsRelease;
using gpuinfo::system::toString;

/* ----------------------------- OsType Tests ----------------------------- */

/** @test Known distribution IDs classify. */
TEST(OsTypeTest, FromId) {
  EXPECT_EQ(osTypeFromId("ubuntu"), OsType::UBUNTU);
  EXPECT_EQ(osTypeFromId("debian"), OsType::DEBIAN);
  EXPECT_EQ(osTypeFromId("rhel"), OsType::RHEL);
  EXPECT_EQ(osTypeFromId("amzn"), OsType::AMAZON);
  EXPECT_EQ(osTypeFromId("ol"), OsType::ORACLE_LINUX);
  EXPECT_EQ(osTypeFromId("opensuse-tumbleweed"), OsType::OPENSUSE);
  EXPECT_EQ(osTypeFromId("sles"), OsType::SUSE);
  EXPECT_EQ(osTypeFromId("linuxmint"), OsType::MINT);
}

/** @test Unrecognized IDs are generic Linux; empty is unknown. */
TEST(OsTypeTest, FallbackIds) {
  EXPECT_EQ(osTypeFromId("gentoo"), OsType::LINUX);
  EXPECT_EQ(osTypeFromId(""), OsType::UNKNOWN);
}

/** @test Display strings. */
TEST(OsTypeTest, ToString) {
  EXPECT_STREQ(toString(OsType::UBUNTU), "Ubuntu");
  EXPECT_STREQ(toString(OsType::LINUX), "Linux");
  EXPECT_STREQ(toString(OsType::UNKNOWN), "Unknown");
}

/* ----------------------------- Parsing Tests ----------------------------- */

/** @test A typical os-release file. */
TEST(OsReleaseParseTest, Ubuntu) {
  const std::string TEXT = "NAME=\"Ubuntu\"\n"
                           "VERSION_ID=\"22.04\"\n"
                           "ID=ubuntu\n"
                           "ID_LIKE=debian\n"
                           "PRETTY_NAME=\"Ubuntu 22.04.4 LTS\"\n"
                           "VERSION_CODENAME=jammy\n";
  OsInfo info{};
  ASSERT_TRUE(parseOsRelease(TEXT, info));
  EXPECT_EQ(info.type, OsType::UBUNTU);
  EXPECT_EQ(info.id, "ubuntu");
  EXPECT_EQ(info.name, "Ubuntu 22.04.4 LTS");
  EXPECT_EQ(info.version, "22.04");
  EXPECT_EQ(info.codename, "jammy");
}

/** @test Comments, blank lines and single quotes are handled; NAME backs up PRETTY_NAME. */
TEST(OsReleaseParseTest, CommentsAndQuotes) {
  const std::string TEXT = "# generated\n"
                           "\n"
                           "NAME='Fedora Linux'\n"
                           "ID='fedora'\n"
                           "VERSION_ID=40\n";
  OsInfo info{};
  ASSERT_TRUE(parseOsRelease(TEXT, info));
  EXPECT_EQ(info.type, OsType::FEDORA);
  EXPECT_EQ(info.name, "Fedora Linux");
  EXPECT_EQ(info.version, "40");
  EXPECT_TRUE(info.codename.empty());
}

/** @test Text without an ID is not recognized. */
TEST(OsReleaseParseTest, MissingId) {
  OsInfo info{};
  EXPECT_FALSE(parseOsRelease("NAME=Something\n", info));
  EXPECT_EQ(info.type, OsType::UNKNOWN);
}

/** @test JSON includes every field. */
TEST(OsReleaseParseTest, ToJson) {
  OsInfo info{};
  info.type = OsType::DEBIAN;
  info.id = "debian";
  info.architecture = "x86_64";
  info.bitDepth = 64;
  const std::string JSON = info.toJson();
  EXPECT_NE(JSON.find("\"type\":\"Debian\""), std::string::npos);
  EXPECT_NE(JSON.find("\"bitDepth\":64"), std::string::npos);
  EXPECT_NE(JSON.find("\"architecture\":\"x86_64\""), std::string::npos);
}

/* ----------------------------- Live System Tests ----------------------------- */

class OsInfoTest : public ::testing::Test {
protected:
  OsInfo info_{};

  void SetUp() override { info_ = getOsInfo(); }
};

/** @test uname always reports architecture and kernel on Linux. */
TEST_F(OsInfoTest, UnameFields) {
  EXPECT_FALSE(info_.architecture.empty());
  EXPECT_FALSE(info_.kernelRelease.empty());
  EXPECT_NE(info_.type, OsType::UNKNOWN);
}

/** @test Bit depth is 0, 32 or 64. */
TEST_F(OsInfoTest, BitDepthRange) {
  EXPECT_TRUE(info_.bitDepth == 0 || info_.bitDepth == 32 || info_.bitDepth == 64)
      << "bitDepth: " << info_.bitDepth;
}

/** @test toString is non-empty. */
TEST_F(OsInfoTest, ToStringNotEmpty) { EXPECT_FALSE(info_.toString().empty()); }
