#include "gtest/gtest.h"
#include "faasbox/utils/string_utils.hpp"
#include "faasbox/utils/hash_utils.hpp"

using namespace std;
using namespace faasbox::utils;

TEST(StringUtilsTest, TrimAndCase) {
    EXPECT_EQ(StringUtils::Trim("  abc \n"), "abc");
    EXPECT_EQ(StringUtils::Trim(" \t\n"), "");
    EXPECT_EQ(StringUtils::TrimRight("  2\n\n"), "  2");
    EXPECT_EQ(StringUtils::ToLower("GVisor"), "gvisor");
}

TEST(StringUtilsTest, SplitSkipsEmptyTokens) {
    auto parts = StringUtils::Split("a//b/", '/');
    ASSERT_EQ(parts.size(), 2u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[1], "b");
}

TEST(StringUtilsTest, Contains) {
    EXPECT_TRUE(StringUtils::Contains("OCI runtime exec failed: exec failed", "OCI runtime exec failed"));
    EXPECT_FALSE(StringUtils::Contains("", "Error"));
}

TEST(StringUtilsTest, ParseSizeToBytes) {
    EXPECT_EQ(StringUtils::ParseSizeToBytes("512B").value(), 512u);
    EXPECT_EQ(StringUtils::ParseSizeToBytes("20KiB").value(), 20480u);
    EXPECT_EQ(StringUtils::ParseSizeToBytes("1.5kB").value(), 1500u);
    EXPECT_EQ(StringUtils::ParseSizeToBytes(" 2MiB ").value(), 2u * 1024 * 1024);
    EXPECT_EQ(StringUtils::ParseSizeToBytes("1GB").value(), 1000000000u);
    EXPECT_EQ(StringUtils::ParseSizeToBytes("42").value(), 42u);
    EXPECT_FALSE(StringUtils::ParseSizeToBytes("").has_value());
    EXPECT_FALSE(StringUtils::ParseSizeToBytes("lots").has_value());
    EXPECT_FALSE(StringUtils::ParseSizeToBytes("12 parsecs").has_value());
}

TEST(StringUtilsTest, ParsePercent) {
    EXPECT_DOUBLE_EQ(StringUtils::ParsePercent("12.34%").value(), 12.34);
    EXPECT_DOUBLE_EQ(StringUtils::ParsePercent("0.00%").value(), 0.0);
    EXPECT_FALSE(StringUtils::ParsePercent("--").has_value());
    EXPECT_FALSE(StringUtils::ParsePercent("").has_value());
}

TEST(StringUtilsTest, ShortId) {
    EXPECT_EQ(StringUtils::ShortId("0123456789abcdef0123"), "0123456789ab");
    EXPECT_EQ(StringUtils::ShortId("abc"), "abc");
}

TEST(HashUtilsTest, SHA256KnownVector) {
    EXPECT_EQ(HashUtils::ComputeSHA256("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashUtils::ComputeSHA256(""),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashUtilsTest, ShortDigest) {
    EXPECT_EQ(HashUtils::ShortDigest("abc"), "ba7816bf8f01");
    EXPECT_EQ(HashUtils::ShortDigest("abc", 4), "ba78");
}
