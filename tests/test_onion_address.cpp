#include <gtest/gtest.h>

#include <string>

#include "discovery/OnionAddress.hpp"
#include "Fakes.hpp"

using namespace onionsite;
using onionsite::test::sample_onion;

TEST(OnionAddress, AcceptsExactShape) {
    EXPECT_TRUE(is_onion_address(sample_onion()));
    EXPECT_TRUE(is_onion_address(std::string(56, 'a') + ".onion"));
    EXPECT_TRUE(is_onion_address(std::string(56, '7') + ".onion"));
}

TEST(OnionAddress, RejectsNearMisses) {
    const std::string id(56, 'a');
    EXPECT_FALSE(is_onion_address(""));
    EXPECT_FALSE(is_onion_address(".onion"));
    EXPECT_FALSE(is_onion_address(std::string(55, 'a') + ".onion"));    // short
    EXPECT_FALSE(is_onion_address(std::string(57, 'a') + ".onion"));    // long
    EXPECT_FALSE(is_onion_address(std::string(16, 'a') + ".onion"));    // v2
    EXPECT_FALSE(is_onion_address(id + ".onion."));
    EXPECT_FALSE(is_onion_address(id + ".ONION"));
    EXPECT_FALSE(is_onion_address(id + ".onio"));
    EXPECT_FALSE(is_onion_address(id + "xonion"));
    EXPECT_FALSE(is_onion_address("A" + std::string(55, 'a') + ".onion"));  // uppercase
    EXPECT_FALSE(is_onion_address("1" + std::string(55, 'a') + ".onion"));  // not base32
    EXPECT_FALSE(is_onion_address("8" + std::string(55, 'a') + ".onion"));
    EXPECT_FALSE(is_onion_address("0" + std::string(55, 'a') + ".onion"));
    EXPECT_FALSE(is_onion_address(" " + id + ".onion"));                    // untrimmed
    EXPECT_FALSE(is_onion_address("http://" + id + ".onion"));
}

TEST(OnionAddress, TrimStripsBothEnds) {
    EXPECT_EQ(trim("  x \t\r"), "x");
    EXPECT_EQ(trim("\n\n"), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(OnionAddress, FindsTrimmedMiddleLine) {
    const std::string out = "foo\n  " + sample_onion() + "\t\nbar";
    auto found = find_onion_address(out);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, sample_onion());
}

TEST(OnionAddress, HandlesCrLf) {
    auto found = find_onion_address("header\r\n" + sample_onion() + "\r\n");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, sample_onion());
}

TEST(OnionAddress, FirstFullMatchWins) {
    const std::string second = std::string(56, 'b') + ".onion";
    auto found = find_onion_address(sample_onion() + "\n" + second + "\n");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, sample_onion());
}

TEST(OnionAddress, IgnoresMalformedInterleavedLines) {
    const std::string id(56, 'c');
    const std::string out =
        "Onion address: " + id + ".onion\n"                      // not the whole line
        "abcdefghijklmnopqrstuvwxyz234567abcdefghijklmnopqrstuvwxyz2.onion\n"  // 59 chars
        + std::string(56, 'C') + ".onion\n"                      // uppercase
        + id.substr(0, 55) + "1.onion\n";                        // bad alphabet
    EXPECT_FALSE(find_onion_address(out).has_value());

    auto found = find_onion_address(out + id + ".onion\n");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, id + ".onion");
}

TEST(OnionAddress, EmptyOutput) {
    EXPECT_FALSE(find_onion_address("").has_value());
    EXPECT_FALSE(find_onion_address("\n\n\n").has_value());
}
