/*
 * Part of the StaticFetch (SF) project.
 *
 * SPDX-FileCopyrightText: 2025 StaticFetch contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <string>
#include <unordered_map>

#include "sf/internal/utils.hpp"

using namespace sf::internal;

TEST(UtilsTest, ParseDecimal) {
    std::uint64_t v = 0;
    EXPECT_TRUE(parse_u64_dec("0", v));
    EXPECT_EQ(0u, v);
    EXPECT_TRUE(parse_u64_dec("18446744073709551615", v));
    EXPECT_EQ(18446744073709551615ull, v);
    EXPECT_FALSE(parse_u64_dec("18446744073709551616", v));
    EXPECT_FALSE(parse_u64_dec("", v));
    EXPECT_FALSE(parse_u64_dec("-1", v));
    EXPECT_FALSE(parse_u64_dec(" 1", v));
    EXPECT_FALSE(parse_u64_dec("1e3", v));
}

TEST(UtilsTest, ParseHex) {
    std::uint64_t v = 0;
    EXPECT_TRUE(parse_u64_hex("1a", v));
    EXPECT_EQ(26u, v);
    EXPECT_TRUE(parse_u64_hex("FFFFFFFFFFFFFFFF", v));
    EXPECT_FALSE(parse_u64_hex("10000000000000000", v));
    EXPECT_FALSE(parse_u64_hex("0x10", v));
    EXPECT_FALSE(parse_u64_hex("", v));
}

TEST(UtilsTest, HeaderLookupIgnoresCase) {
    std::unordered_map<std::string, std::string> h{{"Content-Length", "5"}};
    EXPECT_EQ("5", hdr_ci(h, "content-length"));
    EXPECT_EQ("5", hdr_ci(h, "Content-Length"));
    EXPECT_EQ("", hdr_ci(h, "Location"));
}

TEST(UtilsTest, Trim) {
    std::string s = " \t value \r\n";
    trim_inplace(s);
    EXPECT_EQ("value", s);
}

TEST(UtilsTest, IpLiterals) {
    EXPECT_TRUE(is_ip_literal("127.0.0.1"));
    EXPECT_TRUE(is_ip_literal("::1"));
    EXPECT_FALSE(is_ip_literal("localhost"));
    EXPECT_FALSE(is_ip_literal("[::1]"));
}
