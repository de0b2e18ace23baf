// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog
// (https://www.datadoghq.com/). Copyright 2022 Datadog, Inc.

#include <limits>
#include <unordered_map>

#include "utils.hpp"

#include "common/gtest_utils.hpp"

using namespace idval;

namespace {
constexpr char char_min = std::numeric_limits<char>::min();
constexpr char char_max = std::numeric_limits<char>::max();

TEST(TestUtils, IsDigit)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= '0' && c <= '9') {
            EXPECT_TRUE(isdigit(c));
        } else {
            EXPECT_FALSE(isdigit(c));
        }
    }
}

TEST(TestUtils, IsSpace)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v') {
            EXPECT_TRUE(isspace(c));
        } else {
            EXPECT_FALSE(isspace(c));
        }
    }
}

TEST(TestUtils, IsUpper)
{
    for (char c = char_min; c < char_max; ++c) {
        if (c >= 'A' && c <= 'Z') {
            EXPECT_TRUE(isupper(c));
        } else {
            EXPECT_FALSE(isupper(c));
        }
    }
}

TEST(TestUtils, ToUpper)
{
    std::unordered_map<char, char> mapping{{'a', 'A'}, {'b', 'B'}, {'c', 'C'}, {'d', 'D'},
        {'e', 'E'}, {'f', 'F'}, {'g', 'G'}, {'h', 'H'}, {'i', 'I'}, {'j', 'J'}, {'k', 'K'},
        {'l', 'L'}, {'m', 'M'}, {'n', 'N'}, {'o', 'O'}, {'p', 'P'}, {'q', 'Q'}, {'r', 'R'},
        {'s', 'S'}, {'t', 'T'}, {'u', 'U'}, {'v', 'V'}, {'w', 'W'}, {'x', 'X'}, {'y', 'Y'},
        {'z', 'Z'}};

    for (char c = char_min; c < char_max; ++c) {
        auto uc = toupper(c);
        EXPECT_FALSE((uc >= 'a' && uc <= 'z'));

        if (c >= 'a' && c <= 'z') {
            EXPECT_EQ(mapping[c], uc);
        } else {
            EXPECT_EQ(c, uc);
        }
    }
}

TEST(TestUtils, ToUpperString)
{
    EXPECT_EQ(to_upper("27aapfu0939f1zv"), "27AAPFU0939F1ZV");
    EXPECT_EQ(to_upper("MiXeD 123"), "MIXED 123");
    EXPECT_EQ(to_upper(""), "");
}

TEST(TestUtils, Trim)
{
    EXPECT_STR(trim("  234123412346 "), "234123412346");
    EXPECT_STR(trim("\t\r\n27AAPFU0939F1ZV\r"), "27AAPFU0939F1ZV");
    EXPECT_STR(trim("4539 1488"), "4539 1488");
    EXPECT_STR(trim(" \t\n "), "");
    EXPECT_STR(trim(""), "");
}

TEST(TestUtils, StringIEquals)
{
    EXPECT_TRUE(string_iequals("table", "TABLE"));
    EXPECT_TRUE(string_iequals("Yaml", "yAML"));
    EXPECT_FALSE(string_iequals("table", "tables"));

    EXPECT_TRUE(string_iequals_literal("DeBuG", "debug"));
    EXPECT_FALSE(string_iequals_literal("debug1", "debug"));
}

} // namespace
