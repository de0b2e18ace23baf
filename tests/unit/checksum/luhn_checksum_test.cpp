// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include "checksum/luhn_checksum.hpp"

#include "common/gtest_utils.hpp"

using namespace idval;

namespace {

TEST(TestLuhnChecksum, Name) { EXPECT_STR(luhn_checksum{}.name(), "luhn"); }

TEST(TestLuhnChecksum, Luhn)
{
    // Random visa
    EXPECT_TRUE(luhn_checksum{}.validate("4539148803436467"));
    EXPECT_TRUE(luhn_checksum{}.validate("4222222222222"));
    EXPECT_TRUE(luhn_checksum{}.validate("4242424242424242"));

    // Random mastercard
    EXPECT_TRUE(luhn_checksum{}.validate("5425233430109903"));

    // Random discover
    EXPECT_TRUE(luhn_checksum{}.validate("6011000990139424"));

    // Random IMEI
    EXPECT_TRUE(luhn_checksum{}.validate("350009218041876"));
    EXPECT_TRUE(luhn_checksum{}.validate("490154203237518"));

    // Edge case
    EXPECT_TRUE(luhn_checksum{}.validate("0"));
    EXPECT_TRUE(luhn_checksum{}.validate("0000000000000"));
    EXPECT_TRUE(luhn_checksum{}.validate("79927398713"));

    // Invalid
    EXPECT_FALSE(luhn_checksum{}.validate("4539148803436468"));
    EXPECT_FALSE(luhn_checksum{}.validate("123456789012345"));
    EXPECT_FALSE(luhn_checksum{}.validate("4111111111111"));
    EXPECT_FALSE(luhn_checksum{}.validate("1"));
    EXPECT_FALSE(luhn_checksum{}.validate(""));
}

TEST(TestLuhnChecksum, NonDigitsAreRejected)
{
    EXPECT_FALSE(luhn_checksum{}.validate("4539 1488 0343 6467"));
    EXPECT_FALSE(luhn_checksum{}.validate("4539-1488-0343-6467"));
    EXPECT_FALSE(luhn_checksum{}.validate("453914880343646A"));
    EXPECT_FALSE(luhn_checksum{}.validate("              "));
}

TEST(TestLuhnChecksum, DoubledDigitAboveNine)
{
    // 5 doubled is 10, folded into 1: 1 + 9 = 10
    EXPECT_TRUE(luhn_checksum{}.validate("59"));
    EXPECT_FALSE(luhn_checksum{}.validate("58"));
    // 9 doubled is 18, folded into 9: 9 + 1 = 10
    EXPECT_TRUE(luhn_checksum{}.validate("91"));
}

} // namespace
