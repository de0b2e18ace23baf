// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <vector>

#include "pipeline.hpp"

#include "common/gtest_utils.hpp"

using namespace idval;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace {

TEST(TestPipeline, CheckAadhaar)
{
    auto result = check_identifier("234123412346");
    EXPECT_EQ(result.identifier, "234123412346");
    EXPECT_EQ(result.type, identifier_type::aadhaar);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.flags, IsEmpty());
}

TEST(TestPipeline, CheckGstinKeepsOriginalCase)
{
    auto result = check_identifier("27aapfu0939f1zv");
    EXPECT_EQ(result.identifier, "27aapfu0939f1zv");
    EXPECT_EQ(result.type, identifier_type::gstin);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.flags, IsEmpty());
}

TEST(TestPipeline, CheckInvalidImei)
{
    auto result = check_identifier("123456789012345");
    EXPECT_EQ(result.type, identifier_type::imei);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.flags, IsEmpty());
}

TEST(TestPipeline, CheckUnrecognized)
{
    const validation_result expected{.identifier = "abc",
        .type = identifier_type::unrecognized,
        .valid = false,
        .flags = {fraud_flag::unrecognized_format}};
    EXPECT_EQ(check_identifier("abc"), expected);
}

TEST(TestPipeline, UnrecognizedSkipsHeuristics)
{
    // Would raise repeated_digits if the heuristics were evaluated
    auto result = check_identifier("1111");
    EXPECT_EQ(result.type, identifier_type::unrecognized);
    EXPECT_FALSE(result.valid);
    EXPECT_THAT(result.flags, ElementsAre(fraud_flag::unrecognized_format));
}

TEST(TestPipeline, FlagsDoNotAffectValidity)
{
    auto result = check_identifier("999999999999");
    EXPECT_EQ(result.type, identifier_type::aadhaar);
    EXPECT_TRUE(result.valid);
    EXPECT_THAT(result.flags, ElementsAre(fraud_flag::repeated_digits));
}

TEST(TestPipeline, BatchPreservesOrder)
{
    const std::vector<std::string> tokens{
        "4539148803436467", "abc", "27AAPFU0939F1ZV", "490154203237518", "234123412346"};

    auto results = process_batch(tokens);
    ASSERT_EQ(results.size(), tokens.size());
    for (std::size_t i = 0; i < tokens.size(); ++i) { EXPECT_EQ(results[i].identifier, tokens[i]); }

    EXPECT_EQ(results[0].type, identifier_type::card);
    EXPECT_EQ(results[1].type, identifier_type::unrecognized);
    EXPECT_EQ(results[2].type, identifier_type::gstin);
    EXPECT_EQ(results[3].type, identifier_type::imei);
    EXPECT_EQ(results[4].type, identifier_type::aadhaar);
}

TEST(TestPipeline, BatchWithDuplicates)
{
    const std::vector<std::string> tokens{"abc", "abc", "234123412346", "abc"};

    auto results = process_batch(tokens);
    ASSERT_EQ(results.size(), 4U);
    EXPECT_EQ(results[0], results[1]);
    EXPECT_EQ(results[1], results[3]);
    EXPECT_TRUE(results[2].valid);
}

TEST(TestPipeline, BatchIsIdempotent)
{
    const std::vector<std::string> tokens{"4539148803436468", "111111111111", "27AAPFU0939F1ZW",
        "999999999999", "hello", "4242424242424242"};

    auto first = process_batch(tokens);
    auto second = process_batch(tokens);
    EXPECT_EQ(first, second);
}

TEST(TestPipeline, EmptyBatch) { EXPECT_THAT(process_batch({}), IsEmpty()); }

} // namespace
