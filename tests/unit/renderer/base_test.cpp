// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include "exception.hpp"
#include "pipeline.hpp"
#include "renderer/base.hpp"

#include "common/gtest_utils.hpp"

using namespace idval;

namespace {

TEST(TestRenderer, SummaryRow)
{
    EXPECT_EQ(to_summary_row(check_identifier("234123412346")),
        (summary_row{"234123412346", "Aadhaar", "Yes", "-"}));
    EXPECT_EQ(to_summary_row(check_identifier("4539148803436468")),
        (summary_row{"4539148803436468", "Card", "No", "-"}));
    EXPECT_EQ(to_summary_row(check_identifier("xyz")),
        (summary_row{"xyz", "Unknown", "No", "Unrecognized or invalid format"}));
}

TEST(TestRenderer, SummaryRowJoinsFlags)
{
    const validation_result result{.identifier = "111111111111",
        .type = identifier_type::aadhaar,
        .valid = false,
        .flags = {fraud_flag::repeated_digits, fraud_flag::invalid_aadhaar_start}};

    EXPECT_EQ(to_summary_row(result).flags, "Repeated digits, Invalid Aadhaar start digit");
}

TEST(TestRenderer, StatusLines)
{
    EXPECT_EQ(status_lines(check_identifier("27AAPFU0939F1ZV")),
        "GSTIN number 27AAPFU0939F1ZV is VALID\n");
    EXPECT_EQ(status_lines(check_identifier("999999999999")),
        "Aadhaar number 999999999999 is VALID\nFraud flag: Repeated digits\n");
    EXPECT_EQ(status_lines(check_identifier("abc")),
        "Unknown number abc is INVALID\nFraud flag: Unrecognized or invalid format\n");
}

TEST(TestRenderer, MakeRenderer)
{
    EXPECT_STR(make_renderer("table")->name(), "table");
    EXPECT_STR(make_renderer("YAML")->name(), "yaml");
    EXPECT_THROW(make_renderer("pdf"), parsing_error);

    EXPECT_TRUE(is_supported_format("Table"));
    EXPECT_FALSE(is_supported_format("csv"));
}

} // namespace
