// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "identifier_type.hpp"

namespace idval {

// Values are kept in sync with IDVAL_FRAUD_FLAG
enum class fraud_flag : uint32_t {
    repeated_digits = 1U << 0,
    invalid_aadhaar_start = 1U << 1,
    invalid_gstin_state_code = 1U << 2,
    unrecognized_format = 1U << 3,
};

inline std::string_view fraud_flag_to_string(fraud_flag flag)
{
    switch (flag) {
    case fraud_flag::repeated_digits:
        return "Repeated digits";
    case fraud_flag::invalid_aadhaar_start:
        return "Invalid Aadhaar start digit";
    case fraud_flag::invalid_gstin_state_code:
        return "Invalid GSTIN state code";
    case fraud_flag::unrecognized_format:
        return "Unrecognized or invalid format";
    }
    return {};
}

// Structural heuristics, evaluated in a fixed order regardless of the
// checksum outcome. The flags are advisory and never imply invalidity.
std::vector<fraud_flag> fraud_flags(std::string_view value, identifier_type type);

} // namespace idval
