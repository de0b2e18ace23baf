// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <bitset>
#include <cstddef>
#include <limits>
#include <string_view>
#include <vector>

#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace idval {

namespace {

std::size_t distinct_characters(std::string_view value)
{
    std::bitset<std::numeric_limits<unsigned char>::max() + 1> seen;
    for (auto c : value) { seen.set(static_cast<unsigned char>(toupper(c))); }
    return seen.count();
}

} // namespace

std::vector<fraud_flag> fraud_flags(std::string_view value, identifier_type type)
{
    std::vector<fraud_flag> flags;
    if (type == identifier_type::unrecognized) {
        return flags;
    }

    if (distinct_characters(value) <= 2) {
        flags.emplace_back(fraud_flag::repeated_digits);
    }

    if (type == identifier_type::aadhaar && !value.empty() &&
        (value.front() == '0' || value.front() == '1')) {
        flags.emplace_back(fraud_flag::invalid_aadhaar_start);
    }

    // Unreachable for values detected as GSTIN, whose shape already
    // requires a numeric state code.
    if (type == identifier_type::gstin) {
        auto state_code = value.substr(0, 2);
        if (state_code.empty() || !std::all_of(state_code.begin(), state_code.end(),
                                      [](char c) { return isdigit(c); })) {
            flags.emplace_back(fraud_flag::invalid_gstin_state_code);
        }
    }

    IDVAL_TRACE("{} '{}' raised {} fraud flag(s)", identifier_type_to_string(type), value,
        flags.size());
    return flags;
}

} // namespace idval
