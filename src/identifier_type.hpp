// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <cstdint>
#include <string_view>

namespace idval {

// Values are kept in sync with IDVAL_ID_TYPE
enum class identifier_type : uint8_t { unrecognized = 0, aadhaar, gstin, imei, card };

inline std::string_view identifier_type_to_string(identifier_type type)
{
    switch (type) {
    case identifier_type::aadhaar:
        return "Aadhaar";
    case identifier_type::gstin:
        return "GSTIN";
    case identifier_type::imei:
        return "IMEI";
    case identifier_type::card:
        return "Card";
    case identifier_type::unrecognized:
        break;
    }
    return "Unknown";
}

} // namespace idval
