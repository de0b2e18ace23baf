// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <optional>
#include <string_view>

#include "checksum/gstin_checksum.hpp"
#include "checksum/luhn_checksum.hpp"
#include "checksum/verhoeff_checksum.hpp"
#include "detector.hpp"
#include "identifier_type.hpp"
#include "log.hpp"
#include "utils.hpp"
#include "validator.hpp"

namespace idval {

bool validate_aadhaar(std::string_view value)
{
    if (!default_detector().has_shape(value, identifier_type::aadhaar)) {
        return false;
    }

    static const verhoeff_checksum checksum{};
    return checksum.validate(value);
}

bool luhn_valid(std::string_view value)
{
    static const luhn_checksum checksum{};
    return checksum.validate(value);
}

std::optional<char> gstin_check_char(std::string_view body)
{
    return gstin_checksum::check_char(to_upper(body));
}

bool validate_gstin(std::string_view value)
{
    const auto upper = to_upper(value);
    if (!default_detector().has_shape(upper, identifier_type::gstin)) {
        return false;
    }

    static const gstin_checksum checksum{};
    return checksum.validate(upper);
}

bool validate_id(std::string_view value, identifier_type type)
{
    bool valid = false;
    switch (type) {
    case identifier_type::aadhaar:
        valid = validate_aadhaar(value);
        break;
    case identifier_type::gstin:
        valid = validate_gstin(value);
        break;
    case identifier_type::imei:
    case identifier_type::card:
        valid = luhn_valid(value);
        break;
    case identifier_type::unrecognized:
        return false;
    }

    IDVAL_TRACE("{} '{}' checksum {}", identifier_type_to_string(type), value,
        valid ? "passed" : "failed");
    return valid;
}

} // namespace idval
