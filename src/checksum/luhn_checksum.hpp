// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <string_view>

#include "checksum/base.hpp"

namespace idval {

// Mod-10 checksum used by IMEI and payment card numbers. The input must
// consist exclusively of digits, anything else fails validation.
class luhn_checksum : public base_checksum {
public:
    static constexpr std::string_view checksum_name = "luhn";

    luhn_checksum() = default;
    luhn_checksum(const luhn_checksum &) = default;
    luhn_checksum &operator=(const luhn_checksum &) = default;
    luhn_checksum(luhn_checksum &&) = default;
    luhn_checksum &operator=(luhn_checksum &&) = default;
    ~luhn_checksum() override = default;

    [[nodiscard]] std::string_view name() const noexcept override { return checksum_name; }
    [[nodiscard]] bool validate(std::string_view str) const noexcept override;
};

} // namespace idval
