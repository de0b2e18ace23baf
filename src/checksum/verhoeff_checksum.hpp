// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

#include "checksum/base.hpp"

namespace idval {

// Dihedral group D5 checksum used by Aadhaar numbers. Detects every single
// digit error and every adjacent transposition.
class verhoeff_checksum : public base_checksum {
public:
    static constexpr std::string_view checksum_name = "verhoeff";

    verhoeff_checksum() = default;
    verhoeff_checksum(const verhoeff_checksum &) = default;
    verhoeff_checksum &operator=(const verhoeff_checksum &) = default;
    verhoeff_checksum(verhoeff_checksum &&) = default;
    verhoeff_checksum &operator=(verhoeff_checksum &&) = default;
    ~verhoeff_checksum() override = default;

    [[nodiscard]] std::string_view name() const noexcept override { return checksum_name; }
    [[nodiscard]] bool validate(std::string_view str) const noexcept override;

    // Digit to append to the body for the result to validate, nullopt if
    // the body contains anything other than digits.
    [[nodiscard]] static std::optional<char> check_digit(std::string_view body) noexcept;
};

} // namespace idval
