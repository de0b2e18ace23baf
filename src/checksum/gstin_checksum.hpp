// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

#include "checksum/base.hpp"

namespace idval {

// Base-36 weighted checksum used by GSTIN, the last character of the
// identifier is the check character of all the preceding ones.
class gstin_checksum : public base_checksum {
public:
    static constexpr std::string_view checksum_name = "gstin";
    static constexpr std::string_view alphabet = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";

    gstin_checksum() = default;
    gstin_checksum(const gstin_checksum &) = default;
    gstin_checksum &operator=(const gstin_checksum &) = default;
    gstin_checksum(gstin_checksum &&) = default;
    gstin_checksum &operator=(gstin_checksum &&) = default;
    ~gstin_checksum() override = default;

    [[nodiscard]] std::string_view name() const noexcept override { return checksum_name; }
    [[nodiscard]] bool validate(std::string_view str) const noexcept override;

    // Expected check character of an upper-case body, nullopt if the body
    // contains a character outside of the alphabet.
    [[nodiscard]] static std::optional<char> check_char(std::string_view body) noexcept;
};

} // namespace idval
