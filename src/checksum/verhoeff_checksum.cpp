// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

#include "checksum/verhoeff_checksum.hpp"
#include "utils.hpp"

namespace idval {

namespace {

using verhoeff_table = std::array<std::array<uint8_t, 10>, 10>;

// Multiplication table of the dihedral group D5
constexpr verhoeff_table multiplication{{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 2, 3, 4, 0, 6, 7, 8, 9, 5},
    {2, 3, 4, 0, 1, 7, 8, 9, 5, 6},
    {3, 4, 0, 1, 2, 8, 9, 5, 6, 7},
    {4, 0, 1, 2, 3, 9, 5, 6, 7, 8},
    {5, 9, 8, 7, 6, 0, 4, 3, 2, 1},
    {6, 5, 9, 8, 7, 1, 0, 4, 3, 2},
    {7, 6, 5, 9, 8, 2, 1, 0, 4, 3},
    {8, 7, 6, 5, 9, 3, 2, 1, 0, 4},
    {9, 8, 7, 6, 5, 4, 3, 2, 1, 0},
}};

// Position dependent permutation, repeats every 8 digits
constexpr std::array<std::array<uint8_t, 10>, 8> permutation{{
    {0, 1, 2, 3, 4, 5, 6, 7, 8, 9},
    {1, 5, 7, 6, 2, 8, 3, 0, 9, 4},
    {5, 8, 0, 3, 7, 9, 6, 1, 4, 2},
    {8, 9, 1, 6, 0, 4, 3, 5, 2, 7},
    {9, 4, 5, 3, 1, 2, 6, 8, 7, 0},
    {4, 2, 8, 6, 5, 7, 3, 9, 0, 1},
    {2, 7, 9, 3, 8, 0, 6, 4, 1, 5},
    {7, 0, 4, 6, 9, 1, 3, 2, 5, 8},
}};

constexpr std::array<uint8_t, 10> inverse{0, 4, 3, 2, 1, 5, 6, 7, 8, 9};

// Folds the digits of str, starting at the rightmost one, with the
// permutation index of the rightmost digit set to offset.
std::optional<uint8_t> fold(std::string_view str, std::size_t offset) noexcept
{
    uint8_t c = 0;
    for (std::size_t i = 0; i < str.size(); ++i) {
        const auto ch = str[str.size() - i - 1];
        if (!idval::isdigit(ch)) {
            return std::nullopt;
        }

        const auto digit = static_cast<std::size_t>(ch - '0');
        c = multiplication[c][permutation[(i + offset) % permutation.size()][digit]];
    }
    return c;
}

} // namespace

bool verhoeff_checksum::validate(std::string_view str) const noexcept
{
    if (str.empty()) {
        return false;
    }

    auto c = fold(str, 0);
    return c.has_value() && *c == 0;
}

std::optional<char> verhoeff_checksum::check_digit(std::string_view body) noexcept
{
    // The check digit will occupy position 0, shifting the body by one
    auto c = fold(body, 1);
    if (!c.has_value()) {
        return std::nullopt;
    }
    return static_cast<char>('0' + inverse[*c]);
}

} // namespace idval
