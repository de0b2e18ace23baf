// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <cstddef>
#include <optional>
#include <string_view>

#include "checksum/gstin_checksum.hpp"
#include "utils.hpp"

namespace idval {

namespace {

std::optional<unsigned> code_point(char c) noexcept
{
    if (idval::isdigit(c)) {
        return static_cast<unsigned>(c - '0');
    }

    if (idval::isupper(c)) {
        return static_cast<unsigned>(c - 'A') + 10;
    }

    return std::nullopt;
}

} // namespace

std::optional<char> gstin_checksum::check_char(std::string_view body) noexcept
{
    constexpr unsigned modulus = alphabet.size();

    unsigned factor = 2;
    unsigned total = 0;
    for (std::size_t i = body.size(); i > 0; --i) {
        auto cp = code_point(body[i - 1]);
        if (!cp.has_value()) {
            return std::nullopt;
        }

        auto addend = factor * *cp;
        addend = (addend / modulus) + (addend % modulus);
        total += addend;
        factor = factor == 2 ? 1 : 2;
    }

    return alphabet[(modulus - (total % modulus)) % modulus];
}

bool gstin_checksum::validate(std::string_view str) const noexcept
{
    if (str.size() < 2) {
        return false;
    }

    auto expected = check_char(str.substr(0, str.size() - 1));
    return expected.has_value() && *expected == str.back();
}

} // namespace idval
