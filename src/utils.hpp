// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace idval {

// NOLINTBEGIN(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)
inline bool isdigit(char c) { return static_cast<unsigned>(c) - '0' < 10; }
inline bool isspace(char c)
{
    return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}
inline bool isupper(char c) { return static_cast<unsigned>(c) - 'A' < 26; }
inline bool islower(char c) { return static_cast<unsigned>(c) - 'a' < 26; }
inline char tolower(char c) { return isupper(c) ? static_cast<char>(c | 32) : c; }
inline char toupper(char c) { return islower(c) ? static_cast<char>(c & ~32) : c; }
// NOLINTEND(cppcoreguidelines-avoid-magic-numbers,readability-magic-numbers)

std::string to_upper(std::string_view str);
std::string_view trim(std::string_view str);

template <std::size_t N, std::size_t... I>
// NOLINTNEXTLINE(modernize-avoid-c-arrays,readability-named-parameter)
constexpr std::array<char, N> make_array(const char (&str)[N], std::index_sequence<I...>)
{
    return std::array<char, N>{tolower(str[I])...};
}

template <std::size_t N>
// NOLINTNEXTLINE(modernize-avoid-c-arrays)
constexpr bool string_iequals_literal(std::string_view left, const char (&right)[N])
{
    return left.size() == (N - 1) && std::equal(left.begin(), left.end(),
                                         make_array(right, std::make_index_sequence<N>()).begin(),
                                         [](char l, char r) { return tolower(l) == r; });
}

bool string_iequals(std::string_view left, std::string_view right);

} // namespace idval
