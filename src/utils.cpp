// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2025 Datadog, Inc.

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>

#include "utils.hpp"

namespace idval {

std::string to_upper(std::string_view str)
{
    std::string upper;
    upper.reserve(str.size());
    std::transform(str.begin(), str.end(), std::back_inserter(upper), toupper);
    return upper;
}

std::string_view trim(std::string_view str)
{
    std::size_t start = 0;
    while (start < str.size() && isspace(str[start])) { ++start; }

    std::size_t end = str.size();
    while (end > start && isspace(str[end - 1])) { --end; }

    return str.substr(start, end - start);
}

bool string_iequals(std::string_view left, std::string_view right)
{
    return left.size() == right.size() &&
           std::equal(left.begin(), left.end(), right.begin(),
               [](char l, char r) { return tolower(l) == tolower(r); });
}

} // namespace idval
