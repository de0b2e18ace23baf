// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "tokenizer.hpp"
#include "utils.hpp"

namespace idval {

std::vector<std::string> tokenize(std::string_view text)
{
    std::vector<std::string> tokens;

    std::size_t start = 0;
    while (start <= text.size()) {
        std::size_t end = text.find_first_of(",\n", start);
        if (end == std::string_view::npos) {
            end = text.size();
        }

        auto token = trim(text.substr(start, end - start));
        if (!token.empty()) {
            tokens.emplace_back(token);
        }
        start = end + 1;
    }

    return tokens;
}

} // namespace idval
