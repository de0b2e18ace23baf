// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "detector.hpp"
#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "log.hpp"
#include "pipeline.hpp"
#include "validator.hpp"

namespace idval {

validation_result check_identifier(std::string_view token)
{
    validation_result result{.identifier = std::string{token}};

    result.type = detect_type(token);
    if (result.type == identifier_type::unrecognized) {
        result.flags.emplace_back(fraud_flag::unrecognized_format);
    } else {
        result.valid = validate_id(token, result.type);
        result.flags = fraud_flags(token, result.type);
    }

    IDVAL_DEBUG("{} '{}' is {}", identifier_type_to_string(result.type), token,
        result.valid ? "valid" : "invalid");
    return result;
}

std::vector<validation_result> process_batch(std::span<const std::string> tokens)
{
    std::vector<validation_result> results;
    results.reserve(tokens.size());
    for (const auto &token : tokens) { results.emplace_back(check_identifier(token)); }

    IDVAL_DEBUG("Processed batch of {} identifier(s)", results.size());
    return results;
}

} // namespace idval
