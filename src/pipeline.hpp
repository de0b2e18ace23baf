// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "fraud_flags.hpp"
#include "identifier_type.hpp"

namespace idval {

struct validation_result {
    std::string identifier;
    identifier_type type{identifier_type::unrecognized};
    bool valid{false};
    std::vector<fraud_flag> flags;

    bool operator==(const validation_result &other) const = default;
};

// Detection, validation and fraud heuristics on a single token
validation_result check_identifier(std::string_view token);

// One result per token, in input order
std::vector<validation_result> process_batch(std::span<const std::string> tokens);

} // namespace idval
