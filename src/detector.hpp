// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <re2/re2.h>
#include <string_view>
#include <utility>
#include <vector>

#include "identifier_type.hpp"

namespace idval {

// Classifies identifiers by their shape. Rules are evaluated in order and
// the first match wins, so a 15-digit value is an IMEI rather than a card
// number and a GSTIN is never mistaken for anything else.
class type_detector {
public:
    struct rule {
        identifier_type type;
        std::string_view pattern;
    };

    // Built-in rules, in evaluation order
    static const std::vector<rule> &default_rules();

    type_detector();
    explicit type_detector(const std::vector<rule> &rules);
    ~type_detector() = default;
    type_detector(const type_detector &) = delete;
    type_detector(type_detector &&) noexcept = default;
    type_detector &operator=(const type_detector &) = delete;
    type_detector &operator=(type_detector &&) noexcept = default;

    // The value is upper-cased before matching
    [[nodiscard]] identifier_type detect(std::string_view value) const;

    // Whether the upper-case value has the shape of the given type
    [[nodiscard]] bool has_shape(std::string_view value, identifier_type type) const;

protected:
    std::vector<std::pair<identifier_type, std::unique_ptr<re2::RE2>>> rules_;
};

// Process-wide detector compiled from the built-in rules
const type_detector &default_detector();

identifier_type detect_type(std::string_view value);

} // namespace idval
