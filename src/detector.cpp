// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>
#include <vector>

#include "detector.hpp"
#include "identifier_type.hpp"
#include "log.hpp"
#include "regex_utils.hpp"
#include "utils.hpp"

namespace idval {

const std::vector<type_detector::rule> &type_detector::default_rules()
{
    static const std::vector<rule> rules{
        {identifier_type::aadhaar, "[2-9][0-9]{11}"},
        {identifier_type::gstin, "[0-9]{2}[A-Z]{5}[0-9]{4}[A-Z][1-9A-Z]Z[0-9A-Z]"},
        {identifier_type::imei, "[0-9]{15}"},
        {identifier_type::card, "[0-9]{13,19}"},
    };
    return rules;
}

type_detector::type_detector() : type_detector(default_rules()) {}

type_detector::type_detector(const std::vector<rule> &rules)
{
    rules_.reserve(rules.size());
    for (const auto &[type, pattern] : rules) {
        rules_.emplace_back(type, regex_init(pattern));
    }
}

identifier_type type_detector::detect(std::string_view value) const
{
    const auto upper = to_upper(value);
    for (const auto &[type, regex] : rules_) {
        if (regex_match(*regex, upper)) {
            IDVAL_TRACE("'{}' matched {} shape", value, identifier_type_to_string(type));
            return type;
        }
    }

    IDVAL_TRACE("'{}' matched no known shape", value);
    return identifier_type::unrecognized;
}

bool type_detector::has_shape(std::string_view value, identifier_type type) const
{
    for (const auto &[rule_type, regex] : rules_) {
        if (rule_type == type) {
            return regex_match(*regex, value);
        }
    }
    return false;
}

const type_detector &default_detector()
{
    static const type_detector detector;
    return detector;
}

identifier_type detect_type(std::string_view value) { return default_detector().detect(value); }

} // namespace idval
