// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <memory>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "exception.hpp"
#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "pipeline.hpp"
#include "renderer/base.hpp"
#include "renderer/table_renderer.hpp"
#include "renderer/yaml_renderer.hpp"
#include "utils.hpp"

namespace idval {

summary_row to_summary_row(const validation_result &result)
{
    std::string flags;
    for (auto flag : result.flags) {
        if (!flags.empty()) {
            flags += ", ";
        }
        flags += fraud_flag_to_string(flag);
    }

    return {
        .id_number = result.identifier,
        .type = std::string{identifier_type_to_string(result.type)},
        .valid = result.valid ? "Yes" : "No",
        .flags = flags.empty() ? "-" : flags,
    };
}

std::string status_lines(const validation_result &result)
{
    auto lines = fmt::format("{} number {} is {}\n", identifier_type_to_string(result.type),
        result.identifier, result.valid ? "VALID" : "INVALID");
    for (auto flag : result.flags) {
        lines += fmt::format("Fraud flag: {}\n", fraud_flag_to_string(flag));
    }
    return lines;
}

bool is_supported_format(std::string_view format)
{
    return string_iequals(format, table_renderer::renderer_name) ||
           string_iequals(format, yaml_renderer::renderer_name);
}

std::unique_ptr<renderer> make_renderer(std::string_view format)
{
    if (string_iequals(format, table_renderer::renderer_name)) {
        return std::make_unique<table_renderer>();
    }

    if (string_iequals(format, yaml_renderer::renderer_name)) {
        return std::make_unique<yaml_renderer>();
    }

    throw parsing_error("unknown output format: " + std::string{format});
}

} // namespace idval
