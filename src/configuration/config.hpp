// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

#include "log.hpp"

namespace idval {

struct config {
    log_level level{log_level::warn};
    // Append-only CSV, disabled when unset
    std::optional<std::string> attempt_log;
    std::string output{"table"};
};

// Unknown keys are ignored, invalid values throw parsing_error
config parse_config(const YAML::Node &root);
config parse_config(std::string_view yaml_str);

// Throws io_error if the file can't be read
config load_config(const std::string &path);

} // namespace idval
