// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <yaml-cpp/yaml.h>

#include "configuration/config.hpp"
#include "exception.hpp"
#include "log.hpp"
#include "renderer/base.hpp"

namespace idval {

namespace {

std::string scalar_at(const YAML::Node &root, std::string_view key)
{
    const auto node = root[std::string{key}];
    if (!node.IsScalar()) {
        throw parsing_error("invalid type for '" + std::string{key} + "', expected scalar");
    }
    return node.Scalar();
}

} // namespace

config parse_config(const YAML::Node &root)
{
    config cfg;
    if (!root.IsDefined() || root.IsNull()) {
        return cfg;
    }

    if (!root.IsMap()) {
        throw parsing_error("invalid configuration, expected map");
    }

    if (root["log_level"]) {
        cfg.level = log_level_from_str(scalar_at(root, "log_level"));
    }

    if (root["attempt_log"]) {
        auto path = scalar_at(root, "attempt_log");
        if (path.empty()) {
            throw parsing_error("empty attempt_log path");
        }
        cfg.attempt_log = std::move(path);
    }

    if (root["output"]) {
        cfg.output = scalar_at(root, "output");
        if (!is_supported_format(cfg.output)) {
            throw parsing_error("unknown output format: " + cfg.output);
        }
    }

    for (auto it = root.begin(); it != root.end(); ++it) {
        const auto key = it->first.as<std::string>();
        if (key != "log_level" && key != "attempt_log" && key != "output") {
            IDVAL_WARN("Ignoring unknown configuration key '{}'", key);
        }
    }

    return cfg;
}

config parse_config(std::string_view yaml_str)
{
    try {
        return parse_config(YAML::Load(std::string{yaml_str}));
    } catch (const YAML::Exception &e) {
        throw parsing_error(std::string{"malformed configuration: "} + e.what());
    }
}

config load_config(const std::string &path)
{
    std::ifstream file(path, std::ios::in);
    if (!file) {
        throw io_error("failed to open configuration " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    IDVAL_DEBUG("Loaded configuration from {}", path);
    return parse_config(buffer.str());
}

} // namespace idval
