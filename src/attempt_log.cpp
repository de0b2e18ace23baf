// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <chrono>
#include <ctime>
#include <fstream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "attempt_log.hpp"
#include "exception.hpp"
#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "log.hpp"
#include "pipeline.hpp"

namespace idval {

namespace {

std::string escape_field(std::string_view field)
{
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }

    std::string escaped{"\""};
    for (auto c : field) {
        if (c == '"') {
            escaped += '"';
        }
        escaped += c;
    }
    escaped += '"';
    return escaped;
}

} // namespace

attempt_log::attempt_log(std::string path) : attempt_log(std::move(path), current_timestamp) {}

attempt_log::attempt_log(std::string path, timestamp_fn_type timestamp_fn)
    : path_(std::move(path)), timestamp_fn_(std::move(timestamp_fn))
{}

std::string attempt_log::current_timestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::localtime(now));
}

std::string attempt_log::to_row(const std::string &timestamp, const validation_result &result)
{
    std::string flags;
    for (auto flag : result.flags) {
        if (!flags.empty()) {
            flags += ';';
        }
        flags += fraud_flag_to_string(flag);
    }

    return fmt::format("{},{},{},{},{}", escape_field(timestamp),
        escape_field(result.identifier), identifier_type_to_string(result.type),
        result.valid ? "True" : "False", escape_field(flags));
}

void attempt_log::append(std::span<const validation_result> results) const
{
    std::ofstream file(path_, std::ios::out | std::ios::app);
    if (!file) {
        throw io_error("failed to open attempt log " + path_);
    }

    for (const auto &result : results) { file << to_row(timestamp_fn_(), result) << '\n'; }

    file.flush();
    if (!file) {
        throw io_error("failed to write attempt log " + path_);
    }

    IDVAL_DEBUG("Appended {} row(s) to {}", results.size(), path_);
}

} // namespace idval
