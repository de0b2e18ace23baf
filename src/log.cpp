// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <string>
#include <string_view>

#include "exception.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace idval {

logger::log_cb_type logger::cb = nullptr;
log_level logger::min_level = log_level::off;

log_level log_level_from_str(std::string_view str)
{
    if (string_iequals_literal(str, "trace")) {
        return log_level::trace;
    }

    if (string_iequals_literal(str, "debug")) {
        return log_level::debug;
    }

    if (string_iequals_literal(str, "info")) {
        return log_level::info;
    }

    if (string_iequals_literal(str, "warn")) {
        return log_level::warn;
    }

    if (string_iequals_literal(str, "error")) {
        return log_level::error;
    }

    if (string_iequals_literal(str, "off")) {
        return log_level::off;
    }

    throw parsing_error("unknown log level: " + std::string{str});
}

void logger::init(log_cb_type cb, log_level min_level)
{
    logger::cb = cb;
    logger::min_level = min_level;
}

void logger::log(log_level level, const char *function, const char *file, unsigned line,
    const char *message, size_t length)
{
    logger::cb(static_cast<IDVAL_LOG_LEVEL>(level), function, file, line, message, length);
}

} // namespace idval
