// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <functional>
#include <span>
#include <string>

#include "pipeline.hpp"

namespace idval {

// Append-only CSV record of every processed identifier, one row per result:
//   timestamp,value,type,validity,flags
class attempt_log {
public:
    using timestamp_fn_type = std::function<std::string()>;

    explicit attempt_log(std::string path);
    attempt_log(std::string path, timestamp_fn_type timestamp_fn);
    ~attempt_log() = default;
    attempt_log(const attempt_log &) = delete;
    attempt_log(attempt_log &&) noexcept = default;
    attempt_log &operator=(const attempt_log &) = delete;
    attempt_log &operator=(attempt_log &&) noexcept = default;

    // Throws io_error if the file can't be opened or written
    void append(std::span<const validation_result> results) const;
    void append(const validation_result &result) const { append({&result, 1}); }

    [[nodiscard]] const std::string &path() const noexcept { return path_; }

    // ISO-8601 local time, second precision
    static std::string current_timestamp();

    static std::string to_row(const std::string &timestamp, const validation_result &result);

protected:
    std::string path_;
    timestamp_fn_type timestamp_fn_;
};

} // namespace idval
