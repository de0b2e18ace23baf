// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <exception>
#include <string>
#include <utility>

namespace idval {

class exception : public std::exception {
public:
    explicit exception(std::string what) : what_(std::move(what)) {}
    [[nodiscard]] const char *what() const noexcept override { return what_.c_str(); }

protected:
    std::string what_;
};

// Invalid configuration or regular expression
class parsing_error : public exception {
public:
    using exception::exception;
};

// Failure to read or append to a file
class io_error : public exception {
public:
    using exception::exception;
};

} // namespace idval
