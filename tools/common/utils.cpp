// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.
#include <cerrno>
#include <cstddef>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include "idval.h"
#include "utils.hpp"

const char* level_to_str(IDVAL_LOG_LEVEL level)
{
    switch (level)
    {
        case IDVAL_LOG_TRACE:
            return "trace";
        case IDVAL_LOG_DEBUG:
            return "debug";
        case IDVAL_LOG_ERROR:
            return "error";
        case IDVAL_LOG_WARN:
            return "warn";
        case IDVAL_LOG_INFO:
            return "info";
        case IDVAL_LOG_OFF:
            break;
    }

    return "off";
}

void log_cb(IDVAL_LOG_LEVEL level,
            const char* function, const char* file, unsigned line,
            const char* message, uint64_t  /*length*/)
{
    std::cerr << "[" << level_to_str(level)
              << "][" << file
              << ":" << function
              << ":" << line
              << "]: " << message
              << '\n';
}

std::string read_file(std::string_view filename)
{
    std::ifstream input_file(std::string{filename}, std::ios::in);
    if (!input_file)
    {
        throw std::system_error(errno, std::generic_category());
    }

    // Pipes and FIFOs can't be sized upfront, read them until EOF
    input_file.seekg(0, std::ios::end);
    const std::streamoff size = input_file.tellg();
    if (size < 0)
    {
        input_file.clear();
        return {std::istreambuf_iterator<char>(input_file), std::istreambuf_iterator<char>()};
    }

    // Create a buffer equal to the file size
    std::string buffer;
    buffer.resize(static_cast<std::size_t>(size));
    input_file.seekg(0, std::ios::beg);

    input_file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    input_file.close();
    return buffer;
}
