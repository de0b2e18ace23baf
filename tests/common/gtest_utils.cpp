// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <fmt/format.h>

#include "common/gtest_utils.hpp"

namespace idval {

void PrintTo(identifier_type type, ::std::ostream *os) { *os << identifier_type_to_string(type); }

void PrintTo(fraud_flag flag, ::std::ostream *os) { *os << fraud_flag_to_string(flag); }

void PrintTo(const validation_result &result, ::std::ostream *os)
{
    *os << "{identifier: " << result.identifier
        << ", type: " << identifier_type_to_string(result.type)
        << ", valid: " << (result.valid ? "true" : "false") << ", flags: [";
    for (std::size_t i = 0; i < result.flags.size(); ++i) {
        if (i > 0) {
            *os << ", ";
        }
        *os << fraud_flag_to_string(result.flags[i]);
    }
    *os << "]}";
}

} // namespace idval

namespace idval::test {

temp_file::temp_file(std::string_view prefix)
{
    static std::atomic<unsigned> counter{0};
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    auto name = fmt::format("{}_{}_{}_{}", prefix, info != nullptr ? info->name() : "test",
        ::getpid(), counter++);
    path_ = (std::filesystem::temp_directory_path() / name).string();
    std::filesystem::remove(path_);
}

temp_file::~temp_file()
{
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

std::string temp_file::contents() const
{
    std::ifstream file(path_);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

std::vector<std::string> temp_file::lines() const
{
    std::vector<std::string> result;
    std::ifstream file(path_);
    for (std::string line; std::getline(file, line);) { result.emplace_back(std::move(line)); }
    return result;
}

} // namespace idval::test
