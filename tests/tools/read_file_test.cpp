// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <fstream>
#include <string>
#include <system_error>
#include <thread>

#include <sys/stat.h>

#include "common/gtest_utils.hpp"
#include "common/utils.hpp"

namespace {

TEST(TestReadFile, RegularFile)
{
    idval::test::temp_file file{"input"};
    {
        std::ofstream out(file.path());
        out << "234123412346\n27AAPFU0939F1ZV\n";
    }

    EXPECT_EQ(read_file(file.path()), "234123412346\n27AAPFU0939F1ZV\n");
}

TEST(TestReadFile, Fifo)
{
    idval::test::temp_file file{"fifo"};
    ASSERT_EQ(::mkfifo(file.path().c_str(), 0600), 0);

    const std::string payload{"490154203237518,4539148803436467\n"};
    std::thread writer([&]() {
        std::ofstream out(file.path());
        out << payload;
    });

    std::string contents;
    EXPECT_NO_THROW(contents = read_file(file.path()));
    writer.join();

    EXPECT_EQ(contents, payload);
}

TEST(TestReadFile, MissingFile)
{
    EXPECT_THROW(read_file("/nonexistent/idval/input.txt"), std::system_error);
}

} // namespace
