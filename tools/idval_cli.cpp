// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <cstdlib>
#include <exception>
#include <functional>
#include <iostream>
#include <iterator>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "attempt_log.hpp"
#include "common/utils.hpp"
#include "configuration/config.hpp"
#include "idval.h"
#include "pipeline.hpp"
#include "renderer/base.hpp"
#include "tokenizer.hpp"

namespace {

constexpr int exit_all_valid = 0;
constexpr int exit_some_invalid = 1;
constexpr int exit_usage = 2;

// NOLINTNEXTLINE
auto parse_args(int argc, char *argv[])
{
    const std::map<std::string, std::string, std::less<>> arg_mapping{
        {"-c", "--config"}, {"--config", "--config"}, {"-i", "--input"}, {"--input", "--input"},
        {"-f", "--file"}, {"--file", "--file"}, {"-o", "--format"}, {"--format", "--format"},
        {"-l", "--log"}, {"--log", "--log"}, {"-v", "--verbose"}, {"--verbose", "--verbose"},
        {"-h", "--help"}, {"--help", "--help"}};

    std::unordered_map<std::string, std::vector<std::string>> args;
    auto last_arg = args.end();
    for (int i = 1; i < argc; i++) {
        std::string_view arg = argv[i];
        if (arg.starts_with('-')) {
            if (auto long_arg = arg_mapping.find(arg); long_arg != arg_mapping.end()) {
                arg = long_arg->second;
            } else {
                std::cerr << "Ignoring unknown option " << arg << '\n';
                continue;
            }

            auto [it, res] = args.emplace(arg, std::vector<std::string>{});
            last_arg = it;
        } else if (last_arg != args.end()) {
            last_arg->second.emplace_back(arg);
        }
    }
    return args;
}

void print_usage(const char *name)
{
    std::cout << "Usage: " << name << " [--config <yaml file>] [--format table|yaml]"
              << " [--log <csv file>] [--verbose]"
              << " [--input <ids>..] [--file <path>..]\n"
              << "Identifiers are separated by commas or newlines, standard input is"
              << " read when neither --input nor --file are provided.\n";
}

} // namespace

int main(int argc, char *argv[])
{
    auto args = parse_args(argc, argv);
    if (args.contains("--help")) {
        print_usage(argv[0]);
        return exit_all_valid;
    }

    const bool read_stdin = !args.contains("--input") && !args.contains("--file");

    idval::config cfg;
    try {
        if (const auto &paths = args["--config"]; !paths.empty()) {
            cfg = idval::load_config(paths.back());
        }

        if (const auto &formats = args["--format"]; !formats.empty()) {
            if (!idval::is_supported_format(formats.back())) {
                std::cerr << "Unknown output format: " << formats.back() << '\n';
                return exit_usage;
            }
            cfg.output = formats.back();
        }

        if (const auto &logs = args["--log"]; !logs.empty()) {
            cfg.attempt_log = logs.back();
        }
    } catch (const std::exception &e) {
        std::cerr << "Invalid configuration: " << e.what() << '\n';
        return exit_usage;
    }

    if (args.contains("--verbose")) {
        cfg.level = idval::log_level::trace;
    }
    idval_set_log_cb(log_cb, static_cast<IDVAL_LOG_LEVEL>(cfg.level));

    std::vector<std::string> tokens;
    auto add_tokens = [&tokens](std::string_view text) {
        auto new_tokens = idval::tokenize(text);
        std::move(new_tokens.begin(), new_tokens.end(), std::back_inserter(tokens));
    };

    for (const auto &input : args["--input"]) { add_tokens(input); }

    for (const auto &path : args["--file"]) {
        try {
            add_tokens(read_file(path));
        } catch (const std::exception &e) {
            std::cerr << "Failed to read " << path << ": " << e.what() << '\n';
            return exit_usage;
        }
    }

    if (read_stdin) {
        const std::string text{
            std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>()};
        add_tokens(text);
    }

    if (tokens.empty()) {
        print_usage(argv[0]);
        return exit_usage;
    }

    auto results = idval::process_batch(tokens);

    if (cfg.attempt_log.has_value()) {
        try {
            const idval::attempt_log log{*cfg.attempt_log};
            log.append(results);
        } catch (const std::exception &e) {
            std::cerr << e.what() << '\n';
            return exit_usage;
        }
    }

    for (const auto &result : results) { std::cout << idval::status_lines(result); }

    std::cout << '\n';
    idval::make_renderer(cfg.output)->render(results, std::cout);

    const bool all_valid = std::all_of(
        results.begin(), results.end(), [](const auto &result) { return result.valid; });
    return all_valid ? exit_all_valid : exit_some_invalid;
}
