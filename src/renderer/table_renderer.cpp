// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <algorithm>
#include <array>
#include <cstddef>
#include <ostream>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

#include "renderer/table_renderer.hpp"

namespace idval {

namespace {

using row_cells = std::array<std::string, 4>;

void print_row(std::ostream &out, const row_cells &cells, const std::array<std::size_t, 4> &widths)
{
    // The last column is left unpadded to avoid trailing whitespace
    fmt::print(out, "{:<{}} | {:<{}} | {:<{}} | {}\n", cells[0], widths[0], cells[1], widths[1],
        cells[2], widths[2], cells[3]);
}

} // namespace

void table_renderer::render(std::span<const validation_result> results, std::ostream &out) const
{
    std::vector<row_cells> rows;
    rows.reserve(results.size() + 1);
    rows.push_back({"ID Number", "Type", "Valid", "Flags"});
    for (const auto &result : results) {
        auto row = to_summary_row(result);
        rows.push_back({std::move(row.id_number), std::move(row.type), std::move(row.valid),
            std::move(row.flags)});
    }

    std::array<std::size_t, 4> widths{};
    for (const auto &row : rows) {
        for (std::size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    print_row(out, rows.front(), widths);
    fmt::print(out, "{:-<{}}-+-{:-<{}}-+-{:-<{}}-+-{:-<{}}\n", "", widths[0], "", widths[1], "",
        widths[2], "", widths[3]);
    for (std::size_t i = 1; i < rows.size(); ++i) { print_row(out, rows[i], widths); }
}

} // namespace idval
