// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <memory>
#include <ostream>
#include <span>
#include <string>
#include <string_view>

#include "pipeline.hpp"

namespace idval {

// Presentation form of a result, as shown in the summary
struct summary_row {
    std::string id_number;
    std::string type;
    std::string valid;
    std::string flags;

    bool operator==(const summary_row &other) const = default;
};

summary_row to_summary_row(const validation_result &result);

// "<Type> number <id> is VALID|INVALID" followed by one line per flag
std::string status_lines(const validation_result &result);

class renderer {
public:
    renderer() = default;
    virtual ~renderer() = default;
    renderer(const renderer &) = default;
    renderer(renderer &&) noexcept = default;
    renderer &operator=(const renderer &) = default;
    renderer &operator=(renderer &&) noexcept = default;

    [[nodiscard]] virtual std::string_view name() const = 0;
    virtual void render(std::span<const validation_result> results, std::ostream &out) const = 0;
};

template <typename T> class renderer_impl : public renderer {
public:
    renderer_impl() = default;
    ~renderer_impl() override = default;
    renderer_impl(const renderer_impl &) = default;
    renderer_impl(renderer_impl &&) noexcept = default;
    renderer_impl &operator=(const renderer_impl &) = default;
    renderer_impl &operator=(renderer_impl &&) noexcept = default;

    [[nodiscard]] std::string_view name() const override { return T::renderer_name; }
};

bool is_supported_format(std::string_view format);

// Throws parsing_error on unknown formats
std::unique_ptr<renderer> make_renderer(std::string_view format);

} // namespace idval
