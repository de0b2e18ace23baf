// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <ostream>
#include <span>
#include <string_view>

#include "renderer/base.hpp"

namespace idval {

// Plain text table with the columns {ID Number, Type, Valid, Flags}, each
// column as wide as its widest cell.
class table_renderer : public renderer_impl<table_renderer> {
public:
    static constexpr std::string_view renderer_name = "table";

    void render(std::span<const validation_result> results, std::ostream &out) const override;
};

} // namespace idval
