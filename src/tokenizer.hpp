// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace idval {

// Splits free text on commas and newlines, returning the trimmed non-empty
// tokens in order of appearance.
std::vector<std::string> tokenize(std::string_view text);

} // namespace idval
