// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#pragma once

#include <optional>
#include <string_view>

#include "identifier_type.hpp"

namespace idval {

// Aadhaar shape followed by the Verhoeff checksum
bool validate_aadhaar(std::string_view value);

// Mod-10 checksum over a digit-only value
bool luhn_valid(std::string_view value);

// Check character of the first 14 characters of a GSTIN
std::optional<char> gstin_check_char(std::string_view body);

// Upper-cases the value, then checks the GSTIN shape and check character
bool validate_gstin(std::string_view value);

// Routes the value to the checksum of the given type, unrecognized
// values are never valid.
bool validate_id(std::string_view value, identifier_type type);

} // namespace idval
