// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#include <cstddef>
#include <cstdint>
#include <exception>
#include <string_view>

#include "detector.hpp"
#include "fraud_flags.hpp"
#include "identifier_type.hpp"
#include "idval.h"
#include "log.hpp"
#include "pipeline.hpp"
#include "validator.hpp"
#include "version.hpp"

using namespace idval;

// Type compatibility
static_assert(static_cast<uint8_t>(identifier_type::unrecognized) == IDVAL_ID_UNRECOGNIZED);
static_assert(static_cast<uint8_t>(identifier_type::aadhaar) == IDVAL_ID_AADHAAR);
static_assert(static_cast<uint8_t>(identifier_type::gstin) == IDVAL_ID_GSTIN);
static_assert(static_cast<uint8_t>(identifier_type::imei) == IDVAL_ID_IMEI);
static_assert(static_cast<uint8_t>(identifier_type::card) == IDVAL_ID_CARD);

// Flag compatibility
static_assert(static_cast<uint32_t>(fraud_flag::repeated_digits) == IDVAL_FLAG_REPEATED_DIGITS);
static_assert(
    static_cast<uint32_t>(fraud_flag::invalid_aadhaar_start) == IDVAL_FLAG_INVALID_AADHAAR_START);
static_assert(static_cast<uint32_t>(fraud_flag::invalid_gstin_state_code) ==
              IDVAL_FLAG_INVALID_GSTIN_STATE_CODE);
static_assert(
    static_cast<uint32_t>(fraud_flag::unrecognized_format) == IDVAL_FLAG_UNRECOGNIZED_FORMAT);

// Log level compatibility
static_assert(static_cast<uint32_t>(log_level::trace) == IDVAL_LOG_TRACE);
static_assert(static_cast<uint32_t>(log_level::debug) == IDVAL_LOG_DEBUG);
static_assert(static_cast<uint32_t>(log_level::info) == IDVAL_LOG_INFO);
static_assert(static_cast<uint32_t>(log_level::warn) == IDVAL_LOG_WARN);
static_assert(static_cast<uint32_t>(log_level::error) == IDVAL_LOG_ERROR);
static_assert(static_cast<uint32_t>(log_level::off) == IDVAL_LOG_OFF);

namespace {

std::string_view to_view(const char *value, size_t length)
{
    if (value == nullptr) {
        return {};
    }
    return {value, length};
}

bool is_known_type(uint32_t type) { return type <= static_cast<uint32_t>(IDVAL_ID_CARD); }

} // namespace

extern "C" {

IDVAL_ID_TYPE idval_detect_type(const char *value, size_t length)
{
    try {
        return static_cast<IDVAL_ID_TYPE>(detect_type(to_view(value, length)));
    } catch (const std::exception &e) {
        IDVAL_ERROR("{}", e.what());
    }

    return IDVAL_ID_UNRECOGNIZED;
}

bool idval_validate(const char *value, size_t length, uint32_t type)
{
    if (!is_known_type(type)) {
        IDVAL_WARN("Unknown identifier type {}", type);
        return false;
    }

    try {
        return validate_id(to_view(value, length), static_cast<identifier_type>(type));
    } catch (const std::exception &e) {
        IDVAL_ERROR("{}", e.what());
    }

    return false;
}

bool idval_check(const char *value, size_t length, idval_result *result)
{
    if (result == nullptr) {
        return false;
    }

    try {
        auto res = check_identifier(to_view(value, length));

        result->type = static_cast<IDVAL_ID_TYPE>(res.type);
        result->valid = res.valid;
        result->flags = 0;
        for (auto flag : res.flags) { result->flags |= static_cast<uint32_t>(flag); }
        return true;
    } catch (const std::exception &e) {
        IDVAL_ERROR("{}", e.what());
    }

    return false;
}

const char *idval_id_type_to_string(uint32_t type)
{
    if (!is_known_type(type)) {
        return "Unknown";
    }
    // The underlying strings are literals, hence NUL-terminated
    return identifier_type_to_string(static_cast<identifier_type>(type)).data();
}

const char *idval_fraud_flag_to_string(uint32_t flag)
{
    auto str = fraud_flag_to_string(static_cast<fraud_flag>(flag));
    return str.empty() ? nullptr : str.data();
}

const char *idval_get_version() { return idval::current_version; }

bool idval_set_log_cb(idval_log_cb cb, IDVAL_LOG_LEVEL min_level)
{
    logger::init(cb, static_cast<log_level>(min_level));
    IDVAL_INFO("Sending log messages to binding, min level {}",
        log_level_to_str(static_cast<log_level>(min_level)));
    return true;
}
}
