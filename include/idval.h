// Unless explicitly stated otherwise all files in this repository are
// dual-licensed under the Apache-2.0 License or BSD-3-Clause License.
//
// This product includes software developed at Datadog (https://www.datadoghq.com/).
// Copyright 2021 Datadog, Inc.

#ifndef IDVAL_H
#define IDVAL_H

#ifdef __cplusplus
#include <cstddef>

extern "C"
{
#endif

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/**
 * @enum IDVAL_ID_TYPE
 *
 * Identifier type detected from the textual form of a value.
 **/
typedef enum
{
    IDVAL_ID_UNRECOGNIZED = 0,
    // 12-digit Aadhaar number, Verhoeff check digit
    IDVAL_ID_AADHAAR      = 1,
    // 15-character Goods and Services Tax Identification Number
    IDVAL_ID_GSTIN        = 2,
    // 15-digit International Mobile Equipment Identity, Luhn check digit
    IDVAL_ID_IMEI         = 3,
    // 13 to 19 digit payment card number, Luhn check digit
    IDVAL_ID_CARD         = 4,
} IDVAL_ID_TYPE;

/**
 * @enum IDVAL_FRAUD_FLAG
 *
 * Advisory flags raised by the structural heuristics, these never affect
 * the validity of an identifier.
 **/
typedef enum
{
    IDVAL_FLAG_REPEATED_DIGITS          = 1 << 0,
    IDVAL_FLAG_INVALID_AADHAAR_START    = 1 << 1,
    IDVAL_FLAG_INVALID_GSTIN_STATE_CODE = 1 << 2,
    IDVAL_FLAG_UNRECOGNIZED_FORMAT      = 1 << 3,
} IDVAL_FRAUD_FLAG;

/**
 * @enum IDVAL_LOG_LEVEL
 *
 * Internal log levels, to be used when setting the minimum log level and cb.
 **/
typedef enum
{
    IDVAL_LOG_TRACE,
    IDVAL_LOG_DEBUG,
    IDVAL_LOG_INFO,
    IDVAL_LOG_WARN,
    IDVAL_LOG_ERROR,
    IDVAL_LOG_OFF,
} IDVAL_LOG_LEVEL;

/**
 * @struct idval_result
 *
 * Outcome of checking a single identifier.
 **/
typedef struct
{
    /** Detected identifier type. */
    IDVAL_ID_TYPE type;
    /** Whether the type-specific checksum holds. */
    bool valid;
    /** Bitmask of IDVAL_FRAUD_FLAG values raised for the identifier. */
    uint32_t flags;
} idval_result;

/**
 * @typedef idval_log_cb
 *
 * Callback that the library will call to relay messages to the binding.
 *
 * @param level The logging level.
 * @param function The native function that emitted the message. (nonnull)
 * @param file The file of the native function that emmitted the message. (nonnull)
 * @param line The line where the message was emmitted.
 * @param message The logging message, NUL-terminated.
 * @param message_len The length of the logging message (excluding NUL terminator).
 */
typedef void (*idval_log_cb)(
    IDVAL_LOG_LEVEL level, const char* function, const char* file, unsigned line,
    const char* message, uint64_t message_len);

/**
 * idval_detect_type
 *
 * Classify a value into one of the supported identifier types.
 *
 * @param value Identifier to classify. (nullable)
 * @param length Length of the identifier.
 *
 * @return The detected type, IDVAL_ID_UNRECOGNIZED if none matches.
 **/
IDVAL_ID_TYPE idval_detect_type(const char *value, size_t length);

/**
 * idval_validate
 *
 * Verify the checksum of a value according to the given type.
 *
 * @param value Identifier to validate. (nullable)
 * @param length Length of the identifier.
 * @param type One of IDVAL_ID_TYPE, the type to validate the identifier against.
 *
 * @return Whether the identifier is valid, false for values outside IDVAL_ID_TYPE.
 **/
bool idval_validate(const char *value, size_t length, uint32_t type);

/**
 * idval_check
 *
 * Run detection, validation and the fraud heuristics on a single value.
 *
 * @param value Identifier to check. (nullable)
 * @param length Length of the identifier.
 * @param result Structure to be populated with the outcome. (nonnull)
 *
 * @return False if the arguments were invalid or an internal error occurred.
 **/
bool idval_check(const char *value, size_t length, idval_result *result);

/**
 * idval_id_type_to_string
 *
 * @param type One of IDVAL_ID_TYPE.
 *
 * @return The name of the identifier type, "Unknown" for unrecognized
 *         values and values outside IDVAL_ID_TYPE.
 *         The string is static and must not be freed.
 **/
const char *idval_id_type_to_string(uint32_t type);

/**
 * idval_fraud_flag_to_string
 *
 * @param flag A single IDVAL_FRAUD_FLAG bit.
 *
 * @return A human readable description of a single flag, or NULL if the
 *         value is not a known flag. The string is static and must not be freed.
 **/
const char *idval_fraud_flag_to_string(uint32_t flag);

/**
 * idval_get_version
 *
 * Return the version of the library
 *
 * @return version Version string, note that this should not be freed
 **/
const char *idval_get_version();

/**
 * idval_set_log_cb
 *
 * Sets the callback to relay logging messages to the binding
 *
 * @param cb The callback to call, or NULL to stop relaying messages
 * @param min_level The minimum logging level for which to relay messages
 *
 * @return whether the operation succeeded or not
 *
 * @note This function is not thread-safe
 **/
bool idval_set_log_cb(idval_log_cb cb, IDVAL_LOG_LEVEL min_level);

#ifdef __cplusplus
}
#endif /* __cplusplus */

#endif /*IDVAL_H */
