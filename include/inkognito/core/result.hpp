/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for inkognito
 *
 * This file provides standardized Result<T> types and error handling
 * utilities for the anonymization engine, integrating with common_system's
 * Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace inkognito {

/**
 * @brief Result type alias for inkognito operations
 * @tparam T The success value type
 */
template <typename T>
using Result = kcenon::common::Result<T>;

/**
 * @brief Result type for void operations
 */
using VoidResult = kcenon::common::VoidResult;

/**
 * @brief Error information type
 */
using error_info = kcenon::common::error_info;

/**
 * @namespace error_codes
 * @brief inkognito-specific error codes
 *
 * Error code range: -1100 to -1199
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int inkognito_base = -1100;

    // Vault errors (-1100 to -1119)
    constexpr int vault_not_found = inkognito_base - 0;
    constexpr int vault_format_error = inkognito_base - 1;
    constexpr int persistence_failure = inkognito_base - 2;

    // Pipeline errors (-1120 to -1139)
    constexpr int detection_failure = inkognito_base - 20;
    constexpr int batch_cancelled = inkognito_base - 21;

    // Document errors (-1140 to -1159)
    constexpr int file_not_found = inkognito_base - 40;
    constexpr int directory_not_found = inkognito_base - 41;
    constexpr int file_read_error = inkognito_base - 42;
    constexpr int file_write_error = inkognito_base - 43;
    constexpr int unsupported_document = inkognito_base - 44;
    constexpr int no_headings_found = inkognito_base - 45;

    // Configuration errors (-1160 to -1179)
    constexpr int invalid_argument = inkognito_base - 60;
    constexpr int config_parse_error = inkognito_base - 61;
} // namespace error_codes

// Re-export common utility functions
using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create an inkognito error result with module context
 * @tparam T The result value type
 * @param code Error code from inkognito::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> inkognito_error(int code, const std::string& message,
                                 const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "inkognito");
    }
    return kcenon::common::make_error<T>(code, message, "inkognito", details);
}

/**
 * @brief Create an inkognito void error result
 * @param code Error code from inkognito::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult inkognito_void_error(int code, const std::string& message,
                                       const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "inkognito"});
    }
    return VoidResult(error_info{code, message, "inkognito", details});
}

} // namespace inkognito

/**
 * @brief Return early if expression is an error
 */
#define INKOGNITO_RETURN_IF_ERROR(expr) COMMON_RETURN_IF_ERROR(expr)

/**
 * @brief Assign value or return error
 */
#define INKOGNITO_ASSIGN_OR_RETURN(decl, expr) COMMON_ASSIGN_OR_RETURN(decl, expr)
