/**
 * @file result.hpp
 * @brief Result<T> type aliases and helpers for the gateway
 *
 * Standardized Result<T> types and error codes for the gateway, built on
 * common_system's Result pattern.
 *
 * @see common_system/include/kcenon/common/patterns/result.h
 */

#pragma once

#include <kcenon/common/patterns/result.h>
#include <kcenon/common/error/error_codes.h>

#include <string>

namespace gateway {

/**
 * @brief Result type alias for gateway operations
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
 * @brief Gateway-specific error codes
 *
 * Error code range: -1000 to -1099
 */
namespace error_codes {
    using namespace kcenon::common::error::codes::common_errors;

    constexpr int gateway_base = -1000;

    // Startup errors (-1000 to -1019), fatal
    constexpr int config_error = gateway_base - 0;
    constexpr int bind_error = gateway_base - 1;

    // Per-request errors (-1020 to -1039), converted to HTTP responses
    constexpr int unauthorized = gateway_base - 20;
} // namespace error_codes

using kcenon::common::ok;
using kcenon::common::make_error;

/**
 * @brief Create a gateway error result with module context
 * @tparam T The result value type
 * @param code Error code from gateway::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return Result<T> containing the error
 */
template <typename T>
inline Result<T> gateway_error(int code, const std::string& message,
                               const std::string& details = "") {
    if (details.empty()) {
        return kcenon::common::make_error<T>(code, message, "gateway");
    }
    return kcenon::common::make_error<T>(code, message, "gateway", details);
}

/**
 * @brief Create a gateway void error result
 * @param code Error code from gateway::error_codes
 * @param message Error message
 * @param details Optional additional details
 * @return VoidResult containing the error
 */
inline VoidResult gateway_void_error(int code, const std::string& message,
                                     const std::string& details = "") {
    if (details.empty()) {
        return VoidResult(error_info{code, message, "gateway"});
    }
    return VoidResult(error_info{code, message, "gateway", details});
}

} // namespace gateway

