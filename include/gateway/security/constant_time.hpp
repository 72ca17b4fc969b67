/**
 * @file constant_time.hpp
 * @brief Timing-safe comparison of secrets
 */

#pragma once

#include <string_view>

namespace gateway::security {

/**
 * @brief Compare two secrets without leaking where they differ
 *
 * Both inputs are reduced to SHA-256 digests which are then compared with
 * CRYPTO_memcmp, so neither the position of the first mismatch nor the
 * length of the expected secret influences the running time.
 *
 * @param provided Value presented by the client
 * @param expected Configured secret
 * @return true if the values are byte-for-byte equal; false on mismatch or
 *         if hashing fails
 */
[[nodiscard]] bool constant_time_equals(std::string_view provided,
                                        std::string_view expected) noexcept;

} // namespace gateway::security
