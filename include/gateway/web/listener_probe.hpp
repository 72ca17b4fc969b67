/**
 * @file listener_probe.hpp
 * @brief Synchronous check that a listen address can be bound
 *
 * The HTTP server binds on its own I/O thread; probing first turns an
 * occupied or privileged port into an immediate startup error.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "gateway/core/result.hpp"

#include <cstdint>
#include <string>

namespace gateway::web {

/**
 * @brief Bind and listen on address:port, then release the socket
 *
 * Uses SO_REUSEADDR like the HTTP server, so sockets lingering in
 * TIME_WAIT do not cause false failures.
 *
 * @param bind_address Numeric address or host name
 * @param port Port in 1-65535
 * @return ok() if the address can be bound, otherwise an error with code
 *         error_codes::bind_error
 */
[[nodiscard]] VoidResult probe_listener(const std::string &bind_address,
                                        std::uint16_t port);

/**
 * @brief Check whether something accepts TCP connections on address:port
 *
 * Wildcard listen addresses (0.0.0.0, ::, empty) are checked through the
 * matching loopback address.
 */
[[nodiscard]] bool accepts_connections(const std::string &bind_address,
                                       std::uint16_t port);

} // namespace gateway::web
