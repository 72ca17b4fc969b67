/**
 * @file gateway_server.hpp
 * @brief HTTP entrypoint that gates every request before forwarding it
 *
 * This file provides the gateway_server class which binds the configured
 * port using the Crow framework and routes every request through the
 * admission_gateway.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_types.hpp"

#include "gateway/config/gateway_config.hpp"
#include "gateway/core/result.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace gateway::web {

/**
 * @class gateway_server
 * @brief Configuration-gated HTTP server
 *
 * @par Example
 * @code
 * #include <gateway/web/gateway_server.hpp>
 *
 * auto config = gateway::config::load_gateway_config(
 *     gateway::config::process_environment());
 *
 * gateway_server server(config.value());
 * server.set_downstream(my_handler);
 *
 * auto started = server.start_async();  // Non-blocking
 * if (started.is_err()) {
 *   // port in use or not permitted
 * }
 * // ... do other work ...
 * server.stop();
 * @endcode
 */
class gateway_server {
public:
  /**
   * @brief Construct with default configuration (port 8000, open mode)
   */
  gateway_server();

  /**
   * @brief Construct with the startup configuration
   * @param config Gateway configuration, copied and never modified
   */
  explicit gateway_server(const config::gateway_config &config);

  /**
   * @brief Destructor - stops server if running
   */
  ~gateway_server();

  /// Non-copyable
  gateway_server(const gateway_server &) = delete;
  gateway_server &operator=(const gateway_server &) = delete;

  /// Movable
  gateway_server(gateway_server &&other) noexcept;
  gateway_server &operator=(gateway_server &&other) noexcept;

  // =========================================================================
  // Configuration
  // =========================================================================

  [[nodiscard]] const config::gateway_config &config() const noexcept;

  /**
   * @brief Replace the downstream handler (before start only)
   * @param handler Handler receiving admitted requests
   */
  void set_downstream(request_handler handler);

  /**
   * @brief Exempt an additional path template from the API key check
   *
   * Must be called before start. Segments written as {name} match any
   * single segment.
   */
  void add_public_path(std::string path_template);

  // =========================================================================
  // Lifecycle
  // =========================================================================

  /**
   * @brief Verify that the configured address and port can be bound
   * @return ok(), or an error with code error_codes::bind_error
   */
  [[nodiscard]] VoidResult bind() const;

  /**
   * @brief Bind and serve (blocking)
   *
   * Returns after stop() is called from another thread, or immediately
   * with error_codes::bind_error if the port cannot be bound.
   */
  [[nodiscard]] VoidResult start();

  /**
   * @brief Bind and serve on a background thread
   *
   * The bind check runs before the thread starts, and the call returns
   * once the listener accepts connections, so a bind failure is reported
   * by the return value.
   */
  [[nodiscard]] VoidResult start_async();

  /**
   * @brief Stop the server
   *
   * Gracefully shuts down the server. Safe to call multiple times.
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  /**
   * @brief Wait for server to stop
   *
   * Only valid after start_async() was called.
   */
  void wait();

  /**
   * @brief Get the port the server is listening on
   * @return Port number, or 0 if not running
   */
  [[nodiscard]] std::uint16_t port() const noexcept;

private:
  struct impl;
  std::unique_ptr<impl> impl_;
};

} // namespace gateway::web
