/**
 * @file service_endpoints.hpp
 * @brief Built-in downstream handler of the gateway
 *
 * Serves the public health probe and answers every other path with a JSON
 * 404. Embedders replace it with their own handler through
 * gateway_server::set_downstream().
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "gateway/web/rest_types.hpp"

namespace gateway::web::endpoints {

/// Path of the public liveness probe
constexpr std::string_view health_path = "/healthz";

/**
 * @brief Handle one admitted request with the built-in routes
 *
 * - GET/HEAD /healthz -> 200 {"status":"ok"}
 * - other methods on /healthz -> 405
 * - anything else -> 404
 */
[[nodiscard]] gateway_response handle_service_request(const gateway_request &req);

/**
 * @brief The built-in routes as a request_handler
 */
[[nodiscard]] request_handler make_service_endpoints();

} // namespace gateway::web::endpoints
