/**
 * @file service_endpoints.cpp
 * @brief Built-in downstream handler implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "gateway/web/endpoints/service_endpoints.hpp"

namespace gateway::web::endpoints {

gateway_response handle_service_request(const gateway_request &req) {
  if (req.path == health_path) {
    if (req.method == "GET" || req.method == "HEAD") {
      return make_json_response(http_status::ok, R"({"status":"ok"})");
    }
    auto res = make_json_response(
        http_status::method_not_allowed,
        make_error_json("METHOD_NOT_ALLOWED", "Method Not Allowed"));
    res.set_header("Allow", "GET, HEAD");
    return res;
  }

  return make_json_response(http_status::not_found,
                            make_error_json("NOT_FOUND", "Not Found"));
}

request_handler make_service_endpoints() { return &handle_service_request; }

} // namespace gateway::web::endpoints
