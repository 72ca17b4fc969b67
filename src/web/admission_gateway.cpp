/**
 * @file admission_gateway.cpp
 * @brief Request admission pipeline implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "gateway/web/admission_gateway.hpp"

#include "gateway/integration/logger_adapter.hpp"

#include <exception>
#include <utility>

namespace gateway::web {

namespace {

using integration::logger_adapter;
using integration::security_event_type;

std::string request_line(const gateway_request &req) {
  return req.method + " " + req.path;
}

gateway_response unauthorized_response(const std::string &message) {
  return make_json_response(http_status::unauthorized,
                            R"({"status":"error","message":")" +
                                json_escape(message) + R"("})");
}

} // namespace

admission_gateway::admission_gateway(cors_policy cors,
                                     security::api_key_authenticator auth,
                                     request_handler downstream)
    : cors_(std::move(cors)), auth_(std::move(auth)),
      downstream_(std::move(downstream)) {}

admission_gateway
admission_gateway::from_config(const config::gateway_config &config,
                               request_handler downstream) {
  return admission_gateway(cors_policy(config.allowed_origins),
                           security::api_key_authenticator(config.api_key),
                           std::move(downstream));
}

gateway_response admission_gateway::handle(const gateway_request &req) const {
  if (cors_policy::is_preflight(req)) {
    auto res = cors_.preflight_response(req);
    if (res.status != static_cast<int>(http_status::ok)) {
      logger_adapter::log_security_event(
          security_event_type::preflight_rejected,
          "Disallowed CORS origin " + std::string(*req.header("Origin")),
          request_line(req));
    }
    return res;
  }

  auto origin = req.header("Origin");
  if (cors_.evaluate(origin) == cors_decision::rejected) {
    // Advisory only: the request proceeds, the browser blocks the read
    logger_adapter::log_security_event(
        security_event_type::origin_rejected,
        "Origin not allowed: " + std::string(*origin), request_line(req));
  }

  auto admitted = auth_.authenticate(req);
  if (admitted.is_err()) {
    logger_adapter::log_security_event(
        security_event_type::authentication_failure,
        req.header(security::api_key_header) ? "invalid x-api-key"
                                             : "missing x-api-key",
        request_line(req));

    auto res = unauthorized_response(admitted.error().message);
    cors_.apply(req, res);
    return res;
  }

  auto res = forward(req);
  cors_.apply(req, res);
  return res;
}

gateway_response admission_gateway::forward(const gateway_request &req) const {
  if (!downstream_) {
    logger_adapter::error("No downstream handler for {}", request_line(req));
    return make_json_response(
        http_status::bad_gateway,
        make_error_json("DOWNSTREAM_UNAVAILABLE",
                        "No downstream handler configured"));
  }

  try {
    return downstream_(req);
  } catch (const std::exception &e) {
    logger_adapter::error("Downstream handler failed for {}: {}",
                          request_line(req), e.what());
    return make_json_response(
        http_status::internal_server_error,
        make_error_json("INTERNAL_ERROR", "Internal server error"));
  }
}

} // namespace gateway::web
