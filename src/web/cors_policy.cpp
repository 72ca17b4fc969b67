/**
 * @file cors_policy.cpp
 * @brief CORS policy implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "gateway/web/cors_policy.hpp"

namespace gateway::web {

namespace {

constexpr std::string_view allow_origin_header = "Access-Control-Allow-Origin";

void add_vary_origin(gateway_response &res) {
  auto it = res.headers.find(std::string_view("Vary"));
  if (it == res.headers.end()) {
    res.set_header("Vary", "Origin");
  } else if (it->second.find("Origin") == std::string::npos) {
    it->second += ", Origin";
  }
}

} // namespace

cors_policy::cors_policy(const std::vector<std::string> &allowed_origins,
                         cors_options options)
    : options_(std::move(options)) {
  for (const auto &origin : allowed_origins) {
    if (origin == "*") {
      allow_all_ = true;
    } else {
      origins_.insert(origin);
    }
  }
}

cors_decision
cors_policy::evaluate(std::optional<std::string_view> origin) const {
  if (!origin) {
    return cors_decision::not_cross_origin;
  }
  if (allow_all_) {
    return cors_decision::allowed;
  }
  if (origins_.find(std::string(*origin)) != origins_.end()) {
    return cors_decision::allowed;
  }
  return cors_decision::rejected;
}

bool cors_policy::is_preflight(const gateway_request &req) {
  return req.method == "OPTIONS" && req.header("Origin").has_value() &&
         req.header("Access-Control-Request-Method").has_value();
}

gateway_response
cors_policy::preflight_response(const gateway_request &req) const {
  gateway_response res;
  auto origin = req.header("Origin");

  if (!allow_all_) {
    add_vary_origin(res);
  }

  if (evaluate(origin) != cors_decision::allowed) {
    res.status = static_cast<int>(http_status::bad_request);
    res.set_header("Content-Type", "text/plain; charset=utf-8");
    res.body = "Disallowed CORS origin";
    return res;
  }

  res.status = static_cast<int>(http_status::ok);
  add_allow_origin(*origin, res);
  res.set_header("Access-Control-Allow-Methods", options_.allow_methods);

  if (auto requested = req.header("Access-Control-Request-Headers")) {
    res.set_header("Access-Control-Allow-Headers", std::string(*requested));
  }

  res.set_header("Access-Control-Max-Age",
                 std::to_string(options_.max_age.count()));
  res.set_header("Content-Type", "text/plain; charset=utf-8");
  res.body = "OK";
  return res;
}

void cors_policy::apply(const gateway_request &req,
                        gateway_response &res) const {
  auto origin = req.header("Origin");

  if (!allow_all_) {
    add_vary_origin(res);
  }

  if (evaluate(origin) != cors_decision::allowed) {
    return;
  }

  add_allow_origin(*origin, res);
}

void cors_policy::add_allow_origin(std::string_view origin,
                                   gateway_response &res) const {
  if (allow_all_) {
    res.set_header(std::string(allow_origin_header), "*");
    return;
  }

  res.set_header(std::string(allow_origin_header), std::string(origin));
  if (options_.allow_credentials) {
    res.set_header("Access-Control-Allow-Credentials", "true");
  }
}

} // namespace gateway::web
