/**
 * @file cors_policy.hpp
 * @brief Origin allow-list evaluation and CORS response headers
 *
 * Matching is exact and byte-for-byte. The only pattern is the "*"
 * sentinel, which admits every origin. An empty allow-list rejects every
 * cross-origin request.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "rest_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace gateway::web {

/**
 * @enum cors_decision
 * @brief Outcome of evaluating a request origin
 */
enum class cors_decision {
  not_cross_origin, ///< No Origin header present
  allowed,          ///< Origin is on the allow-list (or "*" configured)
  rejected          ///< Origin is not permitted
};

/**
 * @struct cors_options
 * @brief Tunables for CORS responses
 */
struct cors_options {
  /// Value of Access-Control-Allow-Methods on preflight responses
  std::string allow_methods{"DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT"};

  /// Emit Access-Control-Allow-Credentials for explicitly listed origins
  bool allow_credentials{true};

  /// Access-Control-Max-Age on preflight responses
  std::chrono::seconds max_age{600};
};

/**
 * @class cors_policy
 * @brief Immutable CORS policy built from the configured allow-list
 *
 * Thread Safety: const member functions may be called concurrently.
 */
class cors_policy {
public:
  explicit cors_policy(const std::vector<std::string> &allowed_origins,
                       cors_options options = {});

  /**
   * @brief Evaluate an Origin header value against the allow-list
   * @param origin Origin header, or std::nullopt if absent
   */
  [[nodiscard]] cors_decision
  evaluate(std::optional<std::string_view> origin) const;

  /**
   * @brief Check whether a request is a CORS preflight
   *
   * A preflight is an OPTIONS request carrying both Origin and
   * Access-Control-Request-Method.
   */
  [[nodiscard]] static bool is_preflight(const gateway_request &req);

  /**
   * @brief Build the direct answer to a preflight request
   *
   * Allowed origins get 200 with the permissive headers; rejected origins
   * get 400 without any Access-Control-Allow-* header.
   */
  [[nodiscard]] gateway_response preflight_response(const gateway_request &req) const;

  /**
   * @brief Add CORS headers for a simple (non-preflight) request
   *
   * The response is left untouched when the origin is rejected or absent,
   * except for Vary: Origin whenever the answer depends on the origin.
   */
  void apply(const gateway_request &req, gateway_response &res) const;

  [[nodiscard]] bool allows_any_origin() const noexcept { return allow_all_; }

  [[nodiscard]] bool rejects_all_origins() const noexcept {
    return !allow_all_ && origins_.empty();
  }

private:
  void add_allow_origin(std::string_view origin, gateway_response &res) const;

  std::unordered_set<std::string> origins_;
  bool allow_all_{false};
  cors_options options_;
};

} // namespace gateway::web
