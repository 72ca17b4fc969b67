/**
 * @file admission_gateway.hpp
 * @brief Request admission pipeline in front of downstream handling
 *
 * Every request goes through the same steps:
 * 1. CORS preflights are answered directly and never forwarded.
 * 2. The API key is checked; failures become 401 responses.
 * 3. Admitted requests are forwarded and the downstream response is
 *    relayed unchanged apart from CORS headers.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include "cors_policy.hpp"
#include "rest_types.hpp"

#include "gateway/config/gateway_config.hpp"
#include "gateway/security/api_key_authenticator.hpp"

namespace gateway::web {

/**
 * @class admission_gateway
 * @brief Framework-independent request gate
 *
 * Holds no per-request state. After construction (and any public path
 * registration) handle() may be called from many threads at once.
 */
class admission_gateway {
public:
  admission_gateway(cors_policy cors, security::api_key_authenticator auth,
                    request_handler downstream);

  /**
   * @brief Build a gateway from the startup configuration
   * @param config Immutable gateway configuration
   * @param downstream Handler receiving admitted requests
   */
  [[nodiscard]] static admission_gateway
  from_config(const config::gateway_config &config, request_handler downstream);

  /**
   * @brief Gate one request and produce its response
   *
   * Never throws; downstream exceptions are converted to 500 responses.
   */
  [[nodiscard]] gateway_response handle(const gateway_request &req) const;

  [[nodiscard]] const cors_policy &cors() const noexcept { return cors_; }

  [[nodiscard]] security::api_key_authenticator &authenticator() noexcept {
    return auth_;
  }

  [[nodiscard]] const security::api_key_authenticator &
  authenticator() const noexcept {
    return auth_;
  }

private:
  [[nodiscard]] gateway_response forward(const gateway_request &req) const;

  cors_policy cors_;
  security::api_key_authenticator auth_;
  request_handler downstream_;
};

} // namespace gateway::web
