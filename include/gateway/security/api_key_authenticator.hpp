/**
 * @file api_key_authenticator.hpp
 * @brief Shared-secret admission control for inbound requests
 *
 * Requests must present the configured key in the x-api-key header unless
 * they are CORS preflights or target a public path. Without a configured
 * key the authenticator runs in open mode and admits everything.
 */

#pragma once

#include "gateway/core/result.hpp"
#include "gateway/web/rest_types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gateway::security {

/// Header carrying the client credential
constexpr std::string_view api_key_header = "x-api-key";

/**
 * @class api_key_authenticator
 * @brief Stateless per-request API key check
 *
 * Public paths are registered before the server starts; afterwards the
 * object is only read, so authenticate() may run on any number of worker
 * threads concurrently.
 *
 * @par Example
 * @code
 * api_key_authenticator auth(std::string("secret123"));
 * auth.add_public_path("/api/users/by-qr/{qrId}");
 *
 * auto result = auth.authenticate(request);
 * if (result.is_err()) {
 *   // respond 401
 * }
 * @endcode
 */
class api_key_authenticator {
public:
  /**
   * @brief Construct with the configured key
   * @param api_key Expected key; std::nullopt or empty enables open mode
   */
  explicit api_key_authenticator(std::optional<std::string> api_key);

  /**
   * @brief Register an exact public path
   *
   * Segments written as {name} match any single non-empty segment.
   */
  void add_public_path(std::string_view path_template);

  /**
   * @brief Register a public path prefix (e.g. "/docs/")
   */
  void add_public_prefix(std::string prefix);

  /**
   * @brief Check whether the API-key check is disabled
   */
  [[nodiscard]] bool open_mode() const noexcept { return !api_key_.has_value(); }

  /**
   * @brief Check whether a request is exempt from the key check
   */
  [[nodiscard]] bool is_exempt(std::string_view method,
                               std::string_view path) const;

  /**
   * @brief Admit or reject a request
   * @return ok() when admitted, or an error with code
   *         error_codes::unauthorized
   */
  [[nodiscard]] VoidResult authenticate(const web::gateway_request &req) const;

private:
  [[nodiscard]] bool matches_public_path(std::string_view path) const;

  std::optional<std::string> api_key_;
  std::vector<std::vector<std::string>> public_paths_;
  std::vector<std::string> public_prefixes_;
};

} // namespace gateway::security
