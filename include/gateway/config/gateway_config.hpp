/**
 * @file gateway_config.hpp
 * @brief Process-wide gateway configuration loaded from the environment
 *
 * The configuration is read once at startup and never mutated afterwards,
 * so request handlers share it read-only without locking.
 */

#pragma once

#include <gateway/core/result.hpp>
#include <gateway/integration/logger_adapter.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gateway::config {

/// Environment variable names
namespace env {
constexpr const char* port = "PORT";
constexpr const char* allowed_origins = "ALLOWED_ORIGINS";
constexpr const char* api_key = "API_KEY";
constexpr const char* api_base_path = "API_BASE_PATH";
constexpr const char* app_env = "APP_ENV";
constexpr const char* bind_address = "BIND_ADDRESS";
constexpr const char* concurrency = "GATEWAY_CONCURRENCY";
constexpr const char* log_level = "LOG_LEVEL";
constexpr const char* log_dir = "LOG_DIR";
constexpr const char* audit_log = "AUDIT_LOG";
} // namespace env

/// Port used when PORT is unset or out of range
constexpr std::uint16_t default_port = 8000;

/// Origin entry that admits every origin
constexpr std::string_view wildcard_origin = "*";

/**
 * @struct gateway_config
 * @brief Immutable startup configuration of the gateway
 */
struct gateway_config {
    /// Address to bind the listener to
    std::string bind_address{"0.0.0.0"};

    /// Port to listen on
    std::uint16_t port{default_port};

    /// CORS allow-list; "*" admits any origin, empty rejects all
    std::vector<std::string> allowed_origins{std::string(wildcard_origin)};

    /// Shared secret expected in x-api-key; std::nullopt means open mode
    std::optional<std::string> api_key;

    /// Base path under which downstream API routes live
    std::string api_base_path{"/api"};

    /// Deployment environment name (dev, staging, prod, ...)
    std::string app_env{"dev"};

    /// Number of worker threads for handling requests
    std::size_t concurrency{4};

    /// Minimum log level
    integration::log_level log_level{integration::log_level::info};

    /// Directory for gateway.log and audit.json; std::nullopt logs to console only
    std::optional<std::string> log_directory;

    /// Write the JSON-lines security audit trail
    bool audit_log{false};

    /**
     * @brief Check whether the API-key check is disabled
     * @return true when no key, or an empty key, is configured
     */
    [[nodiscard]] bool open_mode() const noexcept {
        return !api_key.has_value() || api_key->empty();
    }
};

/**
 * @brief Lookup function for a single environment variable
 *
 * Returns std::nullopt when the variable is not set.
 */
using environment_lookup =
    std::function<std::optional<std::string>(const std::string&)>;

/**
 * @brief Lookup backed by the real process environment
 */
[[nodiscard]] environment_lookup process_environment();

/**
 * @brief Lookup backed by a fixed map, for tests and embedding
 */
[[nodiscard]] environment_lookup
map_environment(std::map<std::string, std::string> values);

/**
 * @brief Load the gateway configuration
 *
 * Unset values take their defaults. A PORT outside 1-65535 falls back to
 * 8000 with a warning; a non-numeric PORT is a configuration error.
 *
 * @param lookup Environment lookup
 * @return The configuration, or an error with code error_codes::config_error
 */
[[nodiscard]] Result<gateway_config> load_gateway_config(const environment_lookup& lookup);

/**
 * @brief Logger settings for a loaded configuration
 *
 * Console output is always on. LOG_DIR adds the rotating gateway.log;
 * AUDIT_LOG adds audit.json in LOG_DIR, or in "logs" when LOG_DIR is unset.
 */
[[nodiscard]] integration::logger_config make_logger_config(const gateway_config& config);

/**
 * @brief Split a comma-separated origin list, trimming and dropping blanks
 */
[[nodiscard]] std::vector<std::string> split_origin_list(std::string_view value);

/**
 * @brief Normalize an API base path to "/segment" form without trailing '/'
 *
 * An input that normalizes to "/" or "" yields "/api".
 */
[[nodiscard]] std::string normalize_base_path(std::string_view value);

} // namespace gateway::config
