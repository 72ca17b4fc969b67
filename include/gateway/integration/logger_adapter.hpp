/**
 * @file logger_adapter.hpp
 * @brief Adapter for gateway logging using logger_system
 *
 * This file provides the logger_adapter class for integrating logger_system
 * with the gateway. It supports standard application logging and a security
 * audit trail for admission decisions.
 */

#pragma once

#include <gateway/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace gateway::integration {

/**
 * @enum log_level
 * @brief Log severity levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5,
    off = 6
};

/**
 * @brief Parse a log level name (case-insensitive)
 * @param name One of trace, debug, info, warn, warning, error, fatal, off
 * @return The level, or std::nullopt for an unknown name
 */
[[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

/**
 * @brief Convert a log level to its lowercase name
 */
[[nodiscard]] auto to_string(log_level level) -> std::string_view;

/**
 * @enum security_event_type
 * @brief Types of security events for audit logging
 */
enum class security_event_type {
    authentication_failure,
    origin_rejected,
    preflight_rejected,
    open_mode_enabled,
    configuration_error
};

/**
 * @struct logger_config
 * @brief Configuration options for the logger adapter
 */
struct logger_config {
    /// Directory for log files
    std::filesystem::path log_directory{"logs"};

    /// Minimum log level to output
    log_level min_level{log_level::info};

    /// Enable console output
    bool enable_console{true};

    /// Enable rotating file output
    bool enable_file{false};

    /// Enable separate JSON-lines security audit trail
    bool enable_audit_log{false};

    /// Maximum log file size in megabytes before rotation
    std::size_t max_file_size_mb{100};

    /// Maximum number of rotated log files to keep
    std::size_t max_files{10};

    /// Use asynchronous logging
    bool async_mode{true};

    /// Buffer size for async logging
    std::size_t buffer_size{8192};
};

/**
 * @class logger_adapter
 * @brief Logging facade for the gateway backed by logger_system
 *
 * All calls are no-ops until initialize() has been called, so library code
 * can log unconditionally and unit tests run without a configured backend.
 *
 * Thread Safety: All methods are thread-safe.
 *
 * @example
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * logger_adapter::info("Gateway listening on {}:{}", "0.0.0.0", 8000);
 * logger_adapter::log_security_event(
 *     security_event_type::authentication_failure,
 *     "missing x-api-key", "GET /api/users");
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @brief Initialize the logger with configuration
     *
     * Sets up console and file writers and the audit trail. Calling it
     * again while initialized has no effect.
     *
     * @param config Configuration options
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and release the backend
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::trace, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void debug(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::debug, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void info(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::info, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void warn(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::warn, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void error(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::error, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    static void fatal(gateway::compat::format_string<Args...> fmt, Args&&... args) {
        log(log_level::fatal, gateway::compat::format(fmt, std::forward<Args>(args)...));
    }

    /**
     * @brief Log a message at the specified level
     * @param level Log severity level
     * @param message The message to log
     */
    static void log(log_level level, const std::string& message);

    /**
     * @brief Check if a log level is enabled
     * @param level The level to check
     * @return true if messages at this level will be logged
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    /**
     * @brief Log a security-related event
     *
     * Writes a warning to the main log and, when the audit trail is
     * enabled, appends a JSON line to `audit.json`.
     *
     * @param type Type of security event
     * @param description Human-readable description
     * @param subject Request line or client the event concerns
     */
    static void log_security_event(security_event_type type,
                                   const std::string& description,
                                   const std::string& subject = "");

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> const logger_config&;

private:
    static void write_audit_log(const std::string& event_type,
                                const std::string& outcome,
                                const std::map<std::string, std::string>& fields);

    [[nodiscard]] static auto security_event_to_string(security_event_type type)
        -> std::string;

    class impl;
    static std::unique_ptr<impl> pimpl_;
};

} // namespace gateway::integration
