/**
 * @file gateway_main.cpp
 * @brief Entry point for the admission gateway server
 *
 * The process takes no command-line arguments. All settings come from the
 * environment (PORT, ALLOWED_ORIGINS, API_KEY, LOG_DIR, AUDIT_LOG, ...) and
 * are read once.
 *
 * Exit codes:
 *   0  orderly shutdown after SIGINT/SIGTERM
 *   1  configuration error
 *   2  the listen address could not be bound
 */

#include <gateway/config/gateway_config.hpp>
#include <gateway/integration/logger_adapter.hpp>
#include <gateway/web/gateway_server.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

constexpr int exit_config_error = 1;
constexpr int exit_bind_error = 2;

std::atomic<bool> g_shutdown_requested{false};

/// Signal handler for graceful shutdown
void signal_handler(int /*signal*/) { g_shutdown_requested = true; }

/// Install signal handlers
void install_signal_handlers() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

}  // namespace

int main(int argc, char* argv[]) {
    using gateway::integration::log_level;
    using gateway::integration::logger_adapter;
    using gateway::integration::logger_config;
    using gateway::integration::security_event_type;

    if (argc > 1) {
        std::cerr << "Usage: " << argv[0]
                  << " (configuration is read from the environment)\n";
        return exit_config_error;
    }

    logger_config log_config;
    log_config.min_level = log_level::info;
    logger_adapter::initialize(log_config);

    auto loaded = gateway::config::load_gateway_config(
        gateway::config::process_environment());
    if (loaded.is_err()) {
        logger_adapter::log_security_event(
            security_event_type::configuration_error, loaded.error().message);
        logger_adapter::shutdown();
        return exit_config_error;
    }

    const auto config = loaded.value();

    // Reopen the logger with the file and audit outputs the environment asks for
    logger_adapter::shutdown();
    logger_adapter::initialize(gateway::config::make_logger_config(config));

    if (config.open_mode()) {
        logger_adapter::log_security_event(
            security_event_type::open_mode_enabled,
            "API_KEY is not set; every request is admitted without a key");
    }
    logger_adapter::info("API base path: {}", config.api_base_path);

    install_signal_handlers();

    gateway::web::gateway_server server(config);
    auto started = server.start_async();
    if (started.is_err()) {
        logger_adapter::fatal("BindError: {}", started.error().message);
        logger_adapter::shutdown();
        return exit_bind_error;
    }

    while (!g_shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // Server thread exited without a signal: the transport failed
    const bool failed = !g_shutdown_requested;

    logger_adapter::info("Shutting down gateway");
    server.stop();
    logger_adapter::shutdown();
    return failed ? exit_bind_error : 0;
}
