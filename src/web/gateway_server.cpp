/**
 * @file gateway_server.cpp
 * @brief Gateway HTTP server implementation
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

// IMPORTANT: Include Crow FIRST before any gateway headers
#include "crow.h"

#include "gateway/integration/logger_adapter.hpp"
#include "gateway/web/admission_gateway.hpp"
#include "gateway/web/endpoints/service_endpoints.hpp"
#include "gateway/web/gateway_server.hpp"
#include "gateway/web/listener_probe.hpp"

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace gateway::web {

namespace {

using integration::logger_adapter;

gateway_request to_gateway_request(const crow::request &req) {
  gateway_request out;
  out.method = crow::method_name(req.method);
  out.path = req.url;
  out.body = req.body;
  out.remote_ip = req.remote_ip_address;

  for (const auto &[name, value] : req.headers) {
    auto [it, inserted] = out.headers.emplace(name, value);
    if (!inserted) {
      it->second += ", " + value;
    }
  }
  return out;
}

crow::response to_crow_response(const gateway_response &res) {
  crow::response out(res.status);
  for (const auto &[name, value] : res.headers) {
    out.set_header(name, value);
  }
  out.body = res.body;
  return out;
}

/**
 * @brief Crow middleware that hands OPTIONS requests to the gate
 *
 * Crow answers OPTIONS on its own (204 with an Allow header) without
 * entering any route, but it still runs after_handle on that response.
 * The gate's answer replaces Crow's, so preflights get the CORS policy.
 */
struct preflight_middleware {
  struct context {};

  std::shared_ptr<const admission_gateway> gate;

  void before_handle(crow::request & /*req*/, crow::response & /*res*/,
                     context & /*ctx*/) {}

  void after_handle(crow::request &req, crow::response &res,
                    context & /*ctx*/) {
    if (req.method != crow::HTTPMethod::Options || !gate) {
      return;
    }

    auto answer = gate->handle(to_gateway_request(req));
    res.code = answer.status;
    res.headers.clear();
    for (const auto &[name, value] : answer.headers) {
      res.set_header(name, value);
    }
    res.body = std::move(answer.body);
  }
};

using gateway_app = crow::App<preflight_middleware>;

constexpr auto startup_timeout = std::chrono::seconds(5);
constexpr auto startup_poll_interval = std::chrono::milliseconds(10);

} // namespace

/**
 * @brief Implementation details for gateway_server
 */
struct gateway_server::impl {
  config::gateway_config config;
  request_handler downstream{endpoints::make_service_endpoints()};
  std::vector<std::string> public_paths;
  std::shared_ptr<const admission_gateway> gate;
  std::unique_ptr<gateway_app> app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::atomic<bool> serving_done{false};
  std::mutex mutex;

  impl() = default;

  explicit impl(const config::gateway_config &cfg) : config(cfg) {}

  /// Build the gate and the Crow app; every route funnels into the gate
  void prepare() {
    auto built = admission_gateway::from_config(config, downstream);
    for (const auto &path : public_paths) {
      built.authenticator().add_public_path(path);
    }
    gate = std::make_shared<const admission_gateway>(std::move(built));

    app = std::make_unique<gateway_app>();
    app->signal_clear();
    app->loglevel(crow::LogLevel::Warning);
    app->get_middleware<preflight_middleware>().gate = gate;

    auto gate_ref = gate;
    auto dispatch = [gate_ref](const crow::request &req) {
      auto res = gate_ref->handle(to_gateway_request(req));
      logger_adapter::debug("{} {} -> {}", crow::method_name(req.method),
                            req.url, res.status);
      return to_crow_response(res);
    };

    // OPTIONS never reaches a route; preflight_middleware covers it
    CROW_ROUTE((*app), "/")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST,
                 crow::HTTPMethod::PUT, crow::HTTPMethod::PATCH,
                 crow::HTTPMethod::DELETE)(
            [dispatch](const crow::request &req) { return dispatch(req); });

    CROW_ROUTE((*app), "/<path>")
        .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST,
                 crow::HTTPMethod::PUT, crow::HTTPMethod::PATCH,
                 crow::HTTPMethod::DELETE)(
            [dispatch](const crow::request &req, const std::string & /*path*/) {
              return dispatch(req);
            });

    app->bindaddr(config.bind_address)
        .port(config.port)
        .concurrency(static_cast<std::uint16_t>(config.concurrency));
  }

  /// Run the prepared app until stopped; converts transport failures
  VoidResult run() {
    try {
      app->run();
    } catch (const std::exception &e) {
      running = false;
      logger_adapter::error("Gateway server on {}:{} failed: {}",
                            config.bind_address, config.port, e.what());
      return gateway_void_error(error_codes::bind_error, e.what());
    }
    running = false;
    return ok();
  }

  /// Wait until the listener accepts connections or the server thread ends
  VoidResult await_startup() {
    const auto deadline = std::chrono::steady_clock::now() + startup_timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (serving_done) {
        if (server_thread.joinable()) {
          server_thread.join();
        }
        return gateway_void_error(error_codes::bind_error,
                                  "Gateway server stopped during startup");
      }
      if (accepts_connections(config.bind_address, config.port)) {
        // Listening implies Crow has announced the start; this returns at once
        app->wait_for_server_start();
        return ok();
      }
      std::this_thread::sleep_for(startup_poll_interval);
    }

    app->stop();
    if (server_thread.joinable()) {
      server_thread.join();
    }
    running = false;
    return gateway_void_error(error_codes::bind_error,
                              "Gateway server did not start listening in time");
  }

  void log_startup() const {
    logger_adapter::info("Gateway listening on {}:{} (env={}, workers={})",
                         config.bind_address, config.port, config.app_env,
                         config.concurrency);
    if (gate->cors().allows_any_origin()) {
      logger_adapter::info("CORS: all origins allowed");
    } else if (gate->cors().rejects_all_origins()) {
      logger_adapter::info("CORS: no origins allowed");
    } else {
      logger_adapter::info("CORS: {} allowed origin(s)",
                           config.allowed_origins.size());
    }
  }
};

gateway_server::gateway_server() : impl_(std::make_unique<impl>()) {}

gateway_server::gateway_server(const config::gateway_config &config)
    : impl_(std::make_unique<impl>(config)) {}

gateway_server::~gateway_server() {
  if (impl_) {
    stop();
  }
}

gateway_server::gateway_server(gateway_server &&other) noexcept = default;
gateway_server &gateway_server::operator=(gateway_server &&other) noexcept = default;

const config::gateway_config &gateway_server::config() const noexcept {
  return impl_->config;
}

void gateway_server::set_downstream(request_handler handler) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->downstream = std::move(handler);
}

void gateway_server::add_public_path(std::string path_template) {
  std::lock_guard<std::mutex> lock(impl_->mutex);
  impl_->public_paths.push_back(std::move(path_template));
}

VoidResult gateway_server::bind() const {
  return probe_listener(impl_->config.bind_address, impl_->config.port);
}

VoidResult gateway_server::start() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->running.exchange(true)) {
      return ok(); // Already running
    }

    auto bound = bind();
    if (bound.is_err()) {
      impl_->running = false;
      return bound;
    }

    impl_->prepare();
    impl_->log_startup();
  }

  return impl_->run();
}

VoidResult gateway_server::start_async() {
  auto *state = impl_.get();
  {
    std::lock_guard<std::mutex> lock(state->mutex);
    if (state->running.exchange(true)) {
      return ok(); // Already running
    }

    auto bound = bind();
    if (bound.is_err()) {
      state->running = false;
      return bound;
    }

    state->prepare();
    state->log_startup();

    state->serving_done = false;
    state->server_thread = std::thread([state]() {
      auto result = state->run();
      if (result.is_err()) {
        logger_adapter::error("Gateway server stopped: {}",
                              result.error().message);
      }
      state->serving_done = true;
    });
  }

  // Crow binds on its own thread; a failure there ends the thread early
  return state->await_startup();
}

void gateway_server::stop() {
  {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->app) {
      impl_->app->stop();
    }
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->running = false;
}

bool gateway_server::is_running() const noexcept { return impl_->running; }

void gateway_server::wait() {
  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }
}

std::uint16_t gateway_server::port() const noexcept {
  return impl_->running ? impl_->config.port : 0;
}

} // namespace gateway::web
