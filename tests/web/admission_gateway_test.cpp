/**
 * @file admission_gateway_test.cpp
 * @brief Unit tests for the request admission pipeline
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include <catch2/catch_test_macros.hpp>

#include "gateway/web/admission_gateway.hpp"
#include "gateway/web/endpoints/service_endpoints.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace gateway::web;
using gateway::config::gateway_config;

namespace {

/**
 * @brief Downstream double that records what reached it
 */
struct recording_downstream {
  std::vector<gateway_request> calls;

  request_handler handler() {
    return [this](const gateway_request &req) {
      calls.push_back(req);
      gateway_response res;
      res.status = 201;
      res.set_header("Content-Type", "application/json");
      res.set_header("X-Downstream", "yes");
      res.body = R"({"created":true})";
      return res;
    };
  }
};

gateway_config make_config(std::optional<std::string> api_key,
                           std::vector<std::string> origins = {"*"}) {
  gateway_config config;
  config.api_key = std::move(api_key);
  config.allowed_origins = std::move(origins);
  return config;
}

gateway_request make_request(std::string method, std::string path) {
  gateway_request req;
  req.method = std::move(method);
  req.path = std::move(path);
  return req;
}

} // namespace

TEST_CASE("admission_gateway with API_KEY=secret123", "[web][gateway]") {
  recording_downstream downstream;
  auto gate = admission_gateway::from_config(make_config("secret123"),
                                             downstream.handler());

  SECTION("request without credential gets 401 and is not forwarded") {
    auto res = gate.handle(make_request("GET", "/api/users"));

    REQUIRE(res.status == 401);
    REQUIRE(res.headers.at("Content-Type") == "application/json");
    REQUIRE(res.body ==
            R"({"status":"error","message":"Unauthorized: missing or invalid x-api-key"})");
    REQUIRE(downstream.calls.empty());
  }

  SECTION("request with incorrect credential gets 401") {
    auto req = make_request("POST", "/api/users");
    req.headers.emplace("x-api-key", "secret1234");

    auto res = gate.handle(req);

    REQUIRE(res.status == 401);
    REQUIRE(downstream.calls.empty());
  }

  SECTION("request with matching credential is forwarded and relayed") {
    auto req = make_request("POST", "/api/users");
    req.headers.emplace("x-api-key", "secret123");
    req.body = R"({"name":"a"})";

    auto res = gate.handle(req);

    REQUIRE(downstream.calls.size() == 1);
    REQUIRE(downstream.calls[0].path == "/api/users");
    REQUIRE(downstream.calls[0].body == R"({"name":"a"})");
    REQUIRE(res.status == 201);
    REQUIRE(res.body == R"({"created":true})");
    REQUIRE(res.headers.at("X-Downstream") == "yes");
    REQUIRE(res.headers.at("Content-Type") == "application/json");
  }

  SECTION("public health path bypasses the key") {
    auto res = gate.handle(make_request("GET", "/healthz"));
    REQUIRE(res.status == 201);
    REQUIRE(downstream.calls.size() == 1);
  }

  SECTION("401 responses still carry CORS headers for allowed origins") {
    auto req = make_request("GET", "/api/users");
    req.headers.emplace("Origin", "https://a.example");

    auto res = gate.handle(req);

    REQUIRE(res.status == 401);
    REQUIRE(res.headers.at("Access-Control-Allow-Origin") == "*");
  }
}

TEST_CASE("admission_gateway open mode never returns 401", "[web][gateway]") {
  recording_downstream downstream;
  auto gate = admission_gateway::from_config(make_config(std::nullopt),
                                             downstream.handler());

  for (const auto *method : {"GET", "POST", "PUT", "PATCH", "DELETE"}) {
    auto res = gate.handle(make_request(method, "/api/anything"));
    REQUIRE(res.status != 401);
  }

  auto with_wrong_key = make_request("GET", "/api/users");
  with_wrong_key.headers.emplace("x-api-key", "nope");
  REQUIRE(gate.handle(with_wrong_key).status != 401);

  REQUIRE(downstream.calls.size() == 6);
}

TEST_CASE("admission_gateway CORS behaviour", "[web][gateway][cors]") {
  recording_downstream downstream;
  auto gate = admission_gateway::from_config(
      make_config("secret123", {"https://a.example"}), downstream.handler());

  SECTION("preflight from a disallowed origin lacks permissive headers") {
    auto req = make_request("OPTIONS", "/api/users");
    req.headers.emplace("Origin", "https://b.example");
    req.headers.emplace("Access-Control-Request-Method", "POST");

    auto res = gate.handle(req);

    REQUIRE(res.status == 400);
    REQUIRE_FALSE(res.has_header("Access-Control-Allow-Origin"));
    REQUIRE(downstream.calls.empty());
  }

  SECTION("preflight from an allowed origin is answered without a key") {
    auto req = make_request("OPTIONS", "/api/users");
    req.headers.emplace("Origin", "https://a.example");
    req.headers.emplace("Access-Control-Request-Method", "POST");
    req.headers.emplace("Access-Control-Request-Headers", "x-api-key");

    auto res = gate.handle(req);

    REQUIRE(res.status == 200);
    REQUIRE(res.headers.at("Access-Control-Allow-Origin") == "https://a.example");
    REQUIRE(res.headers.at("Access-Control-Allow-Headers") == "x-api-key");
    REQUIRE(downstream.calls.empty());
  }

  SECTION("simple request from a disallowed origin is processed without CORS headers") {
    auto req = make_request("GET", "/api/users");
    req.headers.emplace("Origin", "https://b.example");
    req.headers.emplace("x-api-key", "secret123");

    auto res = gate.handle(req);

    REQUIRE(res.status == 201);
    REQUIRE(downstream.calls.size() == 1);
    REQUIRE_FALSE(res.has_header("Access-Control-Allow-Origin"));
  }

  SECTION("simple request from an allowed origin carries CORS headers") {
    auto req = make_request("GET", "/api/users");
    req.headers.emplace("Origin", "https://a.example");
    req.headers.emplace("x-api-key", "secret123");

    auto res = gate.handle(req);

    REQUIRE(res.status == 201);
    REQUIRE(res.headers.at("Access-Control-Allow-Origin") == "https://a.example");
    REQUIRE(res.headers.at("Access-Control-Allow-Credentials") == "true");
  }

  SECTION("OPTIONS without preflight headers is forwarded") {
    auto res = gate.handle(make_request("OPTIONS", "/api/users"));
    REQUIRE(res.status == 201);
    REQUIRE(downstream.calls.size() == 1);
  }
}

TEST_CASE("admission_gateway downstream failures", "[web][gateway]") {
  SECTION("exception becomes 500") {
    auto gate = admission_gateway::from_config(
        make_config(std::nullopt), [](const gateway_request &) -> gateway_response {
          throw std::runtime_error("database unavailable");
        });

    auto res = gate.handle(make_request("GET", "/api/users"));

    REQUIRE(res.status == 500);
    REQUIRE(res.body.find("INTERNAL_ERROR") != std::string::npos);
    REQUIRE(res.body.find("database unavailable") == std::string::npos);
  }

  SECTION("missing downstream becomes 502") {
    auto gate = admission_gateway::from_config(make_config(std::nullopt), nullptr);
    REQUIRE(gate.handle(make_request("GET", "/")).status == 502);
  }
}

TEST_CASE("admission_gateway is safe to share across threads", "[web][gateway][concurrency]") {
  std::atomic<int> forwarded{0};
  auto gate = admission_gateway::from_config(
      make_config("secret123", {"https://a.example"}),
      [&forwarded](const gateway_request &) {
        ++forwarded;
        return gateway_response{};
      });

  std::atomic<int> rejected{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&gate, &rejected, t]() {
      for (int i = 0; i < 100; ++i) {
        auto req = make_request("GET", "/api/items");
        req.headers.emplace("x-api-key", (i + t) % 2 == 0 ? "secret123" : "bad");
        if (gate.handle(req).status == 401) {
          ++rejected;
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }

  REQUIRE(forwarded == 400);
  REQUIRE(rejected == 400);
}

TEST_CASE("service_endpoints default downstream", "[web][endpoints]") {
  auto gate = admission_gateway::from_config(make_config("secret123"),
                                             endpoints::make_service_endpoints());

  SECTION("healthz is public") {
    auto res = gate.handle(make_request("GET", "/healthz"));
    REQUIRE(res.status == 200);
    REQUIRE(res.body == R"({"status":"ok"})");
  }

  SECTION("healthz rejects writes") {
    auto res = endpoints::handle_service_request(make_request("POST", "/healthz"));
    REQUIRE(res.status == 405);
    REQUIRE(res.headers.at("Allow") == "GET, HEAD");
  }

  SECTION("unknown authenticated path is 404") {
    auto req = make_request("GET", "/api/users");
    req.headers.emplace("x-api-key", "secret123");
    auto res = gate.handle(req);
    REQUIRE(res.status == 404);
    REQUIRE(res.body.find("NOT_FOUND") != std::string::npos);
  }

  SECTION("unknown unauthenticated path is 401, not 404") {
    REQUIRE(gate.handle(make_request("GET", "/api/users")).status == 401);
  }
}
