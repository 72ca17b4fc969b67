/**
 * @file rest_types.hpp
 * @brief Common request/response types and JSON helpers for the gateway
 *
 * The gateway pipeline works on these framework-neutral types; the HTTP
 * server converts to and from them at the transport boundary.
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace gateway::web {

/**
 * @enum http_status
 * @brief HTTP status codes produced by the gateway itself
 */
enum class http_status : std::uint16_t {
  ok = 200,
  no_content = 204,
  bad_request = 400,
  unauthorized = 401,
  forbidden = 403,
  not_found = 404,
  method_not_allowed = 405,
  internal_server_error = 500,
  bad_gateway = 502
};

/**
 * @struct case_insensitive_less
 * @brief Ordering for HTTP header names
 */
struct case_insensitive_less {
  using is_transparent = void;

  bool operator()(std::string_view lhs, std::string_view rhs) const noexcept {
    return std::lexicographical_compare(
        lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
        [](unsigned char a, unsigned char b) {
          return std::tolower(a) < std::tolower(b);
        });
  }
};

/// Header map keyed case-insensitively
using header_map = std::map<std::string, std::string, case_insensitive_less>;

/**
 * @struct gateway_request
 * @brief Transient view of one inbound HTTP request
 */
struct gateway_request {
  std::string method{"GET"};
  std::string path{"/"};
  header_map headers;
  std::string body;
  std::string remote_ip;

  /**
   * @brief Look up a header value
   * @return The value, or std::nullopt if the header is absent
   */
  [[nodiscard]] std::optional<std::string_view>
  header(std::string_view name) const {
    auto it = headers.find(name);
    if (it == headers.end()) {
      return std::nullopt;
    }
    return std::string_view(it->second);
  }
};

/**
 * @struct gateway_response
 * @brief Response relayed back to the client
 */
struct gateway_response {
  int status{200};
  header_map headers;
  std::string body;

  void set_header(std::string name, std::string value) {
    headers.insert_or_assign(std::move(name), std::move(value));
  }

  [[nodiscard]] bool has_header(std::string_view name) const {
    return headers.find(name) != headers.end();
  }
};

/**
 * @brief Downstream handler that receives admitted requests
 */
using request_handler =
    std::function<gateway_response(const gateway_request &)>;

/**
 * @brief Escape a string for JSON
 * @param s Input string
 * @return JSON-escaped string
 */
[[nodiscard]] inline std::string json_escape(std::string_view s) {
  std::string result;
  result.reserve(s.size() + 10);
  for (char c : s) {
    switch (c) {
    case '"':
      result += "\\\"";
      break;
    case '\\':
      result += "\\\\";
      break;
    case '\n':
      result += "\\n";
      break;
    case '\r':
      result += "\\r";
      break;
    case '\t':
      result += "\\t";
      break;
    default:
      result += c;
      break;
    }
  }
  return result;
}

/**
 * @brief Create JSON error response body
 * @param code Error code
 * @param message Error message
 * @return JSON string
 */
[[nodiscard]] inline std::string make_error_json(std::string_view code,
                                                 std::string_view message) {
  return std::string(R"({"error":{"code":")") + json_escape(code) +
         R"(","message":")" + json_escape(message) + R"("}})";
}

/**
 * @brief Build a JSON response with the given status and body
 */
[[nodiscard]] inline gateway_response make_json_response(http_status status,
                                                         std::string body) {
  gateway_response res;
  res.status = static_cast<int>(status);
  res.set_header("Content-Type", "application/json");
  res.body = std::move(body);
  return res;
}

} // namespace gateway::web
