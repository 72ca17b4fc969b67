/**
 * @file api_key_authenticator.cpp
 * @brief API key admission control implementation
 */

#include "gateway/security/api_key_authenticator.hpp"
#include "gateway/security/constant_time.hpp"

#include <utility>

namespace gateway::security {

namespace {

std::vector<std::string> split_segments(std::string_view path) {
  std::vector<std::string> segments;
  std::size_t start = 0;
  while (start < path.size()) {
    auto slash = path.find('/', start);
    if (slash == std::string_view::npos) {
      slash = path.size();
    }
    segments.emplace_back(path.substr(start, slash - start));
    start = slash + 1;
  }
  // Keep a trailing empty segment so "/docs" and "/docs/" stay distinct
  if (!path.empty() && path.back() == '/') {
    segments.emplace_back();
  }
  return segments;
}

bool is_placeholder(const std::string &segment) {
  return segment.size() > 2 && segment.front() == '{' && segment.back() == '}';
}

} // namespace

api_key_authenticator::api_key_authenticator(std::optional<std::string> api_key) {
  if (api_key && !api_key->empty()) {
    api_key_ = std::move(api_key);
  }

  add_public_path("/healthz");
  add_public_path("/docs");
  add_public_path("/redoc");
  add_public_prefix("/docs/");
}

void api_key_authenticator::add_public_path(std::string_view path_template) {
  public_paths_.push_back(split_segments(path_template));
}

void api_key_authenticator::add_public_prefix(std::string prefix) {
  public_prefixes_.push_back(std::move(prefix));
}

bool api_key_authenticator::is_exempt(std::string_view method,
                                      std::string_view path) const {
  // CORS preflight never carries credentials
  if (method == "OPTIONS") {
    return true;
  }
  for (const auto &prefix : public_prefixes_) {
    if (path.substr(0, prefix.size()) == prefix) {
      return true;
    }
  }
  return matches_public_path(path);
}

VoidResult
api_key_authenticator::authenticate(const web::gateway_request &req) const {
  if (open_mode() || is_exempt(req.method, req.path)) {
    return ok();
  }

  auto provided = req.header(api_key_header);
  if (!provided || provided->empty()) {
    return gateway_void_error(error_codes::unauthorized,
                              "Unauthorized: missing or invalid x-api-key",
                              "missing x-api-key");
  }

  if (!constant_time_equals(*provided, *api_key_)) {
    return gateway_void_error(error_codes::unauthorized,
                              "Unauthorized: missing or invalid x-api-key",
                              "invalid x-api-key");
  }

  return ok();
}

bool api_key_authenticator::matches_public_path(std::string_view path) const {
  auto segments = split_segments(path);
  for (const auto &pattern : public_paths_) {
    if (pattern.size() != segments.size()) {
      continue;
    }
    bool matched = true;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
      if (is_placeholder(pattern[i])) {
        if (segments[i].empty()) {
          matched = false;
          break;
        }
      } else if (pattern[i] != segments[i]) {
        matched = false;
        break;
      }
    }
    if (matched) {
      return true;
    }
  }
  return false;
}

} // namespace gateway::security
