/**
 * @file listener_probe.cpp
 * @brief Listen address probe using BSD sockets
 *
 * @copyright Copyright (c) 2025
 * @license MIT
 */

#include "gateway/web/listener_probe.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

namespace gateway::web {

namespace {

/**
 * @brief RAII wrapper for a socket descriptor
 */
class socket_handle {
public:
  explicit socket_handle(int fd) noexcept : fd_(fd) {}
  ~socket_handle() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  socket_handle(const socket_handle &) = delete;
  socket_handle &operator=(const socket_handle &) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

private:
  int fd_;
};

struct addrinfo_deleter {
  void operator()(addrinfo *info) const {
    if (info) freeaddrinfo(info);
  }
};
using addrinfo_ptr = std::unique_ptr<addrinfo, addrinfo_deleter>;

std::string endpoint_name(const std::string &address, std::uint16_t port) {
  return address + ":" + std::to_string(port);
}

std::string connect_address(const std::string &bind_address) {
  if (bind_address.empty() || bind_address == "0.0.0.0") {
    return "127.0.0.1";
  }
  if (bind_address == "::") {
    return "::1";
  }
  return bind_address;
}

} // namespace

VoidResult probe_listener(const std::string &bind_address, std::uint16_t port) {
  if (port == 0) {
    return gateway_void_error(error_codes::bind_error,
                              "Port must be in range 1-65535",
                              endpoint_name(bind_address, port));
  }

  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;

  addrinfo *raw = nullptr;
  auto service = std::to_string(port);
  int rc = getaddrinfo(bind_address.empty() ? nullptr : bind_address.c_str(),
                       service.c_str(), &hints, &raw);
  if (rc != 0) {
    return gateway_void_error(error_codes::bind_error,
                              std::string("Cannot resolve bind address: ") +
                                  gai_strerror(rc),
                              endpoint_name(bind_address, port));
  }
  addrinfo_ptr results(raw);

  int last_errno = 0;
  for (addrinfo *ai = results.get(); ai != nullptr; ai = ai->ai_next) {
    socket_handle sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (!sock.valid()) {
      last_errno = errno;
      continue;
    }

    int opt = 1;
    if (::setsockopt(sock.get(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
      last_errno = errno;
      continue;
    }

    if (::bind(sock.get(), ai->ai_addr, ai->ai_addrlen) < 0) {
      last_errno = errno;
      continue;
    }

    if (::listen(sock.get(), SOMAXCONN) < 0) {
      last_errno = errno;
      continue;
    }

    return ok();
  }

  return gateway_void_error(
      error_codes::bind_error,
      "Cannot listen on " + endpoint_name(bind_address, port) + ": " +
          std::strerror(last_errno),
      endpoint_name(bind_address, port));
}

bool accepts_connections(const std::string &bind_address, std::uint16_t port) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *raw = nullptr;
  auto host = connect_address(bind_address);
  auto service = std::to_string(port);
  if (getaddrinfo(host.c_str(), service.c_str(), &hints, &raw) != 0) {
    return false;
  }
  addrinfo_ptr results(raw);

  for (addrinfo *ai = results.get(); ai != nullptr; ai = ai->ai_next) {
    socket_handle sock(::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol));
    if (sock.valid() && ::connect(sock.get(), ai->ai_addr, ai->ai_addrlen) == 0) {
      return true;
    }
  }
  return false;
}

} // namespace gateway::web
