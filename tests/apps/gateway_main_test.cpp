/**
 * @file gateway_main_test.cpp
 * @brief Process-level tests for the gateway_server executable
 *
 * Launches the real binary with a controlled environment and checks the
 * exit codes: 1 for configuration errors, 2 for bind failures and 0 for an
 * orderly shutdown after SIGTERM.
 */

#include <catch2/catch_test_macros.hpp>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <signal.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <thread>
#include <vector>

#ifndef GATEWAY_SERVER_EXECUTABLE
#error "GATEWAY_SERVER_EXECUTABLE must name the gateway_server binary"
#endif

namespace {

constexpr int exit_config_error = 1;
constexpr int exit_bind_error = 2;

/**
 * @brief Listening socket on 127.0.0.1 with a kernel-chosen port
 */
class occupied_port {
public:
  occupied_port() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
    ::listen(fd_, 1);

    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~occupied_port() { ::close(fd_); }

  occupied_port(const occupied_port &) = delete;
  occupied_port &operator=(const occupied_port &) = delete;

  [[nodiscard]] std::uint16_t port() const { return port_; }

private:
  int fd_{-1};
  std::uint16_t port_{0};
};

bool is_port_listening(std::uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);
  bool connected =
      ::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0;
  ::close(fd);
  return connected;
}

/**
 * @brief gateway_server child process, killed on scope exit if still alive
 */
class gateway_process {
public:
  gateway_process(const std::vector<std::string> &args,
                  const std::map<std::string, std::string> &environment) {
    std::vector<std::string> env_strings;
    for (const auto &[name, value] : environment) {
      env_strings.push_back(name + "=" + value);
    }

    pid_ = ::fork();
    if (pid_ == 0) {
      int null_fd = ::open("/dev/null", O_RDWR);
      if (null_fd >= 0) {
        ::dup2(null_fd, STDOUT_FILENO);
        ::dup2(null_fd, STDERR_FILENO);
        ::close(null_fd);
      }

      std::string executable = GATEWAY_SERVER_EXECUTABLE;
      std::vector<char *> argv;
      argv.push_back(executable.data());
      for (const auto &arg : args) {
        argv.push_back(const_cast<char *>(arg.c_str()));
      }
      argv.push_back(nullptr);

      std::vector<char *> envp;
      for (auto &entry : env_strings) {
        envp.push_back(entry.data());
      }
      envp.push_back(nullptr);

      ::execve(executable.c_str(), argv.data(), envp.data());
      ::_exit(127);
    }
  }

  ~gateway_process() {
    if (pid_ > 0) {
      ::kill(pid_, SIGKILL);
      ::waitpid(pid_, nullptr, 0);
    }
  }

  gateway_process(const gateway_process &) = delete;
  gateway_process &operator=(const gateway_process &) = delete;

  [[nodiscard]] bool started() const { return pid_ > 0; }

  bool send_signal(int sig) const { return pid_ > 0 && ::kill(pid_, sig) == 0; }

  /**
   * @brief Wait for the process to exit
   * @return Exit code, the negated signal number, or -1 on timeout
   */
  int wait_exit(std::chrono::seconds timeout = std::chrono::seconds{10}) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (pid_ > 0 && std::chrono::steady_clock::now() < deadline) {
      int status = 0;
      pid_t done = ::waitpid(pid_, &status, WNOHANG);
      if (done == pid_) {
        pid_ = -1;
        if (WIFEXITED(status)) {
          return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
          return -WTERMSIG(status);
        }
        return -1;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }
    return -1;
  }

private:
  pid_t pid_{-1};
};

template <typename Func>
bool wait_for(Func &&condition,
              std::chrono::milliseconds timeout = std::chrono::seconds{10}) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!condition()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
  }
  return true;
}

} // namespace

TEST_CASE("gateway_server rejects command-line arguments", "[app][exit]") {
  gateway_process process({"--port", "9000"}, {});
  REQUIRE(process.started());
  REQUIRE(process.wait_exit() == exit_config_error);
}

TEST_CASE("gateway_server exits 1 on configuration errors", "[app][exit]") {
  SECTION("non-numeric PORT") {
    gateway_process process({}, {{"PORT", "abc"}});
    REQUIRE(process.wait_exit() == exit_config_error);
  }

  SECTION("unknown LOG_LEVEL") {
    gateway_process process({}, {{"LOG_LEVEL", "chatty"}});
    REQUIRE(process.wait_exit() == exit_config_error);
  }
}

TEST_CASE("gateway_server exits 2 when the port is taken", "[app][exit][bind]") {
  occupied_port taken;
  gateway_process process({}, {
                                  {"PORT", std::to_string(taken.port())},
                                  {"BIND_ADDRESS", "127.0.0.1"},
                              });
  REQUIRE(process.wait_exit() == exit_bind_error);
}

TEST_CASE("gateway_server exits 0 after SIGTERM", "[app][exit][signal]") {
  std::uint16_t port = 0;
  {
    occupied_port released;
    port = released.port();
  }

  gateway_process process({}, {
                                  {"PORT", std::to_string(port)},
                                  {"BIND_ADDRESS", "127.0.0.1"},
                                  {"API_KEY", "secret123"},
                              });
  REQUIRE(process.started());
  REQUIRE(wait_for([port] { return is_port_listening(port); }));

  REQUIRE(process.send_signal(SIGTERM));
  REQUIRE(process.wait_exit() == 0);
}
