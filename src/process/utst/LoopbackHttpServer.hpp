#ifndef ARBITER_PROCESS_LOOPBACK_HTTP_SERVER_HPP
#define ARBITER_PROCESS_LOOPBACK_HTTP_SERVER_HPP
/**
 * @file LoopbackHttpServer.hpp
 * @brief One-thread HTTP responder on 127.0.0.1 for client tests.
 *
 * Binds an ephemeral port, answers each connection with handler(requestHead)
 * and closes it. Requests are recorded as "METHOD /path?query".
 */

#include <arpa/inet.h>  // ntohs
#include <netinet/in.h> // sockaddr_in
#include <poll.h>       // poll
#include <sys/socket.h> // socket, bind
#include <unistd.h>     // close

#include <atomic>     // std::atomic
#include <cstdint>    // std::uint16_t
#include <functional> // std::function
#include <mutex>      // std::mutex, std::lock_guard
#include <stdexcept>  // std::runtime_error
#include <string>     // std::string
#include <thread>     // std::thread
#include <vector>     // std::vector

namespace arbiter {

namespace process {

namespace test {

class LoopbackHttpServer {
public:
  using Handler = std::function<std::string(const std::string& requestLine)>;

  explicit LoopbackHttpServer(Handler handler) : handler_(std::move(handler)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd_ < 0) {
      throw std::runtime_error("socket() failed");
    }
    const int ONE = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &ONE, sizeof(ONE));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 16) != 0) {
      ::close(fd_);
      throw std::runtime_error("bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);

    thread_ = std::thread([this] { serve(); });
  }

  ~LoopbackHttpServer() {
    stop_ = true;
    thread_.join();
    ::close(fd_);
  }

  LoopbackHttpServer(const LoopbackHttpServer&) = delete;
  LoopbackHttpServer& operator=(const LoopbackHttpServer&) = delete;

  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  [[nodiscard]] std::string url(const std::string& path = "") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  [[nodiscard]] std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  /// Build a complete response with Content-Length.
  static std::string respond(int status, const std::string& body) {
    return "HTTP/1.1 " + std::to_string(status) + " X\r\nContent-Type: application/json\r\n" +
           "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  }

private:
  void serve() {
    while (!stop_) {
      pollfd pfd{fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0) {
        continue;
      }
      const int CLIENT = ::accept(fd_, nullptr, nullptr);
      if (CLIENT < 0) {
        continue;
      }
      std::string head;
      char buf[1024];
      while (head.find("\r\n\r\n") == std::string::npos) {
        const ssize_t N = ::recv(CLIENT, buf, sizeof(buf), 0);
        if (N <= 0) {
          break;
        }
        head.append(buf, static_cast<std::size_t>(N));
      }
      const std::string LINE = head.substr(0, head.find(" HTTP/"));
      {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(LINE);
      }
      const std::string REPLY = handler_(LINE);
      if (!REPLY.empty()) {
        ::send(CLIENT, REPLY.data(), REPLY.size(), MSG_NOSIGNAL);
      }
      ::close(CLIENT);
    }
  }

  Handler handler_;
  int fd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> stop_{false};
  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

} // namespace test

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_LOOPBACK_HTTP_SERVER_HPP
