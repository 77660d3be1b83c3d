/**
 * @file HttpClient.cpp
 * @brief Blocking HTTP/1.1 over TCP sockets.
 */

#include "src/process/inc/HttpClient.hpp"

#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>

#include <fmt/core.h>

namespace arbiter {

namespace process {

namespace {

/* ----------------------------- Socket Helpers ----------------------------- */

/// Owns a socket descriptor.
class SocketFd {
public:
  explicit SocketFd(int fd) noexcept : fd_(fd) {}
  ~SocketFd() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  SocketFd(const SocketFd&) = delete;
  SocketFd& operator=(const SocketFd&) = delete;

  [[nodiscard]] int get() const noexcept { return fd_; }
  [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

private:
  int fd_;
};

/**
 * Apply send/receive timeouts. On Linux SO_SNDTIMEO also bounds connect().
 */
inline bool setSocketTimeouts(int fd, std::chrono::milliseconds timeout) noexcept {
  struct timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  return ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

/**
 * Resolve and connect. Returns -1 and sets error on failure.
 */
int connectTo(const Url& url, std::chrono::milliseconds timeout, std::string& error) {
  struct addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  struct addrinfo* result = nullptr;
  const std::string PORT = std::to_string(url.port);
  const int RC = ::getaddrinfo(url.host.c_str(), PORT.c_str(), &hints, &result);
  if (RC != 0) {
    error = fmt::format("resolve {}: {}", url.host, ::gai_strerror(RC));
    return -1;
  }

  int connected = -1;
  for (struct addrinfo* ai = result; ai != nullptr; ai = ai->ai_next) {
    const int FD = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (FD < 0) {
      continue;
    }
    if (setSocketTimeouts(FD, timeout) && ::connect(FD, ai->ai_addr, ai->ai_addrlen) == 0) {
      connected = FD;
      break;
    }
    error = fmt::format("connect {}:{}: {}", url.host, url.port, std::strerror(errno));
    ::close(FD);
  }
  ::freeaddrinfo(result);
  return connected;
}

bool sendAll(int fd, std::string_view data, std::string& error) noexcept {
  std::size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t N = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error = (errno == EAGAIN || errno == EWOULDBLOCK) ? "send timed out" : std::strerror(errno);
      return false;
    }
    sent += static_cast<std::size_t>(N);
  }
  return true;
}

bool receiveAll(int fd, std::string& out, std::string& error) {
  std::array<char, 4096> buf{};
  while (true) {
    const ssize_t N = ::recv(fd, buf.data(), buf.size(), 0);
    if (N == 0) {
      return true;
    }
    if (N < 0) {
      if (errno == EINTR) {
        continue;
      }
      error =
          (errno == EAGAIN || errno == EWOULDBLOCK) ? "receive timed out" : std::strerror(errno);
      return false;
    }
    out.append(buf.data(), static_cast<std::size_t>(N));
  }
}

/* ----------------------------- Parse Helpers ----------------------------- */

std::string lowerCopy(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

/// Value of a header (case-insensitive name) in the header block.
std::optional<std::string> headerValue(std::string_view headers, std::string_view name) {
  const std::string WANT = lowerCopy(name);
  std::size_t start = 0;
  while (start < headers.size()) {
    std::size_t end = headers.find("\r\n", start);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    const std::string_view LINE = headers.substr(start, end - start);
    const std::size_t COLON = LINE.find(':');
    if (COLON != std::string_view::npos && lowerCopy(LINE.substr(0, COLON)) == WANT) {
      std::string_view value = LINE.substr(COLON + 1);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      return std::string(value);
    }
    start = end + 2;
  }
  return std::nullopt;
}

/// Decode a chunked body; returns false on malformed framing.
bool decodeChunked(std::string_view in, std::string& out) {
  std::size_t pos = 0;
  while (pos < in.size()) {
    const std::size_t LINE_END = in.find("\r\n", pos);
    if (LINE_END == std::string_view::npos) {
      return false;
    }
    const std::string SIZE_TEXT(in.substr(pos, LINE_END - pos));
    char* end = nullptr;
    const unsigned long SIZE = std::strtoul(SIZE_TEXT.c_str(), &end, 16);
    if (end == SIZE_TEXT.c_str()) {
      return false;
    }
    if (SIZE == 0) {
      return true;
    }
    pos = LINE_END + 2;
    if (SIZE > in.size() - pos) {
      return false;
    }
    out.append(in.substr(pos, SIZE));
    pos += SIZE + 2;
  }
  return false;
}

} // namespace

/* ----------------------------- Url ----------------------------- */

std::optional<Url> parseUrl(std::string_view url) {
  constexpr std::string_view SCHEME = "http://";
  if (url.substr(0, SCHEME.size()) != SCHEME) {
    return std::nullopt;
  }
  url.remove_prefix(SCHEME.size());

  Url out{};
  const std::size_t SLASH = url.find('/');
  const std::string_view AUTHORITY = url.substr(0, SLASH);
  if (SLASH != std::string_view::npos) {
    out.path = std::string(url.substr(SLASH));
  }

  const std::size_t COLON = AUTHORITY.rfind(':');
  if (COLON != std::string_view::npos) {
    const std::string PORT_TEXT(AUTHORITY.substr(COLON + 1));
    char* end = nullptr;
    const long PORT = std::strtol(PORT_TEXT.c_str(), &end, 10);
    if (PORT_TEXT.empty() || *end != '\0' || PORT <= 0 || PORT > 65535) {
      return std::nullopt;
    }
    out.port = static_cast<std::uint16_t>(PORT);
    out.host = std::string(AUTHORITY.substr(0, COLON));
  } else {
    out.host = std::string(AUTHORITY);
  }

  if (out.host.empty()) {
    return std::nullopt;
  }
  return out;
}

std::string urlEncode(std::string_view in) {
  std::string out;
  out.reserve(in.size());
  for (const char C : in) {
    const auto U = static_cast<unsigned char>(C);
    if (std::isalnum(U) != 0 || C == '-' || C == '_' || C == '.' || C == '~') {
      out += C;
    } else {
      out += fmt::format("%{:02X}", U);
    }
  }
  return out;
}

/* ----------------------------- HttpResponse ----------------------------- */

std::string HttpResponse::toString() const {
  if (!transportOk) {
    return fmt::format("transport error: {}", error.empty() ? "unknown" : error);
  }
  return fmt::format("HTTP {} ({} bytes)", status, body.size());
}

bool parseHttpResponse(std::string_view raw, HttpResponse& out) {
  const std::size_t LINE_END = raw.find("\r\n");
  const std::string_view STATUS_LINE = raw.substr(0, LINE_END);
  if (STATUS_LINE.substr(0, 5) != "HTTP/") {
    return false;
  }
  const std::size_t SP = STATUS_LINE.find(' ');
  if (SP == std::string_view::npos || SP + 4 > STATUS_LINE.size()) {
    return false;
  }
  const std::string CODE(STATUS_LINE.substr(SP + 1, 3));
  char* end = nullptr;
  const long STATUS = std::strtol(CODE.c_str(), &end, 10);
  if (*end != '\0' || STATUS < 100 || STATUS > 599) {
    return false;
  }
  out.status = static_cast<int>(STATUS);

  const std::size_t HEADERS_END = raw.find("\r\n\r\n");
  if (HEADERS_END == std::string_view::npos) {
    out.body.clear();
    return true;
  }
  const std::string_view HEADERS =
      (LINE_END == std::string_view::npos || LINE_END + 2 > HEADERS_END)
          ? std::string_view{}
          : raw.substr(LINE_END + 2, HEADERS_END - LINE_END - 2);
  std::string_view body = raw.substr(HEADERS_END + 4);

  const auto ENCODING = headerValue(HEADERS, "Transfer-Encoding");
  if (ENCODING && lowerCopy(*ENCODING).find("chunked") != std::string::npos) {
    out.body.clear();
    return decodeChunked(body, out.body);
  }

  const auto LENGTH = headerValue(HEADERS, "Content-Length");
  if (LENGTH) {
    const std::size_t N = static_cast<std::size_t>(std::strtoull(LENGTH->c_str(), nullptr, 10));
    body = body.substr(0, N);
  }
  out.body = std::string(body);
  return true;
}

/* ----------------------------- API ----------------------------- */

HttpResponse httpRequest(std::string_view method, std::string_view url,
                         std::chrono::milliseconds timeout) noexcept {
  HttpResponse response{};
  try {
    const auto PARSED = parseUrl(url);
    if (!PARSED) {
      response.error = fmt::format("unsupported URL '{}'", url);
      return response;
    }

    SocketFd sock(connectTo(*PARSED, timeout, response.error));
    if (!sock.valid()) {
      return response;
    }

    const std::string REQUEST = fmt::format("{} {} HTTP/1.1\r\n"
                                            "Host: {}:{}\r\n"
                                            "Accept: application/json\r\n"
                                            "Content-Length: 0\r\n"
                                            "Connection: close\r\n\r\n",
                                            method, PARSED->path, PARSED->host, PARSED->port);
    if (!sendAll(sock.get(), REQUEST, response.error)) {
      return response;
    }

    std::string raw;
    if (!receiveAll(sock.get(), raw, response.error)) {
      return response;
    }
    if (!parseHttpResponse(raw, response)) {
      response.error = "malformed HTTP response";
      return response;
    }
    response.transportOk = true;
  } catch (const std::exception& e) {
    response.transportOk = false;
    response.error = e.what();
  }
  return response;
}

} // namespace process

} // namespace arbiter
