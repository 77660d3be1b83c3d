#ifndef ARBITER_PROCESS_HTTP_CLIENT_HPP
#define ARBITER_PROCESS_HTTP_CLIENT_HPP
/**
 * @file HttpClient.hpp
 * @brief Minimal blocking HTTP/1.1 client for local control-plane and health endpoints.
 * @note Linux-only. Plain TCP sockets, no TLS, one request per connection.
 * @note Thread-safe: stateless, safe to call concurrently.
 */

#include <chrono>      // std::chrono::milliseconds
#include <cstdint>     // std::uint16_t
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace arbiter {

namespace process {

/* ----------------------------- Url ----------------------------- */

/**
 * @brief Parsed http:// URL.
 */
struct Url {
  std::string host;
  std::uint16_t port{80};
  std::string path{"/"}; ///< Path plus query string
};

/**
 * @brief Parse "http://host[:port][/path[?query]]".
 * @return std::nullopt for other schemes or malformed input.
 */
[[nodiscard]] std::optional<Url> parseUrl(std::string_view url);

/**
 * @brief Percent-encode a query-string component.
 */
[[nodiscard]] std::string urlEncode(std::string_view in);

/* ----------------------------- HttpResponse ----------------------------- */

/**
 * @brief Result of one request.
 */
struct HttpResponse {
  bool transportOk{false}; ///< A complete response was received
  int status{0};           ///< HTTP status code (0 if none)
  std::string body;        ///< Decoded body
  std::string error;       ///< Transport error description

  /// @brief Transport succeeded and status is 2xx.
  [[nodiscard]] bool isSuccess() const noexcept {
    return transportOk && status >= 200 && status < 300;
  }

  /// @brief Human-readable summary.
  [[nodiscard]] std::string toString() const;
};

/**
 * @brief Parse a raw HTTP/1.x response (status line, headers, body).
 * @note Handles Content-Length and chunked transfer encoding.
 * @return false if the status line is malformed.
 */
[[nodiscard]] bool parseHttpResponse(std::string_view raw, HttpResponse& out);

/* ----------------------------- API ----------------------------- */

/**
 * @brief Perform a request.
 * @param method  "GET" or "POST".
 * @param url     Target URL.
 * @param timeout Bound for connect, send and each receive.
 * @return Response; transportOk == false on connect/IO failure or timeout.
 */
[[nodiscard]] HttpResponse httpRequest(std::string_view method, std::string_view url,
                                       std::chrono::milliseconds timeout) noexcept;

[[nodiscard]] inline HttpResponse httpGet(std::string_view url,
                                          std::chrono::milliseconds timeout) noexcept {
  return httpRequest("GET", url, timeout);
}

[[nodiscard]] inline HttpResponse httpPost(std::string_view url,
                                           std::chrono::milliseconds timeout) noexcept {
  return httpRequest("POST", url, timeout);
}

} // namespace process

} // namespace arbiter

#endif // ARBITER_PROCESS_HTTP_CLIENT_HPP
