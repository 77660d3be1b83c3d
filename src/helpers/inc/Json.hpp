#ifndef ARBITER_HELPERS_JSON_HPP
#define ARBITER_HELPERS_JSON_HPP
/**
 * @file Json.hpp
 * @brief Defensive field extraction from small JSON response bodies.
 *
 * Control-plane replies are tiny, flat-ish objects. These helpers locate a
 * key and return its value token without building a document tree. Missing
 * keys, wrong types and malformed input all yield std::nullopt.
 *
 * @note Keys are matched on first occurrence. Scope nested lookups with
 *       findObject() first.
 */

#include <cstddef>     // std::size_t
#include <cstdlib>     // std::strtod
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace arbiter {
namespace helpers {
namespace json {

namespace detail {

inline std::size_t skipSpace(std::string_view s, std::size_t pos) noexcept {
  while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\n' || s[pos] == '\r')) {
    ++pos;
  }
  return pos;
}

/// Index one past the closing quote of a string starting at pos (which must be '"').
inline std::size_t endOfString(std::string_view s, std::size_t pos) noexcept {
  for (std::size_t i = pos + 1; i < s.size(); ++i) {
    if (s[i] == '\\') {
      ++i;
    } else if (s[i] == '"') {
      return i + 1;
    }
  }
  return std::string_view::npos;
}

/// Index one past the matching close bracket of a container starting at pos.
inline std::size_t endOfContainer(std::string_view s, std::size_t pos) noexcept {
  int depth = 0;
  for (std::size_t i = pos; i < s.size(); ++i) {
    const char C = s[i];
    if (C == '"') {
      const std::size_t END = endOfString(s, i);
      if (END == std::string_view::npos) {
        return END;
      }
      i = END - 1;
    } else if (C == '{' || C == '[') {
      ++depth;
    } else if (C == '}' || C == ']') {
      if (--depth == 0) {
        return i + 1;
      }
    }
  }
  return std::string_view::npos;
}

} // namespace detail

/* ----------------------------- API ----------------------------- */

/**
 * @brief Locate the raw value token for key.
 * @return Token text (strings keep their quotes), or std::nullopt.
 */
[[nodiscard]] inline std::optional<std::string_view> findRaw(std::string_view body,
                                                             std::string_view key) noexcept {
  const std::string NEEDLE = "\"" + std::string(key) + "\"";
  std::size_t pos = 0;
  while ((pos = body.find(NEEDLE, pos)) != std::string_view::npos) {
    std::size_t cur = detail::skipSpace(body, pos + NEEDLE.size());
    if (cur >= body.size() || body[cur] != ':') {
      pos += NEEDLE.size();
      continue;
    }
    cur = detail::skipSpace(body, cur + 1);
    if (cur >= body.size()) {
      return std::nullopt;
    }

    std::size_t end = cur;
    const char FIRST = body[cur];
    if (FIRST == '"') {
      end = detail::endOfString(body, cur);
    } else if (FIRST == '{' || FIRST == '[') {
      end = detail::endOfContainer(body, cur);
    } else {
      while (end < body.size() && body[end] != ',' && body[end] != '}' && body[end] != ']' &&
             body[end] != ' ' && body[end] != '\n' && body[end] != '\r') {
        ++end;
      }
    }
    if (end == std::string_view::npos || end == cur) {
      return std::nullopt;
    }
    return body.substr(cur, end - cur);
  }
  return std::nullopt;
}

/**
 * @brief Extract a string value (escape sequences are left as-is).
 */
[[nodiscard]] inline std::optional<std::string> findString(std::string_view body,
                                                           std::string_view key) {
  const auto RAW = findRaw(body, key);
  if (!RAW || RAW->size() < 2 || RAW->front() != '"') {
    return std::nullopt;
  }
  return std::string(RAW->substr(1, RAW->size() - 2));
}

/**
 * @brief Extract a numeric value.
 */
[[nodiscard]] inline std::optional<double> findNumber(std::string_view body,
                                                      std::string_view key) {
  const auto RAW = findRaw(body, key);
  if (!RAW) {
    return std::nullopt;
  }
  const std::string TEXT(*RAW);
  char* end = nullptr;
  const double VALUE = std::strtod(TEXT.c_str(), &end);
  if (end == TEXT.c_str() || *end != '\0') {
    return std::nullopt;
  }
  return VALUE;
}

/**
 * @brief Extract a boolean value.
 */
[[nodiscard]] inline std::optional<bool> findBool(std::string_view body,
                                                  std::string_view key) noexcept {
  const auto RAW = findRaw(body, key);
  if (!RAW) {
    return std::nullopt;
  }
  if (*RAW == "true") {
    return true;
  }
  if (*RAW == "false") {
    return false;
  }
  return std::nullopt;
}

/**
 * @brief Extract a nested object, braces included.
 */
[[nodiscard]] inline std::optional<std::string_view> findObject(std::string_view body,
                                                                std::string_view key) noexcept {
  const auto RAW = findRaw(body, key);
  if (!RAW || RAW->front() != '{') {
    return std::nullopt;
  }
  return RAW;
}

/**
 * @brief True when key is present with a JSON null value.
 */
[[nodiscard]] inline bool isNull(std::string_view body, std::string_view key) noexcept {
  const auto RAW = findRaw(body, key);
  return RAW && *RAW == "null";
}

/**
 * @brief Escape a string for embedding in hand-built JSON output.
 *
 * Control bytes without a short form are written as six-character unicode escapes.
 */
[[nodiscard]] inline std::string escape(std::string_view in) {
  static constexpr char HEX[] = "0123456789abcdef";
  std::string out;
  out.reserve(in.size());
  for (const char C : in) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default: {
      const auto BYTE = static_cast<unsigned char>(C);
      if (BYTE < 0x20) {
        out += "\\u00";
        out += HEX[BYTE >> 4];
        out += HEX[BYTE & 0x0F];
      } else {
        out += C;
      }
    }
    }
  }
  return out;
}

} // namespace json
} // namespace helpers
} // namespace arbiter

#endif // ARBITER_HELPERS_JSON_HPP
