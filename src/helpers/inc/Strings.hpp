#ifndef ARBITER_HELPERS_STRINGS_HPP
#define ARBITER_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief string_view trimming, comparison and strict numeric parsing.
 *
 * Parsers reject trailing garbage: "12x" is not 12. Used for CLI values,
 * configuration files and tool output.
 */

#include <cctype>      // std::tolower
#include <cstdint>     // std::uint64_t, std::int64_t
#include <cstdlib>     // std::strtod
#include <optional>    // std::optional
#include <string>      // std::string
#include <string_view> // std::string_view

namespace arbiter {
namespace helpers {
namespace strings {

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Strip leading and trailing spaces, tabs, CR and LF.
 */
[[nodiscard]] inline std::string_view trim(std::string_view s) noexcept {
  auto isSpace = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!s.empty() && isSpace(s.front())) {
    s.remove_prefix(1);
  }
  while (!s.empty() && isSpace(s.back())) {
    s.remove_suffix(1);
  }
  return s;
}

/**
 * @brief Remove one pair of matching surrounding quotes ('...' or "...").
 */
[[nodiscard]] inline std::string_view unquote(std::string_view s) noexcept {
  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

/* ----------------------------- Comparison ----------------------------- */

/**
 * @brief ASCII case-insensitive equality.
 */
[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse an unsigned decimal integer (surrounding whitespace allowed).
 */
[[nodiscard]] inline std::optional<std::uint64_t> parseUint(std::string_view s) noexcept {
  s = trim(s);
  if (s.empty() || s.size() > 19) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  for (const char C : s) {
    if (C < '0' || C > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<std::uint64_t>(C - '0');
  }
  return value;
}

/**
 * @brief Parse a signed decimal integer.
 */
[[nodiscard]] inline std::optional<std::int64_t> parseInt(std::string_view s) noexcept {
  s = trim(s);
  const bool NEG = !s.empty() && s.front() == '-';
  if (NEG || (!s.empty() && s.front() == '+')) {
    s.remove_prefix(1);
  }
  const auto MAG = parseUint(s);
  if (!MAG || *MAG > static_cast<std::uint64_t>(INT64_MAX)) {
    return std::nullopt;
  }
  const auto VALUE = static_cast<std::int64_t>(*MAG);
  return NEG ? -VALUE : VALUE;
}

/**
 * @brief Parse a floating-point number.
 */
[[nodiscard]] inline std::optional<double> parseDouble(std::string_view s) {
  const std::string TEXT(trim(s));
  if (TEXT.empty()) {
    return std::nullopt;
  }
  char* end = nullptr;
  const double VALUE = std::strtod(TEXT.c_str(), &end);
  if (end != TEXT.c_str() + TEXT.size()) {
    return std::nullopt;
  }
  return VALUE;
}

/**
 * @brief Parse a boolean: true/false, yes/no, on/off, 1/0 (case-insensitive).
 */
[[nodiscard]] inline std::optional<bool> parseBool(std::string_view s) noexcept {
  s = trim(s);
  if (iequals(s, "true") || iequals(s, "yes") || iequals(s, "on") || s == "1") {
    return true;
  }
  if (iequals(s, "false") || iequals(s, "no") || iequals(s, "off") || s == "0") {
    return false;
  }
  return std::nullopt;
}

} // namespace strings
} // namespace helpers
} // namespace arbiter

#endif // ARBITER_HELPERS_STRINGS_HPP
