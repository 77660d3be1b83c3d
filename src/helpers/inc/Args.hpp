#ifndef ARBITER_HELPERS_ARGS_HPP
#define ARBITER_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief CLI argument parsing for the arbiter tools.
 *
 * Fixed-arity flag parsing: a matched flag consumes the next nargs tokens as
 * its values. Unknown tokens are rejected so that typos in service names or
 * timeouts do not silently fall back to defaults.
 *
 * @note Cold-path only. Allocates.
 */

#include <algorithm>     // std::sort
#include <cstdint>       // std::uint64_t, std::uint8_t
#include <cstdlib>       // std::strtoull
#include <functional>    // std::reference_wrapper
#include <optional>      // std::optional
#include <span>          // std::span
#include <string>        // std::string
#include <string_view>   // std::string_view
#include <unordered_map> // std::unordered_map
#include <utility>       // std::move, std::pair
#include <vector>        // std::vector

#include <fmt/core.h>

namespace arbiter {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--service"
  std::uint8_t nargs;      ///< Number of values following the flag
  bool required;           ///< True if the flag must be present
  std::string_view desc{}; ///< Help text
};

/// Map from key to flag definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments against a flag map.
 * @param args  Tokens after argv[0] (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Parsed values, keyed like map.
 * @param error Receives a message on failure when provided.
 * @return true on success.
 */
[[nodiscard]] inline bool
parseArgs(std::span<const std::string_view> args, const ArgMap& map, ParsedArgs& pargs,
          std::optional<std::reference_wrapper<std::string>> error = std::nullopt) {
  auto fail = [&error](std::string msg) {
    if (error) {
      error->get() = std::move(msg);
    }
    return false;
  };

  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = lut.find(args[i]);
    if (IT == lut.end()) {
      return fail(fmt::format("Unknown argument '{}'", args[i]));
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    if (DEF.nargs > 0 && i + DEF.nargs >= args.size()) {
      return fail(fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs));
    }

    auto& out = pargs[KEY];
    out.clear();
    for (std::uint8_t k = 0; k < DEF.nargs; ++k) {
      out.push_back(args[i + 1 + k]);
    }
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && pargs.count(KV.first) == 0) {
      return fail(fmt::format("Missing required argument '{}'", KV.second.flag));
    }
  }
  return true;
}

/**
 * @brief Fetch the first value of a flag.
 * @return The value, or std::nullopt when the flag was absent or took no values.
 */
[[nodiscard]] inline std::optional<std::string_view> firstValue(const ParsedArgs& pargs,
                                                                std::uint8_t key) {
  const auto IT = pargs.find(key);
  if (IT == pargs.end() || IT->second.empty()) {
    return std::nullopt;
  }
  return IT->second.front();
}

/**
 * @brief Parse a non-negative integer flag value.
 * @return Parsed value, or std::nullopt when absent or malformed.
 */
[[nodiscard]] inline std::optional<std::uint64_t> uintValue(const ParsedArgs& pargs,
                                                            std::uint8_t key) {
  const auto RAW = firstValue(pargs, key);
  if (!RAW || RAW->empty()) {
    return std::nullopt;
  }
  const std::string TEXT(*RAW);
  char* end = nullptr;
  const unsigned long long VALUE = std::strtoull(TEXT.c_str(), &end, 10);
  if (end == TEXT.c_str() || *end != '\0' || TEXT.front() == '-') {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(VALUE);
}

/**
 * @brief Print usage generated from the flag map.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> entries;
  entries.reserve(map.size());
  for (const auto& KV : map) {
    entries.push_back(&KV.second);
  }
  std::sort(entries.begin(), entries.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : entries) {
    std::string flagStr(def->flag);
    if (def->nargs == 1) {
      flagStr += " <value>";
    } else if (def->nargs > 1) {
      flagStr += " <value> ...";
    }
    fmt::print("  {:<24}  {}{}\n", flagStr, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace arbiter

#endif // ARBITER_HELPERS_ARGS_HPP
