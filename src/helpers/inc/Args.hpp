#ifndef VITALS_HELPERS_ARGS_HPP
#define VITALS_HELPERS_ARGS_HPP
/**
 * @file Args.hpp
 * @brief Fixed-arity CLI argument parsing for the vitals tools.
 *
 * @note Cold-path: Allocates for lookup tables and parsed results.
 */

#include <algorithm>
#include <bitset>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "src/helpers/inc/Strings.hpp"

namespace vitals {
namespace helpers {
namespace args {

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Definition for a CLI argument flag.
 */
struct ArgDef {
  std::string_view flag;   ///< Flag string, e.g. "--samples"
  std::uint8_t nargs;      ///< Number of values consumed after the flag
  bool required;           ///< True if flag must be provided
  std::string_view desc{}; ///< Description for help output
};

/// Map from key to argument definition.
using ArgMap = std::unordered_map<std::uint8_t, ArgDef>;

/// Map from key to parsed values.
using ParsedArgs = std::unordered_map<std::uint8_t, std::vector<std::string_view>>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse arguments according to a flag map.
 *
 * A matched flag consumes the next nargs tokens literally. Unknown tokens
 * are rejected so that typos in path flags do not silently fall back to
 * defaults.
 *
 * @param args  Argument list (views must outlive pargs).
 * @param map   Accepted flags.
 * @param pargs Output values, keyed like map.
 * @param error Set on failure.
 * @return true on success.
 */
[[nodiscard]] inline bool parseArgs(std::span<const std::string_view> args, const ArgMap& map,
                                    ParsedArgs& pargs, std::string& error) {
  std::unordered_map<std::string_view, std::pair<std::uint8_t, const ArgDef*>> lut;
  lut.reserve(map.size());
  for (const auto& KV : map) {
    lut.emplace(KV.second.flag, std::make_pair(KV.first, &KV.second));
  }

  std::bitset<256> seen;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const auto IT = lut.find(args[i]);
    if (IT == lut.end()) {
      error = fmt::format("Unknown argument '{}'", args[i]);
      return false;
    }

    const std::uint8_t KEY = IT->second.first;
    const ArgDef& DEF = *IT->second.second;
    if (args.size() - i - 1 < DEF.nargs) {
      error = fmt::format("Flag '{}' expects {} value(s)", DEF.flag, DEF.nargs);
      return false;
    }

    auto& out = pargs[KEY];
    out.assign(args.begin() + static_cast<std::ptrdiff_t>(i + 1),
               args.begin() + static_cast<std::ptrdiff_t>(i + 1 + DEF.nargs));
    seen.set(KEY);
    i += DEF.nargs;
  }

  for (const auto& KV : map) {
    if (KV.second.required && !seen.test(KV.first)) {
      error = fmt::format("Missing required argument '{}'", KV.second.flag);
      return false;
    }
  }
  return true;
}

/**
 * @brief Parse a flag value as an unsigned integer.
 * @param value Token following the flag.
 * @param out   Parsed value on success.
 * @return false if value is not a non-negative decimal integer.
 */
[[nodiscard]] inline bool parseUintValue(std::string_view value, std::uint64_t& out) noexcept {
  const auto PARSED = vitals::helpers::strings::parseUint64(value);
  if (!PARSED) {
    return false;
  }
  out = *PARSED;
  return true;
}

/**
 * @brief Print usage information generated from the argument map.
 * @param progName    Program name (typically argv[0]).
 * @param description Brief description of the tool.
 * @param map         Accepted flags.
 */
inline void printUsage(const char* progName, std::string_view description, const ArgMap& map) {
  fmt::print("Usage: {} [OPTIONS]\n\n", progName);
  if (!description.empty()) {
    fmt::print("{}\n\n", description);
  }
  fmt::print("Options:\n");

  std::vector<const ArgDef*> defs;
  defs.reserve(map.size());
  for (const auto& KV : map) {
    defs.push_back(&KV.second);
  }
  std::sort(defs.begin(), defs.end(),
            [](const ArgDef* a, const ArgDef* b) { return a->flag < b->flag; });

  for (const ArgDef* def : defs) {
    const std::string FLAG =
        def->nargs == 0 ? std::string(def->flag) : fmt::format("{} <value>", def->flag);
    fmt::print("  {:<24}  {}{}\n", FLAG, def->desc, def->required ? " (required)" : "");
  }
}

} // namespace args
} // namespace helpers
} // namespace vitals

#endif // VITALS_HELPERS_ARGS_HPP
