#ifndef VITALS_HELPERS_STRINGS_HPP
#define VITALS_HELPERS_STRINGS_HPP
/**
 * @file Strings.hpp
 * @brief String helpers for parsing virtual filesystem node contents.
 *
 * @note RT-SAFE: All functions are noexcept with no allocations.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace vitals {
namespace helpers {
namespace strings {

/* ----------------------------- Classification ----------------------------- */

/// True for the whitespace sysfs and procfs emit (space, tab, CR, LF).
[[nodiscard]] constexpr bool isNodeWhitespace(char c) noexcept {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

/* ----------------------------- Manipulation ----------------------------- */

/**
 * @brief Trim leading and trailing whitespace from a view.
 * @param text Input text.
 * @return Sub-view without surrounding whitespace (may be empty).
 * @note RT-SAFE: No allocation.
 */
[[nodiscard]] constexpr std::string_view trim(std::string_view text) noexcept {
  std::size_t begin = 0;
  while (begin < text.size() && isNodeWhitespace(text[begin])) {
    ++begin;
  }
  std::size_t end = text.size();
  while (end > begin && isNodeWhitespace(text[end - 1])) {
    --end;
  }
  return text.substr(begin, end - begin);
}

/* ----------------------------- Parsing ----------------------------- */

/**
 * @brief Parse an unsigned decimal integer occupying the whole view.
 * @param text Digits, optionally preceded by a single '+'.
 * @return Parsed value, or std::nullopt on empty input, sign, garbage or overflow.
 * @note RT-SAFE: No allocation.
 *
 * Stricter than strtoull: "-5" and "42abc" are rejected instead of wrapped
 * or truncated.
 */
[[nodiscard]] constexpr std::optional<std::uint64_t> parseUint64(std::string_view text) noexcept {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
  }
  if (text.empty()) {
    return std::nullopt;
  }

  constexpr std::uint64_t MAX = ~std::uint64_t{0};
  std::uint64_t value = 0;
  for (const char C : text) {
    if (C < '0' || C > '9') {
      return std::nullopt;
    }
    const auto DIGIT = static_cast<std::uint64_t>(C - '0');
    if (value > (MAX - DIGIT) / 10U) {
      return std::nullopt;
    }
    value = value * 10U + DIGIT;
  }
  return value;
}

} // namespace strings
} // namespace helpers
} // namespace vitals

#endif // VITALS_HELPERS_STRINGS_HPP
