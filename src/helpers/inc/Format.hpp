#ifndef VITALS_HELPERS_FORMAT_HPP
#define VITALS_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Unit conversions and human-readable formatting for report fields.
 *
 * @note Conversions are RT-SAFE. Functions returning std::string are not;
 *       use them only in cold paths (report rendering, CLI output).
 */

#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace vitals {
namespace helpers {
namespace format {

/* ----------------------------- Constants ----------------------------- */

/// Bytes per mebibyte.
inline constexpr std::uint64_t BYTES_PER_MIB = 1024ULL * 1024ULL;

/// Hertz per megahertz.
inline constexpr double HZ_PER_MHZ = 1'000'000.0;

/* ----------------------------- Conversions ----------------------------- */

/**
 * @brief Convert bytes to whole mebibytes (truncating).
 * @note RT-SAFE: Pure computation.
 */
[[nodiscard]] constexpr std::uint64_t bytesToMebibytes(std::uint64_t bytes) noexcept {
  return bytes / BYTES_PER_MIB;
}

/**
 * @brief Convert a frequency in Hz to MHz.
 * @note RT-SAFE: Pure computation.
 */
[[nodiscard]] constexpr double hzToMhz(std::uint64_t hz) noexcept {
  return static_cast<double>(hz) / HZ_PER_MHZ;
}

/* ----------------------------- Formatting ----------------------------- */

/**
 * @brief Format a frequency in Hz as MHz with zero decimal places.
 * @param hz Frequency in Hz.
 * @return e.g. "800" for 800000000.
 * @note NOT RT-SAFE: Returns std::string.
 */
[[nodiscard]] inline std::string mhzString(std::uint64_t hz) {
  return fmt::format("{:.0f}", hzToMhz(hz));
}

} // namespace format
} // namespace helpers
} // namespace vitals

#endif // VITALS_HELPERS_FORMAT_HPP
