#ifndef VITALS_POWER_BATTERY_STATUS_HPP
#define VITALS_POWER_BATTERY_STATUS_HPP
/**
 * @file BatteryStatus.hpp
 * @brief Battery charge from the power_supply class.
 * @note Linux-only. Reads <root>/<supply>/capacity.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Supplies are visited in lexicographic order and the first one with a
 * readable capacity node wins. Unlike the GPU probe this one can legitimately
 * report nothing ("N/A").
 */

#include <string> // std::string

namespace vitals {

namespace power {

/* ----------------------------- Constants ----------------------------- */

/// power_supply class directory.
inline constexpr const char* DEFAULT_POWER_SUPPLY_ROOT = "/sys/class/power_supply";

/// Rendered when no supply reports a capacity.
inline constexpr const char* UNAVAILABLE = "N/A";

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Probe configuration.
 */
struct BatteryProbeConfig {
  std::string powerSupplyRoot{DEFAULT_POWER_SUPPLY_ROOT}; ///< Directory of supplies
};

/**
 * @brief Battery charge reading.
 */
struct BatteryReading {
  bool available{false}; ///< A capacity node was read
  std::string capacity;  ///< Trimmed capacity text, e.g. "85"
  std::string supply;    ///< Supply entry that supplied it, e.g. "battery"

  /// @brief Report summary: "85%" or "N/A".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Find the first power supply with a readable capacity.
 * @param config Root directory to scan.
 * @return Populated reading, or available == false if the root cannot be
 *         listed or no entry has a readable capacity node. A node that reads
 *         back blank still wins and renders as "%".
 * @note NOT RT-safe: Lists a directory and allocates.
 */
[[nodiscard]] BatteryReading readBatteryStatus(const BatteryProbeConfig& config);

} // namespace power

} // namespace vitals

#endif // VITALS_POWER_BATTERY_STATUS_HPP
