/**
 * @file BatteryStatus.cpp
 * @brief First-readable-capacity scan over power_supply entries.
 */

#include "src/power/inc/BatteryStatus.hpp"
#include "src/helpers/inc/Files.hpp"

#include <utility> // std::move

#include <fmt/core.h>

namespace vitals {

namespace power {

using vitals::helpers::files::listDirSorted;
using vitals::helpers::files::readNodeText;

/* ----------------------------- BatteryReading ----------------------------- */

std::string BatteryReading::toString() const {
  if (!available) {
    return UNAVAILABLE;
  }
  return fmt::format("{}%", capacity);
}

/* ----------------------------- API ----------------------------- */

BatteryReading readBatteryStatus(const BatteryProbeConfig& config) {
  BatteryReading reading{};

  for (const std::string& SUPPLY : listDirSorted(config.powerSupplyRoot)) {
    auto capacity = readNodeText(fmt::format("{}/{}/capacity", config.powerSupplyRoot, SUPPLY));
    if (!capacity) {
      continue;
    }
    reading.available = true;
    reading.capacity = std::move(*capacity);
    reading.supply = SUPPLY;
    break;
  }

  return reading;
}

} // namespace power

} // namespace vitals
