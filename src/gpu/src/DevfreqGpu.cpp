/**
 * @file DevfreqGpu.cpp
 * @brief devfreq GPU probe with gpu_busy -> load fallback.
 */

#include "src/gpu/inc/DevfreqGpu.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Format.hpp"

#include <array>    // std::array
#include <optional> // std::optional

#include <fmt/core.h>

namespace vitals {

namespace gpu {

using vitals::helpers::files::readNodeUint64;
using vitals::helpers::format::mhzString;

namespace {

struct LoadCandidate {
  const char* relPath;
  LoadSource source;
};

/// Load nodes in priority order.
constexpr std::array<LoadCandidate, 2> LOAD_CANDIDATES{{
    {"device/gpu_busy", LoadSource::GPU_BUSY},
    {"device/load", LoadSource::LOAD},
}};

inline std::optional<std::uint64_t> readBaseNode(const std::string& base, const char* rel) {
  return readNodeUint64(fmt::format("{}/{}", base, rel));
}

} // namespace

/* ----------------------------- LoadSource ----------------------------- */

const char* toString(LoadSource source) noexcept {
  switch (source) {
  case LoadSource::GPU_BUSY:
    return "gpu_busy";
  case LoadSource::LOAD:
    return "load";
  case LoadSource::NONE:
    break;
  }
  return "none";
}

/* ----------------------------- GpuReading ----------------------------- */

std::string GpuReading::toString() const {
  return fmt::format("{}% | {}/{} MHz", loadPercent, mhzString(curFreqHz), mhzString(maxFreqHz));
}

/* ----------------------------- API ----------------------------- */

GpuReading readDevfreqGpu(const GpuProbeConfig& config) {
  GpuReading reading{};

  for (const LoadCandidate& CANDIDATE : LOAD_CANDIDATES) {
    const auto VAL = readBaseNode(config.devfreqBase, CANDIDATE.relPath);
    if (VAL) {
      reading.loadPercent = *VAL;
      reading.loadSource = CANDIDATE.source;
      break;
    }
  }

  const auto CUR = readBaseNode(config.devfreqBase, "cur_freq");
  reading.curFreqHz = CUR.value_or(0);
  reading.hasCurFreq = CUR.has_value();

  const auto MAX = readBaseNode(config.devfreqBase, "max_freq");
  reading.maxFreqHz = MAX.value_or(0);
  reading.hasMaxFreq = MAX.has_value();

  return reading;
}

} // namespace gpu

} // namespace vitals
