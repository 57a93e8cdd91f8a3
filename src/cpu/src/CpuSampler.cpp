/**
 * @file CpuSampler.cpp
 * @brief Warm-up plus fixed-count CPU utilization averaging.
 */

#include "src/cpu/inc/CpuSampler.hpp"

namespace vitals {

namespace cpu {

CpuSample sampleCpuUsage(system::SystemInfoSource& source, const system::SystemSnapshot& initial,
                         const CpuSamplerConfig& config, const helpers::clock::Sleeper& sleeper) {
  CpuSample result{};

  // Warm-up: primes the counters, reading discarded
  system::SystemSnapshot snap = source.refreshCpu(initial);
  if (sleeper) {
    sleeper(config.interval);
  }

  double total = 0.0;
  for (std::size_t i = 0; i < config.sampleCount; ++i) {
    snap = source.refreshCpu(snap);
    if (sleeper) {
      sleeper(config.interval);
    }
    total += snap.globalCpuUsage;
  }

  result.samplesTaken = config.sampleCount;
  result.meanPercent =
      (config.sampleCount == 0) ? 0.0 : total / static_cast<double>(config.sampleCount);
  result.last = snap;
  return result;
}

CpuSample sampleCpuUsage(system::SystemInfoSource& source, const system::SystemSnapshot& initial) {
  return sampleCpuUsage(source, initial, CpuSamplerConfig{}, helpers::clock::threadSleeper());
}

} // namespace cpu

} // namespace vitals
