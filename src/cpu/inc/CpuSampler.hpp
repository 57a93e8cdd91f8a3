#ifndef VITALS_CPU_SAMPLER_HPP
#define VITALS_CPU_SAMPLER_HPP
/**
 * @file CpuSampler.hpp
 * @brief Smoothed CPU utilization over several fixed-interval samples.
 *
 * A single instantaneous reading is unreliable on low-power cores that idle
 * between scheduler ticks, and the act of sampling wakes the core. The sampler
 * discards one warm-up refresh, then averages SAMPLE_COUNT readings taken
 * SAMPLE_INTERVAL apart.
 *
 * @note NOT RT-safe: Sleeps for the whole sampling budget.
 */

#include "src/helpers/inc/Clock.hpp"
#include "src/system/inc/SystemInfo.hpp"

#include <chrono>  // std::chrono::milliseconds
#include <cstddef> // std::size_t

namespace vitals {

namespace cpu {

/* ----------------------------- Constants ----------------------------- */

/// Number of averaged samples (warm-up excluded).
inline constexpr std::size_t SAMPLE_COUNT = 5;

/// Wait between refreshes.
inline constexpr std::chrono::milliseconds SAMPLE_INTERVAL{300};

/// Total wall-clock cost of one sampling run: warm-up plus samples.
inline constexpr std::chrono::milliseconds SAMPLING_BUDGET =
    SAMPLE_INTERVAL * static_cast<std::chrono::milliseconds::rep>(SAMPLE_COUNT + 1);

/// Largest accepted sample count.
inline constexpr std::size_t MAX_SAMPLE_COUNT = 10'000;

/// Largest accepted wait between refreshes (one hour).
inline constexpr std::chrono::milliseconds MAX_SAMPLE_INTERVAL{3'600'000};

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Sampling parameters.
 */
struct CpuSamplerConfig {
  std::size_t sampleCount{SAMPLE_COUNT};               ///< Averaged samples
  std::chrono::milliseconds interval{SAMPLE_INTERVAL}; ///< Wait after each refresh

  /// @brief True if count and interval are within MAX_SAMPLE_COUNT and
  ///        [0, MAX_SAMPLE_INTERVAL], so budget() cannot overflow.
  [[nodiscard]] bool withinLimits() const noexcept {
    return sampleCount <= MAX_SAMPLE_COUNT && interval.count() >= 0 &&
           interval <= MAX_SAMPLE_INTERVAL;
  }

  /// @brief Wall-clock cost for this configuration.
  [[nodiscard]] std::chrono::milliseconds budget() const noexcept {
    return interval * static_cast<std::chrono::milliseconds::rep>(sampleCount + 1);
  }
};

/**
 * @brief Result of a sampling run.
 */
struct CpuSample {
  double meanPercent{0.0};       ///< Arithmetic mean of the averaged samples; not clamped
  std::size_t samplesTaken{0};   ///< Samples contributing to the mean
  system::SystemSnapshot last{}; ///< Snapshot from the final refresh
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Average global CPU utilization over several samples.
 * @param source   Snapshot source; refreshCpu() is called sampleCount + 1 times.
 * @param initial  Snapshot to start from (typically the result of refreshAll()).
 * @param config   Sample count and interval.
 * @param sleeper  Wait primitive; called once per refresh with config.interval.
 * @return Mean utilization. Never fails; a source yielding no data gives 0.0.
 *
 * The first refresh primes the delta state and its reading is discarded.
 */
[[nodiscard]] CpuSample sampleCpuUsage(system::SystemInfoSource& source,
                                       const system::SystemSnapshot& initial,
                                       const CpuSamplerConfig& config,
                                       const helpers::clock::Sleeper& sleeper);

/// @overload Default configuration, blocking sleep.
[[nodiscard]] CpuSample sampleCpuUsage(system::SystemInfoSource& source,
                                       const system::SystemSnapshot& initial);

} // namespace cpu

} // namespace vitals

#endif // VITALS_CPU_SAMPLER_HPP
