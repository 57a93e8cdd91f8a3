#ifndef VITALS_GPU_DEVFREQ_GPU_HPP
#define VITALS_GPU_DEVFREQ_GPU_HPP
/**
 * @file DevfreqGpu.hpp
 * @brief GPU load and frequency from a devfreq node (Adreno/Freedreno style).
 * @note Linux-only. Reads <base>/device/gpu_busy, <base>/device/load,
 *       <base>/cur_freq and <base>/max_freq.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Best effort, never blank: every field falls back to 0 on its own, so the
 * summary always renders. Availability flags record which fields were really
 * read, since a 0 may mean "idle" or "node missing".
 */

#include <cstdint> // std::uint64_t
#include <string>  // std::string

namespace vitals {

namespace gpu {

/* ----------------------------- Constants ----------------------------- */

/// devfreq node of the Adreno 640 on SM8150.
inline constexpr const char* DEFAULT_DEVFREQ_BASE = "/sys/class/devfreq/2c00000.gpu";

/// Model name shown next to the GPU summary.
inline constexpr const char* DEFAULT_GPU_NAME = "Adreno 640";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Node that supplied the load percentage.
 */
enum class LoadSource : std::uint8_t {
  NONE = 0, ///< Neither candidate readable; load defaulted to 0
  GPU_BUSY, ///< <base>/device/gpu_busy
  LOAD,     ///< <base>/device/load
};

/**
 * @brief Convert LoadSource to the node name it stands for.
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(LoadSource source) noexcept;

/* ----------------------------- Types ----------------------------- */

/**
 * @brief Probe configuration.
 */
struct GpuProbeConfig {
  std::string devfreqBase{DEFAULT_DEVFREQ_BASE}; ///< devfreq directory
  std::string name{DEFAULT_GPU_NAME};            ///< Display name
};

/**
 * @brief Composite GPU reading.
 */
struct GpuReading {
  std::uint64_t loadPercent{0}; ///< Busy percentage; 0 if unavailable
  std::uint64_t curFreqHz{0};   ///< Current frequency; 0 if unavailable
  std::uint64_t maxFreqHz{0};   ///< Maximum frequency; 0 if unavailable

  LoadSource loadSource{LoadSource::NONE}; ///< Where loadPercent came from
  bool hasCurFreq{false};                  ///< cur_freq was readable
  bool hasMaxFreq{false};                  ///< max_freq was readable

  /// @brief True if the load came from a real node.
  [[nodiscard]] bool hasLoad() const noexcept { return loadSource != LoadSource::NONE; }

  /// @brief True if no field could be read.
  [[nodiscard]] bool isEmpty() const noexcept { return !hasLoad() && !hasCurFreq && !hasMaxFreq; }

  /// @brief Report summary, e.g. "37% | 800/900 MHz".
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Read the composite GPU state from a devfreq directory.
 * @param config Base path to probe.
 * @return Reading with zero defaults for unreadable fields. Never fails.
 * @note NOT RT-safe: Builds path strings.
 *
 * Load candidates are tried in order: device/gpu_busy, then device/load.
 * Frequencies are read independently of the load.
 */
[[nodiscard]] GpuReading readDevfreqGpu(const GpuProbeConfig& config);

} // namespace gpu

} // namespace vitals

#endif // VITALS_GPU_DEVFREQ_GPU_HPP
