#ifndef VITALS_SYSTEM_SYSTEM_INFO_HPP
#define VITALS_SYSTEM_SYSTEM_INFO_HPP
/**
 * @file SystemInfo.hpp
 * @brief Refreshable system-info handle: memory totals, CPU usage, kernel release.
 * @note Linux-only. Reads <proc>/stat, <proc>/meminfo, <proc>/sys/kernel/osrelease;
 *       falls back to sysinfo(2) and uname(2).
 *
 * A refresh never mutates its input. Each call takes the previous snapshot
 * (needed for the CPU delta) and returns a new one, so no state is shared
 * between invocations.
 */

#include "src/cpu/inc/CpuCounters.hpp"

#include <cstdint>  // std::uint64_t
#include <optional> // std::optional
#include <string>   // std::string
#include <utility>  // std::move

namespace vitals {

namespace system {

/* ----------------------------- SystemSnapshot ----------------------------- */

/**
 * @brief Aggregate counters captured by one refresh.
 *
 * Values are meaningful right after the refresh that produced them.
 * globalCpuUsage covers the interval since the previous snapshot's counters
 * and is 0.0 when there was no previous capture.
 */
struct SystemSnapshot {
  std::uint64_t totalMemoryBytes{0};        ///< Physical RAM
  std::uint64_t usedMemoryBytes{0};         ///< total - available
  double globalCpuUsage{0.0};               ///< Busy percent since previous refresh
  std::optional<std::string> kernelVersion; ///< Kernel release, e.g. "6.1.0-rc3"

  cpu::CpuTimeCounters cpuCounters{}; ///< Raw counters for the next delta
  bool hasCpuCounters{false};         ///< cpuCounters holds a real capture

  /// @brief Human-readable summary.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- SystemInfoSource ----------------------------- */

/**
 * @brief Source of system snapshots.
 *
 * Implementations must not fail: unreadable counters leave the corresponding
 * fields at their defaults.
 */
class SystemInfoSource {
public:
  virtual ~SystemInfoSource() = default;

  /// @brief Refresh every counter class (memory, CPU, kernel).
  [[nodiscard]] virtual SystemSnapshot refreshAll(const SystemSnapshot& previous) = 0;

  /// @brief Refresh CPU counters only; other fields are carried over.
  [[nodiscard]] virtual SystemSnapshot refreshCpu(const SystemSnapshot& previous) = 0;
};

/* ----------------------------- LinuxSystemInfo ----------------------------- */

/**
 * @brief Options for LinuxSystemInfo.
 */
struct LinuxSystemInfoConfig {
  std::string procRoot{"/proc"}; ///< procfs mount point
  bool syscallFallbacks{true};   ///< Use sysinfo(2)/uname(2) when procfs nodes are missing
};

/**
 * @brief SystemInfoSource backed by procfs.
 */
class LinuxSystemInfo final : public SystemInfoSource {
public:
  LinuxSystemInfo() = default;
  explicit LinuxSystemInfo(LinuxSystemInfoConfig config) : config_(std::move(config)) {}

  [[nodiscard]] SystemSnapshot refreshAll(const SystemSnapshot& previous) override;
  [[nodiscard]] SystemSnapshot refreshCpu(const SystemSnapshot& previous) override;

  [[nodiscard]] const LinuxSystemInfoConfig& config() const noexcept { return config_; }

private:
  LinuxSystemInfoConfig config_{};
};

/* ----------------------------- Memory ----------------------------- */

/**
 * @brief RAM totals parsed from a meminfo file.
 */
struct MemoryTotals {
  std::uint64_t totalBytes{0};     ///< MemTotal
  std::uint64_t availableBytes{0}; ///< MemAvailable, or free + buffers + cache on old kernels

  /// @brief total - available, clamped at zero.
  [[nodiscard]] std::uint64_t usedBytes() const noexcept;
};

/**
 * @brief Parse a /proc/meminfo style file.
 * @param meminfoPath Path to the file.
 * @param out Populated on success.
 * @return true if MemTotal was found.
 * @note RT-safe: Single file read, bounded parsing.
 */
[[nodiscard]] bool readMemoryTotals(const char* meminfoPath, MemoryTotals& out) noexcept;

} // namespace system

} // namespace vitals

#endif // VITALS_SYSTEM_SYSTEM_INFO_HPP
