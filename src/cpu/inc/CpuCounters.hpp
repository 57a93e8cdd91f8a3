#ifndef VITALS_CPU_COUNTERS_HPP
#define VITALS_CPU_COUNTERS_HPP
/**
 * @file CpuCounters.hpp
 * @brief Aggregate CPU time counters and busy-percentage deltas.
 * @note Linux-only. Reads the aggregate "cpu" line of /proc/stat.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Design: snapshot + delta.
 *  - readCpuTimeCounters() captures raw jiffies
 *  - computeBusyPercent() turns two captures into a percentage
 *  - Caller controls the sampling interval
 */

#include <cstdint>
#include <string>

namespace vitals {

namespace cpu {

/* ----------------------------- Raw Counters ----------------------------- */

/**
 * @brief Raw CPU time counters from /proc/stat (in jiffies).
 *
 * Fields match /proc/stat columns:
 *   user nice system idle iowait irq softirq steal guest guest_nice
 *
 * All values are cumulative since boot.
 */
struct CpuTimeCounters {
  std::uint64_t user{0};      ///< Time in user mode
  std::uint64_t nice{0};      ///< Time in user mode with low priority
  std::uint64_t system{0};    ///< Time in kernel mode
  std::uint64_t idle{0};      ///< Time in idle task
  std::uint64_t iowait{0};    ///< Time waiting for I/O
  std::uint64_t irq{0};       ///< Time servicing hardware interrupts
  std::uint64_t softirq{0};   ///< Time servicing software interrupts
  std::uint64_t steal{0};     ///< Time stolen by hypervisor
  std::uint64_t guest{0};     ///< Time running guest OS
  std::uint64_t guestNice{0}; ///< Time running niced guest OS

  /// Total time across all fields.
  [[nodiscard]] std::uint64_t total() const noexcept;

  /// Busy time (total minus idle and iowait).
  [[nodiscard]] std::uint64_t busy() const noexcept;

  /// @brief Single-line dump of the main columns.
  /// @note NOT RT-safe: Allocates std::string.
  [[nodiscard]] std::string toString() const;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse one "cpu ..." line of /proc/stat.
 * @param line Null-terminated line.
 * @param out Populated on success.
 * @return true if line is the aggregate "cpu " line.
 * @note RT-safe: No allocation.
 *
 * Older kernels emit fewer than ten columns; missing ones stay zero.
 */
[[nodiscard]] bool parseAggregateCpuLine(const char* line, CpuTimeCounters& out) noexcept;

/**
 * @brief Read the aggregate counters from a /proc/stat style file.
 * @param statPath Path to the stat file (normally "/proc/stat").
 * @param out Populated on success.
 * @return true if an aggregate line was found.
 * @note RT-safe: Single file read, bounded parsing.
 */
[[nodiscard]] bool readCpuTimeCounters(const char* statPath, CpuTimeCounters& out) noexcept;

/**
 * @brief Busy percentage between two captures (0-100 scale).
 * @param before Earlier capture.
 * @param after Later capture.
 * @return Busy share of elapsed jiffies; 0.0 if no time elapsed or counters went backwards.
 * @note RT-safe: Pure computation.
 */
[[nodiscard]] double computeBusyPercent(const CpuTimeCounters& before,
                                        const CpuTimeCounters& after) noexcept;

} // namespace cpu

} // namespace vitals

#endif // VITALS_CPU_COUNTERS_HPP
