#ifndef VITALS_REPORT_STATUS_REPORT_HPP
#define VITALS_REPORT_STATUS_REPORT_HPP
/**
 * @file StatusReport.hpp
 * @brief Status report assembly, rendering and delivery.
 *
 * Sequence for one invocation:
 *  1. refreshAll() on a fresh snapshot (memory, CPU counters, kernel)
 *  2. sampleCpuUsage() (sleeps for the sampling budget)
 *  3. readDevfreqGpu(), readBatteryStatus()
 *  4. build a StatusReport, render it, hand it to a ReportSink
 *
 * Everything is invocation-local; concurrent invocations share nothing.
 */

#include "src/cpu/inc/CpuSampler.hpp"
#include "src/gpu/inc/DevfreqGpu.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/power/inc/BatteryStatus.hpp"
#include "src/report/inc/ReportSink.hpp"
#include "src/system/inc/SystemInfo.hpp"

#include <cstdint>     // std::uint64_t
#include <string>      // std::string
#include <string_view> // std::string_view

namespace vitals {

namespace report {

/* ----------------------------- Constants ----------------------------- */

/// Rendered when the kernel release cannot be determined.
inline constexpr const char* UNKNOWN_KERNEL = "unknown";

/* ----------------------------- Enums ----------------------------- */

/**
 * @brief Output rendering.
 */
enum class ReportFormat : std::uint8_t {
  HTML = 0, ///< Chat markup (<b> tags), the transport default
  PLAIN,    ///< Same layout without markup
  JSON,     ///< Machine-readable object
};

/**
 * @brief Convert ReportFormat to its CLI name.
 * @note RT-safe: Returns pointer to static string.
 */
[[nodiscard]] const char* toString(ReportFormat format) noexcept;

/**
 * @brief Parse a CLI format name ("html", "plain", "json").
 * @return false if name is not recognized.
 */
[[nodiscard]] bool parseReportFormat(std::string_view name, ReportFormat& out) noexcept;

/* ----------------------------- StatusReport ----------------------------- */

/**
 * @brief The five report fields, already reduced to display units.
 *
 * Built once per invocation and not modified afterwards.
 */
struct StatusReport {
  double cpuPercent{0.0};          ///< Mean CPU utilization
  std::uint64_t usedMemoryMiB{0};  ///< Used RAM in MiB
  std::uint64_t totalMemoryMiB{0}; ///< Total RAM in MiB
  std::string gpuName;             ///< GPU display name
  std::string gpu;                 ///< GPU summary, e.g. "37% | 800/900 MHz"
  std::string battery;             ///< Battery summary, e.g. "85%" or "N/A"
  std::string kernel;              ///< Kernel release or "unknown"
};

/**
 * @brief Build a report from collected readings.
 * @param snapshot Refreshed snapshot (memory, kernel).
 * @param cpuPercent Mean CPU utilization.
 * @param gpuReading GPU reading.
 * @param gpuName GPU display name.
 * @param batteryReading Battery reading.
 * @note Memory is converted with integer division by 1 MiB.
 */
[[nodiscard]] StatusReport buildStatusReport(const system::SystemSnapshot& snapshot,
                                             double cpuPercent,
                                             const gpu::GpuReading& gpuReading,
                                             const std::string& gpuName,
                                             const power::BatteryReading& batteryReading);

/* ----------------------------- Rendering ----------------------------- */

/// @brief Chat markup rendering (title, separator, five fields).
[[nodiscard]] std::string renderHtml(const StatusReport& report);

/// @brief Plain-text rendering, same order as renderHtml().
[[nodiscard]] std::string renderPlain(const StatusReport& report);

/// @brief Single JSON object with the same fields.
[[nodiscard]] std::string renderJson(const StatusReport& report);

/// @brief Dispatch on format.
[[nodiscard]] std::string render(const StatusReport& report, ReportFormat format);

/* ----------------------------- Assembly ----------------------------- */

/**
 * @brief Probe and sampling configuration for one invocation.
 */
struct ReportConfig {
  gpu::GpuProbeConfig gpuProbe{};          ///< devfreq base and display name
  power::BatteryProbeConfig batteryProbe{}; ///< power_supply root
  cpu::CpuSamplerConfig sampling{};         ///< CPU sample count and interval
  ReportFormat format{ReportFormat::HTML};  ///< Rendering for delivery
};

/**
 * @brief Report plus the raw readings behind it.
 *
 * The raw readings carry per-field availability for diagnostics.
 */
struct CollectedStatus {
  StatusReport report{};                  ///< Display fields
  system::SystemSnapshot snapshot{};      ///< Snapshot after refreshAll()
  cpu::CpuSample cpuSample{};             ///< Sampler result
  gpu::GpuReading gpuReading{};           ///< GPU reading
  power::BatteryReading batteryReading{}; ///< Battery reading
};

/**
 * @brief Collect every metric and build the report.
 * @param source System snapshot source.
 * @param config Probe and sampling configuration.
 * @param sleeper Wait primitive for the CPU sampler.
 * @return Collected readings. Never fails; missing hardware degrades fields.
 */
[[nodiscard]] CollectedStatus collectStatus(system::SystemInfoSource& source,
                                            const ReportConfig& config,
                                            const helpers::clock::Sleeper& sleeper);

/**
 * @brief Collect, render and deliver a status report.
 * @param source System snapshot source.
 * @param config Probe, sampling and format configuration.
 * @param sleeper Wait primitive for the CPU sampler.
 * @param sink Delivery target.
 * @param error Set to the sink's error on delivery failure.
 * @return false only if delivery failed.
 */
[[nodiscard]] bool produceStatusReport(system::SystemInfoSource& source, const ReportConfig& config,
                                       const helpers::clock::Sleeper& sleeper, ReportSink& sink,
                                       std::string& error);

} // namespace report

} // namespace vitals

#endif // VITALS_REPORT_STATUS_REPORT_HPP
