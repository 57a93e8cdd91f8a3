/**
 * @file StatusReport.cpp
 * @brief Status report assembly and rendering.
 */

#include "src/report/inc/StatusReport.hpp"
#include "src/helpers/inc/Format.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

namespace vitals {

namespace report {

using vitals::helpers::format::bytesToMebibytes;

namespace {

/// Escape a string for inclusion in a JSON string literal.
inline std::string jsonEscape(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (const char C : in) {
    switch (C) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(C) < 0x20) {
        out += fmt::format("\\u{:04x}", static_cast<unsigned int>(C));
      } else {
        out += C;
      }
    }
  }
  return out;
}

/// Escape '&', '<', '>' for chat HTML markup.
inline std::string htmlEscape(const std::string& in) {
  std::string out;
  out.reserve(in.size());
  for (const char C : in) {
    switch (C) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    default:
      out += C;
    }
  }
  return out;
}

} // namespace

/* ----------------------------- ReportFormat ----------------------------- */

const char* toString(ReportFormat format) noexcept {
  switch (format) {
  case ReportFormat::HTML:
    return "html";
  case ReportFormat::PLAIN:
    return "plain";
  case ReportFormat::JSON:
    return "json";
  }
  return "html";
}

bool parseReportFormat(std::string_view name, ReportFormat& out) noexcept {
  if (name == "html") {
    out = ReportFormat::HTML;
  } else if (name == "plain") {
    out = ReportFormat::PLAIN;
  } else if (name == "json") {
    out = ReportFormat::JSON;
  } else {
    return false;
  }
  return true;
}

/* ----------------------------- StatusReport ----------------------------- */

StatusReport buildStatusReport(const system::SystemSnapshot& snapshot, double cpuPercent,
                               const gpu::GpuReading& gpuReading, const std::string& gpuName,
                               const power::BatteryReading& batteryReading) {
  StatusReport report{};
  report.cpuPercent = cpuPercent;
  report.usedMemoryMiB = bytesToMebibytes(snapshot.usedMemoryBytes);
  report.totalMemoryMiB = bytesToMebibytes(snapshot.totalMemoryBytes);
  report.gpuName = gpuName;
  report.gpu = gpuReading.toString();
  report.battery = batteryReading.toString();
  report.kernel = snapshot.kernelVersion.value_or(UNKNOWN_KERNEL);
  return report;
}

/* ----------------------------- Rendering ----------------------------- */

std::string renderHtml(const StatusReport& report) {
  return fmt::format("🖥 <b>System Status</b>\n"
                     "─────────────────\n"
                     "<b>CPU:</b> {:.1f}%\n"
                     "<b>Memory:</b> {} / {} MiB\n"
                     "<b>GPU ({}):</b> {}\n"
                     "<b>Battery:</b> {}\n"
                     "<b>Kernel:</b> {}",
                     report.cpuPercent, report.usedMemoryMiB, report.totalMemoryMiB,
                     htmlEscape(report.gpuName), report.gpu, htmlEscape(report.battery),
                     htmlEscape(report.kernel));
}

std::string renderPlain(const StatusReport& report) {
  return fmt::format("System Status\n"
                     "-----------------\n"
                     "CPU: {:.1f}%\n"
                     "Memory: {} / {} MiB\n"
                     "GPU ({}): {}\n"
                     "Battery: {}\n"
                     "Kernel: {}",
                     report.cpuPercent, report.usedMemoryMiB, report.totalMemoryMiB,
                     report.gpuName, report.gpu, report.battery, report.kernel);
}

std::string renderJson(const StatusReport& report) {
  std::string out;
  out += "{\n";
  out += fmt::format("  \"cpuPercent\": {:.1f},\n", report.cpuPercent);
  out += fmt::format("  \"memory\": {{\"usedMiB\": {}, \"totalMiB\": {}}},\n", report.usedMemoryMiB,
                     report.totalMemoryMiB);
  out += fmt::format("  \"gpu\": {{\"name\": \"{}\", \"summary\": \"{}\"}},\n",
                     jsonEscape(report.gpuName), jsonEscape(report.gpu));
  out += fmt::format("  \"battery\": \"{}\",\n", jsonEscape(report.battery));
  out += fmt::format("  \"kernel\": \"{}\"\n", jsonEscape(report.kernel));
  out += "}";
  return out;
}

std::string render(const StatusReport& report, ReportFormat format) {
  switch (format) {
  case ReportFormat::PLAIN:
    return renderPlain(report);
  case ReportFormat::JSON:
    return renderJson(report);
  case ReportFormat::HTML:
    break;
  }
  return renderHtml(report);
}

/* ----------------------------- Assembly ----------------------------- */

CollectedStatus collectStatus(system::SystemInfoSource& source, const ReportConfig& config,
                              const helpers::clock::Sleeper& sleeper) {
  CollectedStatus out{};

  // Memory and kernel come from this refresh; the sampler only touches CPU
  out.snapshot = source.refreshAll(system::SystemSnapshot{});
  out.cpuSample = cpu::sampleCpuUsage(source, out.snapshot, config.sampling, sleeper);
  out.gpuReading = gpu::readDevfreqGpu(config.gpuProbe);
  out.batteryReading = power::readBatteryStatus(config.batteryProbe);

  out.report = buildStatusReport(out.snapshot, out.cpuSample.meanPercent, out.gpuReading,
                                 config.gpuProbe.name, out.batteryReading);
  return out;
}

bool produceStatusReport(system::SystemInfoSource& source, const ReportConfig& config,
                         const helpers::clock::Sleeper& sleeper, ReportSink& sink,
                         std::string& error) {
  const CollectedStatus STATUS = collectStatus(source, config, sleeper);
  return sink.deliver(render(STATUS.report, config.format), error);
}

} // namespace report

} // namespace vitals
