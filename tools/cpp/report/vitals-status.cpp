/**
 * @file vitals-status.cpp
 * @brief One-shot host status report: CPU, memory, GPU, battery, kernel.
 *
 * Samples CPU utilization for ~1.8 s, probes the devfreq GPU node and the
 * power_supply class, and writes a single report to stdout or a file.
 */

#include "src/helpers/inc/Args.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/report/inc/ReportSink.hpp"
#include "src/report/inc/StatusReport.hpp"
#include "src/system/inc/SystemInfo.hpp"

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>

namespace report = vitals::report;
namespace args = vitals::helpers::args;

namespace {

/* ----------------------------- Argument Handling ----------------------------- */

enum ArgKey : std::uint8_t {
  ARG_HELP = 0,
  ARG_FORMAT = 1,
  ARG_OUTPUT = 2,
  ARG_SAMPLES = 3,
  ARG_INTERVAL = 4,
  ARG_GPU_BASE = 5,
  ARG_GPU_NAME = 6,
  ARG_POWER_ROOT = 7,
  ARG_PROC_ROOT = 8,
  ARG_VERBOSE = 9,
};

constexpr std::string_view DESCRIPTION =
    "Sample CPU, memory, GPU, battery and kernel state and print one status report.\n"
    "Missing hardware nodes degrade to 0 or N/A; the report is always produced.";

args::ArgMap buildArgMap() {
  args::ArgMap map;
  map[ARG_HELP] = {"--help", 0, false, "Show this help message"};
  map[ARG_FORMAT] = {"--format", 1, false, "Output format: html (default), plain, json"};
  map[ARG_OUTPUT] = {"--output", 1, false, "Write to file instead of stdout"};
  map[ARG_SAMPLES] = {"--samples", 1, false, "CPU samples to average (default 5)"};
  map[ARG_INTERVAL] = {"--interval-ms", 1, false, "Wait between CPU samples (default 300)"};
  map[ARG_GPU_BASE] = {"--gpu-base", 1, false, "devfreq directory of the GPU"};
  map[ARG_GPU_NAME] = {"--gpu-name", 1, false, "GPU name shown in the report"};
  map[ARG_POWER_ROOT] = {"--power-root", 1, false, "power_supply class directory"};
  map[ARG_PROC_ROOT] = {"--proc-root", 1, false, "procfs mount point"};
  map[ARG_VERBOSE] = {"--verbose", 0, false, "Print probe diagnostics to stderr"};
  return map;
}

struct Options {
  report::ReportConfig config{};
  vitals::system::LinuxSystemInfoConfig systemConfig{};
  std::string outputFile;
  bool verbose{false};
};

/// Apply parsed flags; returns false and sets error on an invalid value.
bool applyArgs(const args::ParsedArgs& pargs, Options& opts, std::string& error) {
  auto value = [&](ArgKey key) -> std::string_view { return pargs.at(key)[0]; };

  if (pargs.count(ARG_FORMAT) != 0 &&
      !report::parseReportFormat(value(ARG_FORMAT), opts.config.format)) {
    error = fmt::format("Unknown format '{}'", value(ARG_FORMAT));
    return false;
  }
  if (pargs.count(ARG_SAMPLES) != 0) {
    std::uint64_t samples = 0;
    if (!args::parseUintValue(value(ARG_SAMPLES), samples) || samples == 0) {
      error = fmt::format("Invalid sample count '{}'", value(ARG_SAMPLES));
      return false;
    }
    opts.config.sampling.sampleCount = static_cast<std::size_t>(samples);
  }
  if (pargs.count(ARG_INTERVAL) != 0) {
    std::uint64_t ms = 0;
    if (!args::parseUintValue(value(ARG_INTERVAL), ms) ||
        ms > static_cast<std::uint64_t>(vitals::cpu::MAX_SAMPLE_INTERVAL.count())) {
      error = fmt::format("Invalid interval '{}'", value(ARG_INTERVAL));
      return false;
    }
    opts.config.sampling.interval =
        std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
  }
  if (!opts.config.sampling.withinLimits()) {
    error = fmt::format("Sampling limits are {} samples and {} ms", vitals::cpu::MAX_SAMPLE_COUNT,
                        vitals::cpu::MAX_SAMPLE_INTERVAL.count());
    return false;
  }
  if (pargs.count(ARG_GPU_BASE) != 0) {
    opts.config.gpuProbe.devfreqBase = std::string(value(ARG_GPU_BASE));
  }
  if (pargs.count(ARG_GPU_NAME) != 0) {
    opts.config.gpuProbe.name = std::string(value(ARG_GPU_NAME));
  }
  if (pargs.count(ARG_POWER_ROOT) != 0) {
    opts.config.batteryProbe.powerSupplyRoot = std::string(value(ARG_POWER_ROOT));
  }
  if (pargs.count(ARG_PROC_ROOT) != 0) {
    opts.systemConfig.procRoot = std::string(value(ARG_PROC_ROOT));
  }
  if (pargs.count(ARG_OUTPUT) != 0) {
    opts.outputFile = std::string(value(ARG_OUTPUT));
  }
  opts.verbose = pargs.count(ARG_VERBOSE) != 0;
  return true;
}

/* ----------------------------- Diagnostics ----------------------------- */

void printDiagnostics(const report::CollectedStatus& status, const Options& opts) {
  const auto& GPU = status.gpuReading;
  fmt::print(stderr, "[vitals] cpu: {} samples, mean {:.1f}%\n", status.cpuSample.samplesTaken,
             status.cpuSample.meanPercent);
  fmt::print(stderr, "[vitals] gpu: load from {} (cur_freq {}, max_freq {})\n",
             vitals::gpu::toString(GPU.loadSource), GPU.hasCurFreq ? "ok" : "missing",
             GPU.hasMaxFreq ? "ok" : "missing");
  if (GPU.isEmpty()) {
    fmt::print(stderr, "[vitals] gpu: no readable nodes under {}\n",
               opts.config.gpuProbe.devfreqBase);
  }
  if (status.batteryReading.available) {
    fmt::print(stderr, "[vitals] battery: capacity from {}\n", status.batteryReading.supply);
  } else {
    fmt::print(stderr, "[vitals] battery: no capacity node under {}\n",
               opts.config.batteryProbe.powerSupplyRoot);
  }
  if (!status.snapshot.kernelVersion) {
    fmt::print(stderr, "[vitals] kernel: release unavailable\n");
  }
}

} // namespace

/* ----------------------------- Main ----------------------------- */

int main(int argc, char* argv[]) {
  const args::ArgMap ARG_MAP = buildArgMap();
  args::ParsedArgs pargs;
  Options opts{};

  std::vector<std::string_view> argList;
  argList.reserve(static_cast<std::size_t>(argc > 1 ? argc - 1 : 0));
  for (int i = 1; i < argc; ++i) {
    argList.emplace_back(argv[i]);
  }

  std::string error;
  if (!args::parseArgs(argList, ARG_MAP, pargs, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }
  if (pargs.count(ARG_HELP) != 0) {
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 0;
  }
  if (!applyArgs(pargs, opts, error)) {
    fmt::print(stderr, "Error: {}\n\n", error);
    args::printUsage(argv[0], DESCRIPTION, ARG_MAP);
    return 1;
  }

  vitals::system::LinuxSystemInfo source(opts.systemConfig);
  const report::CollectedStatus STATUS =
      report::collectStatus(source, opts.config, vitals::helpers::clock::threadSleeper());

  if (opts.verbose) {
    printDiagnostics(STATUS, opts);
  }

  std::unique_ptr<report::ReportSink> sink;
  if (opts.outputFile.empty()) {
    sink = std::make_unique<report::StreamSink>(stdout);
  } else {
    sink = std::make_unique<report::FileSink>(opts.outputFile);
  }

  if (!sink->deliver(report::render(STATUS.report, opts.config.format), error)) {
    fmt::print(stderr, "Error: delivery failed: {}\n", error);
    return 1;
  }
  return 0;
}
