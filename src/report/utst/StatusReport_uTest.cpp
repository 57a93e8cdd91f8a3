/**
 * @file StatusReport_uTest.cpp
 * @brief Unit tests for status report assembly, rendering and delivery.
 *
 * Notes:
 *  - Collection tests use a scripted source, a recording sleeper and a
 *    temporary devfreq/power_supply tree, so they never sleep.
 */

#include "src/report/inc/ReportSink.hpp"
#include "src/report/inc/StatusReport.hpp"
#include "src/helpers/utst/TempTree.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <cstdint>
#include <cstddef>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using vitals::gpu::GpuReading;
using vitals::gpu::LoadSource;
using vitals::power::BatteryReading;
using vitals::report::buildStatusReport;
using vitals::report::collectStatus;
using vitals::report::FileSink;
using vitals::report::parseReportFormat;
using vitals::report::produceStatusReport;
using vitals::report::render;
using vitals::report::renderHtml;
using vitals::report::renderJson;
using vitals::report::renderPlain;
using vitals::report::ReportConfig;
using vitals::report::ReportFormat;
using vitals::report::ReportSink;
using vitals::report::StatusReport;
using vitals::system::SystemInfoSource;
using vitals::system::SystemSnapshot;
using vitals::test::TempTree;

namespace {

constexpr std::uint64_t GIB = 1024ULL * 1024ULL * 1024ULL;

/// Fixed memory/kernel, scripted CPU values per refresh.
class ScriptedSource final : public SystemInfoSource {
public:
  std::vector<double> cpuValues;
  std::optional<std::string> kernel{"6.1.0"};
  std::size_t refreshAllCalls{0};
  std::size_t refreshCpuCalls{0};

  SystemSnapshot refreshAll(const SystemSnapshot& previous) override {
    ++refreshAllCalls;
    SystemSnapshot next = previous;
    next.totalMemoryBytes = 8 * GIB;
    next.usedMemoryBytes = 4 * GIB;
    next.kernelVersion = kernel;
    return next;
  }

  SystemSnapshot refreshCpu(const SystemSnapshot& previous) override {
    SystemSnapshot next = previous;
    next.globalCpuUsage =
        (refreshCpuCalls < cpuValues.size()) ? cpuValues[refreshCpuCalls] : 0.0;
    ++refreshCpuCalls;
    return next;
  }
};

/// Records delivered text; optionally fails.
class CaptureSink final : public ReportSink {
public:
  bool fail{false};
  std::vector<std::string> delivered;

  bool deliver(const std::string& text, std::string& error) override {
    if (fail) {
      error = "transport unreachable";
      return false;
    }
    delivered.push_back(text);
    return true;
  }
};

void noSleep(std::chrono::milliseconds /*ms*/) {}

StatusReport sampleReport() {
  StatusReport r{};
  r.cpuPercent = 12.34;
  r.usedMemoryMiB = 4096;
  r.totalMemoryMiB = 8192;
  r.gpuName = "Adreno 640";
  r.gpu = "37% | 585/675 MHz";
  r.battery = "85%";
  r.kernel = "6.1.0";
  return r;
}

} // namespace

/* ----------------------------- Build Tests ----------------------------- */

/** @test Memory is reduced to MiB; readings are summarized. */
TEST(BuildStatusReportTest, Fields) {
  SystemSnapshot snap{};
  snap.totalMemoryBytes = 8'589'934'592ULL;
  snap.usedMemoryBytes = 4'294'967'296ULL;
  snap.kernelVersion = "6.1.0";

  GpuReading gpu{};
  gpu.loadPercent = 37;
  gpu.loadSource = LoadSource::LOAD;
  gpu.curFreqHz = 800'000'000ULL;
  gpu.hasCurFreq = true;

  BatteryReading battery{};
  battery.available = true;
  battery.capacity = "85";

  const StatusReport R = buildStatusReport(snap, 42.0, gpu, "Adreno 640", battery);
  EXPECT_EQ(R.usedMemoryMiB, 4096U);
  EXPECT_EQ(R.totalMemoryMiB, 8192U);
  EXPECT_EQ(R.gpu, "37% | 800/0 MHz");
  EXPECT_EQ(R.battery, "85%");
  EXPECT_EQ(R.kernel, "6.1.0");
  EXPECT_DOUBLE_EQ(R.cpuPercent, 42.0);
}

/** @test Missing kernel release renders as "unknown"; MiB truncates. */
TEST(BuildStatusReportTest, UnknownKernel) {
  SystemSnapshot snap{};
  snap.totalMemoryBytes = 1'048'575ULL;

  const StatusReport R = buildStatusReport(snap, 0.0, GpuReading{}, "gpu", BatteryReading{});
  EXPECT_EQ(R.kernel, "unknown");
  EXPECT_EQ(R.totalMemoryMiB, 0U);
  EXPECT_EQ(R.battery, "N/A");
  EXPECT_EQ(R.gpu, "0% | 0/0 MHz");
}

/* ----------------------------- Render Tests ----------------------------- */

/** @test Exact chat markup layout. */
TEST(RenderTest, Html) {
  EXPECT_EQ(renderHtml(sampleReport()), "🖥 <b>System Status</b>\n"
                                        "─────────────────\n"
                                        "<b>CPU:</b> 12.3%\n"
                                        "<b>Memory:</b> 4096 / 8192 MiB\n"
                                        "<b>GPU (Adreno 640):</b> 37% | 585/675 MHz\n"
                                        "<b>Battery:</b> 85%\n"
                                        "<b>Kernel:</b> 6.1.0");
}

/** @test Markup characters in free text are escaped. */
TEST(RenderTest, HtmlEscapes) {
  StatusReport r = sampleReport();
  r.kernel = "6.1<rc>&";
  EXPECT_NE(renderHtml(r).find("6.1&lt;rc&gt;&amp;"), std::string::npos);
}

/** @test Plain layout matches the markup layout without tags. */
TEST(RenderTest, Plain) {
  EXPECT_EQ(renderPlain(sampleReport()), "System Status\n"
                                         "-----------------\n"
                                         "CPU: 12.3%\n"
                                         "Memory: 4096 / 8192 MiB\n"
                                         "GPU (Adreno 640): 37% | 585/675 MHz\n"
                                         "Battery: 85%\n"
                                         "Kernel: 6.1.0");
}

/** @test JSON carries every field. */
TEST(RenderTest, Json) {
  StatusReport r = sampleReport();
  r.kernel = "6.1 \"x\"";
  const std::string OUT = renderJson(r);
  EXPECT_NE(OUT.find("\"cpuPercent\": 12.3"), std::string::npos);
  EXPECT_NE(OUT.find("\"usedMiB\": 4096"), std::string::npos);
  EXPECT_NE(OUT.find("\"totalMiB\": 8192"), std::string::npos);
  EXPECT_NE(OUT.find("\"name\": \"Adreno 640\""), std::string::npos);
  EXPECT_NE(OUT.find("\"battery\": \"85%\""), std::string::npos);
  EXPECT_NE(OUT.find("\"kernel\": \"6.1 \\\"x\\\"\""), std::string::npos);
  EXPECT_EQ(OUT.front(), '{');
  EXPECT_EQ(OUT.back(), '}');
}

/** @test render() dispatches on format. */
TEST(RenderTest, Dispatch) {
  const StatusReport R = sampleReport();
  EXPECT_EQ(render(R, ReportFormat::HTML), renderHtml(R));
  EXPECT_EQ(render(R, ReportFormat::PLAIN), renderPlain(R));
  EXPECT_EQ(render(R, ReportFormat::JSON), renderJson(R));
}

/** @test Format names round-trip; unknown names are rejected. */
TEST(ReportFormatTest, Parse) {
  ReportFormat f = ReportFormat::HTML;
  ASSERT_TRUE(parseReportFormat("json", f));
  EXPECT_EQ(f, ReportFormat::JSON);
  ASSERT_TRUE(parseReportFormat("plain", f));
  EXPECT_EQ(f, ReportFormat::PLAIN);
  EXPECT_STREQ(toString(f), "plain");
  EXPECT_FALSE(parseReportFormat("xml", f));
  EXPECT_EQ(f, ReportFormat::PLAIN);
}

/* ----------------------------- Collection Tests ----------------------------- */

class CollectStatusTest : public ::testing::Test {
protected:
  TempTree tree_;
  ReportConfig cfg_{};
  ScriptedSource source_;

  void SetUp() override {
    ASSERT_TRUE(tree_.valid());
    cfg_.gpuProbe.devfreqBase = tree_.path("devfreq/gpu");
    cfg_.batteryProbe.powerSupplyRoot = tree_.path("power_supply");
    source_.cpuValues = {99.0, 10.0, 20.0, 30.0, 40.0, 50.0};
  }
};

/** @test One refreshAll, warm-up plus five CPU refreshes, probes folded in. */
TEST_F(CollectStatusTest, EndToEnd) {
  tree_.write("devfreq/gpu/device/load", "37\n");
  tree_.write("devfreq/gpu/cur_freq", "800000000\n");
  tree_.write("devfreq/gpu/max_freq", "900000000\n");
  tree_.write("power_supply/battery/capacity", "85\n");

  std::vector<std::chrono::milliseconds> waits;
  const auto STATUS = collectStatus(source_, cfg_, [&waits](std::chrono::milliseconds ms) {
    waits.push_back(ms);
  });

  EXPECT_EQ(source_.refreshAllCalls, 1U);
  EXPECT_EQ(source_.refreshCpuCalls, 6U);
  EXPECT_EQ(waits.size(), 6U);

  const StatusReport& R = STATUS.report;
  EXPECT_DOUBLE_EQ(R.cpuPercent, 30.0);
  EXPECT_EQ(R.usedMemoryMiB, 4096U);
  EXPECT_EQ(R.totalMemoryMiB, 8192U);
  EXPECT_EQ(R.gpuName, "Adreno 640");
  EXPECT_EQ(R.gpu, "37% | 800/900 MHz");
  EXPECT_EQ(R.battery, "85%");
  EXPECT_EQ(R.kernel, "6.1.0");
  EXPECT_EQ(STATUS.gpuReading.loadSource, LoadSource::LOAD);
}

/** @test Missing hardware and kernel still produce a full report. */
TEST_F(CollectStatusTest, DegradedHost) {
  source_.kernel.reset();

  const auto STATUS = collectStatus(source_, cfg_, noSleep);
  EXPECT_EQ(STATUS.report.gpu, "0% | 0/0 MHz");
  EXPECT_EQ(STATUS.report.battery, "N/A");
  EXPECT_EQ(STATUS.report.kernel, "unknown");
}

/** @test Delivered text is the rendering in the configured format. */
TEST_F(CollectStatusTest, ProduceDelivers) {
  CaptureSink sink;
  std::string error;
  cfg_.format = ReportFormat::PLAIN;

  ASSERT_TRUE(produceStatusReport(source_, cfg_, noSleep, sink, error));
  ASSERT_EQ(sink.delivered.size(), 1U);
  EXPECT_EQ(sink.delivered[0].rfind("System Status\n", 0), 0U);
  EXPECT_NE(sink.delivered[0].find("CPU: 30.0%"), std::string::npos);
  EXPECT_TRUE(error.empty());
}

/** @test Sink failure propagates with its description. */
TEST_F(CollectStatusTest, ProducePropagatesFailure) {
  CaptureSink sink;
  sink.fail = true;
  std::string error;

  EXPECT_FALSE(produceStatusReport(source_, cfg_, noSleep, sink, error));
  EXPECT_EQ(error, "transport unreachable");
}

/* ----------------------------- Sink Tests ----------------------------- */

/** @test FileSink writes the text with a trailing newline. */
TEST(FileSinkTest, WritesFile) {
  TempTree tree;
  ASSERT_TRUE(tree.valid());
  FileSink sink(tree.path("report.txt"));
  std::string error;

  ASSERT_TRUE(sink.deliver("hello", error));
  std::ifstream in(sink.path());
  std::stringstream ss;
  ss << in.rdbuf();
  EXPECT_EQ(ss.str(), "hello\n");
}

/** @test Unwritable path fails with a description. */
TEST(FileSinkTest, BadPathFails) {
  FileSink sink("/nonexistent/dir/report.txt");
  std::string error;

  EXPECT_FALSE(sink.deliver("hello", error));
  EXPECT_NE(error.find("/nonexistent/dir/report.txt"), std::string::npos);
}

/** @test A null stream is rejected. */
TEST(StreamSinkTest, NullStream) {
  vitals::report::StreamSink sink(nullptr);
  std::string error;
  EXPECT_FALSE(sink.deliver("x", error));
  EXPECT_FALSE(error.empty());
}

/** @test A failed flush reports the error of that write. */
TEST(StreamSinkTest, FullDeviceReportsEnospc) {
  if (::access("/dev/full", W_OK) != 0) {
    GTEST_SKIP() << "/dev/full not available";
  }
  std::FILE* full = std::fopen("/dev/full", "w");
  ASSERT_NE(full, nullptr);

  errno = EACCES;
  vitals::report::StreamSink sink(full);
  std::string error;
  EXPECT_FALSE(sink.deliver("hello", error));
  EXPECT_EQ(error, std::string("write failed: ") + std::strerror(ENOSPC));
  std::fclose(full);
}

/** @test FileSink reports the write error, not a stale one. */
TEST(FileSinkTest, FullDeviceReportsEnospc) {
  if (::access("/dev/full", W_OK) != 0) {
    GTEST_SKIP() << "/dev/full not available";
  }
  errno = EACCES;
  FileSink sink("/dev/full");
  std::string error;
  EXPECT_FALSE(sink.deliver("hello", error));
  EXPECT_NE(error.find(std::strerror(ENOSPC)), std::string::npos);
}
