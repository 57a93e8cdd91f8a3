/**
 * @file CpuSampler_uTest.cpp
 * @brief Unit tests for vitals::cpu::sampleCpuUsage.
 *
 * Notes:
 *  - A scripted SystemInfoSource returns fixed utilization per refresh.
 *  - The sleeper records intervals instead of sleeping.
 */

#include "src/cpu/inc/CpuSampler.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <utility>
#include <vector>

using vitals::cpu::CpuSamplerConfig;
using vitals::cpu::MAX_SAMPLE_COUNT;
using vitals::cpu::MAX_SAMPLE_INTERVAL;
using vitals::cpu::sampleCpuUsage;
using vitals::cpu::SAMPLE_COUNT;
using vitals::cpu::SAMPLE_INTERVAL;
using vitals::cpu::SAMPLING_BUDGET;
using vitals::system::SystemInfoSource;
using vitals::system::SystemSnapshot;

namespace {

/// Returns scripted utilization values, one per refreshCpu() call.
class ScriptedSource final : public SystemInfoSource {
public:
  explicit ScriptedSource(std::vector<double> values) : values_(std::move(values)) {}

  SystemSnapshot refreshAll(const SystemSnapshot& previous) override {
    return refreshCpu(previous);
  }

  SystemSnapshot refreshCpu(const SystemSnapshot& previous) override {
    SystemSnapshot next = previous;
    next.globalCpuUsage = (calls_ < values_.size()) ? values_[calls_] : 0.0;
    ++calls_;
    return next;
  }

  [[nodiscard]] std::size_t calls() const noexcept { return calls_; }

private:
  std::vector<double> values_;
  std::size_t calls_{0};
};

struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> waits;

  vitals::helpers::clock::Sleeper fn() {
    return [this](std::chrono::milliseconds ms) { waits.push_back(ms); };
  }
};

} // namespace

/* ----------------------------- Constant Tests ----------------------------- */

/** @test Defaults: five samples, 300 ms apart, 1.8 s total. */
TEST(CpuSamplerConstantsTest, Defaults) {
  EXPECT_EQ(SAMPLE_COUNT, 5U);
  EXPECT_EQ(SAMPLE_INTERVAL, std::chrono::milliseconds(300));
  EXPECT_EQ(SAMPLING_BUDGET, std::chrono::milliseconds(1800));
  EXPECT_EQ(CpuSamplerConfig{}.budget(), SAMPLING_BUDGET);
}

/** @test Limits bound the budget; values past them are flagged. */
TEST(CpuSamplerConstantsTest, Limits) {
  CpuSamplerConfig cfg{};
  EXPECT_TRUE(cfg.withinLimits());

  cfg.sampleCount = MAX_SAMPLE_COUNT;
  cfg.interval = MAX_SAMPLE_INTERVAL;
  EXPECT_TRUE(cfg.withinLimits());
  EXPECT_GT(cfg.budget().count(), 0);

  cfg.interval = MAX_SAMPLE_INTERVAL + std::chrono::milliseconds(1);
  EXPECT_FALSE(cfg.withinLimits());

  cfg.interval = std::chrono::milliseconds(-1);
  EXPECT_FALSE(cfg.withinLimits());

  cfg.interval = SAMPLE_INTERVAL;
  cfg.sampleCount = MAX_SAMPLE_COUNT + 1;
  EXPECT_FALSE(cfg.withinLimits());
}

/* ----------------------------- Averaging Tests ----------------------------- */

/** @test Mean of the five samples, independent of the warm-up reading. */
TEST(CpuSamplerTest, MeanIgnoresWarmup) {
  ScriptedSource source({99.0, 10.0, 20.0, 30.0, 40.0, 50.0});
  RecordingSleeper sleeper;

  const auto RESULT = sampleCpuUsage(source, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());

  EXPECT_DOUBLE_EQ(RESULT.meanPercent, 30.0);
  EXPECT_EQ(RESULT.samplesTaken, 5U);
  EXPECT_EQ(source.calls(), 6U);
}

/** @test Different warm-up value, same result. */
TEST(CpuSamplerTest, WarmupValueIrrelevant) {
  ScriptedSource a({0.0, 12.5, 12.5, 12.5, 12.5, 12.5});
  ScriptedSource b({100.0, 12.5, 12.5, 12.5, 12.5, 12.5});
  RecordingSleeper sleeper;

  const auto RA = sampleCpuUsage(a, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());
  const auto RB = sampleCpuUsage(b, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());
  EXPECT_DOUBLE_EQ(RA.meanPercent, RB.meanPercent);
  EXPECT_DOUBLE_EQ(RA.meanPercent, 12.5);
}

/** @test One wait per refresh, each of the configured interval. */
TEST(CpuSamplerTest, SleepsOncePerRefresh) {
  ScriptedSource source({0, 0, 0, 0, 0, 0});
  RecordingSleeper sleeper;

  (void)sampleCpuUsage(source, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());

  ASSERT_EQ(sleeper.waits.size(), SAMPLE_COUNT + 1);
  for (const auto& W : sleeper.waits) {
    EXPECT_EQ(W, SAMPLE_INTERVAL);
  }
}

/** @test Readings above 100 pass through unclamped. */
TEST(CpuSamplerTest, NotClamped) {
  ScriptedSource source({0.0, 110.0, 110.0, 110.0, 110.0, 110.0});
  RecordingSleeper sleeper;

  const auto RESULT = sampleCpuUsage(source, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());
  EXPECT_DOUBLE_EQ(RESULT.meanPercent, 110.0);
}

/** @test A source with no information degrades to zero. */
TEST(CpuSamplerTest, EmptySourceZero) {
  ScriptedSource source(std::vector<double>{});
  RecordingSleeper sleeper;

  const auto RESULT = sampleCpuUsage(source, SystemSnapshot{}, CpuSamplerConfig{}, sleeper.fn());
  EXPECT_DOUBLE_EQ(RESULT.meanPercent, 0.0);
}

/** @test Custom count and interval are honoured; zero samples do not divide by zero. */
TEST(CpuSamplerTest, CustomConfig) {
  RecordingSleeper sleeper;

  ScriptedSource two({5.0, 10.0, 30.0});
  CpuSamplerConfig cfg{};
  cfg.sampleCount = 2;
  cfg.interval = std::chrono::milliseconds(10);
  const auto R2 = sampleCpuUsage(two, SystemSnapshot{}, cfg, sleeper.fn());
  EXPECT_DOUBLE_EQ(R2.meanPercent, 20.0);
  EXPECT_EQ(sleeper.waits.back(), std::chrono::milliseconds(10));

  ScriptedSource none({50.0});
  cfg.sampleCount = 0;
  const auto R0 = sampleCpuUsage(none, SystemSnapshot{}, cfg, sleeper.fn());
  EXPECT_DOUBLE_EQ(R0.meanPercent, 0.0);
  EXPECT_EQ(R0.samplesTaken, 0U);
}

/** @test Snapshot fields other than CPU usage are carried through. */
TEST(CpuSamplerTest, CarriesSnapshot) {
  ScriptedSource source({0, 1, 2, 3, 4, 5});
  RecordingSleeper sleeper;

  SystemSnapshot initial{};
  initial.totalMemoryBytes = 1024;
  initial.kernelVersion = "6.1.0";

  const auto RESULT = sampleCpuUsage(source, initial, CpuSamplerConfig{}, sleeper.fn());
  EXPECT_EQ(RESULT.last.totalMemoryBytes, 1024U);
  EXPECT_EQ(RESULT.last.kernelVersion, std::string("6.1.0"));
  EXPECT_DOUBLE_EQ(RESULT.last.globalCpuUsage, 5.0);
}
