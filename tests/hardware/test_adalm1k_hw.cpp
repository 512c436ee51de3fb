#include "analog-bench/BenchConfig.hpp"
#include "analog-bench/fixtures/BenchTest.hpp"
#include "analog-bench/m1k/LibsmuDriver.hpp"
#include "analog-bench/m1k/SmuContext.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

using namespace analogbench;
using namespace analogbench::m1k;

// Needs an ADALM1000 with both channels unloaded
class Adalm1kFixtureTest : public fixtures::BenchTest {};

TEST_F(Adalm1kFixtureTest, OpensInHighImpedance) {
  auto &smu = adalm1k();
  EXPECT_FALSE(smu.serial().empty());
  EXPECT_EQ(smu.channel_mode(SmuChannel::A), SmuMode::HiZ);
  EXPECT_EQ(smu.channel_mode(SmuChannel::B), SmuMode::HiZ);
  EXPECT_FALSE(smu.capture_continuous());
  EXPECT_EQ(smu.sample_rate(), 100000u);
  EXPECT_EQ(smu.queue_size(), 100000u);
}

TEST_F(Adalm1kFixtureTest, VoltageSourceHoldsConfiguredVoltages) {
  auto &smu = adalm1k_voltage_source();
  EXPECT_EQ(smu.channel_mode(SmuChannel::A), SmuMode::SVMI);
  EXPECT_EQ(smu.channel_mode(SmuChannel::B), SmuMode::SVMI);
  EXPECT_TRUE(smu.capture_continuous());

  double expected_a = require_setting(bench_config().adalm1k.ch_a_voltage,
                                      "adalm1k.ch_a_voltage");
  double expected_b = require_setting(bench_config().adalm1k.ch_b_voltage,
                                      "adalm1k.ch_b_voltage");

  auto frames = smu.read_all(smu.queue_size(), -1);
  ASSERT_EQ(frames.size(), smu.queue_size());
  for (const auto &frame : frames) {
    EXPECT_NEAR(frame.a.voltage, expected_a, 1e-2);
    EXPECT_NEAR(frame.b.voltage, expected_b, 1e-2);
  }
}

TEST_F(Adalm1kFixtureTest, CurrentSourceHoldsConfiguredCurrents) {
  auto &smu = adalm1k_current_source();
  EXPECT_EQ(smu.channel_mode(SmuChannel::A), SmuMode::SIMV);
  EXPECT_EQ(smu.channel_mode(SmuChannel::B), SmuMode::SIMV);
  EXPECT_TRUE(smu.capture_continuous());

  double expected_a_ma = require_setting(bench_config().adalm1k.ch_a_current,
                                         "adalm1k.ch_a_current");
  double expected_b_ma = require_setting(bench_config().adalm1k.ch_b_current,
                                         "adalm1k.ch_b_current");

  auto frames = smu.read_all(smu.queue_size(), -1);
  ASSERT_EQ(frames.size(), smu.queue_size());
  for (const auto &frame : frames) {
    EXPECT_NEAR(frame.a.current * 1000.0, expected_a_ma, 1e-2);
    EXPECT_NEAR(frame.b.current * 1000.0, expected_b_ma, 1e-2);
  }
}

class SmuContextHardwareTest : public fixtures::BenchTest {};

TEST_F(SmuContextHardwareTest, FiniteCapture) {
  Adalm1k device(std::make_unique<LibsmuDriver>());
  CaptureSetup setup;
  setup.mode_a = SmuMode::HiZ;
  setup.mode_b = SmuMode::SVMI;
  setup.output_b = 1.0;
  setup.samples = 1000;

  SmuContext ctx(device,
                 static_cast<int>(bench_config().adalm1k.device_index), setup);
  auto frames = ctx->read_all(1000, -1);
  ASSERT_EQ(frames.size(), 1000u);
  for (const auto &frame : frames) {
    EXPECT_NEAR(frame.a.voltage, 0.0, 5e-1);
    EXPECT_NEAR(frame.b.voltage, 1.0, 1e-2);
  }
  EXPECT_FALSE(ctx->capture_continuous());
  EXPECT_FALSE(ctx->capture_cancelled());
  EXPECT_TRUE(ctx->read_all(1000).empty());
}

TEST_F(SmuContextHardwareTest, ContinuousCapture) {
  Adalm1k device(std::make_unique<LibsmuDriver>());
  CaptureSetup setup;
  setup.mode_a = SmuMode::SIMV;
  setup.mode_b = SmuMode::HiZ;

  SmuContext ctx(device,
                 static_cast<int>(bench_config().adalm1k.device_index), setup);
  std::this_thread::sleep_for(std::chrono::milliseconds(500));
  EXPECT_FALSE(ctx->read_all(1000).empty());
  EXPECT_TRUE(ctx->capture_continuous());
  EXPECT_FALSE(ctx->capture_cancelled());
  EXPECT_EQ(ctx->read_all(1000, -1).size(), 1000u);

  ctx.release();
  EXPECT_EQ(device.state(), DeviceState::Released);
}
