#include "analog-bench/fixtures/BenchTest.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

namespace analogbench {
namespace fixtures {

namespace {
constexpr double kMilliampsPerAmp = 1000.0;
}

void BenchTest::defer(std::string name, std::function<void()> step) {
  teardown_.emplace_back(std::move(name), std::move(step));
}

void BenchTest::TearDown() {
  while (!teardown_.empty()) {
    auto step = std::move(teardown_.back());
    teardown_.pop_back();
    try {
      step.second();
    } catch (const std::exception &ex) {
      LOG_ERROR("FIXTURE", "TEARDOWN", "{} failed: {}", step.first,
                ex.what());
      ADD_FAILURE() << "teardown of " << step.first << " failed: "
                    << ex.what();
    }
  }
}

discovery::AnalogDiscovery &BenchTest::analog_discovery() {
  return environment().analog_discovery();
}

discovery::AnalogDiscovery &BenchTest::analog_discovery_supplies() {
  auto &ad = analog_discovery();
  if (supplies_) {
    return ad;
  }

  const auto &supplies = bench_config().analog_discovery.supplies;
  double v_plus = require_setting(supplies.positive_voltage,
                                  "analog_discovery.supplies.positive_voltage");
  double v_minus = require_setting(
      supplies.negative_voltage, "analog_discovery.supplies.negative_voltage");

  supplies_ =
      std::make_unique<discovery::SupplyGuard>(ad, v_plus, v_minus, true);
  defer("analog_discovery_supplies", [this] {
    auto guard = std::move(supplies_);
    guard->restore();
  });
  return ad;
}

discovery::AnalogDiscovery &BenchTest::analog_discovery_scope_wavegen() {
  auto &ad = analog_discovery();
  if (scope_wavegen_) {
    return ad;
  }

  scope_wavegen_ = std::make_unique<discovery::ChannelGuard>(
      ad, discovery::ChannelList{discovery::ScopeChannel::Channel1,
                                 discovery::ScopeChannel::Channel2,
                                 discovery::WaveGenChannel::WaveGen1,
                                 discovery::WaveGenChannel::WaveGen2});
  defer("analog_discovery_scope_wavegen", [this] {
    auto guard = std::move(scope_wavegen_);
    guard->restore();
  });
  return ad;
}

m1k::Adalm1k &BenchTest::adalm1k() {
  if (adalm1k_) {
    return *adalm1k_;
  }

  auto device = environment().make_adalm1k();
  device->open(bench_config().adalm1k.device_index);
  adalm1k_ = std::move(device);
  defer("adalm1k", [this] {
    auto device = std::move(adalm1k_);
    device->close();
  });
  return *adalm1k_;
}

m1k::Adalm1k &BenchTest::adalm1k_voltage_source() {
  if (voltage_source_) {
    return *adalm1k_;
  }

  const auto &cfg = bench_config().adalm1k;
  m1k::CaptureSetup setup;
  setup.mode_a = m1k::SmuMode::SVMI;
  setup.mode_b = m1k::SmuMode::SVMI;
  setup.output_a = require_setting(cfg.ch_a_voltage, "adalm1k.ch_a_voltage");
  setup.output_b = require_setting(cfg.ch_b_voltage, "adalm1k.ch_b_voltage");
  setup.settle_time = environment().smu_settle_time();

  auto &device = adalm1k();
  LOG_INFO("FIXTURE", "ADALM1K",
           "Sourcing voltage, measuring current: CH A {} V, CH B {} V",
           setup.output_a, setup.output_b);
  voltage_source_ = std::make_unique<m1k::CaptureGuard>(device, setup);
  defer("adalm1k_voltage_source", [this] {
    auto guard = std::move(voltage_source_);
    guard->restore();
  });
  return device;
}

m1k::Adalm1k &BenchTest::adalm1k_current_source() {
  if (current_source_) {
    return *adalm1k_;
  }

  const auto &cfg = bench_config().adalm1k;
  m1k::CaptureSetup setup;
  setup.mode_a = m1k::SmuMode::SIMV;
  setup.mode_b = m1k::SmuMode::SIMV;
  double ch_a_ma = require_setting(cfg.ch_a_current, "adalm1k.ch_a_current");
  double ch_b_ma = require_setting(cfg.ch_b_current, "adalm1k.ch_b_current");
  setup.output_a = ch_a_ma / kMilliampsPerAmp;
  setup.output_b = ch_b_ma / kMilliampsPerAmp;
  setup.settle_time = environment().smu_settle_time();

  auto &device = adalm1k();
  LOG_INFO("FIXTURE", "ADALM1K",
           "Sourcing current, measuring voltage: CH A {} mA, CH B {} mA",
           ch_a_ma, ch_b_ma);
  current_source_ = std::make_unique<m1k::CaptureGuard>(device, setup);
  defer("adalm1k_current_source", [this] {
    auto guard = std::move(current_source_);
    guard->restore();
  });
  return device;
}

} // namespace fixtures
} // namespace analogbench
