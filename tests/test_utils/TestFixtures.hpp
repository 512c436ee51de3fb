#pragma once
#include "SimulatedScopeDriver.hpp"
#include "SimulatedSmuDriver.hpp"
#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/fixtures/BenchTest.hpp"
#include "analog-bench/m1k/Adalm1k.hpp"

#include <gtest/gtest.h>
#include <memory>

namespace analogbench {
namespace test {

/// Opens the test log once per test
class LoggedTest : public ::testing::Test {
protected:
  void SetUp() override;
};

/// Adalm1k over a SimulatedSmuDriver. smu_ stays owned by device_.
class SimulatedSmuTest : public LoggedTest {
protected:
  void SetUp() override;

  std::unique_ptr<m1k::Adalm1k> device_;
  SimulatedSmuDriver *smu_{nullptr};
};

/// AnalogDiscovery over a SimulatedScopeDriver, without settle waits
class SimulatedScopeTest : public LoggedTest {
protected:
  void SetUp() override;

  std::unique_ptr<discovery::AnalogDiscovery> device_;
  SimulatedScopeDriver *scope_{nullptr};
};

/// BenchTest with a private environment built on simulated drivers.
/// Override bench_config() to change the configuration before SetUp().
class SimulatedBenchTest : public fixtures::BenchTest {
protected:
  void SetUp() override;
  void TearDown() override;

  /// Supplies 3.3/-3.3 V, SMU voltages 2.5/1.0 V, currents 1.0/2.0 mA
  static BenchConfig default_config();
  virtual BenchConfig make_config() { return default_config(); }

  /// Driver behind the session Analog Discovery
  SimulatedScopeDriver *scope_driver() { return scope_; }
  /// Driver behind the last Adalm1k the environment built
  SimulatedSmuDriver *smu_driver() { return smu_; }

  std::unique_ptr<fixtures::BenchEnvironment> env_;

private:
  SimulatedScopeDriver *scope_{nullptr};
  SimulatedSmuDriver *smu_{nullptr};
};

} // namespace test
} // namespace analogbench
