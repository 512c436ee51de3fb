#pragma once
#include "analog-bench/BenchConfig.hpp"
#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/discovery/ScopeDriver.hpp"
#include "analog-bench/export.h"
#include "analog-bench/m1k/Adalm1k.hpp"
#include "analog-bench/m1k/SmuDriver.hpp"

#include <chrono>
#include <functional>
#include <gtest/gtest.h>
#include <memory>

namespace analogbench {
namespace fixtures {

using SmuDriverFactory = std::function<std::unique_ptr<m1k::SmuDriver>()>;
using ScopeDriverFactory =
    std::function<std::unique_ptr<discovery::ScopeDriver>()>;

/// Program-wide bench state: configuration, driver factories and the
/// session-scoped Analog Discovery shared by every test.
class ANALOG_BENCH_API BenchEnvironment : public ::testing::Environment {
public:
  BenchEnvironment(BenchConfig config, SmuDriverFactory smu_factory,
                   ScopeDriverFactory scope_factory);
  ~BenchEnvironment() override;

  /// Register with GoogleTest (which takes ownership) and make current
  static BenchEnvironment *install(std::unique_ptr<BenchEnvironment> env);

  /// Environment used by BenchTest; throws BenchError if none is set
  static BenchEnvironment &current();
  static void set_current(BenchEnvironment *env);

  /// Closes the session Analog Discovery
  void TearDown() override;

  const BenchConfig &config() const { return config_; }

  const discovery::SettleTimes &scope_settle_times() const {
    return scope_settle_;
  }
  void set_scope_settle_times(const discovery::SettleTimes &settle) {
    scope_settle_ = settle;
  }

  /// Wait between writing SMU outputs and starting a capture
  std::chrono::milliseconds smu_settle_time() const { return smu_settle_; }
  void set_smu_settle_time(std::chrono::milliseconds settle) {
    smu_settle_ = settle;
  }

  /// Opened on first use with the configured config_number
  discovery::AnalogDiscovery &analog_discovery();

  std::unique_ptr<m1k::Adalm1k> make_adalm1k() const;
  std::unique_ptr<discovery::AnalogDiscovery> make_analog_discovery() const;

private:
  BenchConfig config_;
  SmuDriverFactory smu_factory_;
  ScopeDriverFactory scope_factory_;
  discovery::SettleTimes scope_settle_;
  std::chrono::milliseconds smu_settle_{1000};
  std::unique_ptr<discovery::AnalogDiscovery> analog_discovery_;
};

} // namespace fixtures
} // namespace analogbench
