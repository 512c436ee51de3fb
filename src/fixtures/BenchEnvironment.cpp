#include "analog-bench/fixtures/BenchEnvironment.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

namespace analogbench {
namespace fixtures {

namespace {
BenchEnvironment *current_env = nullptr;
}

BenchEnvironment::BenchEnvironment(BenchConfig config,
                                   SmuDriverFactory smu_factory,
                                   ScopeDriverFactory scope_factory)
    : config_(std::move(config)), smu_factory_(std::move(smu_factory)),
      scope_factory_(std::move(scope_factory)) {}

BenchEnvironment::~BenchEnvironment() {
  if (current_env == this) {
    current_env = nullptr;
  }
}

BenchEnvironment *
BenchEnvironment::install(std::unique_ptr<BenchEnvironment> env) {
  auto *raw = env.release();
  ::testing::AddGlobalTestEnvironment(raw);
  current_env = raw;
  return raw;
}

BenchEnvironment &BenchEnvironment::current() {
  if (!current_env) {
    throw BenchError("no bench environment installed, link analog_bench_main "
                     "or install a BenchEnvironment");
  }
  return *current_env;
}

void BenchEnvironment::set_current(BenchEnvironment *env) {
  current_env = env;
}

void BenchEnvironment::TearDown() {
  if (!analog_discovery_ || !analog_discovery_->acquired()) {
    return;
  }
  try {
    analog_discovery_->close();
  } catch (const std::exception &ex) {
    LOG_ERROR("FIXTURE", "TEARDOWN", "Failed to close the Analog Discovery: {}",
              ex.what());
  }
}

discovery::AnalogDiscovery &BenchEnvironment::analog_discovery() {
  if (!analog_discovery_) {
    analog_discovery_ = make_analog_discovery();
  }
  if (!analog_discovery_->acquired()) {
    analog_discovery_->open(config_.analog_discovery.config_number);
  }
  return *analog_discovery_;
}

std::unique_ptr<m1k::Adalm1k> BenchEnvironment::make_adalm1k() const {
  if (!smu_factory_) {
    throw BenchError("no ADALM1K driver factory installed");
  }
  return std::make_unique<m1k::Adalm1k>(smu_factory_());
}

std::unique_ptr<discovery::AnalogDiscovery>
BenchEnvironment::make_analog_discovery() const {
  if (!scope_factory_) {
    throw BenchError("no Analog Discovery driver factory installed");
  }
  return std::make_unique<discovery::AnalogDiscovery>(scope_factory_(),
                                                      scope_settle_);
}

} // namespace fixtures
} // namespace analogbench
