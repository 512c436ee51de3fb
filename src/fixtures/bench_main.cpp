#include "analog-bench/BenchConfig.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/dwf/DwfScopeDriver.hpp"
#include "analog-bench/errors.hpp"
#include "analog-bench/fixtures/BenchEnvironment.hpp"
#include "analog-bench/m1k/LibsmuDriver.hpp"

#include <gtest/gtest.h>
#include <iostream>
#include <memory>

// Test program entry point for hardware suites: loads the bench
// configuration and wires the vendor drivers into the fixtures.
int main(int argc, char **argv) {
  using namespace analogbench;

  ::testing::InitGoogleTest(&argc, argv);

  BenchConfig config;
  try {
    config = BenchConfig::resolve(argc, argv);
  } catch (const ConfigError &ex) {
    std::cerr << "Invalid bench configuration: " << ex.what() << "\n";
    return 2;
  }

  BenchLogger::instance().init(config.log.file, config.log.level);
  if (!config.source.empty()) {
    LOG_INFO("FIXTURE", "CONFIG", "Loaded bench configuration from {}",
             config.source);
  }

  fixtures::BenchEnvironment::install(
      std::make_unique<fixtures::BenchEnvironment>(
          std::move(config),
          [] { return std::make_unique<m1k::LibsmuDriver>(); },
          [] { return std::make_unique<dwf::DwfScopeDriver>(); }));

  return RUN_ALL_TESTS();
}
