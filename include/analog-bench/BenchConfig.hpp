#pragma once
#include "analog-bench/export.h"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/common.h>
#include <string>

namespace YAML {
class Node;
}

namespace analogbench {

/// Environment variable naming the bench configuration file
constexpr const char *kBenchConfigEnv = "ANALOG_BENCH_CONFIG";
/// Command line flag naming the bench configuration file
constexpr const char *kBenchConfigFlag = "--bench-config=";
/// File looked up in the working directory when nothing else is given
constexpr const char *kDefaultBenchConfigFile = "analog_bench.yaml";

struct SuppliesConfig {
  std::optional<double> positive_voltage; // [0, 5] V
  std::optional<double> negative_voltage; // [-5, 0] V
};

struct AnalogDiscoveryConfig {
  int config_number{0}; // WaveForms device configuration index
  SuppliesConfig supplies;
};

struct Adalm1kConfig {
  std::size_t device_index{0};
  std::optional<double> ch_a_voltage; // V
  std::optional<double> ch_b_voltage; // V
  std::optional<double> ch_a_current; // mA
  std::optional<double> ch_b_current; // mA
};

struct LogConfig {
  std::string file{"analog_bench.log"};
  spdlog::level::level_enum level{spdlog::level::debug};
};

/// Bench configuration shared by every fixture of a test program
struct ANALOG_BENCH_API BenchConfig {
  AnalogDiscoveryConfig analog_discovery;
  Adalm1kConfig adalm1k;
  LogConfig log;

  /// Path the configuration was loaded from, empty for defaults
  std::string source;

  nlohmann::json to_json() const;

  /// Parse and validate, throwing ConfigError on bad values
  static BenchConfig from_json(const nlohmann::json &j);

  /// Load a YAML (or JSON) file, throwing ConfigError if it is unreadable
  static BenchConfig load(const std::string &path);

  /// Resolve the file from --bench-config=, ANALOG_BENCH_CONFIG or
  /// analog_bench.yaml; defaults when none of them is present
  static BenchConfig resolve(int argc, char **argv);
};

/// Convert a parsed YAML tree into JSON
ANALOG_BENCH_API nlohmann::json yaml_to_json(const YAML::Node &node);

/// Path given by the --bench-config= flag or the environment, if any
ANALOG_BENCH_API std::optional<std::string> find_bench_config(int argc,
                                                              char **argv);

/// Value of an optional setting, or ConfigError naming the missing key
ANALOG_BENCH_API double require_setting(const std::optional<double> &value,
                                        const std::string &key);

} // namespace analogbench
