#include "analog-bench/BenchConfig.hpp"
#include "analog-bench/errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <initializer_list>
#include <string_view>
#include <yaml-cpp/yaml.h>

namespace analogbench {

nlohmann::json yaml_to_json(const YAML::Node &node) {
  if (node.IsNull()) {
    return nullptr;
  } else if (node.IsScalar()) {
    try {
      return node.as<int64_t>();
    } catch (const YAML::BadConversion &) {
      try {
        return node.as<double>();
      } catch (const YAML::BadConversion &) {
        try {
          return node.as<bool>();
        } catch (const YAML::BadConversion &) {
          return node.as<std::string>();
        }
      }
    }
  } else if (node.IsSequence()) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  } else if (node.IsMap()) {
    nlohmann::json obj = nlohmann::json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  return nullptr;
}

namespace {

const nlohmann::json &section(const nlohmann::json &parent,
                              const std::string &key,
                              const std::string &path) {
  static const nlohmann::json empty = nlohmann::json::object();
  if (!parent.contains(key) || parent.at(key).is_null()) {
    return empty;
  }
  const auto &value = parent.at(key);
  if (!value.is_object()) {
    throw ConfigError(fmt::format("{}: expected a mapping", path));
  }
  return value;
}

void check_keys(const nlohmann::json &obj, const std::string &path,
                std::initializer_list<std::string_view> allowed) {
  for (const auto &item : obj.items()) {
    bool known = false;
    for (auto name : allowed) {
      if (item.key() == name) {
        known = true;
        break;
      }
    }
    if (!known) {
      throw ConfigError(
          fmt::format("{}: unknown key '{}'",
                      path.empty() ? std::string("<root>") : path,
                      item.key()));
    }
  }
}

std::optional<double> optional_number(const nlohmann::json &obj,
                                      const std::string &key,
                                      const std::string &path, double min,
                                      double max) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    return std::nullopt;
  }
  const auto &value = obj.at(key);
  if (!value.is_number()) {
    throw ConfigError(fmt::format("{}: expected a number", path));
  }
  double number = value.get<double>();
  if (number < min || number > max) {
    throw ConfigError(fmt::format("{}: {} is outside [{}, {}]", path, number,
                                  min, max));
  }
  return number;
}

int64_t integer(const nlohmann::json &obj, const std::string &key,
                const std::string &path, int64_t fallback) {
  if (!obj.contains(key) || obj.at(key).is_null()) {
    return fallback;
  }
  const auto &value = obj.at(key);
  if (!value.is_number_integer()) {
    throw ConfigError(fmt::format("{}: expected an integer", path));
  }
  auto number = value.get<int64_t>();
  if (number < 0) {
    throw ConfigError(fmt::format("{}: must not be negative", path));
  }
  return number;
}

spdlog::level::level_enum parse_level(const nlohmann::json &value,
                                      const std::string &path) {
  if (!value.is_string()) {
    throw ConfigError(fmt::format("{}: expected a level name", path));
  }
  auto name = value.get<std::string>();
  auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    throw ConfigError(fmt::format("{}: unknown log level '{}'", path, name));
  }
  return level;
}

} // namespace

nlohmann::json BenchConfig::to_json() const {
  nlohmann::json j;

  j["analog_discovery"]["config_number"] = analog_discovery.config_number;
  if (analog_discovery.supplies.positive_voltage) {
    j["analog_discovery"]["supplies"]["positive_voltage"] =
        *analog_discovery.supplies.positive_voltage;
  }
  if (analog_discovery.supplies.negative_voltage) {
    j["analog_discovery"]["supplies"]["negative_voltage"] =
        *analog_discovery.supplies.negative_voltage;
  }

  j["adalm1k"]["device_index"] = adalm1k.device_index;
  if (adalm1k.ch_a_voltage) {
    j["adalm1k"]["ch_a_voltage"] = *adalm1k.ch_a_voltage;
  }
  if (adalm1k.ch_b_voltage) {
    j["adalm1k"]["ch_b_voltage"] = *adalm1k.ch_b_voltage;
  }
  if (adalm1k.ch_a_current) {
    j["adalm1k"]["ch_a_current"] = *adalm1k.ch_a_current;
  }
  if (adalm1k.ch_b_current) {
    j["adalm1k"]["ch_b_current"] = *adalm1k.ch_b_current;
  }

  j["log"]["file"] = log.file;
  auto level = spdlog::level::to_string_view(log.level);
  j["log"]["level"] = std::string(level.data(), level.size());

  return j;
}

BenchConfig BenchConfig::from_json(const nlohmann::json &j) {
  BenchConfig config;

  if (j.is_null()) {
    return config;
  }
  if (!j.is_object()) {
    throw ConfigError("bench configuration: expected a mapping");
  }
  check_keys(j, "", {"analog_discovery", "adalm1k", "log"});

  const auto &ad = section(j, "analog_discovery", "analog_discovery");
  check_keys(ad, "analog_discovery", {"config_number", "supplies"});
  config.analog_discovery.config_number = static_cast<int>(
      integer(ad, "config_number", "analog_discovery.config_number", 0));

  const auto &supplies =
      section(ad, "supplies", "analog_discovery.supplies");
  check_keys(supplies, "analog_discovery.supplies",
             {"positive_voltage", "negative_voltage"});
  config.analog_discovery.supplies.positive_voltage =
      optional_number(supplies, "positive_voltage",
                      "analog_discovery.supplies.positive_voltage", 0.0, 5.0);
  config.analog_discovery.supplies.negative_voltage =
      optional_number(supplies, "negative_voltage",
                      "analog_discovery.supplies.negative_voltage", -5.0, 0.0);

  const auto &m1k = section(j, "adalm1k", "adalm1k");
  check_keys(m1k, "adalm1k",
             {"device_index", "ch_a_voltage", "ch_b_voltage", "ch_a_current",
              "ch_b_current"});
  config.adalm1k.device_index = static_cast<std::size_t>(
      integer(m1k, "device_index", "adalm1k.device_index", 0));
  config.adalm1k.ch_a_voltage = optional_number(
      m1k, "ch_a_voltage", "adalm1k.ch_a_voltage", 0.0, 5.0);
  config.adalm1k.ch_b_voltage = optional_number(
      m1k, "ch_b_voltage", "adalm1k.ch_b_voltage", 0.0, 5.0);
  config.adalm1k.ch_a_current = optional_number(
      m1k, "ch_a_current", "adalm1k.ch_a_current", -200.0, 200.0);
  config.adalm1k.ch_b_current = optional_number(
      m1k, "ch_b_current", "adalm1k.ch_b_current", -200.0, 200.0);

  const auto &log = section(j, "log", "log");
  check_keys(log, "log", {"file", "level"});
  if (log.contains("file")) {
    if (!log["file"].is_string() || log["file"].get<std::string>().empty()) {
      throw ConfigError("log.file: expected a file name");
    }
    config.log.file = log["file"].get<std::string>();
  }
  if (log.contains("level")) {
    config.log.level = parse_level(log["level"], "log.level");
  }

  return config;
}

BenchConfig BenchConfig::load(const std::string &path) {
  if (!std::filesystem::exists(path)) {
    throw ConfigError(fmt::format("bench configuration not found: {}", path));
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception &ex) {
    throw ConfigError(
        fmt::format("failed to parse bench configuration {}: {}", path,
                    ex.what()));
  }

  auto config = from_json(yaml_to_json(root));
  config.source = path;
  return config;
}

BenchConfig BenchConfig::resolve(int argc, char **argv) {
  if (auto path = find_bench_config(argc, argv)) {
    return load(*path);
  }
  if (std::filesystem::exists(kDefaultBenchConfigFile)) {
    return load(kDefaultBenchConfigFile);
  }
  return BenchConfig{};
}

std::optional<std::string> find_bench_config(int argc, char **argv) {
  const std::string_view flag(kBenchConfigFlag);
  for (int i = 1; i < argc; ++i) {
    std::string_view arg(argv[i]);
    if (arg.substr(0, flag.size()) == flag) {
      auto path = std::string(arg.substr(flag.size()));
      if (path.empty()) {
        throw ConfigError("--bench-config= requires a path");
      }
      return path;
    }
  }

  if (const char *env = std::getenv(kBenchConfigEnv)) {
    if (*env != '\0') {
      return std::string(env);
    }
  }
  return std::nullopt;
}

double require_setting(const std::optional<double> &value,
                       const std::string &key) {
  if (!value) {
    throw ConfigError(
        fmt::format("bench configuration is missing '{}'", key));
  }
  return *value;
}

} // namespace analogbench
