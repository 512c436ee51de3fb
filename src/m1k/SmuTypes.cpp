#include "analog-bench/m1k/SmuTypes.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <cctype>
#include <fmt/format.h>

namespace analogbench {
namespace m1k {

namespace {

std::string upper(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return s;
}

constexpr std::array<SmuMode, 6> kModes{
    SmuMode::HiZ,      SmuMode::SVMI,      SmuMode::SIMV,
    SmuMode::HiZSplit, SmuMode::SVMISplit, SmuMode::SIMVSplit};

} // namespace

const char *to_string(SmuChannel ch) {
  return ch == SmuChannel::A ? "A" : "B";
}

const char *to_string(SmuMode mode) {
  switch (mode) {
  case SmuMode::HiZ:
    return "HiZ";
  case SmuMode::SVMI:
    return "SVMI";
  case SmuMode::SIMV:
    return "SIMV";
  case SmuMode::HiZSplit:
    return "HiZSplit";
  case SmuMode::SVMISplit:
    return "SVMISplit";
  case SmuMode::SIMVSplit:
    return "SIMVSplit";
  }
  return "unknown";
}

const char *to_string(SignalShape shape) {
  switch (shape) {
  case SignalShape::Constant:
    return "constant";
  case SignalShape::Square:
    return "square";
  case SignalShape::Sawtooth:
    return "sawtooth";
  case SignalShape::Stairstep:
    return "stairstep";
  case SignalShape::Sine:
    return "sine";
  case SignalShape::Triangle:
    return "triangle";
  }
  return "unknown";
}

SmuChannel parse_smu_channel(const std::string &name) {
  auto u = upper(name);
  if (u == "A") {
    return SmuChannel::A;
  }
  if (u == "B") {
    return SmuChannel::B;
  }
  throw InvalidParameterError(
      fmt::format("unknown SMU channel '{}' (expected A or B)", name));
}

SmuChannel smu_channel_from_index(int index) {
  if (index == 0 || index == 1) {
    return static_cast<SmuChannel>(index);
  }
  throw InvalidParameterError(
      fmt::format("SMU channel index {} out of range [0, 1]", index));
}

SmuMode parse_smu_mode(const std::string &name) {
  auto u = upper(name);
  for (auto mode : kModes) {
    if (upper(to_string(mode)) == u) {
      return mode;
    }
  }
  // libsmu spelling
  if (u == "HI_Z") {
    return SmuMode::HiZ;
  }
  if (u == "HI_Z_SPLIT") {
    return SmuMode::HiZSplit;
  }
  throw InvalidParameterError(fmt::format("unknown SMU mode '{}'", name));
}

SmuMode smu_mode_from_index(int index) {
  if (index >= 0 && index < static_cast<int>(kModes.size())) {
    return kModes[static_cast<std::size_t>(index)];
  }
  throw InvalidParameterError(
      fmt::format("SMU mode index {} out of range [0, 5]", index));
}

bool sources_voltage(SmuMode mode) {
  return mode == SmuMode::SVMI || mode == SmuMode::SVMISplit;
}

bool sources_current(SmuMode mode) {
  return mode == SmuMode::SIMV || mode == SmuMode::SIMVSplit;
}

} // namespace m1k
} // namespace analogbench
