#pragma once
#include "analog-bench/export.h"

#include <array>
#include <string>

namespace analogbench {
namespace m1k {

enum class SmuChannel : unsigned { A = 0, B = 1 };

constexpr std::array<SmuChannel, 2> kSmuChannels{SmuChannel::A,
                                                 SmuChannel::B};

/// Channel source/measure modes, numbered as libsmu numbers them
enum class SmuMode : unsigned {
  HiZ = 0,
  SVMI = 1, // source voltage, measure current
  SIMV = 2, // source current, measure voltage
  HiZSplit = 3,
  SVMISplit = 4,
  SIMVSplit = 5,
};

/// One channel's reading at one time step
struct Sample {
  float voltage{0.0f};
  float current{0.0f};
};

/// Both channels' readings at one time step
struct Frame {
  Sample a;
  Sample b;

  const Sample &operator[](SmuChannel ch) const {
    return ch == SmuChannel::A ? a : b;
  }
};

/// Output buffer shapes the SDK generates
enum class SignalShape {
  Constant,
  Square,
  Sawtooth,
  Stairstep,
  Sine,
  Triangle,
};

/// Parameters of a generated output buffer.
///
/// mid_point is the level the wave oscillates around (the level itself for
/// Constant) and peak its maximum. period is the number of samples of one
/// cycle and phase the sample the wave starts at. duty is the fraction of
/// the period a square wave spends at peak.
struct SignalParameters {
  SignalShape shape{SignalShape::Constant};
  double mid_point{0.0};
  double peak{0.0};
  double period{1.0};
  double phase{0.0};
  double duty{0.5};
};

/// Range of the signal a channel sources in its current mode
struct SignalInfo {
  std::string label;
  double min{0.0};
  double max{0.0};
  double resolution{0.0};
};

// Output limits of an ADALM1000 channel
constexpr double kMinVoltage = 0.0;
constexpr double kMaxVoltage = 5.0;
constexpr double kMinCurrent = -0.2; // A
constexpr double kMaxCurrent = 0.2;  // A

ANALOG_BENCH_API const char *to_string(SmuChannel ch);
ANALOG_BENCH_API const char *to_string(SmuMode mode);
ANALOG_BENCH_API const char *to_string(SignalShape shape);

/// "A"/"B" (case-insensitive), InvalidParameterError otherwise
ANALOG_BENCH_API SmuChannel parse_smu_channel(const std::string &name);
ANALOG_BENCH_API SmuChannel smu_channel_from_index(int index);
ANALOG_BENCH_API SmuMode parse_smu_mode(const std::string &name);
ANALOG_BENCH_API SmuMode smu_mode_from_index(int index);

ANALOG_BENCH_API bool sources_voltage(SmuMode mode);
ANALOG_BENCH_API bool sources_current(SmuMode mode);

} // namespace m1k
} // namespace analogbench
