#include "analog-bench/discovery/ScopeTypes.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fmt/format.h>

namespace analogbench {
namespace discovery {

namespace {

std::string lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

constexpr std::array<OutputSignal, 12> kSignals{
    OutputSignal::DC,        OutputSignal::Sine,     OutputSignal::Square,
    OutputSignal::Triangle,  OutputSignal::RampUp,   OutputSignal::RampDown,
    OutputSignal::Noise,     OutputSignal::Pulse,    OutputSignal::Trapezium,
    OutputSignal::SinePower, OutputSignal::Custom,   OutputSignal::Play};

} // namespace

const char *to_string(ScopeChannel ch) {
  switch (ch) {
  case ScopeChannel::Channel1:
    return "Ch1";
  case ScopeChannel::Channel2:
    return "Ch2";
  case ScopeChannel::Channel3:
    return "Ch3";
  case ScopeChannel::Channel4:
    return "Ch4";
  }
  return "Ch?";
}

const char *to_string(WaveGenChannel ch) {
  return ch == WaveGenChannel::WaveGen1 ? "W1" : "W2";
}

std::string to_string(const AnalogChannel &ch) {
  if (auto *in = std::get_if<ScopeChannel>(&ch)) {
    return to_string(*in);
  }
  return to_string(std::get<WaveGenChannel>(ch));
}

std::string to_string(DigitalPin pin) {
  return fmt::format("DIO{}", static_cast<int>(pin));
}

const char *to_string(OutputSignal signal) {
  switch (signal) {
  case OutputSignal::DC:
    return "DC";
  case OutputSignal::Sine:
    return "Sine";
  case OutputSignal::Square:
    return "Square";
  case OutputSignal::Triangle:
    return "Triangle";
  case OutputSignal::RampUp:
    return "RampUp";
  case OutputSignal::RampDown:
    return "RampDown";
  case OutputSignal::Noise:
    return "Noise";
  case OutputSignal::Pulse:
    return "Pulse";
  case OutputSignal::Trapezium:
    return "Trapezium";
  case OutputSignal::SinePower:
    return "SinePower";
  case OutputSignal::Custom:
    return "Custom";
  case OutputSignal::Play:
    return "Play";
  }
  return "unknown";
}

const char *to_string(AcquisitionMode mode) {
  switch (mode) {
  case AcquisitionMode::Single:
    return "Single";
  case AcquisitionMode::ScanShift:
    return "ScanShift";
  case AcquisitionMode::ScanScreen:
    return "ScanScreen";
  case AcquisitionMode::Record:
    return "Record";
  case AcquisitionMode::Overs:
    return "Overs";
  case AcquisitionMode::Single1:
    return "Single1";
  }
  return "unknown";
}

const char *to_string(AnalogFilter filter) {
  switch (filter) {
  case AnalogFilter::Decimate:
    return "Decimate";
  case AnalogFilter::Average:
    return "Average";
  case AnalogFilter::MinMax:
    return "MinMax";
  }
  return "unknown";
}

const char *to_string(TriggerSource source) {
  switch (source) {
  case TriggerSource::None:
    return "None";
  case TriggerSource::PC:
    return "PC";
  case TriggerSource::DetectorAnalogIn:
    return "DetectorAnalogIn";
  case TriggerSource::DetectorDigitalIn:
    return "DetectorDigitalIn";
  case TriggerSource::AnalogIn:
    return "AnalogIn";
  case TriggerSource::DigitalIn:
    return "DigitalIn";
  case TriggerSource::DigitalOut:
    return "DigitalOut";
  case TriggerSource::AnalogOut1:
    return "AnalogOut1";
  case TriggerSource::AnalogOut2:
    return "AnalogOut2";
  case TriggerSource::AnalogOut3:
    return "AnalogOut3";
  case TriggerSource::AnalogOut4:
    return "AnalogOut4";
  case TriggerSource::External1:
    return "External1";
  case TriggerSource::External2:
    return "External2";
  case TriggerSource::External3:
    return "External3";
  case TriggerSource::External4:
    return "External4";
  case TriggerSource::High:
    return "High";
  case TriggerSource::Low:
    return "Low";
  case TriggerSource::Clock:
    return "Clock";
  }
  return "unknown";
}

const char *to_string(TriggerType type) {
  switch (type) {
  case TriggerType::Edge:
    return "Edge";
  case TriggerType::Pulse:
    return "Pulse";
  case TriggerType::Transition:
    return "Transition";
  case TriggerType::Window:
    return "Window";
  }
  return "unknown";
}

const char *to_string(TriggerSlope slope) {
  switch (slope) {
  case TriggerSlope::Rise:
    return "Rise";
  case TriggerSlope::Fall:
    return "Fall";
  case TriggerSlope::Either:
    return "Either";
  }
  return "unknown";
}

const char *to_string(Coupling coupling) {
  return coupling == Coupling::DC ? "DC" : "AC";
}

const char *to_string(OutputIdle idle) {
  switch (idle) {
  case OutputIdle::Disable:
    return "Disable";
  case OutputIdle::Offset:
    return "Offset";
  case OutputIdle::Initial:
    return "Initial";
  }
  return "unknown";
}

const char *to_string(InstrumentState state) {
  switch (state) {
  case InstrumentState::Ready:
    return "Ready";
  case InstrumentState::Config:
    return "Config";
  case InstrumentState::Prefill:
    return "Prefill";
  case InstrumentState::Armed:
    return "Armed";
  case InstrumentState::Wait:
    return "Wait";
  case InstrumentState::Running:
    return "Running";
  case InstrumentState::Done:
    return "Done";
  }
  return "unknown";
}

const char *to_string(SpiLine line) {
  switch (line) {
  case SpiLine::Siso:
    return "SISO";
  case SpiLine::MosiMiso:
    return "MOSI/MISO";
  case SpiLine::Dual:
    return "Dual";
  case SpiLine::Quad:
    return "Quad";
  }
  return "unknown";
}

ScopeChannel scope_channel_from_number(int number) {
  if (number < 1 || number > 4) {
    throw InvalidParameterError(
        fmt::format("scope channel {} out of range [1, 4]", number));
  }
  return static_cast<ScopeChannel>(number - 1);
}

WaveGenChannel wavegen_channel_from_number(int number) {
  if (number < 1 || number > 2) {
    throw InvalidParameterError(
        fmt::format("wavegen channel {} out of range [1, 2]", number));
  }
  return static_cast<WaveGenChannel>(number - 1);
}

DigitalPin digital_pin_from_index(int index) {
  if (index < 0 || index > 15) {
    throw InvalidParameterError(
        fmt::format("digital pin {} out of range [0, 15]", index));
  }
  return static_cast<DigitalPin>(index);
}

AnalogChannel parse_analog_channel(const std::string &name) {
  auto l = lower(name);
  if (l.size() == 3 && l.compare(0, 2, "ch") == 0 && l[2] >= '1' &&
      l[2] <= '4') {
    return scope_channel_from_number(l[2] - '0');
  }
  if (l.size() == 2 && l[0] == 'w' && (l[1] == '1' || l[1] == '2')) {
    return wavegen_channel_from_number(l[1] - '0');
  }
  throw InvalidParameterError(fmt::format(
      "unknown analog channel '{}' (expected Ch1..Ch4, W1 or W2)", name));
}

OutputSignal parse_output_signal(const std::string &name) {
  auto l = lower(name);
  for (auto signal : kSignals) {
    if (lower(to_string(signal)) == l) {
      return signal;
    }
  }
  throw InvalidParameterError(
      fmt::format("unknown output signal '{}'", name));
}

} // namespace discovery
} // namespace analogbench
