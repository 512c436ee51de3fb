#pragma once
#include "analog-bench/export.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace analogbench {
namespace discovery {

/// Oscilloscope (analog in) channel. Values are SDK channel indices.
enum class ScopeChannel : int { Channel1 = 0, Channel2, Channel3, Channel4 };

/// Waveform generator (analog out) channel
enum class WaveGenChannel : int { WaveGen1 = 0, WaveGen2 };

using AnalogChannel = std::variant<ScopeChannel, WaveGenChannel>;
using ChannelList = std::vector<AnalogChannel>;

enum class DigitalPin : int {
  DIO0 = 0,
  DIO1,
  DIO2,
  DIO3,
  DIO4,
  DIO5,
  DIO6,
  DIO7,
  DIO8,
  DIO9,
  DIO10,
  DIO11,
  DIO12,
  DIO13,
  DIO14,
  DIO15,
};

using PinList = std::vector<DigitalPin>;

enum class OutputSignal {
  DC,
  Sine,
  Square,
  Triangle,
  RampUp,
  RampDown,
  Noise,
  Pulse,
  Trapezium,
  SinePower,
  Custom,
  Play,
};

enum class AcquisitionMode { Single, ScanShift, ScanScreen, Record, Overs, Single1 };

enum class AnalogFilter { Decimate, Average, MinMax };

enum class TriggerSource {
  None,
  PC,
  DetectorAnalogIn,
  DetectorDigitalIn,
  AnalogIn,
  DigitalIn,
  DigitalOut,
  AnalogOut1,
  AnalogOut2,
  AnalogOut3,
  AnalogOut4,
  External1,
  External2,
  External3,
  External4,
  High,
  Low,
  Clock,
};

enum class TriggerType { Edge, Pulse, Transition, Window };

enum class TriggerSlope { Rise, Fall, Either };

enum class Coupling { DC, AC };

/// Output level of a wavegen channel while not running
enum class OutputIdle { Disable, Offset, Initial };

/// Scope and wavegen instrument state. The SDK reports Triggered and
/// Running with the same code; both map to Running.
enum class InstrumentState { Ready, Config, Prefill, Armed, Wait, Running, Done };

enum class AutoConfigure { Disabled = 0, Enabled = 1, Dynamic = 3 };

struct DeviceInfo {
  int index{0};
  std::string name;
  std::string serial;
  int id{0};
  std::string revision;
};

/// Analog in range capabilities
struct RangeInfo {
  double min{0.0};
  double max{0.0};
  int steps{0};
};

struct RecordStatus {
  int available{0};
  int lost{0};
  int corrupt{0};
};

/// Trigger time of the last acquisition as reported by the instrument
struct TriggerTimestamp {
  unsigned int seconds{0}; // UTC
  unsigned int tick{0};
  unsigned int ticks_per_second{0};
};

struct TriggerSettings {
  TriggerSource source{TriggerSource::None};
  double position{0.0};     // s
  TriggerType type{TriggerType::Edge};
  double level{0.0};        // V
  TriggerSlope condition{TriggerSlope::Rise};
  double hysteresis{0.0};   // V
  double auto_timeout{0.0}; // s, 0 disables auto trigger
};

/// Generator node settings of a wavegen channel
struct OutputWaveform {
  OutputSignal signal{OutputSignal::Sine};
  double frequency{1000.0}; // Hz
  double amplitude{1.0};    // V
  double offset{0.0};       // V
  double symmetry{50.0};    // %
  double phase{0.0};        // degrees
};

struct PlaySettings {
  OutputWaveform waveform;
  /// Samples normalized to [-1, 1] for Custom and Play signals
  std::vector<double> data;
  double run_duration{0.0};  // s, 0 plays forever
  int repeat_count{0};       // 0 repeats forever
  double wait_duration{0.0}; // s
  OutputIdle idle{OutputIdle::Initial};
  std::optional<TriggerSource> trigger;
  TriggerSlope trigger_slope{TriggerSlope::Rise};
};

struct RecordSettings {
  double sampling_frequency{0.0}; // Hz
  double record_length{0.0};      // s, 0 records until stopped
  double range{5.0};              // V
  double offset{0.0};             // V
  AnalogFilter filter{AnalogFilter::Average};
  /// Trigger on the first recorded channel
  std::optional<TriggerSettings> trigger;
};

struct AcquisitionSettings {
  double sampling_frequency{0.0};
  std::size_t samples_count{0};
  double range{5.0};
  double offset{0.0};
  AnalogFilter filter{AnalogFilter::Decimate};
  std::optional<TriggerSettings> trigger;
  /// Acquire one buffer without rearming
  bool single{false};
};

/// One triggered acquisition: a buffer per channel and the trigger time
struct Capture {
  std::vector<std::vector<double>> channels;
  std::string trigger_time;
};

/// Scan-shift screen of a slow signal
struct ScreenSettings {
  double sampling_frequency{0.0}; // Hz
  std::size_t samples_count{0};   // screen width, clamped to the buffer
  double range{5.0};
  double offset{0.0};
  AnalogFilter filter{AnalogFilter::Average};
};

/// Capabilities of one device configuration
struct DeviceConfigInfo {
  int index{0};
  int analog_in_channels{0};
  int analog_in_buffer_size{0};
  int analog_out_channels{0};
  int analog_out_buffer_size{0};
  int digital_in_channels{0};
  int digital_in_buffer_size{0};
  int digital_out_channels{0};
  int digital_out_buffer_size{0};
};

/// Bytes read from an I2C target. nak is 0 when every byte was
/// acknowledged, else the 1-based index of the byte that was not.
struct I2CReadResult {
  int nak{0};
  std::vector<uint8_t> data;
};

/// SPI data lines used by a transfer
enum class SpiLine : int { Siso = 0, MosiMiso = 1, Dual = 2, Quad = 3 };

enum class SpiBitOrder { LsbFirst = 0, MsbFirst = 1 };

/// Level a digital protocol line holds between transfers
enum class DigitalIdle { Init = 0, Low = 1, High = 2, HighZ = 3 };

struct SpiSettings {
  DigitalPin chip_select{DigitalPin::DIO0};
  DigitalPin clock{DigitalPin::DIO1};
  DigitalPin miso{DigitalPin::DIO2};
  DigitalPin mosi{DigitalPin::DIO3};
  double frequency{1e6}; // Hz
  /// 0: CPOL=0 CPHA=0, 1: CPOL=0 CPHA=1, 2: CPOL=1 CPHA=0, 3: CPOL=1 CPHA=1
  int mode{0};
  SpiBitOrder bit_order{SpiBitOrder::MsbFirst};
};

struct SupplyVoltages {
  double positive{0.0};
  double negative{0.0};
};

struct SupplyMonitor {
  double usb_voltage{0.0};
  double usb_current{0.0};
  double aux_voltage{0.0};
  double aux_current{0.0};
};

/// Waits that let outputs and offsets settle. Defaults follow the
/// WaveForms SDK sample programs.
struct SettleTimes {
  std::chrono::milliseconds output{2000};
  std::chrono::milliseconds record{2000};
  std::chrono::milliseconds acquisition{1000};
  std::chrono::milliseconds supplies{1000};
  std::chrono::milliseconds protocol{100}; // I2C and SPI (re)configuration

  static SettleTimes none() {
    return {std::chrono::milliseconds(0), std::chrono::milliseconds(0),
            std::chrono::milliseconds(0), std::chrono::milliseconds(0),
            std::chrono::milliseconds(0)};
  }
};

ANALOG_BENCH_API const char *to_string(ScopeChannel ch);
ANALOG_BENCH_API const char *to_string(WaveGenChannel ch);
ANALOG_BENCH_API std::string to_string(const AnalogChannel &ch);
ANALOG_BENCH_API std::string to_string(DigitalPin pin);
ANALOG_BENCH_API const char *to_string(OutputSignal signal);
ANALOG_BENCH_API const char *to_string(AcquisitionMode mode);
ANALOG_BENCH_API const char *to_string(AnalogFilter filter);
ANALOG_BENCH_API const char *to_string(TriggerSource source);
ANALOG_BENCH_API const char *to_string(TriggerType type);
ANALOG_BENCH_API const char *to_string(TriggerSlope slope);
ANALOG_BENCH_API const char *to_string(Coupling coupling);
ANALOG_BENCH_API const char *to_string(OutputIdle idle);
ANALOG_BENCH_API const char *to_string(InstrumentState state);
ANALOG_BENCH_API const char *to_string(SpiLine line);

/// 1-based channel numbers as printed on the device
ANALOG_BENCH_API ScopeChannel scope_channel_from_number(int number);
ANALOG_BENCH_API WaveGenChannel wavegen_channel_from_number(int number);
ANALOG_BENCH_API DigitalPin digital_pin_from_index(int index);

/// "Ch1".."Ch4" or "W1", "W2" (case-insensitive)
ANALOG_BENCH_API AnalogChannel parse_analog_channel(const std::string &name);
ANALOG_BENCH_API OutputSignal parse_output_signal(const std::string &name);

} // namespace discovery
} // namespace analogbench
