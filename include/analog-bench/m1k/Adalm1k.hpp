#pragma once
#include "analog-bench/export.h"
#include "analog-bench/m1k/SmuDriver.hpp"
#include "analog-bench/m1k/SmuTypes.hpp"
#include "analog-bench/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace analogbench {
namespace m1k {

/// ADALM1000 source-measure unit.
///
/// Owns the driver session. The wrapper goes Unacquired -> Acquired on
/// open() and Acquired -> Released on close(); a released wrapper cannot be
/// reopened and every call on it throws NotAcquiredError.
class ANALOG_BENCH_API Adalm1k {
public:
  explicit Adalm1k(std::unique_ptr<SmuDriver> driver);

  /// Closes the device if still acquired. Errors are logged.
  ~Adalm1k();

  Adalm1k(const Adalm1k &) = delete;
  Adalm1k &operator=(const Adalm1k &) = delete;

  const std::string &name() const { return name_; }
  DeviceState state() const { return state_; }
  bool acquired() const { return state_ == DeviceState::Acquired; }

  /// Attach the device_index-th device found by a bus scan
  void open(std::size_t device_index = 0);
  void close();

  std::string serial() const;

  SmuMode channel_mode(SmuChannel ch) const;
  void set_channel_mode(SmuChannel ch, SmuMode mode);

  // Outputs. Levels are in V for voltage modes and A for current modes.
  void set_constant_output(SmuChannel ch, double value);
  void set_square_output(SmuChannel ch, double mid_point, double peak,
                         double period, double phase, double duty,
                         bool cyclic = true);
  void set_sawtooth_output(SmuChannel ch, double mid_point, double peak,
                           double period, double phase, bool cyclic = true);
  void set_stairstep_output(SmuChannel ch, double mid_point, double peak,
                            double period, double phase, bool cyclic = true);
  void set_sine_output(SmuChannel ch, double mid_point, double peak,
                       double period, double phase, bool cyclic = true);
  void set_triangle_output(SmuChannel ch, double mid_point, double peak,
                           double period, double phase, bool cyclic = true);
  void write(SmuChannel ch, const std::vector<float> &data,
             bool cyclic = false);

  /// Label and range of the quantity ch sources in its current mode
  SignalInfo signal_info(SmuChannel ch) const;

  /// True if the most recent read saw an overcurrent condition
  bool overcurrent() const;

  void flush_channel_write(SmuChannel ch);
  void flush();

  /// Start without waiting; samples == 0 runs continuously
  void start_capture(std::size_t samples = 0);
  /// Run samples and block until they are captured
  void run_capture(std::size_t samples);
  void cancel_capture();
  /// Wait for the capture to complete, then turn the outputs off
  void end_capture();

  /// timeout_ms 0 returns immediately, -1 blocks until samples arrived
  std::vector<Frame> read_all(std::size_t samples, int timeout_ms = 0);
  std::vector<Sample> read(SmuChannel ch, std::size_t samples,
                           int timeout_ms = 0);

  /// Non-continuous acquisition of samples, blocking
  std::vector<Frame> get_samples_all(std::size_t samples);
  std::vector<Sample> get_samples(SmuChannel ch, std::size_t samples);

  bool capture_continuous() const;
  bool capture_cancelled() const;
  unsigned sample_rate() const;
  void set_sample_rate(unsigned sample_rate);
  std::size_t queue_size() const;

  /// Bit i lights LED i (RGB, or DS3/DS2/DS1 on rev F)
  void set_leds(unsigned mask);

private:
  void require(const char *operation) const;
  void check_output(SmuChannel ch, const std::vector<float> &data) const;
  void output_signal(SmuChannel ch, const SignalParameters &signal,
                     bool cyclic);
  void check_capture(const char *operation) const;

  std::string name_{"ADALM1K"};
  std::unique_ptr<SmuDriver> driver_;
  DeviceState state_{DeviceState::Unacquired};
  bool capture_started_{false};
};

} // namespace m1k
} // namespace analogbench
