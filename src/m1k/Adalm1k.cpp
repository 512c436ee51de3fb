#include "analog-bench/m1k/Adalm1k.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>

namespace analogbench {
namespace m1k {

Adalm1k::Adalm1k(std::unique_ptr<SmuDriver> driver)
    : driver_(std::move(driver)) {
  if (!driver_) {
    throw InvalidParameterError("ADALM1K requires a driver");
  }
}

Adalm1k::~Adalm1k() {
  if (state_ != DeviceState::Acquired) {
    return;
  }
  try {
    close();
  } catch (const std::exception &ex) {
    LOG_ERROR(name_, "CLOSE", "Failed to close on destruction: {}", ex.what());
  }
}

void Adalm1k::require(const char *operation) const {
  require_acquired(state_, name_, operation);
}

void Adalm1k::open(std::size_t device_index) {
  if (state_ == DeviceState::Acquired) {
    throw BenchError(fmt::format("{} is already open", name_));
  }
  if (state_ == DeviceState::Released) {
    throw NotAcquiredError(
        fmt::format("{} was released and cannot be reopened", name_));
  }

  auto serials = driver_->scan();
  if (serials.empty()) {
    throw DeviceNotFoundError("Could not detect any ADALM1K devices. Make "
                              "sure it is connected via USB");
  }
  if (device_index >= serials.size()) {
    throw DeviceNotFoundError(
        fmt::format("ADALM1K device index {} out of range, {} device(s) found",
                    device_index, serials.size()));
  }

  driver_->attach(device_index);
  state_ = DeviceState::Acquired;
  LOG_INFO(name_, "OPEN", "Opened connection to ADALM1K device: {}",
           serials[device_index]);
}

void Adalm1k::close() {
  require("close");
  state_ = DeviceState::Released;
  capture_started_ = false;
  driver_->detach();
  LOG_INFO(name_, "CLOSE", "Closed connection session to ADALM1K device");
}

std::string Adalm1k::serial() const {
  require("read serial");
  return driver_->serial();
}

SmuMode Adalm1k::channel_mode(SmuChannel ch) const {
  require("read channel mode");
  return driver_->mode(ch);
}

void Adalm1k::set_channel_mode(SmuChannel ch, SmuMode mode) {
  require("set channel mode");
  driver_->set_mode(ch, mode);
  LOG_DEBUG(name_, "MODE", "Channel {} mode set to {}", to_string(ch),
            to_string(mode));
}

void Adalm1k::check_output(SmuChannel ch,
                           const std::vector<float> &data) const {
  auto mode = driver_->mode(ch);
  double lo, hi;
  const char *unit;
  if (sources_voltage(mode)) {
    lo = kMinVoltage;
    hi = kMaxVoltage;
    unit = "V";
  } else if (sources_current(mode)) {
    lo = kMinCurrent;
    hi = kMaxCurrent;
    unit = "A";
  } else {
    return;
  }

  auto [min_it, max_it] = std::minmax_element(data.begin(), data.end());
  if (min_it == data.end()) {
    return;
  }
  if (*min_it < lo || *max_it > hi) {
    throw InvalidParameterError(fmt::format(
        "Channel {} output [{}, {}] {} exceeds the {} range [{}, {}] {}",
        to_string(ch), *min_it, *max_it, unit, to_string(mode), lo, hi, unit));
  }
}

void Adalm1k::output_signal(SmuChannel ch, const SignalParameters &signal,
                            bool cyclic) {
  require("set output");
  if (!std::isfinite(signal.mid_point) || !std::isfinite(signal.peak) ||
      !std::isfinite(signal.phase)) {
    throw InvalidParameterError(
        fmt::format("{} output parameters must be finite",
                    to_string(signal.shape)));
  }

  std::size_t samples = 1;
  if (signal.shape != SignalShape::Constant) {
    if (!std::isfinite(signal.period) || signal.period < 1.0) {
      throw InvalidParameterError(fmt::format(
          "{} period must be at least one sample, got {}",
          to_string(signal.shape), signal.period));
    }
    // One period, rounded to whole samples
    samples = static_cast<std::size_t>(std::lround(signal.period));
  }
  if (signal.shape == SignalShape::Square &&
      !(signal.duty > 0.0 && signal.duty < 1.0)) {
    throw InvalidParameterError(fmt::format(
        "square duty cycle must be in (0, 1), got {}", signal.duty));
  }

  auto data = driver_->generate(ch, signal, samples);
  check_output(ch, data);
  driver_->write(ch, data, cyclic);
  LOG_DEBUG(name_, "OUTPUT",
            "Channel {} {} output mid={} peak={} period={} phase={}",
            to_string(ch), to_string(signal.shape), signal.mid_point,
            signal.peak, signal.period, signal.phase);
}

void Adalm1k::set_constant_output(SmuChannel ch, double value) {
  SignalParameters signal;
  signal.mid_point = value;
  signal.peak = value;
  output_signal(ch, signal, true);
}

void Adalm1k::set_square_output(SmuChannel ch, double mid_point, double peak,
                                double period, double phase, double duty,
                                bool cyclic) {
  output_signal(ch,
                {SignalShape::Square, mid_point, peak, period, phase, duty},
                cyclic);
}

void Adalm1k::set_sawtooth_output(SmuChannel ch, double mid_point,
                                  double peak, double period, double phase,
                                  bool cyclic) {
  output_signal(ch,
                {SignalShape::Sawtooth, mid_point, peak, period, phase, 0.5},
                cyclic);
}

void Adalm1k::set_stairstep_output(SmuChannel ch, double mid_point,
                                   double peak, double period, double phase,
                                   bool cyclic) {
  output_signal(ch,
                {SignalShape::Stairstep, mid_point, peak, period, phase, 0.5},
                cyclic);
}

void Adalm1k::set_sine_output(SmuChannel ch, double mid_point, double peak,
                              double period, double phase, bool cyclic) {
  output_signal(ch, {SignalShape::Sine, mid_point, peak, period, phase, 0.5},
                cyclic);
}

void Adalm1k::set_triangle_output(SmuChannel ch, double mid_point,
                                  double peak, double period, double phase,
                                  bool cyclic) {
  output_signal(ch,
                {SignalShape::Triangle, mid_point, peak, period, phase, 0.5},
                cyclic);
}

SignalInfo Adalm1k::signal_info(SmuChannel ch) const {
  require("read signal info");
  return driver_->signal_info(ch);
}

bool Adalm1k::overcurrent() const {
  require("read overcurrent status");
  return driver_->overcurrent();
}

void Adalm1k::write(SmuChannel ch, const std::vector<float> &data,
                    bool cyclic) {
  require("write");
  if (data.empty()) {
    throw InvalidParameterError("write requires at least one sample");
  }
  check_output(ch, data);
  driver_->write(ch, data, cyclic);
}

void Adalm1k::flush_channel_write(SmuChannel ch) {
  require("flush");
  driver_->flush_write(ch);
}

void Adalm1k::flush() {
  require("flush");
  driver_->flush();
}

void Adalm1k::start_capture(std::size_t samples) {
  require("start capture");
  driver_->start(samples);
  capture_started_ = true;
  if (samples == 0) {
    LOG_INFO(name_, "CAPTURE", "Started continuous capture");
  } else {
    LOG_INFO(name_, "CAPTURE", "Started capture of {} samples", samples);
  }
}

void Adalm1k::run_capture(std::size_t samples) {
  require("run capture");
  if (samples == 0) {
    throw InvalidParameterError("run_capture requires a positive sample count");
  }
  driver_->run(samples);
  capture_started_ = true;
  LOG_DEBUG(name_, "CAPTURE", "Ran capture of {} samples", samples);
}

void Adalm1k::cancel_capture() {
  require("cancel capture");
  driver_->cancel();
  LOG_INFO(name_, "CAPTURE", "Capture cancelled");
}

void Adalm1k::end_capture() {
  require("end capture");
  driver_->end();
  LOG_INFO(name_, "CAPTURE", "Capture ended");
}

void Adalm1k::check_capture(const char *operation) const {
  if (!capture_started_) {
    throw NotConfiguredError(
        fmt::format("{}: cannot {} before a capture was started", name_,
                    operation));
  }
}

std::vector<Frame> Adalm1k::read_all(std::size_t samples, int timeout_ms) {
  require("read");
  if (samples == 0) {
    throw InvalidParameterError("read requires a positive sample count");
  }
  check_capture("read");
  return driver_->read(samples, timeout_ms);
}

std::vector<Sample> Adalm1k::read(SmuChannel ch, std::size_t samples,
                                  int timeout_ms) {
  auto frames = read_all(samples, timeout_ms);
  std::vector<Sample> out;
  out.reserve(frames.size());
  for (const auto &frame : frames) {
    out.push_back(frame[ch]);
  }
  return out;
}

std::vector<Frame> Adalm1k::get_samples_all(std::size_t samples) {
  require("get samples");
  if (samples == 0) {
    throw InvalidParameterError("get_samples requires a positive sample count");
  }
  if (driver_->continuous()) {
    throw BenchError(
        "non-continuous acquisition is not possible during a continuous "
        "capture");
  }
  run_capture(samples);
  return driver_->read(samples, -1);
}

std::vector<Sample> Adalm1k::get_samples(SmuChannel ch, std::size_t samples) {
  auto frames = get_samples_all(samples);
  std::vector<Sample> out;
  out.reserve(frames.size());
  for (const auto &frame : frames) {
    out.push_back(frame[ch]);
  }
  return out;
}

bool Adalm1k::capture_continuous() const {
  require("read capture status");
  return driver_->continuous();
}

bool Adalm1k::capture_cancelled() const {
  require("read capture status");
  return driver_->cancelled();
}

unsigned Adalm1k::sample_rate() const {
  require("read sample rate");
  return driver_->sample_rate();
}

void Adalm1k::set_sample_rate(unsigned sample_rate) {
  require("set sample rate");
  if (sample_rate == 0) {
    throw InvalidParameterError("sample rate must be positive");
  }
  driver_->configure(sample_rate);
  LOG_DEBUG(name_, "CONFIG", "Sample rate set to {} Hz", sample_rate);
}

std::size_t Adalm1k::queue_size() const {
  require("read queue size");
  return driver_->queue_size();
}

void Adalm1k::set_leds(unsigned mask) {
  require("set leds");
  if (mask > 7) {
    throw InvalidParameterError(
        fmt::format("LED mask {} out of range [0, 7]", mask));
  }
  driver_->set_leds(mask);
}

} // namespace m1k
} // namespace analogbench
