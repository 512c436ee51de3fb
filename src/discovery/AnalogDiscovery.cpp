#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>
#include <fmt/format.h>
#include <thread>
#include <type_traits>

namespace analogbench {
namespace discovery {

namespace {

// Analog IO layout of the Analog Discovery 2: channels 0/1 are V+/V-,
// 2/3 are the USB/AUX monitors
constexpr int kPositiveSupply = 0;
constexpr int kNegativeSupply = 1;
constexpr int kUsbMonitor = 2;
constexpr int kAuxMonitor = 3;
constexpr int kNodeEnable = 0;
constexpr int kNodeVoltage = 1;
constexpr int kNodeMonitorVoltage = 0;
constexpr int kNodeMonitorCurrent = 1;

constexpr double kRawScale = 65536.0;

uint32_t pin_bit(DigitalPin pin) { return 1u << static_cast<int>(pin); }

std::string format_trigger_time(const TriggerTimestamp &ts) {
  std::time_t seconds = static_cast<std::time_t>(ts.seconds);
  std::tm local{};
#ifdef _WIN32
  localtime_s(&local, &seconds);
#else
  localtime_r(&seconds, &local);
#endif
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &local);

  double ns = ts.ticks_per_second == 0
                  ? 0.0
                  : 1e9 / ts.ticks_per_second * ts.tick;
  auto ms = static_cast<long>(std::floor(ns / 1e6));
  ns -= ms * 1e6;
  auto us = static_cast<long>(std::floor(ns / 1e3));
  ns -= us * 1e3;
  return fmt::format("{}.{:03}.{:03}.{:03}", date, ms, us,
                     static_cast<long>(std::floor(ns)));
}

void check_frequency(double hz, const char *what) {
  if (!(hz > 0.0)) {
    throw InvalidParameterError(
        fmt::format("{} must be positive, got {}", what, hz));
  }
}

void check_count(std::size_t count, const char *what) {
  if (count == 0) {
    throw InvalidParameterError(fmt::format("{} must be positive", what));
  }
}

void check_i2c_address(uint8_t address) {
  if (address > 0x7F) {
    throw InvalidParameterError(fmt::format(
        "I2C address {:#04x} is not a 7 bit address", address));
  }
}

void check_word_bits(int bits) {
  if (bits != 8 && bits != 16 && bits != 32) {
    throw InvalidParameterError(
        fmt::format("SPI word size must be 8, 16 or 32 bits, got {}", bits));
  }
}

std::vector<double> to_volts(const std::vector<int16_t> &raw, double range,
                             double offset) {
  double factor = range / kRawScale;
  std::vector<double> volts;
  volts.reserve(raw.size());
  for (auto value : raw) {
    volts.push_back(value * factor + offset);
  }
  return volts;
}

} // namespace

AnalogDiscovery::AnalogDiscovery(std::unique_ptr<ScopeDriver> driver,
                                 SettleTimes settle)
    : driver_(std::move(driver)), settle_(settle) {
  if (!driver_) {
    throw InvalidParameterError("AnalogDiscovery requires a driver");
  }
}

AnalogDiscovery::~AnalogDiscovery() {
  if (state_ != DeviceState::Acquired) {
    return;
  }
  try {
    close();
  } catch (const std::exception &ex) {
    LOG_ERROR(name_, "CLOSE", "Failed to close on destruction: {}", ex.what());
  }
}

void AnalogDiscovery::require(const char *operation) const {
  require_acquired(state_, name_, operation);
}

void AnalogDiscovery::open(int config_index) {
  if (state_ == DeviceState::Acquired) {
    throw BenchError(fmt::format("{} is already open", name_));
  }
  if (state_ == DeviceState::Released) {
    throw NotAcquiredError(
        fmt::format("{} was released and cannot be reopened", name_));
  }
  if (config_index < 0) {
    throw InvalidParameterError(
        fmt::format("device configuration index {} is negative", config_index));
  }

  driver_->open(config_index);
  state_ = DeviceState::Acquired;
  LOG_INFO(name_, "OPEN", "Opened Analog Discovery with configuration {}",
           config_index);
}

void AnalogDiscovery::close() {
  require("close");
  state_ = DeviceState::Released;
  record_started_ = false;
  acquisition_started_ = false;
  screen_started_ = false;
  i2c_configured_ = false;
  spi_configured_ = false;
  played_.clear();
  driver_->close();
  LOG_INFO(name_, "CLOSE", "Closed Analog Discovery device");
}

std::vector<DeviceInfo> AnalogDiscovery::devices_info() {
  auto devices = driver_->enumerate();
  for (const auto &dev : devices) {
    LOG_DEBUG(name_, "ENUMERATE", "Device {}: {} SN:{} id={} rev={}",
              dev.index, dev.name, dev.serial, dev.id, dev.revision);
  }
  return devices;
}

std::vector<DeviceConfigInfo>
AnalogDiscovery::device_config_info(int device_index) {
  if (device_index < 0) {
    throw InvalidParameterError(
        fmt::format("device index {} is negative", device_index));
  }
  auto configs = driver_->enumerate_configs(device_index);
  LOG_INFO(name_, "ENUMERATE", "Device {} has {} configuration(s)",
           device_index, configs.size());
  return configs;
}

std::string AnalogDiscovery::library_version() {
  return driver_->library_version();
}

int AnalogDiscovery::adc_bits() {
  require("read ADC resolution");
  return driver_->analog_in_bits();
}

AutoConfigure AnalogDiscovery::auto_configure() {
  require("read auto configure");
  return driver_->auto_configure();
}

void AnalogDiscovery::reset_analog_instrument() {
  require("reset analog instruments");
  LOG_INFO(name_, "RESET", "Resetting analog instruments to their defaults");
  driver_->analog_out_reset_all();
  driver_->analog_in_reset();
  driver_->analog_io_reset();
  record_started_ = false;
  acquisition_started_ = false;
  screen_started_ = false;
  played_.clear();
}

void AnalogDiscovery::reset_digital_instrument() {
  require("reset digital instruments");
  LOG_INFO(name_, "RESET", "Resetting digital instruments to their defaults");
  driver_->digital_out_reset();
  driver_->digital_io_reset();
  driver_->digital_in_reset();
}

void AnalogDiscovery::enable_channel(const AnalogChannel &ch) {
  require("enable channel");
  if (auto *in = std::get_if<ScopeChannel>(&ch)) {
    driver_->analog_in_enable(*in, true);
  } else {
    driver_->analog_out_enable(std::get<WaveGenChannel>(ch), true);
  }
  LOG_DEBUG(name_, "CHANNEL", "Enabled {}", to_string(ch));
}

void AnalogDiscovery::disable_channel(const AnalogChannel &ch) {
  require("disable channel");
  if (auto *in = std::get_if<ScopeChannel>(&ch)) {
    driver_->analog_in_enable(*in, false);
  } else {
    driver_->analog_out_enable(std::get<WaveGenChannel>(ch), false);
  }
  LOG_DEBUG(name_, "CHANNEL", "Disabled {}", to_string(ch));
}

bool AnalogDiscovery::channel_enabled(const AnalogChannel &ch) {
  require("read channel state");
  if (auto *in = std::get_if<ScopeChannel>(&ch)) {
    return driver_->analog_in_enabled(*in);
  }
  return driver_->analog_out_enabled(std::get<WaveGenChannel>(ch));
}

template <typename Channel>
void AnalogDiscovery::require_enabled(const std::vector<Channel> &channels,
                                      const char *operation) {
  if (channels.empty()) {
    throw InvalidParameterError(
        fmt::format("{} requires at least one channel", operation));
  }
  for (auto ch : channels) {
    if (!channel_enabled(ch)) {
      throw NotConfiguredError(fmt::format(
          "{}: channel {} is not enabled, enable it before {}", name_,
          to_string(ch), operation));
    }
  }
}

void AnalogDiscovery::play(const std::vector<WaveGenChannel> &channels,
                           const PlaySettings &settings) {
  require("play");
  require_enabled(channels, "play");

  const auto &wave = settings.waveform;
  bool custom = wave.signal == OutputSignal::Custom ||
                wave.signal == OutputSignal::Play;
  if (custom && settings.data.empty()) {
    throw InvalidParameterError(fmt::format(
        "{} signal requires sample data", to_string(wave.signal)));
  }
  if (wave.signal != OutputSignal::DC) {
    check_frequency(wave.frequency, "output frequency");
  }
  if (settings.repeat_count < 0 || settings.run_duration < 0.0 ||
      settings.wait_duration < 0.0) {
    throw InvalidParameterError(
        "run duration, wait duration and repeat count must not be negative");
  }

  for (auto ch : channels) {
    driver_->analog_out_set_waveform(ch, wave);
    if (custom) {
      driver_->analog_out_set_data(ch, settings.data);
    }
    driver_->analog_out_set_idle(ch, settings.idle);
    driver_->analog_out_set_timing(ch, settings.run_duration,
                                   settings.wait_duration,
                                   settings.repeat_count);
    if (settings.trigger) {
      driver_->analog_out_set_trigger(ch, *settings.trigger,
                                      settings.trigger_slope);
    }
  }

  for (auto ch : channels) {
    auto applied = driver_->analog_out_waveform(ch);
    LOG_DEBUG(name_, "PLAY",
              "{}: {} {} Hz amplitude={} V offset={} V symmetry={} % "
              "phase={} deg idle={}",
              to_string(ch), to_string(applied.signal), applied.frequency,
              applied.amplitude, applied.offset, applied.symmetry,
              applied.phase, to_string(settings.idle));
  }

  // Let the offset stabilize before starting
  std::this_thread::sleep_for(settle_.output);

  for (auto ch : channels) {
    driver_->analog_out_configure(ch, true);
    played_.insert(ch);
  }
  LOG_INFO(name_, "PLAY", "Started {} on {} channel(s)",
           to_string(wave.signal), channels.size());
}

InstrumentState AnalogDiscovery::play_status(WaveGenChannel ch) {
  require("read play status");
  if (played_.count(ch) == 0) {
    throw NotConfiguredError(fmt::format(
        "{}: nothing was played on {}", name_, to_string(ch)));
  }
  return driver_->analog_out_status(ch);
}

void AnalogDiscovery::apply_input_settings(ScopeChannel ch, double range,
                                           double offset,
                                           AnalogFilter filter) {
  driver_->analog_in_set_range(ch, range);
  driver_->analog_in_set_offset(ch, offset);
  driver_->analog_in_set_filter(ch, filter);
}

void AnalogDiscovery::record(const std::vector<ScopeChannel> &channels,
                             const RecordSettings &settings) {
  require("record");
  require_enabled(channels, "record");
  check_frequency(settings.sampling_frequency, "sampling frequency");
  if (settings.record_length < 0.0) {
    throw InvalidParameterError("record length must not be negative");
  }

  driver_->set_auto_configure(AutoConfigure::Disabled);
  driver_->analog_in_set_acquisition_mode(AcquisitionMode::Record);
  driver_->analog_in_set_frequency(settings.sampling_frequency);
  driver_->analog_in_set_record_length(settings.record_length);
  for (auto ch : channels) {
    apply_input_settings(ch, settings.range, settings.offset, settings.filter);
  }
  if (settings.trigger) {
    driver_->analog_in_set_trigger(channels.front(), *settings.trigger);
  }

  driver_->analog_in_configure(true, false);
  std::this_thread::sleep_for(settle_.record);
  driver_->analog_in_configure(false, true);

  record_started_ = true;
  record_bounded_ = settings.record_length > 0.0;
  acquisition_started_ = false;
  screen_started_ = false;
  LOG_INFO(name_, "RECORD", "Recording {} channel(s) at {} Hz for {} s",
           channels.size(), settings.sampling_frequency,
           settings.record_length);
}

InstrumentState AnalogDiscovery::record_status() {
  require("read record status");
  return driver_->analog_in_status(true);
}

void AnalogDiscovery::check_record(const char *operation) const {
  if (!record_started_) {
    throw NotConfiguredError(fmt::format(
        "{}: cannot {} before a recording was started", name_, operation));
  }
}

std::vector<double> AnalogDiscovery::read_recorded(ScopeChannel ch) {
  require("read recorded data");
  check_record("read recorded data");

  auto status = driver_->analog_in_record_status();
  if (status.lost > 0) {
    LOG_WARN(name_, "RECORD", "{} samples were lost, reduce the frequency",
             status.lost);
  }
  if (status.corrupt > 0) {
    LOG_WARN(name_, "RECORD",
             "{} samples could be corrupted, reduce the frequency",
             status.corrupt);
  }
  if (status.available <= 0) {
    return {};
  }
  return driver_->analog_in_data(ch, status.available);
}

std::vector<double>
AnalogDiscovery::fill_recorded_samples(ScopeChannel ch,
                                       std::size_t samples_count) {
  return fill_recorded_samples(std::vector<ScopeChannel>{ch}, samples_count)
      .front();
}

std::vector<std::vector<double>> AnalogDiscovery::fill_recorded_samples(
    const std::vector<ScopeChannel> &channels, std::size_t samples_count) {
  require("fill recorded samples");
  check_record("fill recorded samples");
  check_count(samples_count, "samples count");
  if (channels.empty()) {
    throw InvalidParameterError("fill requires at least one channel");
  }

  std::vector<std::vector<int16_t>> raw(
      channels.size(), std::vector<int16_t>(samples_count, 0));
  std::size_t collected = 0;
  long lost = 0;
  long corrupt = 0;

  while (collected < samples_count) {
    auto state = driver_->analog_in_status(true);
    if (collected == 0 &&
        (state == InstrumentState::Config ||
         state == InstrumentState::Prefill ||
         state == InstrumentState::Armed)) {
      continue;
    }

    auto status = driver_->analog_in_record_status();
    lost += status.lost;
    corrupt += status.corrupt;
    collected += static_cast<std::size_t>(std::max(status.lost, 0));
    if (collected >= samples_count) {
      break;
    }
    if (status.available <= 0) {
      if (state == InstrumentState::Done) {
        throw BenchError(fmt::format(
            "{}: recording finished after {} of {} samples", name_,
            collected, samples_count));
      }
      continue;
    }

    auto take = std::min(static_cast<std::size_t>(status.available),
                         samples_count - collected);
    for (std::size_t i = 0; i < channels.size(); ++i) {
      auto chunk = driver_->analog_in_data16(channels[i], 0,
                                             static_cast<int>(take));
      std::copy_n(chunk.begin(), std::min(chunk.size(), take),
                  raw[i].begin() + static_cast<std::ptrdiff_t>(collected));
    }
    collected += take;
  }

  if (lost > 0) {
    LOG_WARN(name_, "RECORD",
             "{} samples were lost during the fetch, reduce the sampling "
             "frequency",
             lost);
  }
  if (corrupt > 0) {
    LOG_WARN(name_, "RECORD",
             "{} samples could be corrupted during the fetch, reduce the "
             "sampling frequency",
             corrupt);
  }

  std::vector<std::vector<double>> result;
  result.reserve(channels.size());
  for (std::size_t i = 0; i < channels.size(); ++i) {
    result.push_back(to_volts(raw[i], driver_->analog_in_range(channels[i]),
                              driver_->analog_in_offset(channels[i])));
  }
  LOG_DEBUG(name_, "RECORD", "Filled {} samples on {} channel(s)",
            samples_count, channels.size());
  return result;
}

std::vector<double>
AnalogDiscovery::fill_recorded_circular(ScopeChannel ch,
                                        std::size_t samples_count) {
  require("fill recorded samples");
  check_record("fill recorded samples");
  check_count(samples_count, "samples count");
  if (!record_bounded_) {
    throw NotConfiguredError(fmt::format(
        "{}: a circular fill needs a recording with a finite length", name_));
  }

  std::vector<int16_t> ring(samples_count, 0);
  std::size_t next = 0;
  long lost = 0;
  long corrupt = 0;

  for (;;) {
    auto state = driver_->analog_in_status(true);
    auto status = driver_->analog_in_record_status();
    lost += status.lost;
    corrupt += status.corrupt;
    next = (next + static_cast<std::size_t>(std::max(status.lost, 0))) %
           samples_count;

    auto available = static_cast<std::size_t>(std::max(status.available, 0));
    std::size_t first = 0;
    while (available > 0) {
      auto take = std::min(available, samples_count - next);
      auto chunk = driver_->analog_in_data16(ch, static_cast<int>(first),
                                             static_cast<int>(take));
      std::copy_n(chunk.begin(), std::min(chunk.size(), take),
                  ring.begin() + static_cast<std::ptrdiff_t>(next));
      first += take;
      available -= take;
      next = (next + take) % samples_count;
    }

    if (state == InstrumentState::Done) {
      break;
    }
  }

  if (lost > 0) {
    LOG_WARN(name_, "RECORD",
             "{} samples were lost during the fetch, reduce the sampling "
             "frequency",
             lost);
  }
  if (corrupt > 0) {
    LOG_WARN(name_, "RECORD",
             "{} samples could be corrupted during the fetch, reduce the "
             "sampling frequency",
             corrupt);
  }

  // Oldest sample first
  std::rotate(ring.begin(), ring.begin() + static_cast<std::ptrdiff_t>(next),
              ring.end());
  return to_volts(ring, driver_->analog_in_range(ch),
                  driver_->analog_in_offset(ch));
}

void AnalogDiscovery::start_analog_screen(
    const std::vector<ScopeChannel> &channels, const ScreenSettings &settings) {
  require("start analog screen");
  require_enabled(channels, "start analog screen");
  check_frequency(settings.sampling_frequency, "sampling frequency");
  check_count(settings.samples_count, "samples count");

  auto samples_count = clamp_to_buffer(settings.samples_count);
  driver_->set_auto_configure(AutoConfigure::Disabled);
  driver_->analog_in_set_buffer_size(static_cast<int>(samples_count));
  driver_->analog_in_set_acquisition_mode(AcquisitionMode::ScanShift);
  driver_->analog_in_set_frequency(settings.sampling_frequency);
  for (auto ch : channels) {
    apply_input_settings(ch, settings.range, settings.offset, settings.filter);
  }

  driver_->analog_in_configure(true, false);
  std::this_thread::sleep_for(settle_.record);
  driver_->analog_in_configure(false, true);

  screen_started_ = true;
  record_started_ = false;
  acquisition_started_ = false;
  LOG_INFO(name_, "SCREEN",
           "Started screen of {} samples on {} channel(s) at {} Hz",
           samples_count, channels.size(), settings.sampling_frequency);
}

std::vector<std::vector<double>> AnalogDiscovery::retrieve_analog_screen(
    const std::vector<ScopeChannel> &channels, std::size_t samples_count,
    std::chrono::milliseconds scan_duration) {
  require("retrieve analog screen");
  if (!screen_started_) {
    throw NotConfiguredError(fmt::format(
        "{}: cannot retrieve a screen before start_analog_screen", name_));
  }
  check_count(samples_count, "samples count");
  if (channels.empty()) {
    throw InvalidParameterError("screen retrieval requires a channel");
  }

  std::vector<std::vector<double>> screens(channels.size());
  auto deadline = std::chrono::steady_clock::now() + scan_duration;
  do {
    driver_->analog_in_status(true);
    auto valid = std::min(
        static_cast<std::size_t>(std::max(driver_->analog_in_samples_valid(), 0)),
        samples_count);
    for (std::size_t i = 0; i < channels.size(); ++i) {
      screens[i] = driver_->analog_in_data(channels[i], static_cast<int>(valid));
    }
  } while (std::chrono::steady_clock::now() < deadline);

  LOG_DEBUG(name_, "SCREEN", "Retrieved {} samples on {} channel(s)",
            screens.front().size(), channels.size());
  return screens;
}

std::size_t AnalogDiscovery::clamp_to_buffer(std::size_t samples_count) {
  auto max_size =
      static_cast<std::size_t>(driver_->analog_in_max_buffer_size());
  if (samples_count > max_size) {
    LOG_WARN(name_, "ACQUIRE",
             "Requested {} samples exceeds the device buffer of {}, using {}",
             samples_count, max_size, max_size);
    return max_size;
  }
  return samples_count;
}

InstrumentState AnalogDiscovery::wait_done() {
  InstrumentState state;
  do {
    state = driver_->analog_in_status(true);
  } while (state != InstrumentState::Done);
  return state;
}

std::vector<double>
AnalogDiscovery::acquire_single(ScopeChannel ch,
                                const AcquisitionSettings &settings) {
  require("acquire");
  require_enabled(std::vector<ScopeChannel>{ch}, "acquire");
  check_frequency(settings.sampling_frequency, "sampling frequency");
  check_count(settings.samples_count, "samples count");

  auto samples_count = clamp_to_buffer(settings.samples_count);
  driver_->set_auto_configure(AutoConfigure::Disabled);
  driver_->analog_in_set_acquisition_mode(AcquisitionMode::Single);
  driver_->analog_in_set_buffer_size(static_cast<int>(samples_count));
  driver_->analog_in_set_frequency(settings.sampling_frequency);
  apply_input_settings(ch, settings.range, settings.offset, settings.filter);
  if (settings.trigger) {
    auto trigger = *settings.trigger;
    trigger.auto_timeout = 0.0;
    driver_->analog_in_set_trigger(ch, trigger);
  }

  std::this_thread::sleep_for(settle_.acquisition);
  driver_->analog_in_configure(true, true);
  wait_done();

  auto data = driver_->analog_in_data(ch, static_cast<int>(samples_count));
  LOG_DEBUG(name_, "ACQUIRE", "Acquired {} samples on {}", data.size(),
            to_string(ch));
  return data;
}

void AnalogDiscovery::start_acquisition(
    const std::vector<ScopeChannel> &channels,
    const AcquisitionSettings &settings) {
  require("start acquisition");
  require_enabled(channels, "start acquisition");
  check_frequency(settings.sampling_frequency, "sampling frequency");
  check_count(settings.samples_count, "samples count");

  auto samples_count = clamp_to_buffer(settings.samples_count);
  driver_->set_auto_configure(AutoConfigure::Disabled);
  driver_->analog_in_set_buffer_size(static_cast<int>(samples_count));
  driver_->analog_in_set_frequency(settings.sampling_frequency);
  if (settings.single) {
    driver_->analog_in_set_acquisition_mode(AcquisitionMode::Single1);
  }
  for (auto ch : channels) {
    apply_input_settings(ch, settings.range, settings.offset, settings.filter);
  }
  if (settings.trigger) {
    auto trigger = *settings.trigger;
    trigger.auto_timeout = 0.0;
    driver_->analog_in_set_trigger(channels.front(), trigger);
  }

  driver_->analog_in_configure(true, false);
  std::this_thread::sleep_for(settle_.acquisition);
  driver_->analog_in_configure(false, true);

  acquisition_started_ = true;
  record_started_ = false;
  screen_started_ = false;
  LOG_INFO(name_, "ACQUIRE",
           "Armed acquisition of {} samples on {} channel(s) at {} Hz",
           samples_count, channels.size(), settings.sampling_frequency);
}

std::vector<Capture> AnalogDiscovery::retrieve_acquisitions(
    const std::vector<ScopeChannel> &channels, std::size_t samples_count,
    std::size_t captures) {
  require("retrieve acquisitions");
  if (!acquisition_started_) {
    throw NotConfiguredError(fmt::format(
        "{}: cannot retrieve acquisitions before start_acquisition", name_));
  }
  check_count(samples_count, "samples count");
  check_count(captures, "capture count");

  std::vector<Capture> result;
  result.reserve(captures);
  for (std::size_t i = 0; i < captures; ++i) {
    wait_done();
    Capture capture;
    for (auto ch : channels) {
      capture.channels.push_back(
          driver_->analog_in_data(ch, static_cast<int>(samples_count)));
    }
    capture.trigger_time = format_trigger_time(driver_->analog_in_trigger_time());
    LOG_DEBUG(name_, "ACQUIRE", "Capture {} triggered at {}", i + 1,
              capture.trigger_time);
    result.push_back(std::move(capture));
  }
  return result;
}

double AnalogDiscovery::read_voltage(ScopeChannel ch) {
  require("read voltage");
  driver_->analog_in_configure(false, false);
  driver_->analog_in_status(false);
  return driver_->analog_in_sample(ch);
}

RangeInfo AnalogDiscovery::input_range_info() {
  require("read range info");
  return driver_->analog_in_range_info();
}

Coupling AnalogDiscovery::coupling(ScopeChannel ch) {
  require("read coupling");
  return driver_->analog_in_coupling(ch);
}

void AnalogDiscovery::set_coupling(ScopeChannel ch, Coupling coupling) {
  require("set coupling");
  driver_->analog_in_set_coupling(ch, coupling);
  LOG_DEBUG(name_, "CHANNEL", "{} coupling set to {}", to_string(ch),
            to_string(coupling));
}

void AnalogDiscovery::configure_power_supply(
    double positive_voltage, std::optional<double> negative_voltage) {
  require("configure power supply");
  double v_plus = std::clamp(positive_voltage, 0.0, 5.0);
  driver_->analog_io_set_node(kPositiveSupply, kNodeVoltage, v_plus);
  driver_->analog_io_set_node(kPositiveSupply, kNodeEnable, 1.0);
  if (negative_voltage) {
    double v_minus = std::clamp(*negative_voltage, -5.0, 0.0);
    driver_->analog_io_set_node(kNegativeSupply, kNodeVoltage, v_minus);
    driver_->analog_io_set_node(kNegativeSupply, kNodeEnable, 1.0);
    LOG_INFO(name_, "SUPPLY", "Configured V+ {} V, V- {} V", v_plus, v_minus);
  } else {
    LOG_INFO(name_, "SUPPLY", "Configured V+ {} V", v_plus);
  }
}

void AnalogDiscovery::enable_power_supply() {
  require("enable power supply");
  driver_->analog_io_enable(true);
  std::this_thread::sleep_for(settle_.supplies);
  LOG_INFO(name_, "SUPPLY", "Enabled power supply master switch");
}

void AnalogDiscovery::disable_power_supply() {
  require("disable power supply");
  driver_->analog_io_enable(false);
  std::this_thread::sleep_for(settle_.supplies);
  LOG_INFO(name_, "SUPPLY", "Disabled power supply master switch");
}

bool AnalogDiscovery::power_supply_enabled() {
  require("read power supply status");
  driver_->analog_io_status();
  return driver_->analog_io_enabled();
}

void AnalogDiscovery::set_power_supply_voltages(
    double positive_voltage, std::optional<double> negative_voltage) {
  require("set power supply voltages");
  double v_plus = std::clamp(positive_voltage, 0.0, 5.0);
  driver_->analog_io_set_node(kPositiveSupply, kNodeVoltage, v_plus);
  if (negative_voltage) {
    double v_minus = std::clamp(*negative_voltage, -5.0, 0.0);
    driver_->analog_io_set_node(kNegativeSupply, kNodeVoltage, v_minus);
    driver_->analog_io_set_node(kNegativeSupply, kNodeEnable, 1.0);
  }
  std::this_thread::sleep_for(settle_.supplies);
  LOG_INFO(name_, "SUPPLY", "Set supply voltages V+ {} V, V- {}", v_plus,
           negative_voltage ? fmt::format("{} V", *negative_voltage)
                            : std::string("unchanged"));
}

SupplyVoltages AnalogDiscovery::power_supply_voltages() {
  require("read power supply voltages");
  driver_->analog_io_status();
  SupplyVoltages v;
  v.positive = driver_->analog_io_node(kPositiveSupply, kNodeVoltage);
  v.negative = driver_->analog_io_node(kNegativeSupply, kNodeVoltage);
  LOG_DEBUG(name_, "SUPPLY", "Supply voltages V+ {} V, V- {} V", v.positive,
            v.negative);
  return v;
}

SupplyMonitor AnalogDiscovery::power_supply_monitor() {
  require("read power supply monitor");
  driver_->analog_io_status();
  SupplyMonitor m;
  m.usb_voltage = driver_->analog_io_node_status(kUsbMonitor,
                                                 kNodeMonitorVoltage);
  m.usb_current = driver_->analog_io_node_status(kUsbMonitor,
                                                 kNodeMonitorCurrent);
  m.aux_voltage = driver_->analog_io_node_status(kAuxMonitor,
                                                 kNodeMonitorVoltage);
  m.aux_current = driver_->analog_io_node_status(kAuxMonitor,
                                                 kNodeMonitorCurrent);
  return m;
}

void AnalogDiscovery::set_digital_mode(DigitalPin pin, bool output) {
  require("set digital mode");
  auto mask = driver_->digital_io_output_enable();
  mask = output ? (mask | pin_bit(pin)) : (mask & ~pin_bit(pin));
  driver_->digital_io_set_output_enable(mask);
  LOG_DEBUG(name_, "DIO", "{} set as {}", to_string(pin),
            output ? "output" : "input");
}

bool AnalogDiscovery::digital_mode(DigitalPin pin) {
  require("read digital mode");
  return (driver_->digital_io_output_enable() & pin_bit(pin)) != 0;
}

void AnalogDiscovery::set_digital_state(DigitalPin pin, bool high) {
  require("set digital state");
  auto mask = driver_->digital_io_output();
  mask = high ? (mask | pin_bit(pin)) : (mask & ~pin_bit(pin));
  driver_->digital_io_set_output(mask);
  LOG_DEBUG(name_, "DIO", "{} driven {}", to_string(pin),
            high ? "high" : "low");
}

bool AnalogDiscovery::digital_state(DigitalPin pin) {
  require("read digital state");
  driver_->digital_io_status();
  return (driver_->digital_io_input() & pin_bit(pin)) != 0;
}

void AnalogDiscovery::configure_i2c(DigitalPin sda, DigitalPin scl,
                                    double rate) {
  require("configure I2C");
  if (sda == scl) {
    throw InvalidParameterError(
        fmt::format("I2C SDA and SCL cannot share {}", to_string(sda)));
  }
  check_frequency(rate, "I2C rate");

  driver_->i2c_set_clock_pin(static_cast<int>(scl));
  driver_->i2c_set_data_pin(static_cast<int>(sda));
  driver_->i2c_set_rate(rate);
  driver_->i2c_set_read_nak(true);
  if (!driver_->i2c_clear()) {
    throw BenchError(
        "I2C bus error. Check the I2C pin(s) / pull-up(s) configuration");
  }
  std::this_thread::sleep_for(settle_.protocol);

  i2c_configured_ = true;
  LOG_INFO(name_, "I2C", "I2C master on SDA {} SCL {} at {} Hz",
           to_string(sda), to_string(scl), rate);
}

void AnalogDiscovery::reset_i2c() {
  require("reset I2C");
  i2c_configured_ = false;
  driver_->i2c_reset();
  std::this_thread::sleep_for(settle_.protocol);
  LOG_DEBUG(name_, "I2C", "I2C master reset");
}

void AnalogDiscovery::check_i2c(const char *operation) const {
  if (!i2c_configured_) {
    throw NotConfiguredError(fmt::format(
        "{}: cannot {} before configure_i2c", name_, operation));
  }
}

I2CReadResult AnalogDiscovery::i2c_read(uint8_t address,
                                        std::size_t bytes_count) {
  require("read I2C");
  check_i2c("read I2C");
  check_i2c_address(address);
  check_count(bytes_count, "I2C byte count");

  auto result = driver_->i2c_read(static_cast<uint8_t>(address << 1),
                                  static_cast<int>(bytes_count));
  if (result.nak != 0) {
    LOG_WARN(name_, "I2C", "Read from {:#04x} NAK at byte {}", address,
             result.nak);
  }
  return result;
}

int AnalogDiscovery::i2c_write(uint8_t address,
                               const std::vector<uint8_t> &data) {
  require("write I2C");
  check_i2c("write I2C");
  check_i2c_address(address);
  if (data.empty()) {
    throw InvalidParameterError("I2C write requires at least one byte");
  }

  int nak = driver_->i2c_write(static_cast<uint8_t>(address << 1), data);
  if (nak != 0) {
    LOG_WARN(name_, "I2C", "Write to {:#04x} NAK at byte {}", address, nak);
  }
  return nak;
}

void AnalogDiscovery::configure_spi(const SpiSettings &settings) {
  require("configure SPI");
  check_frequency(settings.frequency, "SPI frequency");
  if (settings.mode < 0 || settings.mode > 3) {
    throw InvalidParameterError(
        fmt::format("SPI mode {} out of range [0, 3]", settings.mode));
  }

  driver_->spi_set_frequency(settings.frequency);
  driver_->spi_set_clock_pin(static_cast<int>(settings.clock));
  driver_->spi_set_data_pin(0, static_cast<int>(settings.mosi));
  driver_->spi_set_idle(0, DigitalIdle::HighZ);
  driver_->spi_set_data_pin(1, static_cast<int>(settings.miso));
  driver_->spi_set_idle(1, DigitalIdle::HighZ);
  driver_->spi_set_mode(settings.mode);
  driver_->spi_set_bit_order(settings.bit_order);
  driver_->spi_select(static_cast<int>(settings.chip_select), 1);

  spi_configured_ = true;
  LOG_INFO(name_, "SPI", "SPI master mode {} at {} Hz, CS {} CLK {}",
           settings.mode, settings.frequency, to_string(settings.chip_select),
           to_string(settings.clock));
}

void AnalogDiscovery::reset_spi() {
  require("reset SPI");
  spi_configured_ = false;
  driver_->spi_reset();
  std::this_thread::sleep_for(settle_.protocol);
  LOG_DEBUG(name_, "SPI", "SPI master reset");
}

void AnalogDiscovery::check_spi(const char *operation) const {
  if (!spi_configured_) {
    throw NotConfiguredError(fmt::format(
        "{}: cannot {} before configure_spi", name_, operation));
  }
}

template <typename Transfer>
auto AnalogDiscovery::selected(DigitalPin cs, Transfer &&transfer)
    -> decltype(transfer()) {
  int pin = static_cast<int>(cs);
  driver_->spi_select(pin, 0);
  try {
    if constexpr (std::is_void_v<decltype(transfer())>) {
      transfer();
      driver_->spi_select(pin, 1);
    } else {
      auto result = transfer();
      driver_->spi_select(pin, 1);
      return result;
    }
  } catch (const std::exception &) {
    try {
      driver_->spi_select(pin, 1);
    } catch (const std::exception &ex) {
      LOG_WARN(name_, "SPI", "Failed to release {}: {}", to_string(cs),
               ex.what());
    }
    throw;
  }
}

uint32_t AnalogDiscovery::spi_read_one(DigitalPin cs, int bits, SpiLine line) {
  require("read SPI");
  check_spi("read SPI");
  if (bits < 1 || bits > 32) {
    throw InvalidParameterError(
        fmt::format("SPI word size {} out of range [1, 32]", bits));
  }
  return selected(cs, [&] { return driver_->spi_read_one(line, bits); });
}

std::vector<uint32_t> AnalogDiscovery::spi_read(DigitalPin cs, int word_bits,
                                                std::size_t words,
                                                SpiLine line) {
  require("read SPI");
  check_spi("read SPI");
  check_word_bits(word_bits);
  check_count(words, "SPI word count");
  return selected(cs, [&] {
    return driver_->spi_read(line, word_bits, static_cast<int>(words));
  });
}

void AnalogDiscovery::spi_write_one(DigitalPin cs, int bits, uint32_t word,
                                    SpiLine line) {
  require("write SPI");
  check_spi("write SPI");
  if (bits < 1 || bits > 32) {
    throw InvalidParameterError(
        fmt::format("SPI word size {} out of range [1, 32]", bits));
  }
  selected(cs, [&] { driver_->spi_write_one(line, bits, word); });
}

void AnalogDiscovery::spi_write(DigitalPin cs, int word_bits,
                                const std::vector<uint32_t> &words,
                                SpiLine line) {
  require("write SPI");
  check_spi("write SPI");
  check_word_bits(word_bits);
  if (words.empty()) {
    throw InvalidParameterError("SPI write requires at least one word");
  }
  selected(cs, [&] { driver_->spi_write(line, word_bits, words); });
  LOG_DEBUG(name_, "SPI", "Wrote {} {} bit word(s) over {}", words.size(),
            word_bits, to_string(line));
}

std::vector<uint32_t>
AnalogDiscovery::spi_exchange(DigitalPin cs, int word_bits,
                              const std::vector<uint32_t> &tx,
                              std::size_t rx_words, SpiLine line) {
  require("exchange SPI");
  check_spi("exchange SPI");
  check_word_bits(word_bits);
  if (tx.empty()) {
    throw InvalidParameterError("SPI exchange requires at least one word");
  }
  check_count(rx_words, "SPI read word count");
  return selected(cs, [&] {
    return driver_->spi_write_read(line, word_bits, tx,
                                   static_cast<int>(rx_words));
  });
}

void AnalogDiscovery::restore_dynamic_auto_configure() {
  require("restore auto configure");
  driver_->set_auto_configure(AutoConfigure::Dynamic);
}

void AnalogDiscovery::reset_analog_input() {
  require("reset analog input");
  driver_->analog_in_reset();
  record_started_ = false;
  acquisition_started_ = false;
  screen_started_ = false;
}

void AnalogDiscovery::reset_analog_output(WaveGenChannel ch) {
  require("reset analog output");
  driver_->analog_out_reset(ch);
  played_.erase(ch);
}

void AnalogDiscovery::reset_analog_io() {
  require("reset analog IO");
  driver_->analog_io_reset();
}

void AnalogDiscovery::reset_digital_io() {
  require("reset digital IO");
  driver_->digital_io_reset();
}

} // namespace discovery
} // namespace analogbench
