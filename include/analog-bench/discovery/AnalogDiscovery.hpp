#pragma once
#include "analog-bench/discovery/ScopeDriver.hpp"
#include "analog-bench/discovery/ScopeTypes.hpp"
#include "analog-bench/export.h"
#include "analog-bench/types.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace analogbench {
namespace discovery {

/// Digilent Analog Discovery: oscilloscope, waveform generator,
/// programmable supplies, static digital IO and the I2C and SPI masters.
///
/// Same lifecycle as the SMU wrapper: Unacquired -> Acquired on open(),
/// Acquired -> Released on close(). Only devices_info(),
/// device_config_info() and library_version() work without an open device.
class ANALOG_BENCH_API AnalogDiscovery {
public:
  explicit AnalogDiscovery(std::unique_ptr<ScopeDriver> driver,
                           SettleTimes settle = {});
  ~AnalogDiscovery();

  AnalogDiscovery(const AnalogDiscovery &) = delete;
  AnalogDiscovery &operator=(const AnalogDiscovery &) = delete;

  const std::string &name() const { return name_; }
  DeviceState state() const { return state_; }
  bool acquired() const { return state_ == DeviceState::Acquired; }
  const SettleTimes &settle_times() const { return settle_; }

  /// Open the first device. config_index 0 selects the default
  /// configuration.
  void open(int config_index = 0);
  void close();

  std::vector<DeviceInfo> devices_info();
  /// Configurations of the device_index-th enumerated device
  std::vector<DeviceConfigInfo> device_config_info(int device_index = 0);
  std::string library_version();
  int adc_bits();
  AutoConfigure auto_configure();

  void reset_analog_instrument();
  void reset_digital_instrument();

  void enable_channel(const AnalogChannel &ch);
  void disable_channel(const AnalogChannel &ch);
  bool channel_enabled(const AnalogChannel &ch);

  // Waveform generator

  /// Configure and start the channels. Returns once the outputs run.
  void play(const std::vector<WaveGenChannel> &channels,
            const PlaySettings &settings);
  InstrumentState play_status(WaveGenChannel ch);

  // Oscilloscope

  /// Start a record-mode acquisition. Does not wait for data.
  void record(const std::vector<ScopeChannel> &channels,
              const RecordSettings &settings);
  /// Poll the instrument and fetch the samples it holds
  InstrumentState record_status();
  /// Samples fetched by the last record_status()
  std::vector<double> read_recorded(ScopeChannel ch);
  /// Block until samples_count samples were recorded
  std::vector<double> fill_recorded_samples(ScopeChannel ch,
                                            std::size_t samples_count);
  std::vector<std::vector<double>>
  fill_recorded_samples(const std::vector<ScopeChannel> &channels,
                        std::size_t samples_count);
  /// Fetch into a ring of samples_count until the recording is Done and
  /// return its last samples_count samples, oldest first. Needs a recording
  /// with a finite length.
  std::vector<double> fill_recorded_circular(ScopeChannel ch,
                                             std::size_t samples_count);

  /// Start a scan-shift screen for monitoring slow signals
  void start_analog_screen(const std::vector<ScopeChannel> &channels,
                           const ScreenSettings &settings);
  /// Poll the running screen for scan_duration (at least once) and return
  /// the valid part of the screen per channel
  std::vector<std::vector<double>>
  retrieve_analog_screen(const std::vector<ScopeChannel> &channels,
                         std::size_t samples_count,
                         std::chrono::milliseconds scan_duration);

  /// One buffer of samples on ch, blocking until the acquisition is done
  std::vector<double> acquire_single(ScopeChannel ch,
                                     const AcquisitionSettings &settings);
  /// Arm repeated triggered acquisitions
  void start_acquisition(const std::vector<ScopeChannel> &channels,
                         const AcquisitionSettings &settings);
  /// Wait for captures acquisitions and return each with its trigger time
  std::vector<Capture>
  retrieve_acquisitions(const std::vector<ScopeChannel> &channels,
                        std::size_t samples_count, std::size_t captures = 1);

  double read_voltage(ScopeChannel ch);

  RangeInfo input_range_info();
  Coupling coupling(ScopeChannel ch);
  void set_coupling(ScopeChannel ch, Coupling coupling);

  // Programmable supplies. Levels are clamped to [0, 5] V and [-5, 0] V.

  void configure_power_supply(double positive_voltage,
                              std::optional<double> negative_voltage = {});
  void enable_power_supply();
  void disable_power_supply();
  bool power_supply_enabled();
  void set_power_supply_voltages(double positive_voltage,
                                 std::optional<double> negative_voltage = {});
  SupplyVoltages power_supply_voltages();
  SupplyMonitor power_supply_monitor();

  // Static digital IO

  /// output true drives the pin, false makes it an input
  void set_digital_mode(DigitalPin pin, bool output);
  bool digital_mode(DigitalPin pin);
  void set_digital_state(DigitalPin pin, bool high);
  bool digital_state(DigitalPin pin);

  // I2C master. Addresses are 7 bit.

  /// Set the pins and rate, then clear the bus. Throws BenchError if the
  /// bus stays locked.
  void configure_i2c(DigitalPin sda, DigitalPin scl, double rate = 1e5);
  void reset_i2c();
  I2CReadResult i2c_read(uint8_t address, std::size_t bytes_count);
  /// Returns the NAK indication, 0 when every byte was acknowledged
  int i2c_write(uint8_t address, const std::vector<uint8_t> &data);

  // SPI master. Each transfer drives chip select low, then high again.
  // Array transfers take 8, 16 or 32 bit words.

  void configure_spi(const SpiSettings &settings);
  void reset_spi();
  uint32_t spi_read_one(DigitalPin cs, int bits,
                        SpiLine line = SpiLine::MosiMiso);
  std::vector<uint32_t> spi_read(DigitalPin cs, int word_bits,
                                 std::size_t words,
                                 SpiLine line = SpiLine::MosiMiso);
  void spi_write_one(DigitalPin cs, int bits, uint32_t word,
                     SpiLine line = SpiLine::MosiMiso);
  void spi_write(DigitalPin cs, int word_bits,
                 const std::vector<uint32_t> &words,
                 SpiLine line = SpiLine::MosiMiso);
  std::vector<uint32_t> spi_exchange(DigitalPin cs, int word_bits,
                                     const std::vector<uint32_t> &tx,
                                     std::size_t rx_words,
                                     SpiLine line = SpiLine::MosiMiso);

  // Resets used by the scoped guards
  void restore_dynamic_auto_configure();
  void reset_analog_input();
  void reset_analog_output(WaveGenChannel ch);
  void reset_analog_io();
  void reset_digital_io();

private:
  void require(const char *operation) const;
  template <typename Channel>
  void require_enabled(const std::vector<Channel> &channels,
                       const char *operation);
  void check_record(const char *operation) const;
  std::size_t clamp_to_buffer(std::size_t samples_count);
  void apply_input_settings(ScopeChannel ch, double range, double offset,
                            AnalogFilter filter);
  InstrumentState wait_done();
  void check_i2c(const char *operation) const;
  void check_spi(const char *operation) const;
  template <typename Transfer>
  auto selected(DigitalPin cs, Transfer &&transfer) -> decltype(transfer());

  std::string name_{"AnalogDiscovery"};
  std::unique_ptr<ScopeDriver> driver_;
  SettleTimes settle_;
  DeviceState state_{DeviceState::Unacquired};
  bool record_started_{false};
  bool acquisition_started_{false};
  bool record_bounded_{false};
  bool screen_started_{false};
  bool i2c_configured_{false};
  bool spi_configured_{false};
  std::set<WaveGenChannel> played_;
};

} // namespace discovery
} // namespace analogbench
