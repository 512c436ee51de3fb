#pragma once
#include "analog-bench/discovery/ScopeDriver.hpp"
#include "analog-bench/dwf/DwfLibrary.hpp"
#include "analog-bench/export.h"

#include <memory>

namespace analogbench {
namespace dwf {

using discovery::AcquisitionMode;
using discovery::AnalogFilter;
using discovery::AutoConfigure;
using discovery::Coupling;
using discovery::DeviceConfigInfo;
using discovery::DeviceInfo;
using discovery::DigitalIdle;
using discovery::I2CReadResult;
using discovery::InstrumentState;
using discovery::OutputIdle;
using discovery::OutputWaveform;
using discovery::RangeInfo;
using discovery::RecordStatus;
using discovery::ScopeChannel;
using discovery::SpiBitOrder;
using discovery::SpiLine;
using discovery::TriggerSettings;
using discovery::TriggerSlope;
using discovery::TriggerSource;
using discovery::TriggerTimestamp;
using discovery::WaveGenChannel;

/// ScopeDriver over the WaveForms runtime. Holds one HDWF.
class ANALOG_BENCH_API DwfScopeDriver : public discovery::ScopeDriver {
public:
  /// Loads the default runtime when no library is given
  explicit DwfScopeDriver(std::shared_ptr<DwfLibrary> library = nullptr);
  ~DwfScopeDriver() override;

  DwfScopeDriver(const DwfScopeDriver &) = delete;
  DwfScopeDriver &operator=(const DwfScopeDriver &) = delete;

  std::string library_version() override;
  std::vector<DeviceInfo> enumerate() override;
  std::vector<DeviceConfigInfo> enumerate_configs(int device_index) override;

  void open(int config_index) override;
  void close() override;
  void set_auto_configure(AutoConfigure mode) override;
  AutoConfigure auto_configure() override;

  int analog_in_bits() override;
  void analog_in_reset() override;
  void analog_in_configure(bool reconfigure, bool start) override;
  InstrumentState analog_in_status(bool read_data) override;
  RecordStatus analog_in_record_status() override;
  int analog_in_samples_valid() override;
  std::vector<int16_t> analog_in_data16(ScopeChannel ch, int first,
                                        int count) override;
  std::vector<double> analog_in_data(ScopeChannel ch, int count) override;
  double analog_in_sample(ScopeChannel ch) override;
  TriggerTimestamp analog_in_trigger_time() override;
  int analog_in_max_buffer_size() override;
  void analog_in_set_buffer_size(int size) override;
  void analog_in_set_frequency(double hz) override;
  void analog_in_set_acquisition_mode(AcquisitionMode mode) override;
  void analog_in_set_record_length(double seconds) override;
  void analog_in_enable(ScopeChannel ch, bool enable) override;
  bool analog_in_enabled(ScopeChannel ch) override;
  void analog_in_set_filter(ScopeChannel ch, AnalogFilter filter) override;
  void analog_in_set_range(ScopeChannel ch, double volts) override;
  double analog_in_range(ScopeChannel ch) override;
  RangeInfo analog_in_range_info() override;
  void analog_in_set_offset(ScopeChannel ch, double volts) override;
  double analog_in_offset(ScopeChannel ch) override;
  void analog_in_set_coupling(ScopeChannel ch, Coupling coupling) override;
  Coupling analog_in_coupling(ScopeChannel ch) override;
  void analog_in_set_trigger(ScopeChannel ch,
                             const TriggerSettings &trigger) override;

  void analog_out_reset(WaveGenChannel ch) override;
  void analog_out_reset_all() override;
  void analog_out_configure(WaveGenChannel ch, bool start) override;
  InstrumentState analog_out_status(WaveGenChannel ch) override;
  void analog_out_enable(WaveGenChannel ch, bool enable) override;
  bool analog_out_enabled(WaveGenChannel ch) override;
  void analog_out_set_waveform(WaveGenChannel ch,
                               const OutputWaveform &waveform) override;
  OutputWaveform analog_out_waveform(WaveGenChannel ch) override;
  void analog_out_set_data(WaveGenChannel ch,
                           const std::vector<double> &data) override;
  void analog_out_set_timing(WaveGenChannel ch, double run_seconds,
                             double wait_seconds, int repeats) override;
  void analog_out_set_idle(WaveGenChannel ch, OutputIdle idle) override;
  void analog_out_set_trigger(WaveGenChannel ch, TriggerSource source,
                              TriggerSlope slope) override;

  void analog_io_reset() override;
  void analog_io_status() override;
  void analog_io_enable(bool enable) override;
  bool analog_io_enabled() override;
  void analog_io_set_node(int channel, int node, double value) override;
  double analog_io_node(int channel, int node) override;
  double analog_io_node_status(int channel, int node) override;

  void digital_in_reset() override;
  void digital_out_reset() override;
  void digital_io_reset() override;
  void digital_io_status() override;
  uint32_t digital_io_input() override;
  uint32_t digital_io_output() override;
  void digital_io_set_output(uint32_t mask) override;
  uint32_t digital_io_output_enable() override;
  void digital_io_set_output_enable(uint32_t mask) override;

  void i2c_reset() override;
  void i2c_set_clock_pin(int pin) override;
  void i2c_set_data_pin(int pin) override;
  void i2c_set_rate(double hz) override;
  void i2c_set_read_nak(bool nak_last_byte) override;
  bool i2c_clear() override;
  I2CReadResult i2c_read(uint8_t address8, int count) override;
  int i2c_write(uint8_t address8, const std::vector<uint8_t> &data) override;

  void spi_reset() override;
  void spi_set_frequency(double hz) override;
  void spi_set_clock_pin(int pin) override;
  void spi_set_data_pin(int dq, int pin) override;
  void spi_set_idle(int dq, DigitalIdle idle) override;
  void spi_set_mode(int mode) override;
  void spi_set_bit_order(SpiBitOrder order) override;
  void spi_select(int pin, int level) override;
  uint32_t spi_read_one(SpiLine line, int bits) override;
  std::vector<uint32_t> spi_read(SpiLine line, int word_bits,
                                 int count) override;
  void spi_write_one(SpiLine line, int bits, uint32_t word) override;
  void spi_write(SpiLine line, int word_bits,
                 const std::vector<uint32_t> &words) override;
  std::vector<uint32_t> spi_write_read(SpiLine line, int word_bits,
                                       const std::vector<uint32_t> &tx,
                                       int rx_count) override;

private:
  /// Throws DwfError unless the call returned success
  void check(int result, const char *call) const;
  HDWF handle(const char *call) const;

  std::shared_ptr<DwfLibrary> lib_;
  HDWF hdwf_{hdwfNone};
};

} // namespace dwf
} // namespace analogbench
