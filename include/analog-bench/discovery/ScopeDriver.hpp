#pragma once
#include "analog-bench/discovery/ScopeTypes.hpp"
#include "analog-bench/export.h"

#include <cstdint>
#include <string>
#include <vector>

namespace analogbench {
namespace discovery {

/// Seam between AnalogDiscovery and the WaveForms SDK.
///
/// A driver holds at most one open device handle. Each call maps to one SDK
/// function; failures are thrown as DwfError with the SDK's last error.
/// Analog IO channel/node indices are passed through untouched.
class ANALOG_BENCH_API ScopeDriver {
public:
  virtual ~ScopeDriver() = default;

  // Library and enumeration
  virtual std::string library_version() = 0;
  virtual std::vector<DeviceInfo> enumerate() = 0;
  /// Configurations offered by the device_index-th enumerated device
  virtual std::vector<DeviceConfigInfo> enumerate_configs(int device_index) = 0;

  // Device. config_index 0 opens the default configuration.
  virtual void open(int config_index) = 0;
  virtual void close() = 0;
  virtual void set_auto_configure(AutoConfigure mode) = 0;
  virtual AutoConfigure auto_configure() = 0;

  // Analog in (oscilloscope)
  virtual int analog_in_bits() = 0;
  virtual void analog_in_reset() = 0;
  virtual void analog_in_configure(bool reconfigure, bool start) = 0;
  virtual InstrumentState analog_in_status(bool read_data) = 0;
  virtual RecordStatus analog_in_record_status() = 0;
  /// Valid samples in the buffer after the last status read
  virtual int analog_in_samples_valid() = 0;
  /// Raw samples from the last status read, starting at first
  virtual std::vector<int16_t> analog_in_data16(ScopeChannel ch, int first,
                                                int count) = 0;
  /// Samples in volts from the last status read
  virtual std::vector<double> analog_in_data(ScopeChannel ch, int count) = 0;
  virtual double analog_in_sample(ScopeChannel ch) = 0;
  virtual TriggerTimestamp analog_in_trigger_time() = 0;
  virtual int analog_in_max_buffer_size() = 0;
  virtual void analog_in_set_buffer_size(int size) = 0;
  virtual void analog_in_set_frequency(double hz) = 0;
  virtual void analog_in_set_acquisition_mode(AcquisitionMode mode) = 0;
  virtual void analog_in_set_record_length(double seconds) = 0;
  virtual void analog_in_enable(ScopeChannel ch, bool enable) = 0;
  virtual bool analog_in_enabled(ScopeChannel ch) = 0;
  virtual void analog_in_set_filter(ScopeChannel ch, AnalogFilter filter) = 0;
  virtual void analog_in_set_range(ScopeChannel ch, double volts) = 0;
  virtual double analog_in_range(ScopeChannel ch) = 0;
  virtual RangeInfo analog_in_range_info() = 0;
  virtual void analog_in_set_offset(ScopeChannel ch, double volts) = 0;
  virtual double analog_in_offset(ScopeChannel ch) = 0;
  virtual void analog_in_set_coupling(ScopeChannel ch, Coupling coupling) = 0;
  virtual Coupling analog_in_coupling(ScopeChannel ch) = 0;
  virtual void analog_in_set_trigger(ScopeChannel ch,
                                     const TriggerSettings &trigger) = 0;

  // Analog out (waveform generator)
  virtual void analog_out_reset(WaveGenChannel ch) = 0;
  virtual void analog_out_reset_all() = 0;
  virtual void analog_out_configure(WaveGenChannel ch, bool start) = 0;
  virtual InstrumentState analog_out_status(WaveGenChannel ch) = 0;
  virtual void analog_out_enable(WaveGenChannel ch, bool enable) = 0;
  virtual bool analog_out_enabled(WaveGenChannel ch) = 0;
  virtual void analog_out_set_waveform(WaveGenChannel ch,
                                       const OutputWaveform &waveform) = 0;
  virtual OutputWaveform analog_out_waveform(WaveGenChannel ch) = 0;
  virtual void analog_out_set_data(WaveGenChannel ch,
                                   const std::vector<double> &data) = 0;
  virtual void analog_out_set_timing(WaveGenChannel ch, double run_seconds,
                                     double wait_seconds, int repeats) = 0;
  virtual void analog_out_set_idle(WaveGenChannel ch, OutputIdle idle) = 0;
  virtual void analog_out_set_trigger(WaveGenChannel ch, TriggerSource source,
                                      TriggerSlope slope) = 0;

  // Analog IO (supplies and monitors)
  virtual void analog_io_reset() = 0;
  virtual void analog_io_status() = 0;
  virtual void analog_io_enable(bool enable) = 0;
  virtual bool analog_io_enabled() = 0;
  virtual void analog_io_set_node(int channel, int node, double value) = 0;
  virtual double analog_io_node(int channel, int node) = 0;
  virtual double analog_io_node_status(int channel, int node) = 0;

  // Digital instruments
  virtual void digital_in_reset() = 0;
  virtual void digital_out_reset() = 0;
  virtual void digital_io_reset() = 0;
  virtual void digital_io_status() = 0;
  virtual uint32_t digital_io_input() = 0;
  virtual uint32_t digital_io_output() = 0;
  virtual void digital_io_set_output(uint32_t mask) = 0;
  virtual uint32_t digital_io_output_enable() = 0;
  virtual void digital_io_set_output_enable(uint32_t mask) = 0;

  // I2C master. Addresses are 8 bit (7 bit address shifted left).
  virtual void i2c_reset() = 0;
  virtual void i2c_set_clock_pin(int pin) = 0;
  virtual void i2c_set_data_pin(int pin) = 0;
  /// Sets the bit rate and enables clock stretching
  virtual void i2c_set_rate(double hz) = 0;
  virtual void i2c_set_read_nak(bool nak_last_byte) = 0;
  /// Clears a locked bus. Returns false if the bus stays busy.
  virtual bool i2c_clear() = 0;
  virtual I2CReadResult i2c_read(uint8_t address8, int count) = 0;
  /// Returns the NAK indication, 0 when every byte was acknowledged
  virtual int i2c_write(uint8_t address8, const std::vector<uint8_t> &data) = 0;

  // SPI master
  virtual void spi_reset() = 0;
  virtual void spi_set_frequency(double hz) = 0;
  virtual void spi_set_clock_pin(int pin) = 0;
  /// dq 0 is MOSI/SISO, 1 is MISO, 2 and 3 are the quad lines
  virtual void spi_set_data_pin(int dq, int pin) = 0;
  virtual void spi_set_idle(int dq, DigitalIdle idle) = 0;
  virtual void spi_set_mode(int mode) = 0;
  virtual void spi_set_bit_order(SpiBitOrder order) = 0;
  /// level 0 drives low, 1 drives high, -1 releases the line
  virtual void spi_select(int pin, int level) = 0;
  virtual uint32_t spi_read_one(SpiLine line, int bits) = 0;
  virtual std::vector<uint32_t> spi_read(SpiLine line, int word_bits,
                                         int count) = 0;
  virtual void spi_write_one(SpiLine line, int bits, uint32_t word) = 0;
  virtual void spi_write(SpiLine line, int word_bits,
                         const std::vector<uint32_t> &words) = 0;
  virtual std::vector<uint32_t> spi_write_read(SpiLine line, int word_bits,
                                               const std::vector<uint32_t> &tx,
                                               int rx_count) = 0;
};

} // namespace discovery
} // namespace analogbench
