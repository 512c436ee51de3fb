#pragma once
#include "analog-bench/export.h"
#include "analog-bench/m1k/SmuTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace analogbench {
namespace m1k {

/// Seam between Adalm1k and the source-measure unit SDK.
///
/// One driver owns one session with at most one attached device.
/// Implementations report SDK failures as LibsmuError and a missing
/// device as DeviceNotFoundError.
class ANALOG_BENCH_API SmuDriver {
public:
  virtual ~SmuDriver() = default;

  /// Scan the bus and return the serial numbers found
  virtual std::vector<std::string> scan() = 0;

  /// Attach the index-th device found by the last scan
  virtual void attach(std::size_t index) = 0;

  /// Detach and tear the session down. Safe to call when nothing is attached.
  virtual void detach() = 0;

  virtual std::string serial() const = 0;

  virtual void set_mode(SmuChannel ch, SmuMode mode) = 0;
  virtual SmuMode mode(SmuChannel ch) const = 0;

  /// Generate samples of signal for the quantity ch sources in its mode
  virtual std::vector<float> generate(SmuChannel ch,
                                      const SignalParameters &signal,
                                      std::size_t samples) = 0;

  virtual SignalInfo signal_info(SmuChannel ch) const = 0;

  /// Overcurrent flag of the most recent read
  virtual bool overcurrent() const = 0;

  /// Queue samples for output; cyclic buffers repeat until replaced
  virtual void write(SmuChannel ch, const std::vector<float> &data,
                     bool cyclic) = 0;

  /// Drop queued output samples of one channel
  virtual void flush_write(SmuChannel ch) = 0;

  /// Drop all queued input and output samples
  virtual void flush() = 0;

  /// Non-blocking start; samples == 0 runs continuously
  virtual void start(std::size_t samples) = 0;

  /// Blocking run of samples
  virtual void run(std::size_t samples) = 0;

  virtual void cancel() = 0;
  virtual void end() = 0;

  /// Read up to samples frames. timeout_ms 0 returns what is queued,
  /// a negative timeout blocks until samples frames arrived.
  virtual std::vector<Frame> read(std::size_t samples, int timeout_ms) = 0;

  virtual bool continuous() const = 0;
  virtual bool cancelled() const = 0;

  virtual unsigned sample_rate() const = 0;
  virtual void configure(unsigned sample_rate) = 0;

  virtual std::size_t queue_size() const = 0;

  virtual void set_leds(unsigned mask) = 0;
};

} // namespace m1k
} // namespace analogbench
