#pragma once
#include "analog-bench/DeviceContext.hpp"
#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/export.h"

#include <optional>

namespace analogbench {
namespace discovery {

/// Enables scope and wavegen channels on an open AnalogDiscovery.
/// restore() re-enables dynamic auto-configure, resets the scope and each
/// listed wavegen channel. Every guard below runs its reset when its
/// constructor fails part way, then rethrows. A reset step that fails does
/// not stop the steps after it.
class ANALOG_BENCH_API ChannelGuard {
public:
  ChannelGuard(AnalogDiscovery &device, ChannelList channels);
  ~ChannelGuard();

  ChannelGuard(const ChannelGuard &) = delete;
  ChannelGuard &operator=(const ChannelGuard &) = delete;

  void restore();

  const ChannelList &channels() const { return channels_; }

private:
  void reset(ResetSequence &sequence);

  AnalogDiscovery &device_;
  ChannelList channels_;
  bool restored_{false};
};

/// Configures the programmable supplies, optionally switching them on.
/// restore() switches them off if this guard switched them on, then resets
/// the analog IO instrument.
class ANALOG_BENCH_API SupplyGuard {
public:
  SupplyGuard(AnalogDiscovery &device, double positive_voltage,
              std::optional<double> negative_voltage = {},
              bool enable = false);
  ~SupplyGuard();

  SupplyGuard(const SupplyGuard &) = delete;
  SupplyGuard &operator=(const SupplyGuard &) = delete;

  void restore();

private:
  void reset(ResetSequence &sequence, bool disable);

  AnalogDiscovery &device_;
  bool enabled_{false};
  bool restored_{false};
};

/// Sets pin directions. restore() resets the digital IO instrument.
class ANALOG_BENCH_API DigitalIOGuard {
public:
  DigitalIOGuard(AnalogDiscovery &device, const PinList &inputs,
                 const PinList &outputs);
  ~DigitalIOGuard();

  DigitalIOGuard(const DigitalIOGuard &) = delete;
  DigitalIOGuard &operator=(const DigitalIOGuard &) = delete;

  void restore();

private:
  void reset(ResetSequence &sequence);

  AnalogDiscovery &device_;
  bool restored_{false};
};

/// Configures the I2C master. restore() resets it.
class ANALOG_BENCH_API I2CGuard {
public:
  I2CGuard(AnalogDiscovery &device, DigitalPin sda, DigitalPin scl,
           double rate = 1e5);
  ~I2CGuard();

  I2CGuard(const I2CGuard &) = delete;
  I2CGuard &operator=(const I2CGuard &) = delete;

  void restore();

private:
  void reset(ResetSequence &sequence);

  AnalogDiscovery &device_;
  bool restored_{false};
};

/// Configures the SPI master and deselects the chip. restore() resets it.
class ANALOG_BENCH_API SPIGuard {
public:
  SPIGuard(AnalogDiscovery &device, const SpiSettings &settings);
  ~SPIGuard();

  SPIGuard(const SPIGuard &) = delete;
  SPIGuard &operator=(const SPIGuard &) = delete;

  void restore();

  const SpiSettings &settings() const { return settings_; }

private:
  void reset(ResetSequence &sequence);

  AnalogDiscovery &device_;
  SpiSettings settings_;
  bool restored_{false};
};

/// Open with a configuration index and enable channels until released.
///
///   ScopeWaveGenContext ctx(ad, 0, ChannelList{ScopeChannel::Channel1});
using ScopeWaveGenContext = DeviceContext<AnalogDiscovery, ChannelGuard>;
using PowerSupplyContext = DeviceContext<AnalogDiscovery, SupplyGuard>;
using DigitalIOContext = DeviceContext<AnalogDiscovery, DigitalIOGuard>;
using I2CContext = DeviceContext<AnalogDiscovery, I2CGuard>;
using SPIContext = DeviceContext<AnalogDiscovery, SPIGuard>;

} // namespace discovery
} // namespace analogbench
