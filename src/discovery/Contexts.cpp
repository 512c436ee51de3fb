#include "analog-bench/discovery/Contexts.hpp"
#include "analog-bench/Logger.hpp"

#include <exception>

namespace analogbench {
namespace discovery {

ChannelGuard::ChannelGuard(AnalogDiscovery &device, ChannelList channels)
    : device_(device), channels_(std::move(channels)) {
  try {
    for (const auto &ch : channels_) {
      device_.enable_channel(ch);
    }
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "Enabling channels failed, resetting them: {}", ex.what());
    restored_ = true;
    ResetSequence sequence(device_.name());
    reset(sequence);
    throw;
  }
  LOG_INFO(device_.name(), "ACQUIRE", "Enabled {} scope/wavegen channel(s)",
           channels_.size());
}

ChannelGuard::~ChannelGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to reset channels: {}",
              ex.what());
  }
}

void ChannelGuard::reset(ResetSequence &sequence) {
  sequence.run("Restore auto configure",
               [this] { device_.restore_dynamic_auto_configure(); });
  sequence.run("Reset scope", [this] { device_.reset_analog_input(); });
  for (const auto &ch : channels_) {
    if (auto *out = std::get_if<WaveGenChannel>(&ch)) {
      auto wavegen = *out;
      sequence.run("Reset wavegen",
                   [this, wavegen] { device_.reset_analog_output(wavegen); });
    }
  }
}

void ChannelGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence sequence(device_.name());
  reset(sequence);
  sequence.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "Scope and wavegen channels reset");
}

SupplyGuard::SupplyGuard(AnalogDiscovery &device, double positive_voltage,
                         std::optional<double> negative_voltage, bool enable)
    : device_(device) {
  try {
    device_.configure_power_supply(positive_voltage, negative_voltage);
    if (enable) {
      device_.enable_power_supply();
      enabled_ = true;
    }
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "Supply setup failed, switching supplies off: {}", ex.what());
    restored_ = true;
    ResetSequence sequence(device_.name());
    reset(sequence, true);
    throw;
  }
}

SupplyGuard::~SupplyGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to reset supplies: {}",
              ex.what());
  }
}

void SupplyGuard::reset(ResetSequence &sequence, bool disable) {
  if (disable) {
    sequence.run("Disable supplies", [this] { device_.disable_power_supply(); });
  }
  sequence.run("Reset analog IO", [this] { device_.reset_analog_io(); });
}

void SupplyGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence sequence(device_.name());
  reset(sequence, enabled_);
  sequence.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "Power supplies reset");
}

DigitalIOGuard::DigitalIOGuard(AnalogDiscovery &device, const PinList &inputs,
                               const PinList &outputs)
    : device_(device) {
  try {
    for (auto pin : inputs) {
      device_.set_digital_mode(pin, false);
    }
    for (auto pin : outputs) {
      device_.set_digital_mode(pin, true);
    }
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "Pin setup failed, resetting digital IO: {}", ex.what());
    restored_ = true;
    ResetSequence sequence(device_.name());
    reset(sequence);
    throw;
  }
  LOG_INFO(device_.name(), "ACQUIRE", "Configured {} input and {} output pin(s)",
           inputs.size(), outputs.size());
}

DigitalIOGuard::~DigitalIOGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to reset digital IO: {}",
              ex.what());
  }
}

void DigitalIOGuard::reset(ResetSequence &sequence) {
  sequence.run("Reset digital IO", [this] { device_.reset_digital_io(); });
}

void DigitalIOGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence sequence(device_.name());
  reset(sequence);
  sequence.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "Digital IO reset");
}

I2CGuard::I2CGuard(AnalogDiscovery &device, DigitalPin sda, DigitalPin scl,
                   double rate)
    : device_(device) {
  try {
    device_.configure_i2c(sda, scl, rate);
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "I2C setup failed, resetting the master: {}", ex.what());
    restored_ = true;
    ResetSequence sequence(device_.name());
    reset(sequence);
    throw;
  }
}

I2CGuard::~I2CGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to reset I2C: {}",
              ex.what());
  }
}

void I2CGuard::reset(ResetSequence &sequence) {
  sequence.run("Reset I2C", [this] { device_.reset_i2c(); });
}

void I2CGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence sequence(device_.name());
  reset(sequence);
  sequence.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "I2C master reset");
}

SPIGuard::SPIGuard(AnalogDiscovery &device, const SpiSettings &settings)
    : device_(device), settings_(settings) {
  try {
    device_.configure_spi(settings_);
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "SPI setup failed, resetting the master: {}", ex.what());
    restored_ = true;
    ResetSequence sequence(device_.name());
    reset(sequence);
    throw;
  }
}

SPIGuard::~SPIGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to reset SPI: {}",
              ex.what());
  }
}

void SPIGuard::reset(ResetSequence &sequence) {
  sequence.run("Reset SPI", [this] { device_.reset_spi(); });
}

void SPIGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence sequence(device_.name());
  reset(sequence);
  sequence.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "SPI master reset");
}

} // namespace discovery
} // namespace analogbench
