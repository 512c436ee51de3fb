#pragma once
#include "analog-bench/export.h"
#include "analog-bench/m1k/SmuDriver.hpp"

#include <array>
#include <memory>

namespace smu {
class Session;
class Device;
class Signal;
} // namespace smu

namespace analogbench {
namespace m1k {

/// SmuDriver over a libsmu session
class ANALOG_BENCH_API LibsmuDriver : public SmuDriver {
public:
  LibsmuDriver();
  ~LibsmuDriver() override;

  LibsmuDriver(const LibsmuDriver &) = delete;
  LibsmuDriver &operator=(const LibsmuDriver &) = delete;

  std::vector<std::string> scan() override;
  void attach(std::size_t index) override;
  void detach() override;
  std::string serial() const override;

  void set_mode(SmuChannel ch, SmuMode mode) override;
  SmuMode mode(SmuChannel ch) const override;

  std::vector<float> generate(SmuChannel ch, const SignalParameters &signal,
                              std::size_t samples) override;
  SignalInfo signal_info(SmuChannel ch) const override;
  bool overcurrent() const override;

  void write(SmuChannel ch, const std::vector<float> &data,
             bool cyclic) override;
  void flush_write(SmuChannel ch) override;
  void flush() override;

  void start(std::size_t samples) override;
  void run(std::size_t samples) override;
  void cancel() override;
  void end() override;

  std::vector<Frame> read(std::size_t samples, int timeout_ms) override;

  bool continuous() const override;
  bool cancelled() const override;
  unsigned sample_rate() const override;
  void configure(unsigned sample_rate) override;
  std::size_t queue_size() const override;
  void set_leds(unsigned mask) override;

private:
  ::smu::Device &device() const;
  ::smu::Session &session();
  ::smu::Signal &signal(SmuChannel ch) const;

  std::unique_ptr<::smu::Session> session_;
  ::smu::Device *device_{nullptr};
  // libsmu resets both channels to HI_Z when a device is added
  std::array<SmuMode, 2> modes_{SmuMode::HiZ, SmuMode::HiZ};
};

} // namespace m1k
} // namespace analogbench
