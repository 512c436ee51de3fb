#include "analog-bench/m1k/LibsmuDriver.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <fmt/format.h>
#include <libsmu/libsmu.hpp>
#include <system_error>

namespace analogbench {
namespace m1k {

namespace {

// libsmu reports failures as negative errno values
void check(int ret, const char *call) {
  if (ret < 0) {
    throw LibsmuError(-ret, fmt::format("{}: {}", call,
                                        std::system_category().message(-ret)));
  }
}

unsigned channel_index(SmuChannel ch) { return static_cast<unsigned>(ch); }

// libsmu signal 0 is the channel voltage, 1 its current
constexpr unsigned kVoltageSignal = 0;
constexpr unsigned kCurrentSignal = 1;

} // namespace

LibsmuDriver::LibsmuDriver() = default;

LibsmuDriver::~LibsmuDriver() {
  try {
    detach();
  } catch (const std::exception &ex) {
    LOG_ERROR("LIBSMU", "DETACH", "Failed to detach device: {}", ex.what());
  }
}

::smu::Device &LibsmuDriver::device() const {
  if (!device_) {
    throw NotAcquiredError("no ADALM1K device attached to the libsmu session");
  }
  return *device_;
}

std::vector<std::string> LibsmuDriver::scan() {
  check(session().scan(), "scan");
  std::vector<std::string> serials;
  for (auto *dev : session().m_available_devices) {
    serials.push_back(std::string(dev->m_serial));
  }
  LOG_DEBUG("LIBSMU", "SCAN", "Found {} device(s)", serials.size());
  return serials;
}

void LibsmuDriver::attach(std::size_t index) {
  if (index >= session().m_available_devices.size()) {
    throw DeviceNotFoundError(
        fmt::format("libsmu device index {} out of range", index));
  }
  auto *dev = session().m_available_devices[index];
  check(session().add(dev), "add");
  device_ = dev;
  modes_ = {SmuMode::HiZ, SmuMode::HiZ};
  check(session().configure(device_->get_default_rate()), "configure");
}

void LibsmuDriver::detach() {
  // Destroying the session ends any capture and releases the USB handles
  device_ = nullptr;
  session_.reset();
}

::smu::Session &LibsmuDriver::session() {
  if (!session_) {
    session_ = std::make_unique<::smu::Session>();
  }
  return *session_;
}


std::string LibsmuDriver::serial() const {
  return std::string(device().m_serial);
}

void LibsmuDriver::set_mode(SmuChannel ch, SmuMode mode) {
  check(device().set_mode(channel_index(ch), static_cast<unsigned>(mode)),
        "set_mode");
  modes_[channel_index(ch)] = mode;
}

SmuMode LibsmuDriver::mode(SmuChannel ch) const {
  if (!device_) {
    throw NotAcquiredError("no ADALM1K device attached to the libsmu session");
  }
  return modes_[channel_index(ch)];
}

::smu::Signal &LibsmuDriver::signal(SmuChannel ch) const {
  auto index = channel_index(ch);
  auto *sig = device().signal(index, sources_current(modes_[index])
                                         ? kCurrentSignal
                                         : kVoltageSignal);
  if (!sig) {
    throw LibsmuError(0, fmt::format("no signal on channel {}", to_string(ch)));
  }
  return *sig;
}

std::vector<float> LibsmuDriver::generate(SmuChannel ch,
                                          const SignalParameters &p,
                                          std::size_t samples) {
  auto &sig = signal(ch);
  auto mid = static_cast<float>(p.mid_point);
  auto peak = static_cast<float>(p.peak);
  std::vector<float> buf;
  switch (p.shape) {
  case SignalShape::Constant:
    sig.constant(buf, samples, mid);
    break;
  case SignalShape::Square:
    sig.square(buf, samples, mid, peak, p.period, p.phase, p.duty);
    break;
  case SignalShape::Sawtooth:
    sig.sawtooth(buf, samples, mid, peak, p.period, p.phase);
    break;
  case SignalShape::Stairstep:
    sig.stairstep(buf, samples, mid, peak, p.period, p.phase);
    break;
  case SignalShape::Sine:
    sig.sine(buf, samples, mid, peak, p.period, p.phase);
    break;
  case SignalShape::Triangle:
    sig.triangle(buf, samples, mid, peak, p.period, p.phase);
    break;
  }
  return buf;
}

SignalInfo LibsmuDriver::signal_info(SmuChannel ch) const {
  const auto *info = signal(ch).info();
  return {info->label ? std::string(info->label) : std::string(), info->min,
          info->max, info->resolution};
}

bool LibsmuDriver::overcurrent() const {
  return static_cast<bool>(device().m_overcurrent);
}

void LibsmuDriver::write(SmuChannel ch, const std::vector<float> &data,
                         bool cyclic) {
  std::vector<float> buf(data);
  check(device().write(buf, channel_index(ch), cyclic), "write");
}

void LibsmuDriver::flush_write(SmuChannel ch) {
  device().flush(static_cast<int>(channel_index(ch)));
}

void LibsmuDriver::flush() { session().flush(); }

void LibsmuDriver::start(std::size_t samples) {
  check(session().start(samples), "start");
}

void LibsmuDriver::run(std::size_t samples) {
  check(session().run(samples), "run");
}

void LibsmuDriver::cancel() { check(session().cancel(), "cancel"); }

void LibsmuDriver::end() { check(session().end(), "end"); }

std::vector<Frame> LibsmuDriver::read(std::size_t samples, int timeout_ms) {
  std::vector<std::array<float, 4>> buf;
  try {
    device().read(buf, samples, timeout_ms);
  } catch (const std::system_error &ex) {
    // Raised on dropped samples
    throw LibsmuError(ex.code().value(), ex.what());
  }

  std::vector<Frame> frames;
  frames.reserve(buf.size());
  for (const auto &raw : buf) {
    frames.push_back(Frame{{raw[0], raw[1]}, {raw[2], raw[3]}});
  }
  return frames;
}

bool LibsmuDriver::continuous() const {
  return session_ && session_->m_continuous;
}

bool LibsmuDriver::cancelled() const {
  return session_ && session_->cancelled();
}

unsigned LibsmuDriver::sample_rate() const {
  return session_ ? static_cast<unsigned>(session_->m_sample_rate) : 0;
}

void LibsmuDriver::configure(unsigned sample_rate) {
  check(session().configure(sample_rate), "configure");
}

std::size_t LibsmuDriver::queue_size() const {
  return session_ ? static_cast<std::size_t>(session_->m_queue_size) : 0;
}

void LibsmuDriver::set_leds(unsigned mask) {
  check(device().set_led(mask), "set_led");
}

} // namespace m1k
} // namespace analogbench
