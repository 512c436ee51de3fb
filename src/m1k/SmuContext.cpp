#include "analog-bench/m1k/SmuContext.hpp"
#include "analog-bench/Logger.hpp"

#include <thread>

namespace analogbench {
namespace m1k {

CaptureGuard::CaptureGuard(Adalm1k &device, const CaptureSetup &setup)
    : device_(device), setup_(setup) {
  try {
    device_.set_channel_mode(SmuChannel::A, setup_.mode_a);
    device_.set_channel_mode(SmuChannel::B, setup_.mode_b);
    device_.flush();
    device_.set_constant_output(SmuChannel::A, setup_.output_a);
    device_.set_constant_output(SmuChannel::B, setup_.output_b);

    // Let the outputs settle before sampling
    std::this_thread::sleep_for(setup_.settle_time);

    device_.start_capture(setup_.samples);
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "ACQUIRE",
              "Capture setup failed, resetting channels: {}", ex.what());
    restored_ = true;
    ResetSequence reset(device_.name());
    reset_channels(reset);
    throw;
  }
  LOG_INFO(device_.name(), "ACQUIRE", "Channel A {} {}, channel B {} {}",
           to_string(setup_.mode_a), setup_.output_a, to_string(setup_.mode_b),
           setup_.output_b);
}

CaptureGuard::~CaptureGuard() {
  if (restored_) {
    return;
  }
  try {
    restore();
  } catch (const std::exception &ex) {
    LOG_ERROR(device_.name(), "RELEASE", "Failed to restore channels: {}",
              ex.what());
  }
}

void CaptureGuard::reset_channels(ResetSequence &reset) {
  reset.run("Channel A to HiZ",
            [this] { device_.set_channel_mode(SmuChannel::A, SmuMode::HiZ); });
  reset.run("Channel B to HiZ",
            [this] { device_.set_channel_mode(SmuChannel::B, SmuMode::HiZ); });
  reset.run("End capture", [this] { device_.end_capture(); });
}

void CaptureGuard::restore() {
  if (restored_) {
    return;
  }
  restored_ = true;
  ResetSequence reset(device_.name());
  reset_channels(reset);
  reset.rethrow_first();
  LOG_INFO(device_.name(), "RELEASE", "Channels set to HiZ, capture ended");
}

} // namespace m1k
} // namespace analogbench
