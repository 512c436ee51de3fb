#pragma once
#include "analog-bench/DeviceContext.hpp"
#include "analog-bench/export.h"
#include "analog-bench/m1k/Adalm1k.hpp"

#include <chrono>
#include <cstddef>

namespace analogbench {
namespace m1k {

struct CaptureSetup {
  SmuMode mode_a{SmuMode::HiZ};
  SmuMode mode_b{SmuMode::HiZ};
  double output_a{0.0}; // V or A, depending on mode_a
  double output_b{0.0};
  std::size_t samples{0}; // 0 = continuous
  std::chrono::milliseconds settle_time{1000};
};

/// Configures both channels and starts a capture on an open Adalm1k.
/// restore() puts both channels in HiZ and ends the capture. A setup that
/// fails part way runs the same reset before the error propagates.
class ANALOG_BENCH_API CaptureGuard {
public:
  CaptureGuard(Adalm1k &device, const CaptureSetup &setup);
  ~CaptureGuard();

  CaptureGuard(const CaptureGuard &) = delete;
  CaptureGuard &operator=(const CaptureGuard &) = delete;

  void restore();

  const CaptureSetup &setup() const { return setup_; }

private:
  void reset_channels(ResetSequence &reset);

  Adalm1k &device_;
  CaptureSetup setup_;
  bool restored_{false};
};

/// Open an ADALM1000, configure both channels and capture until released.
///
///   SmuContext ctx(smu, 0, CaptureSetup{SmuMode::SVMI, SmuMode::HiZ, 1.0});
///   auto frames = ctx->read_all(1000, -1);
using SmuContext = DeviceContext<Adalm1k, CaptureGuard>;

} // namespace m1k
} // namespace analogbench
