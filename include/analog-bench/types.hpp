#pragma once
#include "analog-bench/export.h"

#include <string>

namespace analogbench {

/// Lifecycle of a device wrapper. Released is terminal.
enum class DeviceState { Unacquired, Acquired, Released };

ANALOG_BENCH_API const char *to_string(DeviceState state);

/// Throws NotAcquiredError unless state is Acquired
ANALOG_BENCH_API void require_acquired(DeviceState state,
                                       const std::string &device,
                                       const std::string &operation);

} // namespace analogbench
