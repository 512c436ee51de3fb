#include "analog-bench/types.hpp"
#include "analog-bench/errors.hpp"

#include <fmt/format.h>

namespace analogbench {

const char *to_string(DeviceState state) {
  switch (state) {
  case DeviceState::Unacquired:
    return "unacquired";
  case DeviceState::Acquired:
    return "acquired";
  case DeviceState::Released:
    return "released";
  }
  return "unknown";
}

void require_acquired(DeviceState state, const std::string &device,
                      const std::string &operation) {
  if (state != DeviceState::Acquired) {
    throw NotAcquiredError(fmt::format("{}: cannot {} on a {} device", device,
                                       operation, to_string(state)));
  }
}

} // namespace analogbench
