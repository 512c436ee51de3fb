#pragma once
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <exception>
#include <optional>
#include <string>
#include <utility>

namespace analogbench {

/// Runs reset steps in order. A failing step is logged and the rest still
/// run; rethrow_first() then raises the first failure.
class ResetSequence {
public:
  explicit ResetSequence(std::string device) : device_(std::move(device)) {}

  template <typename Step> void run(const char *what, Step &&step) {
    try {
      step();
    } catch (const std::exception &ex) {
      LOG_ERROR(device_, "RELEASE", "{} failed: {}", what, ex.what());
      if (!failure_) {
        failure_ = std::current_exception();
      }
    }
  }

  void rethrow_first() {
    if (failure_) {
      std::rethrow_exception(failure_);
    }
  }

private:
  std::string device_;
  std::exception_ptr failure_;
};

/// Scoped acquisition of a device wrapper.
///
/// The constructor opens the device and builds Guard over it, which applies
/// the configuration. Destruction or release() tears the guard down (reset
/// to a safe idle state) and closes the device, whatever the exit path.
/// A failure while building the guard closes the device before the error
/// propagates. After release, device() and release() throw NotAcquiredError.
///
/// Device needs open(index), close() and name(); Guard needs a constructor
/// taking Device & first and a restore() that resets the device.
template <typename Device, typename Guard> class DeviceContext {
public:
  template <typename... GuardArgs>
  DeviceContext(Device &device, int device_index, GuardArgs &&...guard_args)
      : device_(device) {
    device_.open(device_index);
    try {
      guard_.emplace(device_, std::forward<GuardArgs>(guard_args)...);
    } catch (const std::exception &ex) {
      LOG_ERROR(device_.name(), "ACQUIRE",
                "Configuration failed, releasing device: {}", ex.what());
      close_quietly();
      throw;
    }
    active_ = true;
  }

  ~DeviceContext() {
    if (!active_) {
      return;
    }
    try {
      release();
    } catch (const std::exception &ex) {
      LOG_ERROR(device_.name(), "RELEASE", "Teardown failed: {}", ex.what());
    }
  }

  DeviceContext(const DeviceContext &) = delete;
  DeviceContext &operator=(const DeviceContext &) = delete;

  bool active() const { return active_; }

  Device &device() {
    require_active("access the device");
    return device_;
  }

  Device *operator->() { return &device(); }

  Guard &guard() {
    require_active("access the configuration");
    return *guard_;
  }

  /// Reset and close. The first failure is rethrown after the device is
  /// closed.
  void release() {
    require_active("release");
    active_ = false;

    std::exception_ptr failure;
    try {
      guard_->restore();
    } catch (const std::exception &) {
      failure = std::current_exception();
    }
    guard_.reset();

    try {
      device_.close();
    } catch (const std::exception &) {
      if (!failure) {
        failure = std::current_exception();
      }
    }

    if (failure) {
      std::rethrow_exception(failure);
    }
  }

private:
  void require_active(const char *operation) const {
    if (!active_) {
      throw NotAcquiredError(fmt::format(
          "{}: cannot {} after the context was released", device_.name(),
          operation));
    }
  }

  void close_quietly() {
    try {
      device_.close();
    } catch (const std::exception &ex) {
      LOG_WARN(device_.name(), "RELEASE", "Best-effort close failed: {}",
               ex.what());
    }
  }

  Device &device_;
  std::optional<Guard> guard_;
  bool active_{false};
};

} // namespace analogbench
