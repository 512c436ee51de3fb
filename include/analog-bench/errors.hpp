#pragma once
#include "analog-bench/export.h"

#include <stdexcept>
#include <string>

namespace analogbench {

/// Base of every error raised by the wrappers, guards and fixtures
class ANALOG_BENCH_API BenchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// No device attached, invalid device index, or the SDK refused to open it
class ANALOG_BENCH_API DeviceNotFoundError : public BenchError {
public:
  using BenchError::BenchError;
};

/// Operation on a handle that is not acquired or already released
class ANALOG_BENCH_API NotAcquiredError : public BenchError {
public:
  using BenchError::BenchError;
};

/// Read or retrieve issued before the matching setup call
class ANALOG_BENCH_API NotConfiguredError : public BenchError {
public:
  using BenchError::BenchError;
};

class ANALOG_BENCH_API InvalidParameterError : public BenchError {
public:
  using BenchError::BenchError;
};

/// Invalid or missing bench configuration value
class ANALOG_BENCH_API ConfigError : public InvalidParameterError {
public:
  using InvalidParameterError::InvalidParameterError;
};

/// Failure reported by a vendor SDK, carrying its own code and message
class ANALOG_BENCH_API SdkError : public BenchError {
public:
  SdkError(const std::string &sdk, int code, const std::string &message);

  int code() const { return code_; }
  const std::string &sdk() const { return sdk_; }
  const std::string &sdk_message() const { return sdk_message_; }

private:
  std::string sdk_;
  int code_;
  std::string sdk_message_;
};

/// WaveForms SDK failure (FDwfGetLastError / FDwfGetLastErrorMsg)
class ANALOG_BENCH_API DwfError : public SdkError {
public:
  DwfError(int code, const std::string &message)
      : SdkError("WaveForms", code, message) {}
};

/// libsmu failure
class ANALOG_BENCH_API LibsmuError : public SdkError {
public:
  LibsmuError(int code, const std::string &message)
      : SdkError("libsmu", code, message) {}
};

} // namespace analogbench
