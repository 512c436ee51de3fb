#pragma once
#include "analog-bench/export.h"

#include <digilent/waveforms/dwf.h>
#include <string>

#ifdef _WIN32
#include <windows.h>
using DwfLibraryHandle = HMODULE;
#else
#include <dlfcn.h>
using DwfLibraryHandle = void *;
#endif

// Every WaveForms entry point the scope driver calls
#define ANALOG_BENCH_DWF_FUNCTIONS(X)                                          \
  X(FDwfGetLastError)                                                          \
  X(FDwfGetLastErrorMsg)                                                       \
  X(FDwfGetVersion)                                                            \
  X(FDwfEnum)                                                                  \
  X(FDwfEnumDeviceType)                                                        \
  X(FDwfEnumDeviceName)                                                        \
  X(FDwfEnumSN)                                                                \
  X(FDwfEnumConfig)                                                            \
  X(FDwfEnumConfigInfo)                                                        \
  X(FDwfDeviceOpen)                                                            \
  X(FDwfDeviceConfigOpen)                                                      \
  X(FDwfDeviceClose)                                                           \
  X(FDwfDeviceAutoConfigureSet)                                                \
  X(FDwfDeviceAutoConfigureGet)                                                \
  X(FDwfAnalogInBitsInfo)                                                      \
  X(FDwfAnalogInReset)                                                         \
  X(FDwfAnalogInConfigure)                                                     \
  X(FDwfAnalogInStatus)                                                        \
  X(FDwfAnalogInStatusRecord)                                                  \
  X(FDwfAnalogInStatusData)                                                    \
  X(FDwfAnalogInStatusData16)                                                  \
  X(FDwfAnalogInStatusSample)                                                  \
  X(FDwfAnalogInStatusSamplesValid)                                            \
  X(FDwfAnalogInStatusTime)                                                    \
  X(FDwfAnalogInBufferSizeInfo)                                                \
  X(FDwfAnalogInBufferSizeSet)                                                 \
  X(FDwfAnalogInFrequencySet)                                                  \
  X(FDwfAnalogInAcquisitionModeSet)                                            \
  X(FDwfAnalogInRecordLengthSet)                                               \
  X(FDwfAnalogInChannelEnableSet)                                              \
  X(FDwfAnalogInChannelEnableGet)                                              \
  X(FDwfAnalogInChannelFilterSet)                                              \
  X(FDwfAnalogInChannelRangeSet)                                               \
  X(FDwfAnalogInChannelRangeGet)                                               \
  X(FDwfAnalogInChannelRangeInfo)                                              \
  X(FDwfAnalogInChannelOffsetSet)                                              \
  X(FDwfAnalogInChannelOffsetGet)                                              \
  X(FDwfAnalogInChannelCouplingSet)                                            \
  X(FDwfAnalogInChannelCouplingGet)                                            \
  X(FDwfAnalogInTriggerSourceSet)                                              \
  X(FDwfAnalogInTriggerAutoTimeoutSet)                                         \
  X(FDwfAnalogInTriggerPositionSet)                                            \
  X(FDwfAnalogInTriggerTypeSet)                                                \
  X(FDwfAnalogInTriggerChannelSet)                                             \
  X(FDwfAnalogInTriggerLevelSet)                                               \
  X(FDwfAnalogInTriggerHysteresisSet)                                          \
  X(FDwfAnalogInTriggerConditionSet)                                           \
  X(FDwfAnalogOutReset)                                                        \
  X(FDwfAnalogOutConfigure)                                                    \
  X(FDwfAnalogOutStatus)                                                       \
  X(FDwfAnalogOutNodeEnableSet)                                                \
  X(FDwfAnalogOutNodeEnableGet)                                                \
  X(FDwfAnalogOutNodeFunctionSet)                                              \
  X(FDwfAnalogOutNodeFunctionGet)                                              \
  X(FDwfAnalogOutNodeFrequencySet)                                             \
  X(FDwfAnalogOutNodeFrequencyGet)                                             \
  X(FDwfAnalogOutNodeAmplitudeSet)                                             \
  X(FDwfAnalogOutNodeAmplitudeGet)                                             \
  X(FDwfAnalogOutNodeOffsetSet)                                                \
  X(FDwfAnalogOutNodeOffsetGet)                                                \
  X(FDwfAnalogOutNodeSymmetrySet)                                              \
  X(FDwfAnalogOutNodeSymmetryGet)                                              \
  X(FDwfAnalogOutNodePhaseSet)                                                 \
  X(FDwfAnalogOutNodePhaseGet)                                                 \
  X(FDwfAnalogOutNodeDataInfo)                                                 \
  X(FDwfAnalogOutNodeDataSet)                                                  \
  X(FDwfAnalogOutRunSet)                                                       \
  X(FDwfAnalogOutWaitSet)                                                      \
  X(FDwfAnalogOutRepeatSet)                                                    \
  X(FDwfAnalogOutIdleSet)                                                      \
  X(FDwfAnalogOutTriggerSourceSet)                                             \
  X(FDwfAnalogOutTriggerSlopeSet)                                              \
  X(FDwfAnalogIOReset)                                                         \
  X(FDwfAnalogIOStatus)                                                        \
  X(FDwfAnalogIOEnableSet)                                                     \
  X(FDwfAnalogIOEnableStatus)                                                  \
  X(FDwfAnalogIOChannelNodeSet)                                                \
  X(FDwfAnalogIOChannelNodeGet)                                                \
  X(FDwfAnalogIOChannelNodeStatus)                                             \
  X(FDwfDigitalInReset)                                                        \
  X(FDwfDigitalOutReset)                                                       \
  X(FDwfDigitalIOReset)                                                        \
  X(FDwfDigitalIOStatus)                                                       \
  X(FDwfDigitalIOInputStatus)                                                  \
  X(FDwfDigitalIOOutputGet)                                                    \
  X(FDwfDigitalIOOutputSet)                                                    \
  X(FDwfDigitalIOOutputEnableGet)                                              \
  X(FDwfDigitalIOOutputEnableSet)                                              \
  X(FDwfDigitalI2cReset)                                                       \
  X(FDwfDigitalI2cClear)                                                       \
  X(FDwfDigitalI2cStretchSet)                                                  \
  X(FDwfDigitalI2cRateSet)                                                     \
  X(FDwfDigitalI2cReadNakSet)                                                  \
  X(FDwfDigitalI2cSclSet)                                                      \
  X(FDwfDigitalI2cSdaSet)                                                      \
  X(FDwfDigitalI2cRead)                                                        \
  X(FDwfDigitalI2cWrite)                                                       \
  X(FDwfDigitalSpiReset)                                                       \
  X(FDwfDigitalSpiFrequencySet)                                                \
  X(FDwfDigitalSpiClockSet)                                                    \
  X(FDwfDigitalSpiDataSet)                                                     \
  X(FDwfDigitalSpiIdleSet)                                                     \
  X(FDwfDigitalSpiModeSet)                                                     \
  X(FDwfDigitalSpiOrderSet)                                                    \
  X(FDwfDigitalSpiSelect)                                                      \
  X(FDwfDigitalSpiReadOne)                                                     \
  X(FDwfDigitalSpiRead)                                                        \
  X(FDwfDigitalSpiRead16)                                                      \
  X(FDwfDigitalSpiRead32)                                                      \
  X(FDwfDigitalSpiWriteOne)                                                    \
  X(FDwfDigitalSpiWrite)                                                       \
  X(FDwfDigitalSpiWrite16)                                                     \
  X(FDwfDigitalSpiWrite32)                                                     \
  X(FDwfDigitalSpiWriteRead)                                                   \
  X(FDwfDigitalSpiWriteRead16)                                                 \
  X(FDwfDigitalSpiWriteRead32)

namespace analogbench {
namespace dwf {

/// Platform name of the WaveForms runtime library
ANALOG_BENCH_API const char *default_library_path();

/// RAII handle on the WaveForms runtime, loaded with dlopen.
///
/// Function pointers are named after the SDK functions, so call sites read
/// like the SDK sample programs: lib.FDwfDeviceOpen(-1, &hdwf).
class ANALOG_BENCH_API DwfLibrary {
public:
  /// Throws DeviceNotFoundError if the library cannot be loaded and
  /// BenchError if it lacks one of the required symbols
  explicit DwfLibrary(const std::string &path = default_library_path());
  ~DwfLibrary();

  DwfLibrary(const DwfLibrary &) = delete;
  DwfLibrary &operator=(const DwfLibrary &) = delete;
  DwfLibrary(DwfLibrary &&other) noexcept;
  DwfLibrary &operator=(DwfLibrary &&other) noexcept;

  bool is_loaded() const { return handle_ != nullptr; }
  const std::string &path() const { return path_; }

  /// Error code and message of the last failed call
  int last_error() const;
  std::string last_error_message() const;

#define ANALOG_BENCH_DWF_POINTER(name) decltype(&::name) name{nullptr};
  ANALOG_BENCH_DWF_FUNCTIONS(ANALOG_BENCH_DWF_POINTER)
#undef ANALOG_BENCH_DWF_POINTER

private:
  void load_symbols();
  void reset_symbols();
  void unload();

  DwfLibraryHandle handle_{nullptr};
  std::string path_;
};

} // namespace dwf
} // namespace analogbench
