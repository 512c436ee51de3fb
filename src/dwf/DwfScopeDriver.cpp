#include "analog-bench/dwf/DwfScopeDriver.hpp"
#include "analog-bench/Logger.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <fmt/format.h>

namespace analogbench {
namespace dwf {

namespace {

constexpr int kSuccess = 1;

int channel_index(ScopeChannel ch) { return static_cast<int>(ch); }
int channel_index(WaveGenChannel ch) { return static_cast<int>(ch); }

// cDQ argument of the SPI transfer calls
int to_dq(SpiLine line) {
  switch (line) {
  case SpiLine::Siso:
    return 0;
  case SpiLine::MosiMiso:
    return 1;
  case SpiLine::Dual:
    return 2;
  case SpiLine::Quad:
    return 4;
  }
  return 1;
}

DwfDigitalOutIdle to_dwf(DigitalIdle idle) {
  switch (idle) {
  case DigitalIdle::Init:
    return DwfDigitalOutIdleInit;
  case DigitalIdle::Low:
    return DwfDigitalOutIdleLow;
  case DigitalIdle::High:
    return DwfDigitalOutIdleHigh;
  case DigitalIdle::HighZ:
    return DwfDigitalOutIdleZet;
  }
  return DwfDigitalOutIdleInit;
}

template <typename Word>
std::vector<Word> narrow_words(const std::vector<uint32_t> &words) {
  return std::vector<Word>(words.begin(), words.end());
}

FUNC to_dwf(discovery::OutputSignal signal) {
  using discovery::OutputSignal;
  switch (signal) {
  case OutputSignal::DC:
    return funcDC;
  case OutputSignal::Sine:
    return funcSine;
  case OutputSignal::Square:
    return funcSquare;
  case OutputSignal::Triangle:
    return funcTriangle;
  case OutputSignal::RampUp:
    return funcRampUp;
  case OutputSignal::RampDown:
    return funcRampDown;
  case OutputSignal::Noise:
    return funcNoise;
  case OutputSignal::Pulse:
    return funcPulse;
  case OutputSignal::Trapezium:
    return funcTrapezium;
  case OutputSignal::SinePower:
    return funcSinePower;
  case OutputSignal::Custom:
    return funcCustom;
  case OutputSignal::Play:
    return funcPlay;
  }
  return funcDC;
}

discovery::OutputSignal from_dwf(FUNC func) {
  using discovery::OutputSignal;
  if (func == funcSine)
    return OutputSignal::Sine;
  if (func == funcSquare)
    return OutputSignal::Square;
  if (func == funcTriangle)
    return OutputSignal::Triangle;
  if (func == funcRampUp)
    return OutputSignal::RampUp;
  if (func == funcRampDown)
    return OutputSignal::RampDown;
  if (func == funcNoise)
    return OutputSignal::Noise;
  if (func == funcPulse)
    return OutputSignal::Pulse;
  if (func == funcTrapezium)
    return OutputSignal::Trapezium;
  if (func == funcSinePower)
    return OutputSignal::SinePower;
  if (func == funcCustom)
    return OutputSignal::Custom;
  if (func == funcPlay)
    return OutputSignal::Play;
  return OutputSignal::DC;
}

TRIGSRC to_dwf(TriggerSource source) {
  switch (source) {
  case TriggerSource::None:
    return trigsrcNone;
  case TriggerSource::PC:
    return trigsrcPC;
  case TriggerSource::DetectorAnalogIn:
    return trigsrcDetectorAnalogIn;
  case TriggerSource::DetectorDigitalIn:
    return trigsrcDetectorDigitalIn;
  case TriggerSource::AnalogIn:
    return trigsrcAnalogIn;
  case TriggerSource::DigitalIn:
    return trigsrcDigitalIn;
  case TriggerSource::DigitalOut:
    return trigsrcDigitalOut;
  case TriggerSource::AnalogOut1:
    return trigsrcAnalogOut1;
  case TriggerSource::AnalogOut2:
    return trigsrcAnalogOut2;
  case TriggerSource::AnalogOut3:
    return trigsrcAnalogOut3;
  case TriggerSource::AnalogOut4:
    return trigsrcAnalogOut4;
  case TriggerSource::External1:
    return trigsrcExternal1;
  case TriggerSource::External2:
    return trigsrcExternal2;
  case TriggerSource::External3:
    return trigsrcExternal3;
  case TriggerSource::External4:
    return trigsrcExternal4;
  case TriggerSource::High:
    return trigsrcHigh;
  case TriggerSource::Low:
    return trigsrcLow;
  case TriggerSource::Clock:
    return trigsrcClock;
  }
  return trigsrcNone;
}

ACQMODE to_dwf(AcquisitionMode mode) {
  switch (mode) {
  case AcquisitionMode::Single:
    return acqmodeSingle;
  case AcquisitionMode::ScanShift:
    return acqmodeScanShift;
  case AcquisitionMode::ScanScreen:
    return acqmodeScanScreen;
  case AcquisitionMode::Record:
    return acqmodeRecord;
  case AcquisitionMode::Overs:
    return acqmodeOvers;
  case AcquisitionMode::Single1:
    return acqmodeSingle1;
  }
  return acqmodeSingle;
}

FILTER to_dwf(AnalogFilter filter) {
  switch (filter) {
  case AnalogFilter::Decimate:
    return filterDecimate;
  case AnalogFilter::Average:
    return filterAverage;
  case AnalogFilter::MinMax:
    return filterMinMax;
  }
  return filterDecimate;
}

TRIGTYPE to_dwf(discovery::TriggerType type) {
  using discovery::TriggerType;
  switch (type) {
  case TriggerType::Edge:
    return trigtypeEdge;
  case TriggerType::Pulse:
    return trigtypePulse;
  case TriggerType::Transition:
    return trigtypeTransition;
  case TriggerType::Window:
    return trigtypeWindow;
  }
  return trigtypeEdge;
}

DwfTriggerSlope to_dwf(TriggerSlope slope) {
  switch (slope) {
  case TriggerSlope::Rise:
    return DwfTriggerSlopeRise;
  case TriggerSlope::Fall:
    return DwfTriggerSlopeFall;
  case TriggerSlope::Either:
    return DwfTriggerSlopeEither;
  }
  return DwfTriggerSlopeRise;
}

DwfAnalogOutIdle to_dwf(OutputIdle idle) {
  switch (idle) {
  case OutputIdle::Disable:
    return DwfAnalogOutIdleDisable;
  case OutputIdle::Offset:
    return DwfAnalogOutIdleOffset;
  case OutputIdle::Initial:
    return DwfAnalogOutIdleInitial;
  }
  return DwfAnalogOutIdleInitial;
}

InstrumentState from_dwf_state(DwfState state) {
  if (state == DwfStateReady)
    return InstrumentState::Ready;
  if (state == DwfStateConfig)
    return InstrumentState::Config;
  if (state == DwfStatePrefill)
    return InstrumentState::Prefill;
  if (state == DwfStateArmed)
    return InstrumentState::Armed;
  if (state == DwfStateWait)
    return InstrumentState::Wait;
  if (state == DwfStateDone)
    return InstrumentState::Done;
  return InstrumentState::Running;
}

} // namespace

DwfScopeDriver::DwfScopeDriver(std::shared_ptr<DwfLibrary> library)
    : lib_(library ? std::move(library) : std::make_shared<DwfLibrary>()) {}

DwfScopeDriver::~DwfScopeDriver() {
  if (hdwf_ == hdwfNone) {
    return;
  }
  try {
    close();
  } catch (const std::exception &ex) {
    LOG_ERROR("DWF", "CLOSE", "Failed to close device: {}", ex.what());
  }
}

void DwfScopeDriver::check(int result, const char *call) const {
  if (result != kSuccess) {
    auto code = lib_->last_error();
    auto message = lib_->last_error_message();
    LOG_DEBUG("DWF", call, "Call failed ({}): {}", code, message);
    throw DwfError(code, fmt::format("{}: {}", call, message));
  }
}

HDWF DwfScopeDriver::handle(const char *call) const {
  if (hdwf_ == hdwfNone) {
    throw NotAcquiredError(
        fmt::format("{}: no WaveForms device is open", call));
  }
  return hdwf_;
}

std::string DwfScopeDriver::library_version() {
  char version[32] = {0};
  check(lib_->FDwfGetVersion(version), "FDwfGetVersion");
  return std::string(version);
}

std::vector<DeviceInfo> DwfScopeDriver::enumerate() {
  int count = 0;
  check(lib_->FDwfEnum(enumfilterAll, &count), "FDwfEnum");

  std::vector<DeviceInfo> devices;
  for (int i = 0; i < count; ++i) {
    DeviceInfo info;
    info.index = i;

    char name[32] = {0};
    check(lib_->FDwfEnumDeviceName(i, name), "FDwfEnumDeviceName");
    info.name = name;

    char serial[32] = {0};
    check(lib_->FDwfEnumSN(i, serial), "FDwfEnumSN");
    info.serial = serial;

    DEVID id = 0;
    DEVVER version = 0;
    check(lib_->FDwfEnumDeviceType(i, &id, &version), "FDwfEnumDeviceType");
    info.id = static_cast<int>(id);
    info.revision = std::to_string(static_cast<int>(version));

    devices.push_back(std::move(info));
  }
  return devices;
}

std::vector<DeviceConfigInfo>
DwfScopeDriver::enumerate_configs(int device_index) {
  int count = 0;
  check(lib_->FDwfEnumConfig(device_index, &count), "FDwfEnumConfig");

  auto info = [this](int config, DwfEnumConfigInfo what) {
    int value = 0;
    check(lib_->FDwfEnumConfigInfo(config, what, &value),
          "FDwfEnumConfigInfo");
    return value;
  };

  std::vector<DeviceConfigInfo> configs;
  for (int i = 0; i < count; ++i) {
    DeviceConfigInfo config;
    config.index = i;
    config.analog_in_channels = info(i, DECIAnalogInChannelCount);
    config.analog_in_buffer_size = info(i, DECIAnalogInBufferSize);
    config.analog_out_channels = info(i, DECIAnalogOutChannelCount);
    config.analog_out_buffer_size = info(i, DECIAnalogOutBufferSize);
    config.digital_in_channels = info(i, DECIDigitalInChannelCount);
    config.digital_in_buffer_size = info(i, DECIDigitalInBufferSize);
    config.digital_out_channels = info(i, DECIDigitalOutChannelCount);
    config.digital_out_buffer_size = info(i, DECIDigitalOutBufferSize);
    configs.push_back(config);
  }
  return configs;
}

void DwfScopeDriver::open(int config_index) {
  if (hdwf_ != hdwfNone) {
    throw BenchError("a WaveForms device is already open on this driver");
  }

  HDWF hdwf = hdwfNone;
  int result = config_index == 0
                   ? lib_->FDwfDeviceOpen(-1, &hdwf)
                   : lib_->FDwfDeviceConfigOpen(-1, config_index, &hdwf);
  if (result != kSuccess || hdwf == hdwfNone) {
    throw DeviceNotFoundError(fmt::format(
        "Failed to open Analog Discovery device: {}",
        lib_->last_error_message()));
  }
  hdwf_ = hdwf;
}

void DwfScopeDriver::close() {
  auto hdwf = handle("FDwfDeviceClose");
  hdwf_ = hdwfNone;
  check(lib_->FDwfDeviceClose(hdwf), "FDwfDeviceClose");
}

void DwfScopeDriver::set_auto_configure(AutoConfigure mode) {
  check(lib_->FDwfDeviceAutoConfigureSet(handle("FDwfDeviceAutoConfigureSet"),
                                         static_cast<int>(mode)),
        "FDwfDeviceAutoConfigureSet");
}

AutoConfigure DwfScopeDriver::auto_configure() {
  int mode = 0;
  check(lib_->FDwfDeviceAutoConfigureGet(handle("FDwfDeviceAutoConfigureGet"),
                                         &mode),
        "FDwfDeviceAutoConfigureGet");
  if (mode == 0)
    return AutoConfigure::Disabled;
  if (mode == 3)
    return AutoConfigure::Dynamic;
  return AutoConfigure::Enabled;
}

int DwfScopeDriver::analog_in_bits() {
  int bits = 0;
  check(lib_->FDwfAnalogInBitsInfo(handle("FDwfAnalogInBitsInfo"), &bits),
        "FDwfAnalogInBitsInfo");
  return bits;
}

void DwfScopeDriver::analog_in_reset() {
  check(lib_->FDwfAnalogInReset(handle("FDwfAnalogInReset")),
        "FDwfAnalogInReset");
}

void DwfScopeDriver::analog_in_configure(bool reconfigure, bool start) {
  check(lib_->FDwfAnalogInConfigure(handle("FDwfAnalogInConfigure"),
                                    reconfigure ? 1 : 0, start ? 1 : 0),
        "FDwfAnalogInConfigure");
}

InstrumentState DwfScopeDriver::analog_in_status(bool read_data) {
  DwfState state = DwfStateReady;
  check(lib_->FDwfAnalogInStatus(handle("FDwfAnalogInStatus"),
                                 read_data ? 1 : 0, &state),
        "FDwfAnalogInStatus");
  return from_dwf_state(state);
}

RecordStatus DwfScopeDriver::analog_in_record_status() {
  RecordStatus status;
  check(lib_->FDwfAnalogInStatusRecord(handle("FDwfAnalogInStatusRecord"),
                                       &status.available, &status.lost,
                                       &status.corrupt),
        "FDwfAnalogInStatusRecord");
  return status;
}

int DwfScopeDriver::analog_in_samples_valid() {
  int valid = 0;
  check(lib_->FDwfAnalogInStatusSamplesValid(
            handle("FDwfAnalogInStatusSamplesValid"), &valid),
        "FDwfAnalogInStatusSamplesValid");
  return valid;
}

std::vector<int16_t> DwfScopeDriver::analog_in_data16(ScopeChannel ch,
                                                      int first, int count) {
  std::vector<int16_t> data(static_cast<std::size_t>(std::max(count, 0)));
  if (data.empty()) {
    return data;
  }
  check(lib_->FDwfAnalogInStatusData16(handle("FDwfAnalogInStatusData16"),
                                       channel_index(ch), data.data(), first, count),
        "FDwfAnalogInStatusData16");
  return data;
}

std::vector<double> DwfScopeDriver::analog_in_data(ScopeChannel ch,
                                                   int count) {
  std::vector<double> data(static_cast<std::size_t>(std::max(count, 0)));
  if (data.empty()) {
    return data;
  }
  check(lib_->FDwfAnalogInStatusData(handle("FDwfAnalogInStatusData"),
                                     channel_index(ch), data.data(), count),
        "FDwfAnalogInStatusData");
  return data;
}

double DwfScopeDriver::analog_in_sample(ScopeChannel ch) {
  double volts = 0.0;
  check(lib_->FDwfAnalogInStatusSample(handle("FDwfAnalogInStatusSample"),
                                       channel_index(ch), &volts),
        "FDwfAnalogInStatusSample");
  return volts;
}

TriggerTimestamp DwfScopeDriver::analog_in_trigger_time() {
  TriggerTimestamp ts;
  check(lib_->FDwfAnalogInStatusTime(handle("FDwfAnalogInStatusTime"),
                                     &ts.seconds, &ts.tick,
                                     &ts.ticks_per_second),
        "FDwfAnalogInStatusTime");
  return ts;
}

int DwfScopeDriver::analog_in_max_buffer_size() {
  int min_size = 0;
  int max_size = 0;
  check(lib_->FDwfAnalogInBufferSizeInfo(handle("FDwfAnalogInBufferSizeInfo"),
                                         &min_size, &max_size),
        "FDwfAnalogInBufferSizeInfo");
  return max_size;
}

void DwfScopeDriver::analog_in_set_buffer_size(int size) {
  check(lib_->FDwfAnalogInBufferSizeSet(handle("FDwfAnalogInBufferSizeSet"),
                                        size),
        "FDwfAnalogInBufferSizeSet");
}

void DwfScopeDriver::analog_in_set_frequency(double hz) {
  check(lib_->FDwfAnalogInFrequencySet(handle("FDwfAnalogInFrequencySet"), hz),
        "FDwfAnalogInFrequencySet");
}

void DwfScopeDriver::analog_in_set_acquisition_mode(AcquisitionMode mode) {
  check(lib_->FDwfAnalogInAcquisitionModeSet(
            handle("FDwfAnalogInAcquisitionModeSet"), to_dwf(mode)),
        "FDwfAnalogInAcquisitionModeSet");
}

void DwfScopeDriver::analog_in_set_record_length(double seconds) {
  check(lib_->FDwfAnalogInRecordLengthSet(
            handle("FDwfAnalogInRecordLengthSet"), seconds),
        "FDwfAnalogInRecordLengthSet");
}

void DwfScopeDriver::analog_in_enable(ScopeChannel ch, bool enable) {
  check(lib_->FDwfAnalogInChannelEnableSet(
            handle("FDwfAnalogInChannelEnableSet"), channel_index(ch), enable ? 1 : 0),
        "FDwfAnalogInChannelEnableSet");
}

bool DwfScopeDriver::analog_in_enabled(ScopeChannel ch) {
  int enabled = 0;
  check(lib_->FDwfAnalogInChannelEnableGet(
            handle("FDwfAnalogInChannelEnableGet"), channel_index(ch), &enabled),
        "FDwfAnalogInChannelEnableGet");
  return enabled != 0;
}

void DwfScopeDriver::analog_in_set_filter(ScopeChannel ch,
                                          AnalogFilter filter) {
  check(lib_->FDwfAnalogInChannelFilterSet(
            handle("FDwfAnalogInChannelFilterSet"), channel_index(ch), to_dwf(filter)),
        "FDwfAnalogInChannelFilterSet");
}

void DwfScopeDriver::analog_in_set_range(ScopeChannel ch, double volts) {
  check(lib_->FDwfAnalogInChannelRangeSet(
            handle("FDwfAnalogInChannelRangeSet"), channel_index(ch), volts),
        "FDwfAnalogInChannelRangeSet");
}

double DwfScopeDriver::analog_in_range(ScopeChannel ch) {
  double volts = 0.0;
  check(lib_->FDwfAnalogInChannelRangeGet(
            handle("FDwfAnalogInChannelRangeGet"), channel_index(ch), &volts),
        "FDwfAnalogInChannelRangeGet");
  return volts;
}

RangeInfo DwfScopeDriver::analog_in_range_info() {
  double min = 0.0;
  double max = 0.0;
  double steps = 0.0;
  check(lib_->FDwfAnalogInChannelRangeInfo(
            handle("FDwfAnalogInChannelRangeInfo"), &min, &max, &steps),
        "FDwfAnalogInChannelRangeInfo");
  return RangeInfo{min, max, static_cast<int>(steps)};
}

void DwfScopeDriver::analog_in_set_offset(ScopeChannel ch, double volts) {
  check(lib_->FDwfAnalogInChannelOffsetSet(
            handle("FDwfAnalogInChannelOffsetSet"), channel_index(ch), volts),
        "FDwfAnalogInChannelOffsetSet");
}

double DwfScopeDriver::analog_in_offset(ScopeChannel ch) {
  double volts = 0.0;
  check(lib_->FDwfAnalogInChannelOffsetGet(
            handle("FDwfAnalogInChannelOffsetGet"), channel_index(ch), &volts),
        "FDwfAnalogInChannelOffsetGet");
  return volts;
}

void DwfScopeDriver::analog_in_set_coupling(ScopeChannel ch,
                                            Coupling coupling) {
  check(lib_->FDwfAnalogInChannelCouplingSet(
            handle("FDwfAnalogInChannelCouplingSet"), channel_index(ch),
            coupling == Coupling::DC ? DwfAnalogCouplingDC
                                     : DwfAnalogCouplingAC),
        "FDwfAnalogInChannelCouplingSet");
}

Coupling DwfScopeDriver::analog_in_coupling(ScopeChannel ch) {
  DwfAnalogCoupling coupling = DwfAnalogCouplingDC;
  check(lib_->FDwfAnalogInChannelCouplingGet(
            handle("FDwfAnalogInChannelCouplingGet"), channel_index(ch), &coupling),
        "FDwfAnalogInChannelCouplingGet");
  return coupling == DwfAnalogCouplingAC ? Coupling::AC : Coupling::DC;
}

void DwfScopeDriver::analog_in_set_trigger(ScopeChannel ch,
                                           const TriggerSettings &trigger) {
  auto hdwf = handle("FDwfAnalogInTriggerSourceSet");
  check(lib_->FDwfAnalogInTriggerSourceSet(hdwf, to_dwf(trigger.source)),
        "FDwfAnalogInTriggerSourceSet");
  check(lib_->FDwfAnalogInTriggerAutoTimeoutSet(hdwf, trigger.auto_timeout),
        "FDwfAnalogInTriggerAutoTimeoutSet");
  check(lib_->FDwfAnalogInTriggerPositionSet(hdwf, trigger.position),
        "FDwfAnalogInTriggerPositionSet");
  check(lib_->FDwfAnalogInTriggerTypeSet(hdwf, to_dwf(trigger.type)),
        "FDwfAnalogInTriggerTypeSet");
  check(lib_->FDwfAnalogInTriggerChannelSet(hdwf, channel_index(ch)),
        "FDwfAnalogInTriggerChannelSet");
  check(lib_->FDwfAnalogInTriggerLevelSet(hdwf, trigger.level),
        "FDwfAnalogInTriggerLevelSet");
  check(lib_->FDwfAnalogInTriggerHysteresisSet(hdwf, trigger.hysteresis),
        "FDwfAnalogInTriggerHysteresisSet");
  check(lib_->FDwfAnalogInTriggerConditionSet(hdwf,
                                              to_dwf(trigger.condition)),
        "FDwfAnalogInTriggerConditionSet");
  LOG_DEBUG("DWF", "TRIGGER", "{} trigger on {} at {} V",
            to_string(trigger.source), to_string(ch), trigger.level);
}

void DwfScopeDriver::analog_out_reset(WaveGenChannel ch) {
  check(lib_->FDwfAnalogOutReset(handle("FDwfAnalogOutReset"), channel_index(ch)),
        "FDwfAnalogOutReset");
}

void DwfScopeDriver::analog_out_reset_all() {
  check(lib_->FDwfAnalogOutReset(handle("FDwfAnalogOutReset"), -1),
        "FDwfAnalogOutReset");
}

void DwfScopeDriver::analog_out_configure(WaveGenChannel ch, bool start) {
  check(lib_->FDwfAnalogOutConfigure(handle("FDwfAnalogOutConfigure"),
                                     channel_index(ch), start ? 1 : 0),
        "FDwfAnalogOutConfigure");
}

InstrumentState DwfScopeDriver::analog_out_status(WaveGenChannel ch) {
  DwfState state = DwfStateReady;
  check(lib_->FDwfAnalogOutStatus(handle("FDwfAnalogOutStatus"), channel_index(ch),
                                  &state),
        "FDwfAnalogOutStatus");
  return from_dwf_state(state);
}

void DwfScopeDriver::analog_out_enable(WaveGenChannel ch, bool enable) {
  check(lib_->FDwfAnalogOutNodeEnableSet(handle("FDwfAnalogOutNodeEnableSet"),
                                         channel_index(ch), AnalogOutNodeCarrier,
                                         enable ? 1 : 0),
        "FDwfAnalogOutNodeEnableSet");
}

bool DwfScopeDriver::analog_out_enabled(WaveGenChannel ch) {
  int enabled = 0;
  check(lib_->FDwfAnalogOutNodeEnableGet(handle("FDwfAnalogOutNodeEnableGet"),
                                         channel_index(ch), AnalogOutNodeCarrier,
                                         &enabled),
        "FDwfAnalogOutNodeEnableGet");
  return enabled != 0;
}

void DwfScopeDriver::analog_out_set_waveform(WaveGenChannel ch,
                                             const OutputWaveform &waveform) {
  auto hdwf = handle("FDwfAnalogOutNodeFunctionSet");
  int i = channel_index(ch);
  check(lib_->FDwfAnalogOutNodeFunctionSet(hdwf, i, AnalogOutNodeCarrier,
                                           to_dwf(waveform.signal)),
        "FDwfAnalogOutNodeFunctionSet");
  check(lib_->FDwfAnalogOutNodeFrequencySet(hdwf, i, AnalogOutNodeCarrier,
                                            waveform.frequency),
        "FDwfAnalogOutNodeFrequencySet");
  check(lib_->FDwfAnalogOutNodeAmplitudeSet(hdwf, i, AnalogOutNodeCarrier,
                                            waveform.amplitude),
        "FDwfAnalogOutNodeAmplitudeSet");
  check(lib_->FDwfAnalogOutNodeOffsetSet(hdwf, i, AnalogOutNodeCarrier,
                                         waveform.offset),
        "FDwfAnalogOutNodeOffsetSet");
  check(lib_->FDwfAnalogOutNodeSymmetrySet(hdwf, i, AnalogOutNodeCarrier,
                                           waveform.symmetry),
        "FDwfAnalogOutNodeSymmetrySet");
  check(lib_->FDwfAnalogOutNodePhaseSet(hdwf, i, AnalogOutNodeCarrier,
                                        waveform.phase),
        "FDwfAnalogOutNodePhaseSet");
}

OutputWaveform DwfScopeDriver::analog_out_waveform(WaveGenChannel ch) {
  auto hdwf = handle("FDwfAnalogOutNodeFunctionGet");
  int i = channel_index(ch);
  OutputWaveform waveform;
  FUNC func = funcDC;
  check(lib_->FDwfAnalogOutNodeFunctionGet(hdwf, i, AnalogOutNodeCarrier,
                                           &func),
        "FDwfAnalogOutNodeFunctionGet");
  waveform.signal = from_dwf(func);
  check(lib_->FDwfAnalogOutNodeFrequencyGet(hdwf, i, AnalogOutNodeCarrier,
                                            &waveform.frequency),
        "FDwfAnalogOutNodeFrequencyGet");
  check(lib_->FDwfAnalogOutNodeAmplitudeGet(hdwf, i, AnalogOutNodeCarrier,
                                            &waveform.amplitude),
        "FDwfAnalogOutNodeAmplitudeGet");
  check(lib_->FDwfAnalogOutNodeOffsetGet(hdwf, i, AnalogOutNodeCarrier,
                                         &waveform.offset),
        "FDwfAnalogOutNodeOffsetGet");
  check(lib_->FDwfAnalogOutNodeSymmetryGet(hdwf, i, AnalogOutNodeCarrier,
                                           &waveform.symmetry),
        "FDwfAnalogOutNodeSymmetryGet");
  check(lib_->FDwfAnalogOutNodePhaseGet(hdwf, i, AnalogOutNodeCarrier,
                                        &waveform.phase),
        "FDwfAnalogOutNodePhaseGet");
  return waveform;
}

void DwfScopeDriver::analog_out_set_data(WaveGenChannel ch,
                                         const std::vector<double> &data) {
  auto hdwf = handle("FDwfAnalogOutNodeDataInfo");
  int min_samples = 0;
  int max_samples = 0;
  check(lib_->FDwfAnalogOutNodeDataInfo(hdwf, channel_index(ch), AnalogOutNodeCarrier,
                                        &min_samples, &max_samples),
        "FDwfAnalogOutNodeDataInfo");

  std::vector<double> buffer(data);
  if (static_cast<int>(buffer.size()) > max_samples) {
    LOG_WARN("DWF", "PLAY",
             "{} data of {} samples truncated to the device maximum of {}",
             to_string(ch), buffer.size(), max_samples);
    buffer.resize(static_cast<std::size_t>(max_samples));
  }
  check(lib_->FDwfAnalogOutNodeDataSet(hdwf, channel_index(ch), AnalogOutNodeCarrier,
                                       buffer.data(),
                                       static_cast<int>(buffer.size())),
        "FDwfAnalogOutNodeDataSet");
}

void DwfScopeDriver::analog_out_set_timing(WaveGenChannel ch,
                                           double run_seconds,
                                           double wait_seconds, int repeats) {
  auto hdwf = handle("FDwfAnalogOutRunSet");
  check(lib_->FDwfAnalogOutRunSet(hdwf, channel_index(ch), run_seconds),
        "FDwfAnalogOutRunSet");
  check(lib_->FDwfAnalogOutWaitSet(hdwf, channel_index(ch), wait_seconds),
        "FDwfAnalogOutWaitSet");
  check(lib_->FDwfAnalogOutRepeatSet(hdwf, channel_index(ch), repeats),
        "FDwfAnalogOutRepeatSet");
}

void DwfScopeDriver::analog_out_set_idle(WaveGenChannel ch, OutputIdle idle) {
  check(lib_->FDwfAnalogOutIdleSet(handle("FDwfAnalogOutIdleSet"), channel_index(ch),
                                   to_dwf(idle)),
        "FDwfAnalogOutIdleSet");
}

void DwfScopeDriver::analog_out_set_trigger(WaveGenChannel ch,
                                            TriggerSource source,
                                            TriggerSlope slope) {
  auto hdwf = handle("FDwfAnalogOutTriggerSourceSet");
  check(lib_->FDwfAnalogOutTriggerSourceSet(hdwf, channel_index(ch), to_dwf(source)),
        "FDwfAnalogOutTriggerSourceSet");
  check(lib_->FDwfAnalogOutTriggerSlopeSet(hdwf, channel_index(ch), to_dwf(slope)),
        "FDwfAnalogOutTriggerSlopeSet");
}

void DwfScopeDriver::analog_io_reset() {
  check(lib_->FDwfAnalogIOReset(handle("FDwfAnalogIOReset")),
        "FDwfAnalogIOReset");
}

void DwfScopeDriver::analog_io_status() {
  check(lib_->FDwfAnalogIOStatus(handle("FDwfAnalogIOStatus")),
        "FDwfAnalogIOStatus");
}

void DwfScopeDriver::analog_io_enable(bool enable) {
  check(lib_->FDwfAnalogIOEnableSet(handle("FDwfAnalogIOEnableSet"),
                                    enable ? 1 : 0),
        "FDwfAnalogIOEnableSet");
}

bool DwfScopeDriver::analog_io_enabled() {
  int enabled = 0;
  check(lib_->FDwfAnalogIOEnableStatus(handle("FDwfAnalogIOEnableStatus"),
                                       &enabled),
        "FDwfAnalogIOEnableStatus");
  return enabled != 0;
}

void DwfScopeDriver::analog_io_set_node(int channel, int node, double value) {
  check(lib_->FDwfAnalogIOChannelNodeSet(handle("FDwfAnalogIOChannelNodeSet"),
                                         channel, node, value),
        "FDwfAnalogIOChannelNodeSet");
}

double DwfScopeDriver::analog_io_node(int channel, int node) {
  double value = 0.0;
  check(lib_->FDwfAnalogIOChannelNodeGet(handle("FDwfAnalogIOChannelNodeGet"),
                                         channel, node, &value),
        "FDwfAnalogIOChannelNodeGet");
  return value;
}

double DwfScopeDriver::analog_io_node_status(int channel, int node) {
  double value = 0.0;
  check(lib_->FDwfAnalogIOChannelNodeStatus(
            handle("FDwfAnalogIOChannelNodeStatus"), channel, node, &value),
        "FDwfAnalogIOChannelNodeStatus");
  return value;
}

void DwfScopeDriver::digital_in_reset() {
  check(lib_->FDwfDigitalInReset(handle("FDwfDigitalInReset")),
        "FDwfDigitalInReset");
}

void DwfScopeDriver::digital_out_reset() {
  check(lib_->FDwfDigitalOutReset(handle("FDwfDigitalOutReset")),
        "FDwfDigitalOutReset");
}

void DwfScopeDriver::digital_io_reset() {
  check(lib_->FDwfDigitalIOReset(handle("FDwfDigitalIOReset")),
        "FDwfDigitalIOReset");
}

void DwfScopeDriver::digital_io_status() {
  check(lib_->FDwfDigitalIOStatus(handle("FDwfDigitalIOStatus")),
        "FDwfDigitalIOStatus");
}

uint32_t DwfScopeDriver::digital_io_input() {
  unsigned int mask = 0;
  check(lib_->FDwfDigitalIOInputStatus(handle("FDwfDigitalIOInputStatus"),
                                       &mask),
        "FDwfDigitalIOInputStatus");
  return mask;
}

uint32_t DwfScopeDriver::digital_io_output() {
  unsigned int mask = 0;
  check(lib_->FDwfDigitalIOOutputGet(handle("FDwfDigitalIOOutputGet"), &mask),
        "FDwfDigitalIOOutputGet");
  return mask;
}

void DwfScopeDriver::digital_io_set_output(uint32_t mask) {
  check(lib_->FDwfDigitalIOOutputSet(handle("FDwfDigitalIOOutputSet"), mask),
        "FDwfDigitalIOOutputSet");
}

uint32_t DwfScopeDriver::digital_io_output_enable() {
  unsigned int mask = 0;
  check(lib_->FDwfDigitalIOOutputEnableGet(
            handle("FDwfDigitalIOOutputEnableGet"), &mask),
        "FDwfDigitalIOOutputEnableGet");
  return mask;
}

void DwfScopeDriver::digital_io_set_output_enable(uint32_t mask) {
  check(lib_->FDwfDigitalIOOutputEnableSet(
            handle("FDwfDigitalIOOutputEnableSet"), mask),
        "FDwfDigitalIOOutputEnableSet");
}

void DwfScopeDriver::i2c_reset() {
  check(lib_->FDwfDigitalI2cReset(handle("FDwfDigitalI2cReset")),
        "FDwfDigitalI2cReset");
}

void DwfScopeDriver::i2c_set_clock_pin(int pin) {
  check(lib_->FDwfDigitalI2cSclSet(handle("FDwfDigitalI2cSclSet"), pin),
        "FDwfDigitalI2cSclSet");
}

void DwfScopeDriver::i2c_set_data_pin(int pin) {
  check(lib_->FDwfDigitalI2cSdaSet(handle("FDwfDigitalI2cSdaSet"), pin),
        "FDwfDigitalI2cSdaSet");
}

void DwfScopeDriver::i2c_set_rate(double hz) {
  auto hdwf = handle("FDwfDigitalI2cRateSet");
  check(lib_->FDwfDigitalI2cStretchSet(hdwf, 1), "FDwfDigitalI2cStretchSet");
  check(lib_->FDwfDigitalI2cRateSet(hdwf, hz), "FDwfDigitalI2cRateSet");
}

void DwfScopeDriver::i2c_set_read_nak(bool nak_last_byte) {
  check(lib_->FDwfDigitalI2cReadNakSet(handle("FDwfDigitalI2cReadNakSet"),
                                       nak_last_byte ? 1 : 0),
        "FDwfDigitalI2cReadNakSet");
}

bool DwfScopeDriver::i2c_clear() {
  int bus_free = 0;
  check(lib_->FDwfDigitalI2cClear(handle("FDwfDigitalI2cClear"), &bus_free),
        "FDwfDigitalI2cClear");
  return bus_free != 0;
}

I2CReadResult DwfScopeDriver::i2c_read(uint8_t address8, int count) {
  I2CReadResult result;
  result.data.assign(static_cast<std::size_t>(std::max(count, 0)), 0);
  check(lib_->FDwfDigitalI2cRead(handle("FDwfDigitalI2cRead"), address8,
                                 result.data.data(), count, &result.nak),
        "FDwfDigitalI2cRead");
  return result;
}

int DwfScopeDriver::i2c_write(uint8_t address8,
                              const std::vector<uint8_t> &data) {
  std::vector<uint8_t> tx(data);
  int nak = 0;
  check(lib_->FDwfDigitalI2cWrite(handle("FDwfDigitalI2cWrite"), address8,
                                  tx.data(), static_cast<int>(tx.size()),
                                  &nak),
        "FDwfDigitalI2cWrite");
  return nak;
}

void DwfScopeDriver::spi_reset() {
  check(lib_->FDwfDigitalSpiReset(handle("FDwfDigitalSpiReset")),
        "FDwfDigitalSpiReset");
}

void DwfScopeDriver::spi_set_frequency(double hz) {
  check(lib_->FDwfDigitalSpiFrequencySet(handle("FDwfDigitalSpiFrequencySet"),
                                         hz),
        "FDwfDigitalSpiFrequencySet");
}

void DwfScopeDriver::spi_set_clock_pin(int pin) {
  check(lib_->FDwfDigitalSpiClockSet(handle("FDwfDigitalSpiClockSet"), pin),
        "FDwfDigitalSpiClockSet");
}

void DwfScopeDriver::spi_set_data_pin(int dq, int pin) {
  check(lib_->FDwfDigitalSpiDataSet(handle("FDwfDigitalSpiDataSet"), dq, pin),
        "FDwfDigitalSpiDataSet");
}

void DwfScopeDriver::spi_set_idle(int dq, DigitalIdle idle) {
  check(lib_->FDwfDigitalSpiIdleSet(handle("FDwfDigitalSpiIdleSet"), dq,
                                    to_dwf(idle)),
        "FDwfDigitalSpiIdleSet");
}

void DwfScopeDriver::spi_set_mode(int mode) {
  check(lib_->FDwfDigitalSpiModeSet(handle("FDwfDigitalSpiModeSet"), mode),
        "FDwfDigitalSpiModeSet");
}

void DwfScopeDriver::spi_set_bit_order(SpiBitOrder order) {
  check(lib_->FDwfDigitalSpiOrderSet(handle("FDwfDigitalSpiOrderSet"),
                                     order == SpiBitOrder::MsbFirst ? 1 : 0),
        "FDwfDigitalSpiOrderSet");
}

void DwfScopeDriver::spi_select(int pin, int level) {
  check(lib_->FDwfDigitalSpiSelect(handle("FDwfDigitalSpiSelect"), pin, level),
        "FDwfDigitalSpiSelect");
}

uint32_t DwfScopeDriver::spi_read_one(SpiLine line, int bits) {
  unsigned int word = 0;
  check(lib_->FDwfDigitalSpiReadOne(handle("FDwfDigitalSpiReadOne"),
                                    to_dq(line), bits, &word),
        "FDwfDigitalSpiReadOne");
  return word;
}

// Word arrays go through the 8, 16 or 32 bit variant of each call
std::vector<uint32_t> DwfScopeDriver::spi_read(SpiLine line, int word_bits,
                                               int count) {
  auto hdwf = handle("FDwfDigitalSpiRead");
  auto size = static_cast<std::size_t>(std::max(count, 0));
  if (word_bits <= 8) {
    std::vector<unsigned char> rx(size);
    check(lib_->FDwfDigitalSpiRead(hdwf, to_dq(line), word_bits, rx.data(),
                                   count),
          "FDwfDigitalSpiRead");
    return std::vector<uint32_t>(rx.begin(), rx.end());
  }
  if (word_bits <= 16) {
    std::vector<unsigned short> rx(size);
    check(lib_->FDwfDigitalSpiRead16(hdwf, to_dq(line), word_bits, rx.data(),
                                     count),
          "FDwfDigitalSpiRead16");
    return std::vector<uint32_t>(rx.begin(), rx.end());
  }
  std::vector<unsigned int> rx(size);
  check(lib_->FDwfDigitalSpiRead32(hdwf, to_dq(line), word_bits, rx.data(),
                                   count),
        "FDwfDigitalSpiRead32");
  return std::vector<uint32_t>(rx.begin(), rx.end());
}

void DwfScopeDriver::spi_write_one(SpiLine line, int bits, uint32_t word) {
  check(lib_->FDwfDigitalSpiWriteOne(handle("FDwfDigitalSpiWriteOne"),
                                     to_dq(line), bits, word),
        "FDwfDigitalSpiWriteOne");
}

void DwfScopeDriver::spi_write(SpiLine line, int word_bits,
                               const std::vector<uint32_t> &words) {
  auto hdwf = handle("FDwfDigitalSpiWrite");
  int count = static_cast<int>(words.size());
  if (word_bits <= 8) {
    auto tx = narrow_words<unsigned char>(words);
    check(lib_->FDwfDigitalSpiWrite(hdwf, to_dq(line), word_bits, tx.data(),
                                    count),
          "FDwfDigitalSpiWrite");
  } else if (word_bits <= 16) {
    auto tx = narrow_words<unsigned short>(words);
    check(lib_->FDwfDigitalSpiWrite16(hdwf, to_dq(line), word_bits,
                                      tx.data(), count),
          "FDwfDigitalSpiWrite16");
  } else {
    auto tx = narrow_words<unsigned int>(words);
    check(lib_->FDwfDigitalSpiWrite32(hdwf, to_dq(line), word_bits,
                                      tx.data(), count),
          "FDwfDigitalSpiWrite32");
  }
}

std::vector<uint32_t>
DwfScopeDriver::spi_write_read(SpiLine line, int word_bits,
                               const std::vector<uint32_t> &tx, int rx_count) {
  auto hdwf = handle("FDwfDigitalSpiWriteRead");
  int tx_count = static_cast<int>(tx.size());
  auto size = static_cast<std::size_t>(std::max(rx_count, 0));
  if (word_bits <= 8) {
    auto out = narrow_words<unsigned char>(tx);
    std::vector<unsigned char> rx(size);
    check(lib_->FDwfDigitalSpiWriteRead(hdwf, to_dq(line), word_bits,
                                        out.data(), tx_count, rx.data(),
                                        rx_count),
          "FDwfDigitalSpiWriteRead");
    return std::vector<uint32_t>(rx.begin(), rx.end());
  }
  if (word_bits <= 16) {
    auto out = narrow_words<unsigned short>(tx);
    std::vector<unsigned short> rx(size);
    check(lib_->FDwfDigitalSpiWriteRead16(hdwf, to_dq(line), word_bits,
                                          out.data(), tx_count, rx.data(),
                                          rx_count),
          "FDwfDigitalSpiWriteRead16");
    return std::vector<uint32_t>(rx.begin(), rx.end());
  }
  auto out = narrow_words<unsigned int>(tx);
  std::vector<unsigned int> rx(size);
  check(lib_->FDwfDigitalSpiWriteRead32(hdwf, to_dq(line), word_bits,
                                        out.data(), tx_count, rx.data(),
                                        rx_count),
        "FDwfDigitalSpiWriteRead32");
  return std::vector<uint32_t>(rx.begin(), rx.end());
}

} // namespace dwf
} // namespace analogbench
