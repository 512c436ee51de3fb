#include "../test_utils/TestFixtures.hpp"
#include "analog-bench/discovery/AnalogDiscovery.hpp"
#include "analog-bench/errors.hpp"

#include <algorithm>
#include <cmath>
#include <gtest/gtest.h>
#include <regex>

using namespace analogbench;
using namespace analogbench::discovery;

namespace analogbench {
namespace test {

class AnalogDiscoveryTest : public SimulatedScopeTest {
protected:
  void open() {
    device_->open();
    scope_->clear_history();
  }

  RecordSettings record_settings(double hz, double length = 0.0) {
    RecordSettings settings;
    settings.sampling_frequency = hz;
    settings.record_length = length;
    settings.range = 10.0;
    return settings;
  }

  AcquisitionSettings acquisition_settings(double hz, std::size_t n) {
    AcquisitionSettings settings;
    settings.sampling_frequency = hz;
    settings.samples_count = n;
    settings.range = 10.0;
    return settings;
  }
};

// Lifecycle

TEST_F(AnalogDiscoveryTest, RequiresDriver) {
  EXPECT_THROW(AnalogDiscovery(nullptr), InvalidParameterError);
}

TEST_F(AnalogDiscoveryTest, OpenAndClose) {
  EXPECT_EQ(device_->state(), DeviceState::Unacquired);
  device_->open(2);
  EXPECT_TRUE(device_->acquired());
  EXPECT_EQ(scope_->opened_config(), 2);

  device_->close();
  EXPECT_EQ(device_->state(), DeviceState::Released);
  EXPECT_FALSE(scope_->is_open());
}

TEST_F(AnalogDiscoveryTest, OpenWithoutDeviceThrowsDeviceNotFound) {
  scope_->set_devices({});
  EXPECT_THROW(device_->open(), DeviceNotFoundError);
  EXPECT_EQ(device_->state(), DeviceState::Unacquired);
}

TEST_F(AnalogDiscoveryTest, OpenRejectsNegativeConfiguration) {
  EXPECT_THROW(device_->open(-1), InvalidParameterError);
  EXPECT_EQ(scope_->call_count("open"), 0u);
}

TEST_F(AnalogDiscoveryTest, OpenTwiceAndReopenAfterClose) {
  device_->open();
  EXPECT_THROW(device_->open(), BenchError);
  device_->close();
  EXPECT_THROW(device_->open(), NotAcquiredError);
}

TEST_F(AnalogDiscoveryTest, CallsWithoutOpenDeviceThrowNotAcquired) {
  EXPECT_THROW(device_->adc_bits(), NotAcquiredError);
  EXPECT_THROW(device_->enable_channel(ScopeChannel::Channel1),
               NotAcquiredError);
  EXPECT_THROW(device_->read_voltage(ScopeChannel::Channel1),
               NotAcquiredError);
  EXPECT_THROW(device_->power_supply_enabled(), NotAcquiredError);

  device_->open();
  device_->close();
  EXPECT_THROW(device_->read_recorded(ScopeChannel::Channel1),
               NotAcquiredError);
  EXPECT_THROW(device_->close(), NotAcquiredError);
}

TEST_F(AnalogDiscoveryTest, EnumerationWorksWithoutOpenDevice) {
  auto devices = device_->devices_info();
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].name, "Analog Discovery 2");
  EXPECT_EQ(device_->library_version(), "3.20.1");
}

TEST_F(AnalogDiscoveryTest, DeviceConfigInfoWorksWithoutOpenDevice) {
  auto configs = device_->device_config_info();
  ASSERT_EQ(configs.size(), 3u);
  EXPECT_EQ(configs[0].index, 0);
  EXPECT_EQ(configs[0].analog_in_buffer_size, 8192);
  EXPECT_EQ(configs[1].analog_in_buffer_size, 16384);
  EXPECT_EQ(configs[2].analog_out_buffer_size, 16384);
  EXPECT_EQ(device_->state(), DeviceState::Unacquired);

  EXPECT_THROW(device_->device_config_info(-1), InvalidParameterError);
  EXPECT_THROW(device_->device_config_info(1), DwfError);
}

TEST_F(AnalogDiscoveryTest, DeviceQueries) {
  open();
  EXPECT_EQ(device_->adc_bits(), 14);
  auto info = device_->input_range_info();
  EXPECT_DOUBLE_EQ(info.min, 0.5);
  EXPECT_DOUBLE_EQ(info.max, 50.0);
  EXPECT_EQ(info.steps, 2);
  EXPECT_EQ(device_->auto_configure(), AutoConfigure::Enabled);
}

TEST_F(AnalogDiscoveryTest, DestructorClosesDevice) {
  device_->open();
  scope_->set_error("close", 1, "Device busy");
  EXPECT_NO_THROW(device_.reset());
}

TEST_F(AnalogDiscoveryTest, SdkErrorsPropagateUnchanged) {
  open();
  scope_->set_error("analog_in_bits", 3, "Device communication failed");
  try {
    device_->adc_bits();
    FAIL() << "expected DwfError";
  } catch (const DwfError &ex) {
    EXPECT_EQ(ex.code(), 3);
    EXPECT_EQ(ex.sdk(), "WaveForms");
  }
}

// Channels

TEST_F(AnalogDiscoveryTest, EnableAndDisableChannels) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);
  EXPECT_TRUE(device_->channel_enabled(WaveGenChannel::WaveGen1));
  EXPECT_FALSE(device_->channel_enabled(WaveGenChannel::WaveGen2));

  device_->disable_channel(ScopeChannel::Channel2);
  EXPECT_FALSE(device_->channel_enabled(ScopeChannel::Channel2));
  device_->enable_channel(ScopeChannel::Channel2);
  EXPECT_TRUE(device_->channel_enabled(ScopeChannel::Channel2));
}

TEST_F(AnalogDiscoveryTest, Coupling) {
  open();
  EXPECT_EQ(device_->coupling(ScopeChannel::Channel1), Coupling::DC);
  device_->set_coupling(ScopeChannel::Channel1, Coupling::AC);
  EXPECT_EQ(device_->coupling(ScopeChannel::Channel1), Coupling::AC);
}

// Waveform generator

TEST_F(AnalogDiscoveryTest, PlayConfiguresAndStartsChannels) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);
  device_->enable_channel(WaveGenChannel::WaveGen2);

  PlaySettings settings;
  settings.waveform.signal = OutputSignal::Square;
  settings.waveform.frequency = 500.0;
  settings.waveform.amplitude = 2.0;
  settings.waveform.offset = 0.5;
  settings.idle = OutputIdle::Offset;
  settings.trigger = TriggerSource::PC;
  device_->play({WaveGenChannel::WaveGen1, WaveGenChannel::WaveGen2},
                settings);

  EXPECT_TRUE(scope_->output_running(WaveGenChannel::WaveGen1));
  EXPECT_TRUE(scope_->output_running(WaveGenChannel::WaveGen2));
  EXPECT_EQ(scope_->output_idle(WaveGenChannel::WaveGen2), OutputIdle::Offset);
  EXPECT_EQ(scope_->call_count("analog_out_set_trigger"), 2u);
  EXPECT_EQ(scope_->call_count("analog_out_set_data"), 0u);
  EXPECT_EQ(device_->play_status(WaveGenChannel::WaveGen1),
            InstrumentState::Running);

  auto history = scope_->get_call_history();
  auto first_start = std::find(history.begin(), history.end(),
                               "analog_out_configure");
  auto last_setup = std::find(history.rbegin(), history.rend(),
                              "analog_out_set_timing");
  // Both channels are set up before either starts
  EXPECT_GT(first_start - history.begin(),
            history.rend() - last_setup - 1);
}

TEST_F(AnalogDiscoveryTest, PlayRequiresEnabledChannels) {
  open();
  PlaySettings settings;
  EXPECT_THROW(device_->play({WaveGenChannel::WaveGen1}, settings),
               NotConfiguredError);
  EXPECT_THROW(device_->play({}, settings), InvalidParameterError);
  EXPECT_EQ(scope_->call_count("analog_out_configure"), 0u);
}

TEST_F(AnalogDiscoveryTest, PlayValidatesSettings) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);

  PlaySettings custom;
  custom.waveform.signal = OutputSignal::Custom;
  EXPECT_THROW(device_->play({WaveGenChannel::WaveGen1}, custom),
               InvalidParameterError);

  PlaySettings no_frequency;
  no_frequency.waveform.frequency = 0.0;
  EXPECT_THROW(device_->play({WaveGenChannel::WaveGen1}, no_frequency),
               InvalidParameterError);

  PlaySettings negative;
  negative.repeat_count = -1;
  EXPECT_THROW(device_->play({WaveGenChannel::WaveGen1}, negative),
               InvalidParameterError);

  // DC needs no frequency
  PlaySettings dc;
  dc.waveform.signal = OutputSignal::DC;
  dc.waveform.frequency = 0.0;
  dc.waveform.offset = 1.2;
  EXPECT_NO_THROW(device_->play({WaveGenChannel::WaveGen1}, dc));
}

TEST_F(AnalogDiscoveryTest, PlayCustomDataIsLoaded) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);

  PlaySettings settings;
  settings.waveform.signal = OutputSignal::Custom;
  settings.data = {0.0, 0.5, 1.0, 0.5, 0.0, -0.5, -1.0, -0.5};
  device_->play({WaveGenChannel::WaveGen1}, settings);

  EXPECT_EQ(scope_->output_data(WaveGenChannel::WaveGen1), settings.data);
}

TEST_F(AnalogDiscoveryTest, PlayStatusBeforePlayThrowsNotConfigured) {
  open();
  EXPECT_THROW(device_->play_status(WaveGenChannel::WaveGen2),
               NotConfiguredError);
}

// Record

TEST_F(AnalogDiscoveryTest, RecordBeforeSetupThrowsNotConfigured) {
  open();
  EXPECT_THROW(device_->read_recorded(ScopeChannel::Channel1),
               NotConfiguredError);
  EXPECT_THROW(device_->fill_recorded_samples(ScopeChannel::Channel1, 100),
               NotConfiguredError);
  EXPECT_EQ(scope_->call_count("analog_in_record_status"), 0u);
}

TEST_F(AnalogDiscoveryTest, RecordValidatesArguments) {
  open();
  EXPECT_THROW(device_->record({ScopeChannel::Channel1}, record_settings(0)),
               InvalidParameterError);
  EXPECT_THROW(device_->record({}, record_settings(1e5)),
               InvalidParameterError);
  EXPECT_THROW(
      device_->record({ScopeChannel::Channel1}, record_settings(1e5, -1.0)),
      InvalidParameterError);

  device_->disable_channel(ScopeChannel::Channel2);
  EXPECT_THROW(device_->record({ScopeChannel::Channel2}, record_settings(1e5)),
               NotConfiguredError);
}

TEST_F(AnalogDiscoveryTest, RecordConfiguresRecordMode) {
  open();
  auto settings = record_settings(1e5, 0.5);
  settings.filter = AnalogFilter::MinMax;
  TriggerSettings trigger;
  trigger.source = TriggerSource::DetectorAnalogIn;
  trigger.level = 0.5;
  settings.trigger = trigger;
  device_->record({ScopeChannel::Channel1, ScopeChannel::Channel2}, settings);

  EXPECT_EQ(scope_->acquisition_mode(), AcquisitionMode::Record);
  EXPECT_DOUBLE_EQ(scope_->frequency(), 1e5);
  EXPECT_DOUBLE_EQ(scope_->record_length(), 0.5);
  EXPECT_EQ(scope_->filter(ScopeChannel::Channel2), AnalogFilter::MinMax);
  ASSERT_TRUE(scope_->trigger(ScopeChannel::Channel1));
  EXPECT_DOUBLE_EQ(scope_->trigger(ScopeChannel::Channel1)->level, 0.5);
  EXPECT_FALSE(scope_->trigger(ScopeChannel::Channel2));
  EXPECT_EQ(device_->auto_configure(), AutoConfigure::Disabled);
}

TEST_F(AnalogDiscoveryTest, RecordStatusAndReadRecorded) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double) { return 1.25; });
  scope_->set_chunk_size(300);
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));

  EXPECT_EQ(device_->record_status(), InstrumentState::Armed);
  EXPECT_TRUE(device_->read_recorded(ScopeChannel::Channel1).empty());

  EXPECT_EQ(device_->record_status(), InstrumentState::Running);
  auto samples = device_->read_recorded(ScopeChannel::Channel1);
  ASSERT_EQ(samples.size(), 300u);
  for (auto v : samples) {
    EXPECT_DOUBLE_EQ(v, 1.25);
  }
}

TEST_F(AnalogDiscoveryTest, FillRecordedSamplesAcrossChunks) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double) { return 2.0; });
  scope_->set_chunk_size(700);
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));

  auto samples = device_->fill_recorded_samples(ScopeChannel::Channel1, 2000);
  ASSERT_EQ(samples.size(), 2000u);
  for (auto v : samples) {
    EXPECT_NEAR(v, 2.0, 1e-3);
  }
}

TEST_F(AnalogDiscoveryTest, FillScalesRawWithRangeAndOffset) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double t) { return 0.2 + t; });
  auto settings = record_settings(1000.0);
  settings.range = 2.0;
  settings.offset = 0.5;
  device_->record({ScopeChannel::Channel1}, settings);

  auto samples = device_->fill_recorded_samples(ScopeChannel::Channel1, 500);
  ASSERT_EQ(samples.size(), 500u);
  // One raw step of a 2 V range
  double lsb = 2.0 / 65536.0;
  for (std::size_t i = 0; i < samples.size(); ++i) {
    EXPECT_NEAR(samples[i], 0.2 + i / 1000.0, lsb) << "sample " << i;
  }
}

TEST_F(AnalogDiscoveryTest, FillMultipleChannelsStaysAligned) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double t) { return t; });
  scope_->connect(ScopeChannel::Channel2, [](double t) { return -t; });
  scope_->set_chunk_size(128);
  device_->record({ScopeChannel::Channel1, ScopeChannel::Channel2},
                  record_settings(1000.0));

  auto data = device_->fill_recorded_samples(
      {ScopeChannel::Channel1, ScopeChannel::Channel2}, 1000);
  ASSERT_EQ(data.size(), 2u);
  ASSERT_EQ(data[0].size(), 1000u);
  ASSERT_EQ(data[1].size(), 1000u);
  for (std::size_t i = 0; i < 1000; i += 97) {
    EXPECT_NEAR(data[0][i], i / 1000.0, 1e-3);
    EXPECT_NEAR(data[1][i], -data[0][i], 1e-3);
  }
}

TEST_F(AnalogDiscoveryTest, FillCountsLostSamples) {
  open();
  scope_->set_chunk_size(100);
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));
  scope_->inject_record_loss(50, 5);

  auto samples = device_->fill_recorded_samples(ScopeChannel::Channel1, 250);
  ASSERT_EQ(samples.size(), 250u);
  // 50 lost + 100 + 100 fills the request in two data reads
  EXPECT_EQ(scope_->call_count("analog_in_data16"), 2u);
}

TEST_F(AnalogDiscoveryTest, FillFailsWhenRecordEndsEarly) {
  open();
  scope_->set_chunk_size(100);
  device_->record({ScopeChannel::Channel1}, record_settings(1000.0, 0.2));
  EXPECT_THROW(device_->fill_recorded_samples(ScopeChannel::Channel1, 500),
               BenchError);
}

TEST_F(AnalogDiscoveryTest, FillRejectsZeroSamples) {
  open();
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));
  EXPECT_THROW(device_->fill_recorded_samples(ScopeChannel::Channel1, 0),
               InvalidParameterError);
  EXPECT_THROW(device_->fill_recorded_samples(std::vector<ScopeChannel>{}, 10),
               InvalidParameterError);
}

TEST_F(AnalogDiscoveryTest, CircularFillKeepsLatestSamplesInOrder) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double t) { return t; });
  scope_->set_chunk_size(300);
  device_->record({ScopeChannel::Channel1}, record_settings(1000.0, 1.0));

  // 1000 samples wrap a 250 sample ring four times
  auto samples = device_->fill_recorded_circular(ScopeChannel::Channel1, 250);
  ASSERT_EQ(samples.size(), 250u);
  EXPECT_NEAR(samples.front(), 0.750, 1e-3);
  EXPECT_NEAR(samples.back(), 0.999, 1e-3);
  EXPECT_TRUE(std::is_sorted(samples.begin(), samples.end()));
}

TEST_F(AnalogDiscoveryTest, CircularFillNeedsFiniteRecording) {
  open();
  EXPECT_THROW(device_->fill_recorded_circular(ScopeChannel::Channel1, 100),
               NotConfiguredError);
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));
  EXPECT_THROW(device_->fill_recorded_circular(ScopeChannel::Channel1, 100),
               NotConfiguredError);
}

// Screen

TEST_F(AnalogDiscoveryTest, ScreenRollsLatestSamples) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double t) { return t; });
  scope_->set_chunk_size(200);
  ScreenSettings settings;
  settings.sampling_frequency = 1000.0;
  settings.samples_count = 500;
  device_->start_analog_screen({ScopeChannel::Channel1}, settings);
  EXPECT_EQ(scope_->acquisition_mode(), AcquisitionMode::ScanShift);
  EXPECT_EQ(scope_->buffer_size(), 500);
  EXPECT_EQ(device_->auto_configure(), AutoConfigure::Disabled);

  std::vector<ScopeChannel> channels{ScopeChannel::Channel1};
  auto first = device_->retrieve_analog_screen(channels, 500,
                                               std::chrono::milliseconds(0));
  ASSERT_EQ(first.size(), 1u);
  ASSERT_EQ(first[0].size(), 200u);
  EXPECT_NEAR(first[0].back(), 0.199, 1e-6);

  device_->retrieve_analog_screen(channels, 500, std::chrono::milliseconds(0));
  auto full = device_->retrieve_analog_screen(channels, 500,
                                              std::chrono::milliseconds(0));
  ASSERT_EQ(full[0].size(), 500u);
  EXPECT_NEAR(full[0].front(), 0.100, 1e-6);
  EXPECT_NEAR(full[0].back(), 0.599, 1e-6);
}

TEST_F(AnalogDiscoveryTest, ScreenRetrieveLimitsSampleCount) {
  open();
  scope_->set_chunk_size(400);
  ScreenSettings settings;
  settings.sampling_frequency = 1e4;
  settings.samples_count = 1000;
  device_->start_analog_screen({ScopeChannel::Channel1}, settings);
  auto screen = device_->retrieve_analog_screen(
      {ScopeChannel::Channel1}, 100, std::chrono::milliseconds(0));
  EXPECT_EQ(screen[0].size(), 100u);
}

TEST_F(AnalogDiscoveryTest, ScreenRetrieveBeforeStartThrowsNotConfigured) {
  open();
  EXPECT_THROW(device_->retrieve_analog_screen({ScopeChannel::Channel1}, 10,
                                               std::chrono::milliseconds(0)),
               NotConfiguredError);

  ScreenSettings settings;
  settings.sampling_frequency = 1e4;
  settings.samples_count = 100;
  device_->start_analog_screen({ScopeChannel::Channel1}, settings);
  device_->reset_analog_input();
  EXPECT_THROW(device_->retrieve_analog_screen({ScopeChannel::Channel1}, 10,
                                               std::chrono::milliseconds(0)),
               NotConfiguredError);
}

// Single and repeated acquisitions

TEST_F(AnalogDiscoveryTest, AcquireSingleReturnsBuffer) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double) { return -1.5; });
  auto data = device_->acquire_single(ScopeChannel::Channel1,
                                      acquisition_settings(1e6, 4096));
  ASSERT_EQ(data.size(), 4096u);
  EXPECT_DOUBLE_EQ(data.front(), -1.5);
  EXPECT_EQ(scope_->acquisition_mode(), AcquisitionMode::Single);
  EXPECT_EQ(scope_->buffer_size(), 4096);
}

TEST_F(AnalogDiscoveryTest, AcquireSingleClampsToBuffer) {
  open();
  auto data = device_->acquire_single(ScopeChannel::Channel1,
                                      acquisition_settings(1e6, 100000));
  EXPECT_EQ(data.size(), 8192u);
}

TEST_F(AnalogDiscoveryTest, AcquireSingleDisablesAutoTriggerTimeout) {
  open();
  auto settings = acquisition_settings(1e6, 100);
  TriggerSettings trigger;
  trigger.source = TriggerSource::DetectorAnalogIn;
  trigger.auto_timeout = 2.0;
  settings.trigger = trigger;
  device_->acquire_single(ScopeChannel::Channel1, settings);

  ASSERT_TRUE(scope_->trigger(ScopeChannel::Channel1));
  EXPECT_DOUBLE_EQ(scope_->trigger(ScopeChannel::Channel1)->auto_timeout, 0.0);
}

TEST_F(AnalogDiscoveryTest, AcquireValidatesArguments) {
  open();
  EXPECT_THROW(device_->acquire_single(ScopeChannel::Channel1,
                                       acquisition_settings(0.0, 100)),
               InvalidParameterError);
  EXPECT_THROW(device_->acquire_single(ScopeChannel::Channel1,
                                       acquisition_settings(1e6, 0)),
               InvalidParameterError);
}

TEST_F(AnalogDiscoveryTest, RetrieveBeforeStartThrowsNotConfigured) {
  open();
  EXPECT_THROW(device_->retrieve_acquisitions({ScopeChannel::Channel1}, 100),
               NotConfiguredError);

  // A recording does not count as an armed acquisition
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));
  EXPECT_THROW(device_->retrieve_acquisitions({ScopeChannel::Channel1}, 100),
               NotConfiguredError);
}

TEST_F(AnalogDiscoveryTest, RetrieveRepeatedAcquisitions) {
  open();
  scope_->connect(ScopeChannel::Channel1, [](double) { return 0.75; });
  scope_->connect(ScopeChannel::Channel2, [](double) { return -0.75; });
  device_->start_acquisition({ScopeChannel::Channel1, ScopeChannel::Channel2},
                             acquisition_settings(1e6, 1000));

  auto captures = device_->retrieve_acquisitions(
      {ScopeChannel::Channel1, ScopeChannel::Channel2}, 1000, 3);
  ASSERT_EQ(captures.size(), 3u);

  std::regex time_format(
      R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.123\.456\.780)");
  for (const auto &capture : captures) {
    ASSERT_EQ(capture.channels.size(), 2u);
    EXPECT_EQ(capture.channels[0].size(), 1000u);
    EXPECT_DOUBLE_EQ(capture.channels[0].front(), 0.75);
    EXPECT_DOUBLE_EQ(capture.channels[1].back(), -0.75);
    EXPECT_TRUE(std::regex_match(capture.trigger_time, time_format))
        << capture.trigger_time;
  }
  EXPECT_NE(captures[0].trigger_time, captures[1].trigger_time);
}

TEST_F(AnalogDiscoveryTest, SingleAcquisitionDoesNotRearm) {
  open();
  auto settings = acquisition_settings(1e6, 500);
  settings.single = true;
  device_->start_acquisition({ScopeChannel::Channel1}, settings);
  EXPECT_EQ(scope_->acquisition_mode(), AcquisitionMode::Single1);

  auto captures =
      device_->retrieve_acquisitions({ScopeChannel::Channel1}, 500, 2);
  ASSERT_EQ(captures.size(), 2u);
  EXPECT_EQ(captures[0].trigger_time, captures[1].trigger_time);
}

TEST_F(AnalogDiscoveryTest, ReadVoltageSamplesCurrentLevel) {
  open();
  scope_->connect(ScopeChannel::Channel3, [](double) { return 0.33; });
  EXPECT_DOUBLE_EQ(device_->read_voltage(ScopeChannel::Channel3), 0.33);
}

TEST_F(AnalogDiscoveryTest, LoopbackMeasuresWavegenDc) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);
  scope_->loopback(WaveGenChannel::WaveGen1, ScopeChannel::Channel1);

  PlaySettings dc;
  dc.waveform.signal = OutputSignal::DC;
  dc.waveform.offset = 1.8;
  device_->play({WaveGenChannel::WaveGen1}, dc);

  auto data = device_->acquire_single(ScopeChannel::Channel1,
                                      acquisition_settings(1e5, 256));
  for (auto v : data) {
    EXPECT_NEAR(v, 1.8, 5e-2);
  }
}

TEST_F(AnalogDiscoveryTest, LoopbackMeasuresWavegenSine) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);
  scope_->loopback(WaveGenChannel::WaveGen1, ScopeChannel::Channel1);

  PlaySettings sine;
  sine.waveform.frequency = 1000.0;
  sine.waveform.amplitude = 1.0;
  device_->play({WaveGenChannel::WaveGen1}, sine);

  auto data = device_->acquire_single(ScopeChannel::Channel1,
                                      acquisition_settings(1e5, 1000));
  auto [lo, hi] = std::minmax_element(data.begin(), data.end());
  EXPECT_NEAR(*hi, 1.0, 1e-2);
  EXPECT_NEAR(*lo, -1.0, 1e-2);
}

TEST_F(AnalogDiscoveryTest, ResetAnalogInstrumentClearsState) {
  open();
  device_->enable_channel(WaveGenChannel::WaveGen1);
  PlaySettings settings;
  device_->play({WaveGenChannel::WaveGen1}, settings);
  device_->record({ScopeChannel::Channel1}, record_settings(1e5));

  device_->reset_analog_instrument();
  EXPECT_FALSE(scope_->output_running(WaveGenChannel::WaveGen1));
  EXPECT_THROW(device_->play_status(WaveGenChannel::WaveGen1),
               NotConfiguredError);
  EXPECT_THROW(device_->read_recorded(ScopeChannel::Channel1),
               NotConfiguredError);
}

TEST_F(AnalogDiscoveryTest, ResetDigitalInstrumentResetsAllDigital) {
  open();
  device_->reset_digital_instrument();
  EXPECT_EQ(scope_->call_count("digital_out_reset"), 1u);
  EXPECT_EQ(scope_->call_count("digital_io_reset"), 1u);
  EXPECT_EQ(scope_->call_count("digital_in_reset"), 1u);
}

// Supplies

TEST_F(AnalogDiscoveryTest, PowerSupplyConfigureAndEnable) {
  open();
  device_->configure_power_supply(3.3, -3.3);
  EXPECT_FALSE(device_->power_supply_enabled());

  device_->enable_power_supply();
  EXPECT_TRUE(device_->power_supply_enabled());

  auto v = device_->power_supply_voltages();
  EXPECT_DOUBLE_EQ(v.positive, 3.3);
  EXPECT_DOUBLE_EQ(v.negative, -3.3);

  device_->disable_power_supply();
  EXPECT_FALSE(device_->power_supply_enabled());
}

TEST_F(AnalogDiscoveryTest, PowerSupplyVoltagesAreClamped) {
  open();
  device_->configure_power_supply(7.0, -9.0);
  auto v = device_->power_supply_voltages();
  EXPECT_DOUBLE_EQ(v.positive, 5.0);
  EXPECT_DOUBLE_EQ(v.negative, -5.0);

  device_->set_power_supply_voltages(-1.0, 2.0);
  v = device_->power_supply_voltages();
  EXPECT_DOUBLE_EQ(v.positive, 0.0);
  EXPECT_DOUBLE_EQ(v.negative, 0.0);
}

TEST_F(AnalogDiscoveryTest, SetPositiveVoltageOnlyKeepsNegative) {
  open();
  device_->configure_power_supply(3.3, -3.3);
  device_->set_power_supply_voltages(1.8);
  auto v = device_->power_supply_voltages();
  EXPECT_DOUBLE_EQ(v.positive, 1.8);
  EXPECT_DOUBLE_EQ(v.negative, -3.3);
}

TEST_F(AnalogDiscoveryTest, PowerSupplyMonitor) {
  open();
  scope_->set_monitor(3, 0, 4.9);
  auto m = device_->power_supply_monitor();
  EXPECT_DOUBLE_EQ(m.usb_voltage, 5.0);
  EXPECT_DOUBLE_EQ(m.usb_current, 0.12);
  EXPECT_DOUBLE_EQ(m.aux_voltage, 4.9);
  EXPECT_DOUBLE_EQ(m.aux_current, 0.0);
}

// Digital IO

TEST_F(AnalogDiscoveryTest, DigitalOutputsReadBack) {
  open();
  device_->set_digital_mode(DigitalPin::DIO3, true);
  EXPECT_TRUE(device_->digital_mode(DigitalPin::DIO3));
  EXPECT_FALSE(device_->digital_mode(DigitalPin::DIO4));

  device_->set_digital_state(DigitalPin::DIO3, true);
  EXPECT_TRUE(device_->digital_state(DigitalPin::DIO3));
  device_->set_digital_state(DigitalPin::DIO3, false);
  EXPECT_FALSE(device_->digital_state(DigitalPin::DIO3));
}

TEST_F(AnalogDiscoveryTest, DigitalInputsFollowExternalLevel) {
  open();
  device_->set_digital_mode(DigitalPin::DIO7, false);
  scope_->set_pin_input(DigitalPin::DIO7, true);
  EXPECT_TRUE(device_->digital_state(DigitalPin::DIO7));
  scope_->set_pin_input(DigitalPin::DIO7, false);
  EXPECT_FALSE(device_->digital_state(DigitalPin::DIO7));
}

TEST_F(AnalogDiscoveryTest, DigitalModeChangesOnlyOnePin) {
  open();
  device_->set_digital_mode(DigitalPin::DIO0, true);
  device_->set_digital_mode(DigitalPin::DIO15, true);
  device_->set_digital_mode(DigitalPin::DIO0, false);
  EXPECT_FALSE(device_->digital_mode(DigitalPin::DIO0));
  EXPECT_TRUE(device_->digital_mode(DigitalPin::DIO15));
}

// I2C

TEST_F(AnalogDiscoveryTest, I2CWriteSetsPointerThenReadReturnsRegisters) {
  open();
  scope_->add_i2c_target(0x50, {0x00, 0x00, 0x00, 0x00});
  device_->configure_i2c(DigitalPin::DIO2, DigitalPin::DIO3);
  EXPECT_DOUBLE_EQ(scope_->i2c_rate(), 1e5);

  EXPECT_EQ(device_->i2c_write(0x50, {0x01, 0xAB, 0xCD}), 0);
  EXPECT_EQ(scope_->i2c_registers(0x50),
            (std::vector<uint8_t>{0x00, 0xAB, 0xCD, 0x00}));

  device_->i2c_write(0x50, {0x01});
  auto result = device_->i2c_read(0x50, 2);
  EXPECT_EQ(result.nak, 0);
  EXPECT_EQ(result.data, (std::vector<uint8_t>{0xAB, 0xCD}));
}

TEST_F(AnalogDiscoveryTest, I2CMissingTargetReportsNak) {
  open();
  device_->configure_i2c(DigitalPin::DIO0, DigitalPin::DIO1);
  EXPECT_EQ(device_->i2c_write(0x23, {0x00}), 1);
  EXPECT_EQ(device_->i2c_read(0x23, 1).nak, 1);
}

TEST_F(AnalogDiscoveryTest, I2CValidatesConfigurationAndAddress) {
  open();
  EXPECT_THROW(device_->i2c_read(0x50, 1), NotConfiguredError);
  EXPECT_THROW(device_->configure_i2c(DigitalPin::DIO0, DigitalPin::DIO0),
               InvalidParameterError);
  EXPECT_THROW(device_->configure_i2c(DigitalPin::DIO0, DigitalPin::DIO1, 0.0),
               InvalidParameterError);

  device_->configure_i2c(DigitalPin::DIO0, DigitalPin::DIO1);
  EXPECT_THROW(device_->i2c_read(0x80, 1), InvalidParameterError);
  EXPECT_THROW(device_->i2c_read(0x50, 0), InvalidParameterError);
  EXPECT_THROW(device_->i2c_write(0x50, {}), InvalidParameterError);

  device_->reset_i2c();
  EXPECT_THROW(device_->i2c_write(0x50, {0x00}), NotConfiguredError);
}

TEST_F(AnalogDiscoveryTest, I2CLockedBusThrows) {
  open();
  scope_->set_i2c_bus_locked(true);
  EXPECT_THROW(device_->configure_i2c(DigitalPin::DIO0, DigitalPin::DIO1),
               BenchError);
  EXPECT_THROW(device_->i2c_read(0x50, 1), NotConfiguredError);
}

// SPI

TEST_F(AnalogDiscoveryTest, SPIConfigureSetsLinesAndDeselects) {
  open();
  SpiSettings settings;
  settings.frequency = 2e6;
  settings.mode = 1;
  settings.bit_order = SpiBitOrder::LsbFirst;
  device_->configure_spi(settings);

  EXPECT_DOUBLE_EQ(scope_->spi_frequency(), 2e6);
  EXPECT_EQ(scope_->spi_mode(), 1);
  EXPECT_EQ(scope_->spi_bit_order(), SpiBitOrder::LsbFirst);
  EXPECT_EQ(scope_->spi_data_pin(0), 3);
  EXPECT_EQ(scope_->spi_data_pin(1), 2);
  EXPECT_EQ(scope_->spi_idle(0), DigitalIdle::HighZ);
  EXPECT_EQ(scope_->spi_idle(1), DigitalIdle::HighZ);
  EXPECT_EQ(scope_->spi_select_level(0), 1);
}

TEST_F(AnalogDiscoveryTest, SPIExchangeSelectsAroundTransfer) {
  open();
  device_->configure_spi(SpiSettings{});
  scope_->queue_spi_response({0xBEEF});
  scope_->clear_history();

  auto rx = device_->spi_exchange(DigitalPin::DIO0, 16, {0x9F00}, 1);
  EXPECT_EQ(rx, (std::vector<uint32_t>{0xBEEF}));
  auto history = scope_->get_call_history();
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0], "spi_select");
  EXPECT_EQ(history[1], "spi_write_read");
  EXPECT_EQ(history[2], "spi_select");
  EXPECT_EQ(scope_->spi_select_level(0), 1);
  ASSERT_EQ(scope_->spi_written().size(), 1u);
  EXPECT_EQ(scope_->spi_written()[0], (std::vector<uint32_t>{0x9F00}));
}

TEST_F(AnalogDiscoveryTest, SPIReadAndWriteWords) {
  open();
  device_->configure_spi(SpiSettings{});
  scope_->queue_spi_response({0x12, 0x34, 0x1FF});

  EXPECT_EQ(device_->spi_read(DigitalPin::DIO0, 8, 2),
            (std::vector<uint32_t>{0x12, 0x34}));
  EXPECT_EQ(device_->spi_read_one(DigitalPin::DIO0, 8), 0xFFu);

  device_->spi_write(DigitalPin::DIO0, 8, {0x01, 0x02});
  device_->spi_write_one(DigitalPin::DIO0, 12, 0xABC);
  ASSERT_EQ(scope_->spi_written().size(), 2u);
  EXPECT_EQ(scope_->spi_written()[0], (std::vector<uint32_t>{0x01, 0x02}));
  EXPECT_EQ(scope_->spi_written()[1], (std::vector<uint32_t>{0xABC}));
}

TEST_F(AnalogDiscoveryTest, SPITransferFailureStillDeselects) {
  open();
  device_->configure_spi(SpiSettings{});
  scope_->set_error("spi_read", 5, "Transfer timeout");
  EXPECT_THROW(device_->spi_read(DigitalPin::DIO0, 8, 4), DwfError);
  EXPECT_EQ(scope_->spi_select_level(0), 1);
}

TEST_F(AnalogDiscoveryTest, SPIValidatesArguments) {
  open();
  EXPECT_THROW(device_->spi_read_one(DigitalPin::DIO0, 8), NotConfiguredError);

  SpiSettings bad_mode;
  bad_mode.mode = 4;
  EXPECT_THROW(device_->configure_spi(bad_mode), InvalidParameterError);

  device_->configure_spi(SpiSettings{});
  EXPECT_THROW(device_->spi_read(DigitalPin::DIO0, 12, 1),
               InvalidParameterError);
  EXPECT_THROW(device_->spi_read(DigitalPin::DIO0, 8, 0),
               InvalidParameterError);
  EXPECT_THROW(device_->spi_read_one(DigitalPin::DIO0, 33),
               InvalidParameterError);
  EXPECT_THROW(device_->spi_write(DigitalPin::DIO0, 8, {}),
               InvalidParameterError);
  EXPECT_THROW(device_->spi_exchange(DigitalPin::DIO0, 8, {0x01}, 0),
               InvalidParameterError);

  device_->reset_spi();
  EXPECT_THROW(device_->spi_write_one(DigitalPin::DIO0, 8, 0x00),
               NotConfiguredError);
}

} // namespace test
} // namespace analogbench
