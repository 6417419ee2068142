#pragma once

#include <AudioToolbox/AudioToolbox.h>
#include <AudioUnit/AudioUnit.h>
#include <CoreAudio/CoreAudioTypes.h>
#include <cstdint>
#include "../core/AudioOutput.hpp"
#include "ScopedAudioUnit.hpp"

// Default-device output through the system output AudioUnit. Renders
// interleaved float32; the mono sample is written to every channel.
class CoreAudioOutput : public AudioOutput {
public:
  explicit CoreAudioOutput(double requestedSampleRate = 48000.0, uint32_t channels = 2);
  ~CoreAudioOutput() override;

  CoreAudioOutput(const CoreAudioOutput&) = delete;
  CoreAudioOutput& operator=(const CoreAudioOutput&) = delete;

  // Throws AudioError: UnknownDevice if no default output exists, BuildStream if the
  // unit cannot be configured, PlayStream if it does not start.
  void start(SampleCallback callback) override;
  void stop() override;

  double time() const override { return clock_.now(); }
  // Device rate once started, requested rate before.
  double sampleRate() const override { return sampleRate_; }
  uint32_t channels() const { return channels_; }

private:
  static OSStatus render(void* inRefCon, AudioUnitRenderActionFlags*, const AudioTimeStamp*, UInt32, UInt32 inNumberFrames, AudioBufferList* ioData) noexcept;

  AudioUnitHandle unit_{};
  SampleCallback callback_;
  SampleClock clock_;
  double sampleRate_ = 48000.0;
  uint32_t channels_ = 2;
};
