#pragma once

#include <AudioToolbox/AudioToolbox.h>
#include <AudioUnit/AudioUnit.h>

// Owns an output AudioUnit instance. Teardown order: stop, uninitialize, dispose.
class AudioUnitHandle {
public:
  AudioUnitHandle() = default;
  ~AudioUnitHandle() { reset(); }
  AudioUnitHandle(const AudioUnitHandle&) = delete;
  AudioUnitHandle& operator=(const AudioUnitHandle&) = delete;

  AudioUnit* ptr() { return &unit_; }
  AudioUnit get() const { return unit_; }
  bool valid() const { return unit_ != nullptr; }

  void markInitialized() { initialized_ = true; }
  void markStarted() { started_ = true; }
  bool started() const { return started_; }

  // Stops the unit; blocks until the render callback has returned.
  void stop() {
    if (unit_ && started_) {
      AudioOutputUnitStop(unit_);
      started_ = false;
    }
  }

  void reset() {
    if (!unit_) return;
    stop();
    if (initialized_) AudioUnitUninitialize(unit_);
    AudioComponentInstanceDispose(unit_);
    unit_ = nullptr;
    initialized_ = false;
  }

private:
  AudioUnit unit_ = nullptr;
  bool initialized_ = false;
  bool started_ = false;
};
