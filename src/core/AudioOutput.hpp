#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

enum class AudioErrorKind : uint8_t { UnknownDevice = 0, DefaultStreamConfig, BuildStream, PlayStream };

inline const char* toString(AudioErrorKind k) {
  switch (k) {
    case AudioErrorKind::UnknownDevice: return "UnknownDevice";
    case AudioErrorKind::DefaultStreamConfig: return "DefaultStreamConfig";
    case AudioErrorKind::BuildStream: return "BuildStream";
    case AudioErrorKind::PlayStream: return "PlayStream";
  }
  return "UnknownDevice";
}

// Startup failure of an output binding. Never thrown once the stream runs.
class AudioError : public std::runtime_error {
public:
  AudioError(AudioErrorKind kind, const std::string& what)
  : std::runtime_error(what), kind_(kind) {}
  AudioErrorKind kind() const noexcept { return kind_; }

private:
  AudioErrorKind kind_;
};

// Monotonic seconds counter. Only the render thread advances it; any thread may read it.
class SampleClock {
public:
  double now() const noexcept { return seconds_.load(std::memory_order_relaxed); }
  void advance(double step) noexcept {
    seconds_.store(seconds_.load(std::memory_order_relaxed) + step, std::memory_order_relaxed);
  }
  void reset() noexcept { seconds_.store(0.0, std::memory_order_relaxed); }

private:
  std::atomic<double> seconds_{0.0};
};

// Per-frame callback: receives the current clock time, returns a mono sample.
using SampleCallback = std::function<double(double)>;

// Device binding seam. The binding owns device/format handling and calls the
// installed callback once per output frame, advancing its clock by 1/sampleRate.
class AudioOutput {
public:
  virtual ~AudioOutput() = default;
  // Throws AudioError if the stream cannot be built or started.
  virtual void start(SampleCallback callback) = 0;
  // Blocks until the callback is no longer running. Safe to call repeatedly.
  virtual void stop() = 0;
  virtual double time() const = 0;
  virtual double sampleRate() const = 0;
};
