#pragma once

#include <cstdint>
#include <stdexcept>
#include <vector>
#include "../core/AudioOutput.hpp"

// Output binding driven by the caller instead of a device: each rendered frame
// invokes the callback at the current clock time, then advances the clock.
class OfflineOutput : public AudioOutput {
public:
  explicit OfflineOutput(double sampleRate = 44100.0) : sampleRate_(sampleRate) {
    if (!(sampleRate_ > 0.0)) throw AudioError(AudioErrorKind::DefaultStreamConfig, "sample rate must be > 0");
  }

  void start(SampleCallback callback) override {
    if (!callback) throw AudioError(AudioErrorKind::BuildStream, "callback is empty");
    callback_ = std::move(callback);
  }
  void stop() override { callback_ = nullptr; }
  double time() const override { return clock_.now(); }
  double sampleRate() const override { return sampleRate_; }
  bool running() const { return static_cast<bool>(callback_); }

  // Renders frames into an interleaved buffer, duplicating the mono sample to every channel.
  void renderInto(float* interleaved, uint64_t frames, uint32_t channels) {
    const double step = 1.0 / sampleRate_;
    for (uint64_t i = 0; i < frames; ++i) {
      const float s = callback_ ? static_cast<float>(callback_(clock_.now())) : 0.0f;
      for (uint32_t ch = 0; ch < channels; ++ch) {
        interleaved[static_cast<size_t>(i * channels + ch)] = s;
      }
      clock_.advance(step);
    }
  }

  std::vector<float> render(uint64_t frames, uint32_t channels = 1) {
    if (channels == 0) throw std::invalid_argument("channels must be > 0");
    std::vector<float> out;
    out.resize(static_cast<size_t>(frames * channels));
    renderInto(out.data(), frames, channels);
    return out;
  }

private:
  double sampleRate_ = 44100.0;
  SampleClock clock_;
  SampleCallback callback_;
};
