#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Instrument.hpp"
#include "Voice.hpp"

// Pitch of every sequencer voice; percussion patches are tuned relative to it.
constexpr int kPercussionPitch = 64;

// Upper bound on beats * subBeats.
constexpr uint32_t kMaxSequencerSteps = 4096;

enum class StepState : uint8_t { Rest = 0, Beat };

struct SequencerConfig {
  double tempo = 120.0;   // beats per minute
  uint32_t beats = 4;     // beats per cycle
  uint32_t subBeats = 4;  // steps per beat
};

// Looped drum pattern generator. Emits note-on Voices at kPercussionPitch each
// time elapsed wall time crosses a sub-beat boundary. Never touches a Player.
class PercussionSequencer {
public:
  // Throws std::invalid_argument on non-positive tempo, beats or subBeats, or when
  // beats * subBeats exceeds kMaxSequencerSteps.
  explicit PercussionSequencer(SequencerConfig config = {});

  // Patterns shorter than totalSteps() repeat; empty patterns throw std::invalid_argument.
  void addTrack(const Instrument& instrument, std::vector<StepState> pattern);
  // Step string: 'x' or 'X' is a beat, anything else a rest (e.g. "x...x...").
  void addTrack(const Instrument& instrument, const std::string& steps);

  // Restarts the wall clock and the step position.
  void start();

  // Advances by the wall time elapsed since the previous call (or start()).
  std::vector<Voice> update();
  // Advances by an explicit amount of time. Every crossed boundary emits its own
  // batch, in step order; tracks within a step are emitted in insertion order.
  std::vector<Voice> advance(double elapsedSeconds);

  double subBeatDuration() const { return subBeatDuration_; }
  uint32_t totalSteps() const { return totalSteps_; }
  uint32_t currentStep() const { return currentStep_; }
  size_t trackCount() const { return tracks_.size(); }
  const SequencerConfig& config() const { return config_; }

  static std::vector<StepState> parseSteps(const std::string& steps);

private:
  struct Track {
    std::unique_ptr<Instrument> instrument;
    std::vector<StepState> pattern;
  };

  SequencerConfig config_;
  double subBeatDuration_ = 0.125;
  uint32_t totalSteps_ = 16;
  uint32_t currentStep_ = 0;
  double accumulated_ = 0.0;
  std::chrono::steady_clock::time_point previous_;
  std::vector<Track> tracks_;
};
