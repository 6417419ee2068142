#include "PercussionSequencer.hpp"
#include <stdexcept>
#include <string>

PercussionSequencer::PercussionSequencer(SequencerConfig config)
: config_(config) {
  if (!(config_.tempo > 0.0)) throw std::invalid_argument("Sequencer tempo must be > 0");
  if (config_.beats == 0 || config_.subBeats == 0) throw std::invalid_argument("Sequencer beats and subBeats must be > 0");
  subBeatDuration_ = (60.0 / config_.tempo) / static_cast<double>(config_.subBeats);
  const uint64_t steps = static_cast<uint64_t>(config_.beats) * config_.subBeats;
  if (steps > kMaxSequencerSteps) {
    throw std::invalid_argument("Sequencer beats * subBeats must be <= " + std::to_string(kMaxSequencerSteps));
  }
  totalSteps_ = static_cast<uint32_t>(steps);
  previous_ = std::chrono::steady_clock::now();
}

std::vector<StepState> PercussionSequencer::parseSteps(const std::string& steps) {
  std::vector<StepState> out;
  out.reserve(steps.size());
  for (char c : steps) out.push_back((c == 'x' || c == 'X') ? StepState::Beat : StepState::Rest);
  return out;
}

void PercussionSequencer::addTrack(const Instrument& instrument, std::vector<StepState> pattern) {
  if (pattern.empty()) throw std::invalid_argument("Sequencer track '" + instrument.name() + "' has an empty pattern");
  Track t;
  t.instrument = instrument.clone();
  t.pattern = std::move(pattern);
  tracks_.push_back(std::move(t));
}

void PercussionSequencer::addTrack(const Instrument& instrument, const std::string& steps) {
  addTrack(instrument, parseSteps(steps));
}

void PercussionSequencer::start() {
  currentStep_ = 0;
  accumulated_ = 0.0;
  previous_ = std::chrono::steady_clock::now();
}

std::vector<Voice> PercussionSequencer::update() {
  const auto now = std::chrono::steady_clock::now();
  const double elapsed = std::chrono::duration<double>(now - previous_).count();
  previous_ = now;
  return advance(elapsed);
}

std::vector<Voice> PercussionSequencer::advance(double elapsedSeconds) {
  std::vector<Voice> out;
  if (elapsedSeconds > 0.0) accumulated_ += elapsedSeconds;
  while (accumulated_ >= subBeatDuration_) {
    accumulated_ -= subBeatDuration_;
    currentStep_ = (currentStep_ + 1) % totalSteps_;
    for (const Track& t : tracks_) {
      const size_t idx = currentStep_ % t.pattern.size();
      if (t.pattern[idx] == StepState::Beat) out.emplace_back(*t.instrument, kPercussionPitch);
    }
  }
  return out;
}
