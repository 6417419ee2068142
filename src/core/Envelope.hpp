#pragma once

#include "NoteTiming.hpp"

// All times in seconds, amplitudes in [0, 1].
struct EnvelopeParams {
  double attackTime = 0.1;
  double decayTime = 0.1;
  double releaseTime = 0.2;
  double sustainAmplitude = 1.0;
  double startAmplitude = 1.0;
};

// Attack: linear rise 0 -> startAmplitude.
// Decay: linear move startAmplitude -> sustainAmplitude.
// Sustain: held at sustainAmplitude until note-off.
// Release: linear fade from the level reached at note-off down to 0.
class EnvelopeADSR {
public:
  EnvelopeADSR() = default;
  explicit EnvelopeADSR(const EnvelopeParams& params) : params_(params) {}

  // Infers the release state from timestamps (released once offTime >= onTime).
  double amplitude(double time, double onTime, double offTime) const;
  double amplitude(double time, const NoteTiming& timing) const;

  // Attack/decay/sustain level lifeTime seconds after note-on, ignoring release.
  double heldAmplitude(double lifeTime) const;

  // True once lifeTime has passed the attack and decay phases.
  bool pastDecay(double lifeTime) const { return lifeTime > params_.attackTime + params_.decayTime; }

  const EnvelopeParams& params() const { return params_; }

private:
  EnvelopeParams params_{};
};
