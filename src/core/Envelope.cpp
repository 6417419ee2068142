#include "Envelope.hpp"
#include <limits>

double EnvelopeADSR::heldAmplitude(double lifeTime) const {
  const EnvelopeParams& p = params_;
  if (lifeTime < 0.0) return 0.0;
  if (lifeTime <= p.attackTime) {
    if (p.attackTime <= 0.0) return p.startAmplitude;
    return (lifeTime / p.attackTime) * p.startAmplitude;
  }
  if (lifeTime <= p.attackTime + p.decayTime) {
    // decayTime > 0 here, otherwise the attack branch would have matched
    return ((lifeTime - p.attackTime) / p.decayTime) * (p.sustainAmplitude - p.startAmplitude)
         + p.startAmplitude;
  }
  return p.sustainAmplitude;
}

double EnvelopeADSR::amplitude(double time, double onTime, double offTime) const {
  return amplitude(time, NoteTiming::fromTimestamps(onTime, offTime));
}

double EnvelopeADSR::amplitude(double time, const NoteTiming& timing) const {
  double amp = 0.0;
  if (!timing.released()) {
    amp = heldAmplitude(time - timing.onTime);
  } else {
    const double releaseAmp = heldAmplitude(timing.offTime - timing.onTime);
    const double sinceOff = time - timing.offTime;
    if (sinceOff <= 0.0) {
      amp = releaseAmp;
    } else if (params_.releaseTime <= 0.0) {
      amp = 0.0;
    } else {
      amp = releaseAmp - (sinceOff / params_.releaseTime) * releaseAmp;
    }
  }
  if (amp <= std::numeric_limits<double>::epsilon()) amp = 0.0;
  return amp;
}
