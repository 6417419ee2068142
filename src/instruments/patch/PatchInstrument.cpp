#include "PatchInstrument.hpp"
#include <utility>

PatchInstrument::PatchInstrument(PatchParams params)
: params_(std::move(params)), env_(params_.env) {}

std::unique_ptr<Instrument> PatchInstrument::clone() const {
  return std::make_unique<PatchInstrument>(*this);
}

double PatchInstrument::sound(double time, const NoteTiming& timing, int pitch, bool& finished) const {
  const double amplitude = env_.amplitude(time, timing);
  const double lifeTime = time - timing.onTime;

  if (params_.maxLifeTime > 0.0) {
    if (lifeTime >= params_.maxLifeTime) finished = true;
  } else if (amplitude <= 0.0 && (timing.released() || env_.pastDecay(lifeTime))) {
    // Silent because it was released or because a zero-sustain note has decayed away.
    // The attack ramp also starts at 0, which must not retire a fresh note.
    finished = true;
  }

  if (amplitude <= 0.0) return 0.0;

  double sum = 0.0;
  for (const Partial& p : params_.partials) {
    const double hz = (p.fixedHz >= 0.0) ? p.fixedHz : noteFrequency(pitch + p.semitones);
    sum += p.weight * oscillate(lifeTime, hz, p.osc, p.vibrato);
  }
  return amplitude * sum * params_.volume;
}
