#pragma once

#include <memory>
#include <string>
#include <vector>
#include "../../core/Envelope.hpp"
#include "../../core/Instrument.hpp"
#include "../../core/Oscillator.hpp"

// One oscillator voice inside a patch. Frequency follows the note pitch
// (noteFrequency(pitch + semitones)) unless fixedHz >= 0.
struct Partial {
  double weight = 1.0;
  int semitones = 0;
  Oscillator osc{};
  Vibrato vibrato{};
  double fixedHz = -1.0;
};

struct PatchParams {
  std::string name = "Patch";
  EnvelopeParams env{};
  double volume = 1.0;
  double maxLifeTime = 0.0; // > 0: percussive, finished after this many seconds
  std::vector<Partial> partials;
};

class PatchInstrument : public Instrument {
public:
  explicit PatchInstrument(PatchParams params);

  const std::string& name() const override { return params_.name; }
  std::unique_ptr<Instrument> clone() const override;
  double sound(double time, const NoteTiming& timing, int pitch, bool& finished) const override;

  const PatchParams& params() const { return params_; }
  const EnvelopeADSR& envelope() const { return env_; }

private:
  PatchParams params_;
  EnvelopeADSR env_;
};
