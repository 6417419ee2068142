#include "Presets.hpp"
#include <cctype>

namespace {

Partial partial(double weight, int semitones, Oscillator osc, Vibrato vib = {}) {
  Partial p;
  p.weight = weight;
  p.semitones = semitones;
  p.osc = osc;
  p.vibrato = vib;
  return p;
}

Partial noisePartial(double weight) {
  Partial p;
  p.weight = weight;
  p.osc = Oscillator::noise();
  p.fixedHz = 0.0;
  return p;
}

std::string lower(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  return out;
}

} // namespace

PatchParams bellPatch() {
  PatchParams p;
  p.name = "Bell";
  p.env.attackTime = 0.01;
  p.env.decayTime = 1.0;
  p.env.sustainAmplitude = 0.0;
  p.env.releaseTime = 1.0;
  p.volume = 1.0;
  p.partials = {
    partial(1.00, 12, Oscillator::sine(), Vibrato{5.0, 0.0}),
    partial(0.50, 24, Oscillator::sine()),
    partial(0.25, 36, Oscillator::sine()),
  };
  return p;
}

PatchParams bell8Patch() {
  PatchParams p;
  p.name = "8-Bit Bell";
  p.env.attackTime = 0.01;
  p.env.decayTime = 0.5;
  p.env.sustainAmplitude = 0.8;
  p.env.releaseTime = 1.0;
  p.volume = 1.0;
  p.partials = {
    partial(1.00, 0, Oscillator::square(), Vibrato{5.0, 0.0}),
    partial(0.50, 12, Oscillator::sine()),
    partial(0.25, 24, Oscillator::sine()),
  };
  return p;
}

PatchParams harmonicaPatch() {
  PatchParams p;
  p.name = "Harmonica";
  p.env.attackTime = 0.0;
  p.env.decayTime = 1.0;
  p.env.sustainAmplitude = 0.95;
  p.env.releaseTime = 0.1;
  p.volume = 0.3;
  p.partials = {
    partial(1.00, -12, Oscillator::sawAnalog(), Vibrato{5.0, 0.0}),
    partial(1.00, 0, Oscillator::square(), Vibrato{5.0, 0.0}),
    partial(0.50, 12, Oscillator::square()),
    noisePartial(0.05),
  };
  return p;
}

PatchParams drumKickPatch() {
  PatchParams p;
  p.name = "Drum Kick";
  p.env.attackTime = 0.01;
  p.env.decayTime = 0.15;
  p.env.sustainAmplitude = 0.0;
  p.env.releaseTime = 0.0;
  p.volume = 1.0;
  p.maxLifeTime = 1.5;
  p.partials = {
    partial(0.99, -36, Oscillator::sine(), Vibrato{1.0, 1.0}),
    noisePartial(0.01),
  };
  return p;
}

PatchParams drumSnarePatch() {
  PatchParams p;
  p.name = "Drum Snare";
  p.env.attackTime = 0.0;
  p.env.decayTime = 0.2;
  p.env.sustainAmplitude = 0.0;
  p.env.releaseTime = 0.0;
  p.volume = 1.0;
  p.maxLifeTime = 1.0;
  p.partials = {
    partial(0.5, -24, Oscillator::sine(), Vibrato{0.5, 1.0}),
    noisePartial(0.5),
  };
  return p;
}

PatchParams drumHiHatPatch() {
  PatchParams p;
  p.name = "Drum HiHat";
  p.env.attackTime = 0.01;
  p.env.decayTime = 0.05;
  p.env.sustainAmplitude = 0.0;
  p.env.releaseTime = 0.0;
  p.volume = 0.5;
  p.maxLifeTime = 1.0;
  p.partials = {
    partial(0.1, -12, Oscillator::square(), Vibrato{1.5, 1.0}),
    noisePartial(0.9),
  };
  return p;
}

std::vector<PatchParams> presetPatches() {
  return {bellPatch(), bell8Patch(), harmonicaPatch(), drumKickPatch(), drumSnarePatch(), drumHiHatPatch()};
}

std::unique_ptr<PatchInstrument> makePreset(const std::string& name) {
  const std::string wanted = lower(name);
  for (auto& p : presetPatches()) {
    if (lower(p.name) == wanted) return std::make_unique<PatchInstrument>(std::move(p));
  }
  return nullptr;
}
