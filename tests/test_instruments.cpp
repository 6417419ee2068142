#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "core/Voice.hpp"
#include "instruments/patch/PatchFactory.hpp"
#include "instruments/patch/PatchInstrument.hpp"
#include "instruments/presets/Presets.hpp"
#include "TestInstruments.hpp"

namespace {

PatchParams singleSine(const std::string& name, double sustain) {
  PatchParams p;
  p.name = name;
  p.env.attackTime = 0.1;
  p.env.decayTime = 0.1;
  p.env.releaseTime = 0.2;
  p.env.startAmplitude = 1.0;
  p.env.sustainAmplitude = sustain;
  Partial part;
  part.osc = Oscillator::sine();
  p.partials.push_back(part);
  return p;
}

NoteTiming held(double onTime) {
  return NoteTiming{onTime, 0.0, NoteStage::Sounding};
}

} // namespace

TEST_CASE("patch output is envelope times weighted partials times volume", "[patch]") {
  PatchParams p = singleSine("Sine", 1.0);
  p.volume = 0.5;
  p.partials[0].weight = 0.8;
  const PatchInstrument inst(p);
  bool finished = false;
  const double t = 1.0123;
  const double expected = 1.0 * 0.8 * oscillate(t, noteFrequency(60), Oscillator::sine()) * 0.5;
  CHECK(inst.sound(t, held(0.0), 60, finished) == Approx(expected));
  CHECK_FALSE(finished);
}

TEST_CASE("fixed-frequency partials ignore the pitch", "[patch]") {
  PatchParams p = singleSine("Fixed", 1.0);
  p.partials[0].fixedHz = 100.0;
  const PatchInstrument inst(p);
  bool finished = false;
  const double a = inst.sound(0.5025, held(0.0), 10, finished);
  const double b = inst.sound(0.5025, held(0.0), 90, finished);
  CHECK(a == Approx(b));
  CHECK(a == Approx(1.0));
}

TEST_CASE("fresh note at attack start is not finished", "[patch]") {
  const PatchInstrument inst(singleSine("Sine", 0.0));
  bool finished = false;
  CHECK(inst.sound(3.0, held(3.0), 60, finished) == 0.0);
  CHECK_FALSE(finished);
}

TEST_CASE("zero-sustain note finishes once it has decayed", "[patch]") {
  const PatchInstrument inst(singleSine("Pluck", 0.0));
  bool finished = false;
  inst.sound(0.15, held(0.0), 60, finished);
  CHECK_FALSE(finished);
  inst.sound(0.25, held(0.0), 60, finished);
  CHECK(finished);
}

TEST_CASE("released note finishes after its release time", "[patch]") {
  const PatchInstrument inst(singleSine("Organ", 1.0));
  const NoteTiming released{0.0, 1.0, NoteStage::Releasing};
  bool finished = false;
  inst.sound(1.1, released, 60, finished);
  CHECK_FALSE(finished);
  inst.sound(1.25, released, 60, finished);
  CHECK(finished);
}

TEST_CASE("maxLifeTime retires a note regardless of amplitude", "[patch]") {
  PatchParams p = singleSine("Hit", 1.0);
  p.maxLifeTime = 0.5;
  const PatchInstrument inst(p);
  bool finished = false;
  inst.sound(0.49, held(0.0), 60, finished);
  CHECK_FALSE(finished);
  inst.sound(0.5, held(0.0), 60, finished);
  CHECK(finished);
}

TEST_CASE("clone keeps name and parameters", "[patch]") {
  PatchParams p = singleSine("Lead", 0.6);
  p.volume = 0.3;
  const PatchInstrument inst(p);
  auto copy = inst.clone();
  REQUIRE(copy);
  CHECK(copy->name() == "Lead");
  CHECK(copy->kind() == "Lead");
  auto* patch = dynamic_cast<PatchInstrument*>(copy.get());
  REQUIRE(patch != nullptr);
  CHECK(patch->params().volume == 0.3);
  CHECK(patch->params().env.sustainAmplitude == 0.6);
}

TEST_CASE("preset catalog is complete and case-insensitive", "[presets]") {
  const auto all = presetPatches();
  REQUIRE(all.size() == 6);
  for (const char* name : {"Bell", "8-Bit Bell", "Harmonica", "Drum Kick", "Drum Snare", "Drum HiHat"}) {
    auto inst = makePreset(name);
    REQUIRE(inst);
    CHECK(inst->name() == name);
    CHECK_FALSE(inst->params().partials.empty());
  }
  auto kick = makePreset("drum kick");
  REQUIRE(kick);
  CHECK(kick->name() == "Drum Kick");
  CHECK(kick->params().maxLifeTime == 1.5);
  CHECK(makePreset("Theremin") == nullptr);
}

TEST_CASE("drum presets are percussive", "[presets]") {
  for (const auto& p : {drumKickPatch(), drumSnarePatch(), drumHiHatPatch()}) {
    CHECK(p.maxLifeTime > 0.0);
    CHECK(p.env.sustainAmplitude == 0.0);
  }
  CHECK(bellPatch().maxLifeTime == 0.0);
}

TEST_CASE("patch params parse from json", "[patch_factory]") {
  const nlohmann::json j = nlohmann::json::parse(R"({
    "name": "Pad", "volume": 0.5, "maxLifeTime": 0,
    "envelope": {"attack": 0.2, "decay": 0.3, "release": 0.8, "sustain": 0.7, "start": 1.0},
    "partials": [
      {"wave": "sine", "weight": 1.0, "semitones": 0, "vibratoHz": 5.0, "vibratoDepth": 0.001},
      {"wave": "saw_analog", "harmonics": 20, "weight": 0.3, "semitones": 12},
      {"wave": "noise", "weight": 0.05, "hz": 0}
    ]
  })");
  const PatchParams p = patchParamsFromJson(j);
  CHECK(p.name == "Pad");
  CHECK(p.volume == 0.5);
  CHECK(p.env.attackTime == 0.2);
  CHECK(p.env.decayTime == 0.3);
  CHECK(p.env.releaseTime == 0.8);
  CHECK(p.env.sustainAmplitude == 0.7);
  REQUIRE(p.partials.size() == 3);
  CHECK(p.partials[0].vibrato.rateHz == 5.0);
  CHECK(p.partials[0].vibrato.depth == 0.001);
  CHECK(p.partials[1].osc.wave == Oscillator::Wave::SawAnalog);
  CHECK(p.partials[1].osc.harmonics == 20);
  CHECK(p.partials[1].semitones == 12);
  CHECK(p.partials[2].osc.wave == Oscillator::Wave::Noise);
  CHECK(p.partials[2].fixedHz == 0.0);
  CHECK(p.partials[0].fixedHz < 0.0);
}

TEST_CASE("patch json errors name the problem", "[patch_factory]") {
  CHECK_THROWS_AS(makePatchFromParamsJson(R"({"volume": 1})"), std::runtime_error);
  CHECK_THROWS_AS(makePatchFromParamsJson(R"({"name": "X", "envelope": {"attack": -1}})"), std::runtime_error);
  CHECK_THROWS_AS(makePatchFromParamsJson(R"({"name": "X", "partials": [{"wave": "pulse"}]})"), std::invalid_argument);
  auto inst = makePatchFromParamsJson(R"({"name": "Quiet", "partials": [{"wave": "triangle"}]})");
  REQUIRE(inst);
  CHECK(inst->name() == "Quiet");
}

TEST_CASE("copying a voice clones its instrument", "[voice]") {
  const ToneInstrument tone;
  const Voice a(tone, 7);
  const Voice b = a;
  CHECK(b.pitch() == 7);
  CHECK(b.kind() == "Tone");
  CHECK(b.instrumentName() == "Tone");
  CHECK(&a.instrument() != &b.instrument());
  CHECK(&a.instrument() != static_cast<const Instrument*>(&tone));
}

TEST_CASE("voice without an instrument is rejected", "[voice]") {
  CHECK_THROWS_AS(Voice(std::unique_ptr<Instrument>(), 0), std::invalid_argument);
}
