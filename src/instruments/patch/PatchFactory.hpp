#pragma once

#include <memory>
#include <cstdio>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "PatchInstrument.hpp"

// {"name": "...", "volume": 1, "maxLifeTime": 0,
//  "envelope": {"attack", "decay", "release", "sustain", "start"},
//  "partials": [{"wave", "weight", "semitones", "harmonics", "hz", "vibratoHz", "vibratoDepth"}]}
inline PatchParams patchParamsFromJson(const nlohmann::json& j) {
  PatchParams p;
  p.name = j.value("name", std::string());
  if (p.name.empty()) throw std::runtime_error("Instrument requires a non-empty 'name'");
  p.volume = j.value("volume", p.volume);
  p.maxLifeTime = j.value("maxLifeTime", p.maxLifeTime);
  if (j.contains("envelope")) {
    const auto& e = j.at("envelope");
    p.env.attackTime = e.value("attack", p.env.attackTime);
    p.env.decayTime = e.value("decay", p.env.decayTime);
    p.env.releaseTime = e.value("release", p.env.releaseTime);
    p.env.sustainAmplitude = e.value("sustain", p.env.sustainAmplitude);
    p.env.startAmplitude = e.value("start", p.env.startAmplitude);
  }
  if (p.env.attackTime < 0.0 || p.env.decayTime < 0.0 || p.env.releaseTime < 0.0) {
    throw std::runtime_error("Instrument '" + p.name + "' has a negative envelope time");
  }
  if (j.contains("partials")) {
    for (const auto& pj : j.at("partials")) {
      Partial part;
      part.osc.wave = waveFromString(pj.value("wave", std::string("sine")));
      part.osc.harmonics = pj.value("harmonics", part.osc.harmonics);
      part.weight = pj.value("weight", part.weight);
      part.semitones = pj.value("semitones", part.semitones);
      part.fixedHz = pj.value("hz", part.fixedHz);
      part.vibrato.rateHz = pj.value("vibratoHz", 0.0);
      part.vibrato.depth = pj.value("vibratoDepth", 0.0);
      p.partials.push_back(part);
    }
  }
  if (p.partials.empty()) {
    std::fprintf(stderr, "Warning: instrument '%s' has no partials and will be silent\n", p.name.c_str());
  }
  return p;
}

inline std::unique_ptr<PatchInstrument> makePatchFromParamsJson(const std::string& paramsJson) {
  nlohmann::json j = nlohmann::json::parse(paramsJson);
  return std::make_unique<PatchInstrument>(patchParamsFromJson(j));
}
