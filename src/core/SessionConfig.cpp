#include "SessionConfig.hpp"
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>
#include <utility>
#include <nlohmann/json.hpp>
#include "../instruments/patch/PatchFactory.hpp"
#include "../instruments/presets/Presets.hpp"

using nlohmann::json;

// CWD first, then examples/sessions/, then each CHIME_SEARCH_PATHS entry (colon-separated).
static std::vector<std::filesystem::path> sessionSearchRoots() {
  std::vector<std::filesystem::path> roots{std::filesystem::path(), std::filesystem::path("examples/sessions")};
  if (const char* env = std::getenv("CHIME_SEARCH_PATHS")) {
    std::istringstream list(env);
    std::string entry;
    while (std::getline(list, entry, ':')) {
      if (!entry.empty()) roots.emplace_back(entry);
    }
  }
  return roots;
}

static bool readWholeFile(const std::filesystem::path& p, std::string& out) {
  std::ifstream f(p);
  if (!f) return false;
  std::ostringstream ss;
  ss << f.rdbuf();
  out = ss.str();
  return true;
}

static std::string readFileToString(const std::string& path) {
  const std::filesystem::path requested(path);
  std::string text;
  if (requested.is_absolute()) {
    if (readWholeFile(requested, text)) return text;
    throw std::runtime_error("Failed to open JSON file: " + path);
  }
  for (const auto& root : sessionSearchRoots()) {
    if (readWholeFile(root / requested, text)) return text;
  }
  throw std::runtime_error("Failed to open JSON file: " + path);
}

static SessionSpec::EventType eventTypeFromString(const std::string& t, const std::string& origin) {
  if (t == "on" || t == "noteOn") return SessionSpec::EventType::NoteOn;
  if (t == "off" || t == "noteOff") return SessionSpec::EventType::NoteOff;
  throw std::runtime_error("Unknown event type '" + t + "' in " + origin);
}

const char* toString(SessionSpec::EventType t) {
  return t == SessionSpec::EventType::NoteOn ? "on" : "off";
}

SessionSpec loadSessionSpecFromJsonFile(const std::string& path) {
  return parseSessionSpec(readFileToString(path), path);
}

SessionSpec parseSessionSpec(const std::string& jsonText, const std::string& origin) {
  json j = json::parse(jsonText);
  if (!j.is_object()) throw std::runtime_error("Session JSON must be an object: " + origin);
  if (j.contains("kind")) {
    const std::string k = j.at("kind").get<std::string>();
    if (k != "session") {
      throw std::runtime_error("JSON kind mismatch: expected 'session' but got '" + k + "' in " + origin);
    }
  } else {
    std::fprintf(stderr, "Warning: session JSON missing 'kind'; assuming session (%s)\n", origin.c_str());
  }

  SessionSpec spec;
  if (j.contains("description")) spec.description = j.at("description").get<std::string>();
  if (j.contains("version")) spec.version = j.at("version").get<int>();
  if (j.contains("sampleRate")) spec.sampleRate = j.at("sampleRate").get<uint32_t>();
  if (j.contains("channels")) spec.channels = j.at("channels").get<uint32_t>();
  if (j.contains("randomSeed")) spec.randomSeed = j.at("randomSeed").get<uint32_t>();
  if (j.contains("durationSec")) spec.durationSec = j.at("durationSec").get<double>();

  if (j.contains("player")) {
    const auto& p = j.at("player");
    spec.player.mixGain = p.value("mixGain", spec.player.mixGain);
    if (p.contains("amplitudeLimit") && !p.at("amplitudeLimit").is_null()) {
      spec.player.amplitudeLimit = p.at("amplitudeLimit").get<double>();
    }
    spec.player.reserveNotes = p.value("reserveNotes", spec.player.reserveNotes);
  }

  if (j.contains("instruments")) {
    for (const auto& ij : j.at("instruments")) {
      spec.instruments.push_back(patchParamsFromJson(ij));
    }
  }

  if (j.contains("sequencer")) {
    spec.hasSequencer = true;
    const auto& s = j.at("sequencer");
    spec.sequencer.config.tempo = s.value("tempo", spec.sequencer.config.tempo);
    spec.sequencer.config.beats = s.value("beats", spec.sequencer.config.beats);
    spec.sequencer.config.subBeats = s.value("subBeats", spec.sequencer.config.subBeats);
    if (s.contains("tracks")) {
      for (const auto& tj : s.at("tracks")) {
        SessionSpec::Track t;
        t.instrument = tj.value("instrument", std::string());
        t.steps = tj.value("steps", std::string());
        spec.sequencer.tracks.push_back(t);
      }
    }
  }

  if (j.contains("events")) {
    for (const auto& ej : j.at("events")) {
      SessionSpec::Event e;
      e.timeSec = ej.value("time", 0.0);
      e.type = eventTypeFromString(ej.value("type", std::string("on")), origin);
      e.instrument = ej.value("instrument", std::string());
      e.pitch = ej.value("pitch", 0);
      spec.events.push_back(e);
    }
  }

  return spec;
}

std::unique_ptr<Instrument> resolveInstrument(const SessionSpec& spec, const std::string& name) {
  for (const auto& p : spec.instruments) {
    if (p.name == name) return std::make_unique<PatchInstrument>(p);
  }
  if (auto preset = makePreset(name)) return std::unique_ptr<Instrument>(std::move(preset));
  throw std::runtime_error("Unknown instrument '" + name + "'");
}

PercussionSequencer buildSequencer(const SessionSpec& spec) {
  PercussionSequencer seq(spec.sequencer.config);
  for (const auto& t : spec.sequencer.tracks) {
    auto inst = resolveInstrument(spec, t.instrument);
    seq.addTrack(*inst, t.steps);
  }
  return seq;
}

std::vector<std::string> validateSession(const SessionSpec& spec) {
  std::vector<std::string> errors;
  if (spec.sampleRate < 8000) errors.push_back("sampleRate must be >= 8000");
  if (spec.channels == 0) errors.push_back("channels must be > 0");
  if (spec.durationSec < 0.0) errors.push_back("durationSec must be >= 0");

  {
    std::unordered_set<std::string> names;
    for (const auto& p : spec.instruments) {
      if (!names.insert(p.name).second) errors.push_back("Duplicate instrument '" + p.name + "'");
    }
  }

  auto known = [&](const std::string& name) {
    for (const auto& p : spec.instruments) if (p.name == name) return true;
    return makePreset(name) != nullptr;
  };

  if (spec.hasSequencer) {
    const auto& c = spec.sequencer.config;
    if (!(c.tempo > 0.0)) errors.push_back("Sequencer tempo must be > 0");
    if (c.beats == 0 || c.subBeats == 0) errors.push_back("Sequencer beats and subBeats must be > 0");
    const uint64_t total = static_cast<uint64_t>(c.beats) * c.subBeats;
    if (total > kMaxSequencerSteps) {
      errors.push_back("Sequencer beats * subBeats must be <= " + std::to_string(kMaxSequencerSteps));
    }
    for (const auto& t : spec.sequencer.tracks) {
      if (!known(t.instrument)) errors.push_back("Sequencer track references unknown instrument '" + t.instrument + "'");
      if (t.steps.empty()) {
        errors.push_back("Sequencer track '" + t.instrument + "' has empty steps");
      } else if (t.steps.size() != total) {
        std::fprintf(stderr, "Warning: track '%s' has %zu steps but the grid has %llu; pattern repeats\n",
                     t.instrument.c_str(), t.steps.size(), static_cast<unsigned long long>(total));
      }
    }
  }

  for (const auto& e : spec.events) {
    if (e.timeSec < 0.0) errors.push_back("Event time must be >= 0 (instrument '" + e.instrument + "')");
    if (!known(e.instrument)) errors.push_back("Event references unknown instrument '" + e.instrument + "'");
  }
  return errors;
}
