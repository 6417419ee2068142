#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "Instrument.hpp"
#include "PercussionSequencer.hpp"
#include "Player.hpp"
#include "../instruments/patch/PatchInstrument.hpp"

struct SessionSpec {
  std::string description; // optional human-readable description
  int version = 1;
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;
  uint32_t randomSeed = 0;  // 0 means unspecified
  double durationSec = 0.0; // 0 = auto
  PlayerConfig player;
  std::vector<PatchParams> instruments; // session-defined patches

  struct Track { std::string instrument; std::string steps; };
  struct Sequencer {
    SequencerConfig config;
    std::vector<Track> tracks;
  };
  bool hasSequencer = false;
  Sequencer sequencer;

  enum class EventType : uint8_t { NoteOn = 0, NoteOff };
  struct Event {
    double timeSec = 0.0;
    EventType type = EventType::NoteOn;
    std::string instrument;
    int pitch = 0;
  };
  std::vector<Event> events;
};

// Parse file into SessionSpec using nlohmann/json. Relative paths are searched in
// the CWD, examples/sessions/ and CHIME_SEARCH_PATHS (colon-separated).
SessionSpec loadSessionSpecFromJsonFile(const std::string& path);
// `origin` names the source in warnings and errors.
SessionSpec parseSessionSpec(const std::string& jsonText, const std::string& origin = "<memory>");

// Session patches first, then presets (case-insensitive). Throws std::runtime_error if unknown.
std::unique_ptr<Instrument> resolveInstrument(const SessionSpec& spec, const std::string& name);

// Builds the sequencer described by the session; throws on bad config or unknown instruments.
PercussionSequencer buildSequencer(const SessionSpec& spec);

// Semantic checks; returns one message per problem (empty when valid).
std::vector<std::string> validateSession(const SessionSpec& spec);

const char* toString(SessionSpec::EventType t);
