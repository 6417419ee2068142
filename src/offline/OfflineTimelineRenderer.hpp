#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "../core/SessionConfig.hpp"

struct OfflineRenderOptions {
  double durationSec = -1.0;      // < 0 means auto (session duration, else events/sequencer + tail)
  double tailSec = 1.0;           // decay tail appended in auto mode
  uint32_t blockFrames = 256;     // events, then sequencer steps crossed within the block, are applied at its start
  uint32_t sampleRateOverride = 0;
  uint32_t randomSeedOverride = 0;
};

struct OfflineRenderResult {
  std::vector<float> interleaved;
  uint32_t sampleRate = 44100;
  uint32_t channels = 2;
  uint64_t frames = 0;
  size_t peakNotes = 0;     // highest simultaneous note count seen at a block boundary
  size_t eventsApplied = 0; // session events plus sequencer voices
};

double computeSessionDurationSec(const SessionSpec& spec, const OfflineRenderOptions& opts);

// Plays the session through a Player bound to an OfflineOutput. Throws on unknown
// instruments or invalid sequencer settings.
OfflineRenderResult renderSession(const SessionSpec& spec, const OfflineRenderOptions& opts = {});
