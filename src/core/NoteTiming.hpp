#pragma once

#include <cstdint>

// Lifecycle of a note. Releasing starts at note-off; Finished notes are pruned by the mixer.
enum class NoteStage : uint8_t { Sounding = 0, Releasing, Finished };

struct NoteTiming {
  double onTime = 0.0;  // seconds on the output clock
  double offTime = 0.0; // meaningful only once stage != Sounding
  NoteStage stage = NoteStage::Sounding;

  bool released() const { return stage != NoteStage::Sounding; }

  // Legacy convention: a note is released once offTime has caught up with onTime.
  static NoteTiming fromTimestamps(double onTime, double offTime) {
    NoteTiming t;
    t.onTime = onTime;
    t.offTime = offTime;
    t.stage = (onTime > offTime) ? NoteStage::Sounding : NoteStage::Releasing;
    return t;
  }
};
