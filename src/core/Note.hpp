#pragma once

#include <memory>
#include <string>
#include "Instrument.hpp"
#include "NoteTiming.hpp"

// Live record of one sounding or releasing instrument instance. Owned by Player.
struct Note {
  int pitch = 0;
  NoteTiming timing{};
  std::string kind;
  std::unique_ptr<Instrument> instrument;

  bool matches(int otherPitch, const std::string& otherKind) const {
    return pitch == otherPitch && kind == otherKind;
  }
  bool sounding() const { return timing.stage == NoteStage::Sounding; }
  bool finished() const { return timing.stage == NoteStage::Finished; }
};
