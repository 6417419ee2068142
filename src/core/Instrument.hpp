#pragma once

#include <memory>
#include <string>
#include "NoteTiming.hpp"

// Base interface for instruments. A running note owns its own clone, so
// implementations may keep per-instance parameters without sharing them.
class Instrument {
public:
  virtual ~Instrument() = default;

  // Display name, e.g. "Drum Kick".
  virtual const std::string& name() const = 0;
  // Identity used to match notes on retrigger/release. Defaults to the name.
  virtual const std::string& kind() const { return name(); }

  virtual std::unique_ptr<Instrument> clone() const = 0;

  // Signal value for a note at `time`. Sets `finished` once the note can be retired;
  // never clears it. Called on the render thread: must not block or allocate.
  virtual double sound(double time, const NoteTiming& timing, int pitch, bool& finished) const = 0;
};
