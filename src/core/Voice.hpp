#pragma once

#include <memory>
#include <string>
#include <utility>
#include "Instrument.hpp"

// Request to start or stop one note of one instrument at one pitch.
// Copying a Voice clones its instrument.
class Voice {
public:
  Voice(std::unique_ptr<Instrument> instrument, int pitch);
  Voice(const Instrument& instrument, int pitch) : Voice(instrument.clone(), pitch) {}

  Voice(const Voice& other);
  Voice& operator=(const Voice& other);
  Voice(Voice&&) noexcept = default;
  Voice& operator=(Voice&&) noexcept = default;

  int pitch() const { return pitch_; }
  const std::string& kind() const { return kind_; }
  const std::string& instrumentName() const { return name_; }
  const Instrument& instrument() const { return *instrument_; }

  // Fresh copy of the instrument for a new note.
  std::unique_ptr<Instrument> cloneInstrument() const { return instrument_->clone(); }

private:
  std::unique_ptr<Instrument> instrument_;
  std::string kind_;
  std::string name_;
  int pitch_ = 0;
};
