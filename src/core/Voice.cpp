#include "Voice.hpp"
#include <stdexcept>

Voice::Voice(std::unique_ptr<Instrument> instrument, int pitch)
: instrument_(std::move(instrument)), pitch_(pitch) {
  if (!instrument_) throw std::invalid_argument("Voice requires an instrument");
  kind_ = instrument_->kind();
  name_ = instrument_->name();
}

Voice::Voice(const Voice& other)
: instrument_(other.instrument_->clone()), kind_(other.kind_), name_(other.name_), pitch_(other.pitch_) {}

Voice& Voice::operator=(const Voice& other) {
  if (this != &other) {
    instrument_ = other.instrument_->clone();
    kind_ = other.kind_;
    name_ = other.name_;
    pitch_ = other.pitch_;
  }
  return *this;
}
