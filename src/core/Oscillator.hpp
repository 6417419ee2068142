#pragma once

#include <cstdint>
#include <string>

// Stateless waveform description consumed by oscillate().
struct Oscillator {
  enum class Wave : uint8_t { Sine = 0, Square, Triangle, SawAnalog, SawDigital, Noise };

  Wave wave = Wave::Sine;
  uint32_t harmonics = 50; // SawAnalog only: additive partials used

  static Oscillator sine() { return Oscillator{Wave::Sine, 50}; }
  static Oscillator square() { return Oscillator{Wave::Square, 50}; }
  static Oscillator triangle() { return Oscillator{Wave::Triangle, 50}; }
  static Oscillator sawAnalog(uint32_t harmonics = 50) { return Oscillator{Wave::SawAnalog, harmonics}; }
  static Oscillator sawDigital() { return Oscillator{Wave::SawDigital, 50}; }
  static Oscillator noise() { return Oscillator{Wave::Noise, 50}; }
};

// Phase modulation applied on top of an oscillator (vibrato). depth 0 disables it.
struct Vibrato {
  double rateHz = 0.0;
  double depth = 0.0;
};

// Hz -> rad/s
inline double angularVelocity(double hz) {
  return hz * 2.0 * 3.14159265358979323846;
}

// Equal-tempered scale anchored at 8 Hz for semitone 0. Negative semitones are valid.
double noteFrequency(int semitone);

// Returns a value in [-1, 1] for the given elapsed time (seconds) and frequency.
// Every wave except Noise is a pure function of its arguments.
double oscillate(double time, double hz, const Oscillator& osc, const Vibrato& vibrato = {});

const char* toString(Oscillator::Wave wave);
// Accepts "sine", "square", "triangle", "saw_analog", "saw_digital", "noise".
// Throws std::invalid_argument on anything else.
Oscillator::Wave waveFromString(const std::string& name);
