#include "Oscillator.hpp"
#include "Random.hpp"
#include <cmath>
#include <stdexcept>

namespace {
constexpr double kPi = 3.14159265358979323846;
constexpr double kTwoOverPi = 2.0 / kPi;
}

double noteFrequency(int semitone) {
  return 8.0 * std::pow(2.0, static_cast<double>(semitone) / 12.0);
}

double oscillate(double time, double hz, const Oscillator& osc, const Vibrato& vibrato) {
  const double phase = angularVelocity(hz) * time
                     + vibrato.depth * hz * std::sin(angularVelocity(vibrato.rateHz) * time);

  switch (osc.wave) {
    case Oscillator::Wave::Sine:
      return std::sin(phase);
    case Oscillator::Wave::Square:
      return std::sin(phase) >= 0.0 ? 1.0 : -1.0;
    case Oscillator::Wave::Triangle:
      return std::asin(std::sin(phase)) * kTwoOverPi;
    case Oscillator::Wave::SawAnalog: {
      double sum = 0.0;
      for (uint32_t n = 1; n < osc.harmonics; ++n) {
        const double k = static_cast<double>(n);
        sum += std::sin(k * phase) / k;
      }
      return sum * kTwoOverPi;
    }
    case Oscillator::Wave::SawDigital:
      if (hz <= 0.0) return 0.0;
      return kTwoOverPi * (hz * kPi * std::fmod(time, 1.0 / hz) - kPi / 2.0);
    case Oscillator::Wave::Noise:
      return randomBipolar();
  }
  return 0.0;
}

const char* toString(Oscillator::Wave wave) {
  switch (wave) {
    case Oscillator::Wave::Sine: return "sine";
    case Oscillator::Wave::Square: return "square";
    case Oscillator::Wave::Triangle: return "triangle";
    case Oscillator::Wave::SawAnalog: return "saw_analog";
    case Oscillator::Wave::SawDigital: return "saw_digital";
    case Oscillator::Wave::Noise: return "noise";
  }
  return "sine";
}

Oscillator::Wave waveFromString(const std::string& name) {
  if (name == "sine") return Oscillator::Wave::Sine;
  if (name == "square") return Oscillator::Wave::Square;
  if (name == "triangle") return Oscillator::Wave::Triangle;
  if (name == "saw_analog" || name == "saw") return Oscillator::Wave::SawAnalog;
  if (name == "saw_digital") return Oscillator::Wave::SawDigital;
  if (name == "noise") return Oscillator::Wave::Noise;
  throw std::invalid_argument("Unknown oscillator wave '" + name + "'");
}
