#include <catch2/catch.hpp>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include "core/Oscillator.hpp"
#include "core/Random.hpp"

namespace {
constexpr double kPi = 3.14159265358979323846;
}

TEST_CASE("noteFrequency is anchored at 8 Hz", "[oscillator]") {
  CHECK(noteFrequency(0) == Approx(8.0));
  CHECK(noteFrequency(12) == Approx(16.0));
  CHECK(noteFrequency(-12) == Approx(4.0));
  CHECK(noteFrequency(64) == Approx(8.0 * std::pow(2.0, 64.0 / 12.0)));
}

TEST_CASE("angularVelocity converts Hz to rad/s", "[oscillator]") {
  CHECK(angularVelocity(1.0) == Approx(2.0 * kPi));
  CHECK(angularVelocity(0.0) == 0.0);
}

TEST_CASE("sine starts at zero and peaks at a quarter period", "[oscillator]") {
  const Oscillator osc = Oscillator::sine();
  CHECK(oscillate(0.0, 100.0, osc) == Approx(0.0).margin(1e-12));
  CHECK(oscillate(0.0025, 100.0, osc) == Approx(1.0));
  CHECK(oscillate(0.0075, 100.0, osc) == Approx(-1.0));
}

TEST_CASE("square is +1 at the zero crossing", "[oscillator]") {
  const Oscillator osc = Oscillator::square();
  CHECK(oscillate(0.0, 100.0, osc) == 1.0);
  CHECK(oscillate(0.0025, 100.0, osc) == 1.0);
  CHECK(oscillate(0.0075, 100.0, osc) == -1.0);
}

TEST_CASE("pure waves are deterministic and bounded", "[oscillator]") {
  const std::vector<Oscillator> oscs = {
    Oscillator::sine(), Oscillator::square(), Oscillator::triangle(), Oscillator::sawDigital(),
  };
  for (const auto& osc : oscs) {
    for (int i = 0; i < 500; ++i) {
      const double t = i * 0.00037;
      const double a = oscillate(t, 220.0, osc);
      const double b = oscillate(t, 220.0, osc);
      CHECK(a == b);
      CHECK(a >= -1.0 - 1e-9);
      CHECK(a <= 1.0 + 1e-9);
    }
  }
}

TEST_CASE("analog saw overshoots only slightly", "[oscillator]") {
  const Oscillator osc = Oscillator::sawAnalog(50);
  for (int i = 0; i < 1000; ++i) {
    const double v = oscillate(i * 0.0001, 110.0, osc);
    CHECK(std::fabs(v) < 1.2);
  }
  // one harmonic means an empty sum
  CHECK(oscillate(0.0013, 110.0, Oscillator::sawAnalog(1)) == 0.0);
}

TEST_CASE("digital saw ramps from -1 and is silent at 0 Hz", "[oscillator]") {
  const Oscillator osc = Oscillator::sawDigital();
  CHECK(oscillate(0.0, 1.0, osc) == Approx(-1.0));
  CHECK(oscillate(0.5, 1.0, osc) == Approx(0.0).margin(1e-12));
  CHECK(oscillate(0.999, 1.0, osc) == Approx(0.998).margin(1e-9));
  CHECK(oscillate(0.3, 0.0, osc) == 0.0);
  CHECK(oscillate(0.3, -5.0, osc) == 0.0);
}

TEST_CASE("triangle reaches its extremes", "[oscillator]") {
  const Oscillator osc = Oscillator::triangle();
  CHECK(oscillate(0.25, 1.0, osc) == Approx(1.0));
  CHECK(oscillate(0.75, 1.0, osc) == Approx(-1.0));
}

TEST_CASE("zero vibrato depth leaves the phase untouched", "[oscillator]") {
  const Oscillator osc = Oscillator::sine();
  for (int i = 0; i < 100; ++i) {
    const double t = i * 0.001;
    CHECK(oscillate(t, 330.0, osc, Vibrato{6.0, 0.0}) == oscillate(t, 330.0, osc));
  }
  CHECK(oscillate(0.01, 330.0, osc, Vibrato{6.0, 0.01}) != oscillate(0.01, 330.0, osc));
}

TEST_CASE("noise is bounded and varies between calls", "[oscillator]") {
  const Oscillator osc = Oscillator::noise();
  std::vector<double> values;
  for (int i = 0; i < 256; ++i) {
    const double v = oscillate(0.0, 440.0, osc);
    CHECK(v >= -1.0);
    CHECK(v <= 1.0);
    values.push_back(v);
  }
  bool varied = false;
  for (size_t i = 1; i < values.size(); ++i) varied = varied || values[i] != values[0];
  CHECK(varied);
}

TEST_CASE("seeding the thread generator makes noise reproducible", "[oscillator]") {
  const Oscillator osc = Oscillator::noise();
  auto draw = [&]() {
    std::vector<double> v;
    for (int i = 0; i < 32; ++i) v.push_back(oscillate(0.0, 0.0, osc));
    return v;
  };
  seedThreadRng(1234);
  const auto a = draw();
  seedThreadRng(1234);
  const auto b = draw();
  CHECK(a == b);
}

TEST_CASE("wave names parse and print", "[oscillator]") {
  CHECK(waveFromString("sine") == Oscillator::Wave::Sine);
  CHECK(waveFromString("saw") == Oscillator::Wave::SawAnalog);
  CHECK(waveFromString("saw_digital") == Oscillator::Wave::SawDigital);
  CHECK(std::string(toString(Oscillator::Wave::Noise)) == "noise");
  CHECK(waveFromString(toString(Oscillator::Wave::Triangle)) == Oscillator::Wave::Triangle);
  CHECK_THROWS_AS(waveFromString("pulse"), std::invalid_argument);
}
