#pragma once

#include <cstdint>
#include <random>

// Per-thread RNG for noise oscillators. Each thread (render thread included)
// owns its generator, so noise never contends on shared state.
inline std::mt19937& threadRng() {
  thread_local std::mt19937 rng{std::random_device{}()};
  return rng;
}

// Seeds the calling thread's generator; 0 leaves it random.
inline void seedThreadRng(uint32_t seed) {
  if (seed != 0) threadRng().seed(seed);
}

// Uniform in [-1, 1]
inline double randomBipolar() {
  std::uniform_real_distribution<double> dist(-1.0, 1.0);
  return dist(threadRng());
}
