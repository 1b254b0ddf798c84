#pragma once

#include <random>
#include <cstdint>

// Process-wide generator for tests and state preparation. Simulators own their
// generator and never draw from this one.
namespace qevolve_random {
  inline std::minstd_rand& generator() {
    static std::minstd_rand rng(5489u);
    return rng;
  }
}

inline void seed_rng(uint32_t s) {
  qevolve_random::generator().seed(s);
}

inline uint32_t randi() {
  return qevolve_random::generator()();
}

// Uniform integer in [min, max)
inline uint32_t randi(uint32_t min, uint32_t max) {
  std::uniform_int_distribution<uint32_t> dist(min, max - 1);
  return dist(qevolve_random::generator());
}

inline double randf() {
  std::uniform_real_distribution<double> dist(0.0, 1.0);
  return dist(qevolve_random::generator());
}

inline double randf(double min, double max) {
  std::uniform_real_distribution<double> dist(min, max);
  return dist(qevolve_random::generator());
}
