#include "prng.h"

#include <random>

namespace {
uint64_t SplitMix(uint64_t x) {
  uint64_t z = x + 0x9e3779b97f4a7c15;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9;
  z = (z ^ (z >> 27)) * 0x94d049bb133111eb;
  return z ^ (z >> 31);
}

// Expands one 64-bit seed into a full state with successive SplitMix64
// outputs, as recommended by Vigna.
std::array<uint64_t, 4> ExpandSeed(uint64_t seed) {
  std::array<uint64_t, 4> ret;

  for (uint64_t& x : ret) {
    seed += 0x9e3779b97f4a7c15;
    x = SplitMix(seed);
  }

  return ret;
}

uint64_t SystemSeed() {
  std::random_device dev;
  uint64_t bits = dev();
  bits = bits * (dev.max() + uint64_t{1}) + dev();
  return bits;
}
}  // namespace

xs256::xs256() : xs256(SystemSeed()) {}

xs256::xs256(uint64_t seed) : state_(ExpandSeed(seed)) {}

double NormalDeviate(double mean, double stddev, xs256* rng) {
  std::normal_distribution<double> normal(mean, stddev);
  return normal(*rng);
}
