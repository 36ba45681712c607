#ifndef PRNG_H
#define PRNG_H
#include <array>
#include <cstdint>
#include <limits>

// xoshiro256+ pseudo-random generator.  Satisfies the standard
// UniformRandomBitGenerator requirements, so it plugs into the
// `<random>` distributions.
//
// This class is thread-compatible; give each thread its own instance.
class xs256 {
 public:
  using result_type = uint64_t;

  // Constructs a stream seeded from `std::random_device`.
  xs256();

  // Constructs a reproducible stream: equal seeds yield equal
  // sequences.
  explicit xs256(uint64_t seed);

  // Copyable.
  xs256(const xs256&) = default;
  xs256& operator=(const xs256&) = default;

  // Returns a value in [0, limit).
  uint64_t Uniform(uint64_t limit) {
    unsigned __int128 tmp = limit;

    tmp *= (*this)();
    return tmp >> 64;
  }

  // Returns a value in [0, 1), from the 53 high-order bits.
  double UniformDouble() {
    return static_cast<double>((*this)() >> 11) * (1.0 / 9007199254740992.0);
  }

  // The xoroshiro256+ generator has some bias in the low order bits,
  // but we only use its high-order bits (as if generating floats).
  uint64_t operator()() {
    const uint64_t result_plus = state_[0] + state_[3];

    Advance();
    return result_plus;
  }

  static constexpr uint64_t min() { return 0; }
  static constexpr uint64_t max() {
    return std::numeric_limits<uint64_t>::max();
  }

 private:
  void Advance() {
    const uint64_t t = state_[1] << 17;

    state_[2] ^= state_[0];
    state_[3] ^= state_[1];
    state_[1] ^= state_[2];
    state_[0] ^= state_[3];

    state_[2] ^= t;

    state_[3] = rotl(state_[3], 45);
  }

  static uint64_t rotl(const uint64_t x, int k) {
    return (x << k) | (x >> (64 - k));
  }

  std::array<uint64_t, 4> state_;
};

// Returns a deviate of the Normal distribution N(mean, stddev^2).
double NormalDeviate(double mean, double stddev, xs256* rng);
#endif /*!PRNG_H */
