#include "prng.h"

#include <cmath>
#include <cstdint>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {
TEST(Prng, SeededStreamsRepeat) {
  xs256 a(42);
  xs256 b(42);
  for (size_t i = 0; i < 100; ++i) {
    EXPECT_EQ(a(), b());
  }
}

TEST(Prng, SeedsDiffer) {
  xs256 a(1);
  xs256 b(2);

  size_t num_equal = 0;
  for (size_t i = 0; i < 100; ++i) {
    num_equal += a() == b();
  }

  EXPECT_EQ(num_equal, 0);
}

TEST(Prng, CopiesRepeat) {
  xs256 a;
  a();
  xs256 b = a;
  for (size_t i = 0; i < 10; ++i) {
    EXPECT_EQ(a(), b());
  }
}

TEST(Prng, UniformInRange) {
  xs256 rng(3);
  std::vector<size_t> counts(10, 0);
  for (size_t i = 0; i < 100000; ++i) {
    const uint64_t value = rng.Uniform(10);
    ASSERT_LT(value, 10);
    ++counts[value];
  }

  // Each bucket expects 10000 hits, with a stddev under 100.
  for (const size_t count : counts) {
    EXPECT_GT(count, 9000);
    EXPECT_LT(count, 11000);
  }
}

TEST(Prng, UniformDoubleInUnitInterval) {
  xs256 rng(4);
  double sum = 0;
  for (size_t i = 0; i < 100000; ++i) {
    const double value = rng.UniformDouble();
    ASSERT_GE(value, 0.0);
    ASSERT_LT(value, 1.0);
    sum += value;
  }

  EXPECT_NEAR(sum / 100000, 0.5, 0.01);
}

TEST(Prng, NormalDeviateMoments) {
  xs256 rng(5);
  const size_t n = 100000;
  double sum = 0;
  double sum_squares = 0;
  for (size_t i = 0; i < n; ++i) {
    const double value = NormalDeviate(3.0, 2.0, &rng);
    sum += value;
    sum_squares += value * value;
  }

  const double mean = sum / n;
  const double variance = sum_squares / n - mean * mean;
  EXPECT_NEAR(mean, 3.0, 0.05);
  EXPECT_NEAR(variance, 4.0, 0.1);
}
}  // namespace
