#include "ks-flags.h"

#include "absl/flags/flag.h"

ABSL_FLAG(double, confidence, 0.95,
          "Confidence level of the test; only 0.95 is supported");

ABSL_FLAG(size_t, n1, 0, "Size of the first sample");

ABSL_FLAG(size_t, min_n2, 16,
          "Smallest size of the second sample to tabulate; must exceed 12");

ABSL_FLAG(size_t, limit, 0,
          "Largest size of the second sample to tabulate, inclusive");

ABSL_FLAG(size_t, num_deviates, 0, "Number of deviates to generate");

ABSL_FLAG(double, mean, 0.0, "Mean of the Normal distribution");

ABSL_FLAG(double, variance, 1.0, "Variance of the Normal distribution");

ABSL_FLAG(uint64_t, seed, 0,
          "Random seed for reproducible output; 0 seeds from the system");
