#include <cstdint>
#include <iostream>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "driver.h"
#include "ks-flags.h"
#include "prng.h"

// Prints --num_deviates deviates of N(--mean, --variance), one per
// line.
int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);

  const size_t num_deviates = absl::GetFlag(FLAGS_num_deviates);
  const double variance = absl::GetFlag(FLAGS_variance);
  if (num_deviates == 0) {
    std::cerr << "--num_deviates must be a positive integer.\n";
    return 1;
  }

  if (!(variance > 0)) {
    std::cerr << "--variance must be positive.\n";
    return 1;
  }

  const uint64_t seed = absl::GetFlag(FLAGS_seed);
  xs256 rng = seed == 0 ? xs256() : xs256(seed);
  PrintNormalDeviates(std::cout, num_deviates, absl::GetFlag(FLAGS_mean),
                      variance, &rng);
  return 0;
}
