#include <iostream>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "driver.h"
#include "ks-flags.h"

// Tabulates the critical values of the two-sample test for samples of
// size --n1 against samples of size --min_n2 through --limit.
int main(int argc, char** argv) {
  absl::ParseCommandLine(argc, argv);

  const double confidence = absl::GetFlag(FLAGS_confidence);
  const size_t n1 = absl::GetFlag(FLAGS_n1);
  const size_t limit = absl::GetFlag(FLAGS_limit);
  if (n1 == 0 || limit == 0) {
    std::cerr << "--n1 and --limit must be positive integers.\n";
    return 1;
  }

  if (!(0.0 < confidence && confidence < 1.0)) {
    std::cerr << "--confidence must be strictly between 0 and 1.\n";
    return 1;
  }

  PrintCriticalValues(std::cout, confidence, n1, absl::GetFlag(FLAGS_min_n2),
                      limit);
  return 0;
}
