#ifndef DRIVER_H
#define DRIVER_H
#include <cstddef>
#include <ostream>
#include <string>

#include "ks/two-sample-test.h"
#include "prng.h"

// Bodies of the command-line tools.  Each writes to `out`, so that the
// tools themselves only parse flags.

// Prints the decision, then the statistic, critical value and
// confidence level, one per line.
void PrintTestResult(std::ostream& out, const ks::TestResult& result);

// Runs the two-sample test on the sample files at `path1` and `path2`,
// and prints the result.  Aborts if a file can't be read, or if the
// samples don't satisfy the test's preconditions.
//
// Returns the process exit code.
int CompareDoubleSampleFiles(const std::string& path1,
                             const std::string& path2, double confidence,
                             std::ostream& out);
int CompareIntegerSampleFiles(const std::string& path1,
                              const std::string& path2, double confidence,
                              std::ostream& out);

// Prints a tab-separated table of the critical values for samples of
// size `n1` against samples of size `min_n2` through `limit`,
// inclusive.
void PrintCriticalValues(std::ostream& out, double confidence, size_t n1,
                         size_t min_n2, size_t limit);

// Prints `num_deviates` deviates of N(mean, variance), one per line.
void PrintNormalDeviates(std::ostream& out, size_t num_deviates, double mean,
                         double variance, xs256* rng);
#endif /* !DRIVER_H */
