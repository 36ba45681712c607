#include "driver.h"

#include <assert.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/strings/numbers.h"
#include "absl/strings/str_format.h"
#include "absl/types/span.h"
#include "ks/sample-file.h"

namespace {
// Returns the shortest `%g` rendering of `value` that parses back to
// `value`.
std::string FormatShortest(double value) {
  for (int precision = 1; precision < 17; ++precision) {
    const std::string text = absl::StrFormat("%.*g", precision, value);
    double parsed;
    if (absl::SimpleAtod(text, &parsed) && parsed == value) {
      return text;
    }
  }

  return absl::StrFormat("%.17g", value);
}
}  // namespace

void PrintTestResult(std::ostream& out, const ks::TestResult& result) {
  if (result.is_rejected) {
    out << "Samples are from different distributions.\n";
  } else {
    out << "Samples are from the same distributions.\n";
  }

  out << "test statistic = " << FormatShortest(result.statistic) << "\n";
  out << "critical value = " << FormatShortest(result.critical_value) << "\n";
  out << "confidence = " << FormatShortest(result.confidence) << "\n";
}

int CompareDoubleSampleFiles(const std::string& path1,
                             const std::string& path2, double confidence,
                             std::ostream& out) {
  const std::vector<double> xs = ks::ReadDoubleSamplesOrDie(path1);
  const std::vector<double> ys = ks::ReadDoubleSamplesOrDie(path2);

  PrintTestResult(out, ks::TestDouble(xs, ys, confidence));
  return 0;
}

int CompareIntegerSampleFiles(const std::string& path1,
                              const std::string& path2, double confidence,
                              std::ostream& out) {
  const std::vector<int64_t> xs = ks::ReadIntegerSamplesOrDie(path1);
  const std::vector<int64_t> ys = ks::ReadIntegerSamplesOrDie(path2);

  PrintTestResult(out, ks::Test(absl::MakeConstSpan(xs),
                                absl::MakeConstSpan(ys), confidence));
  return 0;
}

void PrintCriticalValues(std::ostream& out, double confidence, size_t n1,
                         size_t min_n2, size_t limit) {
  out << "n1\tn2\tconfidence\tcritical_value\n";
  for (size_t n2 = min_n2; n2 <= limit; ++n2) {
    out << absl::StrFormat("%d\t%d\t%g\t%.6f\n", n1, n2, confidence,
                           ks::CalculateCriticalValue(n1, n2, confidence));
  }
}

void PrintNormalDeviates(std::ostream& out, size_t num_deviates, double mean,
                         double variance, xs256* rng) {
  assert(variance > 0);

  const double stddev = std::sqrt(variance);
  for (size_t i = 0; i < num_deviates; ++i) {
    out << absl::StrFormat("%.17g\n", NormalDeviate(mean, stddev, rng));
  }
}
