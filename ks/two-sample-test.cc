#include "ks/two-sample-test.h"

#include <cmath>

namespace ks {
namespace internal {
void CheckTestPreconditions(size_t n1, size_t n2, double confidence) {
  ABSL_RAW_CHECK(n1 > 0 && n2 > 0, "samples must be non-empty");
  ABSL_RAW_CHECK(0.0 < confidence && confidence < 1.0,
                 "confidence must be in (0, 1)");
  // The asymptotic formula is too far off for small samples.
  ABSL_RAW_CHECK(n1 > 12 && n2 > 12,
                 "samples must have more than 12 elements");
  ABSL_RAW_CHECK(confidence == 0.95, "only confidence == 0.95 is supported");
}
}  // namespace internal

double CalculateCriticalValue(size_t n1, size_t n2, double confidence) {
  internal::CheckTestPreconditions(n1, n2, confidence);

  const double size1 = static_cast<double>(n1);
  const double size2 = static_cast<double>(n2);
  const double factor = (size1 + size2) / (size1 * size2);
  return 1.36 * std::sqrt(factor);
}

TestResult TestDouble(absl::Span<const double> xs,
                      absl::Span<const double> ys, double confidence) {
  return Test(xs, ys, confidence, TotalOrderDouble());
}

std::ostream& operator<<(std::ostream& out, const TestResult& result) {
  out << "TestResult{" << (result.is_rejected ? "rejected" : "not rejected")
      << ", statistic=" << result.statistic
      << ", critical_value=" << result.critical_value
      << ", confidence=" << result.confidence << "}";
  return out;
}
}  // namespace ks
