#ifndef KS_TWO_SAMPLE_TEST_H
#define KS_TWO_SAMPLE_TEST_H
#include <algorithm>
#include <cmath>
#include <cstddef>
#include <functional>
#include <ostream>
#include <tuple>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/base/internal/raw_logging.h"
#include "absl/types/span.h"
#include "ks/total-order.h"

// Two-sample Kolmogorov-Smirnov test.
//
// The test rejects the null hypothesis that two samples come from the
// same underlying distribution when the largest distance between their
// empirical CDFs exceeds a critical value for the sample sizes and the
// confidence level.
//
// Only the asymptotic critical value at confidence 0.95 is
// implemented, and it is only accurate enough for samples with more
// than 12 values each.  Anything else aborts.
namespace ks {
struct TestResult {
  // Whether the null hypothesis (same distribution) is rejected.
  bool is_rejected{false};
  // Max absolute difference between the two ECDFs, in [0, 1].
  double statistic{0};
  // Depends only on the sample sizes and `confidence`.
  double critical_value{0};
  double confidence{0};

  bool operator==(const TestResult& other) const {
    return std::tie(is_rejected, statistic, critical_value, confidence) ==
           std::tie(other.is_rejected, other.statistic, other.critical_value,
                    other.confidence);
  }
};

std::ostream& operator<<(std::ostream& out, const TestResult& result);

// Returns the critical value of the test statistic for samples of size
// `n1` and `n2`, at the `confidence` level:
//
//   1.36 * sqrt((n1 + n2) / (n1 * n2)).
//
// Aborts unless n1 > 12, n2 > 12 and confidence == 0.95.
double CalculateCriticalValue(size_t n1, size_t n2, double confidence);

namespace internal {
// Aborts if `Test` can't be applied to samples of size `n1` and `n2` at
// `confidence`.
void CheckTestPreconditions(size_t n1, size_t n2, double confidence);
}  // namespace internal

// Returns sup_t |ECDF_xs(t) - ECDF_ys(t)|.
//
// The supremum is attained at one of the sample values, so we sort
// both samples and sweep them in lockstep, from low to high, one
// distinct value at a time.  That's O((n + m) log(n + m)), rather than
// the O(nm) of evaluating both ECDFs at every sample value.
template <typename T, typename Compare = std::less<T>>
double CalculateStatistic(absl::Span<const T> xs, absl::Span<const T> ys,
                          Compare cmp = Compare()) {
  const size_t n = xs.size();
  const size_t m = ys.size();
  ABSL_RAW_CHECK(n > 0 && m > 0, "samples must be non-empty");

  std::vector<T> sorted_xs(xs.begin(), xs.end());
  std::vector<T> sorted_ys(ys.begin(), ys.end());
  absl::c_sort(sorted_xs, cmp);
  absl::c_sort(sorted_ys, cmp);

  // i and j index the first values in xs and ys greater than the last
  // value swept; ecdf_xs and ecdf_ys are the ECDFs at that value.
  size_t i = 0;
  size_t j = 0;
  double ecdf_xs = 0.0;
  double ecdf_ys = 0.0;
  double statistic = 0.0;
  while (i < n && j < m) {
    // Skip to the last copy of each side's current value.
    const T& x_i = sorted_xs[i];
    while (i + 1 < n && Equivalent(x_i, sorted_xs[i + 1], cmp)) {
      ++i;
    }

    const T& y_j = sorted_ys[j];
    while (j + 1 < m && Equivalent(y_j, sorted_ys[j + 1], cmp)) {
      ++j;
    }

    // Step to min(x_i, y_j); on a tie, both sides step.
    const bool step_x = !cmp(y_j, x_i);
    const bool step_y = !cmp(x_i, y_j);
    if (step_x) {
      ecdf_xs = static_cast<double>(i + 1) / n;
      ++i;
    }

    if (step_y) {
      ecdf_ys = static_cast<double>(j + 1) / m;
      ++j;
    }

    statistic = std::max(statistic, std::fabs(ecdf_xs - ecdf_ys));
  }

  // Once one side is exhausted, its ECDF is 1 and the other's only
  // increases towards 1: the difference can only shrink from here.
  return statistic;
}

// Tests whether `xs` and `ys` come from the same distribution.
//
// Aborts if either sample has 12 values or fewer, or if `confidence`
// isn't 0.95.
template <typename T, typename Compare = std::less<T>>
TestResult Test(absl::Span<const T> xs, absl::Span<const T> ys,
                double confidence, Compare cmp = Compare()) {
  internal::CheckTestPreconditions(xs.size(), ys.size(), confidence);

  TestResult ret;
  ret.statistic = CalculateStatistic(xs, ys, cmp);
  ret.critical_value =
      CalculateCriticalValue(xs.size(), ys.size(), confidence);
  ret.confidence = confidence;
  ret.is_rejected = ret.statistic > ret.critical_value;
  return ret;
}

// `Test` on floating-point samples, ordered with `TotalOrderDouble`:
// aborts if any sample is NaN.
TestResult TestDouble(absl::Span<const double> xs,
                      absl::Span<const double> ys, double confidence);
}  // namespace ks
#endif /* !KS_TWO_SAMPLE_TEST_H */
