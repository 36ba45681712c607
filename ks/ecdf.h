#ifndef KS_ECDF_H
#define KS_ECDF_H
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

#include "absl/algorithm/container.h"
#include "absl/base/internal/raw_logging.h"
#include "absl/types/span.h"
#include "ks/order-statistics.h"
#include "ks/total-order.h"

namespace ks {
// Empirical cumulative distribution function of a fixed sample.
//
// Construction sorts a private copy of the samples, which costs
// O(n log n) time and O(n) space.  That cost is amortised over
// queries: `Value` is a binary search, and `Percentile`, `Permille`,
// `Rank`, `Min` and `Max` index directly into the sorted copy.  For a
// handful of queries on a large sample, the one-shot functions in
// `ks/order-statistics.h` are cheaper.
//
// Instances are immutable, and thus thread-compatible: concurrent
// const calls are safe.
template <typename T, typename Compare = std::less<T>>
class Ecdf {
 public:
  // Aborts if `samples` is empty.
  explicit Ecdf(absl::Span<const T> samples, Compare cmp = Compare())
      : cmp_(cmp), sorted_(samples.begin(), samples.end()) {
    ABSL_RAW_CHECK(!sorted_.empty(), "samples must be non-empty");
    absl::c_sort(sorted_, cmp_);
  }

  Ecdf(const Ecdf&) = default;
  Ecdf(Ecdf&&) = default;
  Ecdf& operator=(const Ecdf&) = default;
  Ecdf& operator=(Ecdf&&) = default;

  // Returns the fraction of samples <= `t`.
  double Value(const T& t) const;

  // Nearest-rank percentile, for `p` in [1, 100].
  const T& Percentile(uint8_t p) const {
    return Rank(PercentileRank(p, sorted_.size()));
  }

  // Nearest-rank permille, for `p` in [1, 1000].
  const T& Permille(uint16_t p) const {
    return Rank(PermilleRank(p, sorted_.size()));
  }

  // 1-indexed rank, in [1, size()].
  const T& Rank(size_t rank) const {
    ABSL_RAW_CHECK(0 < rank && rank <= sorted_.size(),
                   "rank must be in [1, length]");
    return sorted_[rank - 1];
  }

  const T& Min() const { return sorted_.front(); }
  const T& Max() const { return sorted_.back(); }

  size_t size() const { return sorted_.size(); }
  absl::Span<const T> sorted() const { return sorted_; }

 private:
  Compare cmp_;
  std::vector<T> sorted_;
};

template <typename T, typename Compare>
double Ecdf<T, Compare>::Value(const T& t) const {
  const size_t length = sorted_.size();
  size_t index = absl::c_lower_bound(sorted_, t, cmp_) - sorted_.begin();

  if (index < length && Equivalent(sorted_[index], t, cmp_)) {
    // We found the start of a run of values equal to t.  We want the
    // count of values <= t, so skip to the end of the run.
    while (index + 1 < length && Equivalent(sorted_[index + 1], t, cmp_)) {
      ++index;
    }

    return static_cast<double>(index + 1) / length;
  }

  // `index` is the insertion point, i.e., the number of values < t.
  return static_cast<double>(index) / length;
}
}  // namespace ks
#endif /* !KS_ECDF_H */
