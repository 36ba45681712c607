#ifndef KS_ORDER_STATISTICS_H
#define KS_ORDER_STATISTICS_H
#include <assert.h>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "absl/base/internal/raw_logging.h"
#include "absl/types/span.h"
#include "ks/total-order.h"

// One-shot order statistics on unsorted samples.
//
// These functions do not keep any state between calls: `EcdfValue` is
// a linear scan, and `Rank`, `Percentile` and `Permille` run a
// quickselect on a private copy of the samples.  Each call is O(n).
// When many queries hit the same sample, build a `ks::Ecdf` instead:
// it pays O(n log n) once, and then answers in O(log n) or O(1).
//
// All functions abort on empty samples or out-of-range arguments.
namespace ks {
// Maps a percentile in [1, 100] to its 1-indexed nearest rank,
// `ceil(p * length / 100)`, in a sample of `length` values.
size_t PercentileRank(uint8_t p, size_t length);

// Maps a permille in [1, 1000] to its 1-indexed nearest rank,
// `ceil(p * length / 1000)`, in a sample of `length` values.
size_t PermilleRank(uint16_t p, size_t length);

// Returns the fraction of `samples` that are <= `t`.
template <typename T, typename Compare = std::less<T>>
double EcdfValue(absl::Span<const T> samples, const T& t,
                 Compare cmp = Compare()) {
  ABSL_RAW_CHECK(!samples.empty(), "samples must be non-empty");

  size_t num_samples_leq_t = 0;
  for (const T& sample : samples) {
    if (!cmp(t, sample)) {
      ++num_samples_leq_t;
    }
  }

  return static_cast<double>(num_samples_leq_t) / samples.size();
}

namespace internal {
// Returns the element of 1-indexed `rank` in `samples`, which is
// permuted in place.
//
// Each round picks the first element in the window [low, high) as the
// pivot, and splits the window in three blocks: values < pivot,
// values == pivot, and values > pivot.  Duplicates of the pivot are
// grouped in the middle block, so a rank that lands anywhere in a run
// of equal values resolves to that value without further rounds.
//
// All elements left of `low` are less than every element in the
// window, and all elements at or right of `high` greater, so ranks
// can be compared directly with absolute indices.
template <typename T, typename Compare>
T QuickSelect(std::vector<T> samples, size_t rank, const Compare& cmp) {
  assert(0 < rank && rank <= samples.size());

  size_t low = 0;
  size_t high = samples.size();
  for (;;) {
    assert(low < high);

    const T pivot = samples[low];
    if (low >= high - 1) {
      return pivot;
    }

    // Move every value < pivot left of `bottom`.
    size_t bottom = low;
    size_t top = high - 1;
    while (bottom < top) {
      while (bottom < top && cmp(samples[bottom], pivot)) {
        ++bottom;
      }

      while (bottom < top && !cmp(samples[top], pivot)) {
        --top;
      }

      if (bottom < top) {
        using std::swap;
        swap(samples[bottom], samples[top]);
      }
    }

    if (rank <= bottom) {
      high = bottom;
      continue;
    }

    // Everything left of `bottom` is too small.  Move every value
    // equal to the pivot left of the new `bottom`.
    low = bottom;
    top = high - 1;
    while (bottom < top) {
      while (bottom < top && Equivalent(samples[bottom], pivot, cmp)) {
        ++bottom;
      }

      while (bottom < top && !Equivalent(samples[top], pivot, cmp)) {
        --top;
      }

      if (bottom < top) {
        using std::swap;
        swap(samples[bottom], samples[top]);
      }
    }

    if (rank <= bottom) {
      return pivot;
    }

    low = bottom;
  }
}
}  // namespace internal

// Returns the element of 1-indexed `rank` in `samples`: rank 1 is the
// minimum, rank `samples.size()` the maximum.
template <typename T, typename Compare = std::less<T>>
T Rank(absl::Span<const T> samples, size_t rank, Compare cmp = Compare()) {
  ABSL_RAW_CHECK(!samples.empty(), "samples must be non-empty");
  ABSL_RAW_CHECK(0 < rank && rank <= samples.size(),
                 "rank must be in [1, length]");

  return internal::QuickSelect(std::vector<T>(samples.begin(), samples.end()),
                               rank, cmp);
}

// Returns the `p`th percentile of `samples`, for `p` in [1, 100],
// with the nearest-rank method.
template <typename T, typename Compare = std::less<T>>
T Percentile(absl::Span<const T> samples, uint8_t p, Compare cmp = Compare()) {
  ABSL_RAW_CHECK(!samples.empty(), "samples must be non-empty");
  return Rank(samples, PercentileRank(p, samples.size()), cmp);
}

// Returns the `p`th permille of `samples`, for `p` in [1, 1000],
// with the nearest-rank method.
template <typename T, typename Compare = std::less<T>>
T Permille(absl::Span<const T> samples, uint16_t p, Compare cmp = Compare()) {
  ABSL_RAW_CHECK(!samples.empty(), "samples must be non-empty");
  return Rank(samples, PermilleRank(p, samples.size()), cmp);
}
}  // namespace ks
#endif /* !KS_ORDER_STATISTICS_H */
