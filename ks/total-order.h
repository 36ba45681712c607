#ifndef KS_TOTAL_ORDER_H
#define KS_TOTAL_ORDER_H
#include <cmath>

#include "absl/base/internal/raw_logging.h"

namespace ks {
// Every generic routine in this library takes a value type `T` and a
// `Compare` functor that must be a strict weak order, total on the
// values actually passed in.  Equality is whatever the comparator
// implies; `T::operator==` is never used.
//
// `TotalOrderDouble` is the comparator to use for floating-point
// samples.  IEEE doubles are only partially ordered (NaN is neither
// less than, greater than nor equal to anything), which would
// silently corrupt sorts and selections.  Instead of guessing where
// NaN belongs, we abort as soon as one is compared.
struct TotalOrderDouble {
  bool operator()(double a, double b) const {
    ABSL_RAW_CHECK(!std::isnan(a) && !std::isnan(b), "cannot order NaN");
    return a < b;
  }
};

// Returns true if neither `a < b` nor `b < a` under `cmp`.
template <typename T, typename Compare>
inline bool Equivalent(const T& a, const T& b, const Compare& cmp) {
  return !cmp(a, b) && !cmp(b, a);
}
}  // namespace ks
#endif /* !KS_TOTAL_ORDER_H */
