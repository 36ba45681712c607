#include "ks/order-statistics.h"

#include <cmath>

namespace ks {
size_t PercentileRank(uint8_t p, size_t length) {
  ABSL_RAW_CHECK(0 < p && p <= 100, "percentile must be in [1, 100]");
  ABSL_RAW_CHECK(length > 0, "samples must be non-empty");

  return static_cast<size_t>(
      std::ceil(static_cast<double>(p) * static_cast<double>(length) / 100.0));
}

size_t PermilleRank(uint16_t p, size_t length) {
  ABSL_RAW_CHECK(0 < p && p <= 1000, "permille must be in [1, 1000]");
  ABSL_RAW_CHECK(length > 0, "samples must be non-empty");

  return static_cast<size_t>(
      std::ceil(static_cast<double>(p) * static_cast<double>(length) / 1000.0));
}
}  // namespace ks
