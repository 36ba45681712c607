#ifndef KS_FLAGS_H
#define KS_FLAGS_H
#include <cstddef>
#include <cstdint>

#include "absl/flags/declare.h"

ABSL_DECLARE_FLAG(double, confidence);

ABSL_DECLARE_FLAG(size_t, n1);

ABSL_DECLARE_FLAG(size_t, min_n2);

ABSL_DECLARE_FLAG(size_t, limit);

ABSL_DECLARE_FLAG(size_t, num_deviates);

ABSL_DECLARE_FLAG(double, mean);

ABSL_DECLARE_FLAG(double, variance);

ABSL_DECLARE_FLAG(uint64_t, seed);
#endif /* !KS_FLAGS_H */
