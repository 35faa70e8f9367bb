#include "numeric.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace memsched {

int64_t round_to_int(double value) {
  if (!std::isfinite(value)) {
    return 0;
  }
  // Saturate outside the int64 range; the cast below would be undefined.
  if (value >= 0x1p63) {
    return std::numeric_limits<int64_t>::max();
  }
  if (value < -0x1p63) {
    return std::numeric_limits<int64_t>::min();
  }
  double floor_value = std::floor(value);
  double diff = value - floor_value;
  if (diff > 0.5) {
    return static_cast<int64_t>(floor_value) + 1;
  }
  if (diff < 0.5) {
    return static_cast<int64_t>(floor_value);
  }
  auto lower = static_cast<int64_t>(floor_value);
  return (lower % 2 == 0) ? lower : lower + 1;
}

int64_t clamp_non_negative_int(double value) {
  return std::max<int64_t>(0, round_to_int(value));
}

int64_t clamp_positive_int(double value) {
  return std::max<int64_t>(1, round_to_int(value));
}

}  // namespace memsched
