#include "quantum_estimator.hpp"

#include <algorithm>

#include "numeric.hpp"

namespace memsched {

int64_t effective_quantum(double signal, int64_t base_q, double k) {
  double scaled = static_cast<double>(base_q) * (1.0 + k * signal);
  return std::max<int64_t>(1, round_to_int(scaled));
}

int64_t estimated_memory_mb(double signal, int64_t min_mb, int64_t max_mb) {
  double span = static_cast<double>(max_mb - min_mb);
  return round_to_int(static_cast<double>(min_mb) + signal * span);
}

}  // namespace memsched
