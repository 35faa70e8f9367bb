#ifndef MEMSCHED_QUANTUM_ESTIMATOR_H_
#define MEMSCHED_QUANTUM_ESTIMATOR_H_

#include <cstdint>

namespace memsched {

// max(1, round(base_q * (1 + k * signal)))
int64_t effective_quantum(double signal, int64_t base_q, double k);

// round(min_mb + signal * (max_mb - min_mb))
int64_t estimated_memory_mb(double signal, int64_t min_mb, int64_t max_mb);

}  // namespace memsched

#endif
