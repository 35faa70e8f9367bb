#ifndef MEMSCHED_METRICS_H_
#define MEMSCHED_METRICS_H_

#include <cstdint>
#include <string>
#include <vector>

#include "round_robin.hpp"
#include "simulation_result.hpp"

namespace memsched {

struct ProcessMetrics {
  PerProcess waiting;
  PerProcess turnaround;
  // Sum of bursts over total_time. Reported utilization comes from the
  // occupancy series instead, see cpu_utilization_from_series().
  double raw_cpu_utilization{0.0};
  int64_t total_time{0};
};

// Adjacent slices with different pids.
int64_t count_context_switches(const Timeline& timeline);

ProcessMetrics compute_metrics(const std::vector<std::string>& pids,
                               const TickMap& bursts, const Timeline& timeline,
                               const TickMap& arrivals);

// One sample per tick in [0, total_time).
std::vector<CpuSample> build_cpu_series(const Timeline& timeline,
                                        int64_t total_time);

double cpu_utilization_from_series(const std::vector<CpuSample>& series);

// running at each slice start, stopped at each slice end; at equal times
// stopped sorts first, then by pid.
std::vector<TraceEntry> generate_trace(const Timeline& timeline);

double average(const PerProcess& values);

}  // namespace memsched

#endif
