#ifndef MEMSCHED_SIMULATION_RESULT_H_
#define MEMSCHED_SIMULATION_RESULT_H_

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

#include "round_robin.hpp"

namespace memsched {

enum class TraceEvent { Running, Stopped };

std::string to_string(TraceEvent event);

struct TraceEntry {
  int64_t time;
  TraceEvent event;
  std::string pid;

  bool operator==(const TraceEntry& other) const = default;
};

// Occupancy of one tick: cpu is 100 when some slice covers it, else 0.
struct CpuSample {
  int64_t time;
  int cpu;

  bool operator==(const CpuSample& other) const = default;
};

using PerProcess = std::map<std::string, int64_t>;
using PerProcessReal = std::map<std::string, double>;

// Free-form diagnostics: scalars (averages) or per-process dumps.
using MetaValue = std::variant<double, PerProcessReal>;

struct SimulationResult {
  std::vector<std::string> pids;  // input order
  PerProcess waiting_times;
  PerProcess turnaround_times;
  double cpu_utilization{0.0};
  int64_t total_time{0};
  int64_t context_switches{0};
  std::vector<TraceEntry> trace;
  PerProcess inferred_quanta;
  PerProcess memory_estimates;  // empty for the baseline run
  std::vector<CpuSample> cpu_series;
  std::map<std::string, MetaValue> meta;
  Timeline timeline;
};

struct CompareBundle {
  SimulationResult baseline;
  SimulationResult memory_aware;
};

}  // namespace memsched

#endif
