#include "scenarios.hpp"

#include <array>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "memory_pressure_model.hpp"
#include "metrics.hpp"
#include "random_source.hpp"
#include "round_robin.hpp"

namespace memsched {

namespace {

// Stream ids for random sources derived from the configured seed.
constexpr uint64_t kWorkloadStream = 0x574F524B4C4F4144ull;
constexpr uint64_t kModelStream = 0x4D454D4D4F44454Cull;

struct Workload {
  std::vector<std::string> pids;
  TickMap bursts;
  TickMap arrivals;
};

Workload collect_workload(const SystemConfig& config) {
  Workload w;
  w.pids = config.pids();
  for (const auto& p : config.processes) {
    w.bursts[p.pid] = static_cast<double>(p.burstTime);
    w.arrivals[p.pid] = static_cast<double>(p.arrivalTime);
  }
  return w;
}

// Runs the timeline once with frozen quanta and fills in everything that
// derives from it.
SimulationResult run_with_quanta(const Workload& w, const PerProcess& quanta) {
  TickMap qmap;
  for (const auto& [pid, q] : quanta) {
    qmap[pid] = static_cast<double>(q);
  }

  SimulationResult result;
  result.pids = w.pids;
  result.timeline = simulate_round_robin(w.pids, w.bursts, qmap, w.arrivals);

  ProcessMetrics metrics = compute_metrics(w.pids, w.bursts, result.timeline, w.arrivals);
  result.waiting_times = std::move(metrics.waiting);
  result.turnaround_times = std::move(metrics.turnaround);
  result.total_time = metrics.total_time;
  result.context_switches = count_context_switches(result.timeline);
  result.cpu_series = build_cpu_series(result.timeline, result.total_time);
  result.cpu_utilization = cpu_utilization_from_series(result.cpu_series);
  result.trace = generate_trace(result.timeline);
  result.inferred_quanta = quanta;

  result.meta["avg_wait"] = average(result.waiting_times);
  result.meta["avg_turnaround"] = average(result.turnaround_times);
  return result;
}

}  // namespace

SimulationResult simulate_baseline(const SystemConfig& config) {
  config.validate();
  Workload w = collect_workload(config);

  PerProcess quanta;
  for (const auto& pid : w.pids) {
    quanta[pid] = config.quantumCycles;
  }
  return run_with_quanta(w, quanta);
}

SimulationResult simulate_memory_aware(const SystemConfig& config) {
  config.validate();
  Workload w = collect_workload(config);
  const int64_t base_q = config.quantumCycles;

  uint64_t root = config.rngSeed ? *config.rngSeed : fresh_seed();
  std::mt19937 workload_rng = make_rng(derive_seed(root, kWorkloadStream));

  MemoryModelConfig mm_config = config.memoryModel;
  mm_config.base_q = base_q;
  mm_config.rng_seed = derive_seed(root, kModelStream);
  MemoryPressureModel model(mm_config);

  constexpr std::array<AccessPatternKind, 3> kPatterns = {
      AccessPatternKind::Locality, AccessPatternKind::Random,
      AccessPatternKind::Sequential};
  std::uniform_int_distribution<uint32_t> page_dist(kMinDefaultPages, kMaxDefaultPages);
  std::uniform_int_distribution<size_t> pattern_dist(0, kPatterns.size() - 1);

  for (const auto& p : config.processes) {
    uint32_t pages = p.pagesCount > 1 ? p.pagesCount : page_dist(workload_rng);
    AccessPatternKind pattern = config.memoryModel.access_pattern;
    if (config.randomizeAccessPatterns) {
      pattern = kPatterns[pattern_dist(workload_rng)];
    }
    model.create_process(p.pid, p.arrivalTime, p.burstTime, pages, pattern);
  }

  for (uint32_t round = 0; round < config.adaptationRounds; ++round) {
    for (const auto& pid : w.pids) {
      int64_t q = model.effective_quantum(pid, base_q);
      SliceObservation obs = model.observe_run(pid, q);
      model.update_signal(pid, obs);
    }
    model.recompute_normalization();
  }

  PerProcess quanta;
  PerProcess memory;
  PerProcessReal signals;
  for (const auto& pid : w.pids) {
    quanta[pid] = model.effective_quantum(pid, base_q);
    memory[pid] = model.estimated_memory_mb(pid);
    signals[pid] = model.process(pid).mem_signal;
  }

  SimulationResult result = run_with_quanta(w, quanta);
  result.memory_estimates = memory;

  PerProcessReal quanta_dump;
  PerProcessReal memory_dump;
  for (const auto& pid : w.pids) {
    quanta_dump[pid] = static_cast<double>(quanta[pid]);
    memory_dump[pid] = static_cast<double>(memory[pid]);
  }
  result.meta["memory_quanta"] = std::move(quanta_dump);
  result.meta["memory_estimates"] = std::move(memory_dump);
  result.meta["mem_signals"] = std::move(signals);
  return result;
}

CompareBundle compare_schedulers(const SystemConfig& config) {
  return CompareBundle{simulate_baseline(config), simulate_memory_aware(config)};
}

}  // namespace memsched
