#ifndef MEMSCHED_SCENARIOS_H_
#define MEMSCHED_SCENARIOS_H_

#include <cstdint>

#include "config.hpp"
#include "simulation_result.hpp"

namespace memsched {

// Page counts drawn for processes that do not declare one (pagesCount <= 1).
inline constexpr uint32_t kMinDefaultPages = 4;
inline constexpr uint32_t kMaxDefaultPages = 24;

// Fixed quantum = quantumCycles for every process.
SimulationResult simulate_baseline(const SystemConfig& config);

// Lets the memory pressure model settle for adaptationRounds rounds,
// freezes the resulting per-process quanta and simulates once.
SimulationResult simulate_memory_aware(const SystemConfig& config);

CompareBundle compare_schedulers(const SystemConfig& config);

}  // namespace memsched

#endif
