#ifndef MEMSCHED_MEMORY_PRESSURE_MODEL_H_
#define MEMSCHED_MEMORY_PRESSURE_MODEL_H_

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "page_access_generator.hpp"
#include "working_set_window.hpp"

namespace memsched {

class UnknownProcessError : public std::out_of_range {
 public:
  explicit UnknownProcessError(const std::string& pid)
      : std::out_of_range("Unknown process: " + pid) {}
};

class DuplicateProcessError : public std::invalid_argument {
 public:
  explicit DuplicateProcessError(const std::string& pid)
      : std::invalid_argument("Process already registered: " + pid) {}
};

struct MemoryModelConfig {
  uint32_t page_size_mb{4};
  int64_t min_memory_mb{8};
  int64_t max_memory_mb{320};
  uint32_t accesses_per_time_unit{1};
  uint32_t window_access_count{50};
  double ema_beta{0.85};
  int64_t base_q{2};
  double k{1.0};  // sensitivity of the quantum to the memory signal
  AccessPatternKind access_pattern{AccessPatternKind::Locality};
  double hotspot_frac{0.2};
  double hotspot_prob{0.8};
  std::optional<uint64_t> rng_seed;
  double normalization_eps{1e-9};
};

struct SliceObservation {
  int64_t run_time{0};
  uint64_t accesses{0};
  uint64_t page_faults{0};
  size_t working_set_size{0};
};

struct ProcessState {
  ProcessState(std::string pid, int64_t arrival, int64_t burst,
               uint32_t pages_count, PageAccessGenerator generator,
               size_t window_capacity);

  std::string pid;
  int64_t arrival;
  int64_t burst;
  int64_t remaining;
  uint32_t pages_count;
  PageAccessGenerator generator;
  WorkingSetWindow window;
  double ema{0.0};
  double mem_signal{0.0};
  std::optional<SliceObservation> last_obs;
};

// Signals are only meaningful while Fresh; any mutation makes them Stale.
enum class NormalizationState { Stale, Fresh };

// Per-run page-fault model. Owns every ProcessState it creates and the
// random source they are seeded from.
class MemoryPressureModel {
 public:
  explicit MemoryPressureModel(MemoryModelConfig config);

  // Non-copyable: a model belongs to exactly one simulation run.
  MemoryPressureModel(const MemoryPressureModel&) = delete;
  MemoryPressureModel& operator=(const MemoryPressureModel&) = delete;

  const ProcessState& create_process(
      const std::string& pid, int64_t arrival, int64_t burst,
      uint32_t pages_count,
      std::optional<AccessPatternKind> pattern = std::nullopt);

  // Simulates max(1, floor(accesses_per_time_unit * run_time)) references.
  SliceObservation observe_run(const std::string& pid, int64_t run_time);

  // ema = beta * ema + (1 - beta) * faults / accesses
  void update_signal(const std::string& pid, const SliceObservation& obs);

  // Rescales every process's signal against the largest ema. No-op when Fresh.
  void recompute_normalization();

  int64_t estimated_memory_mb(const std::string& pid) const;
  int64_t effective_quantum(const std::string& pid, int64_t base_q) const;

  const ProcessState& process(const std::string& pid) const;
  const std::vector<ProcessState>& processes() const { return processes_; }
  bool has_process(const std::string& pid) const { return index_.count(pid) > 0; }

  NormalizationState normalization_state() const { return normalization_; }
  uint64_t root_seed() const { return root_seed_; }
  const MemoryModelConfig& config() const { return config_; }

 private:
  ProcessState& mutable_process(const std::string& pid);

  MemoryModelConfig config_;
  uint64_t root_seed_;
  std::vector<ProcessState> processes_;  // creation order
  std::unordered_map<std::string, size_t> index_;
  NormalizationState normalization_{NormalizationState::Fresh};
};

}  // namespace memsched

#endif
