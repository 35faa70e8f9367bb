#include "memory_pressure_model.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include "quantum_estimator.hpp"
#include "random_source.hpp"

namespace memsched {

ProcessState::ProcessState(std::string pid, int64_t arrival, int64_t burst,
                           uint32_t pages_count, PageAccessGenerator generator,
                           size_t window_capacity)
    : pid(std::move(pid)),
      arrival(arrival),
      burst(burst),
      remaining(burst),
      pages_count(pages_count),
      generator(std::move(generator)),
      window(window_capacity) {}

MemoryPressureModel::MemoryPressureModel(MemoryModelConfig config)
    : config_(std::move(config)),
      root_seed_(config_.rng_seed ? *config_.rng_seed : fresh_seed()) {}

const ProcessState& MemoryPressureModel::create_process(
    const std::string& pid, int64_t arrival, int64_t burst,
    uint32_t pages_count, std::optional<AccessPatternKind> pattern) {
  if (has_process(pid)) {
    throw DuplicateProcessError(pid);
  }
  uint32_t pages = std::max<uint32_t>(1u, pages_count);
  size_t idx = processes_.size();

  PageAccessGenerator generator(pages, pattern.value_or(config_.access_pattern),
                                config_.hotspot_frac, config_.hotspot_prob,
                                make_rng(derive_seed(root_seed_, idx)));

  processes_.emplace_back(pid, arrival, burst, pages, std::move(generator),
                          config_.window_access_count);
  index_.emplace(pid, idx);
  normalization_ = NormalizationState::Stale;
  return processes_.back();
}

SliceObservation MemoryPressureModel::observe_run(const std::string& pid,
                                                  int64_t run_time) {
  ProcessState& proc = mutable_process(pid);

  double scaled = static_cast<double>(config_.accesses_per_time_unit) *
                  static_cast<double>(run_time);
  uint64_t accesses = 1;
  if (std::isfinite(scaled) && scaled >= 1.0) {
    accesses = static_cast<uint64_t>(std::floor(scaled));
  }

  uint64_t faults = 0;
  for (uint64_t i = 0; i < accesses; ++i) {
    if (proc.window.reference(proc.generator.next())) {
      ++faults;
    }
  }

  SliceObservation obs{run_time, accesses, faults, proc.window.working_set_size()};
  proc.last_obs = obs;
  normalization_ = NormalizationState::Stale;
  return obs;
}

void MemoryPressureModel::update_signal(const std::string& pid,
                                        const SliceObservation& obs) {
  ProcessState& proc = mutable_process(pid);
  double observed = obs.accesses > 0 ? static_cast<double>(obs.page_faults) /
                                           static_cast<double>(obs.accesses)
                                     : 0.0;
  proc.ema = config_.ema_beta * proc.ema + (1.0 - config_.ema_beta) * observed;
  normalization_ = NormalizationState::Stale;
}

void MemoryPressureModel::recompute_normalization() {
  if (normalization_ == NormalizationState::Fresh) {
    return;
  }
  double max_ema = 0.0;
  for (const auto& proc : processes_) {
    max_ema = std::max(max_ema, proc.ema);
  }
  for (auto& proc : processes_) {
    proc.mem_signal = max_ema > config_.normalization_eps ? proc.ema / max_ema : 0.0;
  }
  normalization_ = NormalizationState::Fresh;
}

int64_t MemoryPressureModel::estimated_memory_mb(const std::string& pid) const {
  return memsched::estimated_memory_mb(process(pid).mem_signal,
                                       config_.min_memory_mb,
                                       config_.max_memory_mb);
}

int64_t MemoryPressureModel::effective_quantum(const std::string& pid,
                                               int64_t base_q) const {
  return memsched::effective_quantum(process(pid).mem_signal, base_q, config_.k);
}

const ProcessState& MemoryPressureModel::process(const std::string& pid) const {
  auto it = index_.find(pid);
  if (it == index_.end()) {
    throw UnknownProcessError(pid);
  }
  return processes_[it->second];
}

ProcessState& MemoryPressureModel::mutable_process(const std::string& pid) {
  auto it = index_.find(pid);
  if (it == index_.end()) {
    throw UnknownProcessError(pid);
  }
  return processes_[it->second];
}

}  // namespace memsched
