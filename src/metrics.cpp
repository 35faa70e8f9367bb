#include "metrics.hpp"

#include <algorithm>
#include <tuple>
#include <unordered_map>

#include "numeric.hpp"

namespace memsched {

int64_t count_context_switches(const Timeline& timeline) {
  int64_t switches = 0;
  for (size_t i = 1; i < timeline.size(); ++i) {
    if (timeline[i].pid != timeline[i - 1].pid) {
      ++switches;
    }
  }
  return switches;
}

ProcessMetrics compute_metrics(const std::vector<std::string>& pids,
                               const TickMap& bursts, const Timeline& timeline,
                               const TickMap& arrivals) {
  ProcessMetrics metrics;
  for (const auto& pid : pids) {
    metrics.waiting[pid] = 0;
    metrics.turnaround[pid] = 0;
  }
  if (pids.empty() || timeline.empty()) {
    return metrics;
  }

  std::unordered_map<std::string, int64_t> completion;
  int64_t max_end = 0;
  for (const auto& slice : timeline) {
    auto [it, inserted] = completion.emplace(slice.pid, slice.end);
    if (!inserted) {
      it->second = std::max(it->second, slice.end);
    }
    max_end = std::max(max_end, slice.end);
  }
  metrics.total_time = max_end;

  double total_burst = 0.0;
  for (const auto& pid : pids) {
    auto it = bursts.find(pid);
    total_burst += it == bursts.end() ? 0.0 : it->second;
  }

  for (const auto& pid : pids) {
    auto done = completion.find(pid);
    if (done == completion.end()) {
      continue;
    }
    auto arr_it = arrivals.find(pid);
    auto burst_it = bursts.find(pid);
    int64_t arrival = clamp_non_negative_int(arr_it == arrivals.end() ? 0.0 : arr_it->second);
    double burst = burst_it == bursts.end() ? 0.0 : burst_it->second;

    double tat = static_cast<double>(done->second - arrival);
    metrics.turnaround[pid] = std::max<int64_t>(0, round_to_int(tat));
    metrics.waiting[pid] = std::max<int64_t>(0, round_to_int(tat - burst));
  }

  metrics.raw_cpu_utilization =
      metrics.total_time > 0
          ? total_burst / static_cast<double>(metrics.total_time) * 100.0
          : 0.0;
  return metrics;
}

std::vector<CpuSample> build_cpu_series(const Timeline& timeline,
                                        int64_t total_time) {
  std::vector<CpuSample> series;
  if (timeline.empty() || total_time <= 0) {
    return series;
  }

  std::vector<bool> occupied(static_cast<size_t>(total_time), false);
  for (const auto& slice : timeline) {
    if (slice.end <= slice.start) {
      continue;
    }
    int64_t first = std::max<int64_t>(0, slice.start);
    int64_t last = std::min(total_time, slice.end);
    for (int64_t t = first; t < last; ++t) {
      occupied[static_cast<size_t>(t)] = true;
    }
  }

  series.reserve(occupied.size());
  for (int64_t t = 0; t < total_time; ++t) {
    series.push_back(CpuSample{t, occupied[static_cast<size_t>(t)] ? 100 : 0});
  }
  return series;
}

double cpu_utilization_from_series(const std::vector<CpuSample>& series) {
  if (series.empty()) {
    return 0.0;
  }
  auto busy = std::count_if(series.begin(), series.end(),
                            [](const CpuSample& s) { return s.cpu > 0; });
  return static_cast<double>(busy) / static_cast<double>(series.size()) * 100.0;
}

std::vector<TraceEntry> generate_trace(const Timeline& timeline) {
  std::vector<TraceEntry> trace;
  trace.reserve(timeline.size() * 2);
  for (const auto& slice : timeline) {
    if (slice.start < slice.end) {
      trace.push_back(TraceEntry{slice.start, TraceEvent::Running, slice.pid});
      trace.push_back(TraceEntry{slice.end, TraceEvent::Stopped, slice.pid});
    }
  }

  auto order = [](const TraceEntry& e) { return e.event == TraceEvent::Stopped ? 0 : 1; };
  std::stable_sort(trace.begin(), trace.end(),
                   [&](const TraceEntry& a, const TraceEntry& b) {
                     int oa = order(a);
                     int ob = order(b);
                     return std::tie(a.time, oa, a.pid) < std::tie(b.time, ob, b.pid);
                   });
  return trace;
}

double average(const PerProcess& values) {
  if (values.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& [pid, value] : values) {
    sum += static_cast<double>(value);
  }
  return sum / static_cast<double>(values.size());
}

}  // namespace memsched
