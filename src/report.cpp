#include "report.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace memsched {

namespace {

constexpr size_t kSlicesPerLine = 8;
constexpr size_t kTicksPerLine = 60;

std::string fixed2(double value) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(2) << value;
  return oss.str();
}

std::string general6(double value) {
  std::ostringstream oss;
  oss << std::setprecision(6) << value;
  return oss.str();
}

double meta_scalar(const SimulationResult& result, const std::string& key) {
  auto it = result.meta.find(key);
  if (it == result.meta.end()) {
    return 0.0;
  }
  if (const double* v = std::get_if<double>(&it->second)) {
    return *v;
  }
  return 0.0;
}

std::string lookup_or_dash(const PerProcess& values, const std::string& pid) {
  auto it = values.find(pid);
  return it == values.end() ? "-" : std::to_string(it->second);
}

void write_timeline(std::ostream& out, const Timeline& timeline) {
  out << "Timeline (" << timeline.size() << " slices):\n";
  for (size_t i = 0; i < timeline.size(); ++i) {
    const auto& s = timeline[i];
    out << (i % kSlicesPerLine == 0 ? "  " : " ")
        << s.pid << "[" << s.start << "," << s.end << ")";
    if (i % kSlicesPerLine == kSlicesPerLine - 1 || i + 1 == timeline.size()) {
      out << "\n";
    }
  }
}

void write_cpu_strip(std::ostream& out, const std::vector<CpuSample>& series) {
  out << "CPU occupancy (# busy, . idle):\n";
  for (size_t i = 0; i < series.size(); ++i) {
    if (i % kTicksPerLine == 0) {
      out << "  " << std::setw(6) << series[i].time << " ";
    }
    out << (series[i].cpu > 0 ? '#' : '.');
    if (i % kTicksPerLine == kTicksPerLine - 1 || i + 1 == series.size()) {
      out << "\n";
    }
  }
}

void write_meta(std::ostream& out, const SimulationResult& result) {
  out << "Meta:\n";
  for (const auto& [key, value] : result.meta) {
    out << "  " << key << ": ";
    if (const double* scalar = std::get_if<double>(&value)) {
      out << fixed2(*scalar) << "\n";
      continue;
    }
    const auto& per_process = std::get<PerProcessReal>(value);
    out << "{";
    bool first = true;
    for (const auto& [pid, v] : per_process) {
      out << (first ? "" : ", ") << pid << "=" << general6(v);
      first = false;
    }
    out << "}\n";
  }
}

}  // namespace

void write_report(std::ostream& out, const std::string& title,
                  const SimulationResult& result) {
  out << "== " << title << " ==\n";
  out << "Total time: " << result.total_time << "\n";
  out << "CPU utilization: " << fixed2(result.cpu_utilization) << "%\n";
  out << "Context switches: " << result.context_switches << "\n";
  out << "Average waiting time: " << fixed2(meta_scalar(result, "avg_wait")) << "\n";
  out << "Average turnaround time: " << fixed2(meta_scalar(result, "avg_turnaround"))
      << "\n\n";

  out << std::left << std::setw(12) << "PID" << std::right << std::setw(10)
      << "Quantum" << std::setw(10) << "Waiting" << std::setw(12)
      << "Turnaround" << std::setw(12) << "Memory MB" << "\n";
  for (const auto& pid : result.pids) {
    out << std::left << std::setw(12) << pid << std::right << std::setw(10)
        << lookup_or_dash(result.inferred_quanta, pid) << std::setw(10)
        << lookup_or_dash(result.waiting_times, pid) << std::setw(12)
        << lookup_or_dash(result.turnaround_times, pid) << std::setw(12)
        << lookup_or_dash(result.memory_estimates, pid) << "\n";
  }
  out << "\n";

  write_timeline(out, result.timeline);
  write_cpu_strip(out, result.cpu_series);

  out << "Trace:\n";
  for (const auto& entry : result.trace) {
    out << "  t=" << entry.time << " " << to_string(entry.event) << " "
        << entry.pid << "\n";
  }
  write_meta(out, result);
}

void write_memory_table(std::ostream& out, const SimulationResult& result) {
  const PerProcessReal* signals = nullptr;
  auto it = result.meta.find("mem_signals");
  if (it != result.meta.end()) {
    signals = std::get_if<PerProcessReal>(&it->second);
  }

  out << std::left << std::setw(12) << "PID" << std::right << std::setw(10)
      << "Signal" << std::setw(10) << "Quantum" << std::setw(12)
      << "Memory MB" << "\n";
  for (const auto& pid : result.pids) {
    std::string signal = "-";
    if (signals) {
      auto s = signals->find(pid);
      if (s != signals->end()) {
        signal = fixed2(s->second);
      }
    }
    out << std::left << std::setw(12) << pid << std::right << std::setw(10)
        << signal << std::setw(10) << lookup_or_dash(result.inferred_quanta, pid)
        << std::setw(12) << lookup_or_dash(result.memory_estimates, pid) << "\n";
  }
}

void write_compare_report(std::ostream& out, const CompareBundle& bundle) {
  write_report(out, "Baseline Round-Robin", bundle.baseline);
  out << "\n";
  write_report(out, "Memory-aware Round-Robin", bundle.memory_aware);
  out << "\n";

  const auto& b = bundle.baseline;
  const auto& m = bundle.memory_aware;
  auto delta = [](double after, double before) {
    std::string sign = after - before >= 0.0 ? "+" : "";
    return sign + fixed2(after - before);
  };

  out << "== Memory-aware vs baseline ==\n";
  out << "Average waiting time: "
      << delta(meta_scalar(m, "avg_wait"), meta_scalar(b, "avg_wait")) << "\n";
  out << "Average turnaround time: "
      << delta(meta_scalar(m, "avg_turnaround"), meta_scalar(b, "avg_turnaround"))
      << "\n";
  out << "CPU utilization: " << delta(m.cpu_utilization, b.cpu_utilization) << "%\n";
  out << "Context switches: "
      << delta(static_cast<double>(m.context_switches),
               static_cast<double>(b.context_switches))
      << "\n";
  out << "Total time: "
      << delta(static_cast<double>(m.total_time), static_cast<double>(b.total_time))
      << "\n";
}

void generate_report(const std::string& filename, const std::string& title,
                     const SimulationResult& result) {
  std::ofstream report_file(filename);
  if (!report_file.is_open()) {
    throw std::runtime_error("Cannot open report file: " + filename);
  }
  write_report(report_file, title, result);
}

void generate_report(const std::string& filename, const CompareBundle& bundle) {
  std::ofstream report_file(filename);
  if (!report_file.is_open()) {
    throw std::runtime_error("Cannot open report file: " + filename);
  }
  write_compare_report(report_file, bundle);
}

}  // namespace memsched
