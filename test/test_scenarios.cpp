#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <sstream>
#include <string>

#include "config.hpp"
#include "metrics.hpp"
#include "report.hpp"
#include "scenarios.hpp"

using namespace memsched;

namespace {

bool close(double a, double b) { return std::fabs(a - b) < 1e-9; }

SystemConfig example_config() {
    SystemConfig cfg;
    cfg.totalFrames = 64;
    cfg.pageSize = 4;
    cfg.quantumCycles = 2;
    cfg.memoryThreshold = 2.0;
    cfg.idleGap = 1;
    cfg.processes = {
        {"P1", 0, 8, 0, 100},
        {"P2", 3, 5, 0, 100},
        {"P3", 5, 2, 0, 100},
    };
    return cfg;
}

std::string render(const SimulationResult& result) {
    std::ostringstream oss;
    write_report(oss, "run", result);
    return oss.str();
}

double meta_scalar(const SimulationResult& r, const std::string& key) {
    return std::get<double>(r.meta.at(key));
}

void check_consistency(const SimulationResult& r, const SystemConfig& cfg) {
    std::map<std::string, int64_t> consumed;
    for (const auto& s : r.timeline) {
        assert(s.end > s.start);
        consumed[s.pid] += s.duration();
    }
    for (const auto& p : cfg.processes) {
        assert(consumed[p.pid] == p.burstTime);
        if (consumed[p.pid] > 0) {
            assert(r.waiting_times.at(p.pid) + p.burstTime == r.turnaround_times.at(p.pid));
        }
    }
    assert(static_cast<int64_t>(r.cpu_series.size()) == r.total_time);
    assert(r.trace.size() == 2 * r.timeline.size());
    assert(r.context_switches == count_context_switches(r.timeline));
}

}  // namespace

void test_baseline() {
    SystemConfig cfg = example_config();
    SimulationResult r = simulate_baseline(cfg);

    assert(r.total_time == 15);
    assert(r.context_switches == 6);
    assert(close(r.cpu_utilization, 100.0));
    assert(r.waiting_times.at("P1") == 6);
    assert(r.waiting_times.at("P2") == 7);
    assert(r.waiting_times.at("P3") == 3);
    assert(r.turnaround_times.at("P1") == 14);
    assert(r.turnaround_times.at("P2") == 12);
    assert(r.turnaround_times.at("P3") == 5);
    assert(r.memory_estimates.empty());
    for (const auto& [pid, q] : r.inferred_quanta) {
        assert(q == 2);
    }
    assert(r.inferred_quanta.size() == 3);
    assert(r.trace.size() == 16);
    assert(close(meta_scalar(r, "avg_wait"), 16.0 / 3.0));
    assert(close(meta_scalar(r, "avg_turnaround"), 31.0 / 3.0));
    check_consistency(r, cfg);
    std::cout << "Baseline scenario verified." << std::endl;
}

void test_memory_aware_bounds() {
    SystemConfig cfg = example_config();
    cfg.rngSeed = 42;
    SimulationResult r = simulate_memory_aware(cfg);
    check_consistency(r, cfg);

    const auto& signals = std::get<PerProcessReal>(r.meta.at("mem_signals"));
    assert(signals.size() == 3);
    double max_signal = 0.0;
    for (const auto& [pid, s] : signals) {
        assert(s >= 0.0 && s <= 1.0);
        max_signal = std::max(max_signal, s);
    }
    // Every pattern faults on its first references, so some ema is positive
    // and the population maximum normalizes to exactly one.
    assert(max_signal == 1.0);

    for (const auto& pid : r.pids) {
        int64_t q = r.inferred_quanta.at(pid);
        assert(q >= 2 && q <= 4);
        int64_t mb = r.memory_estimates.at(pid);
        assert(mb >= 8 && mb <= 320);
        const auto& dumped = std::get<PerProcessReal>(r.meta.at("memory_quanta"));
        assert(dumped.at(pid) == static_cast<double>(q));
    }
    assert(r.meta.count("memory_estimates") == 1);
    std::cout << "Memory-aware quanta and estimates within bounds." << std::endl;
}

void test_memory_aware_reproducible() {
    SystemConfig cfg = example_config();
    cfg.rngSeed = 1234;
    cfg.processes.push_back({"P4", 1, 9, 0, 1});
    cfg.processes.push_back({"P5", 2, 4, 0, 0});

    std::string first = render(simulate_memory_aware(cfg));
    std::string second = render(simulate_memory_aware(cfg));
    assert(first == second);

    std::ostringstream a;
    std::ostringstream b;
    write_compare_report(a, compare_schedulers(cfg));
    write_compare_report(b, compare_schedulers(cfg));
    assert(a.str() == b.str());
    std::cout << "Same seed renders byte-identical reports." << std::endl;
}

void test_uniform_pressure() {
    // Identical deterministic workloads see identical fault rates, so every
    // signal normalizes to one and every quantum doubles.
    SystemConfig cfg = example_config();
    cfg.rngSeed = 9;
    cfg.randomizeAccessPatterns = false;
    cfg.memoryModel.access_pattern = AccessPatternKind::Sequential;
    for (auto& p : cfg.processes) {
        p.pagesCount = 5;
    }
    SimulationResult r = simulate_memory_aware(cfg);
    for (const auto& pid : r.pids) {
        assert(r.inferred_quanta.at(pid) == 4);
        assert(r.memory_estimates.at(pid) == 320);
    }
    check_consistency(r, cfg);

    // quantum 4: P1[0,4) P2[4,8) P1[8,12) P3[12,14) P2[14,15)
    Timeline expected = {
        {"P1", 0, 4}, {"P2", 4, 8}, {"P1", 8, 12}, {"P3", 12, 14}, {"P2", 14, 15},
    };
    assert(r.timeline == expected);
    assert(r.total_time == 15);
    assert(r.context_switches == 4);
    std::cout << "Uniform pressure doubles every quantum." << std::endl;
}

void test_compare_pairs_both() {
    SystemConfig cfg = example_config();
    cfg.rngSeed = 42;
    CompareBundle bundle = compare_schedulers(cfg);
    assert(render(bundle.baseline) == render(simulate_baseline(cfg)));
    assert(render(bundle.memory_aware) == render(simulate_memory_aware(cfg)));
    assert(bundle.baseline.memory_estimates.empty());
    assert(!bundle.memory_aware.memory_estimates.empty());
    std::cout << "Compare pairs both scenarios." << std::endl;
}

void test_largest_quantum() {
    SystemConfig cfg;
    cfg.quantumCycles = kMaxQuantumCycles;
    cfg.rngSeed = 3;
    cfg.adaptationRounds = 1;
    cfg.processes = {{"P1", 0, 3, 0, 8}};

    SimulationResult baseline = simulate_baseline(cfg);
    Timeline expected = {{"P1", 0, 3}};
    assert(baseline.timeline == expected);
    assert(baseline.inferred_quanta.at("P1") == kMaxQuantumCycles);

    SimulationResult aware = simulate_memory_aware(cfg);
    assert(aware.timeline == expected);
    assert(aware.inferred_quanta.at("P1") >= kMaxQuantumCycles);
    std::cout << "Largest quantum runs the burst in one slice." << std::endl;
}

void test_rejects_invalid() {
    SystemConfig cfg = example_config();
    cfg.processes.clear();
    bool thrown = false;
    try {
        simulate_baseline(cfg);
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);

    cfg = example_config();
    cfg.quantumCycles = 0;
    thrown = false;
    try {
        simulate_memory_aware(cfg);
    } catch (const ConfigError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "Invalid configurations rejected before simulation." << std::endl;
}

void run_tests() {
    std::cout << "Starting scenario tests..." << std::endl;
    test_baseline();
    test_memory_aware_bounds();
    test_memory_aware_reproducible();
    test_uniform_pressure();
    test_compare_pairs_both();
    test_largest_quantum();
    test_rejects_invalid();
    std::cout << "All tests passed!" << std::endl;
}

int main() {
    try {
        run_tests();
    } catch (const std::exception& e) {
        std::cerr << "An exception occurred: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
