#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config.hpp"
#include "report.hpp"
#include "scenarios.hpp"

using namespace memsched;

namespace {

SystemConfig example_config() {
    SystemConfig cfg;
    cfg.quantumCycles = 2;
    cfg.rngSeed = 7;
    cfg.processes = {
        {"P1", 0, 8, 0, 100},
        {"P2", 3, 5, 0, 100},
        {"P3", 5, 2, 0, 100},
    };
    return cfg;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

void test_baseline_report() {
    std::ostringstream oss;
    write_report(oss, "Baseline Round-Robin", simulate_baseline(example_config()));
    std::string text = oss.str();

    assert(contains(text, "== Baseline Round-Robin ==\n"));
    assert(contains(text, "Total time: 15\n"));
    assert(contains(text, "CPU utilization: 100.00%\n"));
    assert(contains(text, "Context switches: 6\n"));
    assert(contains(text, "Average waiting time: 5.33\n"));
    assert(contains(text, "Average turnaround time: 10.33\n"));
    assert(contains(text, "Timeline (8 slices):\n"
                          "  P1[0,2) P1[2,4) P2[4,6) P1[6,8) P3[8,10) P2[10,12) P1[12,14) P2[14,15)\n"));
    assert(contains(text, "     0 ###############\n"));
    assert(contains(text, "  t=2 stopped P1\n  t=2 running P1\n"));
    assert(contains(text, "  avg_wait: 5.33\n"));

    // The baseline run has no memory estimates.
    std::istringstream lines(text);
    std::string line;
    bool saw_row = false;
    while (std::getline(lines, line)) {
        if (line.rfind("P3 ", 0) == 0) {
            saw_row = true;
            assert(line.back() == '-');
        }
    }
    assert(saw_row);
    std::cout << "Baseline report rendered." << std::endl;
}

void test_idle_strip() {
    SystemConfig cfg;
    cfg.quantumCycles = 3;
    cfg.processes = {{"A", 2, 2, 0, 1}};
    std::ostringstream oss;
    write_report(oss, "idle", simulate_baseline(cfg));
    std::string text = oss.str();
    assert(contains(text, "     0 ..##\n"));
    assert(contains(text, "CPU utilization: 50.00%\n"));
    std::cout << "Idle ticks shown in the CPU strip." << std::endl;
}

void test_compare_report() {
    SystemConfig cfg = example_config();
    std::ostringstream oss;
    write_compare_report(oss, compare_schedulers(cfg));
    std::string text = oss.str();
    assert(contains(text, "== Baseline Round-Robin =="));
    assert(contains(text, "== Memory-aware Round-Robin =="));
    assert(contains(text, "== Memory-aware vs baseline =="));
    assert(contains(text, "  mem_signals: {P1="));
    assert(contains(text, "  memory_quanta: {"));

    std::ostringstream table;
    write_memory_table(table, simulate_memory_aware(cfg));
    assert(contains(table.str(), "Signal"));
    assert(contains(table.str(), "P2"));
    std::cout << "Comparison report rendered." << std::endl;
}

void test_generate_report_file() {
    SystemConfig cfg = example_config();
    auto path = std::filesystem::temp_directory_path() / "memsched_test_report.txt";
    SimulationResult result = simulate_baseline(cfg);
    generate_report(path.string(), "Baseline Round-Robin", result);

    std::ostringstream expected;
    write_report(expected, "Baseline Round-Robin", result);
    assert(read_file(path) == expected.str());
    std::filesystem::remove(path);

    bool thrown = false;
    try {
        generate_report((std::filesystem::temp_directory_path() / "no-such-dir" / "r.txt").string(),
                        compare_schedulers(cfg));
    } catch (const std::runtime_error& e) {
        thrown = contains(e.what(), "Cannot open report file");
    }
    assert(thrown);
    std::cout << "Report files written." << std::endl;
}

void run_tests() {
    std::cout << "Starting report tests..." << std::endl;
    test_baseline_report();
    test_idle_strip();
    test_compare_report();
    test_generate_report_file();
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
