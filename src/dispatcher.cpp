#include "dispatcher.hpp"

#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

#include "console.hpp"
#include "report.hpp"
#include "scenarios.hpp"

namespace memsched {

namespace {

constexpr const char* kDefaultConfig = "config.txt";
constexpr const char* kDefaultReport = "memsched-log.txt";

void print_summary(const std::string& title, const SimulationResult& result) {
  std::ostringstream cpu;
  cpu << std::fixed << std::setprecision(2) << result.cpu_utilization;
  std::cout << title << ": total time " << result.total_time << ", CPU "
            << cpu.str() << "%, " << result.context_switches
            << " context switches" << std::endl;
}

void remember(Session& session, const std::string& title, SimulationResult result) {
  session.last_title = title;
  session.last_compare.reset();
  session.last_result = std::move(result);
}

void print_processes(const Session& session) {
  const SystemConfig& cfg = *session.config;
  std::cout << "Loaded from '" << session.config_path << "': "
            << cfg.processes.size() << " processes, quantum "
            << cfg.quantumCycles << "\n";
  std::cout << std::left << std::setw(12) << "PID" << std::right
            << std::setw(10) << "Arrival" << std::setw(10) << "Burst"
            << std::setw(10) << "Priority" << std::setw(10) << "Pages" << "\n";
  for (const auto& p : cfg.processes) {
    std::cout << std::left << std::setw(12) << p.pid << std::right
              << std::setw(10) << p.arrivalTime << std::setw(10) << p.burstTime
              << std::setw(10) << p.priority << std::setw(10) << p.pagesCount
              << "\n";
  }
  std::cout << std::left;
  if (session.last_memory_aware) {
    std::cout << "\nLast memory-aware run:\n";
    write_memory_table(std::cout, *session.last_memory_aware);
  }
  std::cout << std::flush;
}

}  // namespace

void dispatch(Commands cmd, const std::vector<std::string>& args, Session& session) {
  if (!session.config && cmd != Commands::Initialize && cmd != Commands::Exit &&
      cmd != Commands::Clear) {
    std::cout << "Error: System not initialized. Please run `initialize <config_file>` first."
              << std::endl;
    return;
  }

  switch (cmd) {
    case Commands::Initialize: {
      std::string path = args.empty() ? kDefaultConfig : args[0];
      try {
        session = Session{};
        session.config = SystemConfig::fromFile(path);
        session.config_path = path;
        std::cout << "System initialized from '" << path << "' with "
                  << session.config->processes.size() << " processes.\n";
      } catch (const std::exception& e) {
        std::cerr << "Error initializing config: " << e.what() << '\n';
      }
      break;
    }

    case Commands::Baseline: {
      SimulationResult result = simulate_baseline(*session.config);
      print_summary("Baseline", result);
      remember(session, "Baseline Round-Robin", std::move(result));
      break;
    }

    case Commands::MemoryAware: {
      SimulationResult result = simulate_memory_aware(*session.config);
      print_summary("Memory-aware", result);
      session.last_memory_aware = result;
      remember(session, "Memory-aware Round-Robin", std::move(result));
      break;
    }

    case Commands::Compare: {
      CompareBundle bundle = compare_schedulers(*session.config);
      print_summary("Baseline", bundle.baseline);
      print_summary("Memory-aware", bundle.memory_aware);
      session.last_memory_aware = bundle.memory_aware;
      session.last_result.reset();
      session.last_title = "Comparison";
      session.last_compare = std::move(bundle);
      break;
    }

    case Commands::ReportUtil: {
      std::string filename = args.empty() ? kDefaultReport : args[0];
      if (session.last_compare) {
        generate_report(filename, *session.last_compare);
      } else if (session.last_result) {
        generate_report(filename, session.last_title, *session.last_result);
      } else {
        std::cout << "Nothing to report yet. Run baseline, memory-aware or compare first."
                  << std::endl;
        break;
      }
      std::cout << "Report generated at " << filename << "!" << std::endl;
      break;
    }

    case Commands::ProcessSmi:
      print_processes(session);
      break;

    case Commands::Clear:
      std::cout << "\x1b[2J\x1b[H";
      console_prompt();
      break;

    case Commands::Exit:
      break;
  }
}

}  // namespace memsched
