#ifndef MEMSCHED_DISPATCHER_H_
#define MEMSCHED_DISPATCHER_H_

#include <optional>
#include <string>
#include <vector>

#include "commands.hpp"
#include "config.hpp"
#include "simulation_result.hpp"

namespace memsched {

// State carried between console commands.
struct Session {
  std::optional<SystemConfig> config;
  std::string config_path;

  // Most recent run, kept for report-util. Only one of the two is set.
  std::string last_title;
  std::optional<SimulationResult> last_result;
  std::optional<CompareBundle> last_compare;

  // Most recent memory-aware result, kept for process-smi.
  std::optional<SimulationResult> last_memory_aware;
};

void dispatch(Commands cmd, const std::vector<std::string>& args, Session& session);

}  // namespace memsched

#endif
