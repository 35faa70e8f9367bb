#ifndef MEMSCHED_COMMANDS_H_
#define MEMSCHED_COMMANDS_H_

#include <string>

namespace memsched {

enum class Commands {
  Initialize,
  Baseline,
  MemoryAware,
  Compare,
  ReportUtil,
  ProcessSmi,
  Clear,
  Exit
};

// Throws std::invalid_argument for an unknown command name.
Commands from_str(const std::string& name);

// True for the names accepted by the one-shot command line.
bool is_scenario(const std::string& name);

}  // namespace memsched

#endif
