#include "commands.hpp"

#include <stdexcept>
#include <unordered_map>

namespace memsched {

Commands from_str(const std::string& name) {
  static const std::unordered_map<std::string, Commands> kCommands = {
      {"initialize", Commands::Initialize},
      {"baseline", Commands::Baseline},
      {"memory-aware", Commands::MemoryAware},
      {"compare", Commands::Compare},
      {"report-util", Commands::ReportUtil},
      {"process-smi", Commands::ProcessSmi},
      {"clear", Commands::Clear},
      {"exit", Commands::Exit},
  };
  auto it = kCommands.find(name);
  if (it == kCommands.end()) {
    throw std::invalid_argument("Unknown command '" + name + "'");
  }
  return it->second;
}

bool is_scenario(const std::string& name) {
  return name == "baseline" || name == "memory-aware" || name == "compare";
}

}  // namespace memsched
