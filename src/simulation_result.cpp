#include "simulation_result.hpp"

namespace memsched {

std::string to_string(TraceEvent event) {
  return event == TraceEvent::Running ? "running" : "stopped";
}

}  // namespace memsched
