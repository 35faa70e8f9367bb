#ifndef MEMSCHED_REPORT_H_
#define MEMSCHED_REPORT_H_

#include <ostream>
#include <string>

#include "simulation_result.hpp"

namespace memsched {

// Plain-text rendering. Output depends only on the result, so two equal
// results always render to identical bytes.
void write_report(std::ostream& out, const std::string& title,
                  const SimulationResult& result);

void write_compare_report(std::ostream& out, const CompareBundle& bundle);

// Per-process signal/quantum/memory table of a memory-aware result.
void write_memory_table(std::ostream& out, const SimulationResult& result);

// Writes to `filename`, throwing std::runtime_error if it cannot be opened.
void generate_report(const std::string& filename, const std::string& title,
                     const SimulationResult& result);
void generate_report(const std::string& filename, const CompareBundle& bundle);

}  // namespace memsched

#endif
