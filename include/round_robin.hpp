#ifndef MEMSCHED_ROUND_ROBIN_H_
#define MEMSCHED_ROUND_ROBIN_H_

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace memsched {

// One uninterrupted run of `pid` over the half-open interval [start, end).
struct Slice {
  std::string pid;
  int64_t start;
  int64_t end;

  int64_t duration() const { return end - start; }
  bool operator==(const Slice& other) const = default;
};

using Timeline = std::vector<Slice>;

// Values are coerced before use: bursts and arrivals to non-negative
// integers, quanta to integers >= 1. Missing entries default to burst 0,
// arrival 0, quantum 1.
using TickMap = std::unordered_map<std::string, double>;

// Single-CPU Round-Robin over a FIFO ready queue with a frozen quantum per
// process. Simultaneous arrivals are admitted in pid order.
Timeline simulate_round_robin(const std::vector<std::string>& pids,
                              const TickMap& bursts, const TickMap& quanta,
                              const TickMap& arrivals);

}  // namespace memsched

#endif
