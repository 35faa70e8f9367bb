#ifndef MEMSCHED_CONFIG_H_
#define MEMSCHED_CONFIG_H_

#include <cstdint>
#include <filesystem>
#include <istream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "memory_pressure_model.hpp"

namespace memsched {

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& detail)
      : std::runtime_error("Configuration error: " + detail), detail_(detail) {}

  const std::string& detail() const { return detail_; }

 private:
  std::string detail_;
};

// Upper bounds that keep the memory-aware adaptation loop finite.
inline constexpr int64_t kMaxQuantumCycles = 1000000;
inline constexpr double kMaxSensitivity = 1000.0;

struct ProcessSpec {
  std::string pid;
  int64_t arrivalTime{0};
  int64_t burstTime{0};
  int64_t priority{0};     // carried through, not used for scheduling
  uint32_t pagesCount{1};  // <= 1 means "not given"
};

struct SystemConfig {
  uint32_t totalFrames{64};
  uint32_t pageSize{4};
  int64_t quantumCycles{2};
  std::optional<double> memoryThreshold;
  uint32_t idleGap{1};

  // memory-aware run
  std::optional<uint64_t> rngSeed;
  uint32_t adaptationRounds{16};
  bool randomizeAccessPatterns{true};
  MemoryModelConfig memoryModel;

  std::vector<ProcessSpec> processes;

  // Throws ConfigError naming the first offending field or process.
  void validate() const;

  std::vector<std::string> pids() const;

  static SystemConfig fromStream(std::istream& in,
                                 const std::string& source = "<stream>");
  static SystemConfig fromFile(const std::filesystem::path& file);
};

}  // namespace memsched

#endif
