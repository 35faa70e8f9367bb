#include "config.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <unordered_set>

#include "parser.hpp"

namespace memsched {

namespace {

std::string where(const std::string& source, size_t line_no) {
  return source + ":" + std::to_string(line_no);
}

int64_t parse_int(const std::string& value, const std::string& key) {
  try {
    size_t pos = 0;
    long long parsed = std::stoll(value, &pos);
    if (pos != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    throw ConfigError("'" + key + "' expects an integer, got '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError("'" + key + "' is out of range: " + value);
  }
}

uint32_t parse_count(const std::string& value, const std::string& key) {
  int64_t parsed = parse_int(value, key);
  if (parsed < 0 || parsed > std::numeric_limits<uint32_t>::max()) {
    throw ConfigError("'" + key + "' must be between 0 and " +
                      std::to_string(std::numeric_limits<uint32_t>::max()) +
                      ", got " + value);
  }
  return static_cast<uint32_t>(parsed);
}

// Full uint64 range; stoull would silently wrap a leading '-'.
uint64_t parse_seed(const std::string& value, const std::string& key) {
  if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
    throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
  }
  try {
    size_t pos = 0;
    unsigned long long parsed = std::stoull(value, &pos);
    if (pos != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    throw ConfigError("'" + key + "' expects a non-negative integer, got '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError("'" + key + "' is out of range: " + value);
  }
}

double parse_real(const std::string& value, const std::string& key) {
  try {
    size_t pos = 0;
    double parsed = std::stod(value, &pos);
    if (pos != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::invalid_argument&) {
    throw ConfigError("'" + key + "' expects a number, got '" + value + "'");
  } catch (const std::out_of_range&) {
    throw ConfigError("'" + key + "' is out of range: " + value);
  }
}

bool parse_flag(const std::string& value, const std::string& key) {
  if (value == "true" || value == "1" || value == "on" || value == "yes") return true;
  if (value == "false" || value == "0" || value == "off" || value == "no") return false;
  throw ConfigError("'" + key + "' expects true or false, got '" + value + "'");
}

ProcessSpec parse_process(const std::vector<std::string>& tokens) {
  if (tokens.size() < 4 || tokens.size() > 6) {
    throw ConfigError("'process' expects PID ARRIVAL BURST [PRIORITY] [PAGES]");
  }
  ProcessSpec spec;
  spec.pid = tokens[1];
  spec.arrivalTime = parse_int(tokens[2], "process " + spec.pid + " arrival");
  spec.burstTime = parse_int(tokens[3], "process " + spec.pid + " burst");
  if (tokens.size() > 4) {
    spec.priority = parse_int(tokens[4], "process " + spec.pid + " priority");
  }
  if (tokens.size() > 5) {
    spec.pagesCount = parse_count(tokens[5], "process " + spec.pid + " pages");
  }
  return spec;
}

void check_unit_interval(double value, const std::string& key) {
  if (!(value >= 0.0 && value <= 1.0)) {
    throw ConfigError("'" + key + "' must be within [0, 1], got " + std::to_string(value));
  }
}

}  // namespace

void SystemConfig::validate() const {
  if (processes.empty()) {
    throw ConfigError("at least one process is required");
  }
  if (quantumCycles < 1 || quantumCycles > kMaxQuantumCycles) {
    throw ConfigError("'quantum-cycles' must be between 1 and " +
                      std::to_string(kMaxQuantumCycles) + ", got " +
                      std::to_string(quantumCycles));
  }
  if (adaptationRounds < 1) {
    throw ConfigError("'adaptation-rounds' must be at least 1");
  }

  std::unordered_set<std::string> seen;
  for (const auto& p : processes) {
    if (p.pid.empty()) {
      throw ConfigError("process id must not be empty");
    }
    if (!seen.insert(p.pid).second) {
      throw ConfigError("duplicate process id '" + p.pid + "'");
    }
    if (p.arrivalTime < 0) {
      throw ConfigError("process '" + p.pid + "' has negative arrival time " +
                        std::to_string(p.arrivalTime));
    }
    if (p.burstTime < 0) {
      throw ConfigError("process '" + p.pid + "' has negative burst time " +
                        std::to_string(p.burstTime));
    }
  }

  const auto& mm = memoryModel;
  if (mm.window_access_count < 1) {
    throw ConfigError("'window-size' must be at least 1");
  }
  if (mm.accesses_per_time_unit < 1) {
    throw ConfigError("'accesses-per-unit' must be at least 1");
  }
  if (!(std::fabs(mm.k) <= kMaxSensitivity)) {
    throw ConfigError("'sensitivity' must be finite with magnitude at most " +
                      std::to_string(static_cast<int64_t>(kMaxSensitivity)));
  }
  check_unit_interval(mm.ema_beta, "ema-beta");
  check_unit_interval(mm.hotspot_frac, "hotspot-frac");
  check_unit_interval(mm.hotspot_prob, "hotspot-prob");
  if (mm.min_memory_mb < 0 || mm.min_memory_mb > mm.max_memory_mb) {
    throw ConfigError("memory bounds must satisfy 0 <= min-memory-mb <= max-memory-mb");
  }
  if (!(mm.normalization_eps >= 0.0)) {
    throw ConfigError("'normalization-eps' must not be negative");
  }
}

std::vector<std::string> SystemConfig::pids() const {
  std::vector<std::string> out;
  out.reserve(processes.size());
  for (const auto& p : processes) {
    out.push_back(p.pid);
  }
  return out;
}

SystemConfig SystemConfig::fromStream(std::istream& in, const std::string& source) {
  SystemConfig cfg;
  std::string line;
  size_t line_no = 0;

  while (std::getline(in, line)) {
    ++line_no;
    auto tokens = ParseTokens(line);
    if (tokens.empty()) continue;

    const std::string& key = tokens[0];
    try {
      if (key == "process") {
        cfg.processes.push_back(parse_process(tokens));
        continue;
      }
      if (tokens.size() != 2) {
        throw ConfigError("'" + key + "' expects exactly one value");
      }
      const std::string& value = tokens[1];

      if (key == "total-frames") {
        cfg.totalFrames = parse_count(value, key);
      } else if (key == "page-size") {
        cfg.pageSize = parse_count(value, key);
      } else if (key == "quantum-cycles") {
        cfg.quantumCycles = parse_int(value, key);
      } else if (key == "memory-threshold") {
        cfg.memoryThreshold = parse_real(value, key);
      } else if (key == "idle-gap") {
        cfg.idleGap = parse_count(value, key);
      } else if (key == "rng-seed") {
        cfg.rngSeed = parse_seed(value, key);
      } else if (key == "adaptation-rounds") {
        cfg.adaptationRounds = parse_count(value, key);
      } else if (key == "randomize-access-patterns") {
        cfg.randomizeAccessPatterns = parse_flag(value, key);
      } else if (key == "access-pattern") {
        auto kind = access_pattern_from_string(value);
        if (!kind) {
          throw ConfigError("unknown access pattern '" + value +
                            "' (expected random, sequential or locality)");
        }
        cfg.memoryModel.access_pattern = *kind;
      } else if (key == "window-size") {
        cfg.memoryModel.window_access_count = parse_count(value, key);
      } else if (key == "ema-beta") {
        cfg.memoryModel.ema_beta = parse_real(value, key);
      } else if (key == "sensitivity") {
        cfg.memoryModel.k = parse_real(value, key);
      } else if (key == "accesses-per-unit") {
        cfg.memoryModel.accesses_per_time_unit = parse_count(value, key);
      } else if (key == "hotspot-frac") {
        cfg.memoryModel.hotspot_frac = parse_real(value, key);
      } else if (key == "hotspot-prob") {
        cfg.memoryModel.hotspot_prob = parse_real(value, key);
      } else if (key == "min-memory-mb") {
        cfg.memoryModel.min_memory_mb = parse_int(value, key);
      } else if (key == "max-memory-mb") {
        cfg.memoryModel.max_memory_mb = parse_int(value, key);
      } else if (key == "page-size-mb") {
        cfg.memoryModel.page_size_mb = parse_count(value, key);
      } else if (key == "normalization-eps") {
        cfg.memoryModel.normalization_eps = parse_real(value, key);
      } else {
        std::cerr << "Warning: " << where(source, line_no)
                  << ": ignoring unknown key '" << key << "'" << std::endl;
      }
    } catch (const ConfigError& e) {
      throw ConfigError(where(source, line_no) + ": " + e.detail());
    }
  }

  cfg.validate();
  return cfg;
}

SystemConfig SystemConfig::fromFile(const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in) {
    throw ConfigError("cannot open file: " + file.string());
  }
  return fromStream(in, file.string());
}

}  // namespace memsched
