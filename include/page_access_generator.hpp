#ifndef MEMSCHED_PAGE_ACCESS_GENERATOR_H_
#define MEMSCHED_PAGE_ACCESS_GENERATOR_H_

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <variant>

namespace memsched {

enum class AccessPatternKind { Random, Sequential, Locality };

std::optional<AccessPatternKind> access_pattern_from_string(std::string_view name);
std::string to_string(AccessPatternKind kind);

// Uniform draw over the whole address space on every call.
struct RandomPattern {};

// Walks the pages in order and wraps around.
struct SequentialPattern {
  uint64_t index = 0;
};

// A fixed hot window [start, start + size) hit with `probability`,
// otherwise a uniform draw over the whole address space.
struct LocalityPattern {
  uint32_t start = 0;
  uint32_t size = 1;
  double probability = 0.8;
};

using AccessPattern = std::variant<RandomPattern, SequentialPattern, LocalityPattern>;

// Produces an infinite, stateful stream of page references for one process.
class PageAccessGenerator {
 public:
  PageAccessGenerator(uint32_t pages_count, AccessPatternKind kind,
                      double hotspot_frac, double hotspot_prob,
                      std::mt19937 rng);

  // Next page index in [0, pages_count()).
  uint32_t next();

  uint32_t pages_count() const { return pages_count_; }
  AccessPatternKind kind() const;
  const AccessPattern& pattern() const { return pattern_; }

 private:
  uint32_t uniform_page();

  uint32_t pages_count_;
  AccessPattern pattern_;
  std::mt19937 rng_;
};

}  // namespace memsched

#endif
