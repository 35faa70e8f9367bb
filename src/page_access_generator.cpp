#include "page_access_generator.hpp"

#include <algorithm>
#include <type_traits>

#include "numeric.hpp"

namespace memsched {

std::optional<AccessPatternKind> access_pattern_from_string(std::string_view name) {
  if (name == "random") return AccessPatternKind::Random;
  if (name == "sequential") return AccessPatternKind::Sequential;
  if (name == "locality") return AccessPatternKind::Locality;
  return std::nullopt;
}

std::string to_string(AccessPatternKind kind) {
  switch (kind) {
    case AccessPatternKind::Random:
      return "random";
    case AccessPatternKind::Sequential:
      return "sequential";
    case AccessPatternKind::Locality:
      return "locality";
  }
  return "locality";
}

PageAccessGenerator::PageAccessGenerator(uint32_t pages_count,
                                         AccessPatternKind kind,
                                         double hotspot_frac,
                                         double hotspot_prob,
                                         std::mt19937 rng)
    : pages_count_{std::max<uint32_t>(1u, pages_count)}, rng_{rng} {
  switch (kind) {
    case AccessPatternKind::Random:
      pattern_ = RandomPattern{};
      break;
    case AccessPatternKind::Sequential:
      pattern_ = SequentialPattern{};
      break;
    case AccessPatternKind::Locality: {
      auto size = std::clamp<int64_t>(round_to_int(pages_count_ * hotspot_frac),
                                      1, pages_count_);
      uint32_t max_start = pages_count_ - static_cast<uint32_t>(size);
      uint32_t start = 0;
      if (max_start > 0) {
        std::uniform_int_distribution<uint32_t> dist(0, max_start);
        start = dist(rng_);
      }
      pattern_ = LocalityPattern{start, static_cast<uint32_t>(size), hotspot_prob};
      break;
    }
  }
}

AccessPatternKind PageAccessGenerator::kind() const {
  if (std::holds_alternative<RandomPattern>(pattern_)) return AccessPatternKind::Random;
  if (std::holds_alternative<SequentialPattern>(pattern_)) return AccessPatternKind::Sequential;
  return AccessPatternKind::Locality;
}

uint32_t PageAccessGenerator::uniform_page() {
  std::uniform_int_distribution<uint32_t> dist(0, pages_count_ - 1);
  return dist(rng_);
}

uint32_t PageAccessGenerator::next() {
  return std::visit(
      [this](auto& p) -> uint32_t {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, RandomPattern>) {
          return uniform_page();
        } else if constexpr (std::is_same_v<T, SequentialPattern>) {
          auto page = static_cast<uint32_t>(p.index % pages_count_);
          ++p.index;
          return page;
        } else {
          std::uniform_real_distribution<double> coin(0.0, 1.0);
          if (coin(rng_) < p.probability) {
            std::uniform_int_distribution<uint32_t> offset(0, p.size - 1);
            return (p.start + offset(rng_)) % pages_count_;
          }
          return uniform_page();
        }
      },
      pattern_);
}

}  // namespace memsched
