#include "random_source.hpp"

namespace memsched {

uint64_t splitmix64(uint64_t x) {
  x += 0x9E3779B97F4A7C15ull;
  x = (x ^ (x >> 30)) * 0xBF58476D1CE4E5B9ull;
  x = (x ^ (x >> 27)) * 0x94D049BB133111EBull;
  return x ^ (x >> 31);
}

uint64_t derive_seed(uint64_t root, uint64_t stream) {
  return splitmix64(splitmix64(root) ^ (stream * 0xD1B54A32D192ED03ull + 1));
}

uint64_t fresh_seed() {
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}

std::mt19937 make_rng(uint64_t seed) {
  std::seed_seq seq{static_cast<uint32_t>(seed & 0xFFFFFFFFu),
                    static_cast<uint32_t>(seed >> 32)};
  return std::mt19937(seq);
}

}  // namespace memsched
