#ifndef MEMSCHED_RANDOM_SOURCE_H_
#define MEMSCHED_RANDOM_SOURCE_H_

#include <cstdint>
#include <random>

namespace memsched {

uint64_t splitmix64(uint64_t x);

// Independent sub-seed for stream `stream` of a run seeded with `root`.
uint64_t derive_seed(uint64_t root, uint64_t stream);

// Non-reproducible seed, used when the configuration carries none.
uint64_t fresh_seed();

std::mt19937 make_rng(uint64_t seed);

}  // namespace memsched

#endif
