#ifndef MEMSCHED_NUMERIC_H_
#define MEMSCHED_NUMERIC_H_

#include <cstdint>

namespace memsched {

// Rounds to the nearest integer, ties to even (0.5 -> 0, 1.5 -> 2, 2.5 -> 2).
// Every rounding in the engine goes through here so output stays reproducible.
// Values beyond the int64 range saturate; non-finite values map to 0.
int64_t round_to_int(double value);

// max(0, round_to_int(value)). Non-finite values map to 0.
int64_t clamp_non_negative_int(double value);

// max(1, round_to_int(value)). Non-finite values map to 1.
int64_t clamp_positive_int(double value);

}  // namespace memsched

#endif
