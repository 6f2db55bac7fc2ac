#pragma once
#include <cstdint>

namespace mv3 {

// Round a channel count to the nearest multiple of `divisor`, never below
// `min_value` (defaults to divisor) and never more than 10% below `v`.
// Throws std::invalid_argument for divisor <= 0 or v < 0.
int64_t quantize_channels(double v, int64_t divisor, int64_t min_value = -1);

} // namespace mv3
