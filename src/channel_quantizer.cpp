#include "channel_quantizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace mv3 {

int64_t quantize_channels(double v, int64_t divisor, int64_t min_value) {
  if (divisor <= 0)
    throw std::invalid_argument("Channel divisor must be positive, got " + std::to_string(divisor));
  if (!(v >= 0.0))
    throw std::invalid_argument("Channel count must be non-negative, got " + std::to_string(v));
  if (!std::isfinite(v))
    throw std::invalid_argument("Channel count must be finite, got " + std::to_string(v));
  if (min_value < 0) min_value = divisor;

  const double d = (double)divisor;
  const double steps = std::floor((v + d / 2.0) / d);
  // steps * divisor stays below 2^62, leaving room for the 10% bump.
  if (steps >= std::ldexp(1.0, 62) / d)
    throw std::invalid_argument("Channel count " + std::to_string(v) + " is out of range");
  const int64_t rounded = (int64_t)steps * divisor;
  int64_t candidate = std::max(min_value, rounded);
  // Make sure that round down does not go down by more than 10%.
  if ((double)candidate < 0.9 * v) {
    if (candidate > std::numeric_limits<int64_t>::max() - divisor)
      throw std::invalid_argument("Channel count " + std::to_string(v) + " is out of range");
    candidate += divisor;
  }
  return candidate;
}

} // namespace mv3
