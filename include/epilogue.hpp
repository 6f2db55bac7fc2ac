#pragma once
#include <cstdint>
#include "ir.hpp"
#include "mv3_compiler.hpp"

namespace mv3 {

inline float hard_sigmoid(float x) {
  const float t = x + 3.f;
  return (t <= 0.f ? 0.f : (t >= 6.f ? 6.f : t)) / 6.f;
}

inline float hard_swish(float x) { return x * hard_sigmoid(x); }

inline float activation_value(ActKind k, float x) {
  switch (k) {
    case ActKind::ReLU:        return x > 0.f ? x : 0.f;
    case ActKind::HardSwish:   return hard_swish(x);
    case ActKind::HardSigmoid: return hard_sigmoid(x);
    case ActKind::None:        break;
  }
  return x;
}

// d act(x) / dx, taking the one-sided value at the kinks
inline float activation_slope(ActKind k, float x) {
  switch (k) {
    case ActKind::ReLU:        return x > 0.f ? 1.f : 0.f;
    case ActKind::HardSwish:   return x < -3.f ? 0.f : (x <= 3.f ? x / 3.f + 0.5f : 1.f);
    case ActKind::HardSigmoid: return (x > -3.f && x < 3.f) ? 1.f / 6.f : 0.f;
    case ActKind::None:        break;
  }
  return 1.f;
}

inline void apply_activation(const float* MV3_RESTRICT x, float* MV3_RESTRICT y, int64_t len, ActKind k) {
  if (k == ActKind::ReLU) {
    for (int64_t i=0;i<len;++i) y[i] = x[i] > 0.f ? x[i] : 0.f;
  } else if (k == ActKind::HardSwish) {
    for (int64_t i=0;i<len;++i) y[i] = hard_swish(x[i]);
  } else if (k == ActKind::HardSigmoid) {
    for (int64_t i=0;i<len;++i) y[i] = hard_sigmoid(x[i]);
  } else {
    for (int64_t i=0;i<len;++i) y[i] = x[i];
  }
}

// gx = gy * act'(x)
inline void apply_activation_grad(const float* MV3_RESTRICT x, const float* MV3_RESTRICT gy,
                                  float* MV3_RESTRICT gx, int64_t len, ActKind k) {
  for (int64_t i=0;i<len;++i) gx[i] = gy[i] * activation_slope(k, x[i]);
}

} // namespace mv3
