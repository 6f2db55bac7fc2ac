#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "params.hpp"

namespace mv3 {

enum class OpKind {
  Conv2D, BatchNorm, Activation, SqueezeExcite, Residual,
  GlobalAvgPool, Flatten, Linear, Dropout
};
enum class ActKind { None, ReLU, HardSwish, HardSigmoid };

const char* op_kind_name(OpKind k);
const char* act_kind_name(ActKind k);

struct Conv2D {
  int64_t inC = 0, outC = 0, kH = 1, kW = 1;
  int64_t strideH = 1, strideW = 1, padH = 0, padW = 0;
  int64_t dilationH = 1, dilationW = 1, groups = 1;
  Param* weight = nullptr;          // [outC, inC/groups, kH, kW]
  Param* bias = nullptr;            // [outC] or null
};

struct BatchNorm {
  int64_t C = 0;
  float eps = 1e-3f;
  float momentum = 0.01f;
  Param* weight = nullptr;          // [C]
  Param* bias = nullptr;            // [C]
  Param* running_mean = nullptr;    // [C], buffer
  Param* running_var = nullptr;     // [C], buffer
  Param* num_batches_tracked = nullptr;
};

struct Activation {
  ActKind kind = ActKind::ReLU;
};

// Channel gate: avgpool -> fc1 -> inner act -> fc2 -> scale act -> x * scale.
// fc1/fc2 are 1x1 convolutions with bias on the pooled [N,C,1,1] summary.
struct SqueezeExcite {
  int64_t channels = 0, squeeze = 0;
  Conv2D fc1;
  Conv2D fc2;
  ActKind inner = ActKind::ReLU;
  ActKind scale = ActKind::HardSigmoid;
};

struct Op;

// Ordered body with an optional identity shortcut around it.
struct Residual {
  std::vector<Op> body;
  bool has_shortcut = false;
  int64_t inC = 0, outC = 0, stride = 1;
};

struct Linear {
  int64_t inF = 0, outF = 0;
  Param* weight = nullptr;          // [outF, inF]
  Param* bias = nullptr;            // [outF]
};

struct Dropout {
  float p = 0.0f;
};

// Tagged variant; only the member matching `kind` is meaningful.
struct Op {
  OpKind kind = OpKind::Activation;
  std::string name;                 // parameter prefix, e.g. "features.3.block.1"
  Conv2D conv;                      // kind == Conv2D
  BatchNorm bn;                     // kind == BatchNorm
  Activation act;                   // kind == Activation
  SqueezeExcite se;                 // kind == SqueezeExcite
  Residual res;                     // kind == Residual
  Linear fc;                        // kind == Linear
  Dropout drop;                     // kind == Dropout
};

// Output spatial size (floor semantics).
inline int64_t conv_out_dim(int64_t in, int64_t pad, int64_t dilation,
                            int64_t k, int64_t stride) {
  const int64_t eff_k = dilation * (k - 1) + 1;
  return ((in + 2*pad - eff_k) / stride) + 1;
}

} // namespace mv3
