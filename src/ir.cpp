#include "ir.hpp"

namespace mv3 {

const char* op_kind_name(OpKind k) {
  switch (k) {
    case OpKind::Conv2D:        return "Conv2D";
    case OpKind::BatchNorm:     return "BatchNorm";
    case OpKind::Activation:    return "Activation";
    case OpKind::SqueezeExcite: return "SqueezeExcite";
    case OpKind::Residual:      return "Residual";
    case OpKind::GlobalAvgPool: return "GlobalAvgPool";
    case OpKind::Flatten:       return "Flatten";
    case OpKind::Linear:        return "Linear";
    case OpKind::Dropout:       return "Dropout";
  }
  return "?";
}

const char* act_kind_name(ActKind k) {
  switch (k) {
    case ActKind::None:        return "None";
    case ActKind::ReLU:        return "ReLU";
    case ActKind::HardSwish:   return "HardSwish";
    case ActKind::HardSigmoid: return "HardSigmoid";
  }
  return "?";
}

} // namespace mv3
