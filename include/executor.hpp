#pragma once
#include <cstdint>
#include <random>
#include <vector>
#include "ir.hpp"
#include "tensor.hpp"

namespace mv3 {

enum class Mode { Train, Eval };

// Everything an evaluation call depends on besides the weights.
// Train: BatchNorm uses batch statistics and updates its running buffers,
// Dropout draws masks from rng. Eval: frozen statistics, identity dropout.
struct RunContext {
  Mode mode = Mode::Eval;
  std::mt19937 rng{0};

  bool training() const { return mode == Mode::Train; }
};

// Activations an op kept from its forward pass for the reverse pass.
struct OpTrace {
  Tensor input;
  std::vector<Tensor> saved;
  std::vector<OpTrace> body;   // Residual only
};

// Explicit dispatch over Op::kind. When trace is non-null the op records
// what run_op_backward needs.
Tensor run_op(const Op& op, const Tensor& x, RunContext& ctx, OpTrace* trace);
Tensor run_ops(const std::vector<Op>& ops, const Tensor& x, RunContext& ctx,
               std::vector<OpTrace>* traces);

// Accumulates parameter gradients and returns dL/dx.
Tensor run_op_backward(const Op& op, const OpTrace& t, const Tensor& gy);
Tensor run_ops_backward(const std::vector<Op>& ops, const std::vector<OpTrace>& traces,
                        const Tensor& gy);

// Shape walk without touching data. Throws std::invalid_argument on mismatch.
std::vector<int64_t> infer_shape(const std::vector<Op>& ops, std::vector<int64_t> dims);

// Per-channel gate of a SqueezeExcite op: [N,C,H,W] -> [N,C,1,1], values in [0,1].
Tensor squeeze_excite_scale(const SqueezeExcite& se, const Tensor& x);

} // namespace mv3
