#include "executor.hpp"
#include "conv_kernels.hpp"
#include "kernels.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mv3 {

// ---------- helpers ----------
static void require_rank4(const Tensor& x, const Op& op) {
  if (x.rank() != 4)
    throw std::invalid_argument(op.name + " (" + op_kind_name(op.kind) +
                                ") expects [N,C,H,W], got " + shape_str(x.dims));
}

struct GateForward {
  Tensor pooled, z1, a1, z2, scale;
};

static void gate_forward(const SqueezeExcite& se, const Tensor& x, GateForward& g) {
  global_avg_pool_forward(x, g.pooled);
  conv2d_forward(se.fc1, g.pooled, g.z1);
  activation_forward(se.inner, g.z1, g.a1);
  conv2d_forward(se.fc2, g.a1, g.z2);
  activation_forward(se.scale, g.z2, g.scale);
}

Tensor squeeze_excite_scale(const SqueezeExcite& se, const Tensor& x) {
  if (x.rank() != 4 || x.dim(1) != se.channels)
    throw std::invalid_argument("SqueezeExcite expects [N," + std::to_string(se.channels) +
                                ",H,W], got " + shape_str(x.dims));
  GateForward g;
  gate_forward(se, x, g);
  return std::move(g.scale);
}

// ---------- forward ----------
Tensor run_op(const Op& op, const Tensor& x, RunContext& ctx, OpTrace* trace) {
  if (trace) trace->input = x;
  Tensor y;

  switch (op.kind) {
    case OpKind::Conv2D:
      require_rank4(x, op);
      conv2d_forward(op.conv, x, y);
      break;

    case OpKind::BatchNorm:
      if (ctx.training()) {
        Tensor xhat, inv_std;
        batchnorm_forward_train(op.bn, x, y, xhat, inv_std);
        if (trace) {
          trace->saved.push_back(std::move(xhat));
          trace->saved.push_back(std::move(inv_std));
        }
      } else {
        batchnorm_forward_eval(op.bn, x, y);
      }
      break;

    case OpKind::Activation:
      activation_forward(op.act.kind, x, y);
      break;

    case OpKind::SqueezeExcite: {
      require_rank4(x, op);
      if (x.dim(1) != op.se.channels)
        throw std::invalid_argument(op.name + ": expected " + std::to_string(op.se.channels) +
                                    " channels, got " + std::to_string(x.dim(1)));
      GateForward g;
      gate_forward(op.se, x, g);
      channel_scale_forward(x, g.scale, y);
      if (trace) {
        trace->saved.push_back(std::move(g.pooled));
        trace->saved.push_back(std::move(g.z1));
        trace->saved.push_back(std::move(g.a1));
        trace->saved.push_back(std::move(g.z2));
        trace->saved.push_back(std::move(g.scale));
      }
      break;
    }

    case OpKind::Residual:
      y = run_ops(op.res.body, x, ctx, trace ? &trace->body : nullptr);
      if (op.res.has_shortcut) add_inplace(y, x);
      break;

    case OpKind::GlobalAvgPool:
      require_rank4(x, op);
      global_avg_pool_forward(x, y);
      break;

    case OpKind::Flatten: {
      if (x.rank() < 2)
        throw std::invalid_argument(op.name + ": cannot flatten " + shape_str(x.dims));
      y.dims = {x.dim(0), x.dim(0) ? x.numel() / x.dim(0) : 0};
      y.data = x.data;
      break;
    }

    case OpKind::Linear:
      linear_forward(op.fc, x, y);
      break;

    case OpKind::Dropout:
      if (ctx.training() && op.drop.p > 0.f) {
        Tensor mask;
        dropout_forward(op.drop.p, x, y, mask, ctx.rng);
        if (trace) trace->saved.push_back(std::move(mask));
      } else {
        y = x;
      }
      break;
  }
  return y;
}

Tensor run_ops(const std::vector<Op>& ops, const Tensor& x, RunContext& ctx,
               std::vector<OpTrace>* traces) {
  if (traces) {
    traces->clear();
    traces->resize(ops.size());
  }
  Tensor cur = x;
  for (size_t i = 0; i < ops.size(); ++i)
    cur = run_op(ops[i], cur, ctx, traces ? &(*traces)[i] : nullptr);
  return cur;
}

// ---------- backward ----------
Tensor run_op_backward(const Op& op, const OpTrace& t, const Tensor& gy) {
  Tensor gx;

  switch (op.kind) {
    case OpKind::Conv2D:
      conv2d_backward(op.conv, t.input, gy, &gx);
      break;

    case OpKind::BatchNorm:
      if (t.saved.size() != 2)
        throw std::logic_error(op.name + ": BatchNorm backward needs a training-mode forward");
      batchnorm_backward(op.bn, t.saved[0], t.saved[1], gy, gx);
      break;

    case OpKind::Activation:
      activation_backward(op.act.kind, t.input, gy, gx);
      break;

    case OpKind::SqueezeExcite: {
      if (t.saved.size() != 5)
        throw std::logic_error(op.name + ": missing squeeze-excite trace");
      const Tensor& pooled = t.saved[0];
      const Tensor& z1 = t.saved[1];
      const Tensor& a1 = t.saved[2];
      const Tensor& z2 = t.saved[3];
      const Tensor& scale = t.saved[4];

      Tensor gscale, gz2, ga1, gz1, gpooled, gx_gate;
      channel_scale_backward(t.input, scale, gy, gx, gscale);
      activation_backward(op.se.scale, z2, gscale, gz2);
      conv2d_backward(op.se.fc2, a1, gz2, &ga1);
      activation_backward(op.se.inner, z1, ga1, gz1);
      conv2d_backward(op.se.fc1, pooled, gz1, &gpooled);
      global_avg_pool_backward(t.input.dims, gpooled, gx_gate);
      add_inplace(gx, gx_gate);
      break;
    }

    case OpKind::Residual:
      gx = run_ops_backward(op.res.body, t.body, gy);
      if (op.res.has_shortcut) add_inplace(gx, gy);
      break;

    case OpKind::GlobalAvgPool:
      global_avg_pool_backward(t.input.dims, gy, gx);
      break;

    case OpKind::Flatten:
      gx.dims = t.input.dims;
      gx.data = gy.data;
      break;

    case OpKind::Linear:
      linear_backward(op.fc, t.input, gy, &gx);
      break;

    case OpKind::Dropout:
      if (t.saved.empty()) gx = gy;
      else dropout_backward(t.saved[0], gy, gx);
      break;
  }
  return gx;
}

Tensor run_ops_backward(const std::vector<Op>& ops, const std::vector<OpTrace>& traces,
                        const Tensor& gy) {
  if (traces.size() != ops.size())
    throw std::logic_error("Backward called without a recorded forward trace");
  Tensor g = gy;
  for (size_t i = ops.size(); i-- > 0;)
    g = run_op_backward(ops[i], traces[i], g);
  return g;
}

// ---------- shape walk ----------
std::vector<int64_t> infer_shape(const std::vector<Op>& ops, std::vector<int64_t> dims) {
  for (const auto& op : ops) {
    switch (op.kind) {
      case OpKind::Conv2D: {
        if (dims.size() != 4)
          throw std::invalid_argument(op.name + ": expects [N,C,H,W], got " + shape_str(dims));
        const TensorDesc out = conv2d_output_desc(op.conv, TensorDesc{dims[0], dims[1], dims[2], dims[3]});
        dims = {out.N, out.C, out.H, out.W};
        break;
      }
      case OpKind::BatchNorm:
        if (dims.size() < 2 || dims[1] != op.bn.C)
          throw std::invalid_argument(op.name + ": BatchNorm over " + std::to_string(op.bn.C) +
                                      " channels got " + shape_str(dims));
        break;
      case OpKind::Activation:
      case OpKind::Dropout:
        break;
      case OpKind::SqueezeExcite:
        if (dims.size() != 4 || dims[1] != op.se.channels)
          throw std::invalid_argument(op.name + ": expected " + std::to_string(op.se.channels) +
                                      " channels, got " + shape_str(dims));
        break;
      case OpKind::Residual: {
        std::vector<int64_t> out = infer_shape(op.res.body, dims);
        if (op.res.has_shortcut && out != dims)
          throw std::invalid_argument(op.name + ": shortcut shape " + shape_str(dims) +
                                      " does not match block output " + shape_str(out));
        dims = std::move(out);
        break;
      }
      case OpKind::GlobalAvgPool:
        if (dims.size() != 4)
          throw std::invalid_argument(op.name + ": expects [N,C,H,W], got " + shape_str(dims));
        dims = {dims[0], dims[1], 1, 1};
        break;
      case OpKind::Flatten:
        dims = {dims[0], dims[0] ? numel_of(dims) / dims[0] : 0};
        break;
      case OpKind::Linear:
        if (dims.size() != 2 || dims[1] != op.fc.inF)
          throw std::invalid_argument(op.name + ": Linear expects [N," + std::to_string(op.fc.inF) +
                                      "], got " + shape_str(dims));
        dims = {dims[0], op.fc.outF};
        break;
    }
  }
  return dims;
}

} // namespace mv3
