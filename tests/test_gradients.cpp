#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include <vector>
#include "executor.hpp"
#include "kernels.hpp"
#include "layers.hpp"
#include "test_util.hpp"

using namespace mv3;
using namespace mv3::testing_util;

namespace {

// Checks d(sum(op(x) * r))/dx and /dparams against central differences on a
// sample of coordinates. Piecewise-linear activations may put a coordinate on
// a kink, so up to `allowed_misses` samples may disagree.
void check_op_gradients(const Op& op, ParamStore& store, Tensor x, Mode mode,
                        int samples = 12, int allowed_misses = 0) {
  RunContext ctx;
  ctx.mode = mode;

  OpTrace trace;
  const Tensor y = run_op(op, x, ctx, &trace);
  const Tensor r = random_tensor(y.dims, 777);
  store.zero_grad();
  const Tensor gx = run_op_backward(op, trace, r);
  ASSERT_EQ(gx.dims, x.dims);

  auto loss = [&]() {
    RunContext c;
    c.mode = mode;
    return dot(run_op(op, x, c, nullptr), r);
  };

  int misses = 0;
  const size_t nx = x.data.size();
  for (int s = 0; s < samples; ++s) {
    const size_t i = (size_t)s * 7919u % nx;
    const double num = numeric_grad(&x.data[i], loss);
    if (!grad_close(gx.data[i], num)) ++misses;
  }

  for (const auto& ref : store.learnable()) {
    Param& p = *ref.param;
    const size_t n = p.value.data.size();
    for (int s = 0; s < 3; ++s) {
      const size_t i = (size_t)s * 104729u % n;
      const double num = numeric_grad(&p.value.data[i], loss);
      if (!grad_close(p.grad.data[i], num)) ++misses;
    }
  }
  EXPECT_LE(misses, allowed_misses);
}

void randomize(ParamStore& store, uint32_t seed, float scale = 0.5f) {
  for (const auto& name : store.names()) {
    Param* p = store.find(name);
    if (!p->learnable) continue;
    p->value = random_tensor(p->value.dims, seed++, -scale, scale);
  }
}

Op conv_op(ParamStore& store, const std::string& name, int64_t in, int64_t out, int64_t k,
           int64_t stride, int64_t dilation, int64_t groups, bool bias) {
  ConvNormActOptions o;
  o.in_channels = in;
  o.out_channels = out;
  o.kernel = k;
  o.stride = stride;
  o.dilation = dilation;
  o.groups = groups;
  o.norm = false;
  o.activation = ActKind::None;
  o.bias = bias;
  return make_conv_norm_act(store, name, o).ops[0];
}

} // namespace

TEST(Gradients, GroupedDilatedStridedConv) {
  ParamStore store;
  Op op = conv_op(store, "c", 4, 6, 3, 2, 2, 2, true);
  randomize(store, 1);
  check_op_gradients(op, store, random_tensor({2, 4, 7, 7}, 2), Mode::Train);
}

TEST(Gradients, DepthwiseConv) {
  ParamStore store;
  Op op = conv_op(store, "dw", 3, 3, 3, 1, 1, 3, false);
  randomize(store, 3);
  check_op_gradients(op, store, random_tensor({2, 3, 5, 5}, 4), Mode::Train);
}

TEST(Gradients, StridedDilatedDepthwiseConv) {
  ParamStore store;
  Op op = conv_op(store, "dw", 4, 4, 5, 2, 2, 4, false);
  randomize(store, 5);
  check_op_gradients(op, store, random_tensor({1, 4, 9, 9}, 6), Mode::Train);
}

TEST(Gradients, PointwiseConvWithBias) {
  ParamStore store;
  Op op = conv_op(store, "pw", 5, 4, 1, 1, 1, 1, true);
  randomize(store, 7);
  check_op_gradients(op, store, random_tensor({2, 5, 3, 3}, 8), Mode::Train);
}

TEST(Gradients, BatchNormTrainingMode) {
  ParamStore store;
  ConvNormActOptions o;
  o.in_channels = 4;
  o.out_channels = 4;
  o.activation = ActKind::None;
  Op bn = make_conv_norm_act(store, "s", o).ops[1];
  ASSERT_EQ(bn.kind, OpKind::BatchNorm);
  randomize(store, 9);
  check_op_gradients(bn, store, random_tensor({3, 4, 3, 3}, 10, -2.f, 2.f), Mode::Train);
}

TEST(Gradients, ActivationsAwayFromKinks) {
  const ActKind kinds[] = {ActKind::ReLU, ActKind::HardSwish, ActKind::HardSigmoid};
  for (ActKind k : kinds) {
    ParamStore store;
    Op op;
    op.kind = OpKind::Activation;
    op.name = act_kind_name(k);
    op.act.kind = k;
    Tensor x = random_tensor({2, 3, 4, 4}, 11, -5.f, 5.f);
    for (auto& v : x.data) {
      for (float kink : {-3.f, 0.f, 3.f})
        if (std::fabs(v - kink) < 0.05f) v = kink + 0.1f;
    }
    check_op_gradients(op, store, x, Mode::Train, 24);
  }
}

TEST(Gradients, SqueezeExcite) {
  ParamStore store;
  Op op = make_squeeze_excite(store, "se", 8);
  randomize(store, 12, 1.0f);
  check_op_gradients(op, store, random_tensor({2, 8, 4, 4}, 13), Mode::Train, 12, 1);
}

TEST(Gradients, InvertedResidualWithShortcut) {
  ParamStore store;
  const BlockSpec s = make_block_spec(16, 3, 32, 16, true, ActKind::HardSwish, 1, 1, 1.0);
  Op op = make_inverted_residual(store, "r", s);
  ASSERT_TRUE(op.res.has_shortcut);
  randomize(store, 14);
  check_op_gradients(op, store, random_tensor({2, 16, 4, 4}, 15), Mode::Train, 12, 2);
}

TEST(Gradients, LinearAndPooling) {
  ParamStore store;
  Op fc;
  fc.kind = OpKind::Linear;
  fc.name = "fc";
  fc.fc.inF = 5;
  fc.fc.outF = 4;
  fc.fc.weight = store.create("fc.weight", {4, 5});
  fc.fc.bias = store.create("fc.bias", {4});
  randomize(store, 16);
  check_op_gradients(fc, store, random_tensor({3, 5}, 17), Mode::Train);

  ParamStore none;
  Op pool;
  pool.kind = OpKind::GlobalAvgPool;
  pool.name = "avgpool";
  check_op_gradients(pool, none, random_tensor({2, 3, 4, 5}, 18), Mode::Train);
}

TEST(Gradients, BackwardWithoutTraceIsRejected) {
  ParamStore store;
  Op bn = make_conv_norm_act(store, "s", ConvNormActOptions{4, 4}).ops[1];
  OpTrace empty;
  empty.input = random_tensor({2, 4, 3, 3}, 1);
  EXPECT_THROW(run_op_backward(bn, empty, random_tensor({2, 4, 3, 3}, 2)), std::logic_error);
}
