#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "network.hpp"
#include "optim.hpp"
#include "test_util.hpp"

using namespace mv3;
using mv3::testing_util::random_tensor;

namespace {

ModelConfig small_config(int64_t num_classes, uint64_t seed = 0) {
  ModelConfig c;
  c.num_classes = num_classes;
  c.seed = seed;
  return c;
}

double stddev(const std::vector<float>& v) {
  double m = 0.0, s = 0.0;
  for (float x : v) m += x;
  m /= (double)v.size();
  for (float x : v) s += (x - m) * (x - m);
  return std::sqrt(s / (double)v.size());
}

bool same_values(const Tensor& a, const Tensor& b) { return a.dims == b.dims && a.data == b.data; }

} // namespace

TEST(Network, StructureAtUnitWidth) {
  MobileNetV3Small net(small_config(1000));
  EXPECT_EQ(net.num_blocks(), 11u);
  // stem (conv, bn, act) + 11 blocks + tail (conv, bn, act)
  ASSERT_EQ(net.features().size(), 17u);
  EXPECT_EQ(net.features()[0].conv.strideH, 2);
  EXPECT_EQ(net.features()[2].act.kind, ActKind::HardSwish);
  EXPECT_EQ(net.features()[14].conv.kH, 1);
  EXPECT_EQ(net.features()[16].act.kind, ActKind::HardSwish);

  int linears = 0;
  for (const auto& op : net.classifier()) linears += op.kind == OpKind::Linear;
  EXPECT_EQ(linears, 2);
  EXPECT_EQ(net.classifier()[1].act.kind, ActKind::HardSwish);
  EXPECT_EQ(net.classifier()[2].kind, OpKind::Dropout);
  EXPECT_FLOAT_EQ(net.classifier()[2].drop.p, 0.2f);

  EXPECT_EQ(net.stem_channels(), 16);
  EXPECT_EQ(net.tail_channels(), 576);
  EXPECT_EQ(net.hidden_channels(), 1024);
}

TEST(Network, ParameterNamesMatchReferenceLayout) {
  MobileNetV3Small net(small_config(10));
  const ParamStore& s = net.store();
  auto dims = [&](const char* n) {
    const Param* p = s.find(n);
    return p ? p->value.dims : std::vector<int64_t>{-1};
  };
  EXPECT_EQ(dims("features.0.0.weight"), (std::vector<int64_t>{16, 3, 3, 3}));
  EXPECT_EQ(dims("features.0.1.running_var"), (std::vector<int64_t>{16}));
  EXPECT_EQ(dims("features.1.block.0.0.weight"), (std::vector<int64_t>{16, 1, 3, 3}));
  EXPECT_EQ(dims("features.1.block.1.fc1.weight"), (std::vector<int64_t>{8, 16, 1, 1}));
  EXPECT_EQ(dims("features.2.block.0.0.weight"), (std::vector<int64_t>{72, 16, 1, 1}));
  EXPECT_EQ(dims("features.9.block.2.fc2.bias"), (std::vector<int64_t>{288}));
  EXPECT_EQ(dims("features.11.block.3.1.num_batches_tracked"), (std::vector<int64_t>{}));
  EXPECT_EQ(dims("features.12.0.weight"), (std::vector<int64_t>{576, 96, 1, 1}));
  EXPECT_EQ(dims("classifier.0.weight"), (std::vector<int64_t>{1024, 576}));
  EXPECT_EQ(dims("classifier.3.weight"), (std::vector<int64_t>{10, 1024}));
  EXPECT_EQ(dims("classifier.3.bias"), (std::vector<int64_t>{10}));

  for (const auto& ref : net.parameters()) {
    EXPECT_EQ(ref.name.find("running_"), std::string::npos);
    EXPECT_EQ(ref.name.find("num_batches_tracked"), std::string::npos);
  }
}

TEST(Network, ForwardShape) {
  MobileNetV3Small net(small_config(10));
  RunContext ctx;
  const Tensor y = net.forward(random_tensor({2, 3, 32, 32}, 1), ctx);
  EXPECT_EQ(y.dims, (std::vector<int64_t>{2, 10}));
  for (float v : y.data) EXPECT_TRUE(std::isfinite(v));

  MobileNetV3Small one(small_config(1));
  EXPECT_EQ(one.forward(random_tensor({1, 3, 64, 64}, 2), ctx).dims, (std::vector<int64_t>{1, 1}));
  EXPECT_EQ(one.output_shape({3, 3, 96, 64}), (std::vector<int64_t>{3, 1}));
}

TEST(Network, ReducedTailAndDilatedVariants) {
  ModelConfig c = small_config(10);
  c.reduced_tail = true;
  c.dilated = true;
  c.width_mult = 0.75;
  MobileNetV3Small net(c);
  EXPECT_EQ(net.num_blocks(), 11u);
  EXPECT_EQ(net.hidden_channels(), 384);
  RunContext ctx;
  EXPECT_EQ(net.forward(random_tensor({1, 3, 32, 32}, 3), ctx).dims, (std::vector<int64_t>{1, 10}));
}

TEST(Network, RejectsBadInputAndConfig) {
  MobileNetV3Small net(small_config(10));
  RunContext ctx;
  EXPECT_THROW(net.forward(random_tensor({1, 1, 32, 32}, 1), ctx), std::invalid_argument);
  EXPECT_THROW(net.forward(random_tensor({3, 32, 32}, 1), ctx), std::invalid_argument);
  EXPECT_THROW(MobileNetV3Small(small_config(0)), std::invalid_argument);
  ModelConfig bad = small_config(10);
  bad.width_mult = 0.05;
  EXPECT_THROW(MobileNetV3Small{bad}, std::invalid_argument);
}

TEST(Network, WeightInitialization) {
  MobileNetV3Small net(small_config(10, 3));
  const ParamStore& s = net.store();

  // Kaiming normal, fan-out: std = sqrt(2 / (576 * 1 * 1))
  EXPECT_NEAR(stddev(s.find("features.12.0.weight")->value.data), std::sqrt(2.0 / 576.0), 0.006);
  EXPECT_NEAR(stddev(s.find("classifier.0.weight")->value.data), 0.01, 0.001);
  for (float v : s.find("classifier.0.bias")->value.data) EXPECT_EQ(v, 0.f);
  for (float v : s.find("features.1.block.1.fc1.bias")->value.data) EXPECT_EQ(v, 0.f);
  for (float v : s.find("features.3.block.1.1.weight")->value.data) EXPECT_EQ(v, 1.f);
  for (float v : s.find("features.3.block.1.1.bias")->value.data) EXPECT_EQ(v, 0.f);

  MobileNetV3Small same(small_config(10, 3));
  MobileNetV3Small other(small_config(10, 4));
  EXPECT_TRUE(same_values(s.find("features.0.0.weight")->value,
                          same.store().find("features.0.0.weight")->value));
  EXPECT_FALSE(same_values(s.find("features.0.0.weight")->value,
                           other.store().find("features.0.0.weight")->value));
}

TEST(Network, TransplantSkipsClassifierWhenClassCountsDiffer) {
  MobileNetV3Small source(small_config(1000, 1));
  MobileNetV3Small target(small_config(10, 2));
  const StateDict src = source.state_dict();
  const Tensor target_fc0 = target.store().find("classifier.0.weight")->value;

  const TransplantReport rep = target.transplant(src, 1000);
  EXPECT_EQ(rep.skipped_classifier.size(), 4u);
  EXPECT_TRUE(rep.unexpected.empty());

  for (const auto& kv : target.state_dict()) {
    if (is_classifier_param(kv.first)) continue;
    EXPECT_TRUE(same_values(kv.second, src.at(kv.first))) << kv.first;
  }
  // classifier.0 has the same shape in both, yet keeps its fresh values
  const Tensor& fc0 = target.store().find("classifier.0.weight")->value;
  EXPECT_TRUE(same_values(fc0, target_fc0));
  EXPECT_FALSE(same_values(fc0, src.at("classifier.0.weight")));
}

TEST(Network, TransplantCopiesEverythingWhenClassCountsMatch) {
  MobileNetV3Small source(small_config(10, 1));
  MobileNetV3Small target(small_config(10, 2));
  const StateDict src = source.state_dict();
  const TransplantReport rep = target.transplant(src, 10);
  EXPECT_TRUE(rep.skipped_classifier.empty());
  EXPECT_TRUE(rep.missing.empty());
  EXPECT_EQ(rep.copied.size(), src.size());
  EXPECT_TRUE(same_values(target.store().find("classifier.3.weight")->value, src.at("classifier.3.weight")));
}

TEST(Network, TransplantShapeMismatchLeavesTargetUntouched) {
  ModelConfig wide = small_config(10, 1);
  wide.width_mult = 0.75;
  MobileNetV3Small source(wide);
  MobileNetV3Small target(small_config(10, 2));
  const StateDict before = target.state_dict();
  EXPECT_THROW(target.transplant(source.state_dict(), 10), std::runtime_error);
  for (const auto& kv : target.state_dict())
    EXPECT_TRUE(same_values(kv.second, before.at(kv.first))) << kv.first;
}

TEST(Network, StateDictRoundTripReproducesOutputs) {
  MobileNetV3Small a(small_config(10, 5));
  // Non-trivial running statistics
  RunContext train;
  train.mode = Mode::Train;
  a.forward(random_tensor({4, 3, 32, 32}, 6), train);

  MobileNetV3Small b(small_config(10, 9));
  b.load_state_dict(a.state_dict());

  RunContext eval;
  const Tensor x = random_tensor({2, 3, 32, 32}, 7);
  const Tensor ya = a.forward(x, eval);
  const Tensor yb = b.forward(x, eval);
  EXPECT_EQ(ya.data, yb.data);
}

TEST(Network, LoadStateDictIsStrict) {
  MobileNetV3Small net(small_config(10));
  StateDict sd = net.state_dict();

  StateDict missing = sd;
  missing.erase("features.0.0.weight");
  EXPECT_THROW(net.load_state_dict(missing), std::runtime_error);

  StateDict extra = sd;
  extra.emplace("features.99.weight", Tensor({1}));
  EXPECT_THROW(net.load_state_dict(extra), std::runtime_error);

  StateDict reshaped = sd;
  reshaped["classifier.3.weight"] = Tensor({5, 1024});
  EXPECT_THROW(net.load_state_dict(reshaped), std::runtime_error);
}

TEST(Network, EvalIsDeterministicAndTrainUpdatesStats) {
  MobileNetV3Small net(small_config(10));
  const Tensor x = random_tensor({2, 3, 32, 32}, 8);
  RunContext eval;
  const Tensor y1 = net.forward(x, eval);
  const Tensor y2 = net.forward(x, eval);
  EXPECT_EQ(y1.data, y2.data);

  const float nbt = net.store().find("features.0.1.num_batches_tracked")->value.data[0];
  EXPECT_EQ(nbt, 0.f);
  RunContext train;
  train.mode = Mode::Train;
  net.forward(x, train);
  EXPECT_EQ(net.store().find("features.0.1.num_batches_tracked")->value.data[0], 1.f);
}

TEST(Network, BackwardRequiresTrainingForward) {
  MobileNetV3Small net(small_config(10));
  EXPECT_THROW(net.backward(Tensor({1, 10})), std::logic_error);
  RunContext eval;
  net.forward(random_tensor({1, 3, 32, 32}, 1), eval);
  EXPECT_THROW(net.backward(Tensor({1, 10})), std::logic_error);
}

TEST(Network, TrainingStepsReduceLossOnFixedBatch) {
  ModelConfig c = small_config(10, 11);
  c.dropout = 0.f;
  MobileNetV3Small net(c);
  SGDOptions so;
  so.lr = 0.05;
  so.weight_decay = 0.0;
  SGD opt(net.parameters(), so);

  const Tensor x = random_tensor({8, 3, 32, 32}, 12);
  const std::vector<int32_t> labels{0, 1, 2, 3, 4, 5, 6, 7};
  RunContext ctx;
  ctx.mode = Mode::Train;

  Tensor grad;
  double first = 0.0, last = 0.0;
  for (int step = 0; step < 15; ++step) {
    opt.zero_grad();
    const Tensor logits = net.forward(x, ctx);
    const double loss = cross_entropy(logits, labels, &grad, nullptr);
    net.backward(grad);
    opt.step();
    if (step == 0) first = loss;
    last = loss;
  }
  EXPECT_TRUE(std::isfinite(last));
  EXPECT_LT(last, first);
}
