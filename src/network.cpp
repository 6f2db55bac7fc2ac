#include "network.hpp"

#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace mv3 {

bool is_classifier_param(const std::string& name) {
  static const std::string prefix = "classifier.";
  return name.compare(0, prefix.size(), prefix) == 0;
}

static Op make_linear(ParamStore& store, const std::string& name, int64_t inF, int64_t outF) {
  Op op;
  op.kind = OpKind::Linear;
  op.name = name;
  op.fc.inF = inF;
  op.fc.outF = outF;
  op.fc.weight = store.create(name + ".weight", {outF, inF});
  op.fc.bias = store.create(name + ".bias", {outF});
  return op;
}

// Visits ops depth-first, descending into residual bodies.
template <typename F>
static void for_each_op(const std::vector<Op>& ops, F& f) {
  for (const auto& op : ops) {
    if (op.kind == OpKind::Residual) for_each_op(op.res.body, f);
    else f(op);
  }
}

static Op make_simple(OpKind kind, const std::string& name) {
  Op op;
  op.kind = kind;
  op.name = name;
  return op;
}

MobileNetV3Small::MobileNetV3Small(const ModelConfig& cfg)
: cfg_(cfg) {
  if (cfg_.num_classes < 1)
    throw std::invalid_argument("num_classes must be >= 1, got " + std::to_string(cfg_.num_classes));
  if (!(cfg_.dropout >= 0.f && cfg_.dropout <= 1.f))
    throw std::invalid_argument("dropout must be in [0, 1], got " + std::to_string(cfg_.dropout));

  specs_ = mobilenet_v3_small_schedule(cfg_.width_mult, cfg_.reduced_tail, cfg_.dilated);
  tail_out_ = mv3::tail_channels(cfg_.width_mult);
  hidden_ = classifier_hidden(cfg_.width_mult, cfg_.reduced_tail);

  NormSettings ns;
  ns.eps = cfg_.bn_eps;
  ns.momentum = cfg_.bn_momentum;

  // features.0: stem
  ConvNormActOptions stem;
  stem.in_channels = 3;
  stem.out_channels = specs_.front().input_channels;
  stem.kernel = 3;
  stem.stride = 2;
  stem.activation = ActKind::HardSwish;
  stem.norm_settings = ns;
  for (auto& op : make_conv_norm_act(store_, "features.0", stem).ops)
    features_.push_back(std::move(op));

  // features.1 .. features.11
  for (size_t i = 0; i < specs_.size(); ++i)
    features_.push_back(make_inverted_residual(store_, "features." + std::to_string(i + 1),
                                               specs_[i], ns));

  // features.12: tail
  ConvNormActOptions tail;
  tail.in_channels = specs_.back().out_channels;
  tail.out_channels = tail_out_;
  tail.kernel = 1;
  tail.activation = ActKind::HardSwish;
  tail.norm_settings = ns;
  const std::string tail_name = "features." + std::to_string(specs_.size() + 1);
  for (auto& op : make_conv_norm_act(store_, tail_name, tail).ops)
    features_.push_back(std::move(op));

  head_.push_back(make_simple(OpKind::GlobalAvgPool, "avgpool"));
  head_.push_back(make_simple(OpKind::Flatten, "flatten"));

  classifier_.push_back(make_linear(store_, "classifier.0", tail_out_, hidden_));
  Op hs = make_simple(OpKind::Activation, "classifier.1");
  hs.act.kind = ActKind::HardSwish;
  classifier_.push_back(std::move(hs));
  Op drop = make_simple(OpKind::Dropout, "classifier.2");
  drop.drop.p = cfg_.dropout;
  classifier_.push_back(std::move(drop));
  classifier_.push_back(make_linear(store_, "classifier.3", hidden_, cfg_.num_classes));

  initialize_weights(cfg_.seed);
}

size_t MobileNetV3Small::num_blocks() const {
  size_t n = 0;
  for (const auto& op : features_)
    if (op.kind == OpKind::Residual) ++n;
  return n;
}

std::vector<int64_t> MobileNetV3Small::output_shape(const std::vector<int64_t>& input_dims) const {
  std::vector<int64_t> d = infer_shape(features_, input_dims);
  d = infer_shape(head_, d);
  return infer_shape(classifier_, d);
}

Tensor MobileNetV3Small::forward(const Tensor& x, RunContext& ctx) {
  if (x.rank() != 4 || x.dim(1) != 3)
    throw std::invalid_argument("MobileNetV3Small expects [B,3,H,W], got " + shape_str(x.dims));
  has_trace_ = false;
  const bool rec = ctx.training();
  Tensor h = run_ops(features_, x, ctx, rec ? &trace_features_ : nullptr);
  h = run_ops(head_, h, ctx, rec ? &trace_head_ : nullptr);
  h = run_ops(classifier_, h, ctx, rec ? &trace_classifier_ : nullptr);
  has_trace_ = rec;
  return h;
}

Tensor MobileNetV3Small::backward(const Tensor& grad_logits) {
  if (!has_trace_)
    throw std::logic_error("backward() requires a preceding training-mode forward()");
  Tensor g = run_ops_backward(classifier_, trace_classifier_, grad_logits);
  g = run_ops_backward(head_, trace_head_, g);
  g = run_ops_backward(features_, trace_features_, g);
  trace_features_.clear();
  trace_head_.clear();
  trace_classifier_.clear();
  has_trace_ = false;
  return g;
}

StateDict MobileNetV3Small::state_dict() const {
  StateDict sd;
  for (const auto& name : store_.names())
    sd.emplace(name, store_.find(name)->value);
  return sd;
}

void MobileNetV3Small::load_state_dict(const StateDict& sd) {
  for (const auto& name : store_.names()) {
    auto it = sd.find(name);
    if (it == sd.end())
      throw std::runtime_error("Missing key in state_dict: " + name);
    const Tensor& dst = store_.find(name)->value;
    if (!dst.same_shape(it->second))
      throw std::runtime_error("Size mismatch for " + name + ": checkpoint has " +
                               shape_str(it->second.dims) + ", model has " + shape_str(dst.dims));
    if (it->second.data.size() != dst.data.size())
      throw std::runtime_error("Corrupt tensor data for " + name);
  }
  for (const auto& kv : sd)
    if (!store_.find(kv.first))
      throw std::runtime_error("Unexpected key in state_dict: " + kv.first);

  for (const auto& name : store_.names())
    store_.find(name)->value.data = sd.at(name).data;
}

TransplantReport MobileNetV3Small::transplant(const StateDict& src, int64_t src_num_classes) {
  const bool keep_classifier = src_num_classes == cfg_.num_classes;
  TransplantReport rep;

  for (const auto& kv : src) {
    if (!keep_classifier && is_classifier_param(kv.first)) {
      rep.skipped_classifier.push_back(kv.first);
      continue;
    }
    const Param* p = store_.find(kv.first);
    if (!p) {
      rep.unexpected.push_back(kv.first);
      continue;
    }
    if (!p->value.same_shape(kv.second) || kv.second.data.size() != p->value.data.size())
      throw std::runtime_error("Cannot transplant " + kv.first + ": source " +
                               shape_str(kv.second.dims) + " vs target " + shape_str(p->value.dims));
    rep.copied.push_back(kv.first);
  }
  for (const auto& name : store_.names())
    if (!src.count(name)) rep.missing.push_back(name);

  for (const auto& name : rep.copied)
    store_.find(name)->value.data = src.at(name).data;
  return rep;
}

void MobileNetV3Small::initialize_weights(uint64_t seed) {
  std::mt19937_64 rng(seed);

  auto zero = [](Param* p) { if (p) p->value.zero(); };
  auto normal = [&rng](Param* p, double stddev) {
    std::normal_distribution<float> dist(0.f, (float)stddev);
    for (auto& v : p->value.data) v = dist(rng);
  };
  auto init_conv = [&](const Conv2D& c) {
    normal(c.weight, std::sqrt(2.0 / (double)(c.outC * c.kH * c.kW)));
    zero(c.bias);
  };
  auto init_bn = [](const BatchNorm& b) {
    std::fill(b.weight->value.data.begin(), b.weight->value.data.end(), 1.f);
    b.bias->value.zero();
    b.running_mean->value.zero();
    std::fill(b.running_var->value.data.begin(), b.running_var->value.data.end(), 1.f);
    b.num_batches_tracked->value.zero();
  };

  // Module order, so a given seed always yields the same weights.
  auto init = [&](const Op& op) {
    switch (op.kind) {
      case OpKind::Conv2D:        init_conv(op.conv); break;
      case OpKind::BatchNorm:     init_bn(op.bn); break;
      case OpKind::SqueezeExcite: init_conv(op.se.fc1); init_conv(op.se.fc2); break;
      case OpKind::Linear:        normal(op.fc.weight, 0.01); zero(op.fc.bias); break;
      default: break;
    }
  };
  for_each_op(features_, init);
  for_each_op(classifier_, init);
}

} // namespace mv3
