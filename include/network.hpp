#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include "block_spec.hpp"
#include "executor.hpp"
#include "ir.hpp"
#include "layers.hpp"
#include "params.hpp"
#include "tensor.hpp"

namespace mv3 {

// Architecture hyperparameters. Everything the assembler reads comes from here.
struct ModelConfig {
  int64_t num_classes = 1000;
  double width_mult = 1.0;
  float dropout = 0.2f;
  bool reduced_tail = false;
  bool dilated = false;
  float bn_eps = 1e-3f;
  float bn_momentum = 0.01f;
  uint64_t seed = 0;           // weight init RNG
};

// Outcome of a name-keyed weight transplant.
struct TransplantReport {
  std::vector<std::string> copied;
  std::vector<std::string> skipped_classifier;  // excluded: class counts differ
  std::vector<std::string> unexpected;          // in source, not in target
  std::vector<std::string> missing;             // in target, not in source (kept as initialized)
};

// True for entries of the classification head ("classifier.*").
bool is_classifier_param(const std::string& name);

// MobileNetV3-Small: stem, 11 inverted residual blocks, 1x1 tail,
// global pool, classifier. Parameter names match torchvision's state_dict.
class MobileNetV3Small {
public:
  explicit MobileNetV3Small(const ModelConfig& cfg = ModelConfig());
  MobileNetV3Small(const MobileNetV3Small&) = delete;
  MobileNetV3Small& operator=(const MobileNetV3Small&) = delete;

  // [B,3,H,W] -> [B,num_classes]. A training-mode call records the trace
  // that backward() consumes.
  Tensor forward(const Tensor& x, RunContext& ctx);

  // Accumulates into every learnable grad and returns dL/dinput.
  // Throws std::logic_error without a preceding training-mode forward.
  Tensor backward(const Tensor& grad_logits);

  void zero_grad() { store_.zero_grad(); }
  std::vector<ParamRef> parameters() { return store_.learnable(); }

  // Flat name -> tensor, running statistics included.
  StateDict state_dict() const;
  // Strict: missing, unexpected or mis-shaped entries throw std::runtime_error
  // and leave the network untouched.
  void load_state_dict(const StateDict& sd);

  // Copies every source entry whose name exists here; classifier entries are
  // skipped when src_num_classes differs from ours. Shape mismatch on a
  // copied name throws std::runtime_error before anything is written.
  TransplantReport transplant(const StateDict& src, int64_t src_num_classes);

  // Kaiming-normal (fan-out) convs, unit BN, N(0, 0.01) linears, zero biases.
  void initialize_weights(uint64_t seed);

  const ModelConfig& config() const { return cfg_; }
  const std::vector<BlockSpec>& block_specs() const { return specs_; }
  const std::vector<Op>& features() const { return features_; }
  const std::vector<Op>& head() const { return head_; }
  const std::vector<Op>& classifier() const { return classifier_; }
  const ParamStore& store() const { return store_; }

  size_t num_blocks() const;
  int64_t stem_channels() const { return specs_.front().input_channels; }
  int64_t tail_channels() const { return tail_out_; }
  int64_t hidden_channels() const { return hidden_; }

  std::vector<int64_t> output_shape(const std::vector<int64_t>& input_dims) const;

private:
  ModelConfig cfg_;
  ParamStore store_;
  std::vector<BlockSpec> specs_;
  std::vector<Op> features_;     // stem, blocks, tail
  std::vector<Op> head_;         // pool, flatten
  std::vector<Op> classifier_;   // linear, hardswish, dropout, linear
  int64_t tail_out_ = 0, hidden_ = 0;

  std::vector<OpTrace> trace_features_, trace_head_, trace_classifier_;
  bool has_trace_ = false;
};

} // namespace mv3
