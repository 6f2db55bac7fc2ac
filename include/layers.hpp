#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "block_spec.hpp"
#include "ir.hpp"
#include "params.hpp"

namespace mv3 {

// Shared BatchNorm constants for every normalized stage of a network.
struct NormSettings {
  float eps = 1e-3f;
  float momentum = 0.01f;
};

struct ConvNormActOptions {
  int64_t in_channels = 0;
  int64_t out_channels = 0;
  int64_t kernel = 3;
  int64_t stride = 1;
  std::optional<int64_t> padding;    // default (kernel - 1) / 2 * dilation
  int64_t groups = 1;
  bool norm = true;
  ActKind activation = ActKind::ReLU; // None: no activation op
  int64_t dilation = 1;
  std::optional<bool> bias;          // default: present iff !norm
  NormSettings norm_settings;
};

// conv -> [batchnorm] -> [activation], parameters registered as
// "<prefix>.0.weight", "<prefix>.1.running_mean", ...
struct ConvNormAct {
  std::vector<Op> ops;
  int64_t out_channels = 0;
};

ConvNormAct make_conv_norm_act(ParamStore& store, const std::string& prefix,
                               const ConvNormActOptions& o);

// squeeze = quantize_channels(channels / 4, 8); fc1/fc2 under "<prefix>.fc1", "<prefix>.fc2".
Op make_squeeze_excite(ParamStore& store, const std::string& prefix, int64_t channels);
Op make_squeeze_excite(ParamStore& store, const std::string& prefix, int64_t channels,
                       int64_t squeeze);

// expand (skipped when expanded == input) -> depthwise -> [gate] -> linear project,
// with an identity shortcut iff stride == 1 and input == out channels.
// Stages are registered under "<prefix>.block.<j>".
Op make_inverted_residual(ParamStore& store, const std::string& prefix, const BlockSpec& spec,
                          const NormSettings& ns = NormSettings());

} // namespace mv3
