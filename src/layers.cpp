#include "layers.hpp"
#include "channel_quantizer.hpp"
#include "conv_kernels.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace mv3 {

static Conv2D make_conv(ParamStore& store, const std::string& name,
                        int64_t inC, int64_t outC, int64_t k, int64_t stride,
                        int64_t pad, int64_t dilation, int64_t groups, bool bias) {
  Conv2D c;
  c.inC = inC; c.outC = outC;
  c.kH = c.kW = k;
  c.strideH = c.strideW = stride;
  c.padH = c.padW = pad;
  c.dilationH = c.dilationW = dilation;
  c.groups = groups;
  // Geometry first so a bad group count fails before anything is registered.
  if (groups <= 0 || inC % groups != 0 || outC % groups != 0)
    throw std::invalid_argument(name + ": channels (in=" + std::to_string(inC) +
                                ", out=" + std::to_string(outC) +
                                ") are not divisible by groups=" + std::to_string(groups));
  c.weight = store.create(name + ".weight", {outC, inC / groups, k, k});
  if (bias) c.bias = store.create(name + ".bias", {outC});
  validate_conv2d(c);
  return c;
}

ConvNormAct make_conv_norm_act(ParamStore& store, const std::string& prefix,
                               const ConvNormActOptions& o) {
  if (o.kernel <= 0 || o.stride <= 0 || o.dilation <= 0)
    throw std::invalid_argument(prefix + ": kernel, stride and dilation must be positive");
  const int64_t pad = o.padding ? *o.padding : (o.kernel - 1) / 2 * o.dilation;
  const bool bias = o.bias ? *o.bias : !o.norm;

  ConvNormAct out;
  out.out_channels = o.out_channels;

  Op conv;
  conv.kind = OpKind::Conv2D;
  conv.name = prefix + ".0";
  conv.conv = make_conv(store, conv.name, o.in_channels, o.out_channels, o.kernel,
                        o.stride, pad, o.dilation, o.groups, bias);
  out.ops.push_back(std::move(conv));

  int idx = 1;
  if (o.norm) {
    Op bn;
    bn.kind = OpKind::BatchNorm;
    bn.name = prefix + "." + std::to_string(idx++);
    bn.bn.C = o.out_channels;
    bn.bn.eps = o.norm_settings.eps;
    bn.bn.momentum = o.norm_settings.momentum;
    bn.bn.weight = store.create(bn.name + ".weight", {o.out_channels});
    bn.bn.bias = store.create(bn.name + ".bias", {o.out_channels});
    bn.bn.running_mean = store.create(bn.name + ".running_mean", {o.out_channels}, false);
    bn.bn.running_var = store.create(bn.name + ".running_var", {o.out_channels}, false);
    bn.bn.num_batches_tracked = store.create(bn.name + ".num_batches_tracked", {}, false);
    bn.bn.weight->value = Tensor({o.out_channels}, 1.0f);
    bn.bn.running_var->value = Tensor({o.out_channels}, 1.0f);
    out.ops.push_back(std::move(bn));
  }
  if (o.activation != ActKind::None) {
    Op act;
    act.kind = OpKind::Activation;
    act.name = prefix + "." + std::to_string(idx++);
    act.act.kind = o.activation;
    out.ops.push_back(std::move(act));
  }
  return out;
}

Op make_squeeze_excite(ParamStore& store, const std::string& prefix, int64_t channels) {
  return make_squeeze_excite(store, prefix, channels, quantize_channels((double)(channels / 4), 8));
}

Op make_squeeze_excite(ParamStore& store, const std::string& prefix, int64_t channels,
                       int64_t squeeze) {
  if (channels <= 0 || squeeze <= 0)
    throw std::invalid_argument(prefix + ": squeeze-excite channels must be positive");
  Op op;
  op.kind = OpKind::SqueezeExcite;
  op.name = prefix;
  op.se.channels = channels;
  op.se.squeeze = squeeze;
  op.se.fc1 = make_conv(store, prefix + ".fc1", channels, squeeze, 1, 1, 0, 1, 1, true);
  op.se.fc2 = make_conv(store, prefix + ".fc2", squeeze, channels, 1, 1, 0, 1, 1, true);
  op.se.inner = ActKind::ReLU;
  op.se.scale = ActKind::HardSigmoid;
  return op;
}

Op make_inverted_residual(ParamStore& store, const std::string& prefix, const BlockSpec& spec,
                          const NormSettings& ns) {
  validate_block_spec(spec, prefix);

  Op op;
  op.kind = OpKind::Residual;
  op.name = prefix;
  op.res.inC = spec.input_channels;
  op.res.outC = spec.out_channels;
  op.res.stride = spec.stride;
  op.res.has_shortcut = spec.stride == 1 && spec.input_channels == spec.out_channels;

  auto& body = op.res.body;
  int stage = 0;
  auto next = [&]() { return prefix + ".block." + std::to_string(stage++); };
  auto append = [&](ConvNormAct&& cna) {
    for (auto& o : cna.ops) body.push_back(std::move(o));
  };

  if (spec.expanded_channels != spec.input_channels) {
    ConvNormActOptions e;
    e.in_channels = spec.input_channels;
    e.out_channels = spec.expanded_channels;
    e.kernel = 1;
    e.activation = spec.activation;
    e.norm_settings = ns;
    append(make_conv_norm_act(store, next(), e));
  }

  ConvNormActOptions dw;
  dw.in_channels = spec.expanded_channels;
  dw.out_channels = spec.expanded_channels;
  dw.kernel = spec.kernel;
  dw.stride = spec.stride;
  dw.groups = spec.expanded_channels;
  dw.dilation = spec.dilation;
  dw.activation = spec.activation;
  dw.norm_settings = ns;
  append(make_conv_norm_act(store, next(), dw));

  if (spec.use_gate)
    body.push_back(make_squeeze_excite(store, next(), spec.expanded_channels));

  ConvNormActOptions pj;
  pj.in_channels = spec.expanded_channels;
  pj.out_channels = spec.out_channels;
  pj.kernel = 1;
  pj.activation = ActKind::None;
  pj.norm_settings = ns;
  append(make_conv_norm_act(store, next(), pj));

  return op;
}

} // namespace mv3
