#include "block_spec.hpp"
#include "channel_quantizer.hpp"

#include <cstdio>
#include <stdexcept>
#include <string>

namespace mv3 {

static void check_width_mult(double width_mult) {
  if (!(width_mult > 0.0))
    throw std::invalid_argument("width_mult must be positive, got " + std::to_string(width_mult));
}

// A scaled width under divisor/2 rounds to zero channels; only the
// quantizer's minimum clamp would keep the stage alive.
static void check_min_width(int64_t nominal, double width_mult, const char* what) {
  if ((double)nominal * width_mult < (double)kChannelDivisor / 2.0)
    throw std::invalid_argument(std::string("width_mult ") + std::to_string(width_mult) +
                                " collapses " + what + " (" + std::to_string(nominal) +
                                " nominal channels) below " + std::to_string(kChannelDivisor / 2));
}

void validate_block_spec(const BlockSpec& s, const std::string& where) {
  const std::string at = where.empty() ? "" : where + ": ";
  if (s.stride < 1 || s.stride > 2)
    throw std::invalid_argument(at + "Illegal stride value " + std::to_string(s.stride) + ", expected 1 or 2");
  if (s.kernel <= 0 || s.kernel % 2 == 0)
    throw std::invalid_argument(at + "Kernel size must be a positive odd number, got " + std::to_string(s.kernel));
  if (s.dilation < 1)
    throw std::invalid_argument(at + "Dilation must be >= 1, got " + std::to_string(s.dilation));
  if (s.activation != ActKind::ReLU && s.activation != ActKind::HardSwish)
    throw std::invalid_argument(at + "Block activation must be ReLU or HardSwish, got " +
                                act_kind_name(s.activation));
  if (s.input_channels <= 0 || s.expanded_channels <= 0 || s.out_channels <= 0)
    throw std::invalid_argument(at + "Channel counts must be positive, got " + block_spec_str(s));
}

int64_t adjust_channels(int64_t channels, double width_mult) {
  return quantize_channels((double)channels * width_mult, kChannelDivisor);
}

BlockSpec make_block_spec(int64_t input_c, int64_t kernel, int64_t expanded_c, int64_t out_c,
                          bool use_gate, ActKind activation, int64_t stride, int64_t dilation,
                          double width_mult) {
  check_width_mult(width_mult);

  BlockSpec s;
  s.kernel = kernel;
  s.use_gate = use_gate;
  s.activation = activation;
  s.stride = stride;
  s.dilation = dilation;
  // Geometry first, so a bad stride is reported before any width math.
  s.input_channels = s.expanded_channels = s.out_channels = 1;
  validate_block_spec(s);

  s.input_channels = adjust_channels(input_c, width_mult);
  s.expanded_channels = adjust_channels(expanded_c, width_mult);
  s.out_channels = adjust_channels(out_c, width_mult);
  return s;
}

namespace {
struct NominalRow {
  int64_t input_c, kernel, expanded_c, out_c;
  bool gate;
  ActKind act;
  int64_t stride;
  bool tail;   // widths divided by reduce_divider, dilation applies
};
}

std::vector<BlockSpec> mobilenet_v3_small_schedule(double width_mult, bool reduced_tail, bool dilated) {
  check_width_mult(width_mult);
  const int64_t rd = reduced_tail ? 2 : 1;
  const int64_t dil = dilated ? 2 : 1;
  const ActKind RE = ActKind::ReLU, HS = ActKind::HardSwish;

  const NominalRow rows[] = {
    // input_c, kernel, exp_c, out_c, gate, act, stride, tail
    {16,      3, 16,       16,      true,  RE, 2, false},
    {16,      3, 72,       24,      false, RE, 2, false},
    {24,      3, 88,       24,      false, RE, 1, false},
    {24,      5, 96,       40,      true,  HS, 2, false},
    {40,      5, 240,      40,      true,  HS, 1, false},
    {40,      5, 240,      40,      true,  HS, 1, false},
    {40,      5, 120,      48,      true,  HS, 1, false},
    {48,      5, 144,      48,      true,  HS, 1, false},
    {48,      5, 288 / rd, 96 / rd, true,  HS, 2, true},
    {96 / rd, 5, 576 / rd, 96 / rd, true,  HS, 1, true},
    {96 / rd, 5, 576 / rd, 96 / rd, true,  HS, 1, true},
  };

  std::vector<BlockSpec> out;
  out.reserve(sizeof(rows) / sizeof(rows[0]));
  for (const auto& r : rows) {
    check_min_width(r.input_c, width_mult, "a block input");
    check_min_width(r.expanded_c, width_mult, "a block expansion");
    check_min_width(r.out_c, width_mult, "a block output");
    out.push_back(make_block_spec(r.input_c, r.kernel, r.expanded_c, r.out_c,
                                  r.gate, r.act, r.stride, r.tail ? dil : 1, width_mult));
  }
  return out;
}

int64_t tail_channels(double width_mult) {
  check_width_mult(width_mult);
  check_min_width(576, width_mult, "the final stage");
  return quantize_channels(576.0 * width_mult, kChannelDivisor);
}

int64_t classifier_hidden(double width_mult, bool reduced_tail) {
  check_width_mult(width_mult);
  const int64_t nominal = 1024 / (reduced_tail ? 2 : 1);
  check_min_width(nominal, width_mult, "the classifier");
  return quantize_channels((double)nominal * width_mult, kChannelDivisor);
}

std::string block_spec_str(const BlockSpec& s) {
  char buf[160];
  std::snprintf(buf, sizeof(buf), "in=%lld k=%lld exp=%lld out=%lld se=%d act=%s s=%lld d=%lld",
                (long long)s.input_channels, (long long)s.kernel, (long long)s.expanded_channels,
                (long long)s.out_channels, s.use_gate ? 1 : 0,
                s.activation == ActKind::HardSwish ? "HS" : "RE",
                (long long)s.stride, (long long)s.dilation);
  return std::string(buf);
}

} // namespace mv3
