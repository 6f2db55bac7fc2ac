#include "optim.hpp"
#include "mv3_compiler.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace mv3 {

double cross_entropy(const Tensor& logits, const std::vector<int32_t>& labels,
                     Tensor* grad, int64_t* correct) {
  if (logits.rank() != 2 || logits.dim(0) != (int64_t)labels.size())
    throw std::invalid_argument("cross_entropy: logits " + shape_str(logits.dims) + " vs " +
                                std::to_string(labels.size()) + " labels");
  const int64_t B = logits.dim(0), K = logits.dim(1);
  if (B == 0) throw std::invalid_argument("cross_entropy: empty batch");
  if (grad) *grad = Tensor(logits.dims);

  double total = 0.0;
  int64_t hits = 0;
  for (int64_t b = 0; b < B; ++b) {
    const int32_t y = labels[(size_t)b];
    if (y < 0 || y >= K)
      throw std::invalid_argument("cross_entropy: label " + std::to_string(y) + " out of range");
    const float* row = logits.ptr() + b * K;

    int64_t arg = 0;
    for (int64_t k = 1; k < K; ++k)
      if (row[k] > row[arg]) arg = k;
    if (arg == y) ++hits;

    const double mx = row[arg];
    double sum = 0.0;
    for (int64_t k = 0; k < K; ++k) sum += std::exp((double)row[k] - mx);
    const double lse = mx + std::log(sum);
    total += lse - (double)row[y];

    if (grad) {
      float* g = grad->ptr() + b * K;
      for (int64_t k = 0; k < K; ++k) {
        const double p = std::exp((double)row[k] - lse);
        g[k] = (float)((p - (k == y ? 1.0 : 0.0)) / (double)B);
      }
    }
  }
  if (correct) *correct = hits;
  return total / (double)B;
}

SGD::SGD(std::vector<ParamRef> params, const SGDOptions& opts)
: params_(std::move(params)), opts_(opts) {
  if (opts_.lr < 0.0) throw std::invalid_argument("Invalid learning rate: " + std::to_string(opts_.lr));
  if (opts_.momentum < 0.0) throw std::invalid_argument("Invalid momentum value: " + std::to_string(opts_.momentum));
  if (opts_.weight_decay < 0.0)
    throw std::invalid_argument("Invalid weight_decay value: " + std::to_string(opts_.weight_decay));
  if (opts_.nesterov && (opts_.momentum <= 0.0 || opts_.dampening != 0.0))
    throw std::invalid_argument("Nesterov momentum requires a momentum and zero dampening");
}

void SGD::zero_grad() {
  for (auto& r : params_) r.param->grad.zero();
}

void SGD::step() {
  const float lr = (float)opts_.lr;
  const float mom = (float)opts_.momentum;
  const float damp = (float)opts_.dampening;
  const float wd = (float)opts_.weight_decay;
  const bool first = !has_buf_;
  if (first && mom != 0.f) {
    buf_.clear();
    buf_.reserve(params_.size());
    for (auto& r : params_) buf_.emplace_back(r.param->value.dims);
  }

  for (size_t i = 0; i < params_.size(); ++i) {
    Param& p = *params_[i].param;
    float* w = p.value.ptr();
    const float* g = p.grad.ptr();
    float* buf = mom != 0.f ? buf_[i].ptr() : nullptr;
    const int64_t n = p.value.numel();

#pragma omp parallel for schedule(static) if(n >= MV3_PARALLEL_MIN_WORK)
    for (int64_t j = 0; j < n; ++j) {
      float d = g[j] + wd * w[j];
      if (buf) {
        buf[j] = first ? d : mom * buf[j] + (1.f - damp) * d;
        d = opts_.nesterov ? d + mom * buf[j] : buf[j];
      }
      w[j] -= lr * d;
    }
  }
  if (mom != 0.f) has_buf_ = true;
}

CosineAnnealingLR::CosineAnnealingLR(SGD& opt, int t_max, double eta_min)
: opt_(opt), t_max_(t_max), eta_min_(eta_min), base_lr_(opt.lr()) {
  if (t_max_ <= 0)
    throw std::invalid_argument("CosineAnnealingLR needs T_max > 0, got " + std::to_string(t_max_));
}

double CosineAnnealingLR::lr_at(int t) const {
  const double pi = std::acos(-1.0);
  return eta_min_ + (base_lr_ - eta_min_) * (1.0 + std::cos(pi * (double)t / (double)t_max_)) / 2.0;
}

void CosineAnnealingLR::step() {
  ++last_epoch_;
  opt_.set_lr(lr_at(last_epoch_));
}

} // namespace mv3
