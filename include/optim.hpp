#pragma once
#include <cstdint>
#include <vector>
#include "params.hpp"
#include "tensor.hpp"

namespace mv3 {

// Mean softmax cross-entropy over the batch. logits: [B, K].
// Writes dL/dlogits into *grad when non-null; counts argmax hits in *correct.
double cross_entropy(const Tensor& logits, const std::vector<int32_t>& labels,
                     Tensor* grad, int64_t* correct);

struct SGDOptions {
  double lr = 0.01;
  double momentum = 0.9;
  double dampening = 0.0;
  double weight_decay = 1e-4;
  bool nesterov = false;
};

// Stochastic gradient descent with momentum and L2 weight decay:
//   d = g + wd * p
//   buf = d                                   (first step)
//   buf = momentum * buf + (1 - dampening) * d
//   p -= lr * (nesterov ? d + momentum * buf : buf)
class SGD {
public:
  SGD(std::vector<ParamRef> params, const SGDOptions& opts);

  void step();
  void zero_grad();

  double lr() const { return opts_.lr; }
  void set_lr(double lr) { opts_.lr = lr; }
  const SGDOptions& options() const { return opts_; }

private:
  std::vector<ParamRef> params_;
  SGDOptions opts_;
  std::vector<Tensor> buf_;
  bool has_buf_ = false;
};

// lr(t) = eta_min + (base_lr - eta_min) * (1 + cos(pi * t / T_max)) / 2,
// t counted in scheduler steps (epochs).
class CosineAnnealingLR {
public:
  CosineAnnealingLR(SGD& opt, int t_max, double eta_min = 0.0);

  void step();
  double lr_at(int t) const;
  int last_epoch() const { return last_epoch_; }

private:
  SGD& opt_;
  int t_max_;
  double eta_min_, base_lr_;
  int last_epoch_ = 0;
};

} // namespace mv3
