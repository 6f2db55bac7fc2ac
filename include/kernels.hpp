#pragma once
#include <random>
#include <vector>
#include "ir.hpp"
#include "tensor.hpp"

namespace mv3 {

// ---- BatchNorm (per channel over N and all trailing spatial dims) ----

// Frozen statistics: y = (x - running_mean) / sqrt(running_var + eps) * w + b
void batchnorm_forward_eval(const BatchNorm& bn, const Tensor& x, Tensor& y);

// Batch statistics. Updates running_mean, running_var (unbiased) with bn.momentum
// and increments num_batches_tracked. xhat and inv_std are kept for backward.
// Throws std::invalid_argument when a channel sees a single value.
void batchnorm_forward_train(const BatchNorm& bn, const Tensor& x, Tensor& y,
                             Tensor& xhat, Tensor& inv_std);

// Accumulates weight/bias grads; writes dL/dx into gx.
void batchnorm_backward(const BatchNorm& bn, const Tensor& xhat, const Tensor& inv_std,
                        const Tensor& gy, Tensor& gx);

// ---- elementwise ----
void activation_forward(ActKind k, const Tensor& x, Tensor& y);
void activation_backward(ActKind k, const Tensor& x, const Tensor& gy, Tensor& gx);

// y = x * s, s: [N,C,1,1] broadcast over H*W
void channel_scale_forward(const Tensor& x, const Tensor& s, Tensor& y);
// gx = gy * s ; gs = sum_hw(gy * x)
void channel_scale_backward(const Tensor& x, const Tensor& s, const Tensor& gy,
                            Tensor& gx, Tensor& gs);

// y += x (same shape)
void add_inplace(Tensor& y, const Tensor& x);

// ---- pooling / head ----

// [N,C,H,W] -> [N,C,1,1]
void global_avg_pool_forward(const Tensor& x, Tensor& y);
void global_avg_pool_backward(const std::vector<int64_t>& in_dims, const Tensor& gy, Tensor& gx);

// x: [N, inF] -> y: [N, outF] = x W^T + b
void linear_forward(const Linear& fc, const Tensor& x, Tensor& y);
void linear_backward(const Linear& fc, const Tensor& x, const Tensor& gy, Tensor* gx);

// Inverted dropout. mask holds 0 or 1/(1-p) per element.
void dropout_forward(float p, const Tensor& x, Tensor& y, Tensor& mask, std::mt19937& rng);
void dropout_backward(const Tensor& mask, const Tensor& gy, Tensor& gx);

} // namespace mv3
