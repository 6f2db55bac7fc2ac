#include "kernels.hpp"
#include "epilogue.hpp"
#include "gemm.h"
#include "mv3_compiler.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace mv3 {

// ---------- helpers ----------
static void split_channels(const Tensor& x, const char* who, int64_t C,
                           int64_t& N, int64_t& inner) {
  if (x.rank() < 2)
    throw std::invalid_argument(std::string(who) + " expects [N,C,...], got " + shape_str(x.dims));
  if (x.dim(1) != C)
    throw std::invalid_argument(std::string(who) + " expects " + std::to_string(C) +
                                " channels, got " + std::to_string(x.dim(1)));
  N = x.dim(0);
  inner = 1;
  for (int i = 2; i < x.rank(); ++i) inner *= x.dim(i);
}

static void require_same_shape(const Tensor& a, const Tensor& b, const char* who) {
  if (!a.same_shape(b))
    throw std::invalid_argument(std::string(who) + ": shape " + shape_str(a.dims) +
                                " does not match " + shape_str(b.dims));
}

// ---------- BatchNorm ----------
void batchnorm_forward_eval(const BatchNorm& bn, const Tensor& x, Tensor& y) {
  int64_t N, HW;
  split_channels(x, "BatchNorm", bn.C, N, HW);
  y = Tensor(x.dims);
  const float* w  = bn.weight->value.ptr();
  const float* b  = bn.bias->value.ptr();
  const float* rm = bn.running_mean->value.ptr();
  const float* rv = bn.running_var->value.ptr();
  const float* xp = x.ptr();
  float* yp = y.ptr();
  const int64_t C = bn.C;

#pragma omp parallel for schedule(static) if(N * C * HW >= MV3_PARALLEL_MIN_WORK)
  for (int64_t nc = 0; nc < N * C; ++nc) {
    const int64_t c = nc % C;
    const float scale = w[c] / std::sqrt(rv[c] + bn.eps);
    const float shift = b[c] - rm[c] * scale;
    const float* src = xp + nc * HW;
    float* dst = yp + nc * HW;
    MV3_SIMD
    for (int64_t i = 0; i < HW; ++i) dst[i] = src[i] * scale + shift;
  }
}

void batchnorm_forward_train(const BatchNorm& bn, const Tensor& x, Tensor& y,
                             Tensor& xhat, Tensor& inv_std) {
  int64_t N, HW;
  split_channels(x, "BatchNorm", bn.C, N, HW);
  const int64_t C = bn.C;
  const int64_t cnt = N * HW;
  if (cnt <= 1)
    throw std::invalid_argument("Expected more than 1 value per channel when training, got input size " +
                                shape_str(x.dims));

  y = Tensor(x.dims);
  xhat = Tensor(x.dims);
  inv_std = Tensor({C});
  const float* w = bn.weight->value.ptr();
  const float* b = bn.bias->value.ptr();
  float* rm = bn.running_mean->value.ptr();
  float* rv = bn.running_var->value.ptr();
  const float m = bn.momentum;
  const float* xp = x.ptr();
  float* yp = y.ptr();
  float* hp = xhat.ptr();
  float* ip = inv_std.ptr();

#pragma omp parallel for schedule(static) if(cnt * C >= MV3_PARALLEL_MIN_WORK)
  for (int64_t c = 0; c < C; ++c) {
    double sum = 0.0;
    for (int64_t n = 0; n < N; ++n) {
      const float* src = xp + (n * C + c) * HW;
      for (int64_t i = 0; i < HW; ++i) sum += src[i];
    }
    const double mean = sum / (double)cnt;
    double sq = 0.0;
    for (int64_t n = 0; n < N; ++n) {
      const float* src = xp + (n * C + c) * HW;
      for (int64_t i = 0; i < HW; ++i) { const double d = src[i] - mean; sq += d * d; }
    }
    const double var = sq / (double)cnt;
    const float inv = (float)(1.0 / std::sqrt(var + (double)bn.eps));
    ip[c] = inv;

    for (int64_t n = 0; n < N; ++n) {
      const float* src = xp + (n * C + c) * HW;
      float* h = hp + (n * C + c) * HW;
      float* dst = yp + (n * C + c) * HW;
      for (int64_t i = 0; i < HW; ++i) {
        h[i] = (float)(src[i] - mean) * inv;
        dst[i] = h[i] * w[c] + b[c];
      }
    }

    const double unbiased = var * (double)cnt / (double)(cnt - 1);
    rm[c] = (1.f - m) * rm[c] + m * (float)mean;
    rv[c] = (1.f - m) * rv[c] + m * (float)unbiased;
  }

  if (bn.num_batches_tracked) bn.num_batches_tracked->value.data[0] += 1.f;
}

void batchnorm_backward(const BatchNorm& bn, const Tensor& xhat, const Tensor& inv_std,
                        const Tensor& gy, Tensor& gx) {
  require_same_shape(xhat, gy, "BatchNorm backward");
  int64_t N, HW;
  split_channels(gy, "BatchNorm backward", bn.C, N, HW);
  const int64_t C = bn.C;
  const int64_t cnt = N * HW;
  gx = Tensor(gy.dims);

  const float* w = bn.weight->value.ptr();
  float* gw = bn.weight->grad.ptr();
  float* gb = bn.bias->grad.ptr();
  const float* hp = xhat.ptr();
  const float* ip = inv_std.ptr();
  const float* gp = gy.ptr();
  float* gxp = gx.ptr();

#pragma omp parallel for schedule(static) if(cnt * C >= MV3_PARALLEL_MIN_WORK)
  for (int64_t c = 0; c < C; ++c) {
    double sg = 0.0, sgh = 0.0;
    for (int64_t n = 0; n < N; ++n) {
      const float* g = gp + (n * C + c) * HW;
      const float* h = hp + (n * C + c) * HW;
      for (int64_t i = 0; i < HW; ++i) { sg += g[i]; sgh += (double)g[i] * h[i]; }
    }
    gw[c] += (float)sgh;
    gb[c] += (float)sg;

    // dx = w * inv / cnt * (cnt * dy - sum(dy) - xhat * sum(dy * xhat))
    const float k = w[c] * ip[c] / (float)cnt;
    const float msg = (float)sg, msgh = (float)sgh;
    for (int64_t n = 0; n < N; ++n) {
      const float* g = gp + (n * C + c) * HW;
      const float* h = hp + (n * C + c) * HW;
      float* dst = gxp + (n * C + c) * HW;
      for (int64_t i = 0; i < HW; ++i)
        dst[i] = k * ((float)cnt * g[i] - msg - h[i] * msgh);
    }
  }
}

// ---------- elementwise ----------
void activation_forward(ActKind k, const Tensor& x, Tensor& y) {
  y = Tensor(x.dims);
  const int64_t n = x.numel();
  const float* xp = x.ptr();
  float* yp = y.ptr();
  const int64_t chunk = 4096;
#pragma omp parallel for schedule(static) if(n >= MV3_PARALLEL_MIN_WORK)
  for (int64_t s = 0; s < n; s += chunk) {
    const int64_t len = std::min(chunk, n - s);
    apply_activation(xp + s, yp + s, len, k);
  }
}

void activation_backward(ActKind k, const Tensor& x, const Tensor& gy, Tensor& gx) {
  require_same_shape(x, gy, "Activation backward");
  gx = Tensor(x.dims);
  const int64_t n = x.numel();
  const float* xp = x.ptr();
  const float* gp = gy.ptr();
  float* gxp = gx.ptr();
  const int64_t chunk = 4096;
#pragma omp parallel for schedule(static) if(n >= MV3_PARALLEL_MIN_WORK)
  for (int64_t s = 0; s < n; s += chunk) {
    const int64_t len = std::min(chunk, n - s);
    apply_activation_grad(xp + s, gp + s, gxp + s, len, k);
  }
}

void channel_scale_forward(const Tensor& x, const Tensor& s, Tensor& y) {
  if (x.rank() != 4 || s.dims != std::vector<int64_t>{x.dim(0), x.dim(1), 1, 1})
    throw std::invalid_argument("Channel scale " + shape_str(s.dims) +
                                " does not broadcast over " + shape_str(x.dims));
  y = Tensor(x.dims);
  const int64_t NC = x.dim(0) * x.dim(1), HW = x.dim(2) * x.dim(3);
  const float* xp = x.ptr();
  const float* sp = s.ptr();
  float* yp = y.ptr();
#pragma omp parallel for schedule(static) if(NC * HW >= MV3_PARALLEL_MIN_WORK)
  for (int64_t nc = 0; nc < NC; ++nc) {
    const float sv = sp[nc];
    const float* src = xp + nc * HW;
    float* dst = yp + nc * HW;
    for (int64_t i = 0; i < HW; ++i) dst[i] = src[i] * sv;
  }
}

void channel_scale_backward(const Tensor& x, const Tensor& s, const Tensor& gy,
                            Tensor& gx, Tensor& gs) {
  require_same_shape(x, gy, "Channel scale backward");
  gx = Tensor(x.dims);
  gs = Tensor(s.dims);
  const int64_t NC = x.dim(0) * x.dim(1), HW = x.dim(2) * x.dim(3);
  const float* xp = x.ptr();
  const float* sp = s.ptr();
  const float* gp = gy.ptr();
  float* gxp = gx.ptr();
  float* gsp = gs.ptr();
#pragma omp parallel for schedule(static) if(NC * HW >= MV3_PARALLEL_MIN_WORK)
  for (int64_t nc = 0; nc < NC; ++nc) {
    const float sv = sp[nc];
    const float* src = xp + nc * HW;
    const float* g = gp + nc * HW;
    float* dst = gxp + nc * HW;
    double acc = 0.0;
    for (int64_t i = 0; i < HW; ++i) {
      dst[i] = g[i] * sv;
      acc += (double)g[i] * src[i];
    }
    gsp[nc] = (float)acc;
  }
}

void add_inplace(Tensor& y, const Tensor& x) {
  require_same_shape(y, x, "Residual add");
  const int64_t n = y.numel();
  float* yp = y.ptr();
  const float* xp = x.ptr();
#pragma omp parallel for schedule(static) if(n >= MV3_PARALLEL_MIN_WORK)
  for (int64_t i = 0; i < n; ++i) yp[i] += xp[i];
}

// ---------- pooling / head ----------
void global_avg_pool_forward(const Tensor& x, Tensor& y) {
  if (x.rank() != 4)
    throw std::invalid_argument("GlobalAvgPool expects [N,C,H,W], got " + shape_str(x.dims));
  const int64_t N = x.dim(0), C = x.dim(1), HW = x.dim(2) * x.dim(3);
  y = Tensor({N, C, 1, 1});
  const float* xp = x.ptr();
  float* yp = y.ptr();
#pragma omp parallel for schedule(static) if(N * C * HW >= MV3_PARALLEL_MIN_WORK)
  for (int64_t nc = 0; nc < N * C; ++nc) {
    const float* src = xp + nc * HW;
    double s = 0.0;
    for (int64_t i = 0; i < HW; ++i) s += src[i];
    yp[nc] = (float)(s / (double)HW);
  }
}

void global_avg_pool_backward(const std::vector<int64_t>& in_dims, const Tensor& gy, Tensor& gx) {
  if (in_dims.size() != 4 || gy.numel() != in_dims[0] * in_dims[1])
    throw std::invalid_argument("GlobalAvgPool backward got gradient " + shape_str(gy.dims));
  gx = Tensor(in_dims);
  const int64_t NC = in_dims[0] * in_dims[1], HW = in_dims[2] * in_dims[3];
  const float inv = 1.f / (float)HW;
  const float* gp = gy.ptr();
  float* gxp = gx.ptr();
#pragma omp parallel for schedule(static) if(NC * HW >= MV3_PARALLEL_MIN_WORK)
  for (int64_t nc = 0; nc < NC; ++nc) {
    const float g = gp[nc] * inv;
    float* dst = gxp + nc * HW;
    for (int64_t i = 0; i < HW; ++i) dst[i] = g;
  }
}

void linear_forward(const Linear& fc, const Tensor& x, Tensor& y) {
  if (x.rank() != 2 || x.dim(1) != fc.inF)
    throw std::invalid_argument("Linear expects [N," + std::to_string(fc.inF) + "], got " +
                                shape_str(x.dims));
  const int64_t N = x.dim(0);
  y = Tensor({N, fc.outF});
  gemm::sgemm(false, true, (int)N, (int)fc.outF, (int)fc.inF,
              1.f, x.ptr(), (int)fc.inF, fc.weight->value.ptr(), (int)fc.inF,
              0.f, y.ptr(), (int)fc.outF);
  if (fc.bias) {
    const float* b = fc.bias->value.ptr();
    float* yp = y.ptr();
    for (int64_t n = 0; n < N; ++n)
      for (int64_t o = 0; o < fc.outF; ++o) yp[n * fc.outF + o] += b[o];
  }
}

void linear_backward(const Linear& fc, const Tensor& x, const Tensor& gy, Tensor* gx) {
  const int64_t N = x.dim(0);
  if (gy.dims != std::vector<int64_t>{N, fc.outF})
    throw std::invalid_argument("Linear backward got gradient " + shape_str(gy.dims));

  // dW [outF x inF] += dY^T X
  gemm::sgemm(true, false, (int)fc.outF, (int)fc.inF, (int)N,
              1.f, gy.ptr(), (int)fc.outF, x.ptr(), (int)fc.inF,
              1.f, fc.weight->grad.ptr(), (int)fc.inF);
  if (fc.bias) {
    float* gb = fc.bias->grad.ptr();
    const float* gp = gy.ptr();
    for (int64_t o = 0; o < fc.outF; ++o) {
      double s = 0.0;
      for (int64_t n = 0; n < N; ++n) s += gp[n * fc.outF + o];
      gb[o] += (float)s;
    }
  }
  if (gx) {
    *gx = Tensor(x.dims);
    gemm::sgemm(false, false, (int)N, (int)fc.inF, (int)fc.outF,
                1.f, gy.ptr(), (int)fc.outF, fc.weight->value.ptr(), (int)fc.inF,
                0.f, gx->ptr(), (int)fc.inF);
  }
}

void dropout_forward(float p, const Tensor& x, Tensor& y, Tensor& mask, std::mt19937& rng) {
  y = Tensor(x.dims);
  mask = Tensor(x.dims);
  const int64_t n = x.numel();
  const float keep = p >= 1.f ? 0.f : 1.f / (1.f - p);
  std::bernoulli_distribution drop(p);
  // Single-threaded so the mask depends only on the RNG state
  for (int64_t i = 0; i < n; ++i) {
    mask.data[i] = drop(rng) ? 0.f : keep;
    y.data[i] = x.data[i] * mask.data[i];
  }
}

void dropout_backward(const Tensor& mask, const Tensor& gy, Tensor& gx) {
  require_same_shape(mask, gy, "Dropout backward");
  gx = Tensor(gy.dims);
  const int64_t n = gy.numel();
  for (int64_t i = 0; i < n; ++i) gx.data[i] = gy.data[i] * mask.data[i];
}

} // namespace mv3
