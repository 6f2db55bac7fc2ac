#include "conv_kernels.hpp"
#include "aligned_alloc.hpp"
#include "gemm.h"
#include "mv3_compiler.hpp"

#include <cstring>
#include <stdexcept>
#include <string>

namespace mv3 {

// ---------- helpers ----------
static inline bool is_depthwise(const Conv2D& c) {
  return c.groups > 1 && c.groups == c.inC && c.groups == c.outC;
}

// 1x1, stride 1, no padding: the input plane already is the im2col matrix.
static inline bool is_pointwise(const Conv2D& c) {
  return c.kH == 1 && c.kW == 1 && c.strideH == 1 && c.strideW == 1 &&
         c.padH == 0 && c.padW == 0;
}

// col[(ci*kH + kh)*kW + kw][oh*oW + ow]
static void im2col(const float* src, int64_t C, int64_t H, int64_t W,
                   const Conv2D& c, int64_t oH, int64_t oW, float* col) {
  const int64_t L = oH * oW;
  const int64_t rows = C * c.kH * c.kW;
#pragma omp parallel for schedule(static) if(rows * L >= MV3_PARALLEL_MIN_WORK)
  for (int64_t row = 0; row < rows; ++row) {
    const int64_t kw = row % c.kW;
    const int64_t kh = (row / c.kW) % c.kH;
    const int64_t ci = row / (c.kW * c.kH);
    const float* plane = src + ci * H * W;
    float* dst = col + row * L;
    for (int64_t oh = 0; oh < oH; ++oh) {
      const int64_t ih = oh * c.strideH - c.padH + kh * c.dilationH;
      float* drow = dst + oh * oW;
      if ((uint64_t)ih >= (uint64_t)H) {
        std::memset(drow, 0, sizeof(float) * (size_t)oW);
        continue;
      }
      const float* srow = plane + ih * W;
      for (int64_t ow = 0; ow < oW; ++ow) {
        const int64_t iw = ow * c.strideW - c.padW + kw * c.dilationW;
        drow[ow] = ((uint64_t)iw < (uint64_t)W) ? srow[iw] : 0.f;
      }
    }
  }
}

// dst += col2im(col); one thread per input channel
static void col2im_accum(const float* col, int64_t C, int64_t H, int64_t W,
                         const Conv2D& c, int64_t oH, int64_t oW, float* dst) {
  const int64_t L = oH * oW;
#pragma omp parallel for schedule(static) if(C * c.kH * c.kW * L >= MV3_PARALLEL_MIN_WORK)
  for (int64_t ci = 0; ci < C; ++ci) {
    float* plane = dst + ci * H * W;
    for (int64_t kh = 0; kh < c.kH; ++kh) {
      for (int64_t kw = 0; kw < c.kW; ++kw) {
        const float* src = col + ((ci * c.kH + kh) * c.kW + kw) * L;
        for (int64_t oh = 0; oh < oH; ++oh) {
          const int64_t ih = oh * c.strideH - c.padH + kh * c.dilationH;
          if ((uint64_t)ih >= (uint64_t)H) continue;
          for (int64_t ow = 0; ow < oW; ++ow) {
            const int64_t iw = ow * c.strideW - c.padW + kw * c.dilationW;
            if ((uint64_t)iw >= (uint64_t)W) continue;
            plane[ih * W + iw] += src[oh * oW + ow];
          }
        }
      }
    }
  }
}

void validate_conv2d(const Conv2D& c) {
  if (c.inC <= 0 || c.outC <= 0 || c.kH <= 0 || c.kW <= 0 ||
      c.strideH <= 0 || c.strideW <= 0 || c.dilationH <= 0 || c.dilationW <= 0 ||
      c.padH < 0 || c.padW < 0)
    throw std::invalid_argument("Conv2D has a non-positive size, stride or dilation");
  if (c.groups <= 0 || c.inC % c.groups != 0 || c.outC % c.groups != 0)
    throw std::invalid_argument("Conv2D channels (in=" + std::to_string(c.inC) +
                                ", out=" + std::to_string(c.outC) +
                                ") are not divisible by groups=" + std::to_string(c.groups));
  if (!c.weight)
    throw std::invalid_argument("Conv2D has no weight tensor");
  const std::vector<int64_t> expect{c.outC, c.inC / c.groups, c.kH, c.kW};
  if (c.weight->value.dims != expect)
    throw std::invalid_argument("Conv2D weight is " + shape_str(c.weight->value.dims) +
                                ", expected " + shape_str(expect));
  if (c.bias && c.bias->value.dims != std::vector<int64_t>{c.outC})
    throw std::invalid_argument("Conv2D bias is " + shape_str(c.bias->value.dims) +
                                ", expected [" + std::to_string(c.outC) + "]");
}

TensorDesc conv2d_output_desc(const Conv2D& c, const TensorDesc& in) {
  if (in.C != c.inC)
    throw std::invalid_argument("Conv2D expects " + std::to_string(c.inC) +
                                " input channels, got " + std::to_string(in.C));
  const int64_t oH = conv_out_dim(in.H, c.padH, c.dilationH, c.kH, c.strideH);
  const int64_t oW = conv_out_dim(in.W, c.padW, c.dilationW, c.kW, c.strideW);
  if (oH <= 0 || oW <= 0)
    throw std::invalid_argument("Conv2D input " + std::to_string(in.H) + "x" +
                                std::to_string(in.W) + " is smaller than the dilated kernel");
  return TensorDesc{in.N, c.outC, oH, oW};
}

void conv2d_forward(const Conv2D& c, const Tensor& x, Tensor& y) {
  if (x.rank() != 4)
    throw std::invalid_argument("Conv2D expects a 4-D NCHW input, got " + shape_str(x.dims));
  const TensorDesc in{x.dim(0), x.dim(1), x.dim(2), x.dim(3)};
  const TensorDesc out = conv2d_output_desc(c, in);
  y = Tensor({out.N, out.C, out.H, out.W});

  const int64_t N = in.N, H = in.H, W = in.W, oH = out.H, oW = out.W;
  const int64_t L = oH * oW;
  const float* MV3_RESTRICT w = c.weight->value.ptr();
  const float* MV3_RESTRICT xp = x.ptr();
  float* MV3_RESTRICT yp = y.ptr();

  if (is_depthwise(c)) {
    const int64_t C = c.inC;
#pragma omp parallel for schedule(static) if(N * C * L * c.kH * c.kW >= MV3_PARALLEL_MIN_WORK)
    for (int64_t nc = 0; nc < N * C; ++nc) {
      const int64_t ch = nc % C;
      const float* plane = xp + nc * H * W;
      const float* wk = w + ch * c.kH * c.kW;
      float* dst = yp + nc * L;
      for (int64_t oh = 0; oh < oH; ++oh) {
        for (int64_t ow = 0; ow < oW; ++ow) {
          float acc = 0.f;
          for (int64_t kh = 0; kh < c.kH; ++kh) {
            const int64_t ih = oh * c.strideH - c.padH + kh * c.dilationH;
            if ((uint64_t)ih >= (uint64_t)H) continue;
            for (int64_t kw = 0; kw < c.kW; ++kw) {
              const int64_t iw = ow * c.strideW - c.padW + kw * c.dilationW;
              if ((uint64_t)iw >= (uint64_t)W) continue;
              acc += plane[ih * W + iw] * wk[kh * c.kW + kw];
            }
          }
          dst[oh * oW + ow] = acc;
        }
      }
    }
  } else {
    const int64_t G = c.groups;
    const int64_t Cin_g = c.inC / G, Cout_g = c.outC / G;
    const int64_t Kg = Cin_g * c.kH * c.kW;
    const bool pw = is_pointwise(c);
    AlignedBuffer col;
    if (!pw) col.reserve((size_t)(Kg * L));

    for (int64_t n = 0; n < N; ++n) {
      for (int64_t g = 0; g < G; ++g) {
        const float* src = xp + (n * c.inC + g * Cin_g) * H * W;
        const float* B = src;
        if (!pw) {
          im2col(src, Cin_g, H, W, c, oH, oW, col.data());
          B = col.data();
        }
        gemm::sgemm_blocked(w + g * Cout_g * Kg, (int)Cout_g, (int)Kg,
                            B, (int)L,
                            yp + (n * c.outC + g * Cout_g) * L);
      }
    }
  }

  if (c.bias) {
    const float* b = c.bias->value.ptr();
#pragma omp parallel for schedule(static) if(N * c.outC * L >= MV3_PARALLEL_MIN_WORK)
    for (int64_t no = 0; no < N * c.outC; ++no) {
      const float bv = b[no % c.outC];
      float* dst = yp + no * L;
      for (int64_t l = 0; l < L; ++l) dst[l] += bv;
    }
  }
}

void conv2d_backward(const Conv2D& c, const Tensor& x, const Tensor& gy, Tensor* gx) {
  if (x.rank() != 4)
    throw std::invalid_argument("Conv2D backward expects a 4-D input, got " + shape_str(x.dims));
  const TensorDesc in{x.dim(0), x.dim(1), x.dim(2), x.dim(3)};
  const TensorDesc out = conv2d_output_desc(c, in);
  if (gy.dims != std::vector<int64_t>{out.N, out.C, out.H, out.W})
    throw std::invalid_argument("Conv2D backward got gradient " + shape_str(gy.dims));

  const int64_t N = in.N, H = in.H, W = in.W, oH = out.H, oW = out.W;
  const int64_t L = oH * oW;
  const float* w = c.weight->value.ptr();
  float* gw = c.weight->grad.ptr();
  const float* xp = x.ptr();
  const float* gyp = gy.ptr();
  float* gxp = nullptr;
  if (gx) {
    *gx = Tensor(x.dims);
    gxp = gx->ptr();
  }

  if (is_depthwise(c)) {
    const int64_t C = c.inC;
    // One thread per channel: it owns that channel's kernel grad and input-grad planes
#pragma omp parallel for schedule(static) if(N * C * L * c.kH * c.kW >= MV3_PARALLEL_MIN_WORK)
    for (int64_t ch = 0; ch < C; ++ch) {
      const float* wk = w + ch * c.kH * c.kW;
      float* gwk = gw + ch * c.kH * c.kW;
      for (int64_t n = 0; n < N; ++n) {
        const float* plane = xp + (n * C + ch) * H * W;
        float* gplane = gxp ? gxp + (n * C + ch) * H * W : nullptr;
        const float* g = gyp + (n * C + ch) * L;
        for (int64_t oh = 0; oh < oH; ++oh) {
          for (int64_t ow = 0; ow < oW; ++ow) {
            const float go = g[oh * oW + ow];
            for (int64_t kh = 0; kh < c.kH; ++kh) {
              const int64_t ih = oh * c.strideH - c.padH + kh * c.dilationH;
              if ((uint64_t)ih >= (uint64_t)H) continue;
              for (int64_t kw = 0; kw < c.kW; ++kw) {
                const int64_t iw = ow * c.strideW - c.padW + kw * c.dilationW;
                if ((uint64_t)iw >= (uint64_t)W) continue;
                gwk[kh * c.kW + kw] += go * plane[ih * W + iw];
                if (gplane) gplane[ih * W + iw] += go * wk[kh * c.kW + kw];
              }
            }
          }
        }
      }
    }
  } else {
    const int64_t G = c.groups;
    const int64_t Cin_g = c.inC / G, Cout_g = c.outC / G;
    const int64_t Kg = Cin_g * c.kH * c.kW;
    const bool pw = is_pointwise(c);
    AlignedBuffer col, gcol;
    if (!pw) {
      col.reserve((size_t)(Kg * L));
      if (gx) gcol.reserve((size_t)(Kg * L));
    }

    for (int64_t n = 0; n < N; ++n) {
      for (int64_t g = 0; g < G; ++g) {
        const float* src = xp + (n * c.inC + g * Cin_g) * H * W;
        const float* B = src;
        if (!pw) {
          im2col(src, Cin_g, H, W, c, oH, oW, col.data());
          B = col.data();
        }
        const float* gY = gyp + (n * c.outC + g * Cout_g) * L;
        const float* Wg = w + g * Cout_g * Kg;

        // dW_g [Cout_g x Kg] += dY [Cout_g x L] * col^T
        gemm::sgemm(false, true, (int)Cout_g, (int)Kg, (int)L,
                    1.f, gY, (int)L, B, (int)L, 1.f, gw + g * Cout_g * Kg, (int)Kg);

        if (gx) {
          float* gsrc = gxp + (n * c.inC + g * Cin_g) * H * W;
          // dcol [Kg x L] = W_g^T * dY
          if (pw) {
            gemm::sgemm(true, false, (int)Kg, (int)L, (int)Cout_g,
                        1.f, Wg, (int)Kg, gY, (int)L, 1.f, gsrc, (int)L);
          } else {
            gemm::sgemm(true, false, (int)Kg, (int)L, (int)Cout_g,
                        1.f, Wg, (int)Kg, gY, (int)L, 0.f, gcol.data(), (int)L);
            col2im_accum(gcol.data(), Cin_g, H, W, c, oH, oW, gsrc);
          }
        }
      }
    }
  }

  if (c.bias) {
    float* gb = c.bias->grad.ptr();
#pragma omp parallel for schedule(static) if(N * c.outC * L >= MV3_PARALLEL_MIN_WORK)
    for (int64_t oc = 0; oc < c.outC; ++oc) {
      double s = 0.0;
      for (int64_t n = 0; n < N; ++n) {
        const float* g = gyp + (n * c.outC + oc) * L;
        for (int64_t l = 0; l < L; ++l) s += g[l];
      }
      gb[oc] += (float)s;
    }
  }
}

} // namespace mv3
