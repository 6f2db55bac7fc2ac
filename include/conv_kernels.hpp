#pragma once
#include "ir.hpp"
#include "tensor.hpp"

namespace mv3 {

// Shape check + output allocation helper shared by forward and the planner.
TensorDesc conv2d_output_desc(const Conv2D& c, const TensorDesc& in);

// Throws std::invalid_argument when channel counts are not divisible by
// groups or the weight tensor does not match the declared geometry.
void validate_conv2d(const Conv2D& c);

// NCHW in/out. Grouped convolutions lower to im2col + SGEMM per group;
// depthwise (groups == inC == outC) runs a direct loop.
void conv2d_forward(const Conv2D& c, const Tensor& x, Tensor& y);

// Accumulates dL/dW (and dL/db) into c.weight->grad / c.bias->grad.
// Writes dL/dx into *gx when gx is non-null.
void conv2d_backward(const Conv2D& c, const Tensor& x, const Tensor& gy, Tensor* gx);

} // namespace mv3
