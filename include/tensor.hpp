#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mv3 {

// Dense row-major float32 tensor. Activations are NCHW.
struct Tensor {
  std::vector<int64_t> dims;
  std::vector<float> data;

  Tensor() = default;
  explicit Tensor(std::vector<int64_t> d, float fill = 0.0f);

  int64_t numel() const;
  int rank() const { return static_cast<int>(dims.size()); }
  int64_t dim(int i) const { return dims[static_cast<size_t>(i)]; }
  float* ptr() { return data.data(); }
  const float* ptr() const { return data.data(); }

  void zero();
  bool same_shape(const Tensor& o) const { return dims == o.dims; }
};

struct TensorDesc { int64_t N, C, H, W; };

int64_t numel_of(const std::vector<int64_t>& dims);
std::string shape_str(const std::vector<int64_t>& dims);

// Flat name -> tensor mapping used for checkpoints and weight transplant.
using StateDict = std::map<std::string, Tensor>;

} // namespace mv3
