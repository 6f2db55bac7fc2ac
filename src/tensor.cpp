#include "tensor.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace mv3 {

int64_t numel_of(const std::vector<int64_t>& dims) {
  int64_t n = 1;
  for (int64_t d : dims) {
    if (d < 0) throw std::invalid_argument("Negative tensor dimension in " + shape_str(dims));
    n *= d;
  }
  return n;
}

std::string shape_str(const std::vector<int64_t>& dims) {
  std::ostringstream ss;
  ss << '[';
  for (size_t i = 0; i < dims.size(); ++i) {
    if (i) ss << ',';
    ss << dims[i];
  }
  ss << ']';
  return ss.str();
}

Tensor::Tensor(std::vector<int64_t> d, float fill)
: dims(std::move(d)) {
  data.assign(static_cast<size_t>(numel_of(dims)), fill);
}

int64_t Tensor::numel() const { return numel_of(dims); }

void Tensor::zero() { std::fill(data.begin(), data.end(), 0.0f); }

} // namespace mv3
