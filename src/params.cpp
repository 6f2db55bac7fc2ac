#include "params.hpp"
#include <stdexcept>
#include <utility>

namespace mv3 {

Param* ParamStore::create(const std::string& name, std::vector<int64_t> dims, bool learnable) {
  if (params_.count(name))
    throw std::logic_error("Duplicate parameter name: " + name);
  Param p;
  p.learnable = learnable;
  p.value = Tensor(dims);
  if (learnable) p.grad = Tensor(std::move(dims));
  auto it = params_.emplace(name, std::move(p)).first;
  order_.push_back(name);
  return &it->second;
}

Param* ParamStore::find(const std::string& name) {
  auto it = params_.find(name);
  return it == params_.end() ? nullptr : &it->second;
}

const Param* ParamStore::find(const std::string& name) const {
  auto it = params_.find(name);
  return it == params_.end() ? nullptr : &it->second;
}

std::vector<ParamRef> ParamStore::learnable() {
  std::vector<ParamRef> out;
  out.reserve(order_.size());
  for (const auto& name : order_) {
    Param& p = params_.at(name);
    if (p.learnable) out.push_back(ParamRef{name, &p});
  }
  return out;
}

void ParamStore::zero_grad() {
  for (auto& kv : params_)
    if (kv.second.learnable) kv.second.grad.zero();
}

} // namespace mv3
