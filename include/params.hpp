#pragma once
#include <map>
#include <string>
#include <vector>
#include "tensor.hpp"

namespace mv3 {

// One named state tensor. Learnable entries carry a gradient buffer of the
// same shape; buffers (running statistics, counters) do not.
struct Param {
  Tensor value;
  Tensor grad;
  bool learnable = true;
};

struct ParamRef {
  std::string name;
  Param* param;
};

// Owns every state tensor of a network. Entries live in a std::map, so Param*
// handed out by create() stay valid for the lifetime of the store.
class ParamStore {
public:
  ParamStore() = default;
  ParamStore(const ParamStore&) = delete;
  ParamStore& operator=(const ParamStore&) = delete;

  Param* create(const std::string& name, std::vector<int64_t> dims, bool learnable = true);
  Param* find(const std::string& name);
  const Param* find(const std::string& name) const;

  // Insertion (construction) order.
  const std::vector<std::string>& names() const { return order_; }
  size_t size() const { return order_.size(); }

  std::vector<ParamRef> learnable();
  void zero_grad();

private:
  std::map<std::string, Param> params_;
  std::vector<std::string> order_;
};

} // namespace mv3
