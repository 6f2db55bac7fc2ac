#include "checkpoint.hpp"

#include <cstdint>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>
#include "mv3.pb.h"

namespace mv3 {

static_assert(sizeof(float) == 4, "checkpoint tensors are float32");

// raw_data is little-endian IEEE-754 regardless of the host.
static void encode_le(const std::vector<float>& src, std::string& dst) {
  dst.resize(src.size() * 4);
  for (size_t i = 0; i < src.size(); ++i) {
    uint32_t bits;
    std::memcpy(&bits, &src[i], 4);
    for (int b = 0; b < 4; ++b) dst[i * 4 + (size_t)b] = (char)((bits >> (8 * b)) & 0xffu);
  }
}

static void decode_le(const std::string& src, std::vector<float>& dst) {
  dst.resize(src.size() / 4);
  const auto* p = reinterpret_cast<const unsigned char*>(src.data());
  for (size_t i = 0; i < dst.size(); ++i) {
    const uint32_t bits = (uint32_t)p[i * 4] | ((uint32_t)p[i * 4 + 1] << 8) |
                          ((uint32_t)p[i * 4 + 2] << 16) | ((uint32_t)p[i * 4 + 3] << 24);
    std::memcpy(&dst[i], &bits, 4);
  }
}

static void write_tensor(const std::string& name, const Tensor& t, pb::TensorProto* out) {
  out->set_name(name);
  for (int64_t d : t.dims) out->add_dims(d);
  encode_le(t.data, *out->mutable_raw_data());
}

static Tensor read_tensor(const pb::TensorProto& t) {
  Tensor out;
  out.dims.assign(t.dims().begin(), t.dims().end());
  const int64_t n = numel_of(out.dims);
  if (!t.raw_data().empty()) {
    const auto& raw = t.raw_data();
    if (raw.size() % 4 != 0)
      throw std::runtime_error("Tensor " + t.name() + " has a truncated raw_data field");
    decode_le(raw, out.data);
  } else {
    out.data.assign(t.float_data().begin(), t.float_data().end());
  }
  if ((int64_t)out.data.size() != n)
    throw std::runtime_error("Tensor " + t.name() + " holds " + std::to_string(out.data.size()) +
                             " values for shape " + shape_str(out.dims));
  return out;
}

void save_checkpoint(const std::string& path, const MobileNetV3Small& net,
                     int epoch, double val_acc) {
  pb::Checkpoint ck;
  const ModelConfig& c = net.config();
  auto* mc = ck.mutable_config();
  mc->set_num_classes(c.num_classes);
  mc->set_width_mult(c.width_mult);
  mc->set_dropout(c.dropout);
  mc->set_reduced_tail(c.reduced_tail);
  mc->set_dilated(c.dilated);
  mc->set_bn_eps(c.bn_eps);
  mc->set_bn_momentum(c.bn_momentum);
  ck.set_epoch(epoch);
  ck.set_val_acc(val_acc);

  // Construction order keeps the file layout stable across runs.
  const ParamStore& store = net.store();
  for (const auto& name : store.names())
    write_tensor(name, store.find(name)->value, ck.add_tensors());

  std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
  if (!ofs) throw std::runtime_error("Cannot open checkpoint for writing: " + path);
  if (!ck.SerializeToOstream(&ofs))
    throw std::runtime_error("Failed to write checkpoint: " + path);
}

LoadedCheckpoint load_checkpoint(const std::string& path) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("Cannot open checkpoint: " + path);

  pb::Checkpoint ck;
  if (!ck.ParseFromIstream(&ifs))
    throw std::runtime_error("Failed to parse checkpoint protobuf: " + path);

  LoadedCheckpoint out;
  if (ck.has_config()) {
    const auto& mc = ck.config();
    out.config.num_classes = mc.num_classes();
    out.config.width_mult = mc.width_mult();
    out.config.dropout = mc.dropout();
    out.config.reduced_tail = mc.reduced_tail();
    out.config.dilated = mc.dilated();
    out.config.bn_eps = mc.bn_eps();
    out.config.bn_momentum = mc.bn_momentum();
  }
  out.epoch = ck.epoch();
  out.val_acc = ck.val_acc();
  for (const auto& t : ck.tensors()) {
    if (out.state.count(t.name()))
      throw std::runtime_error("Duplicate tensor in checkpoint: " + t.name());
    out.state.emplace(t.name(), read_tensor(t));
  }
  return out;
}

} // namespace mv3
