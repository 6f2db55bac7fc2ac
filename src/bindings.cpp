// bindings.cpp: Python access to the network builder and checkpoints
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/numpy.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "channel_quantizer.hpp"
#include "checkpoint.hpp"
#include "network.hpp"

namespace py = pybind11;

namespace {

mv3::ModelConfig make_config(int64_t num_classes, double width_mult, float dropout,
                             bool reduced_tail, bool dilated, uint64_t seed) {
  mv3::ModelConfig c;
  c.num_classes = num_classes;
  c.width_mult = width_mult;
  c.dropout = dropout;
  c.reduced_tail = reduced_tail;
  c.dilated = dilated;
  c.seed = seed;
  return c;
}

// The network holds raw pointers into its own parameter store, so it stays put on the heap.
class PyModel {
public:
  explicit PyModel(const mv3::ModelConfig& cfg)
  : net_(std::make_unique<mv3::MobileNetV3Small>(cfg)) {}

  // Eval-mode forward. x: float32 [B,3,H,W] -> logits [B,num_classes]
  py::array_t<float> forward(py::array_t<float, py::array::c_style | py::array::forcecast> x) {
    if (x.ndim() != 4)
      throw std::invalid_argument("input must be 4D: [B,3,H,W]");
    mv3::Tensor in({(int64_t)x.shape(0), (int64_t)x.shape(1), (int64_t)x.shape(2), (int64_t)x.shape(3)});
    std::copy(x.data(), x.data() + in.numel(), in.data.begin());

    mv3::Tensor out;
    {
      py::gil_scoped_release release;
      mv3::RunContext ctx;
      ctx.mode = mv3::Mode::Eval;
      out = net_->forward(in, ctx);
    }
    py::array_t<float> y({(py::ssize_t)out.dim(0), (py::ssize_t)out.dim(1)});
    std::copy(out.data.begin(), out.data.end(), y.mutable_data());
    return y;
  }

  void save(const std::string& path) const { mv3::save_checkpoint(path, *net_); }

  // Strict when the class counts agree, classifier-excluding transplant otherwise.
  void load(const std::string& path) {
    const mv3::LoadedCheckpoint ck = mv3::load_checkpoint(path);
    if (ck.config.num_classes == net_->config().num_classes) net_->load_state_dict(ck.state);
    else net_->transplant(ck.state, ck.config.num_classes);
  }

  std::vector<std::string> param_names() const { return net_->store().names(); }
  int64_t num_classes() const { return net_->config().num_classes; }
  size_t num_blocks() const { return net_->num_blocks(); }

private:
  std::unique_ptr<mv3::MobileNetV3Small> net_;
};

} // anonymous

PYBIND11_MODULE(_mv3_cpu, m) {
    m.doc() = "MobileNetV3-Small CPU implementation";
    m.def("quantize_channels",
          [](double v, int64_t divisor, int64_t min_value) {
            return mv3::quantize_channels(v, divisor, min_value);
          },
          py::arg("v"), py::arg("divisor") = 8, py::arg("min_value") = -1,
          "Round v to a multiple of divisor, never more than 10% below v.");

    py::class_<PyModel>(m, "Model")
        .def(py::init([](int64_t num_classes, double width_mult, float dropout,
                         bool reduced_tail, bool dilated, uint64_t seed) {
               return std::make_unique<PyModel>(
                   make_config(num_classes, width_mult, dropout, reduced_tail, dilated, seed));
             }),
             py::arg("num_classes") = 1000, py::arg("width_mult") = 1.0,
             py::arg("dropout") = 0.2f, py::arg("reduced_tail") = false,
             py::arg("dilated") = false, py::arg("seed") = 0)
        .def("forward", &PyModel::forward, py::arg("x"))
        .def("save", &PyModel::save, py::arg("path"))
        .def("load", &PyModel::load, py::arg("path"))
        .def("param_names", &PyModel::param_names)
        .def_property_readonly("num_classes", &PyModel::num_classes)
        .def_property_readonly("num_blocks", &PyModel::num_blocks);
}
