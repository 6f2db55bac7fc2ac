#pragma once
#include <string>
#include "network.hpp"
#include "tensor.hpp"

namespace mv3 {

struct LoadedCheckpoint {
  ModelConfig config;
  StateDict state;
  int epoch = -1;
  double val_acc = 0.0;
};

// Binary mv3.pb.Checkpoint. Throws std::runtime_error on I/O failure.
void save_checkpoint(const std::string& path, const MobileNetV3Small& net,
                     int epoch = -1, double val_acc = 0.0);

// Throws std::runtime_error if the file is missing, unparsable or holds a
// tensor whose data does not match its dims.
LoadedCheckpoint load_checkpoint(const std::string& path);

} // namespace mv3
