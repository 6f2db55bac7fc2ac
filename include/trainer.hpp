#pragma once
#include <cstdint>
#include <string>
#include "cifar10.hpp"
#include "network.hpp"
#include "mv3.pb.h"

namespace mv3 {

struct TrainConfig {
  // data
  std::string data_path = "./data";
  int num_classes = 10;
  // model
  double width_mult = 1.0;
  double dropout = 0.2;
  bool reduced_tail = false;
  bool dilated = false;
  std::string pretrained;        // checkpoint to transplant from, optional
  // training
  int batch_size = 128;
  double learning_rate = 0.01;
  double weight_decay = 1e-4;
  int epochs = 30;
  uint64_t seed = 0;
  int64_t limit_batches = 0;     // >0: cap batches per pass (smoke runs)
  // system
  int num_threads = 0;
  // logging
  int log_interval = 100;
  // output
  std::string out_dir = "run_0";
};

ModelConfig model_config(const TrainConfig& cfg);

struct EvalResult {
  double loss = 0.0;
  double acc = 0.0;    // percent
};

// Eval-mode pass over a loader: mean batch loss and top-1 accuracy.
EvalResult evaluate(MobileNetV3Small& net, Cifar10Loader& loader, int64_t limit_batches = 0);

// Epoch loop: SGD(momentum 0.9) + cosine schedule, a log entry every
// log_interval batches, validation each epoch, best weights saved to
// <out_dir>/best_model.pb. Returns the best validation accuracy.
double train(const TrainConfig& cfg, const Cifar10Split& train_set, const Cifar10Split& val_set,
             pb::RunResult& result);

// Rebuilds the network, loads <out_dir>/best_model.pb and evaluates it.
EvalResult test(const TrainConfig& cfg, const Cifar10Split& test_set);

// Full run: data, train, test, <out_dir>/mobilenetv3_cifar10_results.json.
pb::RunResult run_experiment(const TrainConfig& cfg);

std::string results_to_json(const pb::RunResult& result);
void write_results_json(const pb::RunResult& result, const std::string& path);

std::string best_model_path(const TrainConfig& cfg);
std::string results_path(const TrainConfig& cfg);

} // namespace mv3
