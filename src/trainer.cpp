#include "trainer.hpp"
#include "checkpoint.hpp"
#include "optim.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <google/protobuf/util/json_util.h>

namespace mv3 {

ModelConfig model_config(const TrainConfig& cfg) {
  ModelConfig m;
  m.num_classes = cfg.num_classes;
  m.width_mult = cfg.width_mult;
  m.dropout = (float)cfg.dropout;
  m.reduced_tail = cfg.reduced_tail;
  m.dilated = cfg.dilated;
  m.seed = cfg.seed;
  return m;
}

std::string best_model_path(const TrainConfig& cfg) {
  return (std::filesystem::path(cfg.out_dir) / "best_model.pb").string();
}

std::string results_path(const TrainConfig& cfg) {
  return (std::filesystem::path(cfg.out_dir) / "mobilenetv3_cifar10_results.json").string();
}

static void fill_run_config(const TrainConfig& cfg, pb::RunConfig* rc) {
  rc->set_data_path(cfg.data_path);
  rc->set_num_classes(cfg.num_classes);
  rc->set_model("mobilenet_v3_small");
  rc->set_batch_size(cfg.batch_size);
  rc->set_learning_rate(cfg.learning_rate);
  rc->set_weight_decay(cfg.weight_decay);
  rc->set_epochs(cfg.epochs);
  rc->set_device("cpu");
  rc->set_num_threads(cfg.num_threads);
  rc->set_log_interval(cfg.log_interval);
  rc->set_out_dir(cfg.out_dir);
  rc->set_width_mult(cfg.width_mult);
  rc->set_dropout(cfg.dropout);
  rc->set_reduced_tail(cfg.reduced_tail);
  rc->set_dilated(cfg.dilated);
  rc->set_seed(cfg.seed);
  rc->set_pretrained(cfg.pretrained);
}

EvalResult evaluate(MobileNetV3Small& net, Cifar10Loader& loader, int64_t limit_batches) {
  RunContext ctx;
  ctx.mode = Mode::Eval;
  loader.reset();

  Batch b;
  double loss_sum = 0.0;
  int64_t correct = 0, total = 0, batches = 0;
  while (loader.next(b)) {
    const Tensor logits = net.forward(b.images, ctx);
    int64_t hits = 0;
    loss_sum += cross_entropy(logits, b.labels, nullptr, &hits);
    correct += hits;
    total += (int64_t)b.labels.size();
    ++batches;
    if (limit_batches > 0 && batches >= limit_batches) break;
  }
  if (batches == 0) throw std::runtime_error("Evaluation set is empty");

  EvalResult r;
  r.loss = loss_sum / (double)batches;
  r.acc = 100.0 * (double)correct / (double)total;
  return r;
}

double train(const TrainConfig& cfg, const Cifar10Split& train_set, const Cifar10Split& val_set,
             pb::RunResult& result) {
  MobileNetV3Small net(model_config(cfg));

  if (!cfg.pretrained.empty()) {
    const LoadedCheckpoint src = load_checkpoint(cfg.pretrained);
    const TransplantReport rep = net.transplant(src.state, src.config.num_classes);
    std::printf("Transplanted %zu tensors from %s (%zu classifier tensors skipped)\n",
                rep.copied.size(), cfg.pretrained.c_str(), rep.skipped_classifier.size());
  }

  SGDOptions so;
  so.lr = cfg.learning_rate;
  so.momentum = 0.9;
  so.weight_decay = cfg.weight_decay;
  SGD opt(net.parameters(), so);
  CosineAnnealingLR sched(opt, cfg.epochs);

  Cifar10Loader train_loader(train_set, cfg.batch_size, /*augment=*/true, /*shuffle=*/true, cfg.seed);
  Cifar10Loader val_loader(val_set, cfg.batch_size, /*augment=*/false, /*shuffle=*/false, cfg.seed);

  RunContext ctx;
  ctx.mode = Mode::Train;
  ctx.rng.seed((std::mt19937::result_type)(cfg.seed + 1));

  const int log_interval = cfg.log_interval > 0 ? cfg.log_interval : 1;
  double best_acc = -1.0;   // the first epoch always writes best_model.pb
  for (int epoch = 0; epoch < cfg.epochs; ++epoch) {
    ctx.mode = Mode::Train;
    train_loader.reset();

    Batch b;
    Tensor grad;
    double train_loss = 0.0;
    int64_t train_correct = 0, train_total = 0;
    int batch_idx = 0;
    while (train_loader.next(b)) {
      opt.zero_grad();
      const Tensor logits = net.forward(b.images, ctx);
      int64_t hits = 0;
      const double loss = cross_entropy(logits, b.labels, &grad, &hits);
      net.backward(grad);
      opt.step();

      train_loss += loss;
      train_correct += hits;
      train_total += (int64_t)b.labels.size();

      if (batch_idx % log_interval == 0) {
        const double avg = train_loss / (double)(batch_idx + 1);
        const double acc = 100.0 * (double)train_correct / (double)train_total;
        auto* e = result.add_train_log_info();
        e->set_epoch(epoch);
        e->set_batch(batch_idx);
        e->set_loss(avg);
        e->set_acc(acc);
        e->set_lr(opt.lr());
        std::printf("Epoch: %d, Batch: %d, Loss: %.3f, Acc: %.3f%%, LR: %.6f\n",
                    epoch, batch_idx, avg, acc, opt.lr());
        std::fflush(stdout);
      }
      ++batch_idx;
      if (cfg.limit_batches > 0 && batch_idx >= cfg.limit_batches) break;
    }

    const EvalResult val = evaluate(net, val_loader, cfg.limit_batches);
    auto* v = result.add_val_log_info();
    v->set_epoch(epoch);
    v->set_loss(val.loss);
    v->set_acc(val.acc);
    std::printf("Validation - Loss: %.3f, Acc: %.3f%%\n", val.loss, val.acc);

    if (val.acc > best_acc) {
      best_acc = val.acc;
      save_checkpoint(best_model_path(cfg), net, epoch, val.acc);
    }
    sched.step();
  }
  return best_acc;
}

EvalResult test(const TrainConfig& cfg, const Cifar10Split& test_set) {
  MobileNetV3Small net(model_config(cfg));
  const LoadedCheckpoint ck = load_checkpoint(best_model_path(cfg));
  net.load_state_dict(ck.state);

  Cifar10Loader loader(test_set, cfg.batch_size, /*augment=*/false, /*shuffle=*/false, cfg.seed);
  const EvalResult r = evaluate(net, loader, cfg.limit_batches);
  std::printf("Test - Loss: %.3f, Acc: %.3f%%\n", r.loss, r.acc);
  return r;
}

std::string results_to_json(const pb::RunResult& result) {
  google::protobuf::util::JsonPrintOptions opts;
  opts.add_whitespace = true;
  opts.preserve_proto_field_names = true;
  opts.always_print_primitive_fields = true;
  std::string out;
  const auto st = google::protobuf::util::MessageToJsonString(result, &out, opts);
  if (!st.ok()) throw std::runtime_error("Failed to serialize results: " + st.ToString());
  return out;
}

void write_results_json(const pb::RunResult& result, const std::string& path) {
  const std::string json = results_to_json(result);
  std::ofstream ofs(path, std::ios::trunc);
  if (!ofs) throw std::runtime_error("Cannot open results file: " + path);
  ofs << json;
  if (!ofs) throw std::runtime_error("Failed to write results file: " + path);
}

pb::RunResult run_experiment(const TrainConfig& cfg) {
  std::filesystem::create_directories(cfg.out_dir);
  std::printf("Outputs will be saved to %s\n", cfg.out_dir.c_str());

  const Cifar10Split train_set = load_cifar10(cfg.data_path, /*train=*/true);
  const Cifar10Split test_set = load_cifar10(cfg.data_path, /*train=*/false);

  pb::RunResult result;
  const auto t0 = std::chrono::steady_clock::now();
  const double best_acc = train(cfg, train_set, test_set, result);
  const auto t1 = std::chrono::steady_clock::now();
  const double total_time = std::chrono::duration<double>(t1 - t0).count();

  const EvalResult te = test(cfg, test_set);

  auto* fi = result.mutable_final_info();
  fi->set_best_val_acc(best_acc);
  fi->set_test_acc(te.acc);
  fi->set_total_train_time(total_time);
  fill_run_config(cfg, fi->mutable_config());

  const std::string path = results_path(cfg);
  write_results_json(result, path);

  std::printf("Training completed. Best validation accuracy: %.2f%%\n", best_acc);
  std::printf("Test accuracy: %.2f%%\n", te.acc);
  std::printf("Total training time: %.2f minutes\n", total_time / 60.0);
  std::printf("Results saved to %s\n", path.c_str());
  return result;
}

} // namespace mv3
