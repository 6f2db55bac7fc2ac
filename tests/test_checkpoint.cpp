#include <gtest/gtest.h>
#include <fstream>
#include <stdexcept>
#include <string>
#include "checkpoint.hpp"
#include "network.hpp"
#include "trainer.hpp"
#include "mv3.pb.h"
#include "test_util.hpp"

using namespace mv3;

namespace {

std::string temp_path(const std::string& name) { return ::testing::TempDir() + name; }

ModelConfig tiny_config() {
  ModelConfig c;
  c.num_classes = 10;
  c.width_mult = 0.5;
  c.dropout = 0.1f;
  c.reduced_tail = true;
  c.seed = 21;
  return c;
}

} // namespace

TEST(Checkpoint, RoundTripKeepsConfigAndState) {
  MobileNetV3Small net(tiny_config());
  RunContext train;
  train.mode = Mode::Train;
  net.forward(testing_util::random_tensor({2, 3, 32, 32}, 4), train);

  const std::string path = temp_path("mv3_roundtrip.pb");
  save_checkpoint(path, net, 7, 61.5);
  const LoadedCheckpoint ck = load_checkpoint(path);

  EXPECT_EQ(ck.epoch, 7);
  EXPECT_DOUBLE_EQ(ck.val_acc, 61.5);
  EXPECT_EQ(ck.config.num_classes, 10);
  EXPECT_DOUBLE_EQ(ck.config.width_mult, 0.5);
  EXPECT_FLOAT_EQ(ck.config.dropout, 0.1f);
  EXPECT_TRUE(ck.config.reduced_tail);
  EXPECT_FALSE(ck.config.dilated);

  const StateDict sd = net.state_dict();
  ASSERT_EQ(ck.state.size(), sd.size());
  for (const auto& kv : sd) {
    const auto it = ck.state.find(kv.first);
    ASSERT_NE(it, ck.state.end()) << kv.first;
    EXPECT_EQ(it->second.dims, kv.second.dims) << kv.first;
    EXPECT_EQ(it->second.data, kv.second.data) << kv.first;
  }

  MobileNetV3Small restored(ck.config);
  restored.load_state_dict(ck.state);
  RunContext eval;
  const Tensor x = testing_util::random_tensor({1, 3, 32, 32}, 5);
  EXPECT_EQ(net.forward(x, eval).data, restored.forward(x, eval).data);
}

TEST(Checkpoint, MissingFileThrows) {
  EXPECT_THROW(load_checkpoint(temp_path("mv3_does_not_exist.pb")), std::runtime_error);
}

TEST(Checkpoint, GarbageFileThrows) {
  const std::string path = temp_path("mv3_garbage.pb");
  {
    std::ofstream ofs(path, std::ios::binary);
    ofs << "\xff\xff\xff\xff not a protobuf";
  }
  EXPECT_THROW(load_checkpoint(path), std::runtime_error);
}

TEST(Checkpoint, UnwritablePathThrows) {
  MobileNetV3Small net(tiny_config());
  EXPECT_THROW(save_checkpoint(temp_path("no_such_dir/sub/model.pb"), net), std::runtime_error);
}

TEST(Checkpoint, RawDataIsLittleEndian) {
  MobileNetV3Small net(tiny_config());
  const std::string path = temp_path("mv3_byte_order.pb");
  save_checkpoint(path, net);

  pb::Checkpoint ck;
  {
    std::ifstream ifs(path, std::ios::binary);
    ASSERT_TRUE(ck.ParseFromIstream(&ifs));
  }
  const pb::TensorProto* rv = nullptr;
  for (const auto& t : ck.tensors())
    if (t.name() == "features.0.1.running_var") rv = &t;
  ASSERT_NE(rv, nullptr);
  // 1.0f == 0x3f800000
  const std::string& raw = rv->raw_data();
  ASSERT_GE(raw.size(), 4u);
  EXPECT_EQ((unsigned char)raw[0], 0x00);
  EXPECT_EQ((unsigned char)raw[1], 0x00);
  EXPECT_EQ((unsigned char)raw[2], 0x80);
  EXPECT_EQ((unsigned char)raw[3], 0x3f);
}

TEST(Checkpoint, ReadsLittleEndianAndFloatData) {
  pb::Checkpoint ck;
  auto* a = ck.add_tensors();
  a->set_name("a");
  a->add_dims(2);
  a->set_raw_data(std::string("\x00\x00\x80\x3f\x00\x00\x00\xc0", 8));  // 1.0f, -2.0f
  auto* b = ck.add_tensors();
  b->set_name("b");
  b->add_dims(1);
  b->add_float_data(0.5f);
  auto* bad = ck.add_tensors();
  bad->set_name("c");
  bad->add_dims(3);
  bad->add_float_data(1.f);

  const std::string path = temp_path("mv3_handmade.pb");
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(ck.SerializeToOstream(&ofs));
  }
  // "c" holds one value for three dims
  EXPECT_THROW(load_checkpoint(path), std::runtime_error);

  ck.mutable_tensors()->RemoveLast();
  {
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ASSERT_TRUE(ck.SerializeToOstream(&ofs));
  }
  const LoadedCheckpoint loaded = load_checkpoint(path);
  EXPECT_EQ(loaded.state.at("a").data, (std::vector<float>{1.f, -2.f}));
  EXPECT_EQ(loaded.state.at("b").data, (std::vector<float>{0.5f}));
}

TEST(ResultsJson, UsesProtoFieldNames) {
  pb::RunResult r;
  r.mutable_final_info()->set_best_val_acc(55.25);
  r.mutable_final_info()->set_test_acc(54.0);
  r.mutable_final_info()->mutable_config()->set_batch_size(128);
  auto* t = r.add_train_log_info();
  t->set_epoch(0);
  t->set_batch(100);
  t->set_loss(1.5);
  auto* v = r.add_val_log_info();
  v->set_epoch(0);
  v->set_acc(55.25);

  const std::string json = results_to_json(r);
  EXPECT_NE(json.find("\"final_info\""), std::string::npos);
  EXPECT_NE(json.find("\"best_val_acc\""), std::string::npos);
  EXPECT_NE(json.find("\"train_log_info\""), std::string::npos);
  EXPECT_NE(json.find("\"val_log_info\""), std::string::npos);
  EXPECT_NE(json.find("\"batch_size\""), std::string::npos);
  // primitives at their default value are still printed
  EXPECT_NE(json.find("\"reduced_tail\""), std::string::npos);
}
