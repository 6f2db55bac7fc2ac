#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <string>
#include <vector>
#include "tensor.hpp"

namespace mv3 {

constexpr int kCifarChannels = 3;
constexpr int kCifarSize = 32;
constexpr int kCifarImageBytes = kCifarChannels * kCifarSize * kCifarSize;
constexpr int kCifarRecordBytes = 1 + kCifarImageBytes;
constexpr int kCifarClasses = 10;

// Raw CIFAR-10 images as stored on disk: one label byte, then 3 planes of
// 32x32 uint8 (R, G, B).
struct Cifar10Split {
  std::vector<uint8_t> images;   // size() * kCifarImageBytes
  std::vector<int32_t> labels;

  size_t size() const { return labels.size(); }
};

// Appends every record of one binary batch file. Throws std::runtime_error
// on a missing file, a partial record or an out-of-range label.
void append_cifar10_file(const std::string& path, Cifar10Split& out);

// data_batch_1..5.bin (train) or test_batch.bin, looked up under
// <root>/cifar-10-batches-bin/ and then <root>/.
Cifar10Split load_cifar10(const std::string& root, bool train);

// uint8 CHW -> float CHW, scaled to [0,1] then normalized per channel.
void normalize_image(const uint8_t* src, float* dst);

// Random 32x32 crop of the image zero-padded by 4, then a horizontal flip
// with probability 0.5. Offsets and flip come from rng.
struct AugmentDraw {
  int dy = 4, dx = 4;
  bool flip = false;
};
AugmentDraw draw_augment(std::mt19937& rng);
void augment_image(const uint8_t* src, const AugmentDraw& a, uint8_t* dst);

struct Batch {
  Tensor images;                 // [B,3,32,32]
  std::vector<int32_t> labels;
};

// Mini-batch iterator over a split. The last batch may be short.
class Cifar10Loader {
public:
  Cifar10Loader(const Cifar10Split& data, int64_t batch_size, bool augment, bool shuffle,
                uint64_t seed);

  // Starts a new pass; reshuffles when shuffling is on.
  void reset();
  bool next(Batch& b);
  size_t num_batches() const;
  size_t size() const { return data_.size(); }

private:
  const Cifar10Split& data_;
  int64_t batch_size_;
  bool augment_, shuffle_;
  std::mt19937 rng_;
  std::vector<size_t> order_;
  size_t pos_ = 0;
};

} // namespace mv3
