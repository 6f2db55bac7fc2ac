#include "cifar10.hpp"
#include "mv3_compiler.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>
#include <numeric>
#include <stdexcept>

namespace mv3 {

static const float kMean[kCifarChannels] = {0.4914f, 0.4822f, 0.4465f};
static const float kStd[kCifarChannels]  = {0.2023f, 0.1994f, 0.2010f};
static constexpr int kPad = 4;

void append_cifar10_file(const std::string& path, Cifar10Split& out) {
  std::ifstream ifs(path, std::ios::binary);
  if (!ifs) throw std::runtime_error("Cannot open CIFAR-10 file: " + path);

  std::vector<char> rec(kCifarRecordBytes);
  for (;;) {
    ifs.read(rec.data(), kCifarRecordBytes);
    const std::streamsize got = ifs.gcount();
    if (got == 0) break;
    if (got != kCifarRecordBytes)
      throw std::runtime_error("Truncated CIFAR-10 record in " + path);
    const int label = static_cast<uint8_t>(rec[0]);
    if (label >= kCifarClasses)
      throw std::runtime_error("CIFAR-10 label " + std::to_string(label) + " out of range in " + path);
    out.labels.push_back(label);
    out.images.insert(out.images.end(), rec.begin() + 1, rec.end());
  }
}

static std::string locate(const std::string& root, const std::string& file) {
  const std::string nested = root + "/cifar-10-batches-bin/" + file;
  if (std::ifstream(nested, std::ios::binary)) return nested;
  return root + "/" + file;
}

Cifar10Split load_cifar10(const std::string& root, bool train) {
  Cifar10Split out;
  if (train) {
    for (int i = 1; i <= 5; ++i)
      append_cifar10_file(locate(root, "data_batch_" + std::to_string(i) + ".bin"), out);
  } else {
    append_cifar10_file(locate(root, "test_batch.bin"), out);
  }
  return out;
}

void normalize_image(const uint8_t* src, float* dst) {
  const int plane = kCifarSize * kCifarSize;
  for (int c = 0; c < kCifarChannels; ++c) {
    const float scale = 1.f / (255.f * kStd[c]);
    const float shift = kMean[c] / kStd[c];
    for (int i = 0; i < plane; ++i)
      dst[c * plane + i] = (float)src[c * plane + i] * scale - shift;
  }
}

AugmentDraw draw_augment(std::mt19937& rng) {
  std::uniform_int_distribution<int> off(0, 2 * kPad);
  std::bernoulli_distribution coin(0.5);
  AugmentDraw a;
  a.dy = off(rng);
  a.dx = off(rng);
  a.flip = coin(rng);
  return a;
}

void augment_image(const uint8_t* src, const AugmentDraw& a, uint8_t* dst) {
  const int S = kCifarSize;
  for (int c = 0; c < kCifarChannels; ++c) {
    const uint8_t* sp = src + c * S * S;
    uint8_t* dp = dst + c * S * S;
    for (int y = 0; y < S; ++y) {
      const int sy = y + a.dy - kPad;
      for (int x = 0; x < S; ++x) {
        const int ox = a.flip ? S - 1 - x : x;
        const int sx = ox + a.dx - kPad;
        dp[y * S + x] = (sy >= 0 && sy < S && sx >= 0 && sx < S) ? sp[sy * S + sx] : 0;
      }
    }
  }
}

Cifar10Loader::Cifar10Loader(const Cifar10Split& data, int64_t batch_size, bool augment,
                             bool shuffle, uint64_t seed)
: data_(data), batch_size_(batch_size), augment_(augment), shuffle_(shuffle),
  rng_((std::mt19937::result_type)seed) {
  if (batch_size_ <= 0)
    throw std::invalid_argument("batch_size must be positive, got " + std::to_string(batch_size_));
  order_.resize(data_.size());
  reset();
}

void Cifar10Loader::reset() {
  std::iota(order_.begin(), order_.end(), size_t{0});
  if (shuffle_) std::shuffle(order_.begin(), order_.end(), rng_);
  pos_ = 0;
}

size_t Cifar10Loader::num_batches() const {
  return (data_.size() + (size_t)batch_size_ - 1) / (size_t)batch_size_;
}

bool Cifar10Loader::next(Batch& b) {
  if (pos_ >= order_.size()) return false;
  const int64_t B = std::min<int64_t>(batch_size_, (int64_t)(order_.size() - pos_));

  // Draws happen serially so the batch does not depend on the thread count.
  std::vector<AugmentDraw> draws((size_t)B);
  if (augment_)
    for (auto& d : draws) d = draw_augment(rng_);

  b.images = Tensor({B, kCifarChannels, kCifarSize, kCifarSize});
  b.labels.resize((size_t)B);
  const size_t first = pos_;
#pragma omp parallel for schedule(static) if(B * kCifarImageBytes >= MV3_PARALLEL_MIN_WORK)
  for (int64_t i = 0; i < B; ++i) {
    const size_t idx = order_[first + (size_t)i];
    const uint8_t* src = data_.images.data() + idx * kCifarImageBytes;
    float* dst = b.images.ptr() + i * kCifarImageBytes;
    if (augment_) {
      uint8_t tmp[kCifarImageBytes];
      augment_image(src, draws[(size_t)i], tmp);
      normalize_image(tmp, dst);
    } else {
      normalize_image(src, dst);
    }
    b.labels[(size_t)i] = data_.labels[idx];
  }
  pos_ += (size_t)B;
  return true;
}

} // namespace mv3
