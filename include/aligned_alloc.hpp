#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <new>

namespace mv3 {
inline void* aligned_alloc64(size_t bytes) {
  void* p = nullptr;
  if (bytes == 0) bytes = 64;
#if defined(_MSC_VER)
  p = _aligned_malloc(bytes, 64);
  if (!p) throw std::bad_alloc();
#else
  if (posix_memalign(&p, 64, bytes) != 0) throw std::bad_alloc();
#endif
  return p;
}
inline void aligned_free64(void* p) {
#if defined(_MSC_VER)
  _aligned_free(p);
#else
  std::free(p);
#endif
}

// Owning 64B-aligned float scratch (packing panels, im2col columns).
class AlignedBuffer {
public:
  AlignedBuffer() = default;
  explicit AlignedBuffer(size_t n_floats)
  : ptr_(static_cast<float*>(aligned_alloc64(float_bytes(n_floats)))), size_(n_floats) {}
  ~AlignedBuffer() { if (ptr_) aligned_free64(ptr_); }

  AlignedBuffer(const AlignedBuffer&) = delete;
  AlignedBuffer& operator=(const AlignedBuffer&) = delete;
  AlignedBuffer(AlignedBuffer&& o) noexcept : ptr_(o.ptr_), size_(o.size_) { o.ptr_ = nullptr; o.size_ = 0; }
  AlignedBuffer& operator=(AlignedBuffer&& o) noexcept {
    if (this != &o) {
      if (ptr_) aligned_free64(ptr_);
      ptr_ = o.ptr_; size_ = o.size_;
      o.ptr_ = nullptr; o.size_ = 0;
    }
    return *this;
  }

  // Grow-only; contents are not preserved. On std::bad_alloc the buffer is
  // left empty.
  void reserve(size_t n_floats) {
    if (n_floats <= size_) return;
    if (ptr_) aligned_free64(ptr_);
    ptr_ = nullptr;
    size_ = 0;
    ptr_ = static_cast<float*>(aligned_alloc64(float_bytes(n_floats)));
    size_ = n_floats;
  }

  float* data() { return ptr_; }
  const float* data() const { return ptr_; }
  size_t size() const { return size_; }

private:
  static size_t float_bytes(size_t n_floats) {
    if (n_floats > SIZE_MAX / sizeof(float)) throw std::bad_alloc();
    return n_floats * sizeof(float);
  }

  float* ptr_ = nullptr;
  size_t size_ = 0;
};
} // namespace mv3
