#pragma once
#include <array>
#include <cstddef>
#include <utility>
#include <vector>

namespace sysgraph::util {

// Fixed-capacity FIFO: array + head + count. push() on a full buffer
// overwrites the oldest element. Index 0 is always the oldest retained
// element. Not synchronized; owners lock around it.
template <typename T, size_t N>
class RingBuffer {
  static_assert(N > 0, "RingBuffer capacity must be positive");
public:
  void push(T v) {
    if (count_ < N) {
      slots_[(head_ + count_) % N] = std::move(v);
      ++count_;
    } else {
      slots_[head_] = std::move(v);
      head_ = (head_ + 1) % N;
    }
  }

  size_t size() const { return count_; }
  bool empty() const { return count_ == 0; }
  bool full() const { return count_ == N; }
  static constexpr size_t capacity() { return N; }

  // Chronological index: 0 = oldest, size()-1 = newest.
  // Unchecked: caller keeps i < size().
  const T& operator[](size_t i) const { return slots_[(head_ + i) % N]; }
  // Undefined on an empty buffer; check empty() first.
  const T& front() const { return (*this)[0]; }
  const T& back() const { return (*this)[count_ - 1]; }

  std::vector<T> to_vector() const {
    std::vector<T> out;
    out.reserve(count_);
    for (size_t i = 0; i < count_; ++i) out.push_back((*this)[i]);
    return out;
  }

private:
  std::array<T, N> slots_{};
  size_t head_{0};
  size_t count_{0};
};

} // namespace sysgraph::util
